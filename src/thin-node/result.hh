#pragma once

#include <thin-node/assert.hh>
#include <thin-node/fwd.hh>
#include <thin-node/optional.hh>
#include <thin-node/utility.hh>

#include <type_traits>

// tn::result<T, E> is the vocabulary type for expected failures:
// every try_* allocation entry point returns result<..., tn::allocate_error>.
//
// Construction is implicit from either alternative, so fallible code reads naturally:
//
//   tn::result<node, tn::allocate_error> try_allocate()
//   {
//       auto layout = compute_layout();
//       if (!layout.has_value())
//           return layout.error();
//       ...
//       return node;
//   }
//
// T and E must be distinct types.
// result<void, E> only carries the error alternative.

template <class T, class E>
struct tn::result
{
    static_assert(!std::is_same_v<T, E>, "value and error type must be distinct");
    static_assert(!std::is_reference_v<T> && !std::is_reference_v<E>, "references are not supported");

    // construction
public:
    template <class U = T>
        requires(std::is_constructible_v<T, U &&> && !std::is_same_v<std::remove_cvref_t<U>, result>
                 && !std::is_same_v<std::remove_cvref_t<U>, E>)
    result(U&& value) : _has_value(true) // NOLINT
    {
        new (tn::placement_new, &_value) T(tn::forward<U>(value));
    }

    result(E const& error) : _has_value(false) // NOLINT
    {
        new (tn::placement_new, &_error) E(error);
    }

    result(E&& error) : _has_value(false) // NOLINT
    {
        new (tn::placement_new, &_error) E(tn::move(error));
    }

    result(result&& rhs) noexcept : _has_value(rhs._has_value)
    {
        if (_has_value)
            new (tn::placement_new, &_value) T(tn::move(rhs._value));
        else
            new (tn::placement_new, &_error) E(tn::move(rhs._error));
    }

    result(result const& rhs)
        requires(std::is_copy_constructible_v<T> && std::is_copy_constructible_v<E>)
      : _has_value(rhs._has_value)
    {
        if (_has_value)
            new (tn::placement_new, &_value) T(rhs._value);
        else
            new (tn::placement_new, &_error) E(rhs._error);
    }

    result& operator=(result&& rhs) noexcept
    {
        if (this != &rhs)
        {
            _destroy();
            _has_value = rhs._has_value;
            if (_has_value)
                new (tn::placement_new, &_value) T(tn::move(rhs._value));
            else
                new (tn::placement_new, &_error) E(tn::move(rhs._error));
        }
        return *this;
    }

    result& operator=(result const& rhs)
        requires(std::is_copy_constructible_v<T> && std::is_copy_constructible_v<E>)
    {
        if (this != &rhs)
        {
            _destroy();
            _has_value = rhs._has_value;
            if (_has_value)
                new (tn::placement_new, &_value) T(rhs._value);
            else
                new (tn::placement_new, &_error) E(rhs._error);
        }
        return *this;
    }

    ~result() { _destroy(); }

    // queries and access
public:
    [[nodiscard]] bool has_value() const { return _has_value; }
    [[nodiscard]] bool has_error() const { return !_has_value; }

    /// Precondition: has_value() == true.
    [[nodiscard]] T& value() &
    {
        TN_ASSERT(_has_value, "attempted to access value of a failed result");
        return _value;
    }
    [[nodiscard]] T const& value() const&
    {
        TN_ASSERT(_has_value, "attempted to access value of a failed result");
        return _value;
    }
    [[nodiscard]] T&& value() &&
    {
        TN_ASSERT(_has_value, "attempted to access value of a failed result");
        return tn::move(_value);
    }

    /// Precondition: has_error() == true.
    [[nodiscard]] E const& error() const
    {
        TN_ASSERT(!_has_value, "attempted to access error of a successful result");
        return _error;
    }

    // helper
private:
    void _destroy()
    {
        if (_has_value)
            _value.~T();
        else
            _error.~E();
    }

    // members
private:
    union
    {
        T _value;
        E _error;
    };
    bool _has_value;
};

/// Result without a value alternative: either success or an error.
template <class E>
struct tn::result<void, E>
{
public:
    /// Success.
    result() = default;

    result(E const& error) : _error(error) {} // NOLINT
    result(E&& error) : _error(tn::move(error)) {} // NOLINT

    [[nodiscard]] bool has_value() const { return !_error.has_value(); }
    [[nodiscard]] bool has_error() const { return _error.has_value(); }

    /// Asserts success; exists so that generic code can uniformly call value().
    void value() const { TN_ASSERT(!_error.has_value(), "attempted to access value of a failed result"); }

    /// Precondition: has_error() == true.
    [[nodiscard]] E const& error() const
    {
        TN_ASSERT(_error.has_value(), "attempted to access error of a successful result");
        return _error.value();
    }

private:
    tn::optional<E> _error;
};
