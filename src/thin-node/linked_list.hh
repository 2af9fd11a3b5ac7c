#pragma once

#include <thin-node/allocate_error.hh>
#include <thin-node/assert.hh>
#include <thin-node/fwd.hh>
#include <thin-node/maybe_uninit_node.hh>
#include <thin-node/memory_resource.hh>
#include <thin-node/node_ptr.hh>
#include <thin-node/optional.hh>
#include <thin-node/payload.hh>
#include <thin-node/result.hh>
#include <thin-node/span.hh>
#include <thin-node/thin_box.hh>
#include <thin-node/utility.hh>

#include <exception>
#include <string_view>
#include <type_traits>

// =========================================================================================================
// linked_list<U> - doubly linked list of thin nodes
// =========================================================================================================
//
// Each element is one node allocation {header, metadata, payload}. The header holds the previous and
// next node handles, the metadata (if any) describes the payload:
//
//   tn::linked_list<int>                          fixed payloads
//   tn::linked_list<int[]>                        every element its own runtime-sized array
//   tn::linked_list<char[]>                       strings (push_back_string)
//   tn::linked_list<tn::dyn<tn::debug_printable>> heterogeneous elements behind a capability table
//
// Ordering: iterating front to back visits back-pushed elements in push order and front-pushed
// elements in reverse push order.
//
// Allocation: all nodes come from the memory resource passed at construction (null = default).
// push_* treats allocation failure as fatal, try_push_* reports it through tn::result and leaves the
// list unchanged.
//
// Teardown: the destructor (and clear()) destroy front to back. If a payload destructor throws, the
// remaining nodes are still destroyed and freed, then the exception propagates. A second throwing
// destructor during that recovery terminates the program.
//
// Iterators carry a modification stamp and assert if they are used after the list structure changed.
// Cursors are not stamped and must not outlive structural changes made through other means.

namespace tn::impl
{
template <class U>
constexpr bool is_cloneable_payload()
{
    if constexpr (std::is_array_v<U>)
        return std::is_copy_constructible_v<std::remove_extent_t<U>>;
    else if constexpr (payload_traits<U>::shape == payload_shape::fixed)
        return std::is_copy_constructible_v<U>;
    else
        return false;
}
} // namespace tn::impl

template <class U>
struct tn::linked_list
{
    using traits = payload_traits<U>;
    using metadata_type = typename traits::metadata_type;
    using pointer = typename traits::pointer;
    using reference = typename traits::reference;
    using const_reference = typename traits::const_reference;

private:
    struct header;
    using node = node_ptr<header, U>;

    /// neighbor links; written at allocation time so that insert knows where the node goes
    struct header
    {
        node next;
        node previous;
    };

    struct ends
    {
        node front;
        node back;
    };

public:
    /// structure handle of the list, used by builders
    /// Holds a pointer to the list: the list must outlive its builders and must not be moved while any
    /// builder from allocate_uninit_* or pop_*_node is alive.
    struct list_structure
    {
        linked_list* list = nullptr;

        void insert(header_opaque_node_ptr<U> n) const { list->_link(n.template to_transparent<header>()); }
        [[nodiscard]] memory_resource const* allocator() const { return list->_resource; }
        void deallocate(header_opaque_node_ptr<U> n) const
        {
            n.template to_transparent<header>().deallocate(list->_resource);
        }
    };

    using builder = maybe_uninit_node<U, list_structure>;

    template <bool IsConst, bool IsReverse>
    struct basic_iterator;
    template <bool IsConst>
    struct basic_cursor;
    template <bool IsConst>
    struct reversed_range;
    struct boxed_drain;

    using iterator = basic_iterator<false, false>;
    using const_iterator = basic_iterator<true, false>;
    using cursor = basic_cursor<true>;
    using cursor_mut = basic_cursor<false>;

    // construction
public:
    linked_list() = default;
    explicit linked_list(memory_resource const* resource) : _resource(resource) {}

    linked_list(linked_list&& rhs) noexcept : _ends(rhs._ends), _resource(rhs._resource)
    {
        rhs._ends.reset();
        ++rhs._version;
    }
    linked_list& operator=(linked_list&& rhs) noexcept(false)
    {
        if (this != &rhs)
        {
            clear();
            _ends = rhs._ends;
            _resource = rhs._resource;
            rhs._ends.reset();
            ++rhs._version;
            ++_version;
        }
        return *this;
    }
    linked_list(linked_list const&) = delete;
    linked_list& operator=(linked_list const&) = delete;

    ~linked_list() noexcept(false) { clear(); }

    [[nodiscard]] linked_list clone() const
        requires(impl::is_cloneable_payload<U>())
    {
        return clone_in(_resource);
    }

    /// Deep copy whose nodes come from `resource`.
    [[nodiscard]] linked_list clone_in(memory_resource const* resource) const
        requires(impl::is_cloneable_payload<U>())
    {
        linked_list copy(resource);
        for (auto n = _front(); n.is_valid(); n = n.header_ptr()->next)
        {
            if constexpr (traits::shape == payload_shape::fixed)
                copy.emplace_back(*n.data_ptr());
            else
                copy.push_back_array(n.get_const());
        }
        return copy;
    }

    /// Like clone(), but a failed node allocation is reported instead of being fatal.
    /// On failure the partial copy is freed again and this list is untouched.
    [[nodiscard]] result<linked_list, allocate_error> try_clone() const
        requires(impl::is_cloneable_payload<U>())
    {
        return try_clone_in(_resource);
    }
    [[nodiscard]] result<linked_list, allocate_error> try_clone_in(memory_resource const* resource) const
        requires(impl::is_cloneable_payload<U>())
    {
        linked_list copy(resource);
        for (auto n = _front(); n.is_valid(); n = n.header_ptr()->next)
        {
            auto r = [&] {
                if constexpr (traits::shape == payload_shape::fixed)
                    return copy.try_emplace_back(*n.data_ptr());
                else
                    return copy.try_push_back_array(n.get_const());
            }();
            if (r.has_error())
                return r.error();
        }
        return tn::move(copy);
    }

    // uninitialized allocation
public:
    /// Allocates a node that insert() will link at the front.
    /// The list must not be modified between allocation and insertion.
    [[nodiscard]] builder allocate_uninit_front(metadata_type metadata) { return _allocate_between(metadata, _front(), {}); }
    [[nodiscard]] builder allocate_uninit_back(metadata_type metadata) { return _allocate_between(metadata, {}, _back()); }

    [[nodiscard]] result<builder, allocate_error> try_allocate_uninit_front(metadata_type metadata)
    {
        return _try_allocate_between(metadata, _front(), {});
    }
    [[nodiscard]] result<builder, allocate_error> try_allocate_uninit_back(metadata_type metadata)
    {
        return _try_allocate_between(metadata, {}, _back());
    }

    // fixed payloads
public:
    template <class... Args>
    reference emplace_front(Args&&... args)
        requires(traits::shape == payload_shape::fixed)
    {
        auto b = allocate_uninit_front({});
        auto& v = b.emplace(tn::forward<Args>(args)...);
        tn::move(b).insert();
        return v;
    }
    template <class... Args>
    reference emplace_back(Args&&... args)
        requires(traits::shape == payload_shape::fixed)
    {
        auto b = allocate_uninit_back({});
        auto& v = b.emplace(tn::forward<Args>(args)...);
        tn::move(b).insert();
        return v;
    }

    void push_front(U const& value)
        requires(traits::shape == payload_shape::fixed)
    {
        emplace_front(value);
    }
    void push_front(U&& value)
        requires(traits::shape == payload_shape::fixed)
    {
        emplace_front(tn::move(value));
    }
    void push_back(U const& value)
        requires(traits::shape == payload_shape::fixed)
    {
        emplace_back(value);
    }
    void push_back(U&& value)
        requires(traits::shape == payload_shape::fixed)
    {
        emplace_back(tn::move(value));
    }

    template <class... Args>
    [[nodiscard]] result<void, allocate_error> try_emplace_front(Args&&... args)
        requires(traits::shape == payload_shape::fixed)
    {
        auto b = try_allocate_uninit_front({});
        if (b.has_error())
            return b.error();
        b.value().emplace(tn::forward<Args>(args)...);
        tn::move(b.value()).insert();
        return {};
    }
    template <class... Args>
    [[nodiscard]] result<void, allocate_error> try_emplace_back(Args&&... args)
        requires(traits::shape == payload_shape::fixed)
    {
        auto b = try_allocate_uninit_back({});
        if (b.has_error())
            return b.error();
        b.value().emplace(tn::forward<Args>(args)...);
        tn::move(b.value()).insert();
        return {};
    }

    [[nodiscard]] result<void, allocate_error> try_push_front(U value)
        requires(traits::shape == payload_shape::fixed)
    {
        return try_emplace_front(tn::move(value));
    }
    [[nodiscard]] result<void, allocate_error> try_push_back(U value)
        requires(traits::shape == payload_shape::fixed)
    {
        return try_emplace_back(tn::move(value));
    }

    // array payloads
public:
    /// Pushes a node holding a copy of `values` (memcpy for trivially copyable elements).
    template <class E = std::remove_extent_t<U>>
    void push_front_array(tn::span<E const> values)
        requires(traits::shape == payload_shape::array)
    {
        auto b = allocate_uninit_front(values.size());
        b.copy_from(values);
        tn::move(b).insert();
    }
    template <class E = std::remove_extent_t<U>>
    void push_back_array(tn::span<E const> values)
        requires(traits::shape == payload_shape::array)
    {
        auto b = allocate_uninit_back(values.size());
        b.copy_from(values);
        tn::move(b).insert();
    }

    template <class E = std::remove_extent_t<U>>
    [[nodiscard]] result<void, allocate_error> try_push_front_array(tn::span<E const> values)
        requires(traits::shape == payload_shape::array)
    {
        auto b = try_allocate_uninit_front(values.size());
        if (b.has_error())
            return b.error();
        b.value().copy_from(values);
        tn::move(b.value()).insert();
        return {};
    }
    template <class E = std::remove_extent_t<U>>
    [[nodiscard]] result<void, allocate_error> try_push_back_array(tn::span<E const> values)
        requires(traits::shape == payload_shape::array)
    {
        auto b = try_allocate_uninit_back(values.size());
        if (b.has_error())
            return b.error();
        b.value().copy_from(values);
        tn::move(b.value()).insert();
        return {};
    }

    void push_front_string(std::string_view s)
        requires std::is_same_v<U, char[]>
    {
        push_front_array(tn::span<char const>(s.data(), isize(s.size())));
    }
    void push_back_string(std::string_view s)
        requires std::is_same_v<U, char[]>
    {
        push_back_array(tn::span<char const>(s.data(), isize(s.size())));
    }

    // open-ended payloads
public:
    /// Pushes `value` widened to the list's capability table.
    template <class T>
    void push_front_unsize(T&& value)
        requires(traits::shape == payload_shape::open_ended)
    {
        emplace_front_unsize<std::remove_cvref_t<T>>(tn::forward<T>(value));
    }
    template <class T>
    void push_back_unsize(T&& value)
        requires(traits::shape == payload_shape::open_ended)
    {
        emplace_back_unsize<std::remove_cvref_t<T>>(tn::forward<T>(value));
    }

    template <class T, class... Args>
    T& emplace_front_unsize(Args&&... args)
        requires(traits::shape == payload_shape::open_ended)
    {
        auto b = allocate_uninit_front(tn::widen<typename traits::capabilities, T>());
        auto& v = b.template emplace_as<T>(tn::forward<Args>(args)...);
        tn::move(b).insert();
        return v;
    }
    template <class T, class... Args>
    T& emplace_back_unsize(Args&&... args)
        requires(traits::shape == payload_shape::open_ended)
    {
        auto b = allocate_uninit_back(tn::widen<typename traits::capabilities, T>());
        auto& v = b.template emplace_as<T>(tn::forward<Args>(args)...);
        tn::move(b).insert();
        return v;
    }

    template <class T>
    [[nodiscard]] result<void, allocate_error> try_push_front_unsize(T&& value)
        requires(traits::shape == payload_shape::open_ended)
    {
        using V = std::remove_cvref_t<T>;
        auto b = try_allocate_uninit_front(tn::widen<typename traits::capabilities, V>());
        if (b.has_error())
            return b.error();
        b.value().template emplace_as<V>(tn::forward<T>(value));
        tn::move(b.value()).insert();
        return {};
    }
    template <class T>
    [[nodiscard]] result<void, allocate_error> try_push_back_unsize(T&& value)
        requires(traits::shape == payload_shape::open_ended)
    {
        using V = std::remove_cvref_t<T>;
        auto b = try_allocate_uninit_back(tn::widen<typename traits::capabilities, V>());
        if (b.has_error())
            return b.error();
        b.value().template emplace_as<V>(tn::forward<T>(value));
        tn::move(b.value()).insert();
        return {};
    }

    // removal
public:
    /// Moves the front value out. Empty list: nullopt, nothing changes.
    /// The node is unlinked before the move. If T's move constructor throws, the element is destroyed
    /// and freed and the exception propagates; the list keeps its remaining elements.
    [[nodiscard]] optional<U> pop_front()
        requires(traits::shape == payload_shape::fixed)
    {
        auto b = pop_front_node();
        if (!b.has_value())
            return tn::nullopt;
        return tn::move(b.value()).take();
    }
    /// Same as pop_front, including the behavior on a throwing move.
    [[nodiscard]] optional<U> pop_back()
        requires(traits::shape == payload_shape::fixed)
    {
        auto b = pop_back_node();
        if (!b.has_value())
            return tn::nullopt;
        return tn::move(b.value()).take();
    }

    /// Unlinks the front node and hands it out with its payload still initialized.
    /// Inserting the builder again (without other modifications in between) restores the list.
    [[nodiscard]] optional<builder> pop_front_node()
    {
        if (!_ends.has_value())
            return tn::nullopt;
        return _unlink_to_builder(_front());
    }
    [[nodiscard]] optional<builder> pop_back_node()
    {
        if (!_ends.has_value())
            return tn::nullopt;
        return _unlink_to_builder(_back());
    }

    /// Destroys and frees the front element. Returns false if the list was empty.
    bool delete_front()
    {
        if (!_ends.has_value())
            return false;
        _delete(_front());
        return true;
    }
    bool delete_back()
    {
        if (!_ends.has_value())
            return false;
        _delete(_back());
        return true;
    }

    /// Moves the front payload into a box allocated from the list's resource.
    /// The node only leaves the list once the box exists and the payload was relocated.
    [[nodiscard]] optional<thin_box<U>> pop_front_boxed()
    {
        if (!_ends.has_value())
            return tn::nullopt;
        return _pop_boxed(_front());
    }
    [[nodiscard]] optional<thin_box<U>> pop_back_boxed()
    {
        if (!_ends.has_value())
            return tn::nullopt;
        return _pop_boxed(_back());
    }

    /// Like pop_front_boxed, but a failed box allocation is reported and the list stays unchanged.
    [[nodiscard]] optional<result<thin_box<U>, allocate_error>> try_pop_front_boxed()
    {
        if (!_ends.has_value())
            return tn::nullopt;
        return _try_pop_boxed(_front());
    }
    [[nodiscard]] optional<result<thin_box<U>, allocate_error>> try_pop_back_boxed()
    {
        if (!_ends.has_value())
            return tn::nullopt;
        return _try_pop_boxed(_back());
    }

    /// Consumes the list into a double-ended sequence of boxes.
    /// Elements still in the drain when it is destroyed are destroyed with it.
    [[nodiscard]] boxed_drain drain_boxed() && { return boxed_drain(tn::move(*this)); }

    /// Destroys all elements front to back.
    /// If a payload destructor throws, destruction resumes with the next node and the first exception
    /// propagates once the list is empty. Another throw during that resumption terminates.
    void clear()
    {
        auto const exceptions_before = std::uncaught_exceptions();
        TN_DEFER
        {
            if (std::uncaught_exceptions() > exceptions_before)
                while (delete_front())
                {
                }
        };

        while (delete_front())
        {
        }
    }

    // access
public:
    [[nodiscard]] bool is_empty() const { return !_ends.has_value(); }

    /// Precondition: !is_empty().
    [[nodiscard]] reference front()
    {
        TN_ASSERT(_ends.has_value(), "front() called on empty list");
        return _front().get();
    }
    [[nodiscard]] const_reference front() const
    {
        TN_ASSERT(_ends.has_value(), "front() called on empty list");
        return _front().get_const();
    }
    [[nodiscard]] reference back()
    {
        TN_ASSERT(_ends.has_value(), "back() called on empty list");
        return _back().get();
    }
    [[nodiscard]] const_reference back() const
    {
        TN_ASSERT(_ends.has_value(), "back() called on empty list");
        return _back().get_const();
    }

    [[nodiscard]] memory_resource const* resource() const { return _resource; }

    // iteration
public:
    [[nodiscard]] iterator begin() { return {this, _front()}; }
    [[nodiscard]] iterator end() { return {this, {}}; }
    [[nodiscard]] const_iterator begin() const { return {this, _front()}; }
    [[nodiscard]] const_iterator end() const { return {this, {}}; }

    /// back-to-front view
    [[nodiscard]] reversed_range<false> reversed() { return {{this, _back()}, {this, {}}}; }
    [[nodiscard]] reversed_range<true> reversed() const { return {{this, _back()}, {this, {}}}; }

    /// A cursor on an empty list (or moved past either end) points at the "ghost" position between
    /// back and front.
    [[nodiscard]] cursor cursor_front() const { return {this, _front()}; }
    [[nodiscard]] cursor cursor_back() const { return {this, _back()}; }
    [[nodiscard]] cursor_mut cursor_front_mut() { return {this, _front()}; }
    [[nodiscard]] cursor_mut cursor_back_mut() { return {this, _back()}; }

    // debugging
public:
    /// Walks the list in both directions and checks that all links agree.
    /// Returns the number of elements.
    isize debug_check_links() const
    {
        isize forward_count = 0;
        node previous;
        for (auto n = _front(); n.is_valid(); n = n.header_ptr()->next)
        {
            TN_ASSERT_ALWAYS(n.header_ptr()->previous == previous, "previous link does not match the forward walk");
            previous = n;
            ++forward_count;
        }
        TN_ASSERT_ALWAYS(previous == _back(), "forward walk does not end at the back node");

        isize backward_count = 0;
        node next;
        for (auto n = _back(); n.is_valid(); n = n.header_ptr()->previous)
        {
            TN_ASSERT_ALWAYS(n.header_ptr()->next == next, "next link does not match the backward walk");
            next = n;
            ++backward_count;
        }
        TN_ASSERT_ALWAYS(next == _front(), "backward walk does not end at the front node");
        TN_ASSERT_ALWAYS(forward_count == backward_count, "forward and backward walks disagree");

        return forward_count;
    }

    // helper
private:
    [[nodiscard]] node _front() const { return _ends.has_value() ? _ends.value().front : node{}; }
    [[nodiscard]] node _back() const { return _ends.has_value() ? _ends.value().back : node{}; }

    builder _make_builder(node n, node next, node previous, bool initialized)
    {
        new (tn::placement_new, n.header_ptr()) header{next, previous};
        return builder(list_structure{this}, n.to_header_opaque(), initialized);
    }

    builder _allocate_between(metadata_type metadata, node next, node previous)
    {
        return _make_builder(node::allocate_with_metadata(metadata, _resource), next, previous, false);
    }

    result<builder, allocate_error> _try_allocate_between(metadata_type metadata, node next, node previous)
    {
        auto n = node::try_allocate_with_metadata(metadata, _resource);
        if (n.has_error())
            return n.error();
        return _make_builder(n.value(), next, previous, false);
    }

    /// Links a node between the neighbors recorded in its header.
    void _link(node n)
    {
        auto& h = *n.header_ptr();
        auto const front = _front();
        auto const back = _back();

        if (h.previous.is_valid())
        {
            auto& ph = *h.previous.header_ptr();
            TN_ASSERT(ph.next == h.next, "list was modified between allocating and inserting a node");
            ph.next = n;
        }
        else
        {
            TN_ASSERT(front == h.next, "list was modified between allocating and inserting a node");
        }

        if (h.next.is_valid())
        {
            auto& nh = *h.next.header_ptr();
            TN_ASSERT(nh.previous == h.previous, "list was modified between allocating and inserting a node");
            nh.previous = n;
        }
        else
        {
            TN_ASSERT(back == h.previous, "list was modified between allocating and inserting a node");
        }

        _ends = ends{h.previous.is_valid() ? front : n, h.next.is_valid() ? back : n};
        ++_version;
    }

    /// Removes a node from the chain.
    /// Its own header keeps the old neighbors, which are adjacent afterwards, so it can be re-linked in place.
    void _unlink(node n)
    {
        TN_ASSERT(_ends.has_value(), "cannot unlink from an empty list");
        auto const& h = *n.header_ptr();
        auto& e = _ends.value();

        if (h.previous.is_valid())
        {
            auto& ph = *h.previous.header_ptr();
            TN_ASSERT(ph.next == n, "corrupted links");
            ph.next = h.next;
        }
        else
        {
            TN_ASSERT(e.front == n, "corrupted links");
            e.front = h.next;
        }

        if (h.next.is_valid())
        {
            auto& nh = *h.next.header_ptr();
            TN_ASSERT(nh.previous == n, "corrupted links");
            nh.previous = h.previous;
        }
        else
        {
            TN_ASSERT(e.back == n, "corrupted links");
            e.back = h.previous;
        }

        if (!e.front.is_valid())
        {
            TN_ASSERT(!e.back.is_valid(), "corrupted links");
            _ends.reset();
        }
        ++_version;
    }

    builder _unlink_to_builder(node n)
    {
        _unlink(n);
        return builder(list_structure{this}, n.to_header_opaque(), true);
    }

    /// Unlinks first, so the list is consistent even if the payload destructor throws.
    void _delete(node n)
    {
        _unlink(n);
        TN_DEFER { n.deallocate(_resource); };
        traits::destroy(n.value_ptr(), n.metadata());
    }

    thin_box<U> _pop_boxed(node n)
    {
        thin_box<U> box;
        {
            auto b = thin_box<U>::allocate_uninit(box, n.metadata(), _resource);
            b.relocate_from(n.value_ptr());
            _unlink(n);
            n.deallocate(_resource);
            tn::move(b).insert();
        }
        return box;
    }

    result<thin_box<U>, allocate_error> _try_pop_boxed(node n)
    {
        thin_box<U> box;
        {
            auto b = thin_box<U>::try_allocate_uninit(box, n.metadata(), _resource);
            if (b.has_error())
                return b.error();
            b.value().relocate_from(n.value_ptr());
            _unlink(n);
            n.deallocate(_resource);
            tn::move(b.value()).insert();
        }
        return tn::move(box);
    }

    // members
private:
    tn::optional<ends> _ends;
    memory_resource const* _resource = nullptr;
    isize _version = 0;
};

// =========================================================================================================
// Iteration
// =========================================================================================================

/// Bidirectional iterator yielding the payload views (T&, tn::span<T>, tn::dyn_ref<Caps>).
/// Decrementing end() yields the last element of the traversal direction.
template <class U>
template <bool IsConst, bool IsReverse>
struct tn::linked_list<U>::basic_iterator
{
    using list_type = std::conditional_t<IsConst, linked_list const, linked_list>;
    using value_reference = std::conditional_t<IsConst, const_reference, reference>;
    using difference_type = isize;

public:
    basic_iterator() = default;
    basic_iterator(list_type* list, node current) : _list(list), _current(current), _version(list->_version) {}

    [[nodiscard]] value_reference operator*() const
    {
        _check_version();
        TN_ASSERT(_current.is_valid(), "dereferencing an end iterator");
        if constexpr (IsConst)
            return _current.get_const();
        else
            return _current.get();
    }

    [[nodiscard]] auto* operator->() const
        requires(traits::shape == payload_shape::fixed)
    {
        return &**this;
    }

    basic_iterator& operator++()
    {
        _check_version();
        TN_ASSERT(_current.is_valid(), "incrementing an end iterator");
        _current = IsReverse ? _current.header_ptr()->previous : _current.header_ptr()->next;
        return *this;
    }
    basic_iterator operator++(int)
    {
        auto copy = *this;
        ++*this;
        return copy;
    }

    basic_iterator& operator--()
    {
        _check_version();
        if (!_current.is_valid())
            _current = IsReverse ? _list->_front() : _list->_back();
        else
            _current = IsReverse ? _current.header_ptr()->next : _current.header_ptr()->previous;
        return *this;
    }
    basic_iterator operator--(int)
    {
        auto copy = *this;
        --*this;
        return copy;
    }

    [[nodiscard]] bool operator==(basic_iterator const& rhs) const { return _current == rhs._current; }

private:
    void _check_version() const
    {
        TN_ASSERT(_list != nullptr, "default-constructed iterator");
        TN_ASSERT(_list->_version == _version, "list was modified after the iterator was created");
    }

    list_type* _list = nullptr;
    node _current;
    isize _version = 0;
};

template <class U>
template <bool IsConst>
struct tn::linked_list<U>::reversed_range
{
    basic_iterator<IsConst, true> _begin;
    basic_iterator<IsConst, true> _end;

    [[nodiscard]] basic_iterator<IsConst, true> begin() const { return _begin; }
    [[nodiscard]] basic_iterator<IsConst, true> end() const { return _end; }
};

/// Owning, double-ended sequence of the elements of a consumed list, each handed out in its own box.
///
///   auto drain = tn::move(list).drain_boxed();
///   auto first = drain.next();      // optional<thin_box<U>>
///   auto last = drain.next_back();
///   auto rest = tn::move(drain).take_remainder();
template <class U>
struct tn::linked_list<U>::boxed_drain
{
public:
    explicit boxed_drain(linked_list&& list) : _list(tn::move(list)) {}

    /// front element, nullopt once the drain is empty
    [[nodiscard]] optional<thin_box<U>> next() { return _list.pop_front_boxed(); }
    /// back element, nullopt once the drain is empty
    [[nodiscard]] optional<thin_box<U>> next_back() { return _list.pop_back_boxed(); }

    /// Fallible versions: a failed box allocation leaves the element in the drain.
    [[nodiscard]] optional<result<thin_box<U>, allocate_error>> try_next() { return _list.try_pop_front_boxed(); }
    [[nodiscard]] optional<result<thin_box<U>, allocate_error>> try_next_back() { return _list.try_pop_back_boxed(); }

    [[nodiscard]] bool is_empty() const { return _list.is_empty(); }

    /// Elements not yet taken, in order.
    [[nodiscard]] linked_list const& remaining() const { return _list; }

    /// Ends the drain and returns the elements not yet taken as a list.
    [[nodiscard]] linked_list take_remainder() && { return tn::move(_list); }

private:
    linked_list _list;
};

// =========================================================================================================
// Cursors
// =========================================================================================================

/// Position in the list that can move in both directions and (mutable flavor) edit around itself.
///
/// There is a "ghost" position between back and front that makes the list circular:
/// move_next from the back (or move_previous from the front) lands on the ghost, and moving from the
/// ghost lands on the front (or back). Inserting before the ghost appends, inserting after it prepends.
template <class U>
template <bool IsConst>
struct tn::linked_list<U>::basic_cursor
{
    using list_type = std::conditional_t<IsConst, linked_list const, linked_list>;
    using value_reference = std::conditional_t<IsConst, const_reference, reference>;

public:
    basic_cursor(list_type* list, node current) : _list(list), _current(current) {}

    /// read-only view of the same position
    operator basic_cursor<true>() const // NOLINT
        requires(!IsConst)
    {
        return {_list, _current};
    }

    // navigation
public:
    void move_next() { _current = _current.is_valid() ? _current.header_ptr()->next : _list->_front(); }
    void move_previous() { _current = _current.is_valid() ? _current.header_ptr()->previous : _list->_back(); }

    [[nodiscard]] bool is_ghost() const { return !_current.is_valid(); }

    /// Precondition: !is_ghost().
    [[nodiscard]] value_reference current() const
    {
        TN_ASSERT(!is_ghost(), "cursor is at the ghost position");
        if constexpr (IsConst)
            return _current.get_const();
        else
            return _current.get();
    }

    [[nodiscard]] list_type& list() const { return *_list; }

    // insertion
public:
    /// Allocates a node that insert() links right before the cursor (ghost: at the back).
    [[nodiscard]] builder allocate_uninit_before(metadata_type metadata) const
        requires(!IsConst)
    {
        return _list->_allocate_between(metadata, _current, _before_previous());
    }
    /// Allocates a node that insert() links right after the cursor (ghost: at the front).
    [[nodiscard]] builder allocate_uninit_after(metadata_type metadata) const
        requires(!IsConst)
    {
        return _list->_allocate_between(metadata, _after_next(), _current);
    }

    [[nodiscard]] result<builder, allocate_error> try_allocate_uninit_before(metadata_type metadata) const
        requires(!IsConst)
    {
        return _list->_try_allocate_between(metadata, _current, _before_previous());
    }
    [[nodiscard]] result<builder, allocate_error> try_allocate_uninit_after(metadata_type metadata) const
        requires(!IsConst)
    {
        return _list->_try_allocate_between(metadata, _after_next(), _current);
    }

    template <class... Args>
    reference emplace_before(Args&&... args) const
        requires(!IsConst && traits::shape == payload_shape::fixed)
    {
        auto b = allocate_uninit_before({});
        auto& v = b.emplace(tn::forward<Args>(args)...);
        tn::move(b).insert();
        return v;
    }
    template <class... Args>
    reference emplace_after(Args&&... args) const
        requires(!IsConst && traits::shape == payload_shape::fixed)
    {
        auto b = allocate_uninit_after({});
        auto& v = b.emplace(tn::forward<Args>(args)...);
        tn::move(b).insert();
        return v;
    }

    template <class E = std::remove_extent_t<U>>
    void insert_before_array(tn::span<E const> values) const
        requires(!IsConst && traits::shape == payload_shape::array)
    {
        auto b = allocate_uninit_before(values.size());
        b.copy_from(values);
        tn::move(b).insert();
    }
    template <class E = std::remove_extent_t<U>>
    void insert_after_array(tn::span<E const> values) const
        requires(!IsConst && traits::shape == payload_shape::array)
    {
        auto b = allocate_uninit_after(values.size());
        b.copy_from(values);
        tn::move(b).insert();
    }

    template <class T>
    void insert_before_unsize(T&& value) const
        requires(!IsConst && traits::shape == payload_shape::open_ended)
    {
        using V = std::remove_cvref_t<T>;
        auto b = allocate_uninit_before(tn::widen<typename traits::capabilities, V>());
        b.template emplace_as<V>(tn::forward<T>(value));
        tn::move(b).insert();
    }
    template <class T>
    void insert_after_unsize(T&& value) const
        requires(!IsConst && traits::shape == payload_shape::open_ended)
    {
        using V = std::remove_cvref_t<T>;
        auto b = allocate_uninit_after(tn::widen<typename traits::capabilities, V>());
        b.template emplace_as<V>(tn::forward<T>(value));
        tn::move(b).insert();
    }

    // removal
public:
    /// Unlinks the current node and hands it out; the cursor moves to the next position.
    /// Ghost: nullopt, nothing changes.
    [[nodiscard]] optional<builder> remove_current_node()
        requires(!IsConst)
    {
        if (is_ghost())
            return tn::nullopt;
        auto const n = tn::exchange(_current, _current.header_ptr()->next);
        return _list->_unlink_to_builder(n);
    }

    /// Destroys and frees the current element; the cursor moves to the next position.
    /// Returns false at the ghost position.
    bool delete_current()
        requires(!IsConst)
    {
        if (is_ghost())
            return false;
        auto const n = tn::exchange(_current, _current.header_ptr()->next);
        _list->_delete(n);
        return true;
    }

    /// Moves the current value out; the cursor moves to the next position.
    /// A throwing move loses the element, as in pop_front.
    [[nodiscard]] optional<U> pop_current()
        requires(!IsConst && traits::shape == payload_shape::fixed)
    {
        auto b = remove_current_node();
        if (!b.has_value())
            return tn::nullopt;
        return tn::move(b.value()).take();
    }

private:
    [[nodiscard]] node _before_previous() const { return _current.is_valid() ? _current.header_ptr()->previous : _list->_back(); }
    [[nodiscard]] node _after_next() const { return _current.is_valid() ? _current.header_ptr()->next : _list->_front(); }

    list_type* _list;
    node _current;
};
