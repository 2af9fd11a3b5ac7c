#include <thin-node/capabilities.hh>
#include <thin-node/payload.hh>

#include <nexus/test.hh>

#include "test_helpers.hh"

#include <string>

namespace
{
/// user-defined capability table
struct has_area
{
    tn::function_ptr<double(void const*)> area = nullptr;

    template <class T>
    static constexpr has_area make_for()
    {
        return {[](void const* p) { return static_cast<T const*>(p)->area(); }};
    }
};

struct square
{
    double side = 0;
    double area() const { return side * side; }
};

struct rect
{
    double w = 0;
    double h = 0;
    double area() const { return w * h; }
};

struct not_movable
{
    not_movable() = default;
    not_movable(not_movable&&) = delete;
};

static_assert(tn::capabilities_for<has_area, square>);
static_assert(tn::capabilities_for<tn::no_capabilities, std::string>);
static_assert(!tn::capabilities_for<has_area, int[]>);
} // namespace

TEST("dyn - widen yields one static descriptor per type")
{
    auto const a = tn::widen<has_area, square>();
    auto const b = tn::widen<has_area, square>();
    auto const c = tn::widen<has_area, rect>();

    CHECK(a == b);
    CHECK(a != c);
    CHECK(a->size == tn::isize(sizeof(square)));
    CHECK(a->alignment == tn::isize(alignof(square)));
    CHECK(a->layout() == tn::memory_layout::of<square>());

    // trivially destructible types need no destroy call
    CHECK(a->destroy == nullptr);
    auto const string_meta = tn::widen<tn::no_capabilities, std::string>();
    CHECK(string_meta->destroy != nullptr);

    CHECK(a->relocate != nullptr);
    auto const pinned_meta = tn::widen<tn::no_capabilities, not_movable>();
    CHECK(pinned_meta->relocate == nullptr);
}

TEST("dyn - capability calls through dyn_ref")
{
    square s{3};
    rect r{2, 5};

    auto rs = tn::dyn_ref<has_area>(&s, tn::widen<has_area, square>());
    auto rr = tn::dyn_ref<has_area>(&r, tn::widen<has_area, rect>());

    CHECK(rs.caps().area(rs.ptr()) == 9.0);
    CHECK(rr.caps().area(rr.ptr()) == 10.0);
}

TEST("dyn - downcasts")
{
    std::string s = "text";
    auto ref = tn::dyn_ref<tn::debug_printable>(&s, tn::widen<tn::debug_printable, std::string>());

    CHECK(ref.is<std::string>());
    CHECK(!ref.is<int>());
    CHECK(ref.try_as<std::string>() == &s);
    CHECK(ref.try_as<int>() == nullptr);

    ref.as<std::string>() += "!";
    CHECK(s == "text!");

    tn::dyn_ref<tn::debug_printable const> cref = ref;
    CHECK(cref.ptr() == &s);
    CHECK(cref.as<std::string>() == "text!");
    static_assert(std::is_same_v<decltype(cref.try_as<std::string>()), std::string const*>);

#if TN_ASSERT_ENABLED
    CHECK(test::fails_assertion([&] { (void)ref.as<double>(); }));
#endif
}

TEST("dyn - debug_printable renders the concrete value")
{
    int i = 42;
    std::string s = "hi";
    char c = '\n';

    CHECK(tn::to_debug_string(tn::dyn_ref<tn::debug_printable>(&i, tn::widen<tn::debug_printable, int>())) == "42");
    CHECK(tn::to_debug_string(tn::dyn_ref<tn::debug_printable>(&s, tn::widen<tn::debug_printable, std::string>())) == "\"hi\"");
    CHECK(tn::to_debug_string(tn::dyn_ref<tn::debug_printable>(&c, tn::widen<tn::debug_printable, char>())) == "'\\n'");
}

TEST("dyn - relocate moves into uninitialized storage")
{
    using traits = tn::payload_traits<tn::dyn<tn::no_capabilities>>;
    auto const meta = tn::widen<tn::no_capabilities, std::string>();

    tn::storage_for<std::string> from;
    tn::storage_for<std::string> to;
    new (tn::placement_new, &from.value) std::string(64, 'r');

    traits::relocate(reinterpret_cast<tn::byte*>(&to.value), reinterpret_cast<tn::byte*>(&from.value), meta);
    CHECK(to.value == std::string(64, 'r'));

    traits::destroy(reinterpret_cast<tn::byte*>(&to.value), meta);
}

TEST("payload_traits - shapes")
{
    static_assert(tn::payload_traits<int>::shape == tn::payload_shape::fixed);
    static_assert(tn::payload_traits<int[]>::shape == tn::payload_shape::array);
    static_assert(tn::payload_traits<tn::dyn<has_area>>::shape == tn::payload_shape::open_ended);

    static_assert(!tn::payload_traits<int>::has_stored_metadata);
    static_assert(tn::payload_traits<int[]>::metadata_layout() == tn::memory_layout::of<tn::isize>());
    static_assert(tn::payload_traits<tn::dyn<has_area>>::metadata_layout() == tn::memory_layout::of<void*>());

    auto const arr = tn::payload_traits<double[]>::value_layout(4);
    REQUIRE(arr.has_value());
    CHECK(arr.value().size == 32);

    CHECK(tn::payload_traits<double[]>::value_layout(-1).has_error());
}
