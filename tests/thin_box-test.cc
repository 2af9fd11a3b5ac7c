#include <thin-node/capabilities.hh>
#include <thin-node/thin_box.hh>

#include <nexus/test.hh>

#include "test_helpers.hh"

#include <string>

namespace
{
struct counted
{
    static inline int alive = 0;
    int value = 0;

    explicit counted(int v) : value(v) { ++alive; }
    counted(counted const& rhs) : value(rhs.value) { ++alive; }
    ~counted() { --alive; }
};

static_assert(sizeof(tn::thin_box<int>) == sizeof(void*));
static_assert(sizeof(tn::thin_box<int[]>) == sizeof(void*));
static_assert(sizeof(tn::thin_box<tn::dyn<tn::debug_printable>>) == sizeof(void*));
static_assert(!std::is_copy_constructible_v<tn::thin_box<int>>);
} // namespace

TEST("thin_box - fixed payload")
{
    test::counting_resource res;
    counted::alive = 0;
    {
        auto b = tn::thin_box<counted>::create_in(res.get(), 5);
        CHECK(b.is_valid());
        CHECK(b->value == 5);
        CHECK(b.get().value == 5);
        CHECK(b.resource() == res.get());
        CHECK(counted::alive == 1);
        CHECK(res.live_blocks() == 1);
    }
    CHECK(counted::alive == 0);
    CHECK(res.is_balanced());
}

TEST("thin_box - array payload")
{
    test::counting_resource res;
    {
        auto b = tn::thin_box<int[]>::create_copy({1, 2, 3}, res.get());
        CHECK(b.length() == 3);
        auto v = b.get();
        CHECK(v[0] == 1);
        CHECK(v[2] == 3);
        v[1] = 20;
        CHECK(b.get()[1] == 20);

        auto const& cb = b;
        tn::span<int const> cv = cb.get();
        CHECK(cv.size() == 3);
    }
    CHECK(res.is_balanced());
}

TEST("thin_box - open-ended payload")
{
    test::counting_resource res;
    {
        auto b = tn::thin_box<tn::dyn<tn::debug_printable>>::create_unsize(std::string("boxed"), res.get());
        CHECK(b.get().is<std::string>());
        CHECK(b.get().as<std::string>() == "boxed");
        CHECK(tn::to_debug_string(b.get()) == "\"boxed\"");
        auto const expected_meta = tn::widen<tn::debug_printable, std::string>();
        CHECK(b.metadata() == expected_meta);
    }
    CHECK(res.is_balanced());
}

TEST("thin_box - move and reset")
{
    test::counting_resource res;
    counted::alive = 0;
    {
        auto a = tn::thin_box<counted>::create_in(res.get(), 1);
        auto b = tn::move(a);
        CHECK(!a.is_valid());
        CHECK(b->value == 1);

        auto c = tn::thin_box<counted>::create_in(res.get(), 2);
        c = tn::move(b);
        CHECK(counted::alive == 1);
        CHECK(c->value == 1);

        c.reset();
        CHECK(!c.is_valid());
        CHECK(counted::alive == 0);
        CHECK(res.live_blocks() == 0);
    }
    CHECK(res.is_balanced());
}

TEST("thin_box - default resource")
{
    auto b = tn::thin_box<std::string>::create("default");
    CHECK(*b.handle().data_ptr() == "default");
    CHECK(b.resource() == nullptr);
}

TEST("thin_box - failed allocation leaves the target empty")
{
    test::counting_resource res;
    res.fail_next = 1;

    tn::thin_box<int[]> box;
    auto r = tn::thin_box<int[]>::try_allocate_uninit(box, 8, res.get());
    REQUIRE(r.has_error());
    CHECK(r.error().is_out_of_memory());
    CHECK(!box.is_valid());
    CHECK(res.is_balanced());
}
