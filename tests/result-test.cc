#include <thin-node/allocate_error.hh>
#include <thin-node/result.hh>

#include <nexus/test.hh>

#include "test_helpers.hh"

#include <memory>
#include <string>

namespace
{
tn::result<int, tn::allocate_error> checked_half(int v)
{
    if (v % 2 != 0)
        return tn::allocate_error::layout_overflow();
    return v / 2;
}

tn::result<void, tn::allocate_error> checked_reserve(tn::isize bytes)
{
    if (bytes > 1024)
        return tn::allocate_error::out_of_memory(tn::memory_layout{bytes, 8});
    return {};
}

struct tracked
{
    static inline int alive = 0;
    tracked() { ++alive; }
    tracked(tracked const&) { ++alive; }
    tracked(tracked&&) noexcept { ++alive; }
    ~tracked() { --alive; }
};
} // namespace

TEST("result - value and error alternatives")
{
    auto ok = checked_half(8);
    REQUIRE(ok.has_value());
    CHECK(!ok.has_error());
    CHECK(ok.value() == 4);

    auto bad = checked_half(3);
    REQUIRE(bad.has_error());
    CHECK(bad.error().is_layout_overflow());
}

TEST("result - void results")
{
    CHECK(checked_reserve(16).has_value());

    auto r = checked_reserve(4096);
    REQUIRE(r.has_error());
    CHECK(r.error().is_out_of_memory());
    CHECK(r.error().requested.size == 4096);
}

TEST("result - move-only values")
{
    tn::result<std::unique_ptr<int>, tn::allocate_error> r = std::make_unique<int>(3);
    REQUIRE(r.has_value());

    auto moved = tn::move(r);
    REQUIRE(moved.has_value());
    std::unique_ptr<int> p = tn::move(moved).value();
    CHECK(*p == 3);
}

TEST("result - copies and assignment keep the active alternative")
{
    tn::result<std::string, tn::allocate_error> a = std::string("value");
    tn::result<std::string, tn::allocate_error> b = tn::allocate_error::layout_overflow();

    auto c = a;
    CHECK(c.value() == "value");

    c = b;
    CHECK(c.has_error());

    b = a;
    CHECK(b.value() == "value");
}

TEST("result - payload lifetime")
{
    tracked::alive = 0;
    {
        tn::result<tracked, tn::allocate_error> r = tracked();
        CHECK(tracked::alive == 1);
        r = tn::allocate_error::layout_overflow();
        CHECK(tracked::alive == 0);
    }
    CHECK(tracked::alive == 0);
}

#if TN_ASSERT_ENABLED
TEST("result - wrong alternative access asserts")
{
    auto ok = checked_half(2);
    auto bad = checked_half(1);
    CHECK(test::fails_assertion([&] { (void)ok.error(); }));
    CHECK(test::fails_assertion([&] { (void)bad.value(); }));
    CHECK(test::fails_assertion([&] { checked_reserve(2048).value(); }));
}
#endif
