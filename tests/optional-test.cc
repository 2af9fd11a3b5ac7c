#include <thin-node/optional.hh>

#include <nexus/test.hh>

#include "test_helpers.hh"

#include <string>

// optional stays trivial for trivial payloads
static_assert(std::is_trivially_copyable_v<tn::optional<int>>);
static_assert(std::is_trivially_destructible_v<tn::optional<int>>);
static_assert(!std::is_trivially_destructible_v<tn::optional<std::string>>);

namespace
{
struct move_only
{
    int value = 0;

    explicit move_only(int v) : value(v) {}
    move_only(move_only const&) = delete;
    move_only(move_only&& rhs) noexcept : value(rhs.value) { rhs.value = -1; }
    move_only& operator=(move_only const&) = delete;
    move_only& operator=(move_only&&) = delete;
};

struct destroy_counter
{
    static inline int destroyed = 0;
    int value = 0;

    explicit destroy_counter(int v) : value(v) {}
    destroy_counter(destroy_counter const&) = default;
    ~destroy_counter() { ++destroyed; }
};

// pops of move-only payloads must still compile
static_assert(std::is_move_constructible_v<tn::optional<move_only>>);
static_assert(!std::is_copy_constructible_v<tn::optional<move_only>>);
} // namespace

TEST("optional - empty and engaged")
{
    tn::optional<int> empty;
    CHECK(!empty.has_value());
    CHECK(empty == tn::nullopt);

    tn::optional<int> a = 5;
    CHECK(a.has_value());
    CHECK(a.value() == 5);
    CHECK(a == 5);
    CHECK(!(empty == 5));

    tn::optional<int> b = tn::nullopt;
    CHECK(b == empty);
    b = a;
    CHECK(b == a);
}

TEST("optional - non-trivial payloads")
{
    destroy_counter::destroyed = 0;
    {
        tn::optional<destroy_counter> o = destroy_counter(1);
        auto const after_temporary = destroy_counter::destroyed;

        o.emplace(2);
        CHECK(o.value().value == 2);
        CHECK(destroy_counter::destroyed == after_temporary + 1);

        o.reset();
        CHECK(!o.has_value());
        CHECK(destroy_counter::destroyed == after_temporary + 2);

        o.reset();
        CHECK(destroy_counter::destroyed == after_temporary + 2);

        o.emplace(3);
    }
    CHECK(destroy_counter::destroyed >= 3);
}

TEST("optional - move-only payloads move out")
{
    tn::optional<move_only> a = move_only(7);
    tn::optional<move_only> b = tn::move(a);
    CHECK(!a.has_value());
    REQUIRE(b.has_value());

    move_only taken = tn::move(b).value();
    CHECK(taken.value == 7);
    CHECK(b.value().value == -1);
}

TEST("optional - strings")
{
    tn::optional<std::string> s = std::string("payload");
    tn::optional<std::string> copy = s;
    CHECK(copy == s);
    CHECK(copy.value() == "payload");

    tn::optional<std::string> moved;
    moved = tn::move(s);
    CHECK(moved.value() == "payload");
}

#if TN_ASSERT_ENABLED
TEST("optional - value on empty asserts")
{
    tn::optional<int> empty;
    CHECK(test::fails_assertion([&] { (void)empty.value(); }));
}
#endif
