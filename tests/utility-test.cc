#include <thin-node/utility.hh>

#include <nexus/test.hh>

#include "test_helpers.hh"

#include <string>
#include <vector>

static_assert(tn::align_up(300, 16) == 304);
static_assert(tn::align_up(304, 16) == 304);
static_assert(tn::align_up(7, 1) == 7);
static_assert(tn::is_aligned(64, 32));
static_assert(!tn::is_aligned(48, 32));
static_assert(tn::is_power_of_two(1));
static_assert(tn::is_power_of_two(4096));
static_assert(!tn::is_power_of_two(12));
static_assert(tn::max(3, 9) == 9);
static_assert(tn::min(3, 9) == 3);

static_assert(std::is_same_v<tn::function_ptr<void(void*)>, void (*)(void*)>);
static_assert(std::is_same_v<tn::function_ptr<int() noexcept>, int (*)() noexcept>);

static_assert(sizeof(tn::storage_for<double>) == sizeof(double));
static_assert(alignof(tn::storage_for<double>) == alignof(double));
static_assert(std::is_trivially_destructible_v<tn::storage_for<int>>);

TEST("utility - exchange and move")
{
    std::string s = "old";
    auto prev = tn::exchange(s, "new");
    CHECK(prev == "old");
    CHECK(s == "new");

    std::vector<int> v = {1, 2, 3};
    auto taken = tn::move(v);
    CHECK(taken.size() == 3);
}

TEST("utility - align_up on pointers")
{
    alignas(64) tn::byte buffer[128];
    auto const p = buffer + 3;
    auto const aligned = tn::align_up(p, 16);
    CHECK(aligned == buffer + 16);
    CHECK(tn::is_aligned(aligned, 16));
    CHECK(tn::align_up(buffer + 64, 64) == buffer + 64);
}

TEST("utility - memcpy")
{
    int src[3] = {1, 2, 3};
    int dst[3] = {};
    tn::memcpy(dst, src, tn::isize(sizeof(src)));
    CHECK(dst[2] == 3);

    // zero bytes allows null pointers
    tn::memcpy(nullptr, nullptr, 0);
}

TEST("utility - storage_for leaves the value unconstructed")
{
    tn::storage_for<std::string> storage;
    auto p = new (tn::placement_new, &storage.value) std::string("manual");
    CHECK(storage.value == "manual");
    p->~basic_string();
}

TEST("utility - TN_DEFER runs at scope exit")
{
    std::vector<int> order;
    {
        TN_DEFER { order.push_back(1); };
        TN_DEFER { order.push_back(2); };
        order.push_back(0);
    }
    REQUIRE(order.size() == 3);
    CHECK(order[0] == 0);
    CHECK(order[1] == 2);
    CHECK(order[2] == 1);
}

TEST("utility - TN_DEFER runs when unwinding")
{
    auto released = false;
    try
    {
        TN_DEFER { released = true; };
        throw 1;
    }
    catch (int) // NOLINT(bugprone-empty-catch)
    {
    }
    CHECK(released);
}

TEST("utility - TN_DEFER may throw on normal exit")
{
    auto threw = false;
    try
    {
        TN_DEFER { throw 2; };
    }
    catch (int v)
    {
        threw = v == 2;
    }
    CHECK(threw);
}

#if TN_ASSERT_ENABLED
TEST("utility - alignment preconditions")
{
    CHECK(test::fails_assertion([] { (void)tn::align_up(10, 3); }));
    CHECK(test::fails_assertion([] { (void)tn::is_aligned(10, 0); }));
    CHECK(test::fails_assertion([] { (void)tn::is_power_of_two(0); }));
}
#endif
