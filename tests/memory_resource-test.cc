#include <thin-node/memory_resource.hh>

#include <nexus/test.hh>

#include "test_helpers.hh"

TEST("memory_resource - default resource")
{
    auto const& res = tn::resolve_memory_resource(nullptr);
    CHECK(&res == tn::default_memory_resource);

    for (tn::isize alignment : {1, 2, 8, 16, 64, 256})
    {
        auto p = res.allocate_bytes(24, alignment, res.userdata);
        REQUIRE(p != nullptr);
        CHECK(tn::is_aligned(p, alignment));
        res.deallocate_bytes(p, 24, alignment, res.userdata);
    }

    CHECK(res.allocate_bytes(0, 8, res.userdata) == nullptr);
    CHECK(res.try_allocate_bytes(0, 8, res.userdata) == nullptr);

    auto q = res.try_allocate_bytes(100, 32, res.userdata);
    REQUIRE(q != nullptr);
    CHECK(tn::is_aligned(q, 32));
    res.deallocate_bytes(q, 100, 32, res.userdata);
}

TEST("memory_resource - custom resources are used as given")
{
    test::counting_resource counting;
    CHECK(&tn::resolve_memory_resource(counting.get()) == counting.get());

    auto const& res = *counting.get();
    auto p = res.allocate_bytes(40, 8, res.userdata);
    CHECK(counting.live_blocks() == 1);
    CHECK(counting.last_request.size == 40);

    counting.fail_next = 1;
    CHECK(res.try_allocate_bytes(8, 8, res.userdata) == nullptr);
    CHECK(counting.failed_allocations == 1);

    res.deallocate_bytes(p, 40, 8, res.userdata);
    CHECK(counting.is_balanced());
}

#if TN_ASSERT_ENABLED
TEST("memory_resource - invalid alignment asserts")
{
    auto const& res = *tn::default_memory_resource;
    CHECK(test::fails_assertion([&] { (void)res.try_allocate_bytes(8, 3, res.userdata); }));
}
#endif
