#include <thin-node/capabilities.hh>
#include <thin-node/maybe_uninit_node.hh>
#include <thin-node/node_ptr.hh>

#include <nexus/test.hh>

#include "test_helpers.hh"

#include <string>
#include <vector>

namespace
{
struct slot_header
{
    int id = 0;
};

/// Minimal owning structure: holds at most one node.
template <class U>
struct slot
{
    using node = tn::node_ptr<slot_header, U>;

    tn::memory_resource const* resource = nullptr;
    node stored;
    int inserts = 0;

    void release()
    {
        node::traits::destroy(stored.value_ptr(), stored.metadata());
        stored.deallocate(resource);
        stored = {};
    }
};

/// structure handle of a slot
template <class U>
struct slot_ref
{
    slot<U>* target;

    void insert(tn::header_opaque_node_ptr<U> n) const
    {
        target->stored = n.template to_transparent<slot_header>();
        ++target->inserts;
    }
    [[nodiscard]] tn::memory_resource const* allocator() const { return target->resource; }
    void deallocate(tn::header_opaque_node_ptr<U> n) const
    {
        n.template to_transparent<slot_header>().deallocate(target->resource);
    }
};

template <class U>
tn::maybe_uninit_node<U, slot_ref<U>> allocate_in(slot<U>& s, typename slot<U>::node::metadata_type metadata)
{
    auto n = slot<U>::node::allocate_with_metadata(metadata, s.resource);
    new (tn::placement_new, n.header_ptr()) slot_header{42};
    return {slot_ref<U>{&s}, n.to_header_opaque(), false};
}

struct tracked
{
    static inline int alive = 0;
    int value = 0;

    explicit tracked(int v) : value(v) { ++alive; }
    tracked(tracked const& rhs) : value(rhs.value) { ++alive; }
    tracked(tracked&& rhs) noexcept : value(rhs.value) { ++alive; }
    ~tracked() { --alive; }
};

struct throws_on_third_copy
{
    static inline int copies = 0;
    static inline int alive = 0;

    throws_on_third_copy() { ++alive; }
    throws_on_third_copy(throws_on_third_copy const&)
    {
        if (++copies == 3)
            throw 3;
        ++alive;
    }
    ~throws_on_third_copy() { --alive; }
};

static_assert(tn::structure_handle<slot_ref<int>, int>);
static_assert(!tn::structure_handle<int*, int>);
} // namespace

TEST("maybe_uninit_node - abandoning an uninitialized node only frees it")
{
    test::counting_resource res;
    slot<tracked> s{res.get()};

    tracked::alive = 0;
    {
        auto b = allocate_in(s, {});
        CHECK(b.is_valid());
        CHECK(!b.is_initialized());
        CHECK(res.live_blocks() == 1);
    }
    CHECK(tracked::alive == 0);
    CHECK(s.inserts == 0);
    CHECK(res.is_balanced());
}

TEST("maybe_uninit_node - abandoning an initialized node destroys the payload")
{
    test::counting_resource res;
    slot<tracked> s{res.get()};

    tracked::alive = 0;
    {
        auto b = allocate_in(s, {});
        b.emplace(7);
        CHECK(b.is_initialized());
        CHECK(b.get().value == 7);
        CHECK(tracked::alive == 1);
    }
    CHECK(tracked::alive == 0);
    CHECK(res.is_balanced());
}

TEST("maybe_uninit_node - insert hands the node to the structure")
{
    test::counting_resource res;
    slot<std::string> s{res.get()};

    {
        auto b = allocate_in(s, {});
        b.emplace("payload");
        auto opaque = tn::move(b).insert();
        CHECK(!b.is_valid());
        CHECK(opaque.is_valid());
        CHECK(*opaque.data_ptr() == "payload");
    }

    CHECK(s.inserts == 1);
    CHECK(s.stored.header_ptr()->id == 42);
    CHECK(s.stored.get() == "payload");
    CHECK(res.live_blocks() == 1);

    s.release();
    CHECK(res.is_balanced());
}

TEST("maybe_uninit_node - take moves the value out and frees the node")
{
    test::counting_resource res;
    slot<std::string> s{res.get()};

    auto b = allocate_in(s, {});
    b.emplace(std::string(100, 'x'));
    auto v = tn::move(b).take();
    CHECK(v.size() == 100);
    CHECK(!b.is_valid());
    CHECK(res.is_balanced());
}

TEST("maybe_uninit_node - array payloads")
{
    test::counting_resource res;

    SECTION("copy_from trivially copyable elements")
    {
        slot<int[]> s{res.get()};
        auto b = allocate_in(s, 4);
        CHECK(b.length() == 4);
        b.copy_from(tn::span<int const>{1, 2, 3, 4});
        tn::move(b).insert();

        auto v = s.stored.get();
        CHECK(v.size() == 4);
        CHECK(v[3] == 4);
        s.release();
    }

    SECTION("move_from")
    {
        slot<std::string[]> s{res.get()};
        std::vector<std::string> src = {"a", "bb", "ccc"};
        auto b = allocate_in(s, 3);
        b.move_from(tn::span<std::string>(src));
        tn::move(b).insert();

        CHECK(s.stored.get()[2] == "ccc");
        s.release();
    }

    SECTION("copy_from rolls back when an element copy throws")
    {
        slot<throws_on_third_copy[]> s{res.get()};
        throws_on_third_copy::copies = 0;
        throws_on_third_copy::alive = 0;
        {
            std::vector<throws_on_third_copy> src(4);
            CHECK(throws_on_third_copy::alive == 4);

            auto b = allocate_in(s, 4);
            auto threw = false;
            try
            {
                b.copy_from(tn::span<throws_on_third_copy const>(src));
            }
            catch (int)
            {
                threw = true;
            }
            CHECK(threw);
            CHECK(!b.is_initialized());
            CHECK(throws_on_third_copy::alive == 4);
        }
        CHECK(throws_on_third_copy::alive == 0);
        CHECK(s.inserts == 0);
    }

    CHECK(res.is_balanced());
}

TEST("maybe_uninit_node - open-ended payloads")
{
    test::counting_resource res;
    slot<tn::dyn<tn::debug_printable>> s{res.get()};

    auto b = allocate_in(s, tn::widen<tn::debug_printable, double>());
    b.emplace_as<double>(2.5);
    CHECK(b.get().as<double>() == 2.5);

#if TN_ASSERT_ENABLED
    auto b2 = allocate_in(s, tn::widen<tn::debug_printable, int>());
    CHECK(test::fails_assertion([&] { b2.emplace_as<float>(1.0f); }));
    CHECK(!b2.is_initialized());
#endif

    tn::move(b).insert();
    CHECK(tn::to_debug_string(s.stored.get()) == std::to_string(2.5));
    s.release();
}

TEST("maybe_uninit_node - destroy_value keeps the node")
{
    test::counting_resource res;
    slot<tracked> s{res.get()};
    tracked::alive = 0;

    auto b = allocate_in(s, {});
    b.emplace(1);
    b.destroy_value();
    CHECK(tracked::alive == 0);
    CHECK(b.is_valid());
    CHECK(res.live_blocks() == 1);

    b.emplace(2);
    tn::move(b).insert();
    CHECK(s.stored.get().value == 2);
    s.release();
    CHECK(tracked::alive == 0);
    CHECK(res.is_balanced());
}

#if TN_ASSERT_ENABLED
TEST("maybe_uninit_node - inserting an uninitialized payload asserts")
{
    test::counting_resource res;
    slot<int> s{res.get()};
    {
        auto b = allocate_in(s, {});
        CHECK(test::fails_assertion([&] { (void)tn::move(b).insert(); }));
        CHECK(s.inserts == 0);
    }
    CHECK(res.is_balanced());
}
#endif
