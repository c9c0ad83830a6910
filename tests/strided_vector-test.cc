#include <smart-runtime/runtime_context.hh>
#include <smart-runtime/strided_vector.hh>
#include <smart-runtime/to_string.hh>

#include <nexus/test.hh>

#include <algorithm>
#include <cstddef>
#include <cstring>
#include <initializer_list>
#include <map>
#include <string>
#include <thread>
#include <vector>

#include "test-helpers.hh"

using sr::test::fails_with;

namespace
{
sr::strided_vector make_i64_vector(sr::vector_options options = {})
{
    options.stride = sizeof(sr::i64);
    return sr::strided_vector::create(options).value();
}

bool push(sr::strided_vector& vec, sr::i64 v)
{
    return vec.add_last(sr::as_bytes(v)).has_value();
}

sr::i64 at(sr::strided_vector const& vec, sr::isize i)
{
    return sr::from_bytes<sr::i64>(vec.borrow_at(i).value());
}

bool sequence_is(std::vector<sr::isize> const& values, std::initializer_list<sr::isize> expected)
{
    return std::equal(values.begin(), values.end(), expected.begin(), expected.end());
}

bool holds(sr::strided_vector const& vec, std::initializer_list<sr::i64> expected)
{
    auto const bytes = vec.data();
    if (bytes.size() != sr::isize(expected.size() * sizeof(sr::i64)))
        return false;

    auto offset = sr::isize(0);
    for (auto const v : expected)
    {
        if (sr::from_bytes<sr::i64>(bytes.subspan(offset, sizeof(sr::i64))) != v)
            return false;
        offset += sizeof(sr::i64);
    }
    return true;
}

// Managed values are i64 handles with external reference counts
struct ref_ledger
{
    std::map<sr::i64, int> refs;
    int materialize_calls = 0;
    int release_calls = 0;

    // a fresh reference, as handed to the container by an insert
    sr::i64 acquire(sr::i64 handle)
    {
        ++refs[handle];
        return handle;
    }

    bool all_released() const
    {
        return std::all_of(refs.begin(), refs.end(), [](auto const& kv) { return kv.second == 0; });
    }
};

sr::i64 read_handle(sr::byte const* slot)
{
    sr::i64 handle = 0;
    std::memcpy(&handle, slot, sizeof(handle));
    return handle;
}

sr::runtime_context make_counting_context(ref_ledger& ledger)
{
    return {
        .materialize =
            [](sr::byte* dst, sr::byte const* src, sr::isize stride, void* userdata)
        {
            auto& l = *static_cast<ref_ledger*>(userdata);
            ++l.materialize_calls;
            ++l.refs[read_handle(src)];
            std::memcpy(dst, src, stride);
        },
        .release =
            [](sr::byte* slot, sr::isize, void* userdata)
        {
            auto& l = *static_cast<ref_ledger*>(userdata);
            ++l.release_calls;
            --l.refs[read_handle(slot)];
        },
        .format = [](sr::byte const* slot, sr::isize, void*) { return "#" + std::to_string(read_handle(slot)); },
        .userdata = &ledger,
    };
}

// Memory resource that fails after a given number of allocations
struct failing_resource_state
{
    int allocations_left = 0;
};

sr::memory_resource make_failing_resource(failing_resource_state& state)
{
    return {
        .allocate_bytes = nullptr,
        .try_allocate_bytes =
            [](sr::byte** out_ptr, sr::isize bytes, sr::isize alignment, void* userdata) -> sr::isize
        {
            auto& s = *static_cast<failing_resource_state*>(userdata);
            *out_ptr = nullptr;
            if (bytes == 0)
                return 0;
            if (s.allocations_left == 0)
                return -1;
            --s.allocations_left;
            return sr::default_memory_resource->try_allocate_bytes(out_ptr, bytes, alignment, nullptr);
        },
        .deallocate_bytes = [](sr::byte* p, sr::isize bytes, sr::isize alignment, void*)
        { sr::default_memory_resource->deallocate_bytes(p, bytes, alignment, nullptr); },
        .userdata = &state,
    };
}
} // namespace

TEST("strided_vector - create")
{
    SECTION("zero stride is rejected")
    {
        CHECK(fails_with(sr::strided_vector::create({.stride = 0}), sr::vector_error::zero_stride));
        CHECK(fails_with(sr::strided_vector::create({.stride = -4}), sr::vector_error::zero_stride));
    }

    SECTION("negative initial capacity is rejected")
    {
        CHECK(fails_with(sr::strided_vector::create({.stride = 8, .initial_capacity = -1}), sr::vector_error::invalid_resize));
    }

    SECTION("empty container with initial capacity")
    {
        auto vec = make_i64_vector({.initial_capacity = 4});
        CHECK(vec.size() == 0);
        CHECK(vec.empty());
        CHECK(vec.capacity() == 4);
        CHECK(vec.capacity_bytes() == 32);
        CHECK(vec.stride() == 8);
        CHECK(!vec.is_thread_safe());
        CHECK(!vec.is_managed());
    }

    SECTION("options read-back resolves defaults")
    {
        auto vec = make_i64_vector({.initial_capacity = 3, .policy = sr::growth_policy::linear, .thread_safe = true});
        auto const& opts = vec.options();
        CHECK(opts.stride == 8);
        CHECK(opts.initial_capacity == 3);
        CHECK(sr::to_string(opts.policy) == "linear");
        CHECK(opts.thread_safe);
        CHECK(opts.context == sr::plain_value_context);
        CHECK(opts.resource == sr::default_memory_resource);
        CHECK(vec.is_thread_safe());
    }

    SECTION("allocation failure")
    {
        failing_resource_state state;
        auto const resource = make_failing_resource(state);
        CHECK(fails_with(sr::strided_vector::create({.stride = 8, .initial_capacity = 4, .resource = &resource}),
                         sr::vector_error::allocation_failure));

        // nothing to allocate, nothing to fail
        CHECK(sr::strided_vector::create({.stride = 8, .resource = &resource}).has_value());
    }
}

TEST("strided_vector - insertion order")
{
    auto vec = make_i64_vector();

    SECTION("add_last appends")
    {
        CHECK(push(vec, 1));
        CHECK(push(vec, 2));
        CHECK(push(vec, 3));
        CHECK(holds(vec, {1, 2, 3}));
    }

    SECTION("add_first prepends")
    {
        CHECK(vec.add_first(sr::as_bytes(sr::i64(1))).has_value());
        CHECK(vec.add_first(sr::as_bytes(sr::i64(2))).has_value());
        CHECK(vec.add_first(sr::as_bytes(sr::i64(3))).has_value());
        CHECK(holds(vec, {3, 2, 1}));
    }

    SECTION("add_at shifts later elements")
    {
        CHECK(push(vec, 1));
        CHECK(push(vec, 2));
        CHECK(push(vec, 3));

        CHECK(vec.add_at(1, sr::as_bytes(sr::i64(9))).has_value());
        CHECK(holds(vec, {1, 9, 2, 3}));

        // index == size appends
        CHECK(vec.add_at(4, sr::as_bytes(sr::i64(7))).has_value());
        CHECK(holds(vec, {1, 9, 2, 3, 7}));

        CHECK(vec.add_at(0, sr::as_bytes(sr::i64(0))).has_value());
        CHECK(holds(vec, {0, 1, 9, 2, 3, 7}));
    }

    SECTION("invalid positions leave the container unchanged")
    {
        CHECK(push(vec, 1));
        CHECK(fails_with(vec.add_at(2, sr::as_bytes(sr::i64(5))), sr::vector_error::invalid_index));
        CHECK(fails_with(vec.add_at(-1, sr::as_bytes(sr::i64(5))), sr::vector_error::invalid_index));
        CHECK(holds(vec, {1}));
    }

    SECTION("values of the wrong size assert")
    {
        if (!SR_ASSERT_ENABLED)
            return;

        CHECK(sr::test::asserts([&] { (void)vec.add_last(sr::as_bytes(sr::i32(1))); }));
        CHECK(vec.empty());
    }
}

TEST("strided_vector - inserting a value that lives inside the container")
{
    SECTION("with growth")
    {
        auto vec = make_i64_vector({.initial_capacity = 2});
        CHECK(push(vec, 10));
        CHECK(push(vec, 20));
        REQUIRE(vec.size() == vec.capacity());

        CHECK(vec.add_last(vec.borrow_first().value()).has_value());
        CHECK(holds(vec, {10, 20, 10}));
    }

    SECTION("from the shifted tail")
    {
        auto vec = make_i64_vector({.initial_capacity = 8});
        CHECK(push(vec, 10));
        CHECK(push(vec, 20));
        CHECK(push(vec, 30));

        CHECK(vec.add_first(vec.borrow_last().value()).has_value());
        CHECK(holds(vec, {30, 10, 20, 30}));

        CHECK(vec.add_at(2, vec.borrow_at(2).value()).has_value());
        CHECK(holds(vec, {30, 10, 20, 20, 30}));
    }
}

TEST("strided_vector - borrowing reads")
{
    auto vec = make_i64_vector();

    SECTION("empty container")
    {
        CHECK(fails_with(vec.borrow_first(), sr::vector_error::empty_container));
        CHECK(fails_with(vec.borrow_last(), sr::vector_error::empty_container));
        CHECK(fails_with(vec.borrow_at(0), sr::vector_error::empty_container));
    }

    SECTION("positions")
    {
        CHECK(push(vec, 4));
        CHECK(push(vec, 5));
        CHECK(push(vec, 6));

        CHECK(sr::from_bytes<sr::i64>(vec.borrow_first().value()) == 4);
        CHECK(sr::from_bytes<sr::i64>(vec.borrow_last().value()) == 6);
        CHECK(sr::from_bytes<sr::i64>(vec.borrow_at(1).value()) == 5);
        CHECK(vec.borrow_at(1).value().size() == 8);

        CHECK(fails_with(vec.borrow_at(3), sr::vector_error::invalid_index));
        CHECK(fails_with(vec.borrow_at(-1), sr::vector_error::invalid_index));
    }

    SECTION("first and last on a thread-safe container")
    {
        auto safe = make_i64_vector({.thread_safe = true});
        CHECK(push(safe, 1));
        CHECK(push(safe, 2));

        auto const same_slots = safe.locked(
            [&]
            {
                return safe.borrow_first().value().data() == safe.borrow_at(0).value().data()
                    && safe.borrow_last().value().data() == safe.borrow_at(1).value().data();
            });
        CHECK(same_slots);

        auto const& csafe = safe;
        CHECK(sr::from_bytes<sr::i64>(csafe.borrow_first().value()) == 1);
        CHECK(sr::from_bytes<sr::i64>(csafe.borrow_last().value()) == 2);
    }

    SECTION("borrowed slots alias the storage")
    {
        CHECK(push(vec, 1));
        auto const slot = vec.borrow_at(0).value();
        auto const v = sr::i64(42);
        std::memcpy(slot.data(), &v, sizeof(v));
        CHECK(at(vec, 0) == 42);
    }

    SECTION("const access")
    {
        CHECK(push(vec, 8));
        auto const& cvec = vec;
        auto const slot = cvec.borrow_last().value();
        CHECK(sr::from_bytes<sr::i64>(slot) == 8);
        CHECK(slot.data() == vec.data().data());
    }
}

TEST("strided_vector - materializing reads")
{
    auto vec = make_i64_vector();

    CHECK(fails_with(vec.materialize_first(), sr::vector_error::empty_container));
    CHECK(fails_with(vec.materialize_last(), sr::vector_error::empty_container));

    CHECK(push(vec, 1));
    CHECK(push(vec, 2));
    CHECK(push(vec, 3));

    auto first = vec.materialize_first().value();
    auto middle = vec.materialize_at(1).value();
    auto last = vec.materialize_last().value();

    CHECK(first.as<sr::i64>() == 1);
    CHECK(middle.as<sr::i64>() == 2);
    CHECK(last.as<sr::i64>() == 3);

    // copies are independent of later mutations
    CHECK(vec.set_at(1, sr::as_bytes(sr::i64(99))).has_value());
    vec.reverse();
    CHECK(vec.remove_first().has_value());
    CHECK(middle.as<sr::i64>() == 2);
    CHECK(first.as<sr::i64>() == 1);

    CHECK(fails_with(vec.materialize_at(5), sr::vector_error::invalid_index));
}

TEST("strided_vector - pop")
{
    auto vec = make_i64_vector();
    for (auto i = 1; i <= 5; ++i)
        CHECK(push(vec, i * 10));
    auto const capacity = vec.capacity();

    SECTION("pop_at equals the value materialized right before")
    {
        auto const expected = vec.materialize_at(2).value().as<sr::i64>();
        auto const popped = vec.pop_at(2).value();
        CHECK(popped.as<sr::i64>() == expected);
        CHECK(vec.size() == 4);
        CHECK(holds(vec, {10, 20, 40, 50}));
    }

    SECTION("pop_first and pop_last")
    {
        CHECK(vec.pop_first().value().as<sr::i64>() == 10);
        CHECK(vec.pop_last().value().as<sr::i64>() == 50);
        CHECK(holds(vec, {20, 30, 40}));
    }

    SECTION("capacity never shrinks")
    {
        while (!vec.empty())
            CHECK(vec.pop_last().has_value());
        CHECK(vec.capacity() == capacity);
    }

    SECTION("errors")
    {
        CHECK(fails_with(vec.pop_at(5), sr::vector_error::invalid_index));
        CHECK(fails_with(vec.pop_at(-1), sr::vector_error::invalid_index));
        CHECK(vec.size() == 5);

        vec.clear();
        CHECK(fails_with(vec.pop_first(), sr::vector_error::empty_container));
        CHECK(fails_with(vec.pop_last(), sr::vector_error::empty_container));
        CHECK(fails_with(vec.pop_at(0), sr::vector_error::empty_container));
    }
}

TEST("strided_vector - remove")
{
    auto vec = make_i64_vector();
    for (auto i = 1; i <= 4; ++i)
        CHECK(push(vec, i));

    CHECK(vec.remove_at(1).has_value());
    CHECK(holds(vec, {1, 3, 4}));

    CHECK(vec.remove_first().has_value());
    CHECK(holds(vec, {3, 4}));

    CHECK(vec.remove_last().has_value());
    CHECK(holds(vec, {3}));

    CHECK(fails_with(vec.remove_at(1), sr::vector_error::invalid_index));
    CHECK(vec.remove_last().has_value());

    CHECK(fails_with(vec.remove_first(), sr::vector_error::empty_container));
    CHECK(fails_with(vec.remove_last(), sr::vector_error::empty_container));
    CHECK(fails_with(vec.remove_at(0), sr::vector_error::empty_container));
}

TEST("strided_vector - set")
{
    auto vec = make_i64_vector();

    CHECK(fails_with(vec.set_first(sr::as_bytes(sr::i64(1))), sr::vector_error::empty_container));
    CHECK(fails_with(vec.set_last(sr::as_bytes(sr::i64(1))), sr::vector_error::empty_container));

    CHECK(push(vec, 1));
    CHECK(push(vec, 2));
    CHECK(push(vec, 3));

    CHECK(vec.set_first(sr::as_bytes(sr::i64(10))).has_value());
    CHECK(vec.set_last(sr::as_bytes(sr::i64(30))).has_value());
    CHECK(vec.set_at(1, sr::as_bytes(sr::i64(20))).has_value());
    CHECK(holds(vec, {10, 20, 30}));

    CHECK(fails_with(vec.set_at(3, sr::as_bytes(sr::i64(0))), sr::vector_error::invalid_index));
    CHECK(holds(vec, {10, 20, 30}));

    // copying one slot onto another
    CHECK(vec.set_at(0, vec.borrow_at(2).value()).has_value());
    CHECK(holds(vec, {30, 20, 30}));
}

TEST("strided_vector - set_data")
{
    auto vec = make_i64_vector({.initial_capacity = 2, .policy = sr::growth_policy::double_size});
    CHECK(push(vec, 1));

    SECTION("within capacity")
    {
        sr::i64 const data[] = {7, 8};
        CHECK(vec.set_data(sr::span<sr::byte const>(reinterpret_cast<sr::byte const*>(data), sizeof(data))).has_value());
        CHECK(holds(vec, {7, 8}));
        CHECK(vec.capacity() == 2);
    }

    SECTION("beyond capacity grows exactly")
    {
        sr::i64 const data[] = {1, 2, 3, 4, 5};
        CHECK(vec.set_data(sr::span<sr::byte const>(reinterpret_cast<sr::byte const*>(data), sizeof(data))).has_value());
        CHECK(holds(vec, {1, 2, 3, 4, 5}));
        CHECK(vec.capacity() == 5);
    }

    SECTION("empty data")
    {
        CHECK(vec.set_data(sr::span<sr::byte const>()).has_value());
        CHECK(vec.empty());
        CHECK(vec.capacity() == 2);
    }

    SECTION("partial elements assert in every build")
    {
        sr::byte const data[12] = {};
        CHECK(sr::test::asserts([&] { (void)vec.set_data(sr::span<sr::byte const>(data, 12)); }));
        CHECK(holds(vec, {1}));

        // a trailing partial element at full capacity must not reach the storage either
        sr::byte const full[20] = {};
        CHECK(sr::test::asserts([&] { (void)vec.set_data(sr::span<sr::byte const>(full, 20)); }));
        CHECK(holds(vec, {1}));
        CHECK(vec.capacity() == 2);
    }
}

TEST("strided_vector - growth policies")
{
    // capacity after each of n single inserts
    auto capacities = [](sr::vector_options options, int n)
    {
        auto vec = make_i64_vector(options);
        std::vector<sr::isize> caps;
        for (auto i = 0; i < n; ++i)
        {
            (void)push(vec, i);
            caps.push_back(vec.capacity());
        }
        return caps;
    };

    SECTION("double_size")
    {
        auto const caps = capacities({.initial_capacity = 0, .policy = sr::growth_policy::double_size}, 5);
        CHECK(sequence_is(caps, {1, 2, 4, 4, 8}));
    }

    SECTION("linear")
    {
        auto const caps = capacities({.initial_capacity = 3, .policy = sr::growth_policy::linear}, 7);
        CHECK(sequence_is(caps, {3, 3, 3, 6, 6, 6, 9}));
    }

    SECTION("linear with zero increment")
    {
        auto const caps = capacities({.initial_capacity = 0, .policy = sr::growth_policy::linear}, 3);
        CHECK(sequence_is(caps, {1, 2, 3}));
    }

    SECTION("exact")
    {
        auto const caps = capacities({.initial_capacity = 2, .policy = sr::growth_policy::exact}, 5);
        CHECK(sequence_is(caps, {2, 2, 3, 4, 5}));
    }

    SECTION("filling up to capacity does not reallocate")
    {
        auto vec = make_i64_vector({.initial_capacity = 4});
        CHECK(push(vec, 0));
        auto const storage = vec.data().data();
        CHECK(push(vec, 1));
        CHECK(push(vec, 2));
        CHECK(push(vec, 3));
        CHECK(vec.data().data() == storage);
        CHECK(vec.capacity() == 4);
    }

    SECTION("failed growth leaves the container unchanged")
    {
        failing_resource_state state;
        state.allocations_left = 1;
        auto const resource = make_failing_resource(state);

        auto vec = make_i64_vector({.initial_capacity = 2, .resource = &resource});
        CHECK(push(vec, 1));
        CHECK(push(vec, 2));

        CHECK(fails_with(vec.add_last(sr::as_bytes(sr::i64(3))), sr::vector_error::allocation_failure));
        CHECK(fails_with(vec.add_first(sr::as_bytes(sr::i64(0))), sr::vector_error::allocation_failure));
        CHECK(holds(vec, {1, 2}));
        CHECK(vec.capacity() == 2);

        // reads that need a copy fail the same way
        CHECK(fails_with(vec.materialize_first(), sr::vector_error::allocation_failure));
        CHECK(fails_with(vec.pop_first(), sr::vector_error::allocation_failure));
        CHECK(vec.size() == 2);
    }
}

TEST("strided_vector - resize")
{
    auto vec = make_i64_vector({.initial_capacity = 2});
    CHECK(push(vec, 1));
    CHECK(push(vec, 2));

    CHECK(vec.resize(10).has_value());
    CHECK(vec.capacity() == 10);
    CHECK(holds(vec, {1, 2}));

    CHECK(fails_with(vec.resize(1), sr::vector_error::invalid_resize));
    CHECK(vec.capacity() == 10);
    CHECK(holds(vec, {1, 2}));

    CHECK(vec.resize(2).has_value());
    CHECK(vec.capacity() == 2);
    CHECK(holds(vec, {1, 2}));

    vec.clear();
    CHECK(vec.resize(0).has_value());
    CHECK(vec.capacity() == 0);
    CHECK(push(vec, 3));
    CHECK(holds(vec, {3}));
}

TEST("strided_vector - reverse")
{
    auto vec = make_i64_vector();

    SECTION("empty and single element")
    {
        vec.reverse();
        CHECK(vec.empty());

        CHECK(push(vec, 1));
        vec.reverse();
        CHECK(holds(vec, {1}));
    }

    SECTION("even and odd counts")
    {
        for (auto i = 1; i <= 4; ++i)
            CHECK(push(vec, i));
        vec.reverse();
        CHECK(holds(vec, {4, 3, 2, 1}));

        CHECK(push(vec, 0));
        vec.reverse();
        CHECK(holds(vec, {0, 1, 2, 3, 4}));
    }

    SECTION("reversing twice is the identity")
    {
        for (auto i = 0; i < 7; ++i)
            CHECK(push(vec, i * i));
        auto const capacity = vec.capacity();

        vec.reverse();
        vec.reverse();
        CHECK(holds(vec, {0, 1, 4, 9, 16, 25, 36}));
        CHECK(vec.capacity() == capacity);
    }

    SECTION("odd stride")
    {
        auto bytes3 = sr::strided_vector::create({.stride = 3}).value();
        for (auto i = 0; i < 3; ++i)
        {
            sr::byte const v[3] = {sr::byte(i), sr::byte(i + 10), sr::byte(i + 20)};
            CHECK(bytes3.add_last(sr::span<sr::byte const>(v, 3)).has_value());
        }
        bytes3.reverse();

        auto const first = bytes3.borrow_first().value();
        CHECK(std::to_integer<int>(first[0]) == 2);
        CHECK(std::to_integer<int>(first[1]) == 12);
        CHECK(std::to_integer<int>(first[2]) == 22);

        auto const last = bytes3.borrow_last().value();
        CHECK(std::to_integer<int>(last[0]) == 0);
        CHECK(std::to_integer<int>(last[2]) == 20);
    }
}

TEST("strided_vector - clear keeps capacity")
{
    auto vec = make_i64_vector();
    for (auto i = 0; i < 5; ++i)
        CHECK(push(vec, i));
    auto const capacity = vec.capacity();

    vec.clear();
    CHECK(vec.empty());
    CHECK(vec.capacity() == capacity);
    CHECK(vec.data().empty());

    CHECK(push(vec, 9));
    CHECK(holds(vec, {9}));
}

TEST("strided_vector - stride 8, capacity 2, doubling")
{
    auto vec = make_i64_vector({.initial_capacity = 2, .policy = sr::growth_policy::double_size});

    CHECK(push(vec, 1));
    CHECK(push(vec, 2));
    CHECK(vec.capacity() == 2);

    CHECK(push(vec, 3));
    CHECK(vec.capacity() == 4);

    CHECK(push(vec, 4));
    CHECK(vec.capacity() == 4);

    CHECK(vec.pop_first().value().as<sr::i64>() == 1);
    CHECK(holds(vec, {2, 3, 4}));
    CHECK(at(vec, 1) == 3);
}

TEST("strided_vector - move semantics")
{
    auto a = make_i64_vector();
    CHECK(push(a, 1));
    CHECK(push(a, 2));

    auto b = sr::move(a);
    CHECK(holds(b, {1, 2}));
    CHECK(a.size() == 0); // NOLINT(bugprone-use-after-move)
    CHECK(a.capacity() == 0);

    auto c = make_i64_vector({.thread_safe = true});
    CHECK(push(c, 5));
    c = sr::move(b);
    CHECK(holds(c, {1, 2}));
    CHECK(!c.is_thread_safe());
}

TEST("strided_vector - managed values")
{
    ref_ledger ledger;
    auto const ctx = make_counting_context(ledger);

    SECTION("inserts take ownership, destruction releases")
    {
        {
            auto vec = make_i64_vector({.context = &ctx});
            CHECK(vec.is_managed());
            CHECK(push(vec, ledger.acquire(1)));
            CHECK(push(vec, ledger.acquire(2)));
            CHECK(ledger.materialize_calls == 0);
            CHECK(ledger.refs[1] == 1);
        }
        CHECK(ledger.release_calls == 2);
        CHECK(ledger.all_released());
    }

    SECTION("materialize adds an independent reference")
    {
        auto vec = make_i64_vector({.context = &ctx});
        CHECK(push(vec, ledger.acquire(7)));

        {
            auto const copy = vec.materialize_first().value();
            CHECK(ledger.materialize_calls == 1);
            CHECK(ledger.refs[7] == 2);
            CHECK(copy.context() == &ctx);
        }
        CHECK(ledger.refs[7] == 1);

        // borrowing does not touch the count
        CHECK(sr::from_bytes<sr::i64>(vec.borrow_first().value()) == 7);
        CHECK(ledger.refs[7] == 1);
    }

    SECTION("set and remove release the dropped value")
    {
        auto vec = make_i64_vector({.context = &ctx});
        CHECK(push(vec, ledger.acquire(1)));
        CHECK(push(vec, ledger.acquire(2)));

        CHECK(vec.set_first(sr::as_bytes(ledger.acquire(3))).has_value());
        CHECK(ledger.refs[1] == 0);
        CHECK(ledger.refs[3] == 1);

        CHECK(vec.remove_last().has_value());
        CHECK(ledger.refs[2] == 0);

        // storing a slot's own value again keeps its reference
        CHECK(vec.set_first(vec.borrow_first().value()).has_value());
        CHECK(ledger.refs[3] == 1);

        vec.clear();
        CHECK(ledger.all_released());
        CHECK(vec.capacity() > 0);
    }

    SECTION("pop transfers the stored reference")
    {
        auto vec = make_i64_vector({.context = &ctx});
        CHECK(push(vec, ledger.acquire(4)));
        CHECK(push(vec, ledger.acquire(5)));

        {
            auto popped = vec.pop_first().value();
            CHECK(popped.as<sr::i64>() == 4);
            CHECK(ledger.materialize_calls == 0);
            CHECK(ledger.release_calls == 0);
            CHECK(ledger.refs[4] == 1);
        }
        CHECK(ledger.refs[4] == 0);
        CHECK(ledger.refs[5] == 1);
    }

    SECTION("set_data on managed values asserts")
    {
        if (!SR_ASSERT_ENABLED)
            return;

        auto vec = make_i64_vector({.context = &ctx});
        auto const v = sr::i64(1);
        CHECK(sr::test::asserts([&] { (void)vec.set_data(sr::as_bytes(v)); }));
        CHECK(vec.empty());
    }
}

TEST("strided_vector - two threads appending concurrently")
{
    auto vec = make_i64_vector({.thread_safe = true});

    auto append = [&](sr::i64 base)
    {
        for (auto i = 0; i < 1000; ++i)
            if (!push(vec, base + i))
                return;
    };

    auto a = std::thread(append, 0);
    auto b = std::thread(append, 1000);
    a.join();
    b.join();

    REQUIRE(vec.size() == 2000);

    std::vector<sr::i64> values;
    for (auto i = 0; i < 2000; ++i)
        values.push_back(at(vec, i));
    std::sort(values.begin(), values.end());

    auto all_present = true;
    for (auto i = 0; i < 2000; ++i)
        all_present = all_present && values[i] == i;
    CHECK(all_present);
}

TEST("strided_vector - explicit critical sections")
{
    auto vec = make_i64_vector({.thread_safe = true});

    SECTION("lock and unlock are re-entrant with implicit locking")
    {
        vec.lock();
        CHECK(push(vec, 1));
        CHECK(push(vec, 2));
        CHECK(vec.size() == 2);
        vec.unlock();
        CHECK(holds(vec, {1, 2}));
    }

    SECTION("check-then-act stays atomic")
    {
        auto fill = [&]
        {
            for (auto i = 0; i < 500; ++i)
                vec.locked(
                    [&]
                    {
                        if (vec.size() < 600)
                            (void)push(vec, vec.size());
                    });
        };

        auto a = std::thread(fill);
        auto b = std::thread(fill);
        a.join();
        b.join();

        REQUIRE(vec.size() == 600);

        // each value equals its index since size was read and appended atomically
        auto in_order = true;
        for (auto i = 0; i < 600; ++i)
            in_order = in_order && at(vec, i) == i;
        CHECK(in_order);
    }

    SECTION("unlock without lock asserts")
    {
        CHECK(sr::test::asserts([&] { vec.unlock(); }));
    }
}
