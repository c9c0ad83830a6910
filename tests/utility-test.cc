#include <smart-runtime/span.hh>
#include <smart-runtime/utility.hh>

#include <nexus/test.hh>

#include <limits>

#include "test-helpers.hh"


TEST("utility - checked_mul")
{
    sr::isize out = -1;

    CHECK(sr::checked_mul(6, 7, out));
    CHECK(out == 42);

    CHECK(sr::checked_mul(0, std::numeric_limits<sr::isize>::max(), out));
    CHECK(out == 0);

    out = -1;
    CHECK(!sr::checked_mul(std::numeric_limits<sr::isize>::max() / 2 + 1, 2, out));
    CHECK(out == -1); // untouched on overflow

    CHECK(sr::checked_mul(std::numeric_limits<sr::isize>::max(), 1, out));
    CHECK(out == std::numeric_limits<sr::isize>::max());
}

TEST("utility - is_power_of_two")
{
    CHECK(sr::is_power_of_two(1));
    CHECK(sr::is_power_of_two(16));
    CHECK(!sr::is_power_of_two(0));
    CHECK(!sr::is_power_of_two(-4));
    CHECK(!sr::is_power_of_two(12));
}

TEST("span - byte views of values")
{
    auto const value = sr::i32(0x01020304);
    auto const bytes = sr::as_bytes(value);
    CHECK(bytes.size() == 4);
    CHECK(sr::from_bytes<sr::i32>(bytes) == 0x01020304);

    SECTION("subspan")
    {
        auto const tail = bytes.subspan(1, 3);
        CHECK(tail.size() == 3);
        CHECK(tail.data() == bytes.data() + 1);
    }

    SECTION("size mismatch asserts")
    {
        if (!SR_ASSERT_ENABLED)
            return;

        CHECK(sr::test::asserts([&] { (void)sr::from_bytes<sr::i64>(bytes); }));
        CHECK(sr::test::asserts([&] { (void)bytes.subspan(2, 3); }));
    }
}
