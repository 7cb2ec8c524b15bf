#include <gtest/gtest.h>

#include "application/gadgets/well_formedness_gadget.hpp"
#include "test_helpers.hpp"

using libsnark::pb_variable;
using libsnark::pb_variable_array;
using libsnark::protoboard;

namespace {

const size_t CAPACITY = 4;

struct padded_array_fixture {
    protoboard<FieldT> pb;
    pb_variable<FieldT> count;
    pb_variable_array<FieldT> values;
    std::shared_ptr<active_count_gadget<FieldT>> active;
    std::shared_ptr<well_formedness_gadget<FieldT>> well_formed;

    padded_array_fixture()
    {
        count.allocate(pb, "count");
        values.allocate(pb, CAPACITY, "values");
        active.reset(new active_count_gadget<FieldT>(pb, CAPACITY, count, "active"));
        well_formed.reset(new well_formedness_gadget<FieldT>(pb, active->flags, values, "well_formed"));
        active->generate_r1cs_constraints();
        well_formed->generate_r1cs_constraints();
    }

    // first `filled` slots hold data, the rest the sentinel
    bool accepts(size_t n, size_t filled)
    {
        pb.val(count) = FieldT(n);
        for (size_t i = 0; i < CAPACITY; ++i){
            pb.val(values[i]) = i < filled ? FieldT(100 + i) : sentinel_value<FieldT>();
        }
        active->generate_r1cs_witness();
        well_formed->generate_r1cs_witness();
        return pb.is_satisfied();
    }
};

}

TEST(ActiveCount, FlagsPrefixOfSlots)
{
    padded_array_fixture f;
    ASSERT_TRUE(f.accepts(2, 2));
    EXPECT_EQ(f.pb.val(f.active->flags[0]), FieldT::one());
    EXPECT_EQ(f.pb.val(f.active->flags[1]), FieldT::one());
    EXPECT_EQ(f.pb.val(f.active->flags[2]), FieldT::zero());
    EXPECT_EQ(f.pb.val(f.active->flags[3]), FieldT::zero());
}

TEST(ActiveCount, RejectsCountAboveCapacity)
{
    padded_array_fixture f;
    EXPECT_FALSE(f.accepts(CAPACITY + 1, CAPACITY));
}

TEST(ActiveCount, RejectsGapInFlags)
{
    padded_array_fixture f;
    ASSERT_TRUE(f.accepts(2, 2));

    // same sum, but slot 1 inactive while slot 2 is active
    f.pb.val(f.active->flags[1]) = FieldT::zero();
    f.pb.val(f.active->flags[2]) = FieldT::one();
    EXPECT_FALSE(f.pb.is_satisfied());
}

TEST(ActiveCount, ExpandedFlagsRepeatPerSlot)
{
    padded_array_fixture f;
    const pb_variable_array<FieldT> expanded = f.active->expanded_flags(3);
    ASSERT_EQ(expanded.size(), 3 * CAPACITY);
    for (size_t j = 0; j < expanded.size(); ++j){
        EXPECT_EQ(expanded[j].index, f.active->flags[j / 3].index);
    }
}

TEST(WellFormedness, AcceptsEveryExactPadding)
{
    for (size_t n = 0; n <= CAPACITY; ++n){
        padded_array_fixture f;
        EXPECT_TRUE(f.accepts(n, n)) << "N=" << n;
    }
}

TEST(WellFormedness, RejectsMisplacedPadding)
{
    for (size_t n = 0; n <= CAPACITY; ++n){
        if (n > 0){
            padded_array_fixture f;
            EXPECT_FALSE(f.accepts(n, n - 1)) << "sentinel inside active prefix, N=" << n;
        }
        if (n < CAPACITY){
            padded_array_fixture f;
            EXPECT_FALSE(f.accepts(n, n + 1)) << "data after active prefix, N=" << n;
        }
    }
}

TEST(SentinelCheck, RejectsForgedInverse)
{
    protoboard<FieldT> pb;
    pb_variable<FieldT> flag, value;
    flag.allocate(pb, "flag");
    value.allocate(pb, "value");
    sentinel_check_gadget<FieldT> check(pb, flag, value, "check");
    check.generate_r1cs_constraints();

    pb.val(flag) = FieldT::one();
    pb.val(value) = FieldT(42);
    check.generate_r1cs_witness();
    ASSERT_TRUE(pb.is_satisfied());

    pb.val(value) = sentinel_value<FieldT>();
    EXPECT_FALSE(pb.is_satisfied());
}
