#include <gtest/gtest.h>

#include "application/gadgets/price_model_gadget.hpp"
#include "test_helpers.hpp"

using libsnark::pb_variable;
using libsnark::pb_variable_array;
using libsnark::protoboard;

namespace {

const size_t DERIVED_BITS = 65;

struct price_model_fixture {
    protoboard<FieldT> pb;
    pb_variable<FieldT> count;
    pb_variable_array<FieldT> prices;
    pb_variable_array<FieldT> confidences;
    pb_variable_array<FieldT> slot_flags;
    pb_variable_array<FieldT> flags;
    PriceModelColumns<FieldT> model;
    std::shared_ptr<price_model_gadget<FieldT>> g;

    price_model_fixture(const std::vector<uint64_t> &price_values,
                        const std::vector<uint64_t> &conf_values,
                        size_t active_quotes,
                        size_t entries,
                        size_t active_entries)
    {
        count.allocate(pb, "count");
        pb.val(count) = FieldT(active_quotes);
        prices = allocate_values(pb, price_values, "prices");
        confidences = allocate_values(pb, conf_values, "confidences");
        slot_flags.allocate(pb, price_values.size(), "slot_flags");
        for (size_t i = 0; i < price_values.size(); ++i){
            pb.val(slot_flags[i]) = i < active_quotes ? FieldT::one() : FieldT::zero();
        }
        flags.allocate(pb, entries, "flags");
        for (size_t j = 0; j < entries; ++j){
            pb.val(flags[j]) = j < active_entries ? FieldT::one() : FieldT::zero();
        }
        model.allocate(pb, entries, "model");
        g.reset(new price_model_gadget<FieldT>(pb, DERIVED_BITS, slot_flags, flags, model, count, prices, confidences, "price_model"));
        g->generate_r1cs_constraints();
    }

    bool accepts(const std::vector<PriceModelVals<FieldT>> &entries)
    {
        model.assign(pb, entries);
        g->generate_r1cs_witness();
        return pb.is_satisfied();
    }

    FieldT derived(size_t j)
    {
        return pb.val(g->derived[j]);
    }
};

}

TEST(PriceModel, AppliesOperations)
{
    price_model_fixture f({100}, {5}, 1, 3, 3);
    ASSERT_TRUE(f.accepts({PriceModelVals<FieldT>(0, 0, SUBTRACT_CONF),
                           PriceModelVals<FieldT>(0, 0, PASSTHROUGH),
                           PriceModelVals<FieldT>(0, 0, ADD_CONF)}));
    EXPECT_EQ(f.derived(0), FieldT(95));
    EXPECT_EQ(f.derived(1), FieldT(100));
    EXPECT_EQ(f.derived(2), FieldT(105));
}

TEST(PriceModel, CoversEverySlot)
{
    price_model_fixture f({100, 200}, {5, 7}, 2, 6, 6);
    ASSERT_TRUE(f.accepts({PriceModelVals<FieldT>(0, 0, SUBTRACT_CONF),
                           PriceModelVals<FieldT>(0, 0, PASSTHROUGH),
                           PriceModelVals<FieldT>(0, 0, ADD_CONF),
                           PriceModelVals<FieldT>(1, 1, SUBTRACT_CONF),
                           PriceModelVals<FieldT>(1, 1, PASSTHROUGH),
                           PriceModelVals<FieldT>(1, 1, ADD_CONF)}));
    EXPECT_EQ(f.derived(2), FieldT(105));
    EXPECT_EQ(f.derived(3), FieldT(193));
}

TEST(PriceModel, RejectsConfidenceOfOtherSlot)
{
    // derived values 95, 100, 107, 193, 200, 207 are sorted
    price_model_fixture f({100, 200}, {5, 7}, 2, 6, 6);
    EXPECT_FALSE(f.accepts({PriceModelVals<FieldT>(0, 0, SUBTRACT_CONF),
                            PriceModelVals<FieldT>(0, 0, PASSTHROUGH),
                            PriceModelVals<FieldT>(0, 1, ADD_CONF),
                            PriceModelVals<FieldT>(1, 1, SUBTRACT_CONF),
                            PriceModelVals<FieldT>(1, 1, PASSTHROUGH),
                            PriceModelVals<FieldT>(1, 1, ADD_CONF)}));
}

TEST(PriceModel, RejectsModelRepeatingOneSlot)
{
    price_model_fixture f({100, 110, 500}, {1, 1, 1}, 3, 9, 9);
    EXPECT_FALSE(f.accepts(std::vector<PriceModelVals<FieldT>>(9, PriceModelVals<FieldT>(0, 0, PASSTHROUGH))));
}

TEST(PriceModel, RejectsRepeatedOperation)
{
    price_model_fixture f({100}, {5}, 1, 3, 3);
    EXPECT_FALSE(f.accepts({PriceModelVals<FieldT>(0, 0, SUBTRACT_CONF),
                            PriceModelVals<FieldT>(0, 0, PASSTHROUGH),
                            PriceModelVals<FieldT>(0, 0, PASSTHROUGH)}));
}

TEST(PriceModel, PaddingEntriesSortLast)
{
    price_model_fixture f({100, 0}, {5, 0}, 1, 6, 3);
    ASSERT_TRUE(f.accepts({PriceModelVals<FieldT>(0, 0, SUBTRACT_CONF),
                           PriceModelVals<FieldT>(0, 0, PASSTHROUGH),
                           PriceModelVals<FieldT>(0, 0, ADD_CONF),
                           PriceModelVals<FieldT>::padding(),
                           PriceModelVals<FieldT>::padding(),
                           PriceModelVals<FieldT>::padding()}));
    EXPECT_EQ(f.derived(3), max_value_of_bits<FieldT>(DERIVED_BITS));
}

TEST(PriceModel, RejectsUnsortedDerivedValues)
{
    // derived values 95, 100, 105, 94
    price_model_fixture f({100, 94}, {5, 0}, 2, 4, 4);
    EXPECT_FALSE(f.accepts({PriceModelVals<FieldT>(0, 0, SUBTRACT_CONF),
                            PriceModelVals<FieldT>(0, 0, PASSTHROUGH),
                            PriceModelVals<FieldT>(0, 0, ADD_CONF),
                            PriceModelVals<FieldT>(1, 1, PASSTHROUGH)}));
}

TEST(PriceModel, RejectsNegativeBid)
{
    price_model_fixture f({3}, {5}, 1, 3, 3);
    EXPECT_FALSE(f.accepts({PriceModelVals<FieldT>(0, 0, SUBTRACT_CONF),
                            PriceModelVals<FieldT>(0, 0, PASSTHROUGH),
                            PriceModelVals<FieldT>(0, 0, ADD_CONF)}));
}

TEST(PriceModel, RejectsLookupIntoPaddingSlot)
{
    price_model_fixture f({100, 0}, {5, 0}, 1, 1, 1);
    EXPECT_FALSE(f.accepts({PriceModelVals<FieldT>(1, 1, PASSTHROUGH)}));
}

TEST(PriceModel, RejectsIndexOutsideTable)
{
    price_model_fixture f({100}, {5}, 1, 1, 1);
    EXPECT_FALSE(f.accepts({PriceModelVals<FieldT>(3, 3, PASSTHROUGH)}));
}

TEST(PriceModel, RejectsUnknownOperation)
{
    price_model_fixture f({100}, {5}, 1, 1, 1);
    PriceModelVals<FieldT> entry(0, 0, PASSTHROUGH);
    entry.operation = FieldT(3);
    EXPECT_FALSE(f.accepts({entry}));
}

TEST(PriceModel, RejectsForgedDerivedValue)
{
    price_model_fixture f({100}, {5}, 1, 3, 3);
    ASSERT_TRUE(f.accepts({PriceModelVals<FieldT>(0, 0, SUBTRACT_CONF),
                           PriceModelVals<FieldT>(0, 0, PASSTHROUGH),
                           PriceModelVals<FieldT>(0, 0, ADD_CONF)}));

    f.pb.val(f.g->derived[2]) = FieldT(106);
    EXPECT_FALSE(f.pb.is_satisfied());
}
