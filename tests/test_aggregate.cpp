#include <sstream>
#include <stdexcept>

#include <gtest/gtest.h>

#include "application/oracle/price_feed.h"
#include "pricesnark/pricesnark.hpp"
#include "test_helpers.hpp"

namespace {

const uint64_t THRESHOLD = 60;

aggregate_input<FieldT> observed_round(size_t max_quotes, size_t publishers, uint16_t round, long stale_publisher)
{
    std::vector<signed_quote<FieldT>> quotes;
    for (size_t i = 0; i < publishers; ++i){
        const observation o = observe_market(i, round, (long) i == stale_publisher, THRESHOLD);
        quotes.push_back(sign_quote(test_key(i), make_quote<FieldT>(o.price, o.confidence, o.timestamp, o.observed_online)));
    }
    return make_aggregate_input(max_quotes, quotes, FieldT::zero(), padding_key());
}

aggregate_outputs<FieldT> prove_outputs(aggregate_relation<FieldT> &relation, const aggregate_input<FieldT> &input)
{
    relation.generate_r1cs_witness(input);
    relation.assert_satisfied();
    return relation.outputs();
}

}

TEST(Aggregate, SinglePublisher)
{
    aggregate_relation<FieldT> relation(circuit_params(1, THRESHOLD));
    const aggregate_input<FieldT> input = make_test_input(1, {{100, 5, 1000}});

    // derived: 95 100 105, ranks 1, 2, 3
    const aggregate_outputs<FieldT> outputs = prove_outputs(relation, input);
    EXPECT_EQ(outputs.p25, FieldT(95));
    EXPECT_EQ(outputs.p50, FieldT(100));
    EXPECT_EQ(outputs.p75, FieldT(105));
    EXPECT_EQ(outputs.confidence, FieldT(5));
}

TEST(Aggregate, ReportsModelRepeatingOneSlot)
{
    aggregate_relation<FieldT> relation(circuit_params(3, THRESHOLD));
    const std::vector<PriceModelVals<FieldT>> model(9, PriceModelVals<FieldT>(0, 0, PASSTHROUGH));
    const aggregate_input<FieldT> input = make_aggregate_input(3, sign_quotes({{100, 5, 1000}, {110, 2, 1000}, {500, 10, 1000}}),
                                                               model, FieldT::zero(), padding_key());

    relation.generate_r1cs_witness(input);
    const std::vector<unsatisfied_constraint> failures = relation.unsatisfied_constraints();
    EXPECT_TRUE(has_failure_in(failures, "price_model_coverage", 0));
    EXPECT_TRUE(has_failure_in(failures, "price_model_coverage", 1));
    EXPECT_TRUE(has_failure_in(failures, "price_model_coverage", 2));
    for (size_t i = 0; i < failures.size(); ++i){
        EXPECT_EQ(failures[i].group, "price_model_coverage");
    }
}

TEST(Aggregate, ObservedRoundsAreProvable)
{
    aggregate_relation<FieldT> relation(circuit_params(4, THRESHOLD));
    for (size_t publishers = 1; publishers <= 4; ++publishers){
        for (uint16_t round = 0; round < 3; ++round){
            const aggregate_input<FieldT> input = observed_round(4, publishers, round, -1);
            relation.generate_r1cs_witness(input);
            EXPECT_NO_THROW(relation.assert_satisfied()) << publishers << " publishers, round " << round;
            EXPECT_TRUE(relation.outputs() == compute_aggregate_outputs(input));
        }
    }
}

TEST(Aggregate, ObservedRoundReportsStalePublisher)
{
    aggregate_relation<FieldT> relation(circuit_params(4, THRESHOLD));
    relation.generate_r1cs_witness(observed_round(4, 3, 1, 2));

    const std::vector<unsatisfied_constraint> failures = relation.unsatisfied_constraints();
    EXPECT_TRUE(has_failure_in(failures, "staleness", 2));
    for (size_t i = 0; i < failures.size(); ++i){
        EXPECT_EQ(failures[i].group, "staleness");
    }
}

TEST(Aggregate, ThreePublishersDefaultModel)
{
    aggregate_relation<FieldT> relation(circuit_params(4, THRESHOLD));
    const aggregate_input<FieldT> input = make_test_input(4, {{100, 5, 1000}, {110, 2, 1000}, {120, 10, 998}}, 7);

    const aggregate_outputs<FieldT> outputs = prove_outputs(relation, input);

    // derived: 95 100 105 108 110 110 112 120 130, ranks 3, 5, 7
    EXPECT_EQ(outputs.p25, FieldT(105));
    EXPECT_EQ(outputs.p50, FieldT(110));
    EXPECT_EQ(outputs.p75, FieldT(112));
    EXPECT_EQ(outputs.confidence, FieldT(5));
    EXPECT_EQ(outputs.fee, FieldT(7));
    EXPECT_TRUE(outputs == compute_aggregate_outputs(input));
}

TEST(Aggregate, FullCapacity)
{
    aggregate_relation<FieldT> relation(circuit_params(2, THRESHOLD));
    const aggregate_input<FieldT> input = make_test_input(2, {{200, 10, 50}, {100, 1, 50}});

    const aggregate_outputs<FieldT> outputs = prove_outputs(relation, input);
    EXPECT_TRUE(outputs == compute_aggregate_outputs(input));
    // derived: 99 100 101 190 200 210, ranks 2, 3, 5
    EXPECT_EQ(outputs.p25, FieldT(100));
    EXPECT_EQ(outputs.p50, FieldT(101));
    EXPECT_EQ(outputs.p75, FieldT(200));
    EXPECT_EQ(outputs.confidence, FieldT(99));
}

TEST(Aggregate, NoQuotesGivesZeroAggregate)
{
    aggregate_relation<FieldT> relation(circuit_params(2, THRESHOLD));
    const aggregate_input<FieldT> input = make_test_input(2, {}, 3);

    const aggregate_outputs<FieldT> outputs = prove_outputs(relation, input);
    EXPECT_EQ(outputs.p25, FieldT::zero());
    EXPECT_EQ(outputs.p50, FieldT::zero());
    EXPECT_EQ(outputs.p75, FieldT::zero());
    EXPECT_EQ(outputs.confidence, FieldT::zero());
    EXPECT_EQ(outputs.fee, FieldT(3));
}

TEST(Aggregate, ReportsForgedSignature)
{
    aggregate_relation<FieldT> relation(circuit_params(3, THRESHOLD));
    aggregate_input<FieldT> input = make_test_input(3, {{100, 5, 1000}, {110, 2, 1000}, {120, 10, 1000}});
    // signature of a different price
    input.signatures[1] = sign_message(test_key(1), quote_message(make_quote<FieldT>(111, 2, 1000, 1000)));

    relation.generate_r1cs_witness(input);
    const std::vector<unsatisfied_constraint> failures = relation.unsatisfied_constraints();
    ASSERT_FALSE(failures.empty());
    EXPECT_TRUE(has_failure_in(failures, "signature", 1));
    EXPECT_FALSE(has_failure_in(failures, "signature", 0));
    EXPECT_FALSE(has_failure_in(failures, "signature", 2));

    try {
        relation.assert_satisfied();
        FAIL() << "forged signature accepted";
    } catch (const unsatisfied_circuit_error &e) {
        EXPECT_EQ(e.group, "signature");
        EXPECT_EQ(e.index, 1);
    }
}

TEST(Aggregate, ReportsStaleQuote)
{
    aggregate_relation<FieldT> relation(circuit_params(4, THRESHOLD));
    const aggregate_input<FieldT> input = make_test_input(4, {{100, 5, 1000}, {110, 2, 1000}, {120, 10, 1000}, {105, 1, 500}});

    relation.generate_r1cs_witness(input);
    const std::vector<unsatisfied_constraint> failures = relation.unsatisfied_constraints();
    EXPECT_TRUE(has_failure_in(failures, "staleness", 3));
    for (size_t i = 0; i < failures.size(); ++i){
        EXPECT_EQ(failures[i].group, "staleness");
    }
}

TEST(Aggregate, ReportsOversizedActiveCount)
{
    aggregate_relation<FieldT> relation(circuit_params(2, THRESHOLD));
    aggregate_input<FieldT> input = make_test_input(2, {{100, 5, 1000}, {110, 2, 1000}});
    input.active_count = FieldT(3);

    relation.generate_r1cs_witness(input);
    EXPECT_TRUE(has_failure_in(relation.unsatisfied_constraints(), "active_count", constraint_scope::NO_INDEX));
    EXPECT_THROW(relation.assert_satisfied(), unsatisfied_circuit_error);
}

TEST(Aggregate, ReportsDataInPaddingSlot)
{
    aggregate_relation<FieldT> relation(circuit_params(3, THRESHOLD));
    aggregate_input<FieldT> input = make_test_input(3, {{100, 5, 1000}});
    input.quotes[2].price = FieldT(100);

    relation.generate_r1cs_witness(input);
    EXPECT_TRUE(has_failure_in(relation.unsatisfied_constraints(), "well_formedness.prices", 2));
}

TEST(Aggregate, ReportsUnsortedPriceModel)
{
    aggregate_relation<FieldT> relation(circuit_params(1, THRESHOLD));
    const std::vector<PriceModelVals<FieldT>> model = {PriceModelVals<FieldT>(0, 0, ADD_CONF),
                                                       PriceModelVals<FieldT>(0, 0, PASSTHROUGH),
                                                       PriceModelVals<FieldT>(0, 0, SUBTRACT_CONF)};
    const aggregate_input<FieldT> input = make_aggregate_input(1, sign_quotes({{100, 5, 1000}}), model, FieldT::zero(), padding_key());

    relation.generate_r1cs_witness(input);
    const std::vector<unsatisfied_constraint> failures = relation.unsatisfied_constraints();
    EXPECT_TRUE(has_failure_in(failures, "sortedness", 0));
    EXPECT_TRUE(has_failure_in(failures, "sortedness", 1));
}

TEST(Aggregate, ReportsNegativeBid)
{
    aggregate_relation<FieldT> relation(circuit_params(1, THRESHOLD));
    const aggregate_input<FieldT> input = make_test_input(1, {{3, 5, 1000}});

    // 3 - 5 wraps around the field, the entry sorts last
    relation.generate_r1cs_witness(input);
    EXPECT_TRUE(has_failure_in(relation.unsatisfied_constraints(), "price_model", 2));
}

TEST(Aggregate, RejectsInputOfOtherCapacity)
{
    aggregate_relation<FieldT> relation(circuit_params(2, THRESHOLD));
    const aggregate_input<FieldT> input = make_test_input(3, {{100, 5, 1000}});
    EXPECT_THROW(relation.generate_r1cs_witness(input), std::invalid_argument);
}

TEST(Aggregate, PrimaryInputHoldsOutputsInOrder)
{
    aggregate_relation<FieldT> relation(circuit_params(2, THRESHOLD));
    const aggregate_input<FieldT> input = make_test_input(2, {{100, 5, 1000}}, 9);
    const aggregate_outputs<FieldT> outputs = prove_outputs(relation, input);

    const std::vector<FieldT> primary = relation.pb.primary_input();
    ASSERT_EQ(primary.size(), aggregate_outputs<FieldT>::NUM_VALS);
    EXPECT_EQ(primary[0], outputs.p25);
    EXPECT_EQ(primary[1], outputs.p50);
    EXPECT_EQ(primary[2], outputs.p75);
    EXPECT_EQ(primary[3], outputs.confidence);
    EXPECT_EQ(primary[4], FieldT(9));

    EXPECT_THROW(aggregate_outputs<FieldT>::from_primary_input({FieldT::one()}), std::invalid_argument);
}

TEST(WitnessBuilder, RejectsTooManyQuotes)
{
    EXPECT_THROW(make_test_input(1, {{100, 5, 1000}, {110, 2, 1000}}), std::invalid_argument);

    const std::vector<PriceModelVals<FieldT>> model(4, PriceModelVals<FieldT>(0, 0, PASSTHROUGH));
    EXPECT_THROW(make_aggregate_input(1, sign_quotes({{100, 5, 1000}}), model, FieldT::zero(), padding_key()),
                 std::invalid_argument);
}

TEST(WitnessBuilder, PadsToCapacity)
{
    const aggregate_input<FieldT> input = make_test_input(3, {{100, 5, 1000}});
    ASSERT_EQ(input.quotes.size(), 3u);
    ASSERT_EQ(input.signatures.size(), 3u);
    ASSERT_EQ(input.price_model.size(), 9u);
    EXPECT_EQ(input.active_count, FieldT::one());
    EXPECT_TRUE(is_sentinel(input.quotes[1].price));
    EXPECT_TRUE(is_sentinel(input.signatures[2].s_low));
    EXPECT_TRUE(is_sentinel(input.price_model[3].operation));
    EXPECT_FALSE(is_sentinel(input.price_model[2].operation));
}

TEST(Pricesnark, ProofVerifiesAgainstOutputsOnly)
{
    pricesnark_relation<EcPP> relation(circuit_params(1, THRESHOLD));
    const pricesnark_keypair<EcPP> keypair = pricesnark_generator<EcPP>(relation);
    const pricesnark_processed_verification_key<EcPP> pvk = pricesnark_verifier_process_vk<EcPP>(keypair.vk);

    const aggregate_input<FieldT> input = make_test_input(1, {{100, 5, 1000}}, 2);
    pricesnark_outputs<EcPP> outputs;
    const pricesnark_proof<EcPP> proof = pricesnark_prover<EcPP>(keypair.pk, relation, input, outputs);

    EXPECT_EQ(outputs.p50, FieldT(100));
    EXPECT_TRUE(pricesnark_online_verifier<EcPP>(pvk, outputs, proof));

    pricesnark_outputs<EcPP> altered = outputs;
    altered.p50 = FieldT(101);
    EXPECT_FALSE(pricesnark_online_verifier<EcPP>(pvk, altered, proof));

    altered = outputs;
    altered.fee = FieldT(3);
    EXPECT_FALSE(pricesnark_online_verifier<EcPP>(pvk, altered, proof));
}

TEST(Pricesnark, ProverRefusesUnsatisfiedWitness)
{
    pricesnark_relation<EcPP> relation(circuit_params(1, THRESHOLD));
    const pricesnark_keypair<EcPP> keypair = pricesnark_generator<EcPP>(relation);

    aggregate_input<FieldT> input = make_test_input(1, {{100, 5, 1000}});
    input.quotes[0].price = FieldT(101);

    pricesnark_outputs<EcPP> outputs;
    EXPECT_THROW(pricesnark_prover<EcPP>(keypair.pk, relation, input, outputs), unsatisfied_circuit_error);
}
