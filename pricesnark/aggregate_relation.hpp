/** @file
*****************************************************************************

Relation for the price aggregation SNARK

The relation owns the protoboard of the aggregation circuit. The five public
outputs are allocated first, so the primary input of the relation is

    (p25, p50, p75, confidence, fee)

all other variables are auxiliary input.

*****************************************************************************/

#ifndef PRICESNARK_AGGREGATE_RELATION_HPP_
#define PRICESNARK_AGGREGATE_RELATION_HPP_

#include <memory>
#include <vector>

#include "libsnark/relations/constraint_satisfaction_problems/r1cs/r1cs.hpp"

#include "aggregate_gadget.hpp"

template<typename FieldT>
class aggregate_relation {
private:
    libsnark::pb_variable<FieldT> p25;
    libsnark::pb_variable<FieldT> p50;
    libsnark::pb_variable<FieldT> p75;
    libsnark::pb_variable<FieldT> confidence;
    libsnark::pb_variable<FieldT> fee;

public:
    diagnostic_protoboard<FieldT> pb;
    const circuit_params params;
    std::shared_ptr<price_aggregate_gadget<FieldT>> g;
    libsnark::r1cs_constraint_system<FieldT> constraint_system;

    aggregate_relation(const circuit_params &params, const std::string &annotation_prefix="aggregate");

    // g refers to pb
    aggregate_relation(const aggregate_relation &) = delete;
    aggregate_relation& operator=(const aggregate_relation &) = delete;

    /**
     * assigns the private input and computes all outputs and auxiliary
     * variables. Does not check the result, see assert_satisfied()
     */
    void generate_r1cs_witness(const aggregate_input<FieldT> &input);

    std::vector<unsatisfied_constraint> unsatisfied_constraints() const;

    /**
     * throws unsatisfied_circuit_error naming the group and index of the
     * first unsatisfied constraint
     */
    void assert_satisfied() const;

    aggregate_outputs<FieldT> outputs() const;

    size_t num_constraints() const;
};

#include "aggregate_relation.tcc"

#endif // PRICESNARK_AGGREGATE_RELATION_HPP_
