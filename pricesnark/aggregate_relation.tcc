/** @file
*****************************************************************************

Relation for the price aggregation SNARK

See aggregate_relation.hpp
*****************************************************************************/

#ifndef PRICESNARK_AGGREGATE_RELATION_TCC_
#define PRICESNARK_AGGREGATE_RELATION_TCC_

#include <libff/common/profiling.hpp>

template<typename FieldT>
aggregate_relation<FieldT>::aggregate_relation(const circuit_params &params, const std::string &annotation_prefix) :
    pb(), params(params)
{
    libff::enter_block("Build aggregation relation");

    // public outputs first
    p25.allocate(pb, "p25");
    p50.allocate(pb, "p50");
    p75.allocate(pb, "p75");
    confidence.allocate(pb, "confidence");
    fee.allocate(pb, "fee");
    pb.set_input_sizes(aggregate_outputs<FieldT>::NUM_VALS);

    g.reset(new price_aggregate_gadget<FieldT>(pb, params, p25, p50, p75, confidence, fee, annotation_prefix));
    g->generate_r1cs_constraints();

    // Store r1cs separately, because generator can change constraint system (swap AB if beneficial)
    constraint_system = pb.get_constraint_system();

    if (!libff::inhibit_profiling_info)
    {
        std::cout << "Circuit parameters: " << params << std::endl;
        std::cout << "Number of constraints: " << pb.num_constraints() << std::endl;
        std::cout << "Number of variables: " << pb.num_variables() << std::endl;
    }
    libff::leave_block("Build aggregation relation");
}

template<typename FieldT>
void aggregate_relation<FieldT>::generate_r1cs_witness(const aggregate_input<FieldT> &input)
{
    libff::enter_block("Generate aggregation witness");

    const FieldT n = input.active_count;
    if (fits_in_bits(n, 8 * sizeof(long) - 1)){
        for (size_t i = 0; i < n.as_ulong() && i < input.signatures.size(); ++i){
            if (!params.accepts_pubkey(input.signatures[i].A_x)){
                std::cerr << "warning: quote " << i << " is signed by an unregistered key" << std::endl;
            }
        }
    }

    g->generate_r1cs_witness(input);
    libff::leave_block("Generate aggregation witness");
}

template<typename FieldT>
std::vector<unsatisfied_constraint> aggregate_relation<FieldT>::unsatisfied_constraints() const
{
    return pb.unsatisfied_constraints();
}

template<typename FieldT>
void aggregate_relation<FieldT>::assert_satisfied() const
{
    pb.assert_satisfied();
}

template<typename FieldT>
aggregate_outputs<FieldT> aggregate_relation<FieldT>::outputs() const
{
    return aggregate_outputs<FieldT>::from_primary_input(pb.primary_input());
}

template<typename FieldT>
size_t aggregate_relation<FieldT>::num_constraints() const
{
    return constraint_system.num_constraints();
}

#endif // PRICESNARK_AGGREGATE_RELATION_TCC_
