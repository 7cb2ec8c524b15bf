/** @file
 *****************************************************************************

 Implementation of interfaces for percentile gadgets.

 See percentile_gadget.hpp

 *****************************************************************************/

#include "percentile_gadget.hpp"

template<typename FieldT>
void quantile_gadget<FieldT>::generate_r1cs_constraints()
{
    rank_division->generate_r1cs_constraints();

    libsnark::linear_combination<FieldT> sel_sum;
    libsnark::linear_combination<FieldT> sel_position;
    libsnark::linear_combination<FieldT> selected;
    for (size_t i = 0; i < values.size(); ++i){
        libsnark::generate_boolean_r1cs_constraint<FieldT>(this->pb, sel[i], FMT(this->annotation_prefix, ".bitness_%zu", i));
        this->pb.add_r1cs_constraint(libsnark::r1cs_constraint<FieldT>(sel[i], values[i], products[i]), FMT(this->annotation_prefix, ".product_%zu", i));
        sel_sum.add_term(sel[i]);
        sel_position.add_term(sel[i], i + 1);
        selected.add_term(products[i]);
    }

    // at most one element selected
    this->pb.add_r1cs_constraint(libsnark::r1cs_constraint<FieldT>(sel_sum, 1 - sel_sum, 0), FMT(this->annotation_prefix, ".single"));
    this->pb.add_r1cs_constraint(libsnark::r1cs_constraint<FieldT>(1, sel_position, rank), FMT(this->annotation_prefix, ".position"));
    this->pb.add_r1cs_constraint(libsnark::r1cs_constraint<FieldT>(1, selected, output), FMT(this->annotation_prefix, ".output"));
}

template<typename FieldT>
void quantile_gadget<FieldT>::generate_r1cs_witness()
{
    rank_division->generate_r1cs_witness();

    const FieldT r = this->pb.val(rank);
    FieldT out = FieldT::zero();
    for (size_t i = 0; i < values.size(); ++i){
        values[i].evaluate(this->pb);
        if (r == FieldT(i + 1)){
            this->pb.val(sel[i]) = FieldT::one();
            this->pb.val(products[i]) = this->pb.lc_val(values[i]);
            out = this->pb.lc_val(values[i]);
        }else{
            this->pb.val(sel[i]) = FieldT::zero();
            this->pb.val(products[i]) = FieldT::zero();
        }
    }
    this->pb.val(output) = out;
}

template<typename FieldT>
void percentile_gadget<FieldT>::generate_r1cs_constraints()
{
    if (assert_sorted){
        sorted->generate_r1cs_constraints();
    }
    q25->generate_r1cs_constraints();
    q50->generate_r1cs_constraints();
    q75->generate_r1cs_constraints();
}

template<typename FieldT>
void percentile_gadget<FieldT>::generate_r1cs_witness()
{
    if (assert_sorted){
        sorted->generate_r1cs_witness();
    }
    q25->generate_r1cs_witness();
    q50->generate_r1cs_witness();
    q75->generate_r1cs_witness();
}
