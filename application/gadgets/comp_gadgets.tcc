/** @file
 *****************************************************************************

 Implementation of interfaces for comparison gadget.

 See comp_gadgets.hpp

 *****************************************************************************/

#include "comp_gadgets.hpp"

template<typename FieldT>
void conditional_comparison_gadget<FieldT>::generate_r1cs_constraints()
{
    comp->generate_r1cs_constraints();

    if (strict){
        // enable * (1 - less) = 0
        this->pb.add_r1cs_constraint(libsnark::r1cs_constraint<FieldT>(enable, 1 - less, 0), FMT(this->annotation_prefix, ".assert_less"));
    }else{
        // enable * (1 - less_or_eq) = 0
        this->pb.add_r1cs_constraint(libsnark::r1cs_constraint<FieldT>(enable, 1 - less_or_eq, 0), FMT(this->annotation_prefix, ".assert_less_or_eq"));
    }
}

template<typename FieldT>
void conditional_comparison_gadget<FieldT>::generate_r1cs_witness()
{
    enable.evaluate(this->pb);
    A.evaluate(this->pb);
    B.evaluate(this->pb);

    if (fits_in_bits(this->pb.lc_val(A), n) && fits_in_bits(this->pb.lc_val(B), n)){
        comp->generate_r1cs_witness();
    }else{
        // comparison_gadget asserts on out of range inputs
        // leave its bits at zero, the packing constraint fails
        this->pb.val(less) = FieldT::zero();
        this->pb.val(less_or_eq) = FieldT::zero();
    }
}

template<typename FieldT>
void max_gadget<FieldT>::generate_r1cs_constraints()
{
    comp->generate_r1cs_constraints();

    // output = A + a_less_b * (B - A)
    this->pb.add_r1cs_constraint(libsnark::r1cs_constraint<FieldT>(a_less_b, B - A, output - A), FMT(this->annotation_prefix, ".select"));
}

template<typename FieldT>
void max_gadget<FieldT>::generate_r1cs_witness()
{
    A.evaluate(this->pb);
    B.evaluate(this->pb);

    if (fits_in_bits(this->pb.lc_val(A), n) && fits_in_bits(this->pb.lc_val(B), n)){
        comp->generate_r1cs_witness();
    }else{
        this->pb.val(a_less_b) = FieldT::zero();
        this->pb.val(less_or_eq) = FieldT::zero();
    }

    this->pb.val(output) = this->pb.val(a_less_b).is_zero() ? this->pb.lc_val(A) : this->pb.lc_val(B);
}
