/** @file
 *****************************************************************************

 Implementation of interfaces for integer arithmetic gadget.

 See integer_arithmetic.hpp

 *****************************************************************************/

#include "integer_arithmetic.hpp"

template<typename FieldT>
void integer_division_gadget<FieldT>::generate_r1cs_constraints()
{
    range_r->generate_r1cs_constraints();
    range_q->generate_r1cs_constraints();
    if (rounding == ROUND_FLOOR){
        this->pb.add_r1cs_constraint(libsnark::r1cs_constraint<FieldT>(divisor, q, -r + a), FMT(this->annotation_prefix, ".q*d+r=a"));
    }else{
        this->pb.add_r1cs_constraint(libsnark::r1cs_constraint<FieldT>(divisor, q, r + a), FMT(this->annotation_prefix, ".q*d-r=a"));
    }
}

template<typename FieldT>
void integer_division_gadget<FieldT>::generate_r1cs_witness()
{
    long a_val;
    long r_val;
    long q_val;

    a.evaluate(this->pb);

    const FieldT a_field = this->pb.lc_val(a);
    if (!fits_in_bits(a_field, 8 * sizeof(long) - 2)){
        // no integer solution, leave the division constraint unsatisfied
        this->pb.val(r) = FieldT::zero();
        this->pb.val(q) = FieldT::zero();
        range_r->generate_r1cs_witness();
        range_q->generate_r1cs_witness();
        return;
    }

    a_val = a_field.as_ulong();
    if (rounding == ROUND_FLOOR){
        q_val = integer_division(a_val, divisor);
        r_val = a_val - divisor * q_val;
    }else{
        q_val = integer_division_ceil(a_val, divisor);
        r_val = divisor * q_val - a_val;
    }

    this->pb.val(r) = FieldT(r_val);
    this->pb.val(q) = FieldT(q_val);

    range_r->generate_r1cs_witness();
    range_q->generate_r1cs_witness();
}
