/** @file
 *****************************************************************************

 Declaration of interfaces for integer arithmetic gadgets

 integer_division_gadget: divides a non-negative value by a constant, rounds
 towards negative or positive infinity. This is integer division, not
 division in the field
 *****************************************************************************/

#ifndef INTEGER_ARTIHMETIC_H
#define INTEGER_ARTIHMETIC_H

#include <memory>

#include "libsnark/gadgetlib1/gadget.hpp"
#include "libsnark/gadgetlib1/protoboard.hpp"
#include "libsnark/gadgetlib1/gadgets/basic_gadgets.hpp"
#include "application/gadgets/range_gadgets.hpp"

enum division_rounding {
    ROUND_FLOOR,
    ROUND_CEIL
};

template<typename FieldT>
class integer_division_gadget : public libsnark::gadget<FieldT> {
/**
 * output q = a / d rounded towards -inf (floor) or +inf (ceil)
 *
 * Constraints
 * floor: (1) q*d + r = a (mod P)
 * ceil:  (1) q*d - r = a (mod P)
 *        (2) 0 <= r < d
 *        (3) 0 <= q <= max_quotient
 *
 * if 0 <= a <= max_quotient * d and max_quotient * d + d < P there is exactly
 * one solution: q*d +/- r ranges over [-d, (max_quotient+1)*d) and cannot
 * wrap around P, so (1) holds over the integers
 */
private:
    libsnark::pb_variable<FieldT> r;
    std::shared_ptr<range_gadget<FieldT>> range_r;
    std::shared_ptr<range_gadget<FieldT>> range_q;
public:
    const libsnark::pb_linear_combination<FieldT> a;
    const unsigned int divisor;
    const long max_quotient;
    const division_rounding rounding;
    const libsnark::pb_variable<FieldT> q;

    integer_division_gadget(libsnark::protoboard<FieldT>& pb,
                    const long max_quotient,
                    const libsnark::linear_combination<FieldT> &a,
                    const unsigned int divisor,
                    const division_rounding rounding,
                    const libsnark::pb_variable<FieldT> &q,
                    const std::string &annotation_prefix="") :
            libsnark::gadget<FieldT>(pb, annotation_prefix), a(pb, a), divisor(divisor),
            max_quotient(max_quotient), rounding(rounding), q(q)
    {
        assert(divisor > 1);
        assert(max_quotient > 0);
        assert(((size_t) num_bits(divisor)) < FieldT::num_bits / 2);
        assert(((size_t) num_bits(max_quotient)) < FieldT::num_bits / 2);

        r.allocate(this->pb, FMT(this->annotation_prefix, ".r"));

        range_r.reset(new range_gadget<FieldT>(this->pb, 0, divisor-1, r, FMT(this->annotation_prefix, ".range_r")));
        range_q.reset(new range_gadget<FieldT>(this->pb, 0, max_quotient, q, FMT(this->annotation_prefix, ".range_q")));
    };

    void generate_r1cs_constraints();
    void generate_r1cs_witness();
};


#include "integer_arithmetic.tcc"
#endif //INTEGER_ARTIHMETIC_H
