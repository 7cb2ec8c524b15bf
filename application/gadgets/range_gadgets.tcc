/** @file
 *****************************************************************************

 Implementation of interfaces for range gadgets.

 See range_gadgets.hpp

 *****************************************************************************/

#include "range_gadgets.hpp"

template<typename FieldT>
void range_gadget<FieldT>::generate_r1cs_constraints()
{
    // boolean constrain bits
    for (size_t i = 0; i < bits.size(); ++i)
    {
        libsnark::generate_boolean_r1cs_constraint<FieldT>(this->pb, bits[i], FMT(this->annotation_prefix, ".bitness_%zu", i));
    }

    // compute coefficients
    FieldT coeff = FieldT::one();
    std::vector<libsnark::linear_term<FieldT> > all_terms;
    for (size_t i = 0; i < bits.size() - 1; ++i)
    {
        all_terms.emplace_back(coeff * bits[i]);
        coeff += coeff;
    }
    // last coefficient
    all_terms.emplace_back(FieldT(coeff_n) * bits.back());

    // min as offset
    all_terms.emplace_back(FieldT(min) * libsnark::ONE);

    this->pb.add_r1cs_constraint(libsnark::r1cs_constraint<FieldT>(1, all_terms, value), FMT(this->annotation_prefix, ".sum"));
}

template<typename FieldT>
void range_gadget<FieldT>::generate_r1cs_witness()
{
    value.evaluate(this->pb);
    FieldT r = this->pb.lc_val(value) - FieldT(min);

    // out of range values leave the sum constraint unsatisfied
    if (!fits_in_bits(r, 8 * sizeof(long) - 1) || (long) r.as_ulong() > max - min){
        bits.fill_with_bits_of_ulong(this->pb, 0);
        return;
    }

    long rv = r.as_ulong();
    if (rv >= coeff_n){
        this->pb.val(bits.back()) = FieldT::one();
        rv -= coeff_n;
    }else{
        this->pb.val(bits.back()) = FieldT::zero();
    }

    for (size_t i = 0; i < bits.size() - 1; ++i){
        this->pb.val(bits[i]) = ((rv >> i) & 1) ? FieldT::one() : FieldT::zero();
    }
}

template<typename FieldT>
void bit_range_gadget<FieldT>::generate_r1cs_constraints()
{
    for (size_t i = 0; i < n; ++i)
    {
        libsnark::generate_boolean_r1cs_constraint<FieldT>(this->pb, bits[i], FMT(this->annotation_prefix, ".bitness_%zu", i));
    }
    this->pb.add_r1cs_constraint(libsnark::r1cs_constraint<FieldT>(1, libsnark::pb_packing_sum<FieldT>(bits), value), FMT(this->annotation_prefix, ".packing"));
}

template<typename FieldT>
void bit_range_gadget<FieldT>::generate_r1cs_witness()
{
    // packing_gadget asserts on oversized values, the low n bits are used
    // instead so that the packing constraint fails
    value.evaluate(this->pb);
    bits.fill_with_bits_of_field_element(this->pb, this->pb.lc_val(value));
}

template<typename FieldT>
void bit_encoder_gadget<FieldT>::generate_r1cs_constraints()
{
    this->pb.add_r1cs_constraint(libsnark::r1cs_constraint<FieldT>(enable, value, masked), FMT(this->annotation_prefix, ".mask"));
    range->generate_r1cs_constraints();
}

template<typename FieldT>
void bit_encoder_gadget<FieldT>::generate_r1cs_witness()
{
    enable.evaluate(this->pb);
    value.evaluate(this->pb);

    this->pb.val(masked) = this->pb.lc_val(enable) * this->pb.lc_val(value);
    range->generate_r1cs_witness();
}

template<typename FieldT>
const libsnark::pb_variable_array<FieldT>& bit_encoder_gadget<FieldT>::bits() const
{
    return range->bits;
}
