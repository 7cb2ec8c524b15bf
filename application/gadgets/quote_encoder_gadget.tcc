/** @file
 *****************************************************************************

 Implementation of interfaces for quote encoder gadget.

 See quote_encoder_gadget.hpp

 *****************************************************************************/

#include "quote_encoder_gadget.hpp"

template<typename FieldT>
void quote_encoder_gadget<FieldT>::generate_r1cs_constraints()
{
    price->generate_r1cs_constraints();
    confidence->generate_r1cs_constraints();
    timestamp->generate_r1cs_constraints();
    observed_online->generate_r1cs_constraints();

    const FieldT shift = FieldT(2)^VALUE_BITS;
    this->pb.add_r1cs_constraint(libsnark::r1cs_constraint<FieldT>(1, price->masked + shift * confidence->masked, message),
                                 FMT(this->annotation_prefix, ".message"));
}

template<typename FieldT>
void quote_encoder_gadget<FieldT>::generate_r1cs_witness()
{
    price->generate_r1cs_witness();
    confidence->generate_r1cs_witness();
    timestamp->generate_r1cs_witness();
    observed_online->generate_r1cs_witness();

    const FieldT shift = FieldT(2)^VALUE_BITS;
    this->pb.val(message) = this->pb.val(price->masked) + shift * this->pb.val(confidence->masked);
}
