/** @file
 *****************************************************************************

 Implementation of interfaces for quote signature gadget.

 See signature_gadget.hpp .

 *****************************************************************************/

#include "signature_gadget.hpp"

template<typename FieldT>
void quote_signature_gadget<FieldT>::generate_r1cs_constraints ()
{
    for (size_t i = 0; i < sig_S.size(); ++i){
        libsnark::generate_boolean_r1cs_constraint<FieldT>(this->pb, sig_S[i], FMT(this->annotation_prefix, ".bitness_S_%zu", i));
    }
    eddsa_gadget->generate_r1cs_constraints();

    this->pb.add_r1cs_constraint(libsnark::r1cs_constraint<FieldT>(flag, s_low - sig_S[0], 0), FMT(this->annotation_prefix, ".s_low"));
}

template<typename FieldT>
void quote_signature_gadget<FieldT>::generate_r1cs_witness (const SignatureVals<FieldT> &sig)
{
    this->pb.val(A.x) = sig.A_x;
    this->pb.val(A.y) = sig.A_y;
    this->pb.val(sig_R.x) = sig.R_x;
    this->pb.val(sig_R.y) = sig.R_y;
    sig_S.fill_with_bits_of_field_element(this->pb, sig.S);

    eddsa_gadget->generate_r1cs_witness();
}
