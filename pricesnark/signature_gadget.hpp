/** @file
 *****************************************************************************

 Declaration of interfaces for quote signature gadget

 quote_signature_gadget verifies the signature of one quote slot.

 Signature scheme is EDDSA on a SNARK-friendly curve (jubjub or similar), curve
 depends on selected SNARK curve. The message is a single field element
 hashed with poseidon, signers have to use the matching poseidon based
 signing routine (eddsa_poseidon_sign).

 The public key A is part of the witness, any key is accepted.

 Additionally the gadget ties the separate s_low variable to the low bit of S
 for active slots:
   flag * (s_low - S[0]) = 0
 *****************************************************************************/

#ifndef PRICESNARK_SIGNATURE_GADGET_HPP_
#define PRICESNARK_SIGNATURE_GADGET_HPP_

#include <memory>

#include <libsnark/gadgetlib1/gadget.hpp>
#include <libsnark/gadgetlib1/pb_variable.hpp>
#include <ethsnarks/src/jubjub/eddsa.hpp>

#include "application/gadgets/quote_variables.hpp"

template<typename FieldT>
class quote_signature_gadget : public libsnark::gadget<FieldT>{
private:
    const ethsnarks::jubjub::Params params;  // This member must live within this object, as eddsa gadget has reference to it
    std::shared_ptr<ethsnarks::jubjub::PureEdDSAPoseidon> eddsa_gadget;
    libsnark::pb_variable_array<FieldT> values;
    ethsnarks::jubjub::EdwardsPoint B;

public:
    const libsnark::pb_variable<FieldT> flag;
    const libsnark::pb_variable<FieldT> message;
    const libsnark::pb_variable<FieldT> s_low;
    ethsnarks::jubjub::VariablePointT A;
    ethsnarks::jubjub::VariablePointT sig_R;
    libsnark::pb_variable_array<FieldT> sig_S;

    quote_signature_gadget(libsnark::protoboard<FieldT> &pb,
                           const libsnark::pb_variable<FieldT> &flag,
                           const libsnark::pb_variable<FieldT> &message,
                           const libsnark::pb_variable<FieldT> &s_low,
                           const std::string &annotation_prefix=""):
            libsnark::gadget<FieldT>(pb, annotation_prefix),
            params(), B(params.Gx, params.Gy), flag(flag), message(message), s_low(s_low),
            A(pb, FMT(annotation_prefix, ".A")), sig_R(pb, FMT(annotation_prefix, ".sig_R"))
    {
        sig_S = ethsnarks::make_var_array(pb, FieldT::ceil_size_in_bits(), FMT(annotation_prefix, ".sig_S"));
        values.emplace_back(message);

        eddsa_gadget.reset(new ethsnarks::jubjub::PureEdDSAPoseidon(pb, params, B, A, sig_R, sig_S, values, FMT(this->annotation_prefix, ".eddsa")));
    };

    void generate_r1cs_constraints();

    void generate_r1cs_witness(const SignatureVals<FieldT> &sig);
};

#include "signature_gadget.tcc"

#endif // PRICESNARK_SIGNATURE_GADGET_HPP_
