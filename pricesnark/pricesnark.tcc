/** @file
*****************************************************************************

price aggregation SNARK

See pricesnark.hpp
*****************************************************************************/

#ifndef PRICESNARK_TCC_
#define PRICESNARK_TCC_

template<typename ppT>
pricesnark_keypair<ppT> pricesnark_generator(const pricesnark_relation<ppT> &relation)
{
    return libsnark::r1cs_gg_ppzksnark_generator<ppT>(relation.constraint_system);
}

template<typename ppT>
pricesnark_proof<ppT> pricesnark_prover(const pricesnark_proving_key<ppT> &pk,
                                        pricesnark_relation<ppT> &relation,
                                        const aggregate_input<libff::Fr<ppT> > &input,
                                        pricesnark_outputs<ppT> &outputs)
{
    relation.generate_r1cs_witness(input);
    relation.assert_satisfied();

    outputs = relation.outputs();
    return libsnark::r1cs_gg_ppzksnark_prover<ppT>(pk, relation.constraint_system, relation.pb.primary_input(), relation.pb.auxiliary_input());
}

template<typename ppT>
pricesnark_processed_verification_key<ppT> pricesnark_verifier_process_vk(const pricesnark_verification_key<ppT> &vk)
{
    return libsnark::r1cs_gg_ppzksnark_verifier_process_vk<ppT>(vk);
}

template<typename ppT>
bool pricesnark_online_verifier(const pricesnark_processed_verification_key<ppT> &pvk,
                                const pricesnark_outputs<ppT> &outputs,
                                const pricesnark_proof<ppT> &proof)
{
    return libsnark::r1cs_gg_ppzksnark_online_verifier_strong_IC<ppT>(pvk, outputs.as_primary_input(), proof);
}

#endif // PRICESNARK_TCC_
