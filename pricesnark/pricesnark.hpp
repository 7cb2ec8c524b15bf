/** @file
*****************************************************************************

Declaration of interfaces for the price aggregation SNARK

The price aggregation SNARK proves that a public aggregate
(p25, p50, p75, confidence, fee) was computed from authentically signed,
non-stale, well-formed price quotes, without revealing the quotes.

It is a Groth16 SNARK (r1cs_gg_ppzksnark) over the aggregation relation, see
aggregate_relation.hpp

*****************************************************************************/

#ifndef PRICESNARK_HPP_
#define PRICESNARK_HPP_

#include <vector>

#include "libsnark/zk_proof_systems/ppzksnark/r1cs_gg_ppzksnark/r1cs_gg_ppzksnark.hpp"

#include "aggregate_relation.hpp"

template<typename ppT>
using pricesnark_constraint_system = libsnark::r1cs_constraint_system<libff::Fr<ppT> >;

template<typename ppT>
using pricesnark_primary_input = libsnark::r1cs_primary_input<libff::Fr<ppT> >;

template<typename ppT>
using pricesnark_auxiliary_input = libsnark::r1cs_auxiliary_input<libff::Fr<ppT> >;

template<typename ppT>
using pricesnark_proving_key = libsnark::r1cs_gg_ppzksnark_proving_key<ppT>;

template<typename ppT>
using pricesnark_verification_key = libsnark::r1cs_gg_ppzksnark_verification_key<ppT>;

template<typename ppT>
using pricesnark_processed_verification_key = libsnark::r1cs_gg_ppzksnark_processed_verification_key<ppT>;

template<typename ppT>
using pricesnark_keypair = libsnark::r1cs_gg_ppzksnark_keypair<ppT>;

template<typename ppT>
using pricesnark_proof = libsnark::r1cs_gg_ppzksnark_proof<ppT>;

template<typename ppT>
using pricesnark_relation = aggregate_relation<libff::Fr<ppT> >;

template<typename ppT>
using pricesnark_outputs = aggregate_outputs<libff::Fr<ppT> >;

/***************************** Main algorithms *******************************/

/**
 * Generator algorithm for the price aggregation SNARK
 */
template<typename ppT>
pricesnark_keypair<ppT> pricesnark_generator(const pricesnark_relation<ppT> &relation);

/**
 * Proving algorithm for the price aggregation SNARK
 *
 * generates the witness for input, checks it and proves it. Throws
 * unsatisfied_circuit_error if the witness does not satisfy the relation,
 * no proof is attempted in that case. The public outputs are returned in
 * outputs.
 */
template<typename ppT>
pricesnark_proof<ppT> pricesnark_prover(const pricesnark_proving_key<ppT> &pk,
                                        pricesnark_relation<ppT> &relation,
                                        const aggregate_input<libff::Fr<ppT> > &input,
                                        pricesnark_outputs<ppT> &outputs);

/**
 * Verifier algorithm, preprocessing step for the price aggregation SNARK
 *
 * one time preprocessing of verifier key
 */
template<typename ppT>
pricesnark_processed_verification_key<ppT> pricesnark_verifier_process_vk(const pricesnark_verification_key<ppT> &vk);

/**
 * Verifier algorithm, online step for the price aggregation SNARK
 */
template<typename ppT>
bool pricesnark_online_verifier(const pricesnark_processed_verification_key<ppT> &pvk,
                                const pricesnark_outputs<ppT> &outputs,
                                const pricesnark_proof<ppT> &proof);

#include "pricesnark.tcc"
#endif // PRICESNARK_HPP_
