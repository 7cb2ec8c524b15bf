/** @file
*****************************************************************************

Off-circuit helpers for publishers and the prover

Publishers sign the single field element

    message = price + 2^64 * confidence

with EdDSA using poseidon as message hash (quote_message, sign_quote). A
signature produced with a standard EdDSA hash never verifies in the circuit.

The prover pads the collected quotes to the circuit capacity
(make_aggregate_input): unused quote slots and price model entries hold the
sentinel, unused signature slots hold a signature of the zero message under
a padding key, with s_low set to the sentinel.

compute_aggregate_outputs evaluates the aggregation in plain C++ with the
same rank rule as the circuit.
*****************************************************************************/

#ifndef PRICESNARK_WITNESS_BUILDER_HPP_
#define PRICESNARK_WITNESS_BUILDER_HPP_

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

#include <libsnark/common/crypto/signature/eddsa_snarkfriendly.hpp>
#include "crypto/signatures/eddsa.h"

#include "application/gadgets/quote_variables.hpp"
#include "aggregate_gadget.hpp"

template<typename FieldT>
QuoteVals<FieldT> make_quote(uint64_t price, uint64_t confidence, uint64_t timestamp, uint64_t observed_online);

template<typename FieldT>
FieldT quote_message(const QuoteVals<FieldT> &quote);

/**
 * x-coordinate of the public key, the form listed in valid_pubkeys
 */
template<typename FieldT>
FieldT publisher_pubkey_x(const ethsnarks::eddsa_keypair &key);

/**
 * Signs a message with the poseidon EdDSA variant, the result includes
 * the signer's public key and the low bit of S
 */
template<typename FieldT>
SignatureVals<FieldT> sign_message(const ethsnarks::eddsa_keypair &key, const FieldT &message);

template<typename FieldT>
signed_quote<FieldT> sign_quote(const ethsnarks::eddsa_keypair &key, const QuoteVals<FieldT> &quote);

ethsnarks::eddsa_keypair generate_publisher_key();

/**
 * Price model with three entries per quote (SUBTRACT_CONF, PASSTHROUGH,
 * ADD_CONF), ordered ascending by derived value
 */
template<typename FieldT>
std::vector<PriceModelVals<FieldT>> make_price_model(const std::vector<QuoteVals<FieldT>> &quotes);

/**
 * Pads quotes, signatures and price model to capacity max_quotes
 * throws std::invalid_argument if there are more than max_quotes quotes
 */
template<typename FieldT>
aggregate_input<FieldT> make_aggregate_input(size_t max_quotes,
                                             const std::vector<signed_quote<FieldT>> &quotes,
                                             const FieldT &fee,
                                             const ethsnarks::eddsa_keypair &padding_key);

template<typename FieldT>
aggregate_input<FieldT> make_aggregate_input(size_t max_quotes,
                                             const std::vector<signed_quote<FieldT>> &quotes,
                                             const std::vector<PriceModelVals<FieldT>> &price_model,
                                             const FieldT &fee,
                                             const ethsnarks::eddsa_keypair &padding_key);

/**
 * Value of a price model entry, computed over the integers
 * (a negative bid wraps around the field, as it does in the circuit)
 */
template<typename FieldT>
FieldT derived_value(const aggregate_input<FieldT> &input, const PriceModelVals<FieldT> &entry);

template<typename FieldT>
aggregate_outputs<FieldT> compute_aggregate_outputs(const aggregate_input<FieldT> &input);

#include "witness_builder.tcc"

#endif // PRICESNARK_WITNESS_BUILDER_HPP_
