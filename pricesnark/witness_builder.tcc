/** @file
*****************************************************************************

Off-circuit helpers for publishers and the prover

See witness_builder.hpp
*****************************************************************************/

#ifndef PRICESNARK_WITNESS_BUILDER_TCC_
#define PRICESNARK_WITNESS_BUILDER_TCC_

#include <algorithm>

template<typename FieldT>
QuoteVals<FieldT> make_quote(uint64_t price, uint64_t confidence, uint64_t timestamp, uint64_t observed_online)
{
    return QuoteVals<FieldT>({field_from_ulong<FieldT>(price),
                              field_from_ulong<FieldT>(confidence),
                              field_from_ulong<FieldT>(timestamp),
                              field_from_ulong<FieldT>(observed_online)});
}

template<typename FieldT>
FieldT quote_message(const QuoteVals<FieldT> &quote)
{
    return quote.price + (FieldT(2)^64) * quote.confidence;
}

template<typename FieldT>
FieldT publisher_pubkey_x(const ethsnarks::eddsa_keypair &key)
{
    libsnark::eddsa_sf_pubkey<ethsnarks::default_inner_ec_pp> pubkey = key.pk;
    pubkey.pkey.to_affine_coordinates();
    return ethsnarks::default_inner_ec_pp::inner2outer(pubkey.pkey.X);
}

template<typename FieldT>
SignatureVals<FieldT> sign_message(const ethsnarks::eddsa_keypair &key, const FieldT &message)
{
    ethsnarks::eddsa_msg_field msg;
    msg.push_back(message.as_bigint());
    ethsnarks::EddsaSignature sig = ethsnarks::eddsa_poseidon_sign(msg, key.sk);

    libsnark::eddsa_sf_pubkey<ethsnarks::default_inner_ec_pp> pubkey = key.pk;
    pubkey.pkey.to_affine_coordinates();

    SignatureVals<FieldT> result;
    result.A_x = ethsnarks::default_inner_ec_pp::inner2outer(pubkey.pkey.X);
    result.A_y = ethsnarks::default_inner_ec_pp::inner2outer(pubkey.pkey.Y);

    sig.R.to_affine_coordinates();
    result.R_x = FieldT(sig.R.X.as_bigint());
    result.R_y = FieldT(sig.R.Y.as_bigint());
    result.S = FieldT(sig.s.as_bigint());
    result.s_low = result.S.as_bigint().test_bit(0) ? FieldT::one() : FieldT::zero();
    return result;
}

template<typename FieldT>
signed_quote<FieldT> sign_quote(const ethsnarks::eddsa_keypair &key, const QuoteVals<FieldT> &quote)
{
    signed_quote<FieldT> result;
    result.quote = quote;
    result.signature = sign_message(key, quote_message(quote));
    return result;
}

template<typename FieldT>
std::vector<PriceModelVals<FieldT>> make_price_model(const std::vector<QuoteVals<FieldT>> &quotes)
{
    std::vector<PriceModelVals<FieldT>> entries;
    std::vector<FieldT> derived;
    for (size_t i = 0; i < quotes.size(); ++i){
        entries.push_back(PriceModelVals<FieldT>(i, i, SUBTRACT_CONF));
        derived.push_back(quotes[i].price - quotes[i].confidence);
        entries.push_back(PriceModelVals<FieldT>(i, i, PASSTHROUGH));
        derived.push_back(quotes[i].price);
        entries.push_back(PriceModelVals<FieldT>(i, i, ADD_CONF));
        derived.push_back(quotes[i].price + quotes[i].confidence);
    }

    std::vector<size_t> order(entries.size());
    for (size_t j = 0; j < order.size(); ++j){
        order[j] = j;
    }
    std::stable_sort(order.begin(), order.end(), [&derived](size_t a, size_t b){
        return field_less(derived[a], derived[b]);
    });

    std::vector<PriceModelVals<FieldT>> sorted;
    for (size_t j = 0; j < order.size(); ++j){
        sorted.push_back(entries[order[j]]);
    }
    return sorted;
}

template<typename FieldT>
aggregate_input<FieldT> make_aggregate_input(size_t max_quotes,
                                             const std::vector<signed_quote<FieldT>> &quotes,
                                             const FieldT &fee,
                                             const ethsnarks::eddsa_keypair &padding_key)
{
    std::vector<QuoteVals<FieldT>> values;
    for (size_t i = 0; i < quotes.size(); ++i){
        values.push_back(quotes[i].quote);
    }
    return make_aggregate_input(max_quotes, quotes, make_price_model(values), fee, padding_key);
}

template<typename FieldT>
aggregate_input<FieldT> make_aggregate_input(size_t max_quotes,
                                             const std::vector<signed_quote<FieldT>> &quotes,
                                             const std::vector<PriceModelVals<FieldT>> &price_model,
                                             const FieldT &fee,
                                             const ethsnarks::eddsa_keypair &padding_key)
{
    if (quotes.size() > max_quotes){
        throw std::invalid_argument("too many quotes: " + std::to_string(quotes.size()) +
                                    " for capacity " + std::to_string(max_quotes));
    }
    if (price_model.size() > 3 * max_quotes){
        throw std::invalid_argument("too many price model entries: " + std::to_string(price_model.size()) +
                                    " for capacity " + std::to_string(3 * max_quotes));
    }

    aggregate_input<FieldT> input;
    input.active_count = FieldT(quotes.size());
    input.fee = fee;

    for (size_t i = 0; i < quotes.size(); ++i){
        input.quotes.push_back(quotes[i].quote);
        input.signatures.push_back(quotes[i].signature);
    }

    if (quotes.size() < max_quotes){
        SignatureVals<FieldT> padding_signature = sign_message(padding_key, FieldT::zero());
        padding_signature.s_low = sentinel_value<FieldT>();
        for (size_t i = quotes.size(); i < max_quotes; ++i){
            input.quotes.push_back(QuoteVals<FieldT>::padding());
            input.signatures.push_back(padding_signature);
        }
    }

    input.price_model = price_model;
    while (input.price_model.size() < 3 * max_quotes){
        input.price_model.push_back(PriceModelVals<FieldT>::padding());
    }
    return input;
}

template<typename FieldT>
FieldT derived_value(const aggregate_input<FieldT> &input, const PriceModelVals<FieldT> &entry)
{
    const size_t price_index = entry.price_index.as_ulong();
    const size_t conf_index = entry.conf_index.as_ulong();
    if (price_index >= input.quotes.size() || conf_index >= input.quotes.size()){
        throw std::invalid_argument("price model entry refers to a slot out of range");
    }

    const FieldT price = input.quotes[price_index].price;
    const FieldT conf = input.quotes[conf_index].confidence;
    if (entry.operation == FieldT(SUBTRACT_CONF)){
        return price - conf;
    }
    if (entry.operation == FieldT(ADD_CONF)){
        return price + conf;
    }
    if (entry.operation == FieldT(PASSTHROUGH)){
        return price;
    }
    throw std::invalid_argument("unknown price model operation");
}

template<typename FieldT>
aggregate_outputs<FieldT> compute_aggregate_outputs(const aggregate_input<FieldT> &input)
{
    const long n = input.active_count.as_ulong();
    const size_t m = 3 * n;
    if (m > input.price_model.size()){
        throw std::invalid_argument("active count exceeds price model size");
    }

    std::vector<FieldT> derived;
    for (size_t j = 0; j < m; ++j){
        derived.push_back(derived_value(input, input.price_model[j]));
    }
    std::stable_sort(derived.begin(), derived.end(), field_less<FieldT>);

    // element at 1-indexed rank ceil(k * m / 4), zero if there is none
    auto quantile = [&derived, m](long k) -> FieldT {
        const long rank = integer_division_ceil(k * (long) m, 4);
        return rank == 0 ? FieldT::zero() : derived[rank - 1];
    };

    aggregate_outputs<FieldT> outputs;
    outputs.p25 = quantile(1);
    outputs.p50 = quantile(2);
    outputs.p75 = quantile(3);

    const FieldT left = outputs.p50 - outputs.p25;
    const FieldT right = outputs.p75 - outputs.p50;
    outputs.confidence = field_less(left, right) ? right : left;
    outputs.fee = input.fee;
    return outputs;
}

#endif // PRICESNARK_WITNESS_BUILDER_TCC_
