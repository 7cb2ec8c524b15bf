/** @file
 *****************************************************************************

 Shared fixtures for the pricesnark tests

 *****************************************************************************/

#ifndef PRICESNARK_TEST_HELPERS_HPP_
#define PRICESNARK_TEST_HELPERS_HPP_

#include <cstdint>
#include <string>
#include <vector>

#include "libff/common/default_types/ec_pp.hpp"
#include "libsnark/gadgetlib1/protoboard.hpp"

#include "pricesnark/witness_builder.hpp"

typedef libff::default_ec_pp EcPP;
typedef libff::Fr<EcPP> FieldT;

struct test_quote {
    uint64_t price;
    uint64_t confidence;
    uint64_t timestamp;
};

inline libsnark::pb_variable_array<FieldT> allocate_values(libsnark::protoboard<FieldT> &pb,
                                                            const std::vector<uint64_t> &values,
                                                            const std::string &annotation)
{
    libsnark::pb_variable_array<FieldT> vars;
    vars.allocate(pb, values.size(), annotation);
    for (size_t i = 0; i < values.size(); ++i){
        pb.val(vars[i]) = field_from_ulong<FieldT>(values[i]);
    }
    return vars;
}

// keys are expensive to derive, tests share them
inline const ethsnarks::eddsa_keypair& test_key(size_t i)
{
    static std::vector<ethsnarks::eddsa_keypair> keys;
    while (keys.size() <= i){
        keys.push_back(generate_publisher_key());
    }
    return keys[i];
}

inline const ethsnarks::eddsa_keypair& padding_key()
{
    static const ethsnarks::eddsa_keypair key = generate_publisher_key();
    return key;
}

inline std::vector<signed_quote<FieldT>> sign_quotes(const std::vector<test_quote> &quotes)
{
    std::vector<signed_quote<FieldT>> result;
    for (size_t i = 0; i < quotes.size(); ++i){
        const QuoteVals<FieldT> q = make_quote<FieldT>(quotes[i].price, quotes[i].confidence, quotes[i].timestamp, quotes[i].timestamp);
        result.push_back(sign_quote(test_key(i), q));
    }
    return result;
}

inline aggregate_input<FieldT> make_test_input(size_t max_quotes, const std::vector<test_quote> &quotes, uint64_t fee=0)
{
    return make_aggregate_input(max_quotes, sign_quotes(quotes), field_from_ulong<FieldT>(fee), padding_key());
}

inline bool has_failure_in(const std::vector<unsatisfied_constraint> &failures, const std::string &group, long index)
{
    for (size_t i = 0; i < failures.size(); ++i){
        if (failures[i].group == group && failures[i].index == index){
            return true;
        }
    }
    return false;
}

#endif // PRICESNARK_TEST_HELPERS_HPP_
