/** @file
 *****************************************************************************

 Construction parameters of the aggregation circuit

 max_quotes: capacity of all quote arrays (Max), at least 1
 timestamp_threshold: staleness window relative to the median timestamp,
 1 <= threshold <= 2^64 - 1
 valid_pubkeys: x-coordinates (decimal) of the registered publisher keys.
 They are not constrained by the circuit, the prover only reports quotes
 signed by unknown keys.

 *****************************************************************************/

#ifndef PRICESNARK_CIRCUIT_PARAMS_HPP_
#define PRICESNARK_CIRCUIT_PARAMS_HPP_

#include <cstdint>
#include <iostream>
#include <string>
#include <vector>

#include <libff/algebra/field_utils/bigint.hpp>

struct circuit_params {
    size_t max_quotes;
    uint64_t timestamp_threshold;
    std::vector<std::string> valid_pubkeys;

    circuit_params() : max_quotes(0), timestamp_threshold(0) {}
    circuit_params(size_t max_quotes, uint64_t timestamp_threshold,
                   const std::vector<std::string> &valid_pubkeys=std::vector<std::string>()) :
        max_quotes(max_quotes), timestamp_threshold(timestamp_threshold), valid_pubkeys(valid_pubkeys) {}

    /**
     * throws std::invalid_argument
     */
    void validate() const;

    /**
     * true if valid_pubkeys is empty or lists A_x
     */
    template<typename FieldT>
    bool accepts_pubkey(const FieldT &A_x) const;
};

std::ostream& operator<<(std::ostream &out, const circuit_params &params);

template<typename FieldT>
bool circuit_params::accepts_pubkey(const FieldT &A_x) const
{
    if (valid_pubkeys.empty()){
        return true;
    }
    for (size_t i = 0; i < valid_pubkeys.size(); ++i){
        if (FieldT(libff::bigint<FieldT::num_limbs>(valid_pubkeys[i].c_str())) == A_x){
            return true;
        }
    }
    return false;
}

#endif // PRICESNARK_CIRCUIT_PARAMS_HPP_
