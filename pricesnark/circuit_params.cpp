/** @file
 *****************************************************************************

 See circuit_params.hpp

 *****************************************************************************/

#include <algorithm>
#include <cctype>
#include <iostream>
#include <stdexcept>

#include "circuit_params.hpp"

void circuit_params::validate() const
{
    if (max_quotes == 0){
        throw std::invalid_argument("max_quotes must be at least 1");
    }
    if (timestamp_threshold == 0){
        throw std::invalid_argument("timestamp_threshold must be at least 1");
    }
    for (size_t i = 0; i < valid_pubkeys.size(); ++i){
        const std::string &k = valid_pubkeys[i];
        if (k.empty() || !std::all_of(k.begin(), k.end(), [](char c){ return std::isdigit(static_cast<unsigned char>(c)) != 0; })){
            throw std::invalid_argument("valid_pubkeys entry is not a decimal number: '" + k + "'");
        }
    }
}

std::ostream& operator<<(std::ostream &out, const circuit_params &params)
{
    out << "max_quotes=" << params.max_quotes
        << " timestamp_threshold=" << params.timestamp_threshold
        << " valid_pubkeys=" << params.valid_pubkeys.size();
    return out;
}
