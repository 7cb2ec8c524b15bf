/** @file
 *****************************************************************************

 price quote variables

 Values (FieldT) and protoboard variables for the private inputs of the
 aggregation circuit. Quote and price model inputs are stored column-wise,
 one fixed capacity array per field, padded with the sentinel value.

 *****************************************************************************/

#ifndef _QUOTE_VARIABLES_H
#define _QUOTE_VARIABLES_H

#include <iostream>
#include <vector>

#include <libff/common/serialization.hpp>

#include "libsnark/gadgetlib1/protoboard.hpp"
#include "libsnark/gadgetlib1/pb_variable.hpp"
#include "application/gadgets/utils.h"

using libsnark::pb_variable;
using libsnark::pb_variable_array;
using libsnark::protoboard;

enum price_model_operation {
    SUBTRACT_CONF = 0,
    PASSTHROUGH = 1,
    ADD_CONF = 2
};

template<typename FieldT>
struct QuoteVals {
    static const size_t NUM_VALS = 4;
    FieldT price;
    FieldT confidence;
    FieldT timestamp;
    FieldT observed_online;

    QuoteVals() = default;
    QuoteVals(std::vector<FieldT> fields){
        assert(fields.size() == NUM_VALS);
        this->price = fields[0];
        this->confidence = fields[1];
        this->timestamp = fields[2];
        this->observed_online = fields[3];
    }

    static QuoteVals padding();
};

template<typename FieldT>
struct QuoteVars {
    pb_variable<FieldT> price;
    pb_variable<FieldT> confidence;
    pb_variable<FieldT> timestamp;
    pb_variable<FieldT> observed_online;
};

template<typename FieldT>
struct QuoteColumns {
    pb_variable_array<FieldT> prices;
    pb_variable_array<FieldT> confidences;
    pb_variable_array<FieldT> timestamps;
    pb_variable_array<FieldT> observed_online;

    void allocate(protoboard<FieldT> &pb, size_t capacity, const std::string &annotation);
    void assign(protoboard<FieldT> &pb, const std::vector<QuoteVals<FieldT>> &quotes);
    QuoteVars<FieldT> slot(size_t i) const;
    size_t size() const;
};

/**
 * EdDSA signature of one quote, including the signer's public key A.
 * A and R are affine points on the embedded curve, S the scalar.
 * s_low is the low bit of S, kept as its own column so that padding
 * slots can carry the sentinel.
 */
template<typename FieldT>
struct SignatureVals {
    FieldT A_x;
    FieldT A_y;
    FieldT R_x;
    FieldT R_y;
    FieldT S;
    FieldT s_low;
};

template<typename FieldT>
struct PriceModelVals {
    static const size_t NUM_VALS = 3;
    FieldT price_index;
    FieldT conf_index;
    FieldT operation;

    PriceModelVals() = default;
    PriceModelVals(size_t price_index, size_t conf_index, price_model_operation operation) :
        price_index(FieldT(price_index)), conf_index(FieldT(conf_index)), operation(FieldT(operation)) {}

    static PriceModelVals padding();
};

template<typename FieldT>
struct PriceModelVars {
    pb_variable<FieldT> price_index;
    pb_variable<FieldT> conf_index;
    pb_variable<FieldT> operation;
};

template<typename FieldT>
struct PriceModelColumns {
    pb_variable_array<FieldT> price_indices;
    pb_variable_array<FieldT> conf_indices;
    pb_variable_array<FieldT> operations;

    void allocate(protoboard<FieldT> &pb, size_t capacity, const std::string &annotation);
    void assign(protoboard<FieldT> &pb, const std::vector<PriceModelVals<FieldT>> &entries);
    PriceModelVars<FieldT> entry(size_t j) const;
    size_t size() const;
};

/**
 * Quote as sent by a publisher: values plus signature
 */
template<typename FieldT>
struct signed_quote {
    QuoteVals<FieldT> quote;
    SignatureVals<FieldT> signature;
};

template<typename FieldT>
std::ostream& operator<<(std::ostream &out, const signed_quote<FieldT> &q);

template<typename FieldT>
std::istream& operator>>(std::istream &in, signed_quote<FieldT> &q);

#include "quote_variables.tcc"

#endif //_QUOTE_VARIABLES_H
