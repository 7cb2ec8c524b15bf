/** @file
 *****************************************************************************

 Declaration of interfaces for quote encoder gadget

 quote_encoder_gadget: range checks all attributes of one quote slot on 64
 bits (after masking with the slot's active flag) and forms the signed
 message

   message = price + 2^64 * confidence

 which is the 128 bit string bits(price) || bits(confidence), least
 significant bit first, packed into one field element
 *****************************************************************************/

#ifndef QUOTE_ENCODER_GADGET_H
#define QUOTE_ENCODER_GADGET_H

#include <memory>

#include "libsnark/gadgetlib1/gadget.hpp"
#include "libsnark/gadgetlib1/protoboard.hpp"
#include "range_gadgets.hpp"
#include "quote_variables.hpp"

template<typename FieldT>
class quote_encoder_gadget : public libsnark::gadget<FieldT> {
public:
    static const size_t VALUE_BITS = 64;

    const libsnark::pb_variable<FieldT> flag;
    const QuoteVars<FieldT> quote;
    libsnark::pb_variable<FieldT> message;

    std::shared_ptr<bit_encoder_gadget<FieldT>> price;
    std::shared_ptr<bit_encoder_gadget<FieldT>> confidence;
    std::shared_ptr<bit_encoder_gadget<FieldT>> timestamp;
    std::shared_ptr<bit_encoder_gadget<FieldT>> observed_online;

    quote_encoder_gadget(libsnark::protoboard<FieldT>& pb,
                         const libsnark::pb_variable<FieldT> &flag,
                         const QuoteVars<FieldT> &quote,
                         const std::string &annotation_prefix="") :
            libsnark::gadget<FieldT>(pb, annotation_prefix), flag(flag), quote(quote)
    {
        message.allocate(pb, FMT(this->annotation_prefix, ".message"));

        price.reset(new bit_encoder_gadget<FieldT>(pb, VALUE_BITS, flag, quote.price, FMT(this->annotation_prefix, ".price")));
        confidence.reset(new bit_encoder_gadget<FieldT>(pb, VALUE_BITS, flag, quote.confidence, FMT(this->annotation_prefix, ".confidence")));
        timestamp.reset(new bit_encoder_gadget<FieldT>(pb, VALUE_BITS, flag, quote.timestamp, FMT(this->annotation_prefix, ".timestamp")));
        observed_online.reset(new bit_encoder_gadget<FieldT>(pb, VALUE_BITS, flag, quote.observed_online, FMT(this->annotation_prefix, ".observed_online")));
    };

    void generate_r1cs_constraints();
    void generate_r1cs_witness();
};

#include "quote_encoder_gadget.tcc"

#endif //QUOTE_ENCODER_GADGET_H
