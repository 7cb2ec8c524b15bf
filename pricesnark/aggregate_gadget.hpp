/** @file
 *****************************************************************************

 Declaration of interfaces for the price aggregation gadget

 price_aggregate_gadget wires all checks of the aggregation circuit:

   active count  -> per slot flags
   encoding      -> 64 bit range checks, signed message per slot
   signature     -> EdDSA/poseidon over the message, per slot
   well-formedness of every input array (sentinel padding)
   timestamp median and staleness of every active timestamp
   price model   -> derived values, sorted ascending
   aggregation   -> p25, p50, p75 of the derived values
   confidence    -> max(p50 - p25, p75 - p50)
   fee           -> passed through

 All constraints are generated inside diagnostic scopes, so a failing
 witness can be traced back to a group and slot, entry or pair index.
 *****************************************************************************/

#ifndef PRICESNARK_AGGREGATE_GADGET_HPP_
#define PRICESNARK_AGGREGATE_GADGET_HPP_

#include <memory>
#include <vector>

#include "libsnark/gadgetlib1/gadget.hpp"

#include "application/gadgets/quote_variables.hpp"
#include "application/gadgets/quote_encoder_gadget.hpp"
#include "application/gadgets/well_formedness_gadget.hpp"
#include "application/gadgets/timestamp_gadget.hpp"
#include "application/gadgets/price_model_gadget.hpp"
#include "application/gadgets/percentile_gadget.hpp"
#include "application/gadgets/confidence_gadget.hpp"
#include "diagnostic_protoboard.hpp"
#include "signature_gadget.hpp"
#include "circuit_params.hpp"

/**
 * Private input of the aggregation circuit, padded to capacity
 * quotes, signatures: max_quotes entries
 * price_model: 3 * max_quotes entries
 */
template<typename FieldT>
struct aggregate_input {
    FieldT active_count;
    std::vector<QuoteVals<FieldT>> quotes;
    std::vector<SignatureVals<FieldT>> signatures;
    std::vector<PriceModelVals<FieldT>> price_model;
    FieldT fee;
};

/**
 * Public output of the aggregation circuit, in primary input order
 */
template<typename FieldT>
struct aggregate_outputs {
    static const size_t NUM_VALS = 5;
    FieldT p25;
    FieldT p50;
    FieldT p75;
    FieldT confidence;
    FieldT fee;

    std::vector<FieldT> as_primary_input() const;
    static aggregate_outputs from_primary_input(const std::vector<FieldT> &input);
    bool operator==(const aggregate_outputs &other) const;
};

template<typename FieldT>
std::ostream& operator<<(std::ostream &out, const aggregate_outputs<FieldT> &outputs);

template<typename FieldT>
std::istream& operator>>(std::istream &in, aggregate_outputs<FieldT> &outputs);

template<typename FieldT>
class price_aggregate_gadget : public libsnark::gadget<FieldT> {
public:
    // bits of a derived value: price + conf < 2^65
    static const size_t DERIVED_BITS = 65;

    diagnostic_protoboard<FieldT> &dpb;
    const circuit_params params;

    // private inputs
    libsnark::pb_variable<FieldT> active_count;
    QuoteColumns<FieldT> quotes;
    libsnark::pb_variable_array<FieldT> s_low;
    PriceModelColumns<FieldT> price_model;
    libsnark::pb_variable<FieldT> fee;

    // public outputs
    const libsnark::pb_variable<FieldT> p25;
    const libsnark::pb_variable<FieldT> p50;
    const libsnark::pb_variable<FieldT> p75;
    const libsnark::pb_variable<FieldT> confidence;
    const libsnark::pb_variable<FieldT> fee_out;

    std::shared_ptr<active_count_gadget<FieldT>> active;
    std::vector<quote_encoder_gadget<FieldT>> encoders;
    // not copyable, the eddsa gadget refers to members of the signature gadget
    std::vector<std::shared_ptr<quote_signature_gadget<FieldT>>> signatures;
    std::vector<std::pair<std::string, std::shared_ptr<well_formedness_gadget<FieldT>>>> well_formedness;
    std::shared_ptr<timestamp_consistency_gadget<FieldT>> timestamps;
    std::shared_ptr<price_model_gadget<FieldT>> model;
    std::shared_ptr<percentile_gadget<FieldT>> aggregation;
    std::shared_ptr<confidence_gadget<FieldT>> width;

    price_aggregate_gadget(diagnostic_protoboard<FieldT> &pb,
                           const circuit_params &params,
                           const libsnark::pb_variable<FieldT> &p25,
                           const libsnark::pb_variable<FieldT> &p50,
                           const libsnark::pb_variable<FieldT> &p75,
                           const libsnark::pb_variable<FieldT> &confidence,
                           const libsnark::pb_variable<FieldT> &fee_out,
                           const std::string &annotation_prefix="");

    void generate_r1cs_constraints();
    void generate_r1cs_witness(const aggregate_input<FieldT> &input);

private:
    void add_well_formedness(const std::string &name,
                             const libsnark::pb_variable_array<FieldT> &flags,
                             const libsnark::pb_variable_array<FieldT> &values);
};

#include "aggregate_gadget.tcc"

#endif // PRICESNARK_AGGREGATE_GADGET_HPP_
