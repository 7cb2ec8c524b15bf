/** @file
 *****************************************************************************

 Implementation of interfaces for the price aggregation gadget.

 See aggregate_gadget.hpp .

 *****************************************************************************/

#include "aggregate_gadget.hpp"

template<typename FieldT>
const size_t aggregate_outputs<FieldT>::NUM_VALS;

template<typename FieldT>
std::vector<FieldT> aggregate_outputs<FieldT>::as_primary_input() const
{
    return {p25, p50, p75, confidence, fee};
}

template<typename FieldT>
aggregate_outputs<FieldT> aggregate_outputs<FieldT>::from_primary_input(const std::vector<FieldT> &input)
{
    if (input.size() != NUM_VALS){
        throw std::invalid_argument("primary input must hold " + std::to_string(NUM_VALS) + " values");
    }
    aggregate_outputs<FieldT> outputs;
    outputs.p25 = input[0];
    outputs.p50 = input[1];
    outputs.p75 = input[2];
    outputs.confidence = input[3];
    outputs.fee = input[4];
    return outputs;
}

template<typename FieldT>
bool aggregate_outputs<FieldT>::operator==(const aggregate_outputs<FieldT> &other) const
{
    return p25 == other.p25 && p50 == other.p50 && p75 == other.p75 &&
           confidence == other.confidence && fee == other.fee;
}

template<typename FieldT>
std::ostream& operator<<(std::ostream &out, const aggregate_outputs<FieldT> &outputs)
{
    out << outputs.p25 << OUTPUT_NEWLINE;
    out << outputs.p50 << OUTPUT_NEWLINE;
    out << outputs.p75 << OUTPUT_NEWLINE;
    out << outputs.confidence << OUTPUT_NEWLINE;
    out << outputs.fee << OUTPUT_NEWLINE;
    return out;
}

template<typename FieldT>
std::istream& operator>>(std::istream &in, aggregate_outputs<FieldT> &outputs)
{
    in >> outputs.p25;
    libff::consume_OUTPUT_NEWLINE(in);
    in >> outputs.p50;
    libff::consume_OUTPUT_NEWLINE(in);
    in >> outputs.p75;
    libff::consume_OUTPUT_NEWLINE(in);
    in >> outputs.confidence;
    libff::consume_OUTPUT_NEWLINE(in);
    in >> outputs.fee;
    libff::consume_OUTPUT_NEWLINE(in);
    return in;
}

template<typename FieldT>
price_aggregate_gadget<FieldT>::price_aggregate_gadget(diagnostic_protoboard<FieldT> &pb,
                                                       const circuit_params &params,
                                                       const libsnark::pb_variable<FieldT> &p25,
                                                       const libsnark::pb_variable<FieldT> &p50,
                                                       const libsnark::pb_variable<FieldT> &p75,
                                                       const libsnark::pb_variable<FieldT> &confidence,
                                                       const libsnark::pb_variable<FieldT> &fee_out,
                                                       const std::string &annotation_prefix) :
        libsnark::gadget<FieldT>(pb, annotation_prefix), dpb(pb), params(params),
        p25(p25), p50(p50), p75(p75), confidence(confidence), fee_out(fee_out)
{
    params.validate();
    const size_t max = params.max_quotes;

    active_count.allocate(pb, FMT(this->annotation_prefix, ".active_count"));
    quotes.allocate(pb, max, FMT(this->annotation_prefix, ".quotes"));
    s_low.allocate(pb, max, FMT(this->annotation_prefix, ".s_low"));
    price_model.allocate(pb, 3 * max, FMT(this->annotation_prefix, ".price_model"));
    fee.allocate(pb, FMT(this->annotation_prefix, ".fee"));

    active.reset(new active_count_gadget<FieldT>(pb, max, active_count, FMT(this->annotation_prefix, ".active")));
    const libsnark::pb_variable_array<FieldT> &flags = active->flags;
    const libsnark::pb_variable_array<FieldT> entry_flags = active->expanded_flags(3);

    libsnark::pb_variable_array<FieldT> masked_prices;
    libsnark::pb_variable_array<FieldT> masked_confidences;
    libsnark::pb_variable_array<FieldT> masked_timestamps;
    for (size_t i = 0; i < max; ++i){
        encoders.emplace_back(quote_encoder_gadget<FieldT>(pb, flags[i], quotes.slot(i), FMT(this->annotation_prefix, ".encoder_%zu", i)));
        masked_prices.emplace_back(encoders[i].price->masked);
        masked_confidences.emplace_back(encoders[i].confidence->masked);
        masked_timestamps.emplace_back(encoders[i].timestamp->masked);
    }
    for (size_t i = 0; i < max; ++i){
        signatures.emplace_back(new quote_signature_gadget<FieldT>(pb, flags[i], encoders[i].message, s_low[i],
                                                                   FMT(this->annotation_prefix, ".signature_%zu", i)));
    }

    add_well_formedness("prices", flags, quotes.prices);
    add_well_formedness("confidences", flags, quotes.confidences);
    add_well_formedness("timestamps", flags, quotes.timestamps);
    add_well_formedness("observed_online", flags, quotes.observed_online);
    add_well_formedness("s_low", flags, s_low);
    add_well_formedness("price_index", entry_flags, price_model.price_indices);
    add_well_formedness("conf_index", entry_flags, price_model.conf_indices);
    add_well_formedness("operation", entry_flags, price_model.operations);

    timestamps.reset(new timestamp_consistency_gadget<FieldT>(pb, params.timestamp_threshold, flags, masked_timestamps, active_count,
                                                              FMT(this->annotation_prefix, ".timestamps")));

    model.reset(new price_model_gadget<FieldT>(pb, DERIVED_BITS, flags, entry_flags, price_model, active_count, masked_prices, masked_confidences,
                                               FMT(this->annotation_prefix, ".model")));

    // sortedness of the derived values is established by the price model
    libsnark::pb_linear_combination<FieldT> derived_count;
    derived_count.assign(pb, 3 * active_count);
    aggregation.reset(new percentile_gadget<FieldT>(pb, DERIVED_BITS, libsnark::pb_linear_combination_array<FieldT>(model->derived),
                                                    derived_count, p25, p50, p75, false,
                                                    FMT(this->annotation_prefix, ".aggregation")));

    width.reset(new confidence_gadget<FieldT>(pb, DERIVED_BITS, p25, p50, p75, confidence, FMT(this->annotation_prefix, ".confidence")));
}

template<typename FieldT>
void price_aggregate_gadget<FieldT>::add_well_formedness(const std::string &name,
                                                         const libsnark::pb_variable_array<FieldT> &flags,
                                                         const libsnark::pb_variable_array<FieldT> &values)
{
    std::shared_ptr<well_formedness_gadget<FieldT>> g(new well_formedness_gadget<FieldT>(this->pb, flags, values,
                                                                                         FMT(this->annotation_prefix, ".well_formedness_%s", name.c_str())));
    well_formedness.push_back(std::make_pair(name, g));
}

template<typename FieldT>
void price_aggregate_gadget<FieldT>::generate_r1cs_constraints()
{
    dpb.begin_scope("active_count");
    active->generate_r1cs_constraints();
    dpb.end_scope();

    for (size_t i = 0; i < encoders.size(); ++i){
        dpb.begin_scope("encoding", i);
        encoders[i].generate_r1cs_constraints();
        dpb.end_scope();
    }

    for (size_t i = 0; i < signatures.size(); ++i){
        dpb.begin_scope("signature", i);
        signatures[i]->generate_r1cs_constraints();
        dpb.end_scope();
    }

    for (size_t w = 0; w < well_formedness.size(); ++w){
        const std::string group = "well_formedness." + well_formedness[w].first;
        std::vector<sentinel_check_gadget<FieldT>> &checks = well_formedness[w].second->checks;
        for (size_t i = 0; i < checks.size(); ++i){
            dpb.begin_scope(group, i);
            checks[i].generate_r1cs_constraints();
            dpb.end_scope();
        }
    }

    dpb.begin_scope("timestamp_median");
    timestamps->generate_median_r1cs_constraints();
    dpb.end_scope();

    for (size_t i = 0; i < timestamps->not_after_median.size(); ++i){
        dpb.begin_scope("staleness", i);
        timestamps->not_after_median[i].generate_r1cs_constraints();
        timestamps->within_threshold[i].generate_r1cs_constraints();
        dpb.end_scope();
    }

    for (size_t j = 0; j < model->entries.size(); ++j){
        dpb.begin_scope("price_model", j);
        model->entries[j].generate_r1cs_constraints();
        dpb.end_scope();
    }

    for (size_t i = 0; i < model->coverage.size(); ++i){
        dpb.begin_scope("price_model_coverage", i);
        model->coverage[i].generate_r1cs_constraints();
        dpb.end_scope();
    }

    for (size_t j = 0; j < model->sorted->pairs.size(); ++j){
        dpb.begin_scope("sortedness", j);
        model->sorted->pairs[j].generate_r1cs_constraints();
        dpb.end_scope();
    }

    dpb.begin_scope("aggregation");
    aggregation->generate_r1cs_constraints();
    dpb.end_scope();

    dpb.begin_scope("confidence");
    width->generate_r1cs_constraints();
    dpb.end_scope();

    dpb.begin_scope("fee");
    this->pb.add_r1cs_constraint(libsnark::r1cs_constraint<FieldT>(1, fee, fee_out), FMT(this->annotation_prefix, ".fee"));
    dpb.end_scope();
}

template<typename FieldT>
void price_aggregate_gadget<FieldT>::generate_r1cs_witness(const aggregate_input<FieldT> &input)
{
    const size_t max = params.max_quotes;
    if (input.quotes.size() != max || input.signatures.size() != max || input.price_model.size() != 3 * max){
        throw std::invalid_argument("aggregate input does not match the circuit capacity");
    }

    this->pb.val(active_count) = input.active_count;
    quotes.assign(this->pb, input.quotes);
    for (size_t i = 0; i < max; ++i){
        this->pb.val(s_low[i]) = input.signatures[i].s_low;
    }
    price_model.assign(this->pb, input.price_model);
    this->pb.val(fee) = input.fee;

    active->generate_r1cs_witness();
    for (size_t i = 0; i < max; ++i){
        encoders[i].generate_r1cs_witness();
    }
    for (size_t i = 0; i < max; ++i){
        signatures[i]->generate_r1cs_witness(input.signatures[i]);
    }
    for (size_t w = 0; w < well_formedness.size(); ++w){
        well_formedness[w].second->generate_r1cs_witness();
    }
    timestamps->generate_r1cs_witness();
    model->generate_r1cs_witness();
    aggregation->generate_r1cs_witness();
    width->generate_r1cs_witness();
    this->pb.val(fee_out) = input.fee;
}
