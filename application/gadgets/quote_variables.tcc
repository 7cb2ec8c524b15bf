/** @file
 *****************************************************************************

 See quote_variables.hpp

 *****************************************************************************/

#include "quote_variables.hpp"

template<typename FieldT>
QuoteVals<FieldT> QuoteVals<FieldT>::padding()
{
    QuoteVals<FieldT> q;
    q.price = sentinel_value<FieldT>();
    q.confidence = sentinel_value<FieldT>();
    q.timestamp = sentinel_value<FieldT>();
    q.observed_online = sentinel_value<FieldT>();
    return q;
}

template<typename FieldT>
void QuoteColumns<FieldT>::allocate(protoboard<FieldT> &pb, size_t capacity, const std::string &annotation)
{
    prices.allocate(pb, capacity, FMT(annotation, ".prices"));
    confidences.allocate(pb, capacity, FMT(annotation, ".confidences"));
    timestamps.allocate(pb, capacity, FMT(annotation, ".timestamps"));
    observed_online.allocate(pb, capacity, FMT(annotation, ".observed_online"));
}

template<typename FieldT>
void QuoteColumns<FieldT>::assign(protoboard<FieldT> &pb, const std::vector<QuoteVals<FieldT>> &quotes)
{
    assert(quotes.size() == size());
    for (size_t i = 0; i < quotes.size(); ++i){
        pb.val(prices[i]) = quotes[i].price;
        pb.val(confidences[i]) = quotes[i].confidence;
        pb.val(timestamps[i]) = quotes[i].timestamp;
        pb.val(observed_online[i]) = quotes[i].observed_online;
    }
}

template<typename FieldT>
QuoteVars<FieldT> QuoteColumns<FieldT>::slot(size_t i) const
{
    QuoteVars<FieldT> v;
    v.price = prices[i];
    v.confidence = confidences[i];
    v.timestamp = timestamps[i];
    v.observed_online = observed_online[i];
    return v;
}

template<typename FieldT>
size_t QuoteColumns<FieldT>::size() const
{
    return prices.size();
}

template<typename FieldT>
PriceModelVals<FieldT> PriceModelVals<FieldT>::padding()
{
    PriceModelVals<FieldT> e;
    e.price_index = sentinel_value<FieldT>();
    e.conf_index = sentinel_value<FieldT>();
    e.operation = sentinel_value<FieldT>();
    return e;
}

template<typename FieldT>
void PriceModelColumns<FieldT>::allocate(protoboard<FieldT> &pb, size_t capacity, const std::string &annotation)
{
    price_indices.allocate(pb, capacity, FMT(annotation, ".price_indices"));
    conf_indices.allocate(pb, capacity, FMT(annotation, ".conf_indices"));
    operations.allocate(pb, capacity, FMT(annotation, ".operations"));
}

template<typename FieldT>
void PriceModelColumns<FieldT>::assign(protoboard<FieldT> &pb, const std::vector<PriceModelVals<FieldT>> &entries)
{
    assert(entries.size() == size());
    for (size_t j = 0; j < entries.size(); ++j){
        pb.val(price_indices[j]) = entries[j].price_index;
        pb.val(conf_indices[j]) = entries[j].conf_index;
        pb.val(operations[j]) = entries[j].operation;
    }
}

template<typename FieldT>
PriceModelVars<FieldT> PriceModelColumns<FieldT>::entry(size_t j) const
{
    PriceModelVars<FieldT> v;
    v.price_index = price_indices[j];
    v.conf_index = conf_indices[j];
    v.operation = operations[j];
    return v;
}

template<typename FieldT>
size_t PriceModelColumns<FieldT>::size() const
{
    return price_indices.size();
}

template<typename FieldT>
std::ostream& operator<<(std::ostream &out, const signed_quote<FieldT> &q)
{
    out << q.quote.price << OUTPUT_NEWLINE;
    out << q.quote.confidence << OUTPUT_NEWLINE;
    out << q.quote.timestamp << OUTPUT_NEWLINE;
    out << q.quote.observed_online << OUTPUT_NEWLINE;
    out << q.signature.A_x << OUTPUT_NEWLINE;
    out << q.signature.A_y << OUTPUT_NEWLINE;
    out << q.signature.R_x << OUTPUT_NEWLINE;
    out << q.signature.R_y << OUTPUT_NEWLINE;
    out << q.signature.S << OUTPUT_NEWLINE;
    out << q.signature.s_low << OUTPUT_NEWLINE;
    return out;
}

template<typename FieldT>
std::istream& operator>>(std::istream &in, signed_quote<FieldT> &q)
{
    in >> q.quote.price;
    libff::consume_OUTPUT_NEWLINE(in);
    in >> q.quote.confidence;
    libff::consume_OUTPUT_NEWLINE(in);
    in >> q.quote.timestamp;
    libff::consume_OUTPUT_NEWLINE(in);
    in >> q.quote.observed_online;
    libff::consume_OUTPUT_NEWLINE(in);
    in >> q.signature.A_x;
    libff::consume_OUTPUT_NEWLINE(in);
    in >> q.signature.A_y;
    libff::consume_OUTPUT_NEWLINE(in);
    in >> q.signature.R_x;
    libff::consume_OUTPUT_NEWLINE(in);
    in >> q.signature.R_y;
    libff::consume_OUTPUT_NEWLINE(in);
    in >> q.signature.S;
    libff::consume_OUTPUT_NEWLINE(in);
    in >> q.signature.s_low;
    libff::consume_OUTPUT_NEWLINE(in);
    return in;
}
