/** @file
 *****************************************************************************

 Declaration of interfaces for price model gadgets

 The price model maps every quote to three comparable values (bid, mid, ask):
 each entry names a price slot, a confidence slot and an operation
   SUBTRACT_CONF:  price - conf
   PASSTHROUGH:    price
   ADD_CONF:       price + conf

 index_lookup_gadget: if enable is 1, output = table[index] and index < count,
 otherwise output = 0. index may hold any value if enable is 0.

 price_model_entry_gadget: evaluates one entry. Active entries yield the
 derived value, padding entries yield 2^(n)-1 so that they sort last.
 Price and confidence are looked up in the same slot. The derived value is
 range checked on n bits, a negative bid is rejected.

 slot_coverage_gadget: an active slot is referenced by exactly one entry per
 operation, a padding slot by none.

 price_model_gadget: evaluates all entries, checks the coverage of every
 slot and asserts that the derived values are sorted ascending
 *****************************************************************************/

#ifndef PRICE_MODEL_GADGET_H
#define PRICE_MODEL_GADGET_H

#include <memory>
#include <vector>

#include "libsnark/gadgetlib1/gadget.hpp"
#include "libsnark/gadgetlib1/protoboard.hpp"
#include "libsnark/gadgetlib1/gadgets/basic_gadgets.hpp"
#include "comp_gadgets.hpp"
#include "range_gadgets.hpp"
#include "sort_gadgets.hpp"
#include "quote_variables.hpp"

template<typename FieldT>
class index_lookup_gadget : public libsnark::gadget<FieldT> {
/**
 * Constraints
 * (1) sel[k] boolean
 * (2) sum sel[k] = enable
 * (3) enable * index = gated_index
 * (4) sum k * sel[k] = gated_index
 * (5) enable => gated_index < count
 * (6) output = sum sel[k] * table[k]
 */
private:
    libsnark::pb_variable_array<FieldT> products;
    std::shared_ptr<conditional_comparison_gadget<FieldT>> in_range;

public:
    libsnark::pb_variable_array<FieldT> sel;
    libsnark::pb_variable<FieldT> gated_index;
    const libsnark::pb_variable<FieldT> enable;
    const libsnark::pb_variable<FieldT> index;
    const libsnark::pb_variable<FieldT> count;
    const libsnark::pb_variable_array<FieldT> table;
    const libsnark::pb_variable<FieldT> output;

    index_lookup_gadget(libsnark::protoboard<FieldT>& pb,
                        const libsnark::pb_variable<FieldT> &enable,
                        const libsnark::pb_variable<FieldT> &index,
                        const libsnark::pb_variable<FieldT> &count,
                        const libsnark::pb_variable_array<FieldT> &table,
                        const libsnark::pb_variable<FieldT> &output,
                        const std::string &annotation_prefix="") :
            libsnark::gadget<FieldT>(pb, annotation_prefix), enable(enable), index(index), count(count),
            table(table), output(output)
    {
        sel.allocate(pb, table.size(), FMT(this->annotation_prefix, ".sel"));
        products.allocate(pb, table.size(), FMT(this->annotation_prefix, ".products"));
        gated_index.allocate(pb, FMT(this->annotation_prefix, ".gated_index"));

        in_range.reset(new conditional_comparison_gadget<FieldT>(pb, num_bits(table.size()) + 1, enable, gated_index, count, true,
                                                                 FMT(this->annotation_prefix, ".in_range")));
    };

    void generate_r1cs_constraints();
    void generate_r1cs_witness();
};

template<typename FieldT>
class price_model_entry_gadget : public libsnark::gadget<FieldT> {
private:
    libsnark::pb_variable<FieldT> price;
    libsnark::pb_variable<FieldT> conf;
    libsnark::pb_variable<FieldT> gated_operation;
    libsnark::pb_variable<FieldT> adjustment;
    std::shared_ptr<index_lookup_gadget<FieldT>> conf_lookup;
    std::shared_ptr<bit_range_gadget<FieldT>> range;

public:
    libsnark::pb_variable<FieldT> is_sub;
    libsnark::pb_variable<FieldT> is_pass;
    libsnark::pb_variable<FieldT> is_add;
    std::shared_ptr<index_lookup_gadget<FieldT>> price_lookup;
    const size_t n;
    const libsnark::pb_variable<FieldT> enable;
    const PriceModelVars<FieldT> entry;
    const libsnark::pb_variable<FieldT> derived;

    price_model_entry_gadget(libsnark::protoboard<FieldT>& pb,
                             const size_t n,
                             const libsnark::pb_variable<FieldT> &enable,
                             const PriceModelVars<FieldT> &entry,
                             const libsnark::pb_variable<FieldT> &count,
                             const libsnark::pb_variable_array<FieldT> &prices,
                             const libsnark::pb_variable_array<FieldT> &confidences,
                             const libsnark::pb_variable<FieldT> &derived,
                             const std::string &annotation_prefix="") :
            libsnark::gadget<FieldT>(pb, annotation_prefix), n(n), enable(enable), entry(entry), derived(derived)
    {
        price.allocate(pb, FMT(this->annotation_prefix, ".price"));
        conf.allocate(pb, FMT(this->annotation_prefix, ".conf"));
        is_sub.allocate(pb, FMT(this->annotation_prefix, ".is_sub"));
        is_pass.allocate(pb, FMT(this->annotation_prefix, ".is_pass"));
        is_add.allocate(pb, FMT(this->annotation_prefix, ".is_add"));
        gated_operation.allocate(pb, FMT(this->annotation_prefix, ".gated_operation"));
        adjustment.allocate(pb, FMT(this->annotation_prefix, ".adjustment"));

        price_lookup.reset(new index_lookup_gadget<FieldT>(pb, enable, entry.price_index, count, prices, price,
                                                           FMT(this->annotation_prefix, ".price_lookup")));
        conf_lookup.reset(new index_lookup_gadget<FieldT>(pb, enable, entry.conf_index, count, confidences, conf,
                                                          FMT(this->annotation_prefix, ".conf_lookup")));
        range.reset(new bit_range_gadget<FieldT>(pb, n, derived, FMT(this->annotation_prefix, ".range")));
    };

    void generate_r1cs_constraints();
    void generate_r1cs_witness();
};

template<typename FieldT>
class slot_coverage_gadget : public libsnark::gadget<FieldT> {
/**
 * sel[j]: entry j references the slot
 *
 * Constraints
 * (1) pass[j] = sel[j] * is_pass[j], add[j] = sel[j] * is_add[j]
 * (2) sum sel[j] = 3 * flag
 * (3) sum pass[j] = flag
 * (4) sum add[j] = flag
 *
 * every referencing entry is active and has exactly one operation, so the
 * remaining flag references are SUBTRACT_CONF
 */
private:
    libsnark::pb_variable_array<FieldT> pass;
    libsnark::pb_variable_array<FieldT> add;

public:
    const libsnark::pb_variable<FieldT> flag;
    const libsnark::pb_variable_array<FieldT> sel;
    const libsnark::pb_variable_array<FieldT> is_pass;
    const libsnark::pb_variable_array<FieldT> is_add;

    slot_coverage_gadget(libsnark::protoboard<FieldT>& pb,
                         const libsnark::pb_variable<FieldT> &flag,
                         const libsnark::pb_variable_array<FieldT> &sel,
                         const libsnark::pb_variable_array<FieldT> &is_pass,
                         const libsnark::pb_variable_array<FieldT> &is_add,
                         const std::string &annotation_prefix="") :
            libsnark::gadget<FieldT>(pb, annotation_prefix), flag(flag), sel(sel), is_pass(is_pass), is_add(is_add)
    {
        assert(sel.size() == is_pass.size() && sel.size() == is_add.size());
        pass.allocate(pb, sel.size(), FMT(this->annotation_prefix, ".pass"));
        add.allocate(pb, sel.size(), FMT(this->annotation_prefix, ".add"));
    };

    void generate_r1cs_constraints();
    void generate_r1cs_witness();
};

template<typename FieldT>
class price_model_gadget : public libsnark::gadget<FieldT> {
public:
    const size_t n;
    libsnark::pb_variable_array<FieldT> derived;
    std::vector<price_model_entry_gadget<FieldT>> entries;
    std::vector<slot_coverage_gadget<FieldT>> coverage;
    std::shared_ptr<monotonic_gadget<FieldT>> sorted;

    price_model_gadget(libsnark::protoboard<FieldT>& pb,
                       const size_t n,
                       const libsnark::pb_variable_array<FieldT> &slot_flags,
                       const libsnark::pb_variable_array<FieldT> &flags,
                       const PriceModelColumns<FieldT> &model,
                       const libsnark::pb_variable<FieldT> &count,
                       const libsnark::pb_variable_array<FieldT> &prices,
                       const libsnark::pb_variable_array<FieldT> &confidences,
                       const std::string &annotation_prefix="") :
            libsnark::gadget<FieldT>(pb, annotation_prefix), n(n)
    {
        assert(flags.size() == model.size());
        assert(slot_flags.size() == prices.size());
        derived.allocate(pb, model.size(), FMT(this->annotation_prefix, ".derived"));
        for (size_t j = 0; j < model.size(); ++j){
            entries.emplace_back(price_model_entry_gadget<FieldT>(pb, n, flags[j], model.entry(j), count, prices, confidences, derived[j],
                                                                  FMT(this->annotation_prefix, ".entry_%zu", j)));
        }

        libsnark::pb_variable_array<FieldT> is_pass;
        libsnark::pb_variable_array<FieldT> is_add;
        for (size_t j = 0; j < entries.size(); ++j){
            is_pass.emplace_back(entries[j].is_pass);
            is_add.emplace_back(entries[j].is_add);
        }
        for (size_t i = 0; i < slot_flags.size(); ++i){
            libsnark::pb_variable_array<FieldT> sel;
            for (size_t j = 0; j < entries.size(); ++j){
                sel.emplace_back(entries[j].price_lookup->sel[i]);
            }
            coverage.emplace_back(slot_coverage_gadget<FieldT>(pb, slot_flags[i], sel, is_pass, is_add,
                                                               FMT(this->annotation_prefix, ".coverage_%zu", i)));
        }
        sorted.reset(new monotonic_gadget<FieldT>(pb, n, libsnark::pb_linear_combination_array<FieldT>(derived),
                                                  FMT(this->annotation_prefix, ".sorted")));
    };

    void generate_r1cs_constraints();
    void generate_r1cs_witness();
};

#include "price_model_gadget.tcc"

#endif //PRICE_MODEL_GADGET_H
