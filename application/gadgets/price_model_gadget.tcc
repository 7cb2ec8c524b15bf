/** @file
 *****************************************************************************

 Implementation of interfaces for price model gadgets.

 See price_model_gadget.hpp

 *****************************************************************************/

#include "price_model_gadget.hpp"

template<typename FieldT>
void index_lookup_gadget<FieldT>::generate_r1cs_constraints()
{
    libsnark::linear_combination<FieldT> sel_sum;
    libsnark::linear_combination<FieldT> sel_position;
    libsnark::linear_combination<FieldT> selected;
    for (size_t k = 0; k < table.size(); ++k){
        libsnark::generate_boolean_r1cs_constraint<FieldT>(this->pb, sel[k], FMT(this->annotation_prefix, ".bitness_%zu", k));
        this->pb.add_r1cs_constraint(libsnark::r1cs_constraint<FieldT>(sel[k], table[k], products[k]), FMT(this->annotation_prefix, ".product_%zu", k));
        sel_sum.add_term(sel[k]);
        sel_position.add_term(sel[k], k);
        selected.add_term(products[k]);
    }

    this->pb.add_r1cs_constraint(libsnark::r1cs_constraint<FieldT>(1, sel_sum, enable), FMT(this->annotation_prefix, ".one_hot"));
    this->pb.add_r1cs_constraint(libsnark::r1cs_constraint<FieldT>(enable, index, gated_index), FMT(this->annotation_prefix, ".gate"));
    this->pb.add_r1cs_constraint(libsnark::r1cs_constraint<FieldT>(1, sel_position, gated_index), FMT(this->annotation_prefix, ".position"));
    this->pb.add_r1cs_constraint(libsnark::r1cs_constraint<FieldT>(1, selected, output), FMT(this->annotation_prefix, ".output"));

    in_range->generate_r1cs_constraints();
}

template<typename FieldT>
void index_lookup_gadget<FieldT>::generate_r1cs_witness()
{
    const FieldT e = this->pb.val(enable);
    const FieldT gated = e * this->pb.val(index);
    this->pb.val(gated_index) = gated;

    FieldT out = FieldT::zero();
    for (size_t k = 0; k < table.size(); ++k){
        if (!e.is_zero() && gated == FieldT(k)){
            this->pb.val(sel[k]) = FieldT::one();
            this->pb.val(products[k]) = this->pb.val(table[k]);
            out = this->pb.val(table[k]);
        }else{
            this->pb.val(sel[k]) = FieldT::zero();
            this->pb.val(products[k]) = FieldT::zero();
        }
    }
    this->pb.val(output) = out;

    in_range->generate_r1cs_witness();
}

template<typename FieldT>
void price_model_entry_gadget<FieldT>::generate_r1cs_constraints()
{
    price_lookup->generate_r1cs_constraints();
    conf_lookup->generate_r1cs_constraints();
    this->pb.add_r1cs_constraint(libsnark::r1cs_constraint<FieldT>(1, price_lookup->gated_index, conf_lookup->gated_index),
                                 FMT(this->annotation_prefix, ".same_slot"));

    libsnark::generate_boolean_r1cs_constraint<FieldT>(this->pb, is_sub, FMT(this->annotation_prefix, ".bitness_sub"));
    libsnark::generate_boolean_r1cs_constraint<FieldT>(this->pb, is_pass, FMT(this->annotation_prefix, ".bitness_pass"));
    libsnark::generate_boolean_r1cs_constraint<FieldT>(this->pb, is_add, FMT(this->annotation_prefix, ".bitness_add"));

    // exactly one operation on active entries, none on padding
    this->pb.add_r1cs_constraint(libsnark::r1cs_constraint<FieldT>(1, is_sub + is_pass + is_add, enable), FMT(this->annotation_prefix, ".one_hot"));
    this->pb.add_r1cs_constraint(libsnark::r1cs_constraint<FieldT>(enable, entry.operation, gated_operation), FMT(this->annotation_prefix, ".gate"));
    this->pb.add_r1cs_constraint(libsnark::r1cs_constraint<FieldT>(1, is_pass + 2 * is_add, gated_operation), FMT(this->annotation_prefix, ".operation"));

    // adjustment = (is_add - is_sub) * conf
    this->pb.add_r1cs_constraint(libsnark::r1cs_constraint<FieldT>(is_add - is_sub, conf, adjustment), FMT(this->annotation_prefix, ".adjustment"));

    // derived = price + adjustment + (1 - enable) * (2^n - 1)
    const FieldT pad = max_value_of_bits<FieldT>(n);
    this->pb.add_r1cs_constraint(libsnark::r1cs_constraint<FieldT>(1, price + adjustment + pad * libsnark::ONE - pad * enable, derived),
                                 FMT(this->annotation_prefix, ".derived"));

    range->generate_r1cs_constraints();
}

template<typename FieldT>
void price_model_entry_gadget<FieldT>::generate_r1cs_witness()
{
    price_lookup->generate_r1cs_witness();
    conf_lookup->generate_r1cs_witness();

    const FieldT e = this->pb.val(enable);
    const FieldT op = e * this->pb.val(entry.operation);
    this->pb.val(gated_operation) = op;

    this->pb.val(is_sub) = (!e.is_zero() && op == FieldT(SUBTRACT_CONF)) ? FieldT::one() : FieldT::zero();
    this->pb.val(is_pass) = (!e.is_zero() && op == FieldT(PASSTHROUGH)) ? FieldT::one() : FieldT::zero();
    this->pb.val(is_add) = (!e.is_zero() && op == FieldT(ADD_CONF)) ? FieldT::one() : FieldT::zero();

    this->pb.val(adjustment) = (this->pb.val(is_add) - this->pb.val(is_sub)) * this->pb.val(conf);

    if (e.is_zero()){
        this->pb.val(derived) = max_value_of_bits<FieldT>(n);
    }else{
        this->pb.val(derived) = this->pb.val(price) + this->pb.val(adjustment);
    }

    range->generate_r1cs_witness();
}

template<typename FieldT>
void slot_coverage_gadget<FieldT>::generate_r1cs_constraints()
{
    libsnark::linear_combination<FieldT> sel_sum;
    libsnark::linear_combination<FieldT> pass_sum;
    libsnark::linear_combination<FieldT> add_sum;
    for (size_t j = 0; j < sel.size(); ++j){
        this->pb.add_r1cs_constraint(libsnark::r1cs_constraint<FieldT>(sel[j], is_pass[j], pass[j]), FMT(this->annotation_prefix, ".pass_%zu", j));
        this->pb.add_r1cs_constraint(libsnark::r1cs_constraint<FieldT>(sel[j], is_add[j], add[j]), FMT(this->annotation_prefix, ".add_%zu", j));
        sel_sum.add_term(sel[j]);
        pass_sum.add_term(pass[j]);
        add_sum.add_term(add[j]);
    }

    this->pb.add_r1cs_constraint(libsnark::r1cs_constraint<FieldT>(1, sel_sum, 3 * flag), FMT(this->annotation_prefix, ".entries"));
    this->pb.add_r1cs_constraint(libsnark::r1cs_constraint<FieldT>(1, pass_sum, flag), FMT(this->annotation_prefix, ".passthrough"));
    this->pb.add_r1cs_constraint(libsnark::r1cs_constraint<FieldT>(1, add_sum, flag), FMT(this->annotation_prefix, ".add_conf"));
}

template<typename FieldT>
void slot_coverage_gadget<FieldT>::generate_r1cs_witness()
{
    for (size_t j = 0; j < sel.size(); ++j){
        this->pb.val(pass[j]) = this->pb.val(sel[j]) * this->pb.val(is_pass[j]);
        this->pb.val(add[j]) = this->pb.val(sel[j]) * this->pb.val(is_add[j]);
    }
}

template<typename FieldT>
void price_model_gadget<FieldT>::generate_r1cs_constraints()
{
    for (size_t j = 0; j < entries.size(); ++j){
        entries[j].generate_r1cs_constraints();
    }
    for (size_t i = 0; i < coverage.size(); ++i){
        coverage[i].generate_r1cs_constraints();
    }
    sorted->generate_r1cs_constraints();
}

template<typename FieldT>
void price_model_gadget<FieldT>::generate_r1cs_witness()
{
    for (size_t j = 0; j < entries.size(); ++j){
        entries[j].generate_r1cs_witness();
    }
    for (size_t i = 0; i < coverage.size(); ++i){
        coverage[i].generate_r1cs_witness();
    }
    sorted->generate_r1cs_witness();
}
