/** @file
 *****************************************************************************

 Implementation of interfaces for sort gadgets.

 See sort_gadgets.hpp

 *****************************************************************************/

#include <algorithm>
#include <numeric>

#include "sort_gadgets.hpp"

template<typename FieldT>
void monotonic_gadget<FieldT>::generate_r1cs_constraints()
{
    for (size_t i = 0; i < pairs.size(); ++i){
        pairs[i].generate_r1cs_constraints();
    }
}

template<typename FieldT>
void monotonic_gadget<FieldT>::generate_r1cs_witness()
{
    for (size_t i = 0; i < pairs.size(); ++i){
        pairs[i].generate_r1cs_witness();
    }
}

template<typename FieldT>
void sorted_permutation_gadget<FieldT>::generate_r1cs_constraints()
{
    const size_t m = inputs.size();

    for (size_t i = 0; i < m; ++i){
        for (size_t k = 0; k < m; ++k){
            libsnark::generate_boolean_r1cs_constraint<FieldT>(this->pb, permutation[i][k], FMT(this->annotation_prefix, ".bitness_%zu_%zu", i, k));
            this->pb.add_r1cs_constraint(libsnark::r1cs_constraint<FieldT>(permutation[i][k], inputs[i], products[i][k]),
                                         FMT(this->annotation_prefix, ".product_%zu_%zu", i, k));
        }
    }

    // one 1 per row and per column
    for (size_t i = 0; i < m; ++i){
        this->pb.add_r1cs_constraint(libsnark::r1cs_constraint<FieldT>(1, libsnark::pb_sum<FieldT>(permutation[i]), 1),
                                     FMT(this->annotation_prefix, ".row_%zu", i));
    }
    for (size_t k = 0; k < m; ++k){
        libsnark::linear_combination<FieldT> column;
        libsnark::linear_combination<FieldT> selected;
        for (size_t i = 0; i < m; ++i){
            column.add_term(permutation[i][k]);
            selected.add_term(products[i][k]);
        }
        this->pb.add_r1cs_constraint(libsnark::r1cs_constraint<FieldT>(1, column, 1), FMT(this->annotation_prefix, ".column_%zu", k));
        this->pb.add_r1cs_constraint(libsnark::r1cs_constraint<FieldT>(1, selected, outputs[k]), FMT(this->annotation_prefix, ".output_%zu", k));
    }

    monotonic->generate_r1cs_constraints();
}

template<typename FieldT>
void sorted_permutation_gadget<FieldT>::generate_r1cs_witness()
{
    const size_t m = inputs.size();
    std::vector<FieldT> in(m);

    for (size_t i = 0; i < m; ++i){
        inputs[i].evaluate(this->pb);
        in[i] = this->pb.lc_val(inputs[i]);
    }

    std::vector<size_t> order(m);
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(order.begin(), order.end(), [&in](size_t a, size_t b){
        return field_less(in[a], in[b]);
    });

    for (size_t i = 0; i < m; ++i){
        for (size_t k = 0; k < m; ++k){
            this->pb.val(permutation[i][k]) = FieldT::zero();
            this->pb.val(products[i][k]) = FieldT::zero();
        }
    }
    for (size_t k = 0; k < m; ++k){
        this->pb.val(permutation[order[k]][k]) = FieldT::one();
        this->pb.val(products[order[k]][k]) = in[order[k]];
        this->pb.val(outputs[k]) = in[order[k]];
    }

    monotonic->generate_r1cs_witness();
}
