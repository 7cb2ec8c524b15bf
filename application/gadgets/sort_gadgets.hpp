/** @file
 *****************************************************************************

 Declaration of interfaces for sort gadgets

 monotonic_gadget: asserts values[i] <= values[i+1] for all pairs, every
 value is expected in [0, 2^n)

 sorted_permutation_gadget: proves that outputs is inputs sorted ascending.
 A boolean permutation matrix with exactly one 1 per row and per column maps
 input i to output position k, outputs are then checked to be monotonic.
 *****************************************************************************/

#ifndef SORT_GADGETS_H
#define SORT_GADGETS_H

#include <vector>

#include "libsnark/gadgetlib1/gadget.hpp"
#include "libsnark/gadgetlib1/protoboard.hpp"
#include "libsnark/gadgetlib1/gadgets/basic_gadgets.hpp"
#include "comp_gadgets.hpp"
#include "utils.h"

template<typename FieldT>
class monotonic_gadget : public libsnark::gadget<FieldT> {
public:
    const size_t n;
    const libsnark::pb_linear_combination_array<FieldT> values;
    std::vector<conditional_comparison_gadget<FieldT>> pairs;

    monotonic_gadget(libsnark::protoboard<FieldT>& pb,
                     const size_t n,
                     const libsnark::pb_linear_combination_array<FieldT> &values,
                     const std::string &annotation_prefix="") :
            libsnark::gadget<FieldT>(pb, annotation_prefix), n(n), values(values)
    {
        const libsnark::pb_variable<FieldT> one(0);
        for (size_t i = 0; i + 1 < values.size(); ++i){
            pairs.emplace_back(conditional_comparison_gadget<FieldT>(pb, n, one, values[i], values[i+1], false,
                                                                     FMT(this->annotation_prefix, ".pair_%zu", i)));
        }
    };

    void generate_r1cs_constraints();
    void generate_r1cs_witness();
};

template<typename FieldT>
class sorted_permutation_gadget : public libsnark::gadget<FieldT> {
private:
    // permutation[i][k] = 1 iff inputs[i] is moved to outputs[k]
    std::vector<libsnark::pb_variable_array<FieldT>> permutation;
    std::vector<libsnark::pb_variable_array<FieldT>> products;
    std::shared_ptr<monotonic_gadget<FieldT>> monotonic;

public:
    const size_t n;
    const libsnark::pb_linear_combination_array<FieldT> inputs;
    const libsnark::pb_variable_array<FieldT> outputs;

    sorted_permutation_gadget(libsnark::protoboard<FieldT>& pb,
                              const size_t n,
                              const libsnark::pb_linear_combination_array<FieldT> &inputs,
                              const libsnark::pb_variable_array<FieldT> &outputs,
                              const std::string &annotation_prefix="") :
            libsnark::gadget<FieldT>(pb, annotation_prefix), n(n), inputs(inputs), outputs(outputs)
    {
        assert(inputs.size() == outputs.size());
        permutation.resize(inputs.size());
        products.resize(inputs.size());
        for (size_t i = 0; i < inputs.size(); ++i){
            permutation[i].allocate(pb, inputs.size(), FMT(this->annotation_prefix, ".permutation_%zu", i));
            products[i].allocate(pb, inputs.size(), FMT(this->annotation_prefix, ".products_%zu", i));
        }
        monotonic.reset(new monotonic_gadget<FieldT>(pb, n, libsnark::pb_linear_combination_array<FieldT>(outputs),
                                                     FMT(this->annotation_prefix, ".monotonic")));
    };

    void generate_r1cs_constraints();
    void generate_r1cs_witness();
};

#include "sort_gadgets.tcc"

#endif //SORT_GADGETS_H
