/** @file
 *****************************************************************************

 Declaration of interfaces for comparison gadgets

 Provides additional comparison gadgets including:

 conditional_comparison_gadget: asserts A < B (strict) or A <= B, but only
 if enable is 1. enable is expected to be constrained to {0, 1}

 max_gadget: outputs the larger of two values, selected by the boolean
 result of a comparison

 Both gadgets require 0 <= A, B < 2^n, range checks are up to the caller
 *****************************************************************************/

#ifndef COMP_GADGETS_H
#define COMP_GADGETS_H

#include <memory>

#include "libsnark/gadgetlib1/gadget.hpp"
#include "libsnark/gadgetlib1/protoboard.hpp"
#include "libsnark/gadgetlib1/gadgets/basic_gadgets.hpp"
#include "utils.h"

template<typename FieldT>
class conditional_comparison_gadget : public libsnark::gadget<FieldT> {
private:
    libsnark::pb_variable<FieldT> less;
    libsnark::pb_variable<FieldT> less_or_eq;
    std::shared_ptr<libsnark::comparison_gadget<FieldT> > comp;

public:
    const size_t n;
    const bool strict;
    const libsnark::pb_linear_combination<FieldT> enable;
    const libsnark::pb_linear_combination<FieldT> A;
    const libsnark::pb_linear_combination<FieldT> B;

    conditional_comparison_gadget(libsnark::protoboard<FieldT>& pb,
                      const size_t n,
                      const libsnark::pb_linear_combination<FieldT> &enable,
                      const libsnark::pb_linear_combination<FieldT> &A,
                      const libsnark::pb_linear_combination<FieldT> &B,
                      const bool strict,
                      const std::string &annotation_prefix="") :
            libsnark::gadget<FieldT>(pb, annotation_prefix), n(n), strict(strict), enable(enable), A(A), B(B)
    {
        less.allocate(pb, FMT(this->annotation_prefix, ".less"));
        less_or_eq.allocate(pb, FMT(this->annotation_prefix, ".less_or_eq"));

        comp.reset(new libsnark::comparison_gadget<FieldT>(pb, this->n, this->A, this->B, less, less_or_eq,
                                                    FMT(this->annotation_prefix, ".comp")));
    };

    void generate_r1cs_constraints();
    void generate_r1cs_witness();
};

template<typename FieldT>
class max_gadget : public libsnark::gadget<FieldT> {
    // output = A < B ? B : A
private:
    libsnark::pb_variable<FieldT> less_or_eq;
    std::shared_ptr<libsnark::comparison_gadget<FieldT> > comp;

public:
    const size_t n;
    const libsnark::pb_linear_combination<FieldT> A;
    const libsnark::pb_linear_combination<FieldT> B;
    libsnark::pb_variable<FieldT> a_less_b;
    const libsnark::pb_variable<FieldT> output;

    max_gadget(libsnark::protoboard<FieldT>& pb,
               const size_t n,
               const libsnark::pb_linear_combination<FieldT> &A,
               const libsnark::pb_linear_combination<FieldT> &B,
               const libsnark::pb_variable<FieldT> &output,
               const std::string &annotation_prefix="") :
            libsnark::gadget<FieldT>(pb, annotation_prefix), n(n), A(A), B(B), output(output)
    {
        a_less_b.allocate(pb, FMT(this->annotation_prefix, ".a_less_b"));
        less_or_eq.allocate(pb, FMT(this->annotation_prefix, ".less_or_eq"));

        comp.reset(new libsnark::comparison_gadget<FieldT>(pb, this->n, this->A, this->B, a_less_b, less_or_eq,
                                                    FMT(this->annotation_prefix, ".comp")));
    };

    void generate_r1cs_constraints();
    void generate_r1cs_witness();
};


#include "comp_gadgets.tcc"
#endif //COMP_GADGETS_H
