/** @file
 *****************************************************************************

 Declaration of interfaces for percentile gadgets

 quantile_gadget: selects the k/d-quantile of the first M elements of a sorted
 array. The quantile is the element at 1-indexed rank ceil(k * M / d), so the
 median of an even number of elements is the lower middle one.
 For M = 0 rank is 0 and the output is 0.

 percentile_gadget: p25, p50 and p75 of the first M elements of a sorted
 array, optionally re-asserting that the array is sorted
 *****************************************************************************/

#ifndef PERCENTILE_GADGET_H
#define PERCENTILE_GADGET_H

#include <memory>

#include "libsnark/gadgetlib1/gadget.hpp"
#include "libsnark/gadgetlib1/protoboard.hpp"
#include "libsnark/gadgetlib1/gadgets/basic_gadgets.hpp"
#include "integer_arithmetic.hpp"
#include "sort_gadgets.hpp"

template<typename FieldT>
class quantile_gadget : public libsnark::gadget<FieldT> {
/**
 * Constraints
 * (1) rank = ceil(k * count / d)
 * (2) sel[i] boolean, sum sel[i] boolean
 * (3) sum (i+1) * sel[i] = rank
 * (4) output = sum sel[i] * values[i]
 *
 * count <= values.size() is up to the caller
 */
private:
    libsnark::pb_variable_array<FieldT> sel;
    libsnark::pb_variable_array<FieldT> products;
    std::shared_ptr<integer_division_gadget<FieldT>> rank_division;

public:
    const unsigned int k;
    const unsigned int d;
    const libsnark::pb_linear_combination_array<FieldT> values;
    const libsnark::pb_linear_combination<FieldT> count;
    libsnark::pb_variable<FieldT> rank;
    const libsnark::pb_variable<FieldT> output;

    quantile_gadget(libsnark::protoboard<FieldT>& pb,
                    const unsigned int k,
                    const unsigned int d,
                    const libsnark::pb_linear_combination_array<FieldT> &values,
                    const libsnark::pb_linear_combination<FieldT> &count,
                    const libsnark::pb_variable<FieldT> &output,
                    const std::string &annotation_prefix="") :
            libsnark::gadget<FieldT>(pb, annotation_prefix), k(k), d(d), values(values), count(count), output(output)
    {
        assert(k > 0 && k < d);
        rank.allocate(pb, FMT(this->annotation_prefix, ".rank"));
        sel.allocate(pb, values.size(), FMT(this->annotation_prefix, ".sel"));
        products.allocate(pb, values.size(), FMT(this->annotation_prefix, ".products"));

        rank_division.reset(new integer_division_gadget<FieldT>(pb, values.size(), FieldT(k) * count, d, ROUND_CEIL, rank,
                                                                FMT(this->annotation_prefix, ".rank_division")));
    };

    void generate_r1cs_constraints();
    void generate_r1cs_witness();
};

template<typename FieldT>
class percentile_gadget : public libsnark::gadget<FieldT> {
private:
    std::shared_ptr<quantile_gadget<FieldT>> q25;
    std::shared_ptr<quantile_gadget<FieldT>> q50;
    std::shared_ptr<quantile_gadget<FieldT>> q75;
    std::shared_ptr<monotonic_gadget<FieldT>> sorted;

public:
    const size_t n;
    const bool assert_sorted;
    const libsnark::pb_linear_combination_array<FieldT> values;
    const libsnark::pb_linear_combination<FieldT> count;
    const libsnark::pb_variable<FieldT> p25;
    const libsnark::pb_variable<FieldT> p50;
    const libsnark::pb_variable<FieldT> p75;

    percentile_gadget(libsnark::protoboard<FieldT>& pb,
                      const size_t n,
                      const libsnark::pb_linear_combination_array<FieldT> &values,
                      const libsnark::pb_linear_combination<FieldT> &count,
                      const libsnark::pb_variable<FieldT> &p25,
                      const libsnark::pb_variable<FieldT> &p50,
                      const libsnark::pb_variable<FieldT> &p75,
                      const bool assert_sorted,
                      const std::string &annotation_prefix="") :
            libsnark::gadget<FieldT>(pb, annotation_prefix), n(n), assert_sorted(assert_sorted), values(values),
            count(count), p25(p25), p50(p50), p75(p75)
    {
        q25.reset(new quantile_gadget<FieldT>(pb, 1, 4, values, count, p25, FMT(this->annotation_prefix, ".q25")));
        q50.reset(new quantile_gadget<FieldT>(pb, 2, 4, values, count, p50, FMT(this->annotation_prefix, ".q50")));
        q75.reset(new quantile_gadget<FieldT>(pb, 3, 4, values, count, p75, FMT(this->annotation_prefix, ".q75")));
        if (assert_sorted){
            sorted.reset(new monotonic_gadget<FieldT>(pb, n, values, FMT(this->annotation_prefix, ".sorted")));
        }
    };

    void generate_r1cs_constraints();
    void generate_r1cs_witness();
};

#include "percentile_gadget.tcc"

#endif //PERCENTILE_GADGET_H
