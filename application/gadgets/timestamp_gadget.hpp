/** @file
 *****************************************************************************

 Declaration of interfaces for timestamp consistency gadget

 timestamp_consistency_gadget: computes the median of the active timestamps
 and asserts for every active slot i

   median - threshold < timestamps[i] <= median

 The lower bound is checked as median < timestamps[i] + threshold so that
 median < threshold cannot wrap around in the field.

 Padding slots are moved to the top of the sort order by replacing their
 (masked, zero) timestamp with 2^64 - 1. Timestamps are expected to be
 range checked on 64 bits by the caller.
 *****************************************************************************/

#ifndef TIMESTAMP_GADGET_H
#define TIMESTAMP_GADGET_H

#include <cstdint>
#include <memory>
#include <vector>

#include "libsnark/gadgetlib1/gadget.hpp"
#include "libsnark/gadgetlib1/protoboard.hpp"
#include "comp_gadgets.hpp"
#include "sort_gadgets.hpp"
#include "percentile_gadget.hpp"

template<typename FieldT>
class timestamp_consistency_gadget : public libsnark::gadget<FieldT> {
private:
    libsnark::pb_linear_combination_array<FieldT> padded;
    libsnark::pb_variable_array<FieldT> sorted;

public:
    static const size_t TIMESTAMP_BITS = 64;

    const uint64_t threshold;
    const libsnark::pb_variable_array<FieldT> flags;
    const libsnark::pb_variable_array<FieldT> timestamps;
    const libsnark::pb_variable<FieldT> count;
    libsnark::pb_variable<FieldT> median;

    std::shared_ptr<sorted_permutation_gadget<FieldT>> sort;
    std::shared_ptr<quantile_gadget<FieldT>> median_select;
    std::vector<conditional_comparison_gadget<FieldT>> not_after_median;
    std::vector<conditional_comparison_gadget<FieldT>> within_threshold;

    timestamp_consistency_gadget(libsnark::protoboard<FieldT>& pb,
                                 const uint64_t threshold,
                                 const libsnark::pb_variable_array<FieldT> &flags,
                                 const libsnark::pb_variable_array<FieldT> &timestamps,
                                 const libsnark::pb_variable<FieldT> &count,
                                 const std::string &annotation_prefix="") :
            libsnark::gadget<FieldT>(pb, annotation_prefix), threshold(threshold), flags(flags), timestamps(timestamps), count(count)
    {
        assert(flags.size() == timestamps.size());
        assert(threshold > 0);

        const FieldT top = max_value_of_bits<FieldT>(TIMESTAMP_BITS);
        const FieldT t = field_from_ulong<FieldT>(threshold);

        median.allocate(pb, FMT(this->annotation_prefix, ".median"));
        sorted.allocate(pb, timestamps.size(), FMT(this->annotation_prefix, ".sorted"));

        for (size_t i = 0; i < timestamps.size(); ++i){
            libsnark::pb_linear_combination<FieldT> p;
            p.assign(pb, timestamps[i] + top * libsnark::ONE - top * flags[i]);
            padded.emplace_back(p);
        }

        sort.reset(new sorted_permutation_gadget<FieldT>(pb, TIMESTAMP_BITS, padded, sorted, FMT(this->annotation_prefix, ".sort")));
        median_select.reset(new quantile_gadget<FieldT>(pb, 1, 2, libsnark::pb_linear_combination_array<FieldT>(sorted), count, median,
                                                        FMT(this->annotation_prefix, ".median_select")));

        for (size_t i = 0; i < timestamps.size(); ++i){
            libsnark::pb_linear_combination<FieldT> shifted;
            shifted.assign(pb, timestamps[i] + t * libsnark::ONE);

            not_after_median.emplace_back(conditional_comparison_gadget<FieldT>(pb, TIMESTAMP_BITS + 1, flags[i], timestamps[i], median, false,
                                                                                FMT(this->annotation_prefix, ".not_after_median_%zu", i)));
            within_threshold.emplace_back(conditional_comparison_gadget<FieldT>(pb, TIMESTAMP_BITS + 1, flags[i], median, shifted, true,
                                                                                FMT(this->annotation_prefix, ".within_threshold_%zu", i)));
        }
    };

    void generate_r1cs_constraints();
    void generate_r1cs_witness();

    // median computation only
    void generate_median_r1cs_constraints();
    void generate_median_r1cs_witness();
};

#include "timestamp_gadget.tcc"

#endif //TIMESTAMP_GADGET_H
