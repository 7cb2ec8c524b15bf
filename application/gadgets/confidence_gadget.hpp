/** @file
 *****************************************************************************

 Declaration of interfaces for confidence gadget

 confidence_gadget: width of the aggregate, the larger of the two half
 intervals around the median
   confidence = max(p50 - p25, p75 - p50)

 p25 <= p50 <= p75 < 2^n is up to the caller
 *****************************************************************************/

#ifndef CONFIDENCE_GADGET_H
#define CONFIDENCE_GADGET_H

#include <memory>

#include "libsnark/gadgetlib1/gadget.hpp"
#include "libsnark/gadgetlib1/protoboard.hpp"
#include "comp_gadgets.hpp"

template<typename FieldT>
class confidence_gadget : public libsnark::gadget<FieldT> {
private:
    std::shared_ptr<max_gadget<FieldT>> max_half;

public:
    const size_t n;
    const libsnark::pb_variable<FieldT> p25;
    const libsnark::pb_variable<FieldT> p50;
    const libsnark::pb_variable<FieldT> p75;
    const libsnark::pb_variable<FieldT> confidence;

    confidence_gadget(libsnark::protoboard<FieldT>& pb,
                      const size_t n,
                      const libsnark::pb_variable<FieldT> &p25,
                      const libsnark::pb_variable<FieldT> &p50,
                      const libsnark::pb_variable<FieldT> &p75,
                      const libsnark::pb_variable<FieldT> &confidence,
                      const std::string &annotation_prefix="") :
            libsnark::gadget<FieldT>(pb, annotation_prefix), n(n), p25(p25), p50(p50), p75(p75), confidence(confidence)
    {
        libsnark::pb_linear_combination<FieldT> left;
        libsnark::pb_linear_combination<FieldT> right;
        left.assign(pb, p50 - p25);
        right.assign(pb, p75 - p50);

        max_half.reset(new max_gadget<FieldT>(pb, n, left, right, confidence, FMT(this->annotation_prefix, ".max")));
    };

    void generate_r1cs_constraints();
    void generate_r1cs_witness();
};

#include "confidence_gadget.tcc"

#endif //CONFIDENCE_GADGET_H
