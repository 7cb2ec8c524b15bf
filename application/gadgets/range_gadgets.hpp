/** @file
 *****************************************************************************

 Declaration of interfaces for range gadgets

 range_gadget: checks whether a value is within a fixed range.

 bit_range_gadget: decomposes a value into n bits (least significant first),
 which proves 0 <= value < 2^n

 bit_encoder_gadget: masks a value with an enable flag and decomposes the
 masked value into n bits. Disabled (padding) values encode as zero.
 *****************************************************************************/

#ifndef RANGE_GADGETS_H
#define RANGE_GADGETS_H

#include "libsnark/gadgetlib1/gadget.hpp"
#include "libsnark/gadgetlib1/pb_variable.hpp"
#include "libsnark/gadgetlib1/protoboard.hpp"
#include "libsnark/gadgetlib1/gadgets/basic_gadgets.hpp"
#include "utils.h"

template<typename FieldT>
class range_gadget : public libsnark::gadget<FieldT> {
    // checks whether value is in range [min, max]
private:
    libsnark::pb_variable_array<FieldT> bits;
    long coeff_n;

public:
    int n;
    const long min;
    const long max;
    const libsnark::pb_linear_combination<FieldT> value;

    range_gadget(libsnark::protoboard<FieldT>& pb,
                       long min,
                       long max,
                       const libsnark::pb_linear_combination<FieldT> &value,
                       const std::string &annotation_prefix="") :
            libsnark::gadget<FieldT>(pb, annotation_prefix), min(min), max(max), value(value)
    {
        assert(max > min);
        n = num_bits(max-min);

        // last coefficient
        coeff_n = (max - min) - (1l << (n-1)) + 1;

        bits.allocate(pb, n, FMT(this->annotation_prefix, ".bits"));
    };

    void generate_r1cs_constraints();
    void generate_r1cs_witness();
};

template<typename FieldT>
class bit_range_gadget : public libsnark::gadget<FieldT> {
    // value = sum 2^i * bits[i], bits boolean
public:
    const size_t n;
    const libsnark::pb_linear_combination<FieldT> value;
    libsnark::pb_variable_array<FieldT> bits;

    bit_range_gadget(libsnark::protoboard<FieldT>& pb,
                     const size_t n,
                     const libsnark::pb_linear_combination<FieldT> &value,
                     const std::string &annotation_prefix="") :
            libsnark::gadget<FieldT>(pb, annotation_prefix), n(n), value(value)
    {
        assert(n < FieldT::capacity());
        bits.allocate(pb, n, FMT(this->annotation_prefix, ".bits"));
    };

    void generate_r1cs_constraints();
    void generate_r1cs_witness();
};

template<typename FieldT>
class bit_encoder_gadget : public libsnark::gadget<FieldT> {
    // masked = enable * value, masked encoded in n bits
private:
    std::shared_ptr<bit_range_gadget<FieldT>> range;

public:
    const size_t n;
    const libsnark::pb_linear_combination<FieldT> enable;
    const libsnark::pb_linear_combination<FieldT> value;
    libsnark::pb_variable<FieldT> masked;

    bit_encoder_gadget(libsnark::protoboard<FieldT>& pb,
                       const size_t n,
                       const libsnark::pb_linear_combination<FieldT> &enable,
                       const libsnark::pb_linear_combination<FieldT> &value,
                       const std::string &annotation_prefix="") :
            libsnark::gadget<FieldT>(pb, annotation_prefix), n(n), enable(enable), value(value)
    {
        masked.allocate(pb, FMT(this->annotation_prefix, ".masked"));
        range.reset(new bit_range_gadget<FieldT>(pb, n, masked, FMT(this->annotation_prefix, ".range")));
    };

    void generate_r1cs_constraints();
    void generate_r1cs_witness();
    const libsnark::pb_variable_array<FieldT>& bits() const;
};

#include "range_gadgets.tcc"

#endif //RANGE_GADGETS_H
