/** @file
 *****************************************************************************

 Declaration of interfaces for well-formedness gadgets

 Fixed capacity arrays carry a variable number of active elements: the first
 N elements are data, the rest is padding and must equal the sentinel (-1).

 active_count_gadget: decodes the active count N into one flag per slot,
 flag[i] = 1 iff i < N. Flags are boolean, non-increasing and sum up to N,
 which also forces 0 <= N <= capacity.

 sentinel_check_gadget: for a single element v with flag a
   (1 - a) * (v - sentinel) = 0     padding holds the sentinel
   (v - sentinel) * inv = a         data never holds the sentinel

 well_formedness_gadget: sentinel checks for every element of one array
 *****************************************************************************/

#ifndef WELL_FORMEDNESS_GADGET_H
#define WELL_FORMEDNESS_GADGET_H

#include <vector>

#include "libsnark/gadgetlib1/gadget.hpp"
#include "libsnark/gadgetlib1/protoboard.hpp"
#include "libsnark/gadgetlib1/gadgets/basic_gadgets.hpp"
#include "utils.h"

template<typename FieldT>
class active_count_gadget : public libsnark::gadget<FieldT> {
public:
    const size_t capacity;
    const libsnark::pb_variable<FieldT> count;
    libsnark::pb_variable_array<FieldT> flags;

    active_count_gadget(libsnark::protoboard<FieldT>& pb,
                        const size_t capacity,
                        const libsnark::pb_variable<FieldT> &count,
                        const std::string &annotation_prefix="") :
            libsnark::gadget<FieldT>(pb, annotation_prefix), capacity(capacity), count(count)
    {
        assert(capacity > 0);
        flags.allocate(pb, capacity, FMT(this->annotation_prefix, ".flags"));
    };

    void generate_r1cs_constraints();
    void generate_r1cs_witness();

    /**
     * flags repeated for arrays with several elements per slot,
     * element j belongs to slot j / multiplicity
     */
    libsnark::pb_variable_array<FieldT> expanded_flags(size_t multiplicity) const;
};

template<typename FieldT>
class sentinel_check_gadget : public libsnark::gadget<FieldT> {
private:
    libsnark::pb_variable<FieldT> inv;

public:
    const libsnark::pb_variable<FieldT> flag;
    const libsnark::pb_variable<FieldT> value;

    sentinel_check_gadget(libsnark::protoboard<FieldT>& pb,
                          const libsnark::pb_variable<FieldT> &flag,
                          const libsnark::pb_variable<FieldT> &value,
                          const std::string &annotation_prefix="") :
            libsnark::gadget<FieldT>(pb, annotation_prefix), flag(flag), value(value)
    {
        inv.allocate(pb, FMT(this->annotation_prefix, ".inv"));
    };

    void generate_r1cs_constraints();
    void generate_r1cs_witness();
};

template<typename FieldT>
class well_formedness_gadget : public libsnark::gadget<FieldT> {
public:
    const libsnark::pb_variable_array<FieldT> flags;
    const libsnark::pb_variable_array<FieldT> values;
    std::vector<sentinel_check_gadget<FieldT>> checks;

    well_formedness_gadget(libsnark::protoboard<FieldT>& pb,
                           const libsnark::pb_variable_array<FieldT> &flags,
                           const libsnark::pb_variable_array<FieldT> &values,
                           const std::string &annotation_prefix="") :
            libsnark::gadget<FieldT>(pb, annotation_prefix), flags(flags), values(values)
    {
        assert(flags.size() == values.size());
        for (size_t i = 0; i < values.size(); ++i){
            checks.emplace_back(sentinel_check_gadget<FieldT>(pb, flags[i], values[i], FMT(this->annotation_prefix, ".check_%zu", i)));
        }
    };

    void generate_r1cs_constraints();
    void generate_r1cs_witness();
};

#include "well_formedness_gadget.tcc"

#endif //WELL_FORMEDNESS_GADGET_H
