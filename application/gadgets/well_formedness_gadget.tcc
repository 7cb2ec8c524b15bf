/** @file
 *****************************************************************************

 Implementation of interfaces for well-formedness gadgets.

 See well_formedness_gadget.hpp

 *****************************************************************************/

#include "well_formedness_gadget.hpp"

template<typename FieldT>
void active_count_gadget<FieldT>::generate_r1cs_constraints()
{
    for (size_t i = 0; i < capacity; ++i){
        libsnark::generate_boolean_r1cs_constraint<FieldT>(this->pb, flags[i], FMT(this->annotation_prefix, ".bitness_%zu", i));
    }

    // flags[i+1] = 1 implies flags[i] = 1
    for (size_t i = 0; i + 1 < capacity; ++i){
        this->pb.add_r1cs_constraint(libsnark::r1cs_constraint<FieldT>(flags[i+1], 1 - flags[i], 0), FMT(this->annotation_prefix, ".prefix_%zu", i));
    }

    this->pb.add_r1cs_constraint(libsnark::r1cs_constraint<FieldT>(1, libsnark::pb_sum<FieldT>(flags), count), FMT(this->annotation_prefix, ".sum"));
}

template<typename FieldT>
void active_count_gadget<FieldT>::generate_r1cs_witness()
{
    const FieldT n = this->pb.val(count);

    if (!fits_in_bits(n, 8 * sizeof(long) - 1) || n.as_ulong() > capacity){
        // every slot active, sum does not match
        for (size_t i = 0; i < capacity; ++i){
            this->pb.val(flags[i]) = FieldT::one();
        }
        return;
    }

    for (size_t i = 0; i < capacity; ++i){
        this->pb.val(flags[i]) = i < n.as_ulong() ? FieldT::one() : FieldT::zero();
    }
}

template<typename FieldT>
libsnark::pb_variable_array<FieldT> active_count_gadget<FieldT>::expanded_flags(size_t multiplicity) const
{
    libsnark::pb_variable_array<FieldT> result;
    for (size_t j = 0; j < capacity * multiplicity; ++j){
        result.emplace_back(flags[j / multiplicity]);
    }
    return result;
}

template<typename FieldT>
void sentinel_check_gadget<FieldT>::generate_r1cs_constraints()
{
    const libsnark::linear_combination<FieldT> diff = value - sentinel_value<FieldT>() * libsnark::ONE;

    this->pb.add_r1cs_constraint(libsnark::r1cs_constraint<FieldT>(1 - flag, diff, 0), FMT(this->annotation_prefix, ".padding"));
    this->pb.add_r1cs_constraint(libsnark::r1cs_constraint<FieldT>(diff, inv, flag), FMT(this->annotation_prefix, ".data"));
}

template<typename FieldT>
void sentinel_check_gadget<FieldT>::generate_r1cs_witness()
{
    const FieldT diff = this->pb.val(value) - sentinel_value<FieldT>();
    this->pb.val(inv) = diff.is_zero() ? FieldT::zero() : diff.inverse();
}

template<typename FieldT>
void well_formedness_gadget<FieldT>::generate_r1cs_constraints()
{
    for (size_t i = 0; i < checks.size(); ++i){
        checks[i].generate_r1cs_constraints();
    }
}

template<typename FieldT>
void well_formedness_gadget<FieldT>::generate_r1cs_witness()
{
    for (size_t i = 0; i < checks.size(); ++i){
        checks[i].generate_r1cs_witness();
    }
}
