/** @file
 *****************************************************************************

 interfaces for utilities for using gadgets.

 *****************************************************************************/


#ifndef GADGET_UTILS_H
#define GADGET_UTILS_H

#include <cstdint>
#include <gmp.h>

#include <libff/common/utils.hpp>
#include <libff/algebra/field_utils/bigint.hpp>

int num_bits(unsigned long value);
long integer_division(long a, unsigned int d);
long integer_division_ceil(long a, unsigned int d);


/**
 * Reserved padding value for fixed capacity arrays: -1 in the field (p-1)
 */
template<typename FieldT>
FieldT sentinel_value(){
    return -FieldT::one();
}

template<typename FieldT>
bool is_sentinel(const FieldT &v){
    return v == sentinel_value<FieldT>();
}

template<typename FieldT>
FieldT field_from_ulong(uint64_t v){
    return FieldT((long) v, true);
}

/**
 * 2^n - 1, the largest value representable with n bits
 */
template<typename FieldT>
FieldT max_value_of_bits(size_t n){
    return (FieldT(2)^n) - FieldT::one();
}

template<typename FieldT>
bool fits_in_bits(const FieldT &v, size_t n){
    return v.as_bigint().num_bits() <= n;
}

/**
 * Compares the canonical integer representatives of two field elements
 * returns <0, 0, >0 like memcmp
 */
template<typename FieldT>
int field_compare(const FieldT &a, const FieldT &b){
    const libff::bigint<FieldT::num_limbs> ai = a.as_bigint();
    const libff::bigint<FieldT::num_limbs> bi = b.as_bigint();
    return mpn_cmp(ai.data, bi.data, FieldT::num_limbs);
}

template<typename FieldT>
bool field_less(const FieldT &a, const FieldT &b){
    return field_compare(a, b) < 0;
}

#endif //GADGET_UTILS_H
