/** @file
 *****************************************************************************

 utilities for gadgets.

 *****************************************************************************/

#include "utils.h"

int num_bits(unsigned long value){
    int n = 0;
    while(value > 0){
        value >>= 1;
        n += 1;
    }
    return n;
}

/**
 * Integer division with truncation towards -inf
 */
long integer_division(long a, unsigned int d){
    long q, r;
    q = a / (long) d; // this operation should truncate towards zero for modern compilers. This is not guaranteed by all compilers (C89 or older)

    r = a - d * q;

    // We need truncation towards -inf
    if (r < 0){
        q -= 1;
    }
    return q;
}

/**
 * Integer division with rounding towards +inf
 */
long integer_division_ceil(long a, unsigned int d){
    return -integer_division(-a, d);
}
