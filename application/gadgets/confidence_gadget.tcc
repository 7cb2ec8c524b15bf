/** @file
 *****************************************************************************

 Implementation of interfaces for confidence gadget.

 See confidence_gadget.hpp

 *****************************************************************************/

#include "confidence_gadget.hpp"

template<typename FieldT>
void confidence_gadget<FieldT>::generate_r1cs_constraints()
{
    max_half->generate_r1cs_constraints();
}

template<typename FieldT>
void confidence_gadget<FieldT>::generate_r1cs_witness()
{
    max_half->generate_r1cs_witness();
}
