/** @file
 *****************************************************************************

 Implementation of interfaces for timestamp consistency gadget.

 See timestamp_gadget.hpp

 *****************************************************************************/

#include "timestamp_gadget.hpp"

template<typename FieldT>
void timestamp_consistency_gadget<FieldT>::generate_median_r1cs_constraints()
{
    sort->generate_r1cs_constraints();
    median_select->generate_r1cs_constraints();
}

template<typename FieldT>
void timestamp_consistency_gadget<FieldT>::generate_median_r1cs_witness()
{
    sort->generate_r1cs_witness();
    median_select->generate_r1cs_witness();
}

template<typename FieldT>
void timestamp_consistency_gadget<FieldT>::generate_r1cs_constraints()
{
    generate_median_r1cs_constraints();
    for (size_t i = 0; i < timestamps.size(); ++i){
        not_after_median[i].generate_r1cs_constraints();
        within_threshold[i].generate_r1cs_constraints();
    }
}

template<typename FieldT>
void timestamp_consistency_gadget<FieldT>::generate_r1cs_witness()
{
    generate_median_r1cs_witness();
    for (size_t i = 0; i < timestamps.size(); ++i){
        not_after_median[i].generate_r1cs_witness();
        within_threshold[i].generate_r1cs_witness();
    }
}
