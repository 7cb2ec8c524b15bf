/** @file
*****************************************************************************

See witness_builder.hpp
*****************************************************************************/

#include "witness_builder.hpp"

ethsnarks::eddsa_keypair generate_publisher_key()
{
    ethsnarks::eddsa_keypair key;
    ethsnarks::eddsa_generate_keypair(key.sk, key.pk);
    return key;
}
