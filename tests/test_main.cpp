#include <gtest/gtest.h>

#include "libff/common/default_types/ec_pp.hpp"
#include "libff/common/profiling.hpp"
#include <ethsnarks/src/jubjub/eddsa.hpp>
#include <libsnark/common/crypto/signature/eddsa_snarkfriendly.hpp>

int main(int argc, char **argv)
{
    libff::default_ec_pp::init_public_params();
    ethsnarks::default_inner_ec_pp::init_public_params();
    libff::inhibit_profiling_info = true;
    libff::inhibit_profiling_counters = true;

    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
