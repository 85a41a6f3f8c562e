//SPDX-License-Identifier: Apache-2.0
//Author: Blayne Dennis
#include <gtest/gtest.h>

#include "kcore.hpp"

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);

    // Enable fail-fast
    GTEST_FLAG_SET(fail_fast, true);

    // loguru is initialized once per process
    kcore::config::logging::initialize();

    return RUN_ALL_TESTS();
}
