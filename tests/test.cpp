#include <gtest/gtest.h>

#include "core/runtime.h"

int main(int argc, char** argv) {
    Runtime::init();

    ::testing::InitGoogleTest(&argc, argv);

    return RUN_ALL_TESTS();
}
