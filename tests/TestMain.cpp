#include <gtest/gtest.h>

#include <logging/SpdlogInit.hpp>

int main(int argc, char** argv) {
    testing::InitGoogleTest(&argc, argv);
    GmShim_SpdlogInit();
    int ret = RUN_ALL_TESTS();
    GmShim_SpdlogDeInit();
    return ret;
}
