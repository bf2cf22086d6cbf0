// Entry point of the unit test executable. Test cases live in the other
// sources of this directory and register themselves with gtest.
#include "gtest/gtest.h"

int main(int argc, char **argv)
{
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
