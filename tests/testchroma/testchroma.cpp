#include <gtest/gtest.h>

// top-level test entrypoint: just bootstraps the CLI. The tests themselves are
// placed beside the sources they test (e.g. `libchroma/Graphics/Color.tests.cpp`)

int main(int argc, char** argv)
{
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
