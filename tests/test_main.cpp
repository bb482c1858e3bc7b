#include <gtest/gtest.h>

#include <speedline/logger.hpp>

int main(int argc, char** argv)
{
    ::testing::InitGoogleTest(&argc, argv);

    // Keep test output readable; tests that inspect logs install a sink.
    speedline::logger().set_level(speedline::LogLevel::Error);
    return RUN_ALL_TESTS();
}
