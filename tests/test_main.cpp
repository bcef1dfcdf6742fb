#include <gtest/gtest.h>
#include <docpipe/core/logger.hpp>

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);

    // Pipeline stages log warnings for every skipped unit; keep test output readable
    docpipe::Logger::instance().set_level(docpipe::LogLevel::ERROR);

    return RUN_ALL_TESTS();
}
