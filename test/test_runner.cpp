// test/test_runner.cpp
// -----------------------------------------------------------
// Google Test entry point for the docredact unit and integration tests.
// Logging is raised to WARN so test output stays readable.

#include <gtest/gtest.h>
#include "util/logger.hpp"

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    docredact::util::logger::setLogLevel(docredact::util::logger::LogLevel::WARN);
    return RUN_ALL_TESTS();
}
