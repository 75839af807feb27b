/**
 * Gridsync core - Test Main
 */

#include <gtest/gtest.h>
#include "logger.hpp"

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    gridsync::Logger::init(gridsync::LogLevel::WARN);
    return RUN_ALL_TESTS();
}
