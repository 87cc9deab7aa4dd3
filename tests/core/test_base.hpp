//===== test_base.hpp =====
#pragma once

#include <gtest/gtest.h>
#include "backfolio/core/logger.hpp"

namespace backfolio {
namespace testing {

/**
 * @brief Fixture with a console logger that only reports errors
 */
class TestBase : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::reset_for_tests();
        LoggerConfig config;
        config.min_level = LogLevel::ERR;
        config.destination = LogDestination::CONSOLE;
        Logger::instance().initialize(config);
    }

    void TearDown() override {
        Logger::reset_for_tests();
    }
};

}  // namespace testing
}  // namespace backfolio
