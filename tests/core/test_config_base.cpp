// test_config_base.cpp
#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include "backfolio/backtest/backtest_engine.hpp"
#include "backfolio/core/config_base.hpp"
#include "backfolio/core/time_utils.hpp"

using namespace backfolio;

class ConfigBaseTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir = std::filesystem::temp_directory_path() / "backfolio_config_base_test";
        std::filesystem::create_directories(test_dir);
    }

    void TearDown() override {
        std::filesystem::remove_all(test_dir);
    }

    std::filesystem::path test_dir;
};

class TestConfig : public ConfigBase {
public:
    std::string name = "default";
    int value = 42;
    double ratio = 0.5;

    nlohmann::json to_json() const override {
        nlohmann::json j;
        j["name"] = name;
        j["value"] = value;
        j["ratio"] = ratio;
        return j;
    }

    void from_json(const nlohmann::json& j) override {
        if (j.contains("name"))
            name = j["name"].get<std::string>();
        if (j.contains("value"))
            value = j["value"].get<int>();
        if (j.contains("ratio"))
            ratio = j["ratio"].get<double>();
    }
};

TEST_F(ConfigBaseTest, SaveAndLoadFile) {
    TestConfig config;
    config.name = "test";
    config.value = 100;
    config.ratio = 1.5;

    std::filesystem::path file_path = test_dir / "test_config.json";
    auto save_result = config.save_to_file(file_path.string());
    ASSERT_TRUE(save_result.is_ok()) << save_result.error()->to_string();
    ASSERT_TRUE(std::filesystem::exists(file_path));

    TestConfig loaded_config;
    auto load_result = loaded_config.load_from_file(file_path.string());
    ASSERT_TRUE(load_result.is_ok()) << load_result.error()->to_string();

    EXPECT_EQ(loaded_config.name, "test");
    EXPECT_EQ(loaded_config.value, 100);
    EXPECT_DOUBLE_EQ(loaded_config.ratio, 1.5);
}

TEST_F(ConfigBaseTest, DefaultValuesPreserved) {
    TestConfig config;

    nlohmann::json partial;
    partial["name"] = "partial";
    config.from_json(partial);

    EXPECT_EQ(config.name, "partial");
    EXPECT_EQ(config.value, 42);
    EXPECT_DOUBLE_EQ(config.ratio, 0.5);
}

TEST_F(ConfigBaseTest, InvalidJsonHandling) {
    TestConfig config;

    std::filesystem::path file_path = test_dir / "invalid.json";
    std::ofstream file(file_path);
    file << "{ this is not valid JSON }";
    file.close();

    auto result = config.load_from_file(file_path.string());
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::JSON_PARSE_ERROR);
}

TEST_F(ConfigBaseTest, WrongFieldTypeIsInvalidArgument) {
    TestConfig config;

    std::filesystem::path file_path = test_dir / "wrong_type.json";
    std::ofstream file(file_path);
    file << R"({"value": "forty-two"})";
    file.close();

    auto result = config.load_from_file(file_path.string());
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::INVALID_ARGUMENT);
}

TEST_F(ConfigBaseTest, MissingFileIsFileError) {
    TestConfig config;
    auto result = config.load_from_file((test_dir / "absent.json").string());
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::FILE_IO_ERROR);
}

TEST_F(ConfigBaseTest, BacktestConfigSerialization) {
    backtest::BacktestConfig config;
    config.start_date = core::make_timestamp(2023, 1, 2);
    config.end_date = core::make_timestamp(2023, 12, 29);
    config.initial_capital = 5000000.0;
    config.commission = backtest::CommissionModel{0.001, 5.0};
    config.max_positions = 15;
    config.long_only = true;
    config.strategy_name = "VALUE_PORTFOLIO";
    config.strategy_params = {{"max_stocks", 15}};

    std::filesystem::path file_path = test_dir / "backtest.json";
    ASSERT_TRUE(config.save_to_file(file_path.string()).is_ok());

    backtest::BacktestConfig loaded;
    auto result = loaded.load_from_file(file_path.string());
    ASSERT_TRUE(result.is_ok()) << result.error()->to_string();

    EXPECT_EQ(loaded.start_date, config.start_date);
    EXPECT_EQ(loaded.end_date, config.end_date);
    EXPECT_DOUBLE_EQ(loaded.initial_capital, 5000000.0);
    EXPECT_DOUBLE_EQ(loaded.commission.rate, 0.001);
    EXPECT_DOUBLE_EQ(loaded.commission.minimum, 5.0);
    EXPECT_EQ(loaded.max_positions, 15u);
    EXPECT_TRUE(loaded.long_only);
    EXPECT_EQ(loaded.strategy_name, "VALUE_PORTFOLIO");
    EXPECT_EQ(loaded.strategy_params["max_stocks"], 15);
}

TEST_F(ConfigBaseTest, BacktestConfigDefaults) {
    backtest::BacktestConfig config;
    EXPECT_DOUBLE_EQ(config.initial_capital, 10000000.0);
    EXPECT_DOUBLE_EQ(config.commission.rate, 0.0015);
    EXPECT_DOUBLE_EQ(config.slippage_bps, 10.0);
    EXPECT_EQ(config.rebalance_interval_sessions, 1);
    EXPECT_DOUBLE_EQ(config.periods_per_year, 252.0);
}

TEST_F(ConfigBaseTest, BacktestConfigRejectsMalformedDate) {
    backtest::BacktestConfig config;
    nlohmann::json j = {{"start_date", "2023-13-45"}};
    EXPECT_THROW(config.from_json(j), std::invalid_argument);
}
