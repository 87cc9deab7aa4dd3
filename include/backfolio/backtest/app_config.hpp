// include/backfolio/backtest/app_config.hpp
#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include "backfolio/backtest/backtest_engine.hpp"
#include "backfolio/core/config_base.hpp"
#include "backfolio/core/logger.hpp"
#include "backfolio/data/postgres_database.hpp"

namespace backfolio {
namespace backtest {

/**
 * @brief Top-level configuration of the bt_portfolio application
 *
 * "batch" is an optional array of partial backtest configurations; each entry
 * is merged over "backtest" to form one job. Without it a single job runs.
 * A non-empty "parameter_grid" expands every job into one run per parameter
 * combination, and the best "top_n" runs by "ranking_metric" are reported.
 */
struct AppConfig : public ConfigBase {
    BacktestConfig backtest;
    nlohmann::json batch = nlohmann::json::array();
    nlohmann::json parameter_grid = nlohmann::json::object();
    std::string ranking_metric{"sharpe_ratio"};
    size_t top_n{10};
    data::PostgresSourceConfig database;
    LoggerConfig logger;
    size_t cache_capacity{512};
    size_t max_workers{0};  // 0 = hardware concurrency
    std::string output_dir{"results"};

    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;

    /**
     * @brief Backtest configurations of all jobs, in batch order
     */
    std::vector<BacktestConfig> jobs() const;
};

}  // namespace backtest
}  // namespace backfolio
