// src/backtest/app_config.cpp
#include "backfolio/backtest/app_config.hpp"

namespace backfolio {
namespace backtest {

nlohmann::json AppConfig::to_json() const {
    nlohmann::json j;
    j["backtest"] = backtest.to_json();
    j["batch"] = batch;
    j["parameter_grid"] = parameter_grid;
    j["ranking_metric"] = ranking_metric;
    j["top_n"] = top_n;
    j["database"] = database.to_json();
    j["logger"] = logger.to_json();
    j["cache_capacity"] = cache_capacity;
    j["max_workers"] = max_workers;
    j["output_dir"] = output_dir;
    return j;
}

void AppConfig::from_json(const nlohmann::json& j) {
    if (j.contains("backtest"))
        backtest.from_json(j.at("backtest"));
    if (j.contains("batch"))
        batch = j.at("batch");
    if (j.contains("parameter_grid"))
        parameter_grid = j.at("parameter_grid");
    if (j.contains("ranking_metric"))
        ranking_metric = j.at("ranking_metric").get<std::string>();
    if (j.contains("top_n"))
        top_n = j.at("top_n").get<size_t>();
    if (j.contains("database"))
        database.from_json(j.at("database"));
    if (j.contains("logger"))
        logger.from_json(j.at("logger"));
    if (j.contains("cache_capacity"))
        cache_capacity = j.at("cache_capacity").get<size_t>();
    if (j.contains("max_workers"))
        max_workers = j.at("max_workers").get<size_t>();
    if (j.contains("output_dir"))
        output_dir = j.at("output_dir").get<std::string>();
}

std::vector<BacktestConfig> AppConfig::jobs() const {
    std::vector<BacktestConfig> configs;
    if (!batch.is_array() || batch.empty()) {
        configs.push_back(backtest);
        return configs;
    }

    nlohmann::json base = backtest.to_json();
    for (const auto& overrides : batch) {
        nlohmann::json merged = base;
        merged.merge_patch(overrides);
        BacktestConfig config;
        config.from_json(merged);
        configs.push_back(std::move(config));
    }
    return configs;
}

}  // namespace backtest
}  // namespace backfolio
