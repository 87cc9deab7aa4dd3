#include <csignal>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <nlohmann/json.hpp>
#include "backfolio/backtest/app_config.hpp"
#include "backfolio/backtest/backtest_csv_exporter.hpp"
#include "backfolio/backtest/backtest_engine.hpp"
#include "backfolio/backtest/parallel_runner.hpp"
#include "backfolio/backtest/parameter_search.hpp"
#include "backfolio/backtest/result_serializer.hpp"
#include "backfolio/core/logger.hpp"
#include "backfolio/core/time_utils.hpp"
#include "backfolio/data/cached_market_data_source.hpp"
#include "backfolio/data/data_cache.hpp"
#include "backfolio/data/postgres_database.hpp"

using namespace backfolio;
using namespace backfolio::backtest;

namespace {

CancellationToken g_cancel;

void handle_interrupt(int) {
    g_cancel.cancel();
}

// Value portfolios carry their rebalance period as a strategy parameter
void apply_strategy_rebalance_period(BacktestConfig& config) {
    if (config.rebalance_interval_sessions == 1 && config.strategy_params.is_object() &&
        config.strategy_params.contains("rebalance_days")) {
        config.rebalance_interval_sessions = config.strategy_params.at("rebalance_days").get<int>();
    }
}

void print_summary(const BacktestResult& result) {
    std::cout << "\n======== " << result.backtest_id << " ========\n"
              << "Strategy:        " << result.strategy_name << "\n"
              << "Period:          " << core::format_date(result.start_date) << " to "
              << core::format_date(result.end_date) << "\n"
              << std::fixed << std::setprecision(2)
              << "Initial capital: " << result.initial_capital << "\n"
              << "Final equity:    " << result.final_equity << "\n"
              << "Total return:    " << result.total_return * 100.0 << "%\n"
              << "Max drawdown:    " << result.mdd * 100.0 << "%\n"
              << std::setprecision(4) << "Sharpe ratio:    " << result.sharpe_ratio << "\n"
              << std::setprecision(2) << "Win rate:        " << result.win_rate << "%\n"
              << "Profit factor:   " << result.profit_factor << "\n"
              << "Total trades:    " << result.total_trades << "\n"
              << "Sessions:        " << result.diagnostics.sessions_effective << "/"
              << result.diagnostics.sessions_total << " (skipped "
              << result.diagnostics.skipped_sessions << ", rejected orders "
              << result.diagnostics.rejected_orders << ")\n";
    std::cout.unsetf(std::ios::floatfield);
}

bool save_outputs(const BacktestResult& result, const std::string& output_dir) {
    std::filesystem::path run_dir = std::filesystem::path(output_dir) / result.backtest_id;

    BacktestCSVExporter exporter(run_dir.string());
    auto exported = exporter.export_all(result);
    if (exported.is_error()) {
        ERROR("CSV export failed: " << exported.error()->to_string());
        return false;
    }

    auto saved = ResultSerializer::save_to_file(result, (run_dir / "result.json").string());
    if (saved.is_error()) {
        ERROR("Saving result failed: " << saved.error()->to_string());
        return false;
    }
    return true;
}

void print_ranking(const std::vector<RankedResult>& ranked,
                   const std::vector<Result<BacktestResult>>& results, RankingMetric metric) {
    std::cout << "\n======== Best runs by " << ranking_metric_to_string(metric) << " ========\n";
    for (size_t rank = 0; rank < ranked.size(); ++rank) {
        const RankedResult& entry = ranked[rank];
        const BacktestResult& result = results[entry.job_index].value();
        std::cout << std::setw(3) << rank + 1 << ". " << result.backtest_id << "  score "
                  << entry.score << "  " << entry.parameters.dump() << "\n";
    }
}

void print_statistics(const SearchStatistics& stats) {
    std::cout << "Runs: " << stats.successful_runs << "/" << stats.total_runs << " succeeded\n"
              << std::fixed << std::setprecision(4) << "Total return avg/min/max: "
              << stats.avg_return << " / " << stats.min_return << " / " << stats.max_return
              << "\n"
              << "Max drawdown avg/min/max: " << stats.avg_mdd << " / " << stats.min_mdd << " / "
              << stats.max_mdd << "\n"
              << "Sharpe avg/min/max:       " << stats.avg_sharpe << " / " << stats.min_sharpe
              << " / " << stats.max_sharpe << "\n";
    std::cout.unsetf(std::ios::floatfield);
}

}  // namespace

int main(int argc, char* argv[]) {
    std::string config_filename = argc > 1 ? argv[1] : "./config.json";

    AppConfig config;
    auto loaded = config.load_from_file(config_filename);
    if (loaded.is_error()) {
        std::cerr << "Failed to load " << config_filename << ": " << loaded.error()->to_string()
                  << std::endl;
        return 1;
    }

    try {
        Logger::instance().initialize(config.logger);
    } catch (const std::exception& e) {
        std::cerr << "ERROR: Logger initialization failed: " << e.what() << std::endl;
        return 1;
    }
    Logger::register_component("bt_portfolio");
    INFO("Loaded configuration from " << config_filename);

    std::signal(SIGINT, handle_interrupt);

    auto database = std::make_shared<data::PostgresDatabase>(config.database);
    auto connected = database->connect();
    if (connected.is_error()) {
        ERROR("Database connection failed: " << connected.error()->to_string());
        return 1;
    }

    auto cache = std::make_shared<data::DataCache>(config.cache_capacity);
    auto source = std::make_shared<data::CachedMarketDataSource>(database, cache);

    auto grid = ParameterGrid::from_json(config.parameter_grid);
    if (grid.is_error()) {
        ERROR("Invalid parameter grid: " << grid.error()->to_string());
        return 1;
    }
    auto metric = ranking_metric_from_string(config.ranking_metric);
    if (metric.is_error()) {
        ERROR(metric.error()->to_string());
        return 1;
    }
    bool searching = !grid.value().empty();

    std::vector<BacktestJob> jobs;
    for (const auto& job_config : config.jobs()) {
        for (auto& job : grid.value().make_jobs(job_config)) {
            apply_strategy_rebalance_period(job.config);
            jobs.push_back(std::move(job));
        }
    }
    if (searching) {
        INFO("Parameter search over " << grid.value().size() << " combinations, "
                                      << jobs.size() << " runs");
    }

    ParallelBacktestRunner runner(source, config.max_workers);
    auto results = runner.run_all(jobs, &g_cancel);

    int failures = 0;
    for (size_t i = 0; i < results.size(); ++i) {
        if (results[i].is_error()) {
            ++failures;
            std::cerr << "Backtest " << jobs[i].config.strategy_name
                      << " failed: " << results[i].error()->to_string() << std::endl;
            continue;
        }
        const BacktestResult& result = results[i].value();
        print_summary(result);
        if (!save_outputs(result, config.output_dir)) {
            ++failures;
        }
    }

    if (searching) {
        print_ranking(rank_results(results, metric.value(), config.top_n), results,
                      metric.value());
        print_statistics(summarize_results(results));
    }

    auto stats = cache->stats();
    INFO("Data cache: " << stats.hits << " hits, " << stats.misses << " misses, "
                        << stats.evictions << " evictions");

    database->disconnect();
    return failures == 0 ? 0 : 1;
}
