// include/backfolio/backtest/parallel_runner.hpp
#pragma once

#include <functional>
#include <memory>
#include <string>
#include <vector>
#include "backfolio/backtest/backtest_engine.hpp"

namespace backfolio {
namespace backtest {

/**
 * @brief Builds the private strategy instance of one job
 */
using StrategyBuilder =
    std::function<Result<std::unique_ptr<strategy::StrategyInterface>>(const BacktestConfig&)>;

/**
 * @brief One independent backtest of a batch
 *
 * Without a builder the strategy is created by StrategyFactory from
 * config.strategy_name and config.strategy_params.
 */
struct BacktestJob {
    BacktestConfig config;
    StrategyBuilder builder;
};

/**
 * @brief Runs independent backtests on a bounded pool of worker threads
 *
 * Every job gets its own engine and strategy; only the data source (and its
 * cache) is shared, so it must be thread-safe.
 */
class ParallelBacktestRunner {
public:
    /**
     * @param data_source Shared, thread-safe market data
     * @param max_workers Upper bound on threads; 0 uses the hardware concurrency
     */
    explicit ParallelBacktestRunner(std::shared_ptr<data::MarketDataSource> data_source,
                                    size_t max_workers = 0);

    /**
     * @brief Run all jobs and return one result per job, in job order
     *
     * A failing job does not affect the others. Jobs not yet started when
     * @p cancel fires fail with RUN_CANCELLED.
     */
    std::vector<Result<BacktestResult>> run_all(const std::vector<BacktestJob>& jobs,
                                                const CancellationToken* cancel = nullptr);

    size_t worker_count(size_t job_count) const;

private:
    Result<BacktestResult> run_job(const BacktestJob& job, const CancellationToken* cancel) const;

    std::shared_ptr<data::MarketDataSource> data_source_;
    size_t max_workers_;
};

}  // namespace backtest
}  // namespace backfolio
