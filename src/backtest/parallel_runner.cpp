// src/backtest/parallel_runner.cpp
#include "backfolio/backtest/parallel_runner.hpp"
#include <algorithm>
#include <atomic>
#include <optional>
#include <thread>
#include "backfolio/core/logger.hpp"
#include "backfolio/core/run_id_generator.hpp"
#include "backfolio/strategy/strategy_factory.hpp"

namespace backfolio {
namespace backtest {

ParallelBacktestRunner::ParallelBacktestRunner(std::shared_ptr<data::MarketDataSource> data_source,
                                               size_t max_workers)
    : data_source_(std::move(data_source)), max_workers_(max_workers) {
    Logger::register_component("ParallelBacktestRunner");
}

size_t ParallelBacktestRunner::worker_count(size_t job_count) const {
    size_t limit = max_workers_;
    if (limit == 0) {
        limit = std::max<size_t>(1, std::thread::hardware_concurrency());
    }
    return std::max<size_t>(1, std::min(limit, job_count));
}

Result<BacktestResult> ParallelBacktestRunner::run_job(const BacktestJob& job,
                                                       const CancellationToken* cancel) const {
    if (cancel && cancel->is_cancelled()) {
        return make_error<BacktestResult>(ErrorCode::RUN_CANCELLED,
                                          "Batch cancelled before job started",
                                          "ParallelBacktestRunner");
    }

    auto strategy = job.builder
                        ? job.builder(job.config)
                        : strategy::StrategyFactory::create(job.config.strategy_name,
                                                            job.config.strategy_params);
    if (strategy.is_error()) {
        return make_error<BacktestResult>(ErrorCode::SETUP_ERROR,
                                          "Failed to create strategy " +
                                              job.config.strategy_name + ": " +
                                              strategy.error()->what(),
                                          "ParallelBacktestRunner");
    }

    std::shared_ptr<strategy::StrategyInterface> instance(strategy.take_value());
    BacktestEngine engine(job.config, data_source_);
    return engine.run(instance, cancel);
}

std::vector<Result<BacktestResult>> ParallelBacktestRunner::run_all(
    const std::vector<BacktestJob>& jobs, const CancellationToken* cancel) {
    std::vector<Result<BacktestResult>> results;
    if (jobs.empty()) {
        return results;
    }

    std::vector<std::string> names;
    for (const auto& job : jobs) {
        names.push_back(job.config.strategy_name);
    }
    std::string batch_id =
        RunIdGenerator::generate_batch_run_id(names, std::chrono::system_clock::now());

    size_t workers = worker_count(jobs.size());
    INFO("Running batch " << batch_id << ": " << jobs.size() << " backtests on " << workers
                          << " workers");

    // Each slot is written by exactly one worker
    std::vector<std::optional<Result<BacktestResult>>> slots(jobs.size());
    std::atomic<size_t> next{0};

    auto worker = [&]() {
        for (size_t i = next.fetch_add(1); i < jobs.size(); i = next.fetch_add(1)) {
            try {
                slots[i].emplace(run_job(jobs[i], cancel));
            } catch (const std::exception& e) {
                slots[i].emplace(make_error<BacktestResult>(
                    ErrorCode::UNKNOWN_ERROR,
                    "Backtest job " + std::to_string(i) + " threw: " + e.what(),
                    "ParallelBacktestRunner"));
            }
        }
    };

    std::vector<std::thread> threads;
    threads.reserve(workers);
    for (size_t t = 0; t < workers; ++t) {
        threads.emplace_back(worker);
    }
    for (auto& thread : threads) {
        thread.join();
    }

    results.reserve(jobs.size());
    size_t failures = 0;
    for (auto& slot : slots) {
        if (slot->is_error()) {
            ++failures;
            WARN("Backtest job failed: " << slot->error()->to_string());
        }
        results.push_back(std::move(*slot));
    }

    INFO("Batch " << batch_id << " finished: " << jobs.size() - failures << " succeeded, "
                  << failures << " failed");
    return results;
}

}  // namespace backtest
}  // namespace backfolio
