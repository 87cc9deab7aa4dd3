// include/backfolio/backtest/backtest_engine.hpp
#pragma once

#include <atomic>
#include <map>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include "backfolio/backtest/backtest_metrics_calculator.hpp"
#include "backfolio/backtest/backtest_types.hpp"
#include "backfolio/backtest/execution_model.hpp"
#include "backfolio/core/config_base.hpp"
#include "backfolio/core/error.hpp"
#include "backfolio/core/types.hpp"
#include "backfolio/data/market_data_source.hpp"
#include "backfolio/ledger/fifo_matcher.hpp"
#include "backfolio/portfolio/account.hpp"
#include "backfolio/portfolio/position_tracker.hpp"
#include "backfolio/strategy/strategy_interface.hpp"

namespace backfolio {
namespace backtest {

/**
 * @brief Configuration for one backtest run
 */
struct BacktestConfig : public ConfigBase {
    Timestamp start_date;
    Timestamp end_date;
    std::string symbol;  // instrument replayed in single-instrument mode

    double initial_capital{10000000.0};
    CommissionModel commission{0.0015, 0.0};
    std::string slippage_model{"BASIS_POINT"};  // BASIS_POINT or VOLUME
    double slippage_bps{10.0};                  // used by BASIS_POINT
    TradePricePolicy trade_price_policy{TradePricePolicy::CLOSE};

    // Rebalancing
    double min_rebalance_cost{0.0};
    size_t max_positions{0};  // 0 = unlimited
    double min_cash_balance{0.0};
    int rebalance_interval_sessions{1};

    // Metrics
    double periods_per_year{252.0};
    double risk_free_rate{0.0};

    bool long_only{false};
    DataFrequency data_frequency{DataFrequency::DAILY};

    std::string strategy_name;
    nlohmann::json strategy_params = nlohmann::json::object();

    // Configuration metadata
    std::string version{"1.0.0"};

    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;
};

/**
 * @brief Cooperative cancellation flag shared with a running backtest
 */
class CancellationToken {
public:
    void cancel() {
        cancelled_.store(true, std::memory_order_release);
    }

    bool is_cancelled() const {
        return cancelled_.load(std::memory_order_acquire);
    }

private:
    std::atomic<bool> cancelled_{false};
};

/**
 * @brief Event-driven simulation loop
 *
 * Each call to run() owns a private account, ledger and execution model, so
 * one engine may serve concurrent runs as long as its data source is
 * thread-safe. Strategies are stateful and must not be shared between
 * concurrent runs.
 */
class BacktestEngine {
public:
    /**
     * @brief Constructor
     * @param config Run configuration
     * @param data_source Historical data; required for portfolio mode and
     *        for single-instrument runs that load their own series
     */
    explicit BacktestEngine(BacktestConfig config,
                            std::shared_ptr<data::MarketDataSource> data_source = nullptr);

    /**
     * @brief Run a strategy over [start, end], choosing the mode from
     *        has_universe_selection()
     *
     * Single-instrument strategies replay config.symbol loaded from the data
     * source.
     *
     * @return The result, SETUP_ERROR / INVALID_ARGUMENT before any session
     *         runs, or RUN_CANCELLED
     */
    Result<BacktestResult> run(std::shared_ptr<strategy::StrategyInterface> strategy,
                               const Timestamp& start, const Timestamp& end,
                               const CancellationToken* cancel = nullptr);

    /**
     * @brief Run over the configured start and end dates
     */
    Result<BacktestResult> run(std::shared_ptr<strategy::StrategyInterface> strategy,
                               const CancellationToken* cancel = nullptr);

    /**
     * @brief Replay a caller-supplied series through a single-instrument
     *        strategy
     *
     * Bars that do not advance in time are skipped with a warning.
     */
    Result<BacktestResult> run_single(std::shared_ptr<strategy::StrategyInterface> strategy,
                                      const std::vector<Bar>& bars,
                                      const CancellationToken* cancel = nullptr);

    /**
     * @brief Metrics, trades and fills of one instrument of a finished run
     */
    static SymbolDetail build_symbol_detail(const BacktestResult& result,
                                            const std::string& symbol);

    /**
     * @brief OHLC series of an instrument restricted to the run's date range
     */
    Result<std::vector<Bar>> load_symbol_ohlc(const BacktestResult& result,
                                              const std::string& symbol);

    const BacktestConfig& config() const {
        return config_;
    }

private:
    /**
     * @brief Per-run mutable state
     */
    struct RunState {
        explicit RunState(const BacktestConfig& config);

        portfolio::Account account;
        ledger::FifoMatcher matcher;
        portfolio::PositionTracker tracker;
        std::unique_ptr<ExecutionModel> execution;
        std::vector<EquitySample> equity;
        RunDiagnostics diagnostics;
        std::vector<std::string> warnings;
        std::vector<OrderRejection> rejections;

        data::OhlcSeriesMap series;               // whole-range bars per instrument
        std::map<std::string, size_t> cursors;    // next unread bar per instrument
        std::map<std::string, const Bar*> today;  // bars of the current session
    };

    Result<void> validate_setup(const strategy::StrategyInterface* strategy,
                                const Timestamp& start, const Timestamp& end) const;

    Result<BacktestResult> run_portfolio(strategy::StrategyInterface& strategy,
                                         const Timestamp& start, const Timestamp& end,
                                         const CancellationToken* cancel);

    Result<BacktestResult> replay_bars(strategy::StrategyInterface& strategy,
                                       const std::vector<Bar>& bars, const Timestamp& start,
                                       const Timestamp& end, const CancellationToken* cancel);

    /**
     * @brief Load whole-range series for instruments seen for the first time
     */
    void ensure_series(RunState& state, const std::vector<std::string>& symbols,
                       const Timestamp& start, const Timestamp& end);

    /**
     * @brief Advance cursors and collect each instrument's bar for the session date
     */
    void collect_session_bars(RunState& state, const Timestamp& day) const;

    void rebalance(RunState& state, strategy::StrategyInterface& strategy,
                   const std::vector<TargetWeight>& targets, const Timestamp& day);

    /**
     * @brief Execute and settle one order; rejected orders are recorded
     * @param check_admission Apply position-limit and cash-floor checks to buys
     * @return true if a fill was settled
     */
    bool execute_order(RunState& state, strategy::StrategyInterface& strategy,
                       const std::string& symbol, Side side, Quantity quantity, const Bar& bar,
                       const Timestamp& ts, bool check_admission = true);

    bool settle(RunState& state, strategy::StrategyInterface& strategy, const Fill& fill);

    void enforce_cash_floor(RunState& state, strategy::StrategyInterface& strategy,
                            const Timestamp& ts);

    void mark(RunState& state, const Timestamp& ts, const data::MarketSnapshot* snapshot);

    void record_warning(RunState& state, const std::string& message);

    /**
     * @brief Count, log and keep an order the run refused
     */
    void record_rejection(RunState& state, const Timestamp& session, const std::string& symbol,
                          Side side, Quantity quantity, ErrorCode reason,
                          const std::string& message);

    BacktestResult finalize(RunState& state, const strategy::StrategyInterface& strategy,
                            const Timestamp& start, const Timestamp& end) const;

    std::unique_ptr<ExecutionModel> make_execution_model() const;

    BacktestConfig config_;
    std::shared_ptr<data::MarketDataSource> data_source_;
};

}  // namespace backtest
}  // namespace backfolio
