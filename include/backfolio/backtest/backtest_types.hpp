// include/backfolio/backtest/backtest_types.hpp
#pragma once

#include <map>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include "backfolio/core/error.hpp"
#include "backfolio/core/types.hpp"

namespace backfolio {
namespace backtest {

/**
 * @brief Aggregated statistics for one instrument
 *
 * total_return is the instrument's summed pnl as a percentage of the run's
 * initial capital, so it can be recomputed from the trade list alone.
 */
struct SymbolPerformance {
    std::string symbol;
    double total_return{0.0};  // percent of initial capital
    int total_trades{0};
    int winning_trades{0};
    int losing_trades{0};
    double win_rate{0.0};       // percent
    double profit_factor{0.0};  // +infinity when there are trades but no losses
    double avg_holding_period{0.0};  // days
    double total_pnl{0.0};
    double avg_win{0.0};
    double avg_loss{0.0};  // reported as a positive magnitude
    double total_commission{0.0};
};

/**
 * @brief Degradation counters collected during a run
 */
struct RunDiagnostics {
    int sessions_total{0};
    int sessions_effective{0};  // sessions that produced an equity sample
    int skipped_sessions{0};    // snapshot or strategy failures
    int strategy_errors{0};     // subset of skipped_sessions
    int rejected_orders{0};
    int dropped_orders{0};      // below minimum rebalance cost
    int allocation_warnings{0};
    int invariant_violations{0};
    int forced_liquidations{0};
    int unpriced_instruments{0};
};

/**
 * @brief An order the engine refused to settle
 */
struct OrderRejection {
    Timestamp session;
    std::string symbol;
    Side side{Side::NONE};
    Quantity quantity{0.0};
    ErrorCode reason{ErrorCode::ORDER_REJECTED};
    std::string message;
};

/**
 * @brief Final output of a backtest run
 */
struct BacktestResult {
    std::string backtest_id;
    std::string strategy_name;
    nlohmann::json parameters = nlohmann::json::object();
    Timestamp start_date;
    Timestamp end_date;

    double initial_capital{0.0};
    double final_equity{0.0};
    double total_return{0.0};  // fraction
    double mdd{0.0};           // positive fraction
    double sharpe_ratio{0.0};
    double win_rate{0.0};       // percent, over all trades
    double profit_factor{0.0};  // over all trades
    int total_trades{0};

    // Extended statistics
    double volatility{0.0};
    double sortino_ratio{0.0};
    double calmar_ratio{0.0};
    double avg_win{0.0};
    double avg_loss{0.0};
    double avg_holding_period{0.0};
    int max_consecutive_wins{0};
    int max_consecutive_losses{0};

    std::vector<double> equity_curve;
    std::vector<Timestamp> equity_timestamps;
    std::vector<double> drawdown_curve;

    // Ordered by instrument id
    std::vector<SymbolPerformance> symbol_performances;

    RunDiagnostics diagnostics;
    std::vector<std::string> warnings;
    std::vector<OrderRejection> rejections;  // one per rejected_orders count, in run order

    // Ledger snapshots for on-demand symbol detail
    std::vector<CompletedTrade> completed_trades;
    std::vector<Fill> fills;
};

/**
 * @brief Drill-down for one instrument of a finished run
 */
struct SymbolDetail {
    SymbolPerformance performance;
    std::vector<CompletedTrade> trades;  // in closing order
    std::vector<Fill> fills;             // in execution order
    std::vector<OrderRejection> rejections;
};

}  // namespace backtest
}  // namespace backfolio
