// include/backfolio/backtest/backtest_metrics_calculator.hpp
#pragma once

#include <string>
#include <vector>
#include "backfolio/backtest/backtest_types.hpp"
#include "backfolio/core/types.hpp"

namespace backfolio {
namespace backtest {

/**
 * @brief Annualization settings for return-based metrics
 */
struct MetricsSettings {
    double periods_per_year{252.0};
    double risk_free_rate{0.0};  // annual
};

/**
 * @brief Pure stateless calculation component for backtest metrics
 *
 * Reduces a frozen trade ledger and equity series into a BacktestResult.
 * All methods are const and deterministic: the same input always produces
 * the same output, field for field.
 *
 * Conventions:
 * - Returns and drawdowns are fractions (0.10 = 10%)
 * - Win rates and per-trade returns are percentages
 * - Standard deviations are population deviations
 */
class BacktestMetricsCalculator {
public:
    explicit BacktestMetricsCalculator(MetricsSettings settings = MetricsSettings{});

    // ========== Return Calculations ==========

    /**
     * @brief Total return as decimal (0.10 = 10%); 0 if start_value <= 0
     */
    double calculate_total_return(double start_value, double end_value) const;

    /**
     * @brief Simple period returns r[t] = equity[t] / equity[t-1] - 1
     *
     * Periods whose previous equity is not positive are skipped.
     */
    std::vector<double> calculate_returns_from_equity(
        const std::vector<EquitySample>& equity) const;

    // ========== Risk-Adjusted Return Metrics ==========

    /**
     * @brief Annualized Sharpe ratio
     *
     * (mean(r) - rf / periods_per_year) / stdev(r) * sqrt(periods_per_year).
     * Returns 0 with fewer than two returns or zero deviation.
     */
    double calculate_sharpe_ratio(const std::vector<double>& returns) const;

    /**
     * @brief Annualized Sortino ratio; 0 when there is no downside deviation
     */
    double calculate_sortino_ratio(const std::vector<double>& returns) const;

    /**
     * @brief Total return over maximum drawdown; 0 when there is no drawdown
     */
    double calculate_calmar_ratio(double total_return, double max_drawdown) const;

    // ========== Volatility Metrics ==========

    double calculate_volatility(const std::vector<double>& returns) const;

    double calculate_downside_volatility(const std::vector<double>& returns,
                                         double target = 0.0) const;

    // ========== Drawdown Metrics ==========

    /**
     * @brief Drawdown at every sample relative to the running peak, as positive fractions
     */
    std::vector<double> calculate_drawdowns(const std::vector<EquitySample>& equity) const;

    /**
     * @brief -min(equity[t] / runmax(equity[0..t]) - 1), as a positive fraction
     */
    double calculate_max_drawdown(const std::vector<EquitySample>& equity) const;

    // ========== Trade Statistics ==========

    struct TradeStatistics {
        int total_trades = 0;
        int winning_trades = 0;
        int losing_trades = 0;
        double win_rate = 0.0;  // percent
        double profit_factor = 0.0;
        double gross_profit = 0.0;
        double gross_loss = 0.0;  // positive magnitude
        double net_pnl = 0.0;
        double avg_win = 0.0;
        double avg_loss = 0.0;
        double avg_holding_period = 0.0;
        double total_commission = 0.0;
        int max_consecutive_wins = 0;
        int max_consecutive_losses = 0;
    };

    /**
     * @brief Win/loss statistics over completed trades in closing order
     *
     * profit_factor is +infinity when trades exist but none lost, and 0 when
     * there are no trades.
     */
    TradeStatistics calculate_trade_statistics(const std::vector<CompletedTrade>& trades) const;

    // ========== Per-Symbol Analysis ==========

    /**
     * @brief Performance for one instrument from its trades
     * @param initial_capital Capital the instrument's total_return is expressed against
     */
    SymbolPerformance calculate_symbol_performance(const std::string& symbol,
                                                   const std::vector<CompletedTrade>& trades,
                                                   double initial_capital) const;

    /**
     * @brief One entry per instrument with at least one trade, ordered by instrument id
     */
    std::vector<SymbolPerformance> calculate_symbol_performances(
        const std::vector<CompletedTrade>& trades, double initial_capital) const;

    // ========== Composite Calculation ==========

    /**
     * @brief Reduce a finished run into a BacktestResult
     *
     * Identification fields (id, strategy, parameters, dates) and diagnostics
     * are left for the caller to fill in.
     *
     * @param trades Completed trades in closing order
     * @param equity Equity samples with strictly increasing timestamps
     * @param initial_capital Starting cash of the run
     */
    BacktestResult reduce(const std::vector<CompletedTrade>& trades,
                          const std::vector<EquitySample>& equity, double initial_capital) const;

    const MetricsSettings& settings() const {
        return settings_;
    }

private:
    double calculate_mean(const std::vector<double>& values) const;
    double calculate_std_dev(const std::vector<double>& values, double mean) const;

    MetricsSettings settings_;
};

}  // namespace backtest
}  // namespace backfolio
