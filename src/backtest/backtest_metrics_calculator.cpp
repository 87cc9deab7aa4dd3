// src/backtest/backtest_metrics_calculator.cpp

#include "backfolio/backtest/backtest_metrics_calculator.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <map>
#include <numeric>

namespace backfolio {
namespace backtest {

namespace {
// Deviations below this are treated as zero
constexpr double kMinDeviation = 1e-12;
}  // namespace

BacktestMetricsCalculator::BacktestMetricsCalculator(MetricsSettings settings)
    : settings_(settings) {}

// ========== Return Calculations ==========

double BacktestMetricsCalculator::calculate_total_return(double start_value,
                                                         double end_value) const {
    if (start_value <= 0.0) {
        return 0.0;
    }
    return (end_value - start_value) / start_value;
}

std::vector<double> BacktestMetricsCalculator::calculate_returns_from_equity(
    const std::vector<EquitySample>& equity) const {
    std::vector<double> returns;
    if (equity.size() < 2) {
        return returns;
    }

    returns.reserve(equity.size() - 1);
    for (size_t i = 1; i < equity.size(); ++i) {
        if (equity[i - 1].equity > 0.0) {
            returns.push_back(equity[i].equity / equity[i - 1].equity - 1.0);
        }
    }
    return returns;
}

// ========== Risk-Adjusted Return Metrics ==========

double BacktestMetricsCalculator::calculate_sharpe_ratio(const std::vector<double>& returns) const {
    if (returns.size() < 2 || settings_.periods_per_year <= 0.0) {
        return 0.0;
    }

    double mean_return = calculate_mean(returns);
    double std_dev = calculate_std_dev(returns, mean_return);
    if (std_dev < kMinDeviation) {
        return 0.0;
    }

    double period_rf = settings_.risk_free_rate / settings_.periods_per_year;
    return (mean_return - period_rf) / std_dev * std::sqrt(settings_.periods_per_year);
}

double BacktestMetricsCalculator::calculate_sortino_ratio(const std::vector<double>& returns) const {
    if (returns.size() < 2 || settings_.periods_per_year <= 0.0) {
        return 0.0;
    }

    double downside_vol = calculate_downside_volatility(returns, 0.0);
    if (downside_vol < kMinDeviation) {
        return 0.0;
    }

    double mean_return = calculate_mean(returns);
    double period_rf = settings_.risk_free_rate / settings_.periods_per_year;
    return (mean_return - period_rf) * settings_.periods_per_year / downside_vol;
}

double BacktestMetricsCalculator::calculate_calmar_ratio(double total_return,
                                                         double max_drawdown) const {
    if (max_drawdown <= 0.0) {
        return 0.0;
    }
    return total_return / max_drawdown;
}

// ========== Volatility Metrics ==========

double BacktestMetricsCalculator::calculate_volatility(const std::vector<double>& returns) const {
    if (returns.size() < 2) {
        return 0.0;
    }
    double mean_return = calculate_mean(returns);
    return calculate_std_dev(returns, mean_return) * std::sqrt(settings_.periods_per_year);
}

double BacktestMetricsCalculator::calculate_downside_volatility(const std::vector<double>& returns,
                                                                double target) const {
    double downside_sum = 0.0;
    int downside_count = 0;

    for (double ret : returns) {
        if (ret < target) {
            double deviation = ret - target;
            downside_sum += deviation * deviation;
            downside_count++;
        }
    }

    if (downside_count == 0) {
        return 0.0;
    }
    return std::sqrt(downside_sum / downside_count) * std::sqrt(settings_.periods_per_year);
}

// ========== Drawdown Metrics ==========

std::vector<double> BacktestMetricsCalculator::calculate_drawdowns(
    const std::vector<EquitySample>& equity) const {
    std::vector<double> drawdowns;
    drawdowns.reserve(equity.size());

    double peak = -std::numeric_limits<double>::infinity();
    for (const auto& sample : equity) {
        peak = std::max(peak, sample.equity);
        double drawdown = peak > 0.0 ? 1.0 - sample.equity / peak : 0.0;
        drawdowns.push_back(std::max(0.0, drawdown));
    }
    return drawdowns;
}

double BacktestMetricsCalculator::calculate_max_drawdown(
    const std::vector<EquitySample>& equity) const {
    auto drawdowns = calculate_drawdowns(equity);
    if (drawdowns.empty()) {
        return 0.0;
    }
    return *std::max_element(drawdowns.begin(), drawdowns.end());
}

// ========== Trade Statistics ==========

BacktestMetricsCalculator::TradeStatistics BacktestMetricsCalculator::calculate_trade_statistics(
    const std::vector<CompletedTrade>& trades) const {
    TradeStatistics stats;
    stats.total_trades = static_cast<int>(trades.size());
    if (trades.empty()) {
        return stats;
    }

    int win_streak = 0;
    int loss_streak = 0;
    double holding_sum = 0.0;

    for (const auto& trade : trades) {
        stats.net_pnl += trade.pnl;
        stats.total_commission += trade.commission;
        holding_sum += trade.holding_period_days;

        if (trade.pnl > 0.0) {
            stats.winning_trades++;
            stats.gross_profit += trade.pnl;
            win_streak++;
            loss_streak = 0;
        } else if (trade.pnl < 0.0) {
            stats.losing_trades++;
            stats.gross_loss -= trade.pnl;
            loss_streak++;
            win_streak = 0;
        } else {
            win_streak = 0;
            loss_streak = 0;
        }
        stats.max_consecutive_wins = std::max(stats.max_consecutive_wins, win_streak);
        stats.max_consecutive_losses = std::max(stats.max_consecutive_losses, loss_streak);
    }

    stats.win_rate =
        static_cast<double>(stats.winning_trades) / static_cast<double>(stats.total_trades) * 100.0;
    stats.avg_win = stats.winning_trades > 0 ? stats.gross_profit / stats.winning_trades : 0.0;
    stats.avg_loss = stats.losing_trades > 0 ? stats.gross_loss / stats.losing_trades : 0.0;
    stats.avg_holding_period = holding_sum / static_cast<double>(stats.total_trades);

    if (stats.gross_loss > 0.0) {
        stats.profit_factor = stats.gross_profit / stats.gross_loss;
    } else {
        stats.profit_factor = std::numeric_limits<double>::infinity();
    }

    return stats;
}

// ========== Per-Symbol Analysis ==========

SymbolPerformance BacktestMetricsCalculator::calculate_symbol_performance(
    const std::string& symbol, const std::vector<CompletedTrade>& trades,
    double initial_capital) const {
    TradeStatistics stats = calculate_trade_statistics(trades);

    SymbolPerformance perf;
    perf.symbol = symbol;
    perf.total_trades = stats.total_trades;
    perf.winning_trades = stats.winning_trades;
    perf.losing_trades = stats.losing_trades;
    perf.win_rate = stats.win_rate;
    perf.profit_factor = stats.profit_factor;
    perf.avg_holding_period = stats.avg_holding_period;
    perf.total_pnl = stats.net_pnl;
    perf.avg_win = stats.avg_win;
    perf.avg_loss = stats.avg_loss;
    perf.total_commission = stats.total_commission;
    perf.total_return = initial_capital > 0.0 ? stats.net_pnl / initial_capital * 100.0 : 0.0;
    return perf;
}

std::vector<SymbolPerformance> BacktestMetricsCalculator::calculate_symbol_performances(
    const std::vector<CompletedTrade>& trades, double initial_capital) const {
    // std::map keeps instruments ordered by id
    std::map<std::string, std::vector<CompletedTrade>> by_symbol;
    for (const auto& trade : trades) {
        by_symbol[trade.symbol].push_back(trade);
    }

    std::vector<SymbolPerformance> performances;
    performances.reserve(by_symbol.size());
    for (const auto& [symbol, symbol_trades] : by_symbol) {
        performances.push_back(calculate_symbol_performance(symbol, symbol_trades,
                                                            initial_capital));
    }
    return performances;
}

// ========== Composite Calculation ==========

BacktestResult BacktestMetricsCalculator::reduce(const std::vector<CompletedTrade>& trades,
                                                 const std::vector<EquitySample>& equity,
                                                 double initial_capital) const {
    BacktestResult result;
    result.initial_capital = initial_capital;

    result.equity_curve.reserve(equity.size());
    result.equity_timestamps.reserve(equity.size());
    for (const auto& sample : equity) {
        result.equity_curve.push_back(sample.equity);
        result.equity_timestamps.push_back(sample.timestamp);
    }

    result.final_equity = equity.empty() ? initial_capital : equity.back().equity;
    result.total_return = calculate_total_return(initial_capital, result.final_equity);

    result.drawdown_curve = calculate_drawdowns(equity);
    result.mdd = result.drawdown_curve.empty()
                     ? 0.0
                     : *std::max_element(result.drawdown_curve.begin(),
                                         result.drawdown_curve.end());

    std::vector<double> returns = calculate_returns_from_equity(equity);
    result.sharpe_ratio = calculate_sharpe_ratio(returns);
    result.sortino_ratio = calculate_sortino_ratio(returns);
    result.volatility = calculate_volatility(returns);
    result.calmar_ratio = calculate_calmar_ratio(result.total_return, result.mdd);

    TradeStatistics stats = calculate_trade_statistics(trades);
    result.total_trades = stats.total_trades;
    result.win_rate = stats.win_rate;
    result.profit_factor = stats.profit_factor;
    result.avg_win = stats.avg_win;
    result.avg_loss = stats.avg_loss;
    result.avg_holding_period = stats.avg_holding_period;
    result.max_consecutive_wins = stats.max_consecutive_wins;
    result.max_consecutive_losses = stats.max_consecutive_losses;

    result.symbol_performances = calculate_symbol_performances(trades, initial_capital);
    result.completed_trades = trades;
    return result;
}

// ========== Helper Methods ==========

double BacktestMetricsCalculator::calculate_mean(const std::vector<double>& values) const {
    if (values.empty()) {
        return 0.0;
    }
    return std::accumulate(values.begin(), values.end(), 0.0) /
           static_cast<double>(values.size());
}

double BacktestMetricsCalculator::calculate_std_dev(const std::vector<double>& values,
                                                    double mean) const {
    if (values.empty()) {
        return 0.0;
    }
    double sq_sum = 0.0;
    for (double v : values) {
        sq_sum += (v - mean) * (v - mean);
    }
    return std::sqrt(sq_sum / static_cast<double>(values.size()));
}

}  // namespace backtest
}  // namespace backfolio
