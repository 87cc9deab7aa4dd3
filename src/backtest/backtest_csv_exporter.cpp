// src/backtest/backtest_csv_exporter.cpp
#include "backfolio/backtest/backtest_csv_exporter.hpp"
#include <filesystem>
#include <iomanip>
#include "backfolio/core/logger.hpp"
#include "backfolio/core/time_utils.hpp"

namespace backfolio {
namespace backtest {

BacktestCSVExporter::BacktestCSVExporter(std::string output_directory)
    : output_directory_(std::move(output_directory)) {}

Result<void> BacktestCSVExporter::open_file(std::ofstream& file, const std::string& name) const {
    try {
        std::filesystem::create_directories(output_directory_);
    } catch (const std::filesystem::filesystem_error& e) {
        return make_error<void>(ErrorCode::FILE_IO_ERROR,
                                "Cannot create " + output_directory_ + ": " + e.what(),
                                "BacktestCSVExporter");
    }

    auto path = std::filesystem::path(output_directory_) / name;
    file.open(path);
    if (!file.is_open()) {
        return make_error<void>(ErrorCode::FILE_IO_ERROR,
                                "Failed to open " + path.string() + " for writing",
                                "BacktestCSVExporter");
    }
    file << std::setprecision(10);
    return Result<void>();
}

Result<void> BacktestCSVExporter::export_equity_curve(const BacktestResult& result) const {
    std::ofstream file;
    auto opened = open_file(file, "equity_curve.csv");
    if (opened.is_error()) {
        return opened;
    }

    file << "date,equity,drawdown\n";
    for (size_t i = 0; i < result.equity_curve.size() && i < result.equity_timestamps.size();
         ++i) {
        double drawdown = i < result.drawdown_curve.size() ? result.drawdown_curve[i] : 0.0;
        file << core::format_date(result.equity_timestamps[i]) << "," << result.equity_curve[i]
             << "," << drawdown << "\n";
    }
    return Result<void>();
}

Result<void> BacktestCSVExporter::export_trades(const BacktestResult& result) const {
    std::ofstream file;
    auto opened = open_file(file, "trades.csv");
    if (opened.is_error()) {
        return opened;
    }

    file << "symbol,direction,entry_date,exit_date,entry_price,exit_price,quantity,pnl,"
         << "return_pct,holding_period_days,commission,entry_order_id,exit_order_id\n";
    for (const auto& trade : result.completed_trades) {
        file << trade.symbol << "," << direction_to_string(trade.direction) << ","
             << core::format_date(trade.entry_time) << "," << core::format_date(trade.exit_time)
             << "," << trade.entry_price << "," << trade.exit_price << "," << trade.quantity
             << "," << trade.pnl << "," << trade.return_pct << "," << trade.holding_period_days
             << "," << trade.commission << "," << trade.entry_order_id << ","
             << trade.exit_order_id << "\n";
    }
    return Result<void>();
}

Result<void> BacktestCSVExporter::export_symbol_performance(const BacktestResult& result) const {
    std::ofstream file;
    auto opened = open_file(file, "symbol_performance.csv");
    if (opened.is_error()) {
        return opened;
    }

    file << "symbol,total_return_pct,total_trades,winning_trades,losing_trades,win_rate,"
         << "profit_factor,avg_holding_period,total_pnl,avg_win,avg_loss,total_commission\n";
    for (const auto& perf : result.symbol_performances) {
        file << perf.symbol << "," << perf.total_return << "," << perf.total_trades << ","
             << perf.winning_trades << "," << perf.losing_trades << "," << perf.win_rate << ","
             << perf.profit_factor << "," << perf.avg_holding_period << "," << perf.total_pnl
             << "," << perf.avg_win << "," << perf.avg_loss << "," << perf.total_commission
             << "\n";
    }
    return Result<void>();
}

Result<void> BacktestCSVExporter::export_all(const BacktestResult& result) const {
    auto status = export_equity_curve(result);
    if (status.is_error())
        return status;
    status = export_trades(result);
    if (status.is_error())
        return status;
    status = export_symbol_performance(result);
    if (status.is_error())
        return status;

    INFO("Exported backtest " << result.backtest_id << " to " << output_directory_);
    return Result<void>();
}

}  // namespace backtest
}  // namespace backfolio
