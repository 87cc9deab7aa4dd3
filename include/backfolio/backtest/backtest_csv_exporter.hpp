// include/backfolio/backtest/backtest_csv_exporter.hpp
#pragma once

#include <fstream>
#include <string>
#include "backfolio/backtest/backtest_types.hpp"
#include "backfolio/core/error.hpp"

namespace backfolio {
namespace backtest {

/**
 * @brief Writes a finished backtest as CSV files
 *
 * Files written under the output directory:
 *   equity_curve.csv        date,equity,drawdown
 *   trades.csv              one row per completed trade
 *   symbol_performance.csv  one row per traded instrument
 */
class BacktestCSVExporter {
public:
    explicit BacktestCSVExporter(std::string output_directory);

    Result<void> export_equity_curve(const BacktestResult& result) const;
    Result<void> export_trades(const BacktestResult& result) const;
    Result<void> export_symbol_performance(const BacktestResult& result) const;

    /**
     * @brief Write all three files, stopping at the first failure
     */
    Result<void> export_all(const BacktestResult& result) const;

    const std::string& output_directory() const {
        return output_directory_;
    }

private:
    Result<void> open_file(std::ofstream& file, const std::string& name) const;

    std::string output_directory_;
};

}  // namespace backtest
}  // namespace backfolio
