// include/backfolio/backtest/result_serializer.hpp
#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include "backfolio/backtest/backtest_types.hpp"
#include "backfolio/core/error.hpp"

namespace backfolio {

// Ledger records
void to_json(nlohmann::json& j, const Fill& fill);
void from_json(const nlohmann::json& j, Fill& fill);
void to_json(nlohmann::json& j, const CompletedTrade& trade);
void from_json(const nlohmann::json& j, CompletedTrade& trade);

namespace backtest {

void to_json(nlohmann::json& j, const SymbolPerformance& perf);
void from_json(const nlohmann::json& j, SymbolPerformance& perf);
void to_json(nlohmann::json& j, const RunDiagnostics& diagnostics);
void from_json(const nlohmann::json& j, RunDiagnostics& diagnostics);
void to_json(nlohmann::json& j, const OrderRejection& rejection);
void from_json(const nlohmann::json& j, OrderRejection& rejection);
void to_json(nlohmann::json& j, const BacktestResult& result);
void from_json(const nlohmann::json& j, BacktestResult& result);
void to_json(nlohmann::json& j, const SymbolDetail& detail);

/**
 * @brief JSON encoding of backtest results
 *
 * Doubles are written with round-trip precision and timestamps as
 * "YYYY-MM-DD HH:MM:SS" UTC strings. Non-finite numbers, such as the profit
 * factor of a run without losses, are written as the strings "inf", "-inf"
 * and "nan". Serializing the same result twice yields identical text.
 */
class ResultSerializer {
public:
    static std::string to_string(const BacktestResult& result, int indent = -1);

    static Result<BacktestResult> from_string(const std::string& text);

    static Result<void> save_to_file(const BacktestResult& result, const std::string& filepath);

    static Result<BacktestResult> load_from_file(const std::string& filepath);
};

}  // namespace backtest
}  // namespace backfolio
