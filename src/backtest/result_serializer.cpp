// src/backtest/result_serializer.cpp
#include "backfolio/backtest/result_serializer.hpp"
#include <cmath>
#include <fstream>
#include <iterator>
#include <limits>
#include <stdexcept>
#include "backfolio/core/time_utils.hpp"

namespace backfolio {

namespace {

nlohmann::json number_to_json(double value) {
    if (std::isnan(value))
        return "nan";
    if (std::isinf(value))
        return value > 0 ? "inf" : "-inf";
    return value;
}

double number_from_json(const nlohmann::json& j) {
    if (j.is_string()) {
        const auto& text = j.get_ref<const std::string&>();
        if (text == "inf")
            return std::numeric_limits<double>::infinity();
        if (text == "-inf")
            return -std::numeric_limits<double>::infinity();
        if (text == "nan")
            return std::numeric_limits<double>::quiet_NaN();
        throw std::invalid_argument("Not a number: " + text);
    }
    return j.get<double>();
}

std::string timestamp_to_json(const Timestamp& ts) {
    return core::format_timestamp(ts);
}

Timestamp timestamp_from_json(const nlohmann::json& j) {
    auto text = j.get<std::string>();
    auto ts = core::parse_timestamp(text);
    if (!ts) {
        throw std::invalid_argument("Not a timestamp: " + text);
    }
    return *ts;
}

}  // namespace

void to_json(nlohmann::json& j, const Fill& fill) {
    j = nlohmann::json{{"symbol", fill.symbol},
                       {"side", side_to_string(fill.side)},
                       {"quantity", number_to_json(fill.quantity)},
                       {"price", number_to_json(fill.price)},
                       {"commission", number_to_json(fill.commission)},
                       {"timestamp", timestamp_to_json(fill.timestamp)},
                       {"order_id", fill.order_id}};
}

void from_json(const nlohmann::json& j, Fill& fill) {
    fill.symbol = j.at("symbol").get<std::string>();
    fill.side = side_from_string(j.at("side").get<std::string>());
    fill.quantity = number_from_json(j.at("quantity"));
    fill.price = number_from_json(j.at("price"));
    fill.commission = number_from_json(j.at("commission"));
    fill.timestamp = timestamp_from_json(j.at("timestamp"));
    fill.order_id = j.at("order_id").get<std::string>();
}

void to_json(nlohmann::json& j, const CompletedTrade& trade) {
    j = nlohmann::json{{"symbol", trade.symbol},
                       {"direction", direction_to_string(trade.direction)},
                       {"entry_time", timestamp_to_json(trade.entry_time)},
                       {"exit_time", timestamp_to_json(trade.exit_time)},
                       {"entry_price", number_to_json(trade.entry_price)},
                       {"exit_price", number_to_json(trade.exit_price)},
                       {"quantity", number_to_json(trade.quantity)},
                       {"pnl", number_to_json(trade.pnl)},
                       {"return_pct", number_to_json(trade.return_pct)},
                       {"holding_period_days", trade.holding_period_days},
                       {"commission", number_to_json(trade.commission)},
                       {"entry_order_id", trade.entry_order_id},
                       {"exit_order_id", trade.exit_order_id}};
}

void from_json(const nlohmann::json& j, CompletedTrade& trade) {
    trade.symbol = j.at("symbol").get<std::string>();
    trade.direction = direction_from_string(j.at("direction").get<std::string>());
    trade.entry_time = timestamp_from_json(j.at("entry_time"));
    trade.exit_time = timestamp_from_json(j.at("exit_time"));
    trade.entry_price = number_from_json(j.at("entry_price"));
    trade.exit_price = number_from_json(j.at("exit_price"));
    trade.quantity = number_from_json(j.at("quantity"));
    trade.pnl = number_from_json(j.at("pnl"));
    trade.return_pct = number_from_json(j.at("return_pct"));
    trade.holding_period_days = j.at("holding_period_days").get<int>();
    trade.commission = number_from_json(j.at("commission"));
    trade.entry_order_id = j.at("entry_order_id").get<std::string>();
    trade.exit_order_id = j.at("exit_order_id").get<std::string>();
}

namespace backtest {

void to_json(nlohmann::json& j, const SymbolPerformance& perf) {
    j = nlohmann::json{{"symbol", perf.symbol},
                       {"total_return", number_to_json(perf.total_return)},
                       {"total_trades", perf.total_trades},
                       {"winning_trades", perf.winning_trades},
                       {"losing_trades", perf.losing_trades},
                       {"win_rate", number_to_json(perf.win_rate)},
                       {"profit_factor", number_to_json(perf.profit_factor)},
                       {"avg_holding_period", number_to_json(perf.avg_holding_period)},
                       {"total_pnl", number_to_json(perf.total_pnl)},
                       {"avg_win", number_to_json(perf.avg_win)},
                       {"avg_loss", number_to_json(perf.avg_loss)},
                       {"total_commission", number_to_json(perf.total_commission)}};
}

void from_json(const nlohmann::json& j, SymbolPerformance& perf) {
    perf.symbol = j.at("symbol").get<std::string>();
    perf.total_return = number_from_json(j.at("total_return"));
    perf.total_trades = j.at("total_trades").get<int>();
    perf.winning_trades = j.at("winning_trades").get<int>();
    perf.losing_trades = j.at("losing_trades").get<int>();
    perf.win_rate = number_from_json(j.at("win_rate"));
    perf.profit_factor = number_from_json(j.at("profit_factor"));
    perf.avg_holding_period = number_from_json(j.at("avg_holding_period"));
    perf.total_pnl = number_from_json(j.at("total_pnl"));
    perf.avg_win = number_from_json(j.at("avg_win"));
    perf.avg_loss = number_from_json(j.at("avg_loss"));
    perf.total_commission = number_from_json(j.at("total_commission"));
}

void to_json(nlohmann::json& j, const RunDiagnostics& d) {
    j = nlohmann::json{{"sessions_total", d.sessions_total},
                       {"sessions_effective", d.sessions_effective},
                       {"skipped_sessions", d.skipped_sessions},
                       {"strategy_errors", d.strategy_errors},
                       {"rejected_orders", d.rejected_orders},
                       {"dropped_orders", d.dropped_orders},
                       {"allocation_warnings", d.allocation_warnings},
                       {"invariant_violations", d.invariant_violations},
                       {"forced_liquidations", d.forced_liquidations},
                       {"unpriced_instruments", d.unpriced_instruments}};
}

void from_json(const nlohmann::json& j, RunDiagnostics& d) {
    d.sessions_total = j.at("sessions_total").get<int>();
    d.sessions_effective = j.at("sessions_effective").get<int>();
    d.skipped_sessions = j.at("skipped_sessions").get<int>();
    d.strategy_errors = j.at("strategy_errors").get<int>();
    d.rejected_orders = j.at("rejected_orders").get<int>();
    d.dropped_orders = j.at("dropped_orders").get<int>();
    d.allocation_warnings = j.at("allocation_warnings").get<int>();
    d.invariant_violations = j.at("invariant_violations").get<int>();
    d.forced_liquidations = j.at("forced_liquidations").get<int>();
    d.unpriced_instruments = j.at("unpriced_instruments").get<int>();
}

void to_json(nlohmann::json& j, const OrderRejection& rejection) {
    j = nlohmann::json{{"session", timestamp_to_json(rejection.session)},
                       {"symbol", rejection.symbol},
                       {"side", side_to_string(rejection.side)},
                       {"quantity", number_to_json(rejection.quantity)},
                       {"reason", error_code_to_string(rejection.reason)},
                       {"message", rejection.message}};
}

void from_json(const nlohmann::json& j, OrderRejection& rejection) {
    rejection.session = timestamp_from_json(j.at("session"));
    rejection.symbol = j.at("symbol").get<std::string>();
    rejection.side = side_from_string(j.at("side").get<std::string>());
    rejection.quantity = number_from_json(j.at("quantity"));
    rejection.reason = error_code_from_string(j.at("reason").get<std::string>());
    rejection.message = j.at("message").get<std::string>();
}

void to_json(nlohmann::json& j, const BacktestResult& r) {
    j = nlohmann::json::object();
    j["backtest_id"] = r.backtest_id;
    j["strategy_name"] = r.strategy_name;
    j["parameters"] = r.parameters;
    j["start_date"] = timestamp_to_json(r.start_date);
    j["end_date"] = timestamp_to_json(r.end_date);

    j["initial_capital"] = number_to_json(r.initial_capital);
    j["final_equity"] = number_to_json(r.final_equity);
    j["total_return"] = number_to_json(r.total_return);
    j["mdd"] = number_to_json(r.mdd);
    j["sharpe_ratio"] = number_to_json(r.sharpe_ratio);
    j["win_rate"] = number_to_json(r.win_rate);
    j["profit_factor"] = number_to_json(r.profit_factor);
    j["total_trades"] = r.total_trades;

    j["volatility"] = number_to_json(r.volatility);
    j["sortino_ratio"] = number_to_json(r.sortino_ratio);
    j["calmar_ratio"] = number_to_json(r.calmar_ratio);
    j["avg_win"] = number_to_json(r.avg_win);
    j["avg_loss"] = number_to_json(r.avg_loss);
    j["avg_holding_period"] = number_to_json(r.avg_holding_period);
    j["max_consecutive_wins"] = r.max_consecutive_wins;
    j["max_consecutive_losses"] = r.max_consecutive_losses;

    nlohmann::json curve = nlohmann::json::array();
    for (double equity : r.equity_curve) {
        curve.push_back(number_to_json(equity));
    }
    j["equity_curve"] = curve;

    nlohmann::json timestamps = nlohmann::json::array();
    for (const auto& ts : r.equity_timestamps) {
        timestamps.push_back(timestamp_to_json(ts));
    }
    j["equity_timestamps"] = timestamps;

    nlohmann::json drawdowns = nlohmann::json::array();
    for (double dd : r.drawdown_curve) {
        drawdowns.push_back(number_to_json(dd));
    }
    j["drawdown_curve"] = drawdowns;

    j["symbol_performances"] = r.symbol_performances;
    j["diagnostics"] = r.diagnostics;
    j["warnings"] = r.warnings;
    j["rejections"] = r.rejections;
    j["completed_trades"] = r.completed_trades;
    j["fills"] = r.fills;
}

void from_json(const nlohmann::json& j, BacktestResult& r) {
    r.backtest_id = j.at("backtest_id").get<std::string>();
    r.strategy_name = j.at("strategy_name").get<std::string>();
    r.parameters = j.at("parameters");
    r.start_date = timestamp_from_json(j.at("start_date"));
    r.end_date = timestamp_from_json(j.at("end_date"));

    r.initial_capital = number_from_json(j.at("initial_capital"));
    r.final_equity = number_from_json(j.at("final_equity"));
    r.total_return = number_from_json(j.at("total_return"));
    r.mdd = number_from_json(j.at("mdd"));
    r.sharpe_ratio = number_from_json(j.at("sharpe_ratio"));
    r.win_rate = number_from_json(j.at("win_rate"));
    r.profit_factor = number_from_json(j.at("profit_factor"));
    r.total_trades = j.at("total_trades").get<int>();

    if (j.contains("volatility"))
        r.volatility = number_from_json(j.at("volatility"));
    if (j.contains("sortino_ratio"))
        r.sortino_ratio = number_from_json(j.at("sortino_ratio"));
    if (j.contains("calmar_ratio"))
        r.calmar_ratio = number_from_json(j.at("calmar_ratio"));
    if (j.contains("avg_win"))
        r.avg_win = number_from_json(j.at("avg_win"));
    if (j.contains("avg_loss"))
        r.avg_loss = number_from_json(j.at("avg_loss"));
    if (j.contains("avg_holding_period"))
        r.avg_holding_period = number_from_json(j.at("avg_holding_period"));
    if (j.contains("max_consecutive_wins"))
        r.max_consecutive_wins = j.at("max_consecutive_wins").get<int>();
    if (j.contains("max_consecutive_losses"))
        r.max_consecutive_losses = j.at("max_consecutive_losses").get<int>();

    r.equity_curve.clear();
    for (const auto& value : j.at("equity_curve")) {
        r.equity_curve.push_back(number_from_json(value));
    }
    r.equity_timestamps.clear();
    for (const auto& value : j.at("equity_timestamps")) {
        r.equity_timestamps.push_back(timestamp_from_json(value));
    }
    r.drawdown_curve.clear();
    if (j.contains("drawdown_curve")) {
        for (const auto& value : j.at("drawdown_curve")) {
            r.drawdown_curve.push_back(number_from_json(value));
        }
    }

    r.symbol_performances = j.at("symbol_performances").get<std::vector<SymbolPerformance>>();
    if (j.contains("diagnostics"))
        r.diagnostics = j.at("diagnostics").get<RunDiagnostics>();
    if (j.contains("warnings"))
        r.warnings = j.at("warnings").get<std::vector<std::string>>();
    r.rejections.clear();
    if (j.contains("rejections"))
        r.rejections = j.at("rejections").get<std::vector<OrderRejection>>();
    if (j.contains("completed_trades"))
        r.completed_trades = j.at("completed_trades").get<std::vector<CompletedTrade>>();
    if (j.contains("fills"))
        r.fills = j.at("fills").get<std::vector<Fill>>();
}

void to_json(nlohmann::json& j, const SymbolDetail& detail) {
    j = nlohmann::json{{"performance", detail.performance},
                       {"trades", detail.trades},
                       {"fills", detail.fills},
                       {"rejections", detail.rejections}};
}

std::string ResultSerializer::to_string(const BacktestResult& result, int indent) {
    nlohmann::json j = result;
    return j.dump(indent);
}

Result<BacktestResult> ResultSerializer::from_string(const std::string& text) {
    try {
        return nlohmann::json::parse(text).get<BacktestResult>();
    } catch (const nlohmann::json::parse_error& e) {
        return make_error<BacktestResult>(ErrorCode::JSON_PARSE_ERROR,
                                          std::string("Malformed result JSON: ") + e.what(),
                                          "ResultSerializer");
    } catch (const std::exception& e) {
        return make_error<BacktestResult>(ErrorCode::INVALID_DATA,
                                          std::string("Invalid result JSON: ") + e.what(),
                                          "ResultSerializer");
    }
}

Result<void> ResultSerializer::save_to_file(const BacktestResult& result,
                                            const std::string& filepath) {
    std::ofstream file(filepath);
    if (!file.is_open()) {
        return make_error<void>(ErrorCode::FILE_IO_ERROR,
                                "Failed to open file for writing: " + filepath,
                                "ResultSerializer");
    }
    file << to_string(result, 4) << std::endl;
    if (!file) {
        return make_error<void>(ErrorCode::FILE_IO_ERROR, "Failed to write " + filepath,
                                "ResultSerializer");
    }
    return Result<void>();
}

Result<BacktestResult> ResultSerializer::load_from_file(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        return make_error<BacktestResult>(ErrorCode::FILE_IO_ERROR,
                                          "Failed to open file for reading: " + filepath,
                                          "ResultSerializer");
    }
    std::string text((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    return from_string(text);
}

}  // namespace backtest
}  // namespace backfolio
