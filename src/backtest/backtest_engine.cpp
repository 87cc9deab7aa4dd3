// src/backtest/backtest_engine.cpp
#include "backfolio/backtest/backtest_engine.hpp"
#include <algorithm>
#include <cmath>
#include <optional>
#include <sstream>
#include <stdexcept>
#include "backfolio/backtest/slippage_models.hpp"
#include "backfolio/core/logger.hpp"
#include "backfolio/core/run_id_generator.hpp"
#include "backfolio/core/time_utils.hpp"

namespace backfolio {
namespace backtest {

namespace {

constexpr double kCashEpsilon = 1e-9;

Timestamp end_of_day(const Timestamp& ts) {
    return ts + std::chrono::hours(24) - std::chrono::seconds(1);
}

bool within_dates(const Timestamp& ts, const Timestamp& start, const Timestamp& end) {
    return core::days_between(start, ts) >= 0 && core::days_between(ts, end) >= 0;
}

Timestamp parse_date_field(const nlohmann::json& j, const char* key) {
    auto text = j.at(key).get<std::string>();
    auto ts = core::parse_timestamp(text);
    if (!ts) {
        throw std::invalid_argument(std::string("Invalid ") + key + ": " + text);
    }
    return *ts;
}

}  // namespace

nlohmann::json BacktestConfig::to_json() const {
    nlohmann::json j;
    j["start_date"] = core::format_date(start_date);
    j["end_date"] = core::format_date(end_date);
    j["symbol"] = symbol;
    j["initial_capital"] = initial_capital;
    j["commission"] = commission.to_json();
    j["slippage_model"] = slippage_model;
    j["slippage_bps"] = slippage_bps;
    j["trade_price_policy"] = trade_price_policy_to_string(trade_price_policy);
    j["min_rebalance_cost"] = min_rebalance_cost;
    j["max_positions"] = max_positions;
    j["min_cash_balance"] = min_cash_balance;
    j["rebalance_interval_sessions"] = rebalance_interval_sessions;
    j["periods_per_year"] = periods_per_year;
    j["risk_free_rate"] = risk_free_rate;
    j["long_only"] = long_only;
    j["data_frequency"] = frequency_to_string(data_frequency);
    j["strategy_name"] = strategy_name;
    j["strategy_params"] = strategy_params;
    j["version"] = version;
    return j;
}

void BacktestConfig::from_json(const nlohmann::json& j) {
    if (j.contains("start_date"))
        start_date = parse_date_field(j, "start_date");
    if (j.contains("end_date"))
        end_date = parse_date_field(j, "end_date");
    if (j.contains("symbol"))
        symbol = j.at("symbol").get<std::string>();
    if (j.contains("initial_capital"))
        initial_capital = j.at("initial_capital").get<double>();
    if (j.contains("commission"))
        commission.from_json(j.at("commission"));
    if (j.contains("slippage_model"))
        slippage_model = j.at("slippage_model").get<std::string>();
    if (j.contains("slippage_bps"))
        slippage_bps = j.at("slippage_bps").get<double>();
    if (j.contains("trade_price_policy"))
        trade_price_policy =
            trade_price_policy_from_string(j.at("trade_price_policy").get<std::string>());
    if (j.contains("min_rebalance_cost"))
        min_rebalance_cost = j.at("min_rebalance_cost").get<double>();
    if (j.contains("max_positions"))
        max_positions = j.at("max_positions").get<size_t>();
    if (j.contains("min_cash_balance"))
        min_cash_balance = j.at("min_cash_balance").get<double>();
    if (j.contains("rebalance_interval_sessions"))
        rebalance_interval_sessions = j.at("rebalance_interval_sessions").get<int>();
    if (j.contains("periods_per_year"))
        periods_per_year = j.at("periods_per_year").get<double>();
    if (j.contains("risk_free_rate"))
        risk_free_rate = j.at("risk_free_rate").get<double>();
    if (j.contains("long_only"))
        long_only = j.at("long_only").get<bool>();
    if (j.contains("data_frequency"))
        data_frequency = frequency_from_string(j.at("data_frequency").get<std::string>());
    if (j.contains("strategy_name"))
        strategy_name = j.at("strategy_name").get<std::string>();
    if (j.contains("strategy_params"))
        strategy_params = j.at("strategy_params");
    if (j.contains("version"))
        version = j.at("version").get<std::string>();
}

BacktestEngine::RunState::RunState(const BacktestConfig& config)
    : account(config.initial_capital),
      matcher(config.long_only),
      tracker(portfolio::RebalancePolicy{config.min_rebalance_cost, config.max_positions,
                                         config.min_cash_balance}) {}

BacktestEngine::BacktestEngine(BacktestConfig config,
                               std::shared_ptr<data::MarketDataSource> data_source)
    : config_(std::move(config)), data_source_(std::move(data_source)) {
    Logger::register_component("BacktestEngine");
}

std::unique_ptr<ExecutionModel> BacktestEngine::make_execution_model() const {
    std::unique_ptr<SlippageModel> slippage;
    if (config_.slippage_model == "VOLUME") {
        slippage = std::make_unique<VolumeSlippageModel>(VolumeSlippageConfig{});
    } else if (config_.slippage_bps > 0.0) {
        slippage = std::make_unique<BasisPointSlippageModel>(config_.slippage_bps);
    }
    return std::make_unique<SimulatedExecutionModel>(config_.trade_price_policy,
                                                     config_.commission, std::move(slippage));
}

Result<void> BacktestEngine::validate_setup(const strategy::StrategyInterface* strategy,
                                            const Timestamp& start, const Timestamp& end) const {
    if (!strategy) {
        return make_error<void>(ErrorCode::SETUP_ERROR, "No strategy supplied", "BacktestEngine");
    }
    if (start > end) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "Start date " + core::format_date(start) + " is after end date " +
                                    core::format_date(end),
                                "BacktestEngine");
    }
    if (!std::isfinite(config_.initial_capital) || config_.initial_capital <= 0.0) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "Initial capital must be positive", "BacktestEngine");
    }
    if (config_.rebalance_interval_sessions < 1) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "Rebalance interval must be at least one session",
                                "BacktestEngine");
    }
    if (config_.periods_per_year <= 0.0) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT, "Periods per year must be positive",
                                "BacktestEngine");
    }
    if (config_.commission.rate < 0.0 || config_.commission.minimum < 0.0) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT, "Commission must be non-negative",
                                "BacktestEngine");
    }
    return Result<void>();
}

Result<BacktestResult> BacktestEngine::run(std::shared_ptr<strategy::StrategyInterface> strategy,
                                           const CancellationToken* cancel) {
    return run(std::move(strategy), config_.start_date, config_.end_date, cancel);
}

Result<BacktestResult> BacktestEngine::run(std::shared_ptr<strategy::StrategyInterface> strategy,
                                           const Timestamp& start, const Timestamp& end,
                                           const CancellationToken* cancel) {
    auto setup = validate_setup(strategy.get(), start, end);
    if (setup.is_error()) {
        ERROR("Backtest setup failed: " << setup.error()->what());
        return make_error<BacktestResult>(setup.error()->code(), setup.error()->what(),
                                          "BacktestEngine");
    }

    if (!data_source_) {
        return make_error<BacktestResult>(ErrorCode::SETUP_ERROR, "No market data source",
                                          "BacktestEngine");
    }

    if (strategy->has_universe_selection()) {
        return run_portfolio(*strategy, start, end, cancel);
    }

    if (config_.symbol.empty()) {
        return make_error<BacktestResult>(
            ErrorCode::SETUP_ERROR,
            "Single-instrument strategy " + strategy->name() + " needs an instrument",
            "BacktestEngine");
    }

    auto series = data_source_->get_multi_ohlc({config_.symbol}, config_.data_frequency, start,
                                               end_of_day(end));
    if (series.is_error()) {
        return make_error<BacktestResult>(ErrorCode::SETUP_ERROR,
                                          "Failed to load " + config_.symbol + ": " +
                                              series.error()->what(),
                                          "BacktestEngine");
    }

    std::vector<Bar> bars;
    auto it = series.value().find(config_.symbol);
    if (it != series.value().end()) {
        for (const auto& bar : it->second) {
            if (within_dates(bar.timestamp, start, end)) {
                bars.push_back(bar);
            }
        }
    }
    if (bars.empty()) {
        WARN("No bars for " << config_.symbol << " between " << core::format_date(start)
                            << " and " << core::format_date(end));
    }

    return replay_bars(*strategy, bars, start, end, cancel);
}

Result<BacktestResult> BacktestEngine::run_single(
    std::shared_ptr<strategy::StrategyInterface> strategy, const std::vector<Bar>& bars,
    const CancellationToken* cancel) {
    Timestamp start = bars.empty() ? config_.start_date : bars.front().timestamp;
    Timestamp end = bars.empty() ? config_.end_date : bars.back().timestamp;
    if (end < start) {
        end = start;
    }

    auto setup = validate_setup(strategy.get(), start, end);
    if (setup.is_error()) {
        ERROR("Backtest setup failed: " << setup.error()->what());
        return make_error<BacktestResult>(setup.error()->code(), setup.error()->what(),
                                          "BacktestEngine");
    }
    if (strategy->has_universe_selection()) {
        return make_error<BacktestResult>(
            ErrorCode::SETUP_ERROR,
            "Strategy " + strategy->name() + " selects a universe and cannot replay one series",
            "BacktestEngine");
    }
    return replay_bars(*strategy, bars, start, end, cancel);
}

Result<BacktestResult> BacktestEngine::replay_bars(strategy::StrategyInterface& strategy,
                                                   const std::vector<Bar>& bars,
                                                   const Timestamp& start, const Timestamp& end,
                                                   const CancellationToken* cancel) {
    RunState state(config_);
    state.execution = make_execution_model();

    INFO("Starting single-instrument backtest of " << strategy.name() << " over " << bars.size()
                                                   << " bars");

    std::optional<Timestamp> last_bar_time;
    for (const auto& bar : bars) {
        if (last_bar_time && bar.timestamp <= *last_bar_time) {
            WARN("Skipping out-of-order bar for " << bar.symbol << " at "
                                                  << core::format_timestamp(bar.timestamp));
            continue;
        }
        last_bar_time = bar.timestamp;
        ++state.diagnostics.sessions_total;

        auto signals = strategy.on_bar(bar, state.account);
        if (signals.is_error()) {
            ++state.diagnostics.skipped_sessions;
            ++state.diagnostics.strategy_errors;
            record_warning(state, "Strategy error on " + core::format_date(bar.timestamp) +
                                      ": " + signals.error()->what());
        } else {
            for (const auto& signal : signals.value()) {
                const std::string& symbol = signal.symbol.empty() ? bar.symbol : signal.symbol;
                if (symbol != bar.symbol || !(signal.quantity > 0.0) ||
                    (signal.side != Side::BUY && signal.side != Side::SELL)) {
                    std::ostringstream msg;
                    msg << "Malformed signal for " << symbol << " qty " << signal.quantity;
                    record_rejection(state, bar.timestamp, symbol, signal.side, signal.quantity,
                                     ErrorCode::ORDER_REJECTED, msg.str());
                    continue;
                }
                execute_order(state, strategy, symbol, signal.side, signal.quantity, bar,
                              bar.timestamp);
            }

            state.today.clear();
            state.today[bar.symbol] = &bar;
            enforce_cash_floor(state, strategy, bar.timestamp);

            mark(state, bar.timestamp, nullptr);
            ++state.diagnostics.sessions_effective;
        }

        if (cancel && cancel->is_cancelled()) {
            INFO("Backtest of " << strategy.name() << " cancelled after "
                                << state.diagnostics.sessions_total << " bars");
            return make_error<BacktestResult>(ErrorCode::RUN_CANCELLED, "Backtest cancelled",
                                              "BacktestEngine");
        }
    }

    return finalize(state, strategy, start, end);
}

Result<BacktestResult> BacktestEngine::run_portfolio(strategy::StrategyInterface& strategy,
                                                     const Timestamp& start, const Timestamp& end,
                                                     const CancellationToken* cancel) {
    auto calendar = data_source_->get_trading_days(start, end);
    if (calendar.is_error()) {
        ERROR("Trading calendar unavailable: " << calendar.error()->what());
        return make_error<BacktestResult>(ErrorCode::SETUP_ERROR,
                                          "Trading calendar unavailable: " +
                                              std::string(calendar.error()->what()),
                                          "BacktestEngine");
    }

    std::vector<Timestamp> sessions = calendar.take_value();
    std::sort(sessions.begin(), sessions.end());
    sessions.erase(std::unique(sessions.begin(), sessions.end()), sessions.end());

    RunState state(config_);
    state.execution = make_execution_model();
    int sessions_since_rebalance = 0;
    bool rebalanced_once = false;

    INFO("Starting portfolio backtest of " << strategy.name() << " over " << sessions.size()
                                           << " sessions from " << core::format_date(start)
                                           << " to " << core::format_date(end));

    for (const auto& day : sessions) {
        ++state.diagnostics.sessions_total;
        const std::string date = core::format_date(day);

        // Snapshot
        auto snapshot_result = data_source_->get_market_snapshot(day);
        if (snapshot_result.is_error()) {
            ++state.diagnostics.skipped_sessions;
            record_warning(state, "Session " + date + " skipped: " +
                                      snapshot_result.error()->what());
            if (cancel && cancel->is_cancelled()) {
                return make_error<BacktestResult>(ErrorCode::RUN_CANCELLED,
                                                  "Backtest cancelled", "BacktestEngine");
            }
            continue;
        }
        const data::MarketSnapshot& snapshot = snapshot_result.value();

        bool rebalance_session =
            !rebalanced_once || sessions_since_rebalance >= config_.rebalance_interval_sessions;

        std::vector<std::string> held;
        for (const auto& [symbol, pos] : state.account.positions()) {
            held.push_back(symbol);
        }
        ensure_series(state, held, start, end);

        if (rebalance_session) {
            // Select
            auto universe_result = strategy.select_universe(day, snapshot);
            if (universe_result.is_error()) {
                ++state.diagnostics.skipped_sessions;
                ++state.diagnostics.strategy_errors;
                record_warning(state, "Session " + date + " skipped, universe selection failed: " +
                                          universe_result.error()->what());
                if (cancel && cancel->is_cancelled()) {
                    return make_error<BacktestResult>(ErrorCode::RUN_CANCELLED,
                                                      "Backtest cancelled", "BacktestEngine");
                }
                continue;
            }
            std::vector<std::string> universe = universe_result.take_value();

            // Allocate
            std::vector<TargetWeight> targets;
            if (!universe.empty()) {
                auto weights_result = strategy.get_target_weights(universe, snapshot, state.account);
                if (weights_result.is_error()) {
                    ++state.diagnostics.skipped_sessions;
                    ++state.diagnostics.strategy_errors;
                    record_warning(state, "Session " + date +
                                              " skipped, target allocation failed: " +
                                              weights_result.error()->what());
                    if (cancel && cancel->is_cancelled()) {
                        return make_error<BacktestResult>(ErrorCode::RUN_CANCELLED,
                                                          "Backtest cancelled", "BacktestEngine");
                    }
                    continue;
                }
                targets = weights_result.take_value();
            } else {
                DEBUG("Empty universe on " << date << ", holding cash");
            }

            auto sanitized = state.tracker.sanitize_weights(targets);
            for (const auto& warning : sanitized.warnings) {
                ++state.diagnostics.allocation_warnings;
                record_warning(state, date + ": " + warning);
            }

            std::vector<std::string> wanted;
            for (const auto& target : sanitized.weights) {
                wanted.push_back(target.symbol);
            }
            ensure_series(state, wanted, start, end);
            collect_session_bars(state, day);

            // Rebalance and settle
            rebalance(state, strategy, sanitized.weights, day);
            rebalanced_once = true;
            sessions_since_rebalance = 0;
        } else {
            collect_session_bars(state, day);
        }

        enforce_cash_floor(state, strategy, day);

        // Mark
        mark(state, day, &snapshot);
        ++state.diagnostics.sessions_effective;
        ++sessions_since_rebalance;

        DEBUG("Session " << date << " equity " << state.equity.back().equity << " cash "
                         << state.account.cash() << " positions "
                         << state.account.open_position_count());

        if (cancel && cancel->is_cancelled()) {
            INFO("Backtest of " << strategy.name() << " cancelled after session " << date);
            return make_error<BacktestResult>(ErrorCode::RUN_CANCELLED, "Backtest cancelled",
                                              "BacktestEngine");
        }
    }

    return finalize(state, strategy, start, end);
}

void BacktestEngine::ensure_series(RunState& state, const std::vector<std::string>& symbols,
                                   const Timestamp& start, const Timestamp& end) {
    std::vector<std::string> missing;
    for (const auto& symbol : symbols) {
        if (state.series.count(symbol) == 0 &&
            std::find(missing.begin(), missing.end(), symbol) == missing.end()) {
            missing.push_back(symbol);
        }
    }
    if (missing.empty()) {
        return;
    }

    auto fetched =
        data_source_->get_multi_ohlc(missing, config_.data_frequency, start, end_of_day(end));
    if (fetched.is_error()) {
        record_warning(state, "Failed to load bars for " + std::to_string(missing.size()) +
                                  " instruments: " + fetched.error()->what());
        for (const auto& symbol : missing) {
            state.series[symbol];
        }
        return;
    }

    const auto& loaded = fetched.value();
    for (const auto& symbol : missing) {
        auto& bars = state.series[symbol];
        auto it = loaded.find(symbol);
        if (it == loaded.end()) {
            WARN("No bars for " << symbol << " in the backtest range");
            continue;
        }
        for (const auto& bar : it->second) {
            if (within_dates(bar.timestamp, start, end)) {
                bars.push_back(bar);
            }
        }
    }
}

void BacktestEngine::collect_session_bars(RunState& state, const Timestamp& day) const {
    state.today.clear();
    for (const auto& [symbol, bars] : state.series) {
        size_t& cursor = state.cursors[symbol];
        while (cursor < bars.size() && core::days_between(bars[cursor].timestamp, day) > 0) {
            ++cursor;
        }
        if (cursor < bars.size() && core::days_between(bars[cursor].timestamp, day) == 0) {
            state.today[symbol] = &bars[cursor];
        }
    }
}

void BacktestEngine::rebalance(RunState& state, strategy::StrategyInterface& strategy,
                               const std::vector<TargetWeight>& targets, const Timestamp& day) {
    std::map<std::string, Price> trade_prices;
    for (const auto& [symbol, bar] : state.today) {
        auto price = state.execution->session_price(*bar);
        if (price) {
            trade_prices[symbol] = *price;
        }
    }

    state.account.mark_to_market(trade_prices, day);
    double total_equity = state.account.equity();

    auto plan = state.tracker.compute_rebalance_orders(targets, trade_prices, total_equity,
                                                       portfolio::holdings_of(state.account));

    for (const auto& symbol : plan.dropped) {
        ++state.diagnostics.dropped_orders;
        DEBUG("Dropped order for " << symbol << " below minimum rebalance cost");
    }
    for (const auto& symbol : plan.unpriced) {
        ++state.diagnostics.unpriced_instruments;
        WARN("No usable price for " << symbol << " on " << core::format_date(day));
    }

    for (const auto& order : plan.orders) {
        auto bar_it = state.today.find(order.symbol);
        if (bar_it == state.today.end()) {
            continue;
        }
        execute_order(state, strategy, order.symbol, order.side(), std::abs(order.quantity),
                      *bar_it->second, day);
    }
}

bool BacktestEngine::execute_order(RunState& state, strategy::StrategyInterface& strategy,
                                   const std::string& symbol, Side side, Quantity quantity,
                                   const Bar& bar, const Timestamp& ts, bool check_admission) {
    auto fill_result = state.execution->execute(symbol, side, quantity, bar, ts);
    if (fill_result.is_error()) {
        record_rejection(state, ts, symbol, side, quantity, fill_result.error()->code(),
                         fill_result.error()->what());
        return false;
    }
    Fill fill = fill_result.take_value();

    if (check_admission && side == Side::BUY) {
        auto admitted = state.tracker.admit_buy(state.account, symbol,
                                                fill.quantity * fill.price, fill.commission);
        if (admitted.is_error()) {
            record_rejection(state, ts, symbol, side, fill.quantity, admitted.error()->code(),
                             admitted.error()->what());
            return false;
        }
    }

    return settle(state, strategy, fill);
}

bool BacktestEngine::settle(RunState& state, strategy::StrategyInterface& strategy,
                            const Fill& fill) {
    auto matched = state.matcher.apply_fill(fill);
    if (matched.is_error()) {
        record_rejection(state, fill.timestamp, fill.symbol, fill.side, fill.quantity,
                         matched.error()->code(),
                         "Fill " + fill.order_id + " rejected by ledger: " +
                             matched.error()->what());
        return false;
    }

    auto applied = state.account.apply_fill(fill);
    if (applied.is_error()) {
        record_warning(state, "Fill " + fill.order_id + " not applied to account: " +
                                  applied.error()->what());
        return false;
    }

    strategy.on_fill(fill);
    return true;
}

void BacktestEngine::enforce_cash_floor(RunState& state, strategy::StrategyInterface& strategy,
                                        const Timestamp& ts) {
    if (state.account.cash() >= config_.min_cash_balance - kCashEpsilon ||
        state.account.positions().empty()) {
        return;
    }

    std::ostringstream msg;
    msg << "Cash " << state.account.cash() << " below minimum " << config_.min_cash_balance
        << " on " << core::format_date(ts) << ", liquidating all positions";
    record_warning(state, msg.str());

    // Copy, settling fills erases positions
    auto positions = state.account.positions();
    for (const auto& [symbol, pos] : positions) {
        auto bar_it = state.today.find(symbol);
        if (bar_it == state.today.end()) {
            record_warning(state, "Cannot liquidate " + symbol + ": no bar on " +
                                      core::format_date(ts));
            continue;
        }
        Side side = pos.quantity > 0 ? Side::SELL : Side::BUY;
        if (execute_order(state, strategy, symbol, side, std::abs(pos.quantity),
                          *bar_it->second, ts, false)) {
            ++state.diagnostics.forced_liquidations;
        }
    }
}

void BacktestEngine::mark(RunState& state, const Timestamp& ts,
                          const data::MarketSnapshot* snapshot) {
    std::map<std::string, Price> prices;
    for (const auto& [symbol, bar] : state.today) {
        if (std::isfinite(bar->close) && bar->close > 0.0) {
            prices[symbol] = bar->close;
        }
        state.execution->on_bar(*bar);
    }

    if (snapshot) {
        for (const auto& [symbol, pos] : state.account.positions()) {
            if (prices.count(symbol) > 0) {
                continue;
            }
            const auto* row = snapshot->find(symbol);
            if (row && std::isfinite(row->price) && row->price > 0.0) {
                prices[symbol] = row->price;
            }
        }
    }

    state.account.mark_to_market(prices, ts);
    state.equity.push_back(EquitySample{ts, state.account.equity()});
}

void BacktestEngine::record_warning(RunState& state, const std::string& message) {
    WARN(message);
    state.warnings.push_back(message);
}

void BacktestEngine::record_rejection(RunState& state, const Timestamp& session,
                                      const std::string& symbol, Side side, Quantity quantity,
                                      ErrorCode reason, const std::string& message) {
    ++state.diagnostics.rejected_orders;
    WARN("Rejected " << side_to_string(side) << " " << quantity << " " << symbol << " on "
                     << core::format_date(session) << " (" << error_code_to_string(reason)
                     << "): " << message);
    state.rejections.push_back(OrderRejection{session, symbol, side, quantity, reason, message});
}

BacktestResult BacktestEngine::finalize(RunState& state,
                                        const strategy::StrategyInterface& strategy,
                                        const Timestamp& start, const Timestamp& end) const {
    BacktestMetricsCalculator calculator(
        MetricsSettings{config_.periods_per_year, config_.risk_free_rate});
    BacktestResult result = calculator.reduce(state.matcher.completed_trades(), state.equity,
                                              config_.initial_capital);

    state.diagnostics.invariant_violations = state.matcher.invariant_violations();

    result.backtest_id =
        RunIdGenerator::generate_run_id(strategy.name(), std::chrono::system_clock::now());
    result.strategy_name = strategy.name();
    result.parameters = strategy.parameters();
    result.start_date = start;
    result.end_date = end;
    result.diagnostics = state.diagnostics;
    result.warnings = state.warnings;
    result.rejections = state.rejections;
    result.fills = state.matcher.fills();

    INFO("Backtest " << result.backtest_id << " finished: " << result.diagnostics.sessions_effective
                     << "/" << result.diagnostics.sessions_total << " sessions, "
                     << result.total_trades << " trades, total return "
                     << result.total_return * 100.0 << "%");
    return result;
}

SymbolDetail BacktestEngine::build_symbol_detail(const BacktestResult& result,
                                                 const std::string& symbol) {
    SymbolDetail detail;
    detail.performance.symbol = symbol;
    for (const auto& perf : result.symbol_performances) {
        if (perf.symbol == symbol) {
            detail.performance = perf;
            break;
        }
    }
    for (const auto& trade : result.completed_trades) {
        if (trade.symbol == symbol) {
            detail.trades.push_back(trade);
        }
    }
    for (const auto& fill : result.fills) {
        if (fill.symbol == symbol) {
            detail.fills.push_back(fill);
        }
    }
    for (const auto& rejection : result.rejections) {
        if (rejection.symbol == symbol) {
            detail.rejections.push_back(rejection);
        }
    }
    return detail;
}

Result<std::vector<Bar>> BacktestEngine::load_symbol_ohlc(const BacktestResult& result,
                                                          const std::string& symbol) {
    if (!data_source_) {
        return make_error<std::vector<Bar>>(ErrorCode::NOT_INITIALIZED, "No market data source",
                                            "BacktestEngine");
    }

    auto series = data_source_->get_multi_ohlc({symbol}, config_.data_frequency,
                                               result.start_date, end_of_day(result.end_date));
    if (series.is_error()) {
        return make_error<std::vector<Bar>>(series.error()->code(), series.error()->what(),
                                            "BacktestEngine");
    }

    std::vector<Bar> bars;
    auto it = series.value().find(symbol);
    if (it != series.value().end()) {
        for (const auto& bar : it->second) {
            if (within_dates(bar.timestamp, result.start_date, result.end_date)) {
                bars.push_back(bar);
            }
        }
    }
    return bars;
}

}  // namespace backtest
}  // namespace backfolio
