#include <gtest/gtest.h>
#include <cmath>
#include <memory>
#include <vector>
#include "backfolio/backtest/backtest_engine.hpp"
#include "backfolio/strategy/moving_average_cross.hpp"
#include "backtest/mock_strategies.hpp"
#include "core/test_base.hpp"
#include "data/test_data_utils.hpp"

using namespace backfolio;
using namespace backfolio::backtest;
using namespace backfolio::testing;

class BacktestEngineTest : public TestBase {
protected:
    void SetUp() override {
        TestBase::SetUp();
        source = std::make_shared<MockMarketDataSource>();

        config.initial_capital = 10000.0;
        config.commission = CommissionModel{0.0, 0.0};
        config.slippage_bps = 0.0;
        config.start_date = make_day(0);
    }

    std::vector<double> flat(size_t n, double price) const {
        return std::vector<double>(n, price);
    }

    std::vector<double> ramp(size_t n, double first, double step) const {
        std::vector<double> out;
        for (size_t i = 0; i < n; ++i) {
            out.push_back(first + step * static_cast<double>(i));
        }
        return out;
    }

    Result<BacktestResult> run_portfolio(std::shared_ptr<ScriptedPortfolioStrategy> strategy,
                                         int sessions, const CancellationToken* cancel = nullptr) {
        BacktestEngine engine(config, source);
        return engine.run(strategy, make_day(0), make_day(sessions - 1), cancel);
    }

    static std::shared_ptr<ScriptedPortfolioStrategy> fixed_weights(
        std::vector<TargetWeight> weights) {
        auto strategy = std::make_shared<ScriptedPortfolioStrategy>();
        strategy->select_fn = [weights](const Timestamp&, const data::MarketSnapshot&) {
            std::vector<std::string> universe;
            for (const auto& w : weights) {
                universe.push_back(w.symbol);
            }
            return Result<std::vector<std::string>>(universe);
        };
        strategy->weight_fn = [weights](const std::vector<std::string>&,
                                        const portfolio::Account&) {
            return Result<std::vector<TargetWeight>>(weights);
        };
        return strategy;
    }

    void expect_equity_identity(const BacktestResult& result) const {
        ASSERT_FALSE(result.equity_curve.empty());
        EXPECT_DOUBLE_EQ(result.final_equity, result.equity_curve.back());
        EXPECT_NEAR(result.total_return,
                    (result.final_equity - result.initial_capital) / result.initial_capital, 1e-12);
        for (double dd : result.drawdown_curve) {
            EXPECT_GE(dd, 0.0);
        }
    }

    std::shared_ptr<MockMarketDataSource> source;
    BacktestConfig config;
};

// ---------------------------------------------------------------------------
// Portfolio mode
// ---------------------------------------------------------------------------

TEST_F(BacktestEngineTest, EqualWeightPortfolioTracksPrices) {
    source->add_series("A", ramp(5, 100.0, 10.0));  // 100 .. 140
    source->add_series("B", flat(5, 50.0));

    auto result = run_portfolio(fixed_weights({{"A", 0.5}, {"B", 0.5}}), 5);
    ASSERT_TRUE(result.is_ok()) << result.error()->to_string();
    const BacktestResult& r = result.value();

    // Day 0 buys 50 A and 100 B, later rebalances trim A as it rises
    ASSERT_EQ(r.equity_curve.size(), 5u);
    EXPECT_DOUBLE_EQ(r.equity_curve[0], 10000.0);
    EXPECT_DOUBLE_EQ(r.equity_curve[1], 10500.0);
    EXPECT_GT(r.final_equity, 10000.0);
    EXPECT_EQ(r.diagnostics.sessions_total, 5);
    EXPECT_EQ(r.diagnostics.sessions_effective, 5);
    EXPECT_EQ(r.diagnostics.skipped_sessions, 0);
    EXPECT_EQ(r.strategy_name, "SCRIPTED_PORTFOLIO");
    EXPECT_EQ(r.parameters["scripted"], true);
    EXPECT_EQ(r.start_date, make_day(0));
    EXPECT_EQ(r.end_date, make_day(4));
    EXPECT_FALSE(r.backtest_id.empty());
    expect_equity_identity(r);
}

TEST_F(BacktestEngineTest, OverAllocatedWeightsWarnAndComplete) {
    source->add_series("A", flat(5, 100.0));
    source->add_series("B", flat(5, 100.0));

    auto result = run_portfolio(fixed_weights({{"A", 0.6}, {"B", 0.6}}), 5);
    ASSERT_TRUE(result.is_ok()) << result.error()->to_string();
    const BacktestResult& r = result.value();

    EXPECT_EQ(r.diagnostics.sessions_effective, 5);
    EXPECT_EQ(r.diagnostics.allocation_warnings, 5);
    EXPECT_GE(r.diagnostics.rejected_orders, 1);
    bool flagged = false;
    for (const auto& warning : r.warnings) {
        flagged = flagged || warning.find("not renormalized") != std::string::npos;
    }
    EXPECT_TRUE(flagged);

    // The unaffordable buy is rejected, so cash never goes negative
    for (const auto& fill : r.fills) {
        EXPECT_EQ(fill.symbol, "A");
    }
    ASSERT_EQ(r.rejections.size(), static_cast<size_t>(r.diagnostics.rejected_orders));
    EXPECT_EQ(r.rejections.front().session, make_day(0));
    for (const auto& rejection : r.rejections) {
        EXPECT_EQ(rejection.symbol, "B");
        EXPECT_EQ(rejection.reason, ErrorCode::INSUFFICIENT_FUNDS);
    }
    EXPECT_DOUBLE_EQ(r.final_equity, 10000.0);
}

TEST_F(BacktestEngineTest, FailedSnapshotsSkipSessions) {
    source->add_series("A", ramp(250, 100.0, 0.1));
    source->fail_snapshot_on(make_day(10));
    source->fail_snapshot_on(make_day(100));
    source->fail_snapshot_on(make_day(200));

    auto result = run_portfolio(fixed_weights({{"A", 0.5}}), 250);
    ASSERT_TRUE(result.is_ok()) << result.error()->to_string();
    const BacktestResult& r = result.value();

    EXPECT_EQ(r.diagnostics.sessions_total, 250);
    EXPECT_EQ(r.diagnostics.skipped_sessions, 3);
    EXPECT_EQ(r.diagnostics.sessions_effective, 247);
    EXPECT_EQ(r.equity_curve.size(), 247u);
    EXPECT_EQ(r.equity_timestamps.size(), 247u);
    for (const auto& ts : r.equity_timestamps) {
        EXPECT_NE(ts, make_day(100));
    }
    EXPECT_EQ(r.warnings.size(), 3u);
    expect_equity_identity(r);
}

TEST_F(BacktestEngineTest, EquityTimestampsStrictlyIncrease) {
    source->add_series("A", ramp(20, 10.0, 0.5));
    auto result = run_portfolio(fixed_weights({{"A", 1.0}}), 20);
    ASSERT_TRUE(result.is_ok());
    const auto& ts = result.value().equity_timestamps;
    for (size_t i = 1; i < ts.size(); ++i) {
        EXPECT_LT(ts[i - 1], ts[i]);
    }
}

TEST_F(BacktestEngineTest, RebalanceIntervalLimitsSelection) {
    source->add_series("A", flat(10, 100.0));
    config.rebalance_interval_sessions = 3;

    auto strategy = fixed_weights({{"A", 0.5}});
    auto result = run_portfolio(strategy, 10);
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(strategy->select_calls.load(), 4);  // sessions 0, 3, 6, 9
    EXPECT_EQ(result.value().diagnostics.sessions_effective, 10);
}

TEST_F(BacktestEngineTest, EmptyUniverseLiquidatesToCash) {
    source->add_series("A", {100.0, 110.0, 120.0});

    auto strategy = std::make_shared<ScriptedPortfolioStrategy>();
    strategy->select_fn = [](const Timestamp& date, const data::MarketSnapshot&) {
        std::vector<std::string> universe;
        if (date == make_day(0)) {
            universe.push_back("A");
        }
        return Result<std::vector<std::string>>(universe);
    };

    auto result = run_portfolio(strategy, 3);
    ASSERT_TRUE(result.is_ok()) << result.error()->to_string();
    const BacktestResult& r = result.value();

    ASSERT_EQ(r.completed_trades.size(), 1u);
    EXPECT_DOUBLE_EQ(r.completed_trades[0].quantity, 100.0);
    EXPECT_DOUBLE_EQ(r.completed_trades[0].pnl, 1000.0);
    EXPECT_DOUBLE_EQ(r.final_equity, 11000.0);
    EXPECT_EQ(strategy->fill_count.load(), 2);
}

TEST_F(BacktestEngineTest, StrategyErrorsSkipSession) {
    source->add_series("A", flat(5, 100.0));

    auto strategy = fixed_weights({{"A", 0.5}});
    auto base_select = strategy->select_fn;
    strategy->select_fn = [base_select](const Timestamp& date, const data::MarketSnapshot& s) {
        if (date == make_day(2)) {
            return make_error<std::vector<std::string>>(ErrorCode::STRATEGY_ERROR, "screen failed",
                                                        "Scripted");
        }
        return base_select(date, s);
    };

    auto result = run_portfolio(strategy, 5);
    ASSERT_TRUE(result.is_ok());
    const RunDiagnostics& d = result.value().diagnostics;
    EXPECT_EQ(d.skipped_sessions, 1);
    EXPECT_EQ(d.strategy_errors, 1);
    EXPECT_EQ(d.sessions_effective + d.skipped_sessions, d.sessions_total);
    EXPECT_EQ(result.value().equity_curve.size(), 4u);
}

TEST_F(BacktestEngineTest, MaxPositionsRejectsExtraInstruments) {
    source->add_series("A", flat(3, 100.0));
    source->add_series("B", flat(3, 100.0));
    config.max_positions = 1;

    auto result = run_portfolio(fixed_weights({{"A", 0.4}, {"B", 0.4}}), 3);
    ASSERT_TRUE(result.is_ok());
    const BacktestResult& r = result.value();
    EXPECT_EQ(r.diagnostics.rejected_orders, 3);
    for (const auto& fill : r.fills) {
        EXPECT_EQ(fill.symbol, "A");
    }

    ASSERT_EQ(r.rejections.size(), 3u);
    for (int i = 0; i < 3; ++i) {
        const OrderRejection& rejection = r.rejections[i];
        EXPECT_EQ(rejection.session, make_day(i));
        EXPECT_EQ(rejection.symbol, "B");
        EXPECT_EQ(rejection.side, Side::BUY);
        EXPECT_DOUBLE_EQ(rejection.quantity, 40.0);
        EXPECT_EQ(rejection.reason, ErrorCode::POSITION_LIMIT_EXCEEDED);
        EXPECT_FALSE(rejection.message.empty());
    }

    auto detail = BacktestEngine::build_symbol_detail(r, "B");
    EXPECT_EQ(detail.rejections.size(), 3u);
    EXPECT_TRUE(detail.fills.empty());
    EXPECT_TRUE(BacktestEngine::build_symbol_detail(r, "A").rejections.empty());
}

TEST_F(BacktestEngineTest, SmallOrdersAreDropped) {
    source->add_series("A", flat(3, 100.0));
    config.min_rebalance_cost = 20000.0;

    auto result = run_portfolio(fixed_weights({{"A", 0.5}}), 3);
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value().diagnostics.dropped_orders, 3);
    EXPECT_TRUE(result.value().fills.empty());
}

TEST_F(BacktestEngineTest, InstrumentWithoutBarsIsUnpriced) {
    source->add_series("A", flat(3, 100.0));
    source->set_trading_days({make_day(0), make_day(1), make_day(2)});

    auto result = run_portfolio(fixed_weights({{"A", 0.5}, {"GHOST", 0.5}}), 3);
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value().diagnostics.unpriced_instruments, 3);
    EXPECT_EQ(result.value().diagnostics.rejected_orders, 0);
}

TEST_F(BacktestEngineTest, CommissionAndSlippageReduceEquity) {
    source->add_series("A", flat(2, 100.0));
    config.commission = CommissionModel{0.0015, 0.0};
    config.slippage_bps = 10.0;

    auto result = run_portfolio(fixed_weights({{"A", 0.5}}), 2);
    ASSERT_TRUE(result.is_ok());
    const BacktestResult& r = result.value();
    ASSERT_FALSE(r.fills.empty());
    EXPECT_DOUBLE_EQ(r.fills[0].price, 100.0 * 1.001);
    EXPECT_GT(r.fills[0].commission, 0.0);
    EXPECT_LT(r.final_equity, 10000.0);
}

TEST_F(BacktestEngineTest, IdenticalRunsProduceIdenticalResults) {
    source->add_series("A", ramp(30, 50.0, 0.7));
    source->add_series("B", ramp(30, 80.0, -0.4));
    config.commission = CommissionModel{0.0015, 0.0};

    auto first = run_portfolio(fixed_weights({{"A", 0.3}, {"B", 0.3}}), 30);
    auto second = run_portfolio(fixed_weights({{"A", 0.3}, {"B", 0.3}}), 30);
    ASSERT_TRUE(first.is_ok());
    ASSERT_TRUE(second.is_ok());

    EXPECT_EQ(first.value().equity_curve, second.value().equity_curve);
    EXPECT_EQ(first.value().sharpe_ratio, second.value().sharpe_ratio);
    EXPECT_EQ(first.value().mdd, second.value().mdd);
    EXPECT_EQ(first.value().fills.size(), second.value().fills.size());
}

TEST_F(BacktestEngineTest, CancellationStopsTheRun) {
    source->add_series("A", flat(10, 100.0));
    CancellationToken token;

    auto strategy = fixed_weights({{"A", 0.5}});
    auto base_select = strategy->select_fn;
    strategy->select_fn = [base_select, &token](const Timestamp& date,
                                                const data::MarketSnapshot& s) {
        if (date == make_day(3)) {
            token.cancel();
        }
        return base_select(date, s);
    };

    auto result = run_portfolio(strategy, 10, &token);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::RUN_CANCELLED);
    EXPECT_EQ(strategy->select_calls.load(), 4);
}

// ---------------------------------------------------------------------------
// Setup validation
// ---------------------------------------------------------------------------

TEST_F(BacktestEngineTest, SetupErrors) {
    source->add_series("A", flat(3, 100.0));
    BacktestEngine engine(config, source);

    auto no_strategy = engine.run(nullptr, make_day(0), make_day(2));
    ASSERT_TRUE(no_strategy.is_error());
    EXPECT_EQ(no_strategy.error()->code(), ErrorCode::SETUP_ERROR);

    auto reversed = engine.run(fixed_weights({{"A", 1.0}}), make_day(2), make_day(0));
    ASSERT_TRUE(reversed.is_error());
    EXPECT_EQ(reversed.error()->code(), ErrorCode::INVALID_ARGUMENT);

    BacktestEngine no_source(config);
    auto missing = no_source.run(fixed_weights({{"A", 1.0}}), make_day(0), make_day(2));
    ASSERT_TRUE(missing.is_error());
    EXPECT_EQ(missing.error()->code(), ErrorCode::SETUP_ERROR);

    BacktestConfig broke = config;
    broke.initial_capital = 0.0;
    auto no_capital =
        BacktestEngine(broke, source).run(fixed_weights({{"A", 1.0}}), make_day(0), make_day(2));
    ASSERT_TRUE(no_capital.is_error());
    EXPECT_EQ(no_capital.error()->code(), ErrorCode::INVALID_ARGUMENT);
}

TEST_F(BacktestEngineTest, CalendarFailureIsSetupError) {
    source->add_series("A", flat(3, 100.0));
    source->fail_calendar();

    auto result = run_portfolio(fixed_weights({{"A", 1.0}}), 3);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::SETUP_ERROR);
}

TEST_F(BacktestEngineTest, EmptyCalendarGivesEmptyResult) {
    auto result = run_portfolio(fixed_weights({{"A", 1.0}}), 3);
    ASSERT_TRUE(result.is_ok());
    EXPECT_TRUE(result.value().equity_curve.empty());
    EXPECT_DOUBLE_EQ(result.value().final_equity, 10000.0);
    EXPECT_DOUBLE_EQ(result.value().total_return, 0.0);
    EXPECT_DOUBLE_EQ(result.value().sharpe_ratio, 0.0);
}

// ---------------------------------------------------------------------------
// Single-instrument mode
// ---------------------------------------------------------------------------

TEST_F(BacktestEngineTest, SingleModeRoundTrip) {
    std::vector<Bar> bars;
    for (int i = 0; i < 3; ++i) {
        bars.push_back(make_bar("A", make_day(i), 100.0 + 5.0 * i));
    }

    auto strategy = std::make_shared<ScriptedSingleStrategy>(
        [](int index, const Bar& bar, const portfolio::Account&) {
            std::vector<OrderSignal> signals;
            if (index == 0)
                signals.push_back(OrderSignal{bar.symbol, Side::BUY, 100});
            if (index == 2)
                signals.push_back(OrderSignal{"", Side::SELL, 100});
            return Result<std::vector<OrderSignal>>(signals);
        });

    BacktestEngine engine(config);
    auto result = engine.run_single(strategy, bars);
    ASSERT_TRUE(result.is_ok()) << result.error()->to_string();
    const BacktestResult& r = result.value();

    ASSERT_EQ(r.completed_trades.size(), 1u);
    EXPECT_DOUBLE_EQ(r.completed_trades[0].pnl, 1000.0);
    EXPECT_DOUBLE_EQ(r.completed_trades[0].return_pct, 10.0);
    EXPECT_EQ(r.completed_trades[0].holding_period_days, 2);
    EXPECT_DOUBLE_EQ(r.final_equity, 11000.0);
    EXPECT_EQ(r.equity_curve.size(), 3u);
    EXPECT_EQ(r.fills.size(), 2u);
    EXPECT_EQ(r.fills[0].order_id, "BT-00000001");
    EXPECT_EQ(strategy->fills.size(), 2u);
    EXPECT_DOUBLE_EQ(r.win_rate, 100.0);
    EXPECT_EQ(r.start_date, make_day(0));
    EXPECT_EQ(r.end_date, make_day(2));
}

TEST_F(BacktestEngineTest, MalformedSignalsAreRejected) {
    std::vector<Bar> bars = {make_bar("A", make_day(0), 100.0)};
    auto strategy = std::make_shared<ScriptedSingleStrategy>(
        [](int, const Bar&, const portfolio::Account&) {
            std::vector<OrderSignal> signals = {{"OTHER", Side::BUY, 1},
                                                {"A", Side::BUY, 0},
                                                {"A", Side::NONE, 5},
                                                {"A", Side::BUY, 1e9}};
            return Result<std::vector<OrderSignal>>(signals);
        });

    auto result = BacktestEngine(config).run_single(strategy, bars);
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value().diagnostics.rejected_orders, 4);
    EXPECT_TRUE(result.value().fills.empty());

    const auto& rejections = result.value().rejections;
    ASSERT_EQ(rejections.size(), 4u);
    EXPECT_EQ(rejections[0].symbol, "OTHER");
    EXPECT_EQ(rejections[0].reason, ErrorCode::ORDER_REJECTED);
    EXPECT_EQ(rejections[1].reason, ErrorCode::ORDER_REJECTED);
    EXPECT_EQ(rejections[2].side, Side::NONE);
    EXPECT_EQ(rejections[3].reason, ErrorCode::INSUFFICIENT_FUNDS);
    for (const auto& rejection : rejections) {
        EXPECT_EQ(rejection.session, make_day(0));
    }
}

TEST_F(BacktestEngineTest, OutOfOrderBarsAreSkipped) {
    std::vector<Bar> bars = {make_bar("A", make_day(0), 100.0), make_bar("A", make_day(2), 101.0),
                             make_bar("A", make_day(1), 102.0), make_bar("A", make_day(3), 103.0)};
    auto strategy = std::make_shared<ScriptedSingleStrategy>(
        [](int, const Bar&, const portfolio::Account&) {
            return Result<std::vector<OrderSignal>>(std::vector<OrderSignal>{});
        });

    auto result = BacktestEngine(config).run_single(strategy, bars);
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value().equity_curve.size(), 3u);
    EXPECT_EQ(result.value().diagnostics.sessions_total, 3);
}

TEST_F(BacktestEngineTest, LongOnlyCountsOversells) {
    config.long_only = true;
    std::vector<Bar> bars = {make_bar("A", make_day(0), 100.0), make_bar("A", make_day(1), 90.0)};
    auto strategy = std::make_shared<ScriptedSingleStrategy>(
        [](int index, const Bar&, const portfolio::Account&) {
            std::vector<OrderSignal> signals;
            if (index == 0)
                signals.push_back(OrderSignal{"A", Side::SELL, 10});
            return Result<std::vector<OrderSignal>>(signals);
        });

    auto result = BacktestEngine(config).run_single(strategy, bars);
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value().diagnostics.invariant_violations, 1);
    EXPECT_DOUBLE_EQ(result.value().final_equity, 10100.0);
}

TEST_F(BacktestEngineTest, CashFloorForcesLiquidation) {
    config.initial_capital = 1000.0;
    config.min_cash_balance = 5000.0;
    std::vector<Bar> bars = {make_bar("A", make_day(0), 100.0), make_bar("A", make_day(1), 100.0)};
    auto strategy = std::make_shared<ScriptedSingleStrategy>(
        [](int index, const Bar&, const portfolio::Account&) {
            std::vector<OrderSignal> signals;
            if (index == 0)
                signals.push_back(OrderSignal{"A", Side::SELL, 10});
            return Result<std::vector<OrderSignal>>(signals);
        });

    auto result = BacktestEngine(config).run_single(strategy, bars);
    ASSERT_TRUE(result.is_ok());
    const BacktestResult& r = result.value();
    EXPECT_EQ(r.diagnostics.forced_liquidations, 1);
    EXPECT_EQ(r.fills.size(), 2u);
    EXPECT_DOUBLE_EQ(r.final_equity, 1000.0);
}

TEST_F(BacktestEngineTest, StrategyErrorsInSingleMode) {
    std::vector<Bar> bars = {make_bar("A", make_day(0), 100.0), make_bar("A", make_day(1), 100.0)};
    auto strategy = std::make_shared<ScriptedSingleStrategy>(
        [](int index, const Bar&, const portfolio::Account&) {
            if (index == 1) {
                return make_error<std::vector<OrderSignal>>(ErrorCode::STRATEGY_ERROR, "boom",
                                                            "Scripted");
            }
            return Result<std::vector<OrderSignal>>(std::vector<OrderSignal>{});
        });

    auto result = BacktestEngine(config).run_single(strategy, bars);
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value().diagnostics.strategy_errors, 1);
    EXPECT_EQ(result.value().equity_curve.size(), 1u);
}

TEST_F(BacktestEngineTest, RunLoadsConfiguredInstrument) {
    source->add_series("A", {10, 10, 10, 10, 10, 12, 14, 16, 18, 20, 15, 10, 6, 4, 3});
    config.symbol = "A";
    config.end_date = make_day(14);

    auto strategy = std::make_shared<strategy::MovingAverageCrossStrategy>(
        nlohmann::json{{"fast_period", 2}, {"slow_period", 4}});
    BacktestEngine engine(config, source);
    auto result = engine.run(strategy);
    ASSERT_TRUE(result.is_ok()) << result.error()->to_string();
    const BacktestResult& r = result.value();

    EXPECT_EQ(r.equity_curve.size(), 15u);
    EXPECT_EQ(r.strategy_name, "MA_CROSS");
    ASSERT_EQ(r.completed_trades.size(), 1u);
    EXPECT_EQ(r.completed_trades[0].direction, TradeDirection::LONG);

    SymbolDetail detail = BacktestEngine::build_symbol_detail(r, "A");
    EXPECT_EQ(detail.performance.total_trades, 1);
    EXPECT_EQ(detail.trades.size(), 1u);
    EXPECT_EQ(detail.fills.size(), 2u);

    auto ohlc = engine.load_symbol_ohlc(r, "A");
    ASSERT_TRUE(ohlc.is_ok());
    EXPECT_EQ(ohlc.value().size(), 15u);
}

TEST_F(BacktestEngineTest, SingleStrategyNeedsInstrument) {
    source->add_series("A", flat(3, 100.0));
    auto strategy = std::make_shared<strategy::MovingAverageCrossStrategy>();
    auto result = BacktestEngine(config, source).run(strategy, make_day(0), make_day(2));
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::SETUP_ERROR);
}

TEST_F(BacktestEngineTest, PortfolioStrategyCannotReplaySeries) {
    auto result = BacktestEngine(config).run_single(fixed_weights({{"A", 1.0}}),
                                                    {make_bar("A", make_day(0), 100.0)});
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::SETUP_ERROR);
}

TEST_F(BacktestEngineTest, SymbolDetailForUnknownInstrumentIsEmpty) {
    BacktestResult result;
    SymbolDetail detail = BacktestEngine::build_symbol_detail(result, "NONE");
    EXPECT_EQ(detail.performance.symbol, "NONE");
    EXPECT_EQ(detail.performance.total_trades, 0);
    EXPECT_TRUE(detail.trades.empty());

    auto ohlc = BacktestEngine(config).load_symbol_ohlc(result, "NONE");
    ASSERT_TRUE(ohlc.is_error());
    EXPECT_EQ(ohlc.error()->code(), ErrorCode::NOT_INITIALIZED);
}
