// include/backfolio/data/postgres_database.hpp

#pragma once

#include <arrow/api.h>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <pqxx/pqxx>
#include <string>
#include <vector>
#include "backfolio/core/config_base.hpp"
#include "backfolio/core/error.hpp"
#include "backfolio/core/types.hpp"
#include "backfolio/data/market_data_source.hpp"

namespace backfolio {
namespace data {

/**
 * @brief Table layout of the historical data store
 */
struct PostgresSourceConfig : public ConfigBase {
    std::string connection_string;
    std::string ohlc_table{"ohlc_data"};
    std::string fundamentals_table{"stock_master"};
    std::string interval{"1d"};  // ohlc_data.interval of the session bars

    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;
};

/**
 * @brief Market data source backed by PostgreSQL
 *
 * Queries run inside a pqxx transaction under a connection mutex, so one
 * instance can serve concurrent backtest runs.
 */
class PostgresDatabase : public MarketDataSource {
public:
    explicit PostgresDatabase(PostgresSourceConfig config);
    ~PostgresDatabase() override;

    PostgresDatabase(const PostgresDatabase&) = delete;
    PostgresDatabase& operator=(const PostgresDatabase&) = delete;
    PostgresDatabase(PostgresDatabase&&) = delete;
    PostgresDatabase& operator=(PostgresDatabase&&) = delete;

    Result<void> connect();
    void disconnect();
    bool is_connected() const;

    Result<MarketSnapshot> get_market_snapshot(
        const Timestamp& date, const std::vector<std::string>& instrument_filter = {}) override;

    Result<OhlcSeriesMap> get_multi_ohlc(const std::vector<std::string>& symbols,
                                         DataFrequency freq, const Timestamp& start,
                                         const Timestamp& end) override;

    Result<std::vector<Timestamp>> get_trading_days(const Timestamp& start,
                                                    const Timestamp& end) override;

private:
    Result<void> validate_connection() const;
    Result<void> validate_identifier(const std::string& name) const;
    Result<void> validate_symbols(const std::vector<std::string>& symbols) const;
    Result<std::string> interval_for(DataFrequency freq) const;

    Result<std::shared_ptr<arrow::Table>> ohlc_to_arrow_table(const pqxx::result& result) const;
    Result<std::shared_ptr<arrow::Table>> snapshot_to_arrow_table(
        const pqxx::result& result) const;

    PostgresSourceConfig config_;
    std::unique_ptr<pqxx::connection> connection_;
    mutable std::mutex mutex_;
};

}  // namespace data
}  // namespace backfolio
