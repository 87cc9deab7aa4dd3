// src/data/postgres_database.cpp

#include "backfolio/data/postgres_database.hpp"
#include <cctype>
#include <cmath>
#include "backfolio/core/logger.hpp"
#include "backfolio/core/time_utils.hpp"
#include "backfolio/data/conversion_utils.hpp"

namespace backfolio {
namespace data {

nlohmann::json PostgresSourceConfig::to_json() const {
    nlohmann::json j;
    j["connection_string"] = connection_string;
    j["ohlc_table"] = ohlc_table;
    j["fundamentals_table"] = fundamentals_table;
    j["interval"] = interval;
    return j;
}

void PostgresSourceConfig::from_json(const nlohmann::json& j) {
    if (j.contains("connection_string"))
        connection_string = j.at("connection_string").get<std::string>();
    if (j.contains("ohlc_table"))
        ohlc_table = j.at("ohlc_table").get<std::string>();
    if (j.contains("fundamentals_table"))
        fundamentals_table = j.at("fundamentals_table").get<std::string>();
    if (j.contains("interval"))
        interval = j.at("interval").get<std::string>();
}

PostgresDatabase::PostgresDatabase(PostgresSourceConfig config) : config_(std::move(config)) {}

PostgresDatabase::~PostgresDatabase() {
    disconnect();
}

Result<void> PostgresDatabase::connect() {
    std::lock_guard<std::mutex> lock(mutex_);

    auto tables_ok = validate_identifier(config_.ohlc_table);
    if (tables_ok.is_ok()) {
        tables_ok = validate_identifier(config_.fundamentals_table);
    }
    if (tables_ok.is_error()) {
        return tables_ok;
    }

    try {
        connection_ = std::make_unique<pqxx::connection>(config_.connection_string);
        if (!connection_->is_open()) {
            return make_error<void>(ErrorCode::CONNECTION_ERROR,
                                    "Failed to open database connection", "PostgresDatabase");
        }
        INFO("Connected to PostgreSQL database " << connection_->dbname());
        return Result<void>();
    } catch (const std::exception& e) {
        return make_error<void>(ErrorCode::CONNECTION_ERROR,
                                "Database connection error: " + std::string(e.what()),
                                "PostgresDatabase");
    }
}

void PostgresDatabase::disconnect() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (connection_ && connection_->is_open()) {
        connection_->close();
        INFO("Disconnected from PostgreSQL database");
    }
    connection_.reset();
}

bool PostgresDatabase::is_connected() const {
    return connection_ && connection_->is_open();
}

Result<void> PostgresDatabase::validate_connection() const {
    if (!is_connected()) {
        return make_error<void>(ErrorCode::CONNECTION_ERROR, "Not connected to database",
                                "PostgresDatabase");
    }
    return Result<void>();
}

Result<void> PostgresDatabase::validate_identifier(const std::string& name) const {
    if (name.empty()) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT, "Empty table name",
                                "PostgresDatabase");
    }
    for (char c : name) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (!std::isalnum(uc) && c != '_' && c != '.') {
            return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                    "Invalid character in table name: " + name,
                                    "PostgresDatabase");
        }
    }
    return Result<void>();
}

Result<void> PostgresDatabase::validate_symbols(const std::vector<std::string>& symbols) const {
    for (const auto& symbol : symbols) {
        if (symbol.empty() || symbol.size() > 32) {
            return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                    "Invalid instrument id: '" + symbol + "'", "PostgresDatabase");
        }
    }
    return Result<void>();
}

Result<std::string> PostgresDatabase::interval_for(DataFrequency freq) const {
    switch (freq) {
        case DataFrequency::DAILY:
            return config_.interval;
        case DataFrequency::WEEKLY:
            return std::string("1w");
        case DataFrequency::MONTHLY:
            return std::string("1M");
        case DataFrequency::HOURLY:
            return std::string("1h");
        case DataFrequency::MINUTE:
            return std::string("1m");
        default:
            return make_error<std::string>(ErrorCode::INVALID_ARGUMENT,
                                           "Unsupported frequency " + frequency_to_string(freq),
                                           "PostgresDatabase");
    }
}

Result<MarketSnapshot> PostgresDatabase::get_market_snapshot(
    const Timestamp& date, const std::vector<std::string>& instrument_filter) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto validation = validate_connection();
    if (validation.is_error()) {
        return make_error<MarketSnapshot>(validation.error()->code(), validation.error()->what(),
                                          "PostgresDatabase");
    }
    auto symbol_validation = validate_symbols(instrument_filter);
    if (symbol_validation.is_error()) {
        return make_error<MarketSnapshot>(symbol_validation.error()->code(),
                                          symbol_validation.error()->what(), "PostgresDatabase");
    }

    std::string query =
        "SELECT o.symbol, o.close AS price, o.close * o.volume AS volume_amount, "
        "m.per, m.pbr, m.roe, m.market_cap "
        "FROM " +
        config_.ohlc_table + " o LEFT JOIN " + config_.fundamentals_table +
        " m ON m.symbol = o.symbol "
        "WHERE o.interval = $1 AND o.timestamp::date = $2::date";

    try {
        pqxx::work txn(*connection_);
        pqxx::result rows;
        if (instrument_filter.empty()) {
            rows = txn.exec_params(query + " ORDER BY o.symbol", config_.interval,
                                   core::format_date(date));
        } else {
            rows = txn.exec_params(query + " AND o.symbol = ANY($3) ORDER BY o.symbol",
                                   config_.interval, core::format_date(date), instrument_filter);
        }
        txn.commit();

        auto table = snapshot_to_arrow_table(rows);
        if (table.is_error()) {
            return make_error<MarketSnapshot>(table.error()->code(), table.error()->what(),
                                              "PostgresDatabase");
        }
        return DataConversionUtils::arrow_table_to_snapshot(table.value(), date);
    } catch (const std::exception& e) {
        return make_error<MarketSnapshot>(
            ErrorCode::DATABASE_ERROR,
            "Failed to fetch snapshot for " + core::format_date(date) + ": " + e.what(),
            "PostgresDatabase");
    }
}

Result<OhlcSeriesMap> PostgresDatabase::get_multi_ohlc(const std::vector<std::string>& symbols,
                                                       DataFrequency freq, const Timestamp& start,
                                                       const Timestamp& end) {
    if (start > end) {
        return make_error<OhlcSeriesMap>(ErrorCode::INVALID_ARGUMENT,
                                         "Start date must not be after end date",
                                         "PostgresDatabase");
    }
    if (symbols.empty()) {
        return OhlcSeriesMap{};
    }

    auto interval = interval_for(freq);
    if (interval.is_error()) {
        return make_error<OhlcSeriesMap>(interval.error()->code(), interval.error()->what(),
                                         "PostgresDatabase");
    }

    std::lock_guard<std::mutex> lock(mutex_);

    auto validation = validate_connection();
    if (validation.is_error()) {
        return make_error<OhlcSeriesMap>(validation.error()->code(), validation.error()->what(),
                                         "PostgresDatabase");
    }
    auto symbol_validation = validate_symbols(symbols);
    if (symbol_validation.is_error()) {
        return make_error<OhlcSeriesMap>(symbol_validation.error()->code(),
                                         symbol_validation.error()->what(), "PostgresDatabase");
    }

    std::string query =
        "SELECT timestamp AS time, symbol, open, high, low, close, volume FROM " +
        config_.ohlc_table +
        " WHERE interval = $1 AND symbol = ANY($2) AND timestamp BETWEEN $3 AND $4 "
        "ORDER BY symbol, timestamp";

    try {
        pqxx::work txn(*connection_);
        pqxx::result rows =
            txn.exec_params(query, interval.value(), symbols, core::format_timestamp(start),
                            core::format_timestamp(end));
        txn.commit();

        auto table = ohlc_to_arrow_table(rows);
        if (table.is_error()) {
            return make_error<OhlcSeriesMap>(table.error()->code(), table.error()->what(),
                                             "PostgresDatabase");
        }
        DEBUG("Fetched " << rows.size() << " bars for " << symbols.size() << " instruments");
        return DataConversionUtils::arrow_table_to_series(table.value());
    } catch (const std::exception& e) {
        return make_error<OhlcSeriesMap>(ErrorCode::DATABASE_ERROR,
                                         "Failed to fetch market data: " + std::string(e.what()),
                                         "PostgresDatabase");
    }
}

Result<std::vector<Timestamp>> PostgresDatabase::get_trading_days(const Timestamp& start,
                                                                  const Timestamp& end) {
    if (start > end) {
        return make_error<std::vector<Timestamp>>(ErrorCode::INVALID_ARGUMENT,
                                                  "Start date must not be after end date",
                                                  "PostgresDatabase");
    }

    std::lock_guard<std::mutex> lock(mutex_);

    auto validation = validate_connection();
    if (validation.is_error()) {
        return make_error<std::vector<Timestamp>>(validation.error()->code(),
                                                  validation.error()->what(), "PostgresDatabase");
    }

    std::string query = "SELECT DISTINCT timestamp::date AS day FROM " + config_.ohlc_table +
                        " WHERE interval = $1 AND timestamp::date BETWEEN $2::date AND $3::date "
                        "ORDER BY day";

    try {
        pqxx::work txn(*connection_);
        pqxx::result rows = txn.exec_params(query, config_.interval, core::format_date(start),
                                            core::format_date(end));
        txn.commit();

        std::vector<Timestamp> days;
        days.reserve(rows.size());
        for (const auto& row : rows) {
            auto day = core::parse_timestamp(row["day"].as<std::string>());
            if (!day) {
                return make_error<std::vector<Timestamp>>(
                    ErrorCode::CONVERSION_ERROR,
                    "Unparseable session date: " + row["day"].as<std::string>(),
                    "PostgresDatabase");
            }
            days.push_back(*day);
        }
        return days;
    } catch (const std::exception& e) {
        return make_error<std::vector<Timestamp>>(
            ErrorCode::DATABASE_ERROR, "Failed to fetch trading calendar: " + std::string(e.what()),
            "PostgresDatabase");
    }
}

Result<std::shared_ptr<arrow::Table>> PostgresDatabase::ohlc_to_arrow_table(
    const pqxx::result& result) const {
    std::vector<Bar> bars;
    bars.reserve(result.size());

    for (const auto& row : result) {
        auto ts = core::parse_timestamp(row["time"].as<std::string>());
        if (!ts) {
            return make_error<std::shared_ptr<arrow::Table>>(
                ErrorCode::CONVERSION_ERROR,
                "Unparseable bar timestamp: " + row["time"].as<std::string>(), "PostgresDatabase");
        }
        if (row["open"].is_null() || row["high"].is_null() || row["low"].is_null() ||
            row["close"].is_null()) {
            WARN("Skipping bar with null prices for " << row["symbol"].as<std::string>() << " at "
                                                      << row["time"].as<std::string>());
            continue;
        }
        bars.emplace_back(*ts, row["open"].as<double>(), row["high"].as<double>(),
                          row["low"].as<double>(), row["close"].as<double>(),
                          row["volume"].is_null() ? 0.0 : row["volume"].as<double>(),
                          row["symbol"].as<std::string>());
    }

    return DataConversionUtils::bars_to_arrow_table(bars);
}

Result<std::shared_ptr<arrow::Table>> PostgresDatabase::snapshot_to_arrow_table(
    const pqxx::result& result) const {
    arrow::MemoryPool* pool = arrow::default_memory_pool();
    arrow::StringBuilder symbol_builder(pool);
    arrow::DoubleBuilder price_builder(pool);
    arrow::DoubleBuilder volume_amount_builder(pool);
    arrow::DoubleBuilder per_builder(pool);
    arrow::DoubleBuilder pbr_builder(pool);
    arrow::DoubleBuilder roe_builder(pool);
    arrow::DoubleBuilder market_cap_builder(pool);

    auto append_double = [](arrow::DoubleBuilder& builder, const pqxx::row& row,
                            const char* column) {
        if (row[column].is_null()) {
            return builder.AppendNull();
        }
        return builder.Append(row[column].as<double>());
    };

    for (const auto& row : result) {
        arrow::Status status = symbol_builder.Append(row["symbol"].as<std::string>());
        if (status.ok())
            status = append_double(price_builder, row, "price");
        if (status.ok())
            status = append_double(volume_amount_builder, row, "volume_amount");
        if (status.ok())
            status = append_double(per_builder, row, "per");
        if (status.ok())
            status = append_double(pbr_builder, row, "pbr");
        if (status.ok())
            status = append_double(roe_builder, row, "roe");
        if (status.ok())
            status = append_double(market_cap_builder, row, "market_cap");
        if (!status.ok()) {
            return make_error<std::shared_ptr<arrow::Table>>(
                ErrorCode::CONVERSION_ERROR, "Arrow builder error: " + status.ToString(),
                "PostgresDatabase");
        }
    }

    std::shared_ptr<arrow::Array> symbol_array, price_array, volume_amount_array, per_array,
        pbr_array, roe_array, market_cap_array;
    arrow::Status status = symbol_builder.Finish(&symbol_array);
    if (status.ok())
        status = price_builder.Finish(&price_array);
    if (status.ok())
        status = volume_amount_builder.Finish(&volume_amount_array);
    if (status.ok())
        status = per_builder.Finish(&per_array);
    if (status.ok())
        status = pbr_builder.Finish(&pbr_array);
    if (status.ok())
        status = roe_builder.Finish(&roe_array);
    if (status.ok())
        status = market_cap_builder.Finish(&market_cap_array);
    if (!status.ok()) {
        return make_error<std::shared_ptr<arrow::Table>>(
            ErrorCode::CONVERSION_ERROR, "Arrow builder error: " + status.ToString(),
            "PostgresDatabase");
    }

    auto schema = arrow::schema(
        {arrow::field("symbol", arrow::utf8()), arrow::field("price", arrow::float64()),
         arrow::field("volume_amount", arrow::float64()), arrow::field("per", arrow::float64()),
         arrow::field("pbr", arrow::float64()), arrow::field("roe", arrow::float64()),
         arrow::field("market_cap", arrow::float64())});

    return arrow::Table::Make(schema, {symbol_array, price_array, volume_amount_array, per_array,
                                       pbr_array, roe_array, market_cap_array});
}

}  // namespace data
}  // namespace backfolio
