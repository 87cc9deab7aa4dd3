// src/data/conversion_utils.cpp
#include "backfolio/data/conversion_utils.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <set>

namespace backfolio {
namespace data {

std::shared_ptr<arrow::Schema> DataConversionUtils::ohlc_schema() {
    return arrow::schema({arrow::field("time", arrow::timestamp(arrow::TimeUnit::SECOND)),
                          arrow::field("symbol", arrow::utf8()),
                          arrow::field("open", arrow::float64()),
                          arrow::field("high", arrow::float64()),
                          arrow::field("low", arrow::float64()),
                          arrow::field("close", arrow::float64()),
                          arrow::field("volume", arrow::float64())});
}

std::pair<std::shared_ptr<arrow::Array>, int64_t> DataConversionUtils::locate(
    const std::shared_ptr<arrow::ChunkedArray>& column, int64_t index) {
    int64_t offset = index;
    for (int c = 0; c < column->num_chunks(); ++c) {
        auto chunk = column->chunk(c);
        if (offset < chunk->length()) {
            return {chunk, offset};
        }
        offset -= chunk->length();
    }
    return {nullptr, -1};
}

Result<std::vector<Bar>> DataConversionUtils::arrow_table_to_bars(
    const std::shared_ptr<arrow::Table>& table) {
    if (!table) {
        return make_error<std::vector<Bar>>(ErrorCode::INVALID_ARGUMENT, "Table pointer is null",
                                            "DataConversionUtils");
    }

    const std::vector<std::string> required_columns = {"time", "symbol", "open", "high",
                                                       "low",  "close",  "volume"};
    for (const auto& col : required_columns) {
        if (table->GetColumnByName(col) == nullptr) {
            return make_error<std::vector<Bar>>(ErrorCode::INVALID_DATA,
                                                "Missing required column: " + col,
                                                "DataConversionUtils");
        }
    }

    auto time_col = table->GetColumnByName("time");
    auto symbol_col = table->GetColumnByName("symbol");
    auto open_col = table->GetColumnByName("open");
    auto high_col = table->GetColumnByName("high");
    auto low_col = table->GetColumnByName("low");
    auto close_col = table->GetColumnByName("close");
    auto volume_col = table->GetColumnByName("volume");

    std::vector<Bar> bars;
    bars.reserve(static_cast<size_t>(table->num_rows()));

    for (int64_t i = 0; i < table->num_rows(); ++i) {
        auto ts = extract_timestamp(time_col, i);
        if (ts.is_error()) {
            return make_error<std::vector<Bar>>(ts.error()->code(), ts.error()->what(),
                                                "DataConversionUtils");
        }

        auto symbol = extract_string(symbol_col, i);
        if (symbol.is_error()) {
            return make_error<std::vector<Bar>>(symbol.error()->code(), symbol.error()->what(),
                                                "DataConversionUtils");
        }

        auto open = extract_double(open_col, i);
        auto high = extract_double(high_col, i);
        auto low = extract_double(low_col, i);
        auto close = extract_double(close_col, i);
        auto volume = extract_double(volume_col, i);
        if (open.is_error() || high.is_error() || low.is_error() || close.is_error() ||
            volume.is_error()) {
            return make_error<std::vector<Bar>>(
                ErrorCode::CONVERSION_ERROR,
                "Error extracting OHLCV values at row " + std::to_string(i),
                "DataConversionUtils");
        }

        bars.emplace_back(ts.value(), open.value(), high.value(), low.value(), close.value(),
                          volume.value(), symbol.value());
    }

    return bars;
}

Result<OhlcSeriesMap> DataConversionUtils::arrow_table_to_series(
    const std::shared_ptr<arrow::Table>& table) {
    auto bars = arrow_table_to_bars(table);
    if (bars.is_error()) {
        return make_error<OhlcSeriesMap>(bars.error()->code(), bars.error()->what(),
                                         "DataConversionUtils");
    }

    OhlcSeriesMap series;
    for (const auto& bar : bars.value()) {
        series[bar.symbol].push_back(bar);
    }
    for (auto& [symbol, symbol_bars] : series) {
        std::stable_sort(symbol_bars.begin(), symbol_bars.end(),
                         [](const Bar& a, const Bar& b) { return a.timestamp < b.timestamp; });
    }
    return series;
}

Result<MarketSnapshot> DataConversionUtils::arrow_table_to_snapshot(
    const std::shared_ptr<arrow::Table>& table, const Timestamp& date) {
    if (!table) {
        return make_error<MarketSnapshot>(ErrorCode::INVALID_ARGUMENT, "Table pointer is null",
                                          "DataConversionUtils");
    }

    auto symbol_col = table->GetColumnByName("symbol");
    auto price_col = table->GetColumnByName("price");
    if (!symbol_col || !price_col) {
        return make_error<MarketSnapshot>(ErrorCode::INVALID_DATA,
                                          "Snapshot table needs symbol and price columns",
                                          "DataConversionUtils");
    }
    auto volume_amount_col = table->GetColumnByName("volume_amount");
    auto per_col = table->GetColumnByName("per");
    auto pbr_col = table->GetColumnByName("pbr");
    auto roe_col = table->GetColumnByName("roe");

    const std::set<std::string> known = {"symbol", "price", "volume_amount", "per", "pbr", "roe"};
    std::vector<std::pair<std::string, std::shared_ptr<arrow::ChunkedArray>>> extra;
    for (const auto& field : table->schema()->fields()) {
        if (known.count(field->name()) == 0 && field->type()->id() == arrow::Type::DOUBLE) {
            extra.emplace_back(field->name(), table->GetColumnByName(field->name()));
        }
    }

    // Null or absent fundamentals read as NaN
    auto optional_double = [](const std::shared_ptr<arrow::ChunkedArray>& col, int64_t i) {
        if (!col) {
            return std::numeric_limits<double>::quiet_NaN();
        }
        auto v = extract_double(col, i);
        return v.is_ok() ? v.value() : std::numeric_limits<double>::quiet_NaN();
    };

    MarketSnapshot snapshot;
    snapshot.date = date;
    snapshot.rows.reserve(static_cast<size_t>(table->num_rows()));

    for (int64_t i = 0; i < table->num_rows(); ++i) {
        auto symbol = extract_string(symbol_col, i);
        if (symbol.is_error()) {
            return make_error<MarketSnapshot>(symbol.error()->code(), symbol.error()->what(),
                                              "DataConversionUtils");
        }

        SnapshotRow row;
        row.symbol = symbol.value();
        row.price = optional_double(price_col, i);
        double volume_amount = optional_double(volume_amount_col, i);
        row.volume_amount = std::isnan(volume_amount) ? 0.0 : volume_amount;
        row.per = optional_double(per_col, i);
        row.pbr = optional_double(pbr_col, i);
        row.roe = optional_double(roe_col, i);
        for (const auto& [name, col] : extra) {
            row.fields[name] = optional_double(col, i);
        }
        snapshot.rows.push_back(std::move(row));
    }

    return snapshot;
}

Result<std::shared_ptr<arrow::Table>> DataConversionUtils::bars_to_arrow_table(
    const std::vector<Bar>& bars) {
    arrow::MemoryPool* pool = arrow::default_memory_pool();

    arrow::TimestampBuilder time_builder(arrow::timestamp(arrow::TimeUnit::SECOND), pool);
    arrow::StringBuilder symbol_builder(pool);
    arrow::DoubleBuilder open_builder(pool);
    arrow::DoubleBuilder high_builder(pool);
    arrow::DoubleBuilder low_builder(pool);
    arrow::DoubleBuilder close_builder(pool);
    arrow::DoubleBuilder volume_builder(pool);

    auto builder_error = [](const std::string& operation, const arrow::Status& status) {
        return make_error<std::shared_ptr<arrow::Table>>(
            ErrorCode::CONVERSION_ERROR,
            "Arrow builder error during " + operation + ": " + status.ToString(),
            "DataConversionUtils");
    };

    for (const auto& bar : bars) {
        auto secs = std::chrono::duration_cast<std::chrono::seconds>(
                        bar.timestamp.time_since_epoch())
                        .count();
        arrow::Status status = time_builder.Append(secs);
        if (status.ok())
            status = symbol_builder.Append(bar.symbol);
        if (status.ok())
            status = open_builder.Append(bar.open);
        if (status.ok())
            status = high_builder.Append(bar.high);
        if (status.ok())
            status = low_builder.Append(bar.low);
        if (status.ok())
            status = close_builder.Append(bar.close);
        if (status.ok())
            status = volume_builder.Append(bar.volume);
        if (!status.ok()) {
            return builder_error("append", status);
        }
    }

    std::shared_ptr<arrow::Array> time_array, symbol_array, open_array, high_array, low_array,
        close_array, volume_array;
    arrow::Status status = time_builder.Finish(&time_array);
    if (status.ok())
        status = symbol_builder.Finish(&symbol_array);
    if (status.ok())
        status = open_builder.Finish(&open_array);
    if (status.ok())
        status = high_builder.Finish(&high_array);
    if (status.ok())
        status = low_builder.Finish(&low_array);
    if (status.ok())
        status = close_builder.Finish(&close_array);
    if (status.ok())
        status = volume_builder.Finish(&volume_array);
    if (!status.ok()) {
        return builder_error("finish", status);
    }

    return arrow::Table::Make(ohlc_schema(), {time_array, symbol_array, open_array, high_array,
                                              low_array, close_array, volume_array});
}

Result<Timestamp> DataConversionUtils::extract_timestamp(
    const std::shared_ptr<arrow::ChunkedArray>& column, int64_t index) {
    auto [array, offset] = locate(column, index);
    if (!array) {
        return make_error<Timestamp>(ErrorCode::INVALID_ARGUMENT,
                                     "Row " + std::to_string(index) + " out of range",
                                     "DataConversionUtils");
    }
    if (array->type_id() != arrow::Type::TIMESTAMP) {
        return make_error<Timestamp>(ErrorCode::CONVERSION_ERROR,
                                     "Column is not a timestamp column", "DataConversionUtils");
    }
    if (array->IsNull(offset)) {
        return make_error<Timestamp>(ErrorCode::INVALID_DATA,
                                     "Null timestamp value at index " + std::to_string(index),
                                     "DataConversionUtils");
    }

    auto ts_array = std::static_pointer_cast<arrow::TimestampArray>(array);
    auto unit = std::static_pointer_cast<arrow::TimestampType>(ts_array->type())->unit();
    int64_t value = ts_array->Value(offset);

    switch (unit) {
        case arrow::TimeUnit::SECOND:
            return Timestamp(std::chrono::seconds(value));
        case arrow::TimeUnit::MILLI:
            return Timestamp(std::chrono::milliseconds(value));
        case arrow::TimeUnit::MICRO:
            return Timestamp(std::chrono::duration_cast<Timestamp::duration>(
                std::chrono::microseconds(value)));
        case arrow::TimeUnit::NANO:
            return Timestamp(std::chrono::duration_cast<Timestamp::duration>(
                std::chrono::nanoseconds(value)));
    }
    return make_error<Timestamp>(ErrorCode::CONVERSION_ERROR, "Unknown timestamp unit",
                                 "DataConversionUtils");
}

Result<double> DataConversionUtils::extract_double(
    const std::shared_ptr<arrow::ChunkedArray>& column, int64_t index) {
    auto [array, offset] = locate(column, index);
    if (!array) {
        return make_error<double>(ErrorCode::INVALID_ARGUMENT,
                                  "Row " + std::to_string(index) + " out of range",
                                  "DataConversionUtils");
    }
    if (array->IsNull(offset)) {
        return make_error<double>(ErrorCode::INVALID_DATA,
                                  "Null double value at index " + std::to_string(index),
                                  "DataConversionUtils");
    }

    switch (array->type_id()) {
        case arrow::Type::DOUBLE:
            return std::static_pointer_cast<arrow::DoubleArray>(array)->Value(offset);
        case arrow::Type::INT64:
            return static_cast<double>(
                std::static_pointer_cast<arrow::Int64Array>(array)->Value(offset));
        default:
            return make_error<double>(ErrorCode::CONVERSION_ERROR,
                                      "Column is not numeric: " + array->type()->ToString(),
                                      "DataConversionUtils");
    }
}

Result<std::string> DataConversionUtils::extract_string(
    const std::shared_ptr<arrow::ChunkedArray>& column, int64_t index) {
    auto [array, offset] = locate(column, index);
    if (!array) {
        return make_error<std::string>(ErrorCode::INVALID_ARGUMENT,
                                       "Row " + std::to_string(index) + " out of range",
                                       "DataConversionUtils");
    }
    if (array->type_id() != arrow::Type::STRING) {
        return make_error<std::string>(ErrorCode::CONVERSION_ERROR,
                                       "Column is not a string column", "DataConversionUtils");
    }
    if (array->IsNull(offset)) {
        return make_error<std::string>(ErrorCode::INVALID_DATA,
                                       "Null string value at index " + std::to_string(index),
                                       "DataConversionUtils");
    }
    return std::static_pointer_cast<arrow::StringArray>(array)->GetString(offset);
}

}  // namespace data
}  // namespace backfolio
