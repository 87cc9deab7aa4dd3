// include/backfolio/data/conversion_utils.hpp
#pragma once

#include <arrow/api.h>
#include <memory>
#include <string>
#include <vector>
#include "backfolio/core/error.hpp"
#include "backfolio/core/types.hpp"
#include "backfolio/data/market_data_source.hpp"

namespace backfolio {
namespace data {

/**
 * @brief Conversions between Arrow tables and the engine's row types
 *
 * OHLC tables carry the columns time (timestamp[s]), symbol (utf8) and
 * open/high/low/close/volume (float64). Snapshot tables carry symbol, price,
 * volume_amount, per, pbr, roe and any further float64 columns.
 */
class DataConversionUtils {
public:
    static Result<std::vector<Bar>> arrow_table_to_bars(const std::shared_ptr<arrow::Table>& table);

    /**
     * @brief Group an OHLC table by symbol, each series sorted by time
     */
    static Result<OhlcSeriesMap> arrow_table_to_series(const std::shared_ptr<arrow::Table>& table);

    /**
     * @brief Build snapshot rows; null fundamentals become NaN
     */
    static Result<MarketSnapshot> arrow_table_to_snapshot(
        const std::shared_ptr<arrow::Table>& table, const Timestamp& date);

    static Result<std::shared_ptr<arrow::Table>> bars_to_arrow_table(const std::vector<Bar>& bars);

    static std::shared_ptr<arrow::Schema> ohlc_schema();

private:
    static Result<Timestamp> extract_timestamp(const std::shared_ptr<arrow::ChunkedArray>& column,
                                               int64_t index);

    static Result<double> extract_double(const std::shared_ptr<arrow::ChunkedArray>& column,
                                         int64_t index);

    static Result<std::string> extract_string(const std::shared_ptr<arrow::ChunkedArray>& column,
                                              int64_t index);

    /**
     * @brief Locate the chunk holding a row of a chunked column
     */
    static std::pair<std::shared_ptr<arrow::Array>, int64_t> locate(
        const std::shared_ptr<arrow::ChunkedArray>& column, int64_t index);
};

}  // namespace data
}  // namespace backfolio
