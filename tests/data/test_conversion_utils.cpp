#include <gtest/gtest.h>
#include <arrow/api.h>
#include <cmath>
#include "backfolio/data/conversion_utils.hpp"
#include "core/test_base.hpp"
#include "data/test_data_utils.hpp"

using namespace backfolio;
using namespace backfolio::data;
using namespace backfolio::testing;

class ConversionUtilsTest : public TestBase {
protected:
    std::shared_ptr<arrow::Table> make_snapshot_table() {
        arrow::StringBuilder symbol_builder;
        arrow::DoubleBuilder price_builder;
        arrow::DoubleBuilder per_builder;
        arrow::DoubleBuilder dividend_builder;

        EXPECT_TRUE(symbol_builder.Append("AAA").ok());
        EXPECT_TRUE(symbol_builder.Append("BBB").ok());
        EXPECT_TRUE(price_builder.Append(100.0).ok());
        EXPECT_TRUE(price_builder.Append(50.0).ok());
        EXPECT_TRUE(per_builder.Append(8.5).ok());
        EXPECT_TRUE(per_builder.AppendNull().ok());
        EXPECT_TRUE(dividend_builder.Append(2.0).ok());
        EXPECT_TRUE(dividend_builder.Append(1.0).ok());

        std::shared_ptr<arrow::Array> symbols, prices, pers, dividends;
        EXPECT_TRUE(symbol_builder.Finish(&symbols).ok());
        EXPECT_TRUE(price_builder.Finish(&prices).ok());
        EXPECT_TRUE(per_builder.Finish(&pers).ok());
        EXPECT_TRUE(dividend_builder.Finish(&dividends).ok());

        auto schema = arrow::schema({arrow::field("symbol", arrow::utf8()),
                                     arrow::field("price", arrow::float64()),
                                     arrow::field("per", arrow::float64()),
                                     arrow::field("dividend_yield", arrow::float64())});
        return arrow::Table::Make(schema, {symbols, prices, pers, dividends});
    }
};

TEST_F(ConversionUtilsTest, BarsSurviveArrowTable) {
    std::vector<Bar> bars = {Bar(make_day(0), 10.0, 11.0, 9.0, 10.5, 1000.0, "AAA"),
                             Bar(make_day(1), 10.5, 12.0, 10.0, 11.5, 1500.0, "AAA")};

    auto table = DataConversionUtils::bars_to_arrow_table(bars);
    ASSERT_TRUE(table.is_ok()) << table.error()->to_string();
    EXPECT_EQ(table.value()->num_rows(), 2);
    EXPECT_TRUE(table.value()->schema()->Equals(*DataConversionUtils::ohlc_schema()));

    auto decoded = DataConversionUtils::arrow_table_to_bars(table.value());
    ASSERT_TRUE(decoded.is_ok()) << decoded.error()->to_string();
    ASSERT_EQ(decoded.value().size(), 2u);
    EXPECT_EQ(decoded.value()[1].timestamp, make_day(1));
    EXPECT_EQ(decoded.value()[1].symbol, "AAA");
    EXPECT_DOUBLE_EQ(decoded.value()[1].high, 12.0);
    EXPECT_DOUBLE_EQ(decoded.value()[1].volume, 1500.0);
}

TEST_F(ConversionUtilsTest, SeriesAreGroupedAndSorted) {
    std::vector<Bar> bars = {make_bar("BBB", make_day(2), 3.0), make_bar("AAA", make_day(1), 2.0),
                             make_bar("BBB", make_day(0), 1.0), make_bar("AAA", make_day(0), 1.0)};
    auto table = DataConversionUtils::bars_to_arrow_table(bars);
    ASSERT_TRUE(table.is_ok());

    auto series = DataConversionUtils::arrow_table_to_series(table.value());
    ASSERT_TRUE(series.is_ok());
    ASSERT_EQ(series.value().size(), 2u);
    const auto& b = series.value().at("BBB");
    ASSERT_EQ(b.size(), 2u);
    EXPECT_EQ(b[0].timestamp, make_day(0));
    EXPECT_EQ(b[1].timestamp, make_day(2));
}

TEST_F(ConversionUtilsTest, SnapshotNullsBecomeNaN) {
    auto snapshot = DataConversionUtils::arrow_table_to_snapshot(make_snapshot_table(), make_day(0));
    ASSERT_TRUE(snapshot.is_ok()) << snapshot.error()->to_string();
    ASSERT_EQ(snapshot.value().rows.size(), 2u);

    const SnapshotRow* aaa = snapshot.value().find("AAA");
    ASSERT_NE(aaa, nullptr);
    EXPECT_DOUBLE_EQ(aaa->price, 100.0);
    EXPECT_DOUBLE_EQ(aaa->per, 8.5);
    EXPECT_TRUE(std::isnan(aaa->pbr));
    EXPECT_DOUBLE_EQ(aaa->volume_amount, 0.0);
    EXPECT_DOUBLE_EQ(aaa->fields.at("dividend_yield"), 2.0);

    const SnapshotRow* bbb = snapshot.value().find("BBB");
    ASSERT_NE(bbb, nullptr);
    EXPECT_TRUE(std::isnan(bbb->per));
    EXPECT_EQ(snapshot.value().find("CCC"), nullptr);
}

TEST_F(ConversionUtilsTest, MissingColumnsAreInvalidData) {
    arrow::StringBuilder symbol_builder;
    ASSERT_TRUE(symbol_builder.Append("AAA").ok());
    std::shared_ptr<arrow::Array> symbols;
    ASSERT_TRUE(symbol_builder.Finish(&symbols).ok());
    auto table = arrow::Table::Make(arrow::schema({arrow::field("symbol", arrow::utf8())}),
                                    {symbols});

    auto bars = DataConversionUtils::arrow_table_to_bars(table);
    ASSERT_TRUE(bars.is_error());
    EXPECT_EQ(bars.error()->code(), ErrorCode::INVALID_DATA);

    auto snapshot = DataConversionUtils::arrow_table_to_snapshot(table, make_day(0));
    ASSERT_TRUE(snapshot.is_error());
    EXPECT_EQ(snapshot.error()->code(), ErrorCode::INVALID_DATA);
}

TEST_F(ConversionUtilsTest, NullTableIsInvalidArgument) {
    auto bars = DataConversionUtils::arrow_table_to_bars(nullptr);
    ASSERT_TRUE(bars.is_error());
    EXPECT_EQ(bars.error()->code(), ErrorCode::INVALID_ARGUMENT);
}
