#include <gtest/gtest.h>
#include "backfolio/core/time_utils.hpp"
#include "backfolio/data/postgres_database.hpp"
#include "core/test_base.hpp"

using namespace backfolio;
using namespace backfolio::data;
using namespace backfolio::testing;

class PostgresDatabaseTest : public TestBase {
protected:
    static PostgresSourceConfig unreachable_config() {
        PostgresSourceConfig config;
        config.connection_string =
            "host=/nonexistent/backfolio/socket dbname=market connect_timeout=1";
        return config;
    }
};

TEST_F(PostgresDatabaseTest, ConfigDefaultsAndJson) {
    PostgresSourceConfig config;
    EXPECT_EQ(config.ohlc_table, "ohlc_data");
    EXPECT_EQ(config.fundamentals_table, "stock_master");
    EXPECT_EQ(config.interval, "1d");

    config.from_json({{"connection_string", "postgresql://db/market"}, {"interval", "1D"}});
    EXPECT_EQ(config.connection_string, "postgresql://db/market");
    EXPECT_EQ(config.interval, "1D");
    EXPECT_EQ(config.to_json()["ohlc_table"], "ohlc_data");
}

TEST_F(PostgresDatabaseTest, QueriesRequireConnection) {
    PostgresDatabase db(unreachable_config());
    EXPECT_FALSE(db.is_connected());

    auto day = core::make_timestamp(2024, 1, 2);
    auto snapshot = db.get_market_snapshot(day);
    ASSERT_TRUE(snapshot.is_error());
    EXPECT_EQ(snapshot.error()->code(), ErrorCode::CONNECTION_ERROR);

    auto ohlc = db.get_multi_ohlc({"005930"}, DataFrequency::DAILY, day, day);
    ASSERT_TRUE(ohlc.is_error());
    EXPECT_EQ(ohlc.error()->code(), ErrorCode::CONNECTION_ERROR);

    auto calendar = db.get_trading_days(day, day);
    ASSERT_TRUE(calendar.is_error());
    EXPECT_EQ(calendar.error()->code(), ErrorCode::CONNECTION_ERROR);
}

TEST_F(PostgresDatabaseTest, RejectsUnsafeTableNames) {
    PostgresSourceConfig config = unreachable_config();
    config.ohlc_table = "ohlc_data; DROP TABLE stock_master";

    PostgresDatabase db(config);
    auto connected = db.connect();
    ASSERT_TRUE(connected.is_error());
    EXPECT_EQ(connected.error()->code(), ErrorCode::INVALID_ARGUMENT);
    EXPECT_FALSE(db.is_connected());
}

TEST_F(PostgresDatabaseTest, UnreachableServerIsConnectionError) {
    PostgresDatabase db(unreachable_config());
    auto connected = db.connect();
    ASSERT_TRUE(connected.is_error());
    EXPECT_EQ(connected.error()->code(), ErrorCode::CONNECTION_ERROR);
    EXPECT_FALSE(db.is_connected());

    db.disconnect();
    EXPECT_FALSE(db.is_connected());
}
