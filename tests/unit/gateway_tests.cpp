#include <gtest/gtest.h>
#include <anchorband/data/gateway_client.hpp>
#include <anchorband/data/gateway_sources.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <future>

using anchorband::core::Date;
using anchorband::data::GatewayBarSource;
using anchorband::data::GatewayCalendarSource;
using anchorband::data::GatewayClient;
using anchorband::data::GatewayConfiguration;
using nlohmann::json;

TEST(GatewayClientTest, DurationStrings) {
    EXPECT_EQ(GatewayClient::duration_for_days(1), "2 D");
    EXPECT_EQ(GatewayClient::duration_for_days(23), "23 D");
    EXPECT_EQ(GatewayClient::duration_for_days(365), "365 D");
    EXPECT_EQ(GatewayClient::duration_for_days(366), "1 Y");
    EXPECT_EQ(GatewayClient::duration_for_days(800), "2 Y");
}

TEST(GatewayClientTest, InformationalCodes) {
    EXPECT_TRUE(GatewayClient::is_informational(2104));
    EXPECT_TRUE(GatewayClient::is_informational(2106));
    EXPECT_TRUE(GatewayClient::is_informational(2158));
    EXPECT_TRUE(GatewayClient::is_informational(2176));
    EXPECT_FALSE(GatewayClient::is_informational(162));
    EXPECT_FALSE(GatewayClient::is_informational(0));
}

TEST(GatewayClientTest, ReplyCompletesMatchingRequest) {
    GatewayClient client;
    auto first = client.expect_reply(1);
    auto second = client.expect_reply(2);

    client.dispatch(R"({"id": 2, "rows": [{"symbol": "ABC"}]})");
    ASSERT_EQ(second.wait_for(std::chrono::milliseconds(0)), std::future_status::ready);
    EXPECT_EQ(first.wait_for(std::chrono::milliseconds(0)), std::future_status::timeout);

    auto reply = second.get();
    EXPECT_TRUE(reply.ok);
    ASSERT_EQ(reply.rows.size(), 1u);
    EXPECT_EQ(reply.rows[0]["symbol"], "ABC");
}

TEST(GatewayClientTest, ErrorRepliesFailTheRequest) {
    GatewayClient client;
    auto pending = client.expect_reply(5);

    client.dispatch(R"({"id": 5, "error": {"code": 162, "message": "no data"}})");
    ASSERT_EQ(pending.wait_for(std::chrono::milliseconds(0)), std::future_status::ready);

    auto reply = pending.get();
    EXPECT_FALSE(reply.ok);
    EXPECT_EQ(reply.error_code, 162);
    EXPECT_EQ(reply.error_message, "no data");
}

TEST(GatewayClientTest, MistypedErrorFieldsStillFailTheRequest) {
    GatewayClient client;
    auto bad_code = client.expect_reply(6);
    auto bad_message = client.expect_reply(7);

    EXPECT_NO_THROW(client.dispatch(R"({"id": 6, "error": {"code": "x"}})"));
    EXPECT_NO_THROW(client.dispatch(R"({"id": 7, "error": {"code": 162, "message": ["no", "data"]}})"));

    ASSERT_EQ(bad_code.wait_for(std::chrono::milliseconds(0)), std::future_status::ready);
    auto first = bad_code.get();
    EXPECT_FALSE(first.ok);
    EXPECT_EQ(first.error_code, 0);

    ASSERT_EQ(bad_message.wait_for(std::chrono::milliseconds(0)), std::future_status::ready);
    auto second = bad_message.get();
    EXPECT_FALSE(second.ok);
    EXPECT_EQ(second.error_code, 162);
    EXPECT_TRUE(second.error_message.empty());
}

TEST(GatewayClientTest, InformationalErrorsLeaveRequestPending) {
    GatewayClient client;
    auto pending = client.expect_reply(3);

    client.dispatch(R"({"id": 3, "error": {"code": 2104, "message": "farm connection is OK"}})");
    EXPECT_EQ(pending.wait_for(std::chrono::milliseconds(0)), std::future_status::timeout);

    client.dispatch(R"({"id": 3, "rows": []})");
    EXPECT_EQ(pending.wait_for(std::chrono::milliseconds(0)), std::future_status::ready);
}

TEST(GatewayClientTest, GarbageAndUnknownIdsAreDropped) {
    GatewayClient client;
    auto pending = client.expect_reply(9);

    client.dispatch("not json");
    client.dispatch("[1, 2, 3]");
    client.dispatch(R"({"id": 99, "rows": []})");
    client.dispatch(R"({"rows": []})");
    EXPECT_EQ(pending.wait_for(std::chrono::milliseconds(0)), std::future_status::timeout);
}

TEST(GatewayClientTest, RequestWithoutConnectionFails) {
    GatewayClient client;
    EXPECT_FALSE(client.is_connected());
    EXPECT_FALSE(client.request("daily_bars", json{{"symbol", "ABC"}}).has_value());
}

TEST(GatewayClientTest, TimesOutWithoutGateway) {
    GatewayConfiguration config;
    config.endpoint = "tcp://127.0.0.1:59999";
    config.request_timeout = std::chrono::milliseconds(100);

    GatewayClient client(config);
    ASSERT_TRUE(client.connect());
    EXPECT_FALSE(client.request("earnings_by_date", json{{"date", "2024-01-05"}}).has_value());
    client.disconnect();
    EXPECT_FALSE(client.is_connected());
}

TEST(GatewaySourcesTest, ParsesBarRows) {
    json rows = json::array({
        {{"date", "20240103"}, {"open", 11}, {"high", 12}, {"low", 10}, {"close", 11.5}, {"volume", 1000}},
        {{"date", "2024-01-02"}, {"open", 10}, {"high", 11}, {"low", 9}, {"close", 10.5}, {"volume", "900"}},
        {{"date", "2024-01-03"}, {"open", 99}, {"high", 99}, {"low", 99}, {"close", 99}, {"volume", 1}},
        {{"date", "garbage"}, {"open", 1}, {"high", 1}, {"low", 1}, {"close", 1}, {"volume", 1}},
        {{"date", "2024-01-04"}, {"open", 1}, {"high", 1}, {"low", 1}, {"close", 1}},
        "not an object"
    });

    auto bars = GatewayBarSource::parse_bar_rows(rows);
    ASSERT_EQ(bars.size(), 2u);
    EXPECT_EQ(bars[0].date, Date(2024, 1, 2));
    EXPECT_DOUBLE_EQ(bars[0].volume, 900.0);
    EXPECT_EQ(bars[1].date, Date(2024, 1, 3));
    EXPECT_DOUBLE_EQ(bars[1].close, 11.5);

    EXPECT_TRUE(GatewayBarSource::parse_bar_rows(json::object()).empty());
}

TEST(GatewaySourcesTest, NonFiniteStringFieldsDropTheRow) {
    json rows = json::array({
        {{"date", "2024-01-02"}, {"open", "nan"}, {"high", 11}, {"low", 9}, {"close", 10}, {"volume", 100}},
        {{"date", "2024-01-03"}, {"open", 10}, {"high", "inf"}, {"low", 9}, {"close", 10}, {"volume", 100}},
        {{"date", "2024-01-04"}, {"open", 10}, {"high", 11}, {"low", 9}, {"close", 10}, {"volume", "-inf"}},
        {{"date", "2024-01-05"}, {"open", 10}, {"high", 11}, {"low", 9}, {"close", "1e999"}, {"volume", 100}},
        {{"date", "2024-01-08"}, {"open", "10"}, {"high", "11"}, {"low", "9"}, {"close", "10.5"}, {"volume", "100"}}
    });

    auto bars = GatewayBarSource::parse_bar_rows(rows);
    ASSERT_EQ(bars.size(), 1u);
    EXPECT_EQ(bars[0].date, Date(2024, 1, 8));
    EXPECT_DOUBLE_EQ(bars[0].close, 10.5);
}

TEST(GatewaySourcesTest, ParsesCalendarRows) {
    json rows = json::array({{{"symbol", "abc"}}, {{"name", "no symbol"}}, "xyz", {{"symbol", ""}}});
    auto parsed = GatewayCalendarSource::parse_calendar_rows(rows);

    ASSERT_EQ(parsed.size(), 2u);
    EXPECT_EQ(parsed[0].symbol, "ABC");
    EXPECT_EQ(parsed[1].symbol, "XYZ");
}

TEST(GatewaySourcesTest, ParsesHistoryRows) {
    json rows = json::array({{{"date", "2024-01-05T16:00:00"}}, "2023-10-20", 20230721, {{"date", "later"}}});
    auto parsed = GatewayCalendarSource::parse_history_rows(rows);

    ASSERT_EQ(parsed.size(), 3u);
    EXPECT_EQ(parsed[0], Date(2024, 1, 5));
    EXPECT_EQ(parsed[1], Date(2023, 10, 20));
    EXPECT_EQ(parsed[2], Date(2023, 7, 21));
}

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
