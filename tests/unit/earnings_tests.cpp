#include <gtest/gtest.h>
#include <anchorband/earnings/anchor_cache.hpp>
#include <anchorband/earnings/anchor_resolver.hpp>
#include <anchorband/earnings/anchor_set.hpp>
#include <anchorband/earnings/calendar_source.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <map>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

using anchorband::core::Date;
using anchorband::earnings::AnchorCache;
using anchorband::earnings::AnchorResolver;
using anchorband::earnings::AnchorSet;
using anchorband::earnings::CalendarRow;
using anchorband::earnings::ResolverConfiguration;
using nlohmann::json;

// Calendar with a fixed answer per date; records every request
class FakeCalendar : public anchorband::earnings::CalendarSource {
public:
    std::vector<CalendarRow> earnings_on(const Date& date) override {
        queried_dates.push_back(date);
        if (failing_dates.count(date.to_iso())) {
            throw std::runtime_error("calendar endpoint unavailable");
        }
        auto it = by_date.find(date.to_iso());
        if (it == by_date.end()) {
            return {};
        }
        std::vector<CalendarRow> rows;
        for (const auto& symbol : it->second) {
            rows.push_back(CalendarRow{symbol});
        }
        return rows;
    }

    std::vector<Date> earnings_history(const std::string& symbol, int limit) override {
        history_requests.push_back(symbol);
        last_limit = limit;
        if (history_throws) {
            throw std::runtime_error("history lookup failed");
        }
        auto it = history.find(symbol);
        return it != history.end() ? it->second : std::vector<Date>();
    }

    std::map<std::string, std::vector<std::string>> by_date;
    std::map<std::string, bool> failing_dates;
    std::map<std::string, std::vector<Date>> history;
    bool history_throws = false;

    std::vector<Date> queried_dates;
    std::vector<std::string> history_requests;
    int last_limit = 0;
};

// AnchorSet tests
TEST(AnchorSetTest, SortsDescendingAndDedupes) {
    AnchorSet set({Date(2023, 10, 20), Date(2024, 1, 5), Date(2023, 10, 20)});
    ASSERT_EQ(set.size(), 2u);
    EXPECT_EQ(*set.current(), Date(2024, 1, 5));
    EXPECT_EQ(*set.previous(), Date(2023, 10, 20));
}

TEST(AnchorSetTest, UpToAndMerge) {
    AnchorSet set({Date(2024, 3, 1), Date(2024, 1, 5)});
    AnchorSet past = set.up_to(Date(2024, 2, 1));
    ASSERT_EQ(past.size(), 1u);
    EXPECT_EQ(*past.current(), Date(2024, 1, 5));

    AnchorSet merged = past.merged_with({Date(2024, 1, 5), Date(2023, 7, 1)});
    EXPECT_EQ(merged.dates(), (std::vector<Date>{Date(2024, 1, 5), Date(2023, 7, 1)}));
    EXPECT_EQ(merged.most_recent(1), std::vector<Date>{Date(2024, 1, 5)});
    EXPECT_EQ(merged.most_recent(5).size(), 2u);
}

TEST(AnchorSetTest, NormalizesBareString) {
    AnchorSet set = anchorband::earnings::normalize_entry(json("2024-01-05"));
    ASSERT_EQ(set.size(), 1u);

    json out = anchorband::earnings::serialize_entry(set);
    EXPECT_EQ(out, json({{"current", "2024-01-05"}}));
    EXPECT_FALSE(out.contains("previous"));
    EXPECT_FALSE(out.contains("dates"));
}

TEST(AnchorSetTest, NormalizesLegacyShapes) {
    const std::vector<Date> expected{Date(2024, 1, 5), Date(2023, 10, 20)};

    EXPECT_EQ(anchorband::earnings::normalize_entry(json::array({"2023-10-20", "2024-01-05"})).dates(), expected);
    EXPECT_EQ(anchorband::earnings::normalize_entry(json{{"dates", {"2024-01-05", "2023-10-20"}}}).dates(), expected);
    EXPECT_EQ(anchorband::earnings::normalize_entry(
                  json{{"current", "2024-01-05"}, {"previous", "2023-10-20"}}).dates(), expected);
    EXPECT_EQ(anchorband::earnings::normalize_entry(
                  json{{"latest", "2024-01-05T16:00:00"}, {"prior", "2023-10-20"}}).dates(), expected);
}

TEST(AnchorSetTest, DropsUnparseableValues) {
    AnchorSet set = anchorband::earnings::normalize_entry(json::array({"2024-01-05", "soon", nullptr, 3.5}));
    ASSERT_EQ(set.size(), 1u);
    EXPECT_EQ(*set.current(), Date(2024, 1, 5));

    EXPECT_TRUE(anchorband::earnings::normalize_entry(json(42.0)).empty());
    EXPECT_TRUE(anchorband::earnings::normalize_entry(json::object()).empty());
}

TEST(AnchorSetTest, SerializesFullHistoryAboveTwoDates) {
    AnchorSet set({Date(2024, 1, 5), Date(2023, 10, 20), Date(2023, 7, 21)});
    json out = anchorband::earnings::serialize_entry(set);

    EXPECT_EQ(out["current"], "2024-01-05");
    EXPECT_EQ(out["previous"], "2023-10-20");
    ASSERT_TRUE(out.contains("dates"));
    EXPECT_EQ(out["dates"].size(), 3u);
}

TEST(AnchorSetTest, CacheDocumentDropsEmptyEntries) {
    json document = {
        {"ABC", "2024-01-05"},
        {"XYZ", "garbage"},
        {"QQQ", {{"dates", json::array()}}}
    };
    auto entries = anchorband::earnings::normalize_cache(document);
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_TRUE(entries.count("ABC"));

    EXPECT_TRUE(anchorband::earnings::normalize_cache(json::array({"ABC"})).empty());
}

// AnchorCache tests
class AnchorCacheTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir = std::filesystem::temp_directory_path() /
              ("anchorband_cache_test_" + std::to_string(::testing::UnitTest::GetInstance()->random_seed()) + "_" +
               ::testing::UnitTest::GetInstance()->current_test_info()->name());
        std::filesystem::remove_all(dir);
        std::filesystem::create_directories(dir);
        path = (dir / "earnings_cache.json").string();
    }

    void TearDown() override {
        std::filesystem::remove_all(dir);
    }

    std::filesystem::path dir;
    std::string path;
};

TEST_F(AnchorCacheTest, MissingFileIsEmpty) {
    AnchorCache cache(path);
    EXPECT_TRUE(cache.load());
    EXPECT_EQ(cache.size(), 0u);
}

TEST_F(AnchorCacheTest, SaveThenLoadRoundTrips) {
    AnchorCache cache(path);
    cache.put("ABC", AnchorSet({Date(2024, 1, 5), Date(2023, 10, 20), Date(2023, 7, 21)}));
    cache.put("XYZ", AnchorSet({Date(2024, 2, 1)}));
    cache.put("EMPTY", AnchorSet());
    ASSERT_TRUE(cache.save());

    AnchorCache reloaded(path);
    ASSERT_TRUE(reloaded.load());
    EXPECT_EQ(reloaded.size(), 2u);
    EXPECT_EQ(reloaded.get("ABC"), cache.get("ABC"));
    EXPECT_EQ(reloaded.get("XYZ"), cache.get("XYZ"));
    EXPECT_FALSE(reloaded.contains("EMPTY"));
    EXPECT_FALSE(std::filesystem::exists(path + ".tmp"));
}

TEST_F(AnchorCacheTest, WritesTwoSpaceIndentedJson) {
    AnchorCache cache(path);
    cache.put("ABC", AnchorSet({Date(2024, 1, 5)}));
    ASSERT_TRUE(cache.save());

    std::ifstream in(path);
    std::stringstream content;
    content << in.rdbuf();
    EXPECT_EQ(content.str(), "{\n  \"ABC\": {\n    \"current\": \"2024-01-05\"\n  }\n}\n");
}

TEST_F(AnchorCacheTest, ReadsLegacyFile) {
    {
        std::ofstream out(path);
        out << R"({"ABC": "2024-01-05", "XYZ": ["2023-10-20", "2024-01-25"], "OLD": {"latest": "2023-05-01"}})";
    }

    AnchorCache cache(path);
    ASSERT_TRUE(cache.load());
    EXPECT_EQ(cache.size(), 3u);
    EXPECT_EQ(*cache.get("XYZ").current(), Date(2024, 1, 25));
    EXPECT_EQ(*cache.get("OLD").current(), Date(2023, 5, 1));
}

TEST_F(AnchorCacheTest, CorruptFileLoadsEmpty) {
    {
        std::ofstream out(path);
        out << "{ this is not json";
    }

    AnchorCache cache(path);
    EXPECT_FALSE(cache.load());
    EXPECT_EQ(cache.size(), 0u);

    cache.put("ABC", AnchorSet({Date(2024, 1, 5)}));
    ASSERT_TRUE(cache.save());

    AnchorCache repaired(path);
    EXPECT_TRUE(repaired.load());
    EXPECT_EQ(repaired.size(), 1u);
}

// AnchorResolver tests
class AnchorResolverTest : public ::testing::Test {
protected:
    AnchorResolverTest() : today(2024, 3, 1) {
        config.throttle = std::chrono::milliseconds(1000);
        config.max_lookback_days = 60;
    }

    AnchorResolver make_resolver() {
        return AnchorResolver(calendar, config, [this](std::chrono::milliseconds d) { sleeps.push_back(d); });
    }

    FakeCalendar calendar;
    ResolverConfiguration config;
    std::vector<std::chrono::milliseconds> sleeps;
    AnchorCache cache;
    Date today;
};

TEST_F(AnchorResolverTest, ScanStopsOnceEverySymbolHasEnough) {
    calendar.by_date["2024-02-28"] = {"abc", "XYZ"};
    calendar.by_date["2024-02-20"] = {"ABC"};
    calendar.by_date["2024-02-10"] = {"XYZ"};
    calendar.by_date["2024-01-01"] = {"ABC"};

    auto resolver = make_resolver();
    auto found = resolver.collect_calendar_dates({"ABC", "xyz"}, today);

    EXPECT_EQ(found["ABC"], (std::vector<Date>{Date(2024, 2, 28), Date(2024, 2, 20)}));
    EXPECT_EQ(found["XYZ"], (std::vector<Date>{Date(2024, 2, 28), Date(2024, 2, 10)}));

    // 03/01 back to 02/10 inclusive, then stop
    EXPECT_EQ(calendar.queried_dates.size(), 21u);
    EXPECT_EQ(calendar.queried_dates.front(), today);
    EXPECT_EQ(calendar.queried_dates.back(), Date(2024, 2, 10));
    EXPECT_EQ(sleeps.size(), 20u);
}

TEST_F(AnchorResolverTest, ScanIsBoundedByLookback) {
    config.max_lookback_days = 5;
    auto resolver = make_resolver();
    auto found = resolver.collect_calendar_dates({"ABC"}, today);

    EXPECT_TRUE(found["ABC"].empty());
    EXPECT_EQ(calendar.queried_dates.size(), 5u);
}

TEST_F(AnchorResolverTest, CalendarFailureIsAnEmptyDay) {
    calendar.by_date["2024-02-29"] = {"ABC"};
    calendar.failing_dates["2024-03-01"] = true;

    auto resolver = make_resolver();
    auto found = resolver.collect_calendar_dates({"ABC"}, today);
    ASSERT_EQ(found["ABC"].size(), 1u);
    EXPECT_EQ(found["ABC"][0], Date(2024, 2, 29));
}

TEST_F(AnchorResolverTest, CacheHitSkipsScanAndFallback) {
    cache.put("ABC", AnchorSet({Date(2024, 1, 25), Date(2023, 10, 26)}));

    auto resolver = make_resolver();
    auto anchors = resolver.resolve_all({"ABC"}, cache, today);

    EXPECT_EQ(anchors["ABC"], (std::vector<Date>{Date(2024, 1, 25), Date(2023, 10, 26)}));
    EXPECT_TRUE(calendar.queried_dates.empty());
    EXPECT_TRUE(calendar.history_requests.empty());
}

TEST_F(AnchorResolverTest, FutureCachedDatesAreIgnored) {
    cache.put("ABC", AnchorSet({Date(2024, 4, 25), Date(2024, 1, 25), Date(2023, 10, 26)}));

    auto resolver = make_resolver();
    auto anchors = resolver.resolve_all({"ABC"}, cache, today);
    EXPECT_EQ(anchors["ABC"], (std::vector<Date>{Date(2024, 1, 25), Date(2023, 10, 26)}));
}

TEST_F(AnchorResolverTest, FallsThroughToHistory) {
    calendar.by_date["2024-02-15"] = {"ABC"};
    calendar.history["ABC"] = {Date(2024, 6, 1), Date(2024, 2, 15), Date(2023, 11, 9), Date(2023, 8, 10)};

    auto resolver = make_resolver();
    auto anchors = resolver.resolve_all({"ABC"}, cache, today);

    EXPECT_EQ(anchors["ABC"], (std::vector<Date>{Date(2024, 2, 15), Date(2023, 11, 9)}));
    ASSERT_EQ(calendar.history_requests.size(), 1u);
    EXPECT_EQ(calendar.last_limit, 8);

    // Everything known is persisted, not only the two anchors
    EXPECT_EQ(cache.get("ABC").size(), 3u);
}

TEST_F(AnchorResolverTest, HistoryFailureKeepsWhatWasFound) {
    calendar.by_date["2024-02-15"] = {"ABC"};
    calendar.history_throws = true;

    auto resolver = make_resolver();
    auto anchors = resolver.resolve_all({"ABC"}, cache, today);

    EXPECT_EQ(anchors["ABC"], std::vector<Date>{Date(2024, 2, 15)});
    EXPECT_EQ(cache.get("ABC").size(), 1u);
}

TEST_F(AnchorResolverTest, NothingFoundLeavesCacheUntouched) {
    auto resolver = make_resolver();
    auto anchors = resolver.resolve_all({"ABC"}, cache, today);

    EXPECT_TRUE(anchors["ABC"].empty());
    EXPECT_FALSE(cache.contains("ABC"));
}

TEST_F(AnchorResolverTest, OnlyShortSymbolsAreScanned) {
    cache.put("ABC", AnchorSet({Date(2024, 1, 25), Date(2023, 10, 26)}));
    calendar.by_date["2024-02-29"] = {"ABC", "XYZ"};
    calendar.by_date["2024-02-01"] = {"XYZ"};

    auto resolver = make_resolver();
    auto anchors = resolver.resolve_all({"ABC", "XYZ"}, cache, today);

    // ABC came from the cache, so the 02/29 row does not extend it
    EXPECT_EQ(anchors["ABC"], (std::vector<Date>{Date(2024, 1, 25), Date(2023, 10, 26)}));
    EXPECT_EQ(anchors["XYZ"], (std::vector<Date>{Date(2024, 2, 29), Date(2024, 2, 1)}));
    EXPECT_EQ(calendar.queried_dates.back(), Date(2024, 2, 1));
}

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
