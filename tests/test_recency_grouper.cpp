#include <gtest/gtest.h>

#include "parley/services/RecencyGrouper.hpp"
#include "TestSupport.hpp"

using namespace parley;
using namespace std::chrono_literals;

namespace {

models::ConversationSummary updated_at(const std::string& id, models::Timestamp when) {
    models::ConversationSummary summary;
    summary.id = id;
    summary.title = id;
    summary.created_at = when;
    summary.updated_at = when;
    return summary;
}

std::vector<std::string> ids_of(const std::vector<models::ConversationSummary>& bucket) {
    std::vector<std::string> ids;
    for (const auto& summary : bucket) {
        ids.push_back(summary.id);
    }
    return ids;
}

} // namespace

TEST(RecencyGrouperTest, BucketsByCalendarDay) {
    const auto now = fakes::local_noon(2026, 6, 17);
    std::vector<models::ConversationSummary> listing = {
        updated_at("now", now),
        updated_at("two-hours", now - 2h),
        updated_at("thirty-hours", now - 30h),
        updated_at("ten-days", now - 240h)
    };

    auto groups = services::group_by_recency(listing, now);
    EXPECT_EQ(ids_of(groups.today), (std::vector<std::string>{"now", "two-hours"}));
    EXPECT_EQ(ids_of(groups.yesterday), (std::vector<std::string>{"thirty-hours"}));
    EXPECT_TRUE(groups.last_week.empty());
    EXPECT_EQ(ids_of(groups.older), (std::vector<std::string>{"ten-days"}));
    EXPECT_EQ(groups.total(), listing.size());
}

TEST(RecencyGrouperTest, LastWeekCoversSevenDaysBeforeToday) {
    const auto now = fakes::local_noon(2026, 6, 17);
    const auto today_start = services::start_of_local_day(now);
    const auto week_start = services::start_of_local_day(fakes::local_noon(2026, 6, 10));

    std::vector<models::ConversationSummary> listing = {
        updated_at("midnight", today_start),
        updated_at("just-before-midnight", today_start - 1s),
        updated_at("three-days", now - 72h),
        updated_at("week-boundary", week_start),
        updated_at("before-week", week_start - 1s)
    };

    auto groups = services::group_by_recency(listing, now);
    EXPECT_EQ(ids_of(groups.today), (std::vector<std::string>{"midnight"}));
    EXPECT_EQ(ids_of(groups.yesterday), (std::vector<std::string>{"just-before-midnight"}));
    EXPECT_EQ(ids_of(groups.last_week), (std::vector<std::string>{"three-days", "week-boundary"}));
    EXPECT_EQ(ids_of(groups.older), (std::vector<std::string>{"before-week"}));
}

TEST(RecencyGrouperTest, PreservesListingOrderWithinBuckets) {
    const auto now = fakes::local_noon(2026, 6, 17);
    std::vector<models::ConversationSummary> listing = {
        updated_at("c", now - 1h),
        updated_at("b", now - 2h),
        updated_at("a", now - 3h),
        updated_at("z", now - 400h),
        updated_at("y", now - 500h)
    };

    auto groups = services::group_by_recency(listing, now);
    EXPECT_EQ(ids_of(groups.today), (std::vector<std::string>{"c", "b", "a"}));
    EXPECT_EQ(ids_of(groups.older), (std::vector<std::string>{"z", "y"}));
}

TEST(RecencyGrouperTest, EmptyListingGivesEmptyBuckets) {
    auto groups = services::group_by_recency({}, fakes::local_noon(2026, 6, 17));
    EXPECT_EQ(groups.total(), 0u);

    auto json = groups.toJson();
    EXPECT_TRUE(json["today"].empty());
    EXPECT_TRUE(json["yesterday"].empty());
    EXPECT_TRUE(json["lastWeek"].empty());
    EXPECT_TRUE(json["older"].empty());
}

TEST(RecencyGrouperTest, StartOfLocalDayIsMidnight) {
    const auto noon = fakes::local_noon(2026, 6, 17);
    const auto midnight = services::start_of_local_day(noon);
    EXPECT_EQ(noon - midnight, std::chrono::duration_cast<std::chrono::system_clock::duration>(12h));
    EXPECT_EQ(services::start_of_local_day(midnight), midnight);
}

TEST(RecencyGrouperTest, UtcDayStartFallback) {
    const auto noon_utc = std::chrono::system_clock::from_time_t(1781697600);
    const auto midnight_utc = std::chrono::system_clock::from_time_t(1781697600 - 12 * 3600);

    EXPECT_EQ(services::start_of_utc_day(noon_utc), midnight_utc);
    EXPECT_EQ(services::start_of_utc_day(noon_utc, 1), midnight_utc - 24h);
    EXPECT_EQ(services::start_of_utc_day(noon_utc, 7), midnight_utc - 7 * 24h);
    EXPECT_EQ(services::start_of_utc_day(midnight_utc), midnight_utc);

    // Before the epoch the boundary still rounds down, not toward zero.
    EXPECT_EQ(services::start_of_utc_day(std::chrono::system_clock::from_time_t(-1)),
              std::chrono::system_clock::from_time_t(-86400));
}
