#include "parley/services/RecencyGrouper.hpp"
#include <ctime>
#include <iostream>

namespace parley {
namespace services {

namespace {
    // Steps whole calendar days so DST transitions do not shift the boundary.
    models::Timestamp local_midnight(models::Timestamp moment, int days_back) {
        std::time_t time = std::chrono::system_clock::to_time_t(moment);
        std::tm local{};
        if (localtime_r(&time, &local) == nullptr) {
            std::cerr << "[RecencyGrouper] localtime_r failed, using UTC day boundaries" << std::endl;
            return start_of_utc_day(moment, days_back);
        }
        local.tm_hour = 0;
        local.tm_min = 0;
        local.tm_sec = 0;
        local.tm_mday -= days_back;
        local.tm_isdst = -1;
        const std::time_t midnight = std::mktime(&local);
        if (midnight == static_cast<std::time_t>(-1)) {
            std::cerr << "[RecencyGrouper] mktime failed, using UTC day boundaries" << std::endl;
            return start_of_utc_day(moment, days_back);
        }
        return std::chrono::system_clock::from_time_t(midnight);
    }
}

models::Timestamp start_of_utc_day(models::Timestamp moment, int days_back) {
    using days = std::chrono::duration<int64_t, std::ratio<86400>>;
    const auto day = std::chrono::floor<days>(moment) - days(days_back);
    return std::chrono::time_point_cast<models::Timestamp::duration>(day);
}

models::Timestamp start_of_local_day(models::Timestamp moment) {
    return local_midnight(moment, 0);
}

models::RecencyGroups group_by_recency(const std::vector<models::ConversationSummary>& summaries,
                                       models::Timestamp now) {
    const auto today_start = local_midnight(now, 0);
    const auto yesterday_start = local_midnight(now, 1);
    const auto last_week_start = local_midnight(now, 7);

    models::RecencyGroups groups;
    for (const auto& summary : summaries) {
        if (summary.updated_at >= today_start) {
            groups.today.push_back(summary);
        } else if (summary.updated_at >= yesterday_start) {
            groups.yesterday.push_back(summary);
        } else if (summary.updated_at >= last_week_start) {
            groups.last_week.push_back(summary);
        } else {
            groups.older.push_back(summary);
        }
    }
    return groups;
}

} // namespace services
} // namespace parley
