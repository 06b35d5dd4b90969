#ifndef PARLEY_SERVICES_RECENCY_GROUPER_HPP
#define PARLEY_SERVICES_RECENCY_GROUPER_HPP

#include <vector>
#include <chrono>
#include <cstdint>

#include "parley/models/Conversation.hpp"

namespace parley {
namespace services {

// Midnight (local time) of the calendar day containing `moment`.
models::Timestamp start_of_local_day(models::Timestamp moment);

// Midnight UTC, `days_back` days before the day containing `moment`. Used
// when the local time conversion fails.
models::Timestamp start_of_utc_day(models::Timestamp moment, int days_back = 0);

/**
 * @brief Bucket a listing into today / yesterday / last 7 days / older
 *
 * Boundaries are local calendar days relative to `now`. Input order is kept
 * inside every bucket. Must be recomputed per listing since `now` moves.
 */
models::RecencyGroups group_by_recency(const std::vector<models::ConversationSummary>& summaries,
                                       models::Timestamp now);

} // namespace services
} // namespace parley

#endif // PARLEY_SERVICES_RECENCY_GROUPER_HPP
