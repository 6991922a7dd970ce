/**
 * @file room_analytics.hpp
 * @brief Per-user rollup of completed room-mode sessions
 */

#pragma once

#include "common.hpp"
#include "data_types.hpp"
#include <map>
#include <string>
#include <vector>

namespace training_engine {

/**
 * @brief Direction of a metric between recent and older sessions
 */
enum class Trend {
    INSUFFICIENT_DATA,   ///< Fewer than two sessions
    IMPROVING,
    STABLE,
    DECLINING
};

std::string toString(Trend trend);

struct RoomAnalytics {
    UserId user_id = 0;
    int room_sessions = 0;                            ///< Completed sessions played in room mode
    std::map<std::string, int> pattern_distribution;  ///< Sessions per drill pattern

    int total_incidents = 0;
    int critical_incidents = 0;
    double average_incidents_per_session = 0.0;
    double safety_compliance_rate = 100.0;            ///< Share of sessions without a critical incident

    double average_score = 0.0;                       ///< Mean total score
    double average_accuracy = 0.0;

    Trend score_trend = Trend::INSUFFICIENT_DATA;
    Trend safety_trend = Trend::INSUFFICIENT_DATA;
};

/**
 * @brief Summarize a user's sessions
 *
 * Only completed sessions whose room was analysed in room mode count.
 * Trends split the counted sessions, newest first, into a recent window of
 * min(5, n / 2) sessions and the older rest.
 *
 * Score: recent mean above 110% of older is improving, below 90% declining.
 * Safety: recent incidents per session below 80% of older is improving,
 * above 120% declining.
 */
RoomAnalytics summarizeRoomSessions(UserId user_id, std::vector<TrainingSession> sessions);

} // namespace training_engine
