/**
 * @file room_analytics.cpp
 * @brief Implementation of the room-mode session rollup
 */

#include "training_engine/room_analytics.hpp"
#include <algorithm>
#include <cstddef>

namespace training_engine {

namespace {

constexpr size_t kRecentWindow = 5;

// Higher is better
Trend compareScores(double recent, double older) {
    if (recent > older * 1.1) return Trend::IMPROVING;
    if (recent < older * 0.9) return Trend::DECLINING;
    return Trend::STABLE;
}

// Lower is better
Trend compareIncidentRates(double recent, double older) {
    if (recent < older * 0.8) return Trend::IMPROVING;
    if (recent > older * 1.2) return Trend::DECLINING;
    return Trend::STABLE;
}

double meanScore(std::vector<TrainingSession>::const_iterator first,
                 std::vector<TrainingSession>::const_iterator last) {
    double sum = 0.0;
    size_t n = 0;
    for (auto it = first; it != last; ++it, ++n) {
        sum += it->scores.total;
    }
    return n > 0 ? sum / n : 0.0;
}

double meanIncidents(std::vector<TrainingSession>::const_iterator first,
                     std::vector<TrainingSession>::const_iterator last) {
    double sum = 0.0;
    size_t n = 0;
    for (auto it = first; it != last; ++it, ++n) {
        sum += static_cast<double>(it->safety_log.size());
    }
    return n > 0 ? sum / n : 0.0;
}

} // anonymous namespace

std::string toString(Trend trend) {
    switch (trend) {
        case Trend::INSUFFICIENT_DATA: return "insufficient_data";
        case Trend::IMPROVING:         return "improving";
        case Trend::STABLE:            return "stable";
        case Trend::DECLINING:         return "declining";
    }
    return "unknown";
}

RoomAnalytics summarizeRoomSessions(UserId user_id, std::vector<TrainingSession> sessions) {
    sessions.erase(
        std::remove_if(sessions.begin(), sessions.end(), [user_id](const TrainingSession& s) {
            return s.user_id != user_id || s.status != SessionStatus::COMPLETED ||
                   !s.room || !s.room->is_room_mode;
        }),
        sessions.end());

    // Newest first; ids break ties between sessions created in the same millisecond
    std::sort(sessions.begin(), sessions.end(), [](const TrainingSession& a, const TrainingSession& b) {
        if (a.created_at_ms != b.created_at_ms) return a.created_at_ms > b.created_at_ms;
        return a.id > b.id;
    });

    RoomAnalytics out;
    out.user_id = user_id;
    out.room_sessions = static_cast<int>(sessions.size());
    if (sessions.empty()) {
        return out;
    }

    int sessions_with_critical = 0;
    double score_sum = 0.0;
    double accuracy_sum = 0.0;

    for (const auto& s : sessions) {
        out.pattern_distribution[s.drill_pattern_id]++;
        out.total_incidents += static_cast<int>(s.safety_log.size());

        int critical = 0;
        for (const auto& incident : s.safety_log) {
            if (incident.severity == Severity::CRITICAL) critical++;
        }
        out.critical_incidents += critical;
        if (critical > 0) sessions_with_critical++;

        score_sum += s.scores.total;
        accuracy_sum += s.accuracy;
    }

    const double n = static_cast<double>(sessions.size());
    out.average_incidents_per_session = out.total_incidents / n;
    out.safety_compliance_rate = 100.0 * (n - sessions_with_critical) / n;
    out.average_score = score_sum / n;
    out.average_accuracy = accuracy_sum / n;

    if (sessions.size() >= 2) {
        const size_t recent = std::min(kRecentWindow, sessions.size() / 2);
        auto split = sessions.cbegin() + static_cast<std::ptrdiff_t>(recent);

        out.score_trend = compareScores(meanScore(sessions.cbegin(), split),
                                        meanScore(split, sessions.cend()));
        out.safety_trend = compareIncidentRates(meanIncidents(sessions.cbegin(), split),
                                                meanIncidents(split, sessions.cend()));
    }

    return out;
}

} // namespace training_engine
