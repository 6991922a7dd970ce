/**
 * @file session_log.hpp
 * @brief JSON serialisation of session records for the external store
 */

#pragma once

#include "common.hpp"
#include "data_types.hpp"
#include <nlohmann/json.hpp>
#include <vector>

namespace training_engine {

nlohmann::json toJson(const BounceEvent& event);
nlohmann::json toJson(const RoomConstraints& room);
nlohmann::json toJson(const SafetyIncident& incident);
nlohmann::json toJson(const SessionQuality& quality);
nlohmann::json toJson(const TrainingSession& session);
nlohmann::json toJson(const MarkerSet& markers);
nlohmann::json toJson(const PerformanceMetric& metric);

/**
 * @brief Full session log: session, events and summary
 *
 * {"ts_unix_ms", "session", "drill_id", "events": [...], "summary": {...}}
 */
nlohmann::json buildSessionLog(
    const TrainingSession& session,
    const std::vector<BounceEvent>& events,
    const SessionSummary& summary
);

/**
 * @brief Parse a tagged sync payload
 *
 * {"platform": "web_mediapipe" | "flutter_unity", "syncData": {...},
 *  "context": {...}}
 *
 * @throws ValidationError on unknown platforms or wrongly typed fields
 */
SyncPayload syncPayloadFromJson(const nlohmann::json& j);

/**
 * @throws ValidationError on missing or wrongly typed fields
 */
PlaneObservation planeObservationFromJson(const nlohmann::json& j);

} // namespace training_engine
