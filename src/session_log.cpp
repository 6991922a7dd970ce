/**
 * @file session_log.cpp
 * @brief JSON export of sessions and parsing of client payloads
 */

#include "training_engine/session_log.hpp"
#include "training_engine/errors.hpp"
#include <chrono>

namespace training_engine {

using json = nlohmann::json;

namespace {

json vec(const Eigen::Vector2d& v) {
    return {{"x", v.x()}, {"y", v.y()}};
}

json vec(const Eigen::Vector3d& v) {
    return {{"x", v.x()}, {"y", v.y()}, {"z", v.z()}};
}

template <typename T>
void putIf(json& j, const char* key, const std::optional<T>& value) {
    if (value) {
        j[key] = *value;
    }
}

Eigen::Vector3d readVec3(const json& j) {
    return Eigen::Vector3d(
        j.at("x").get<double>(),
        j.at("y").get<double>(),
        j.value("z", 0.0)
    );
}

template <typename T>
void readIf(const json& j, const char* key, std::optional<T>& out) {
    auto it = j.find(key);
    if (it != j.end() && !it->is_null()) {
        out = it->get<T>();
    }
}

SyncMetrics metricsFromJson(const json& j) {
    SyncMetrics m;
    if (!j.is_object()) {
        throw ValidationError("syncData must be an object");
    }
    readIf(j, "averageFps", m.average_fps);
    readIf(j, "trackingQuality", m.tracking_quality);
    readIf(j, "safetyScore", m.safety_score);
    readIf(j, "scaleFactor", m.scale_factor);
    readIf(j, "obstacleCount", m.obstacle_count);
    readIf(j, "reflectiveSurfaces", m.reflective_surfaces);
    if (j.contains("roomCenter") && !j["roomCenter"].is_null()) {
        m.room_center = readVec3(j["roomCenter"]);
    }
    if (j.contains("lightingConditions") && !j["lightingConditions"].is_null()) {
        m.lighting = parseLightingCondition(j["lightingConditions"].get<std::string>());
    }
    return m;
}

} // anonymous namespace

// ============================================================================
// Export
// ============================================================================

json toJson(const BounceEvent& e) {
    return {
        {"session_id", e.session_id},
        {"timestamp_ms", e.timestamp_ms},
        {"world_position", vec(e.world_position)},
        {"court_position", vec(e.court_position)},
        {"target_index", e.target_index},
        {"target_position", vec(e.target_position)},
        {"error_distance_mm", e.error_distance_mm},
        {"is_hit", e.is_hit},
        {"tolerance_radius_mm", e.tolerance_radius_mm},
        {"vision_confidence", e.vision_confidence},
        {"audio_confidence", e.audio_confidence},
        {"fusion_confidence", e.fusion_confidence},
    };
}

json toJson(const RoomConstraints& room) {
    json excluded = json::array();
    for (const auto& ex : room.excluded_patterns) {
        excluded.push_back({{"pattern", ex.pattern_id}, {"reason", ex.reason}});
    }

    json j = {
        {"sport", room.sport},
        {"width_m", room.width_m},
        {"height_m", room.height_m},
        {"area_m2", room.area_m2},
        {"is_flat", room.is_flat},
        {"aspect_ratio", room.aspect_ratio},
        {"safety_score", room.safety_score},
        {"obstacle_count", room.obstacle_count},
        {"lighting", toString(room.lighting)},
        {"reflective_surfaces", room.reflective_surfaces},
        {"is_room_mode", room.is_room_mode},
        {"adaptations", {
            {"tolerance_multiplier", room.adaptations.tolerance_multiplier},
            {"reduced_target_count", room.adaptations.reduced_target_count},
            {"no_overhead_movements", room.adaptations.no_overhead_movements},
        }},
        {"recommended_patterns", room.recommended_patterns},
        {"excluded_patterns", excluded},
        {"safety_warnings", room.safety_warnings},
    };
    putIf(j, "ceiling_height_m", room.ceiling_height_m);
    return j;
}

json toJson(const SafetyIncident& incident) {
    json j = {
        {"session_id", incident.session_id},
        {"timestamp_ms", incident.timestamp_ms},
        {"type", toString(incident.type)},
        {"severity", toString(incident.severity)},
        {"message", incident.message},
        {"session_paused", incident.session_paused},
    };
    if (incident.user_position) {
        j["user_position"] = vec(*incident.user_position);
    }
    putIf(j, "drill_pattern", incident.drill_pattern);
    putIf(j, "automatic_response", incident.automatic_response);
    return j;
}

json toJson(const SessionQuality& q) {
    json j = json::object();
    putIf(j, "average_fps", q.average_fps);
    putIf(j, "tracking_quality", q.tracking_quality);
    putIf(j, "safety_score", q.safety_score);
    putIf(j, "scale_factor", q.scale_factor);
    putIf(j, "obstacle_count", q.obstacle_count);
    putIf(j, "reflective_surfaces", q.reflective_surfaces);
    if (q.room_center) {
        j["room_center"] = vec(*q.room_center);
    }
    if (q.lighting) {
        j["lighting"] = toString(*q.lighting);
    }
    if (q.last_platform) {
        j["platform"] = toString(*q.last_platform);
    }

    // Platform context is tagged by the platform that reported it
    json contexts = json::array();
    if (q.web) {
        json ctx = {{"platform", toString(SyncPlatform::WEB_MEDIAPIPE)}};
        putIf(ctx, "pose_detection_confidence", q.web->pose_detection_confidence);
        putIf(ctx, "landmark_count", q.web->landmark_count);
        contexts.push_back(ctx);
    }
    if (q.unity) {
        json ctx = {{"platform", toString(SyncPlatform::FLUTTER_UNITY)}};
        putIf(ctx, "plane_area_m2", q.unity->plane_area_m2);
        putIf(ctx, "device_model", q.unity->device_model);
        putIf(ctx, "unity_version", q.unity->unity_version);
        contexts.push_back(ctx);
    }
    j["contexts"] = contexts;
    return j;
}

json toJson(const TrainingSession& s) {
    json incidents = json::array();
    int critical = 0;
    for (const auto& incident : s.safety_log) {
        incidents.push_back(toJson(incident));
        if (incident.severity == Severity::CRITICAL) {
            critical++;
        }
    }

    json session_data = {
        {"quality", toJson(s.quality)},
        {"safety_incidents", incidents},
        {"total_safety_incidents", s.safety_log.size()},
        {"critical_incidents", critical},
    };
    if (!s.safety_log.empty()) {
        session_data["last_incident_severity"] = toString(s.safety_log.back().severity);
    }
    if (s.room) {
        session_data["room_constraints"] = toJson(*s.room);
    }
    if (s.calibration) {
        session_data["calibration"] = {
            {"origin", vec(s.calibration->origin)},
            {"x_axis", vec(s.calibration->x_axis)},
            {"y_axis", vec(s.calibration->y_axis)},
            {"baseline_distance_m", s.calibration->baseline_distance_m},
            {"scale_factor", s.calibration->scale_factor},
            {"room_mode", s.calibration->room_mode},
        };
    }

    json j = {
        {"id", s.id},
        {"user_id", s.user_id},
        {"sport", s.sport},
        {"drill_pattern", s.drill_pattern_id},
        {"difficulty", toString(s.difficulty)},
        {"device_platform", toString(s.device_platform)},
        {"status", toString(s.status)},
        {"created_at_ms", s.created_at_ms},
        {"duration_ms", s.duration_ms},
        {"total_bounces", s.total_bounces},
        {"successful_hits", s.successful_hits},
        {"accuracy", s.accuracy},
        {"average_reaction_time_ms", s.average_reaction_time_ms},
        {"max_streak", s.max_streak},
        {"precision_score", s.scores.precision},
        {"pace_score", s.scores.pace},
        {"streak_score", s.scores.streak},
        {"total_score", s.scores.total},
        {"session_data", session_data},
    };
    putIf(j, "completed_at_ms", s.completed_at_ms);
    putIf(j, "pause_reason", s.pause_reason);
    return j;
}

json toJson(const MarkerSet& markers) {
    json list = json::array();
    for (const auto& m : markers.markers) {
        list.push_back({
            {"index", m.index},
            {"id", m.id},
            {"position_m", vec(m.position_m)},
            {"normalized", vec(m.normalized)},
            {"tolerance_radius_mm", m.tolerance_radius_mm},
        });
    }
    return {
        {"pattern", markers.pattern_id},
        {"width_m", markers.area.width_m},
        {"height_m", markers.area.height_m},
        {"safety_margin_m", markers.safety_margin_m},
        {"reduced_target_count", markers.reduced_target_count},
        {"markers", list},
    };
}

json toJson(const PerformanceMetric& m) {
    return {
        {"session_id", m.session_id},
        {"user_id", m.user_id},
        {"sport", m.sport},
        {"adaptation_score", m.adaptation_score},
        {"space_utilization", m.space_utilization},
        {"movement_efficiency", m.movement_efficiency},
        {"safety_compliance", m.safety_compliance},
        {"drills_modified", m.drills_modified},
        {"room_mode_score", m.room_mode_score},
    };
}

json buildSessionLog(
    const TrainingSession& session,
    const std::vector<BounceEvent>& events,
    const SessionSummary& summary
) {
    json event_list = json::array();
    for (const auto& e : events) {
        event_list.push_back(toJson(e));
    }

    auto now = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();

    return {
        {"ts_unix_ms", now},
        {"session", toJson(session)},
        {"drill_id", session.drill_pattern_id},
        {"events", event_list},
        {"summary", {
            {"attempts", summary.attempts},
            {"hits", summary.hits},
            {"accuracy_pct", summary.accuracy_pct},
            {"avg_error_mm", summary.avg_error_mm},
            {"avg_pace_hz", summary.avg_pace_hz},
            {"current_streak", summary.current_streak},
            {"max_streak", summary.max_streak},
            {"avg_reaction_ms", summary.avg_reaction_ms},
            {"duration_ms", summary.duration_ms},
        }},
    };
}

// ============================================================================
// Import
// ============================================================================

SyncPayload syncPayloadFromJson(const json& j) {
    try {
        if (!j.is_object() || !j.contains("platform")) {
            throw ValidationError("Sync payload needs a 'platform' tag");
        }
        SyncPlatform platform = parseSyncPlatform(j.at("platform").get<std::string>());
        SyncMetrics metrics = metricsFromJson(j.value("syncData", json::object()));
        json ctx = j.value("context", json::object());

        if (platform == SyncPlatform::WEB_MEDIAPIPE) {
            WebMediapipeSync web;
            web.metrics = metrics;
            readIf(ctx, "poseDetectionConfidence", web.context.pose_detection_confidence);
            readIf(ctx, "landmarkCount", web.context.landmark_count);
            return web;
        }

        FlutterUnitySync unity;
        unity.metrics = metrics;
        readIf(ctx, "planeArea", unity.context.plane_area_m2);
        readIf(ctx, "deviceModel", unity.context.device_model);
        readIf(ctx, "unityVersion", unity.context.unity_version);
        return unity;
    } catch (const json::exception& e) {
        throw ValidationError(std::string("Malformed sync payload: ") + e.what());
    }
}

PlaneObservation planeObservationFromJson(const json& j) {
    try {
        PlaneObservation plane;
        plane.width_m = j.at("width").get<double>();
        plane.height_m = j.at("height").get<double>();
        plane.is_flat = j.value("isFlat", true);
        plane.obstacle_count = j.value("obstacleCount", 0);
        plane.reflective_surfaces = j.value("reflectiveSurfaces", false);
        if (j.contains("lighting")) {
            plane.lighting = parseLightingCondition(j["lighting"].get<std::string>());
        }
        readIf(j, "ceilingHeight", plane.ceiling_height_m);
        return plane;
    } catch (const json::exception& e) {
        throw ValidationError(std::string("Malformed room scan: ") + e.what());
    }
}

} // namespace training_engine
