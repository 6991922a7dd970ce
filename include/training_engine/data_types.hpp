/**
 * @file data_types.hpp
 * @brief Core data structures: sessions, bounce events, room snapshots, incidents
 */

#pragma once

#include "common.hpp"
#include "court_calibration.hpp"
#include <Eigen/Dense>
#include <opencv2/core.hpp>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace training_engine {

// ============================================================================
// Bounce input / output
// ============================================================================

/**
 * @brief One detected impact as reported by a client
 *
 * Court and target positions are in court metres. Confidences in [0, 100].
 */
struct ImpactData {
    TimestampMs timestamp_ms = 0;
    Eigen::Vector3d world_position = Eigen::Vector3d::Zero();
    std::optional<Eigen::Vector2d> court_position;  ///< Derived from calibration if absent
    TargetIndex target_index = -1;
    std::optional<Eigen::Vector2d> target_position;
    std::optional<double> vision_confidence;
    std::optional<double> audio_confidence;
};

/**
 * @brief Validated, append-only record of one impact
 *
 * Invariant: is_hit == (error_distance_mm <= tolerance_radius_mm)
 */
struct BounceEvent {
    SessionId session_id = 0;
    TimestampMs timestamp_ms = 0;
    Eigen::Vector3d world_position = Eigen::Vector3d::Zero();
    Eigen::Vector2d court_position = Eigen::Vector2d::Zero();
    TargetIndex target_index = -1;
    Eigen::Vector2d target_position = Eigen::Vector2d::Zero();
    double error_distance_mm = 0.0;
    bool is_hit = false;
    double tolerance_radius_mm = 0.0;
    double vision_confidence = 0.0;
    double audio_confidence = 0.0;
    double fusion_confidence = 0.0;
};

// ============================================================================
// Room analysis
// ============================================================================

/**
 * @brief Usable plane as detected by the client (AR plane or camera scan)
 */
struct PlaneObservation {
    double width_m = 0.0;
    double height_m = 0.0;
    bool is_flat = true;
    int obstacle_count = 0;
    LightingCondition lighting = LightingCondition::GOOD;
    bool reflective_surfaces = false;
    std::optional<double> ceiling_height_m;
};

struct PatternExclusion {
    std::string pattern_id;
    std::string reason;
};

/**
 * @brief Drill adjustments for cramped or low rooms
 */
struct RoomAdaptations {
    double tolerance_multiplier = 1.0;    ///< Applied to the sport's tolerance radius
    bool reduced_target_count = false;    ///< Markers thinned to every other template point
    bool no_overhead_movements = false;   ///< Known ceiling below the sport's overhead limit
};

/**
 * @brief Per-room snapshot derived from a PlaneObservation
 *
 * Invariant: area_m2 == width_m * height_m
 */
struct RoomConstraints {
    std::string sport;
    double width_m = 0.0;
    double height_m = 0.0;
    double area_m2 = 0.0;
    std::optional<double> ceiling_height_m;
    bool is_flat = true;
    double aspect_ratio = 1.0;
    double safety_score = 100.0;
    int obstacle_count = 0;
    LightingCondition lighting = LightingCondition::GOOD;
    bool reflective_surfaces = false;
    bool is_room_mode = false;
    RoomAdaptations adaptations;

    std::vector<std::string> recommended_patterns;   ///< Ranked, best first
    std::vector<PatternExclusion> excluded_patterns;
    std::vector<std::string> safety_warnings;

    bool recommends(const std::string& pattern_id) const;
};

/**
 * @brief Usable rectangle in metres, origin at one corner
 */
struct UsableArea {
    double width_m = 0.0;
    double height_m = 0.0;

    double area() const { return width_m * height_m; }
};

// ============================================================================
// Markers
// ============================================================================

struct Marker {
    int index = 0;
    std::string id;
    Eigen::Vector2d position_m = Eigen::Vector2d::Zero();   ///< In usable-area metres
    Eigen::Vector2d normalized = Eigen::Vector2d::Zero();   ///< position / (width, height)
    double tolerance_radius_mm = 0.0;
};

/**
 * @brief Ordered target markers for one pattern in one usable area
 */
struct MarkerSet {
    std::string pattern_id;
    UsableArea area;
    double safety_margin_m = 0.0;
    bool reduced_target_count = false;
    std::vector<Marker> markers;

    /**
     * @brief Map normalized positions onto a rendering canvas (view concern)
     */
    std::vector<cv::Point2f> toCanvas(const cv::Size& canvas) const;

    /**
     * @brief Axis-aligned footprint of the markers, in square metres
     */
    double footprintArea() const;
};

// ============================================================================
// Pose safety
// ============================================================================

struct Landmark {
    std::string name;                  ///< e.g. "nose", "left_wrist"
    Eigen::Vector3d position = Eigen::Vector3d::Zero();  ///< x, y on the floor; z height
    double visibility = 0.0;           ///< [0, 1]
};

struct PoseSnapshot {
    TimestampMs timestamp_ms = 0;
    std::vector<Landmark> landmarks;

    const Landmark* find(const std::string& name) const;
};

struct SafetyIncident {
    SessionId session_id = 0;
    TimestampMs timestamp_ms = 0;
    IncidentType type = IncidentType::POSE_UNSAFE;
    Severity severity = Severity::INFO;
    std::string message;
    std::optional<Eigen::Vector3d> user_position;
    std::optional<std::string> drill_pattern;
    std::optional<std::string> automatic_response;   ///< "pause" for critical escalations
    bool session_paused = false;                      ///< Pause has been applied for this incident
};

struct SafetyEvaluation {
    bool safe = true;
    std::vector<std::string> warnings;               ///< Ordered as checks ran
    std::vector<SafetyIncident> incidents;           ///< Critical escalations
    bool pause_requested = false;
};

// ============================================================================
// Cross-platform sync
// ============================================================================

/**
 * @brief Quality/context metrics either client may report (all optional)
 */
struct SyncMetrics {
    std::optional<double> average_fps;
    std::optional<double> tracking_quality;        ///< [0, 100]
    std::optional<double> safety_score;            ///< [0, 100]
    std::optional<Eigen::Vector3d> room_center;
    std::optional<double> scale_factor;
    std::optional<int> obstacle_count;
    std::optional<LightingCondition> lighting;
    std::optional<bool> reflective_surfaces;
};

/// Browser client running camera pose tracking
struct WebMediapipeContext {
    std::optional<double> pose_detection_confidence;   ///< Model threshold in [0, 1]
    std::optional<int> landmark_count;
};

/// Native client running device AR
struct FlutterUnityContext {
    std::optional<double> plane_area_m2;
    std::optional<std::string> device_model;
    std::optional<std::string> unity_version;
};

struct WebMediapipeSync {
    SyncMetrics metrics;
    WebMediapipeContext context;
};

struct FlutterUnitySync {
    SyncMetrics metrics;
    FlutterUnityContext context;
};

using SyncPayload = std::variant<WebMediapipeSync, FlutterUnitySync>;

SyncPlatform platformOf(const SyncPayload& payload);

/**
 * @brief Canonical merged quality record
 */
struct SessionQuality {
    std::optional<double> average_fps;
    std::optional<double> tracking_quality;
    std::optional<double> safety_score;
    std::optional<Eigen::Vector3d> room_center;
    std::optional<double> scale_factor;
    std::optional<int> obstacle_count;
    std::optional<LightingCondition> lighting;
    std::optional<bool> reflective_surfaces;
    std::optional<SyncPlatform> last_platform;

    std::optional<WebMediapipeContext> web;
    std::optional<FlutterUnityContext> unity;
};

// ============================================================================
// Sessions
// ============================================================================

struct ScoreBreakdown {
    double precision = 0.0;
    double pace = 0.0;
    double streak = 0.0;
    double total = 0.0;
};

struct SessionSummary {
    int attempts = 0;
    int hits = 0;
    double accuracy_pct = 0.0;
    double avg_error_mm = 0.0;
    double avg_pace_hz = 0.0;
    int current_streak = 0;
    int max_streak = 0;
    double avg_reaction_ms = 0.0;
    TimestampMs duration_ms = 0;
};

/**
 * @brief Canonical training session record
 *
 * Scores are only ever written by ScoringEngine::applyTo(); status only by
 * SessionStateMachine.
 */
struct TrainingSession {
    SessionId id = 0;
    UserId user_id = 0;
    std::string sport;
    std::string drill_pattern_id;
    Difficulty difficulty = Difficulty::MEDIUM;
    DevicePlatform device_platform = DevicePlatform::WEB;
    SessionStatus status = SessionStatus::ACTIVE;

    TimestampMs created_at_ms = 0;
    std::optional<TimestampMs> completed_at_ms;
    std::optional<std::string> pause_reason;

    // Aggregated metrics
    TimestampMs duration_ms = 0;
    int total_bounces = 0;
    int successful_hits = 0;
    double accuracy = 0.0;
    double average_reaction_time_ms = 0.0;
    int max_streak = 0;
    ScoreBreakdown scores;

    // Platform-specific session data
    std::optional<RoomConstraints> room;
    std::optional<CourtCalibration> calibration;
    std::vector<SafetyIncident> safety_log;
    SessionQuality quality;
};

// ============================================================================
// Rollups
// ============================================================================

struct PerformanceMetric {
    SessionId session_id = 0;
    UserId user_id = 0;
    std::string sport;
    double adaptation_score = 0.0;     ///< Share of patterns usable in this room
    double space_utilization = 0.0;    ///< Marker footprint / usable area
    double movement_efficiency = 0.0;  ///< Accuracy
    double safety_compliance = 100.0;
    int drills_modified = 0;           ///< Patterns excluded by room constraints
    double room_mode_score = 0.0;
};

struct SyncStatus {
    TrainingSession session;
    size_t bounce_events = 0;
    size_t room_snapshots = 0;
    size_t safety_incidents = 0;
    std::optional<SyncPlatform> last_platform;
};

} // namespace training_engine
