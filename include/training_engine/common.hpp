/**
 * @file common.hpp
 * @brief Common types, enums, and utilities for the training session engine
 */

#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include <memory>
#include <optional>

namespace training_engine {

// ============================================================================
// Enumerations
// ============================================================================

/**
 * @brief Drill difficulty (drives the tolerance radius)
 */
enum class Difficulty {
    EASY,
    MEDIUM,
    HARD,
    EXPERT
};

/**
 * @brief Device the session was started on
 */
enum class DevicePlatform {
    ANDROID,
    IOS,
    WEB
};

/**
 * @brief Client stack reporting sync metrics
 */
enum class SyncPlatform {
    WEB_MEDIAPIPE,   ///< Browser client, camera pose tracking
    FLUTTER_UNITY    ///< Native client, device AR
};

/**
 * @brief Session lifecycle state
 */
enum class SessionStatus {
    ACTIVE,
    PAUSED,
    COMPLETED,  ///< Terminal
    FAILED      ///< Terminal
};

/**
 * @brief Requests that move a session between states
 */
enum class SessionTrigger {
    PAUSE,           ///< Explicit client pause
    RESUME,          ///< Explicit client resume
    END,             ///< Client finished the drill
    SAFETY_PAUSE,    ///< Automatic pause from a critical incident
    UPSTREAM_ERROR   ///< Unrecoverable upstream failure
};

enum class IncidentType {
    BOUNDARY_VIOLATION,
    COLLISION_RISK,
    POSE_UNSAFE,
    TRACKING_LOST
};

enum class Severity {
    INFO,
    WARNING,
    CRITICAL
};

enum class LightingCondition {
    GOOD,
    DIM,
    POOR
};

// ============================================================================
// String conversions
// ============================================================================

std::string toString(Difficulty difficulty);
std::string toString(DevicePlatform platform);
std::string toString(SyncPlatform platform);
std::string toString(SessionStatus status);
std::string toString(SessionTrigger trigger);
std::string toString(IncidentType type);
std::string toString(Severity severity);
std::string toString(LightingCondition lighting);

/// Parsers throw ValidationError on unknown names
Difficulty parseDifficulty(const std::string& name);
DevicePlatform parseDevicePlatform(const std::string& name);
SyncPlatform parseSyncPlatform(const std::string& name);
SessionStatus parseSessionStatus(const std::string& name);
IncidentType parseIncidentType(const std::string& name);
Severity parseSeverity(const std::string& name);
LightingCondition parseLightingCondition(const std::string& name);

inline bool isTerminal(SessionStatus status) {
    return status == SessionStatus::COMPLETED || status == SessionStatus::FAILED;
}

// ============================================================================
// Type aliases for clarity
// ============================================================================

using SessionId = int64_t;
using UserId = int64_t;
using TimestampMs = int64_t;
using TargetIndex = int32_t;

} // namespace training_engine
