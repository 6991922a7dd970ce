/**
 * @file common.cpp
 * @brief Enum <-> string conversions
 */

#include "training_engine/common.hpp"
#include "training_engine/errors.hpp"

namespace training_engine {

namespace {

template <typename Enum, size_t N>
Enum parseEnum(const std::string& name,
               const std::pair<const char*, Enum> (&table)[N],
               const char* kind) {
    for (const auto& entry : table) {
        if (name == entry.first) {
            return entry.second;
        }
    }
    throw ValidationError(std::string("unknown ") + kind + ": '" + name + "'");
}

const std::pair<const char*, Difficulty> kDifficulties[] = {
    {"easy", Difficulty::EASY},
    {"medium", Difficulty::MEDIUM},
    {"hard", Difficulty::HARD},
    {"expert", Difficulty::EXPERT},
};

const std::pair<const char*, DevicePlatform> kDevicePlatforms[] = {
    {"android", DevicePlatform::ANDROID},
    {"ios", DevicePlatform::IOS},
    {"web", DevicePlatform::WEB},
};

const std::pair<const char*, SyncPlatform> kSyncPlatforms[] = {
    {"web_mediapipe", SyncPlatform::WEB_MEDIAPIPE},
    {"flutter_unity", SyncPlatform::FLUTTER_UNITY},
};

const std::pair<const char*, SessionStatus> kStatuses[] = {
    {"active", SessionStatus::ACTIVE},
    {"paused", SessionStatus::PAUSED},
    {"completed", SessionStatus::COMPLETED},
    {"failed", SessionStatus::FAILED},
};

const std::pair<const char*, IncidentType> kIncidentTypes[] = {
    {"boundary_violation", IncidentType::BOUNDARY_VIOLATION},
    {"collision_risk", IncidentType::COLLISION_RISK},
    {"pose_unsafe", IncidentType::POSE_UNSAFE},
    {"tracking_lost", IncidentType::TRACKING_LOST},
};

const std::pair<const char*, Severity> kSeverities[] = {
    {"info", Severity::INFO},
    {"warning", Severity::WARNING},
    {"critical", Severity::CRITICAL},
};

const std::pair<const char*, LightingCondition> kLighting[] = {
    {"good", LightingCondition::GOOD},
    {"dim", LightingCondition::DIM},
    {"poor", LightingCondition::POOR},
};

} // anonymous namespace

// ============================================================================
// toString
// ============================================================================

std::string toString(Difficulty difficulty) {
    switch (difficulty) {
        case Difficulty::EASY:   return "easy";
        case Difficulty::MEDIUM: return "medium";
        case Difficulty::HARD:   return "hard";
        case Difficulty::EXPERT: return "expert";
    }
    return "unknown";
}

std::string toString(DevicePlatform platform) {
    switch (platform) {
        case DevicePlatform::ANDROID: return "android";
        case DevicePlatform::IOS:     return "ios";
        case DevicePlatform::WEB:     return "web";
    }
    return "unknown";
}

std::string toString(SyncPlatform platform) {
    switch (platform) {
        case SyncPlatform::WEB_MEDIAPIPE: return "web_mediapipe";
        case SyncPlatform::FLUTTER_UNITY: return "flutter_unity";
    }
    return "unknown";
}

std::string toString(SessionStatus status) {
    switch (status) {
        case SessionStatus::ACTIVE:    return "active";
        case SessionStatus::PAUSED:    return "paused";
        case SessionStatus::COMPLETED: return "completed";
        case SessionStatus::FAILED:    return "failed";
    }
    return "unknown";
}

std::string toString(SessionTrigger trigger) {
    switch (trigger) {
        case SessionTrigger::PAUSE:          return "pause";
        case SessionTrigger::RESUME:         return "resume";
        case SessionTrigger::END:            return "end";
        case SessionTrigger::SAFETY_PAUSE:   return "safety_pause";
        case SessionTrigger::UPSTREAM_ERROR: return "upstream_error";
    }
    return "unknown";
}

std::string toString(IncidentType type) {
    switch (type) {
        case IncidentType::BOUNDARY_VIOLATION: return "boundary_violation";
        case IncidentType::COLLISION_RISK:     return "collision_risk";
        case IncidentType::POSE_UNSAFE:        return "pose_unsafe";
        case IncidentType::TRACKING_LOST:      return "tracking_lost";
    }
    return "unknown";
}

std::string toString(Severity severity) {
    switch (severity) {
        case Severity::INFO:     return "info";
        case Severity::WARNING:  return "warning";
        case Severity::CRITICAL: return "critical";
    }
    return "unknown";
}

std::string toString(LightingCondition lighting) {
    switch (lighting) {
        case LightingCondition::GOOD: return "good";
        case LightingCondition::DIM:  return "dim";
        case LightingCondition::POOR: return "poor";
    }
    return "unknown";
}

// ============================================================================
// Parsers
// ============================================================================

Difficulty parseDifficulty(const std::string& name) {
    return parseEnum(name, kDifficulties, "difficulty");
}

DevicePlatform parseDevicePlatform(const std::string& name) {
    return parseEnum(name, kDevicePlatforms, "device platform");
}

SyncPlatform parseSyncPlatform(const std::string& name) {
    return parseEnum(name, kSyncPlatforms, "sync platform");
}

SessionStatus parseSessionStatus(const std::string& name) {
    return parseEnum(name, kStatuses, "session status");
}

IncidentType parseIncidentType(const std::string& name) {
    return parseEnum(name, kIncidentTypes, "incident type");
}

Severity parseSeverity(const std::string& name) {
    return parseEnum(name, kSeverities, "severity");
}

LightingCondition parseLightingCondition(const std::string& name) {
    return parseEnum(name, kLighting, "lighting condition");
}

} // namespace training_engine
