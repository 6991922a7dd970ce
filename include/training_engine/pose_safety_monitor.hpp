/**
 * @file pose_safety_monitor.hpp
 * @brief Live pose checks against the room boundary and ceiling
 */

#pragma once

#include "common.hpp"
#include "config.hpp"
#include "data_types.hpp"

namespace training_engine {

/**
 * @brief Read-only pose checks over RoomConstraints
 *
 * Landmark x/y are floor coordinates in the room rectangle
 * [0, width] x [0, height]; z is height above the floor.
 */
class PoseSafetyMonitor {
public:
    explicit PoseSafetyMonitor(const Config& config);

    /**
     * @brief Evaluate one pose snapshot
     *
     * Visible landmarks closer than the warning margin to a wall add a
     * warning; closer than the critical margin (or outside the room) they
     * become a critical incident with automatic_response "pause". The head
     * is checked against the ceiling the same way.
     *
     * With a previous snapshot no older than Config::pose_max_sample_gap_ms,
     * landmarks visible in both frames are also checked for speed. Warnings
     * are per landmark; incidents are collapsed to one per type.
     */
    SafetyEvaluation evaluate(
        SessionId session_id,
        const PoseSnapshot& pose,
        const RoomConstraints& room,
        const PoseSnapshot* previous = nullptr
    ) const;

private:
    SafetyIncident makeCritical(
        SessionId session_id,
        const PoseSnapshot& pose,
        const Landmark& landmark,
        IncidentType type,
        const std::string& message
    ) const;

    Config cfg_;
};

/**
 * @brief Human-readable landmark name ("left_wrist" -> "Left wrist")
 */
std::string displayName(const std::string& landmark_name);

} // namespace training_engine
