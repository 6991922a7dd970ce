/**
 * @file pose_safety_monitor.cpp
 * @brief Implementation of live pose boundary/ceiling checks
 */

#include "training_engine/pose_safety_monitor.hpp"
#include "training_engine/errors.hpp"
#include "training_engine/geometry.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>

namespace training_engine {

std::string displayName(const std::string& landmark_name) {
    std::string out = landmark_name;
    for (auto& ch : out) {
        if (ch == '_') ch = ' ';
    }
    if (!out.empty()) {
        out[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(out[0])));
    }
    return out;
}

namespace {

// One incident per type and snapshot; the first landmark found is reported
void addIncident(SafetyEvaluation& eval, SafetyIncident incident) {
    bool seen = std::any_of(eval.incidents.begin(), eval.incidents.end(),
        [&](const SafetyIncident& i) { return i.type == incident.type; });
    if (!seen) {
        eval.incidents.push_back(std::move(incident));
    }
}

} // anonymous namespace

PoseSafetyMonitor::PoseSafetyMonitor(const Config& config)
    : cfg_(config) {
    if (!(cfg_.pose_speed_warning_mps > 0.0)) {
        throw ConfigError("pose_speed_warning_mps must be positive");
    }
    if (!(cfg_.pose_speed_critical_mps >= cfg_.pose_speed_warning_mps)) {
        throw ConfigError("pose_speed_critical_mps must be >= pose_speed_warning_mps");
    }
    if (cfg_.pose_max_sample_gap_ms <= 0) {
        throw ConfigError("pose_max_sample_gap_ms must be positive");
    }
}

SafetyEvaluation PoseSafetyMonitor::evaluate(
    SessionId session_id,
    const PoseSnapshot& pose,
    const RoomConstraints& room,
    const PoseSnapshot* previous
) const {
    SafetyEvaluation eval;
    const UsableArea area{room.width_m, room.height_m};

    // Speed needs a recent, strictly older frame
    const TimestampMs dt_ms = previous ? pose.timestamp_ms - previous->timestamp_ms : 0;
    const bool check_speed = previous && dt_ms > 0 && dt_ms <= cfg_.pose_max_sample_gap_ms;

    for (const auto& lm : pose.landmarks) {
        if (lm.visibility <= cfg_.landmark_visibility_threshold) {
            continue;
        }

        // Walls
        double d = distanceToBoundary(Eigen::Vector2d(lm.position.x(), lm.position.y()), area);
        if (d < cfg_.pose_warning_margin_m) {
            eval.warnings.push_back(displayName(lm.name) + " too close to wall - move toward center");

            if (d < cfg_.pose_critical_margin_m) {
                bool outside = d < 0.0;
                addIncident(eval, makeCritical(
                    session_id, pose, lm,
                    outside ? IncidentType::BOUNDARY_VIOLATION : IncidentType::COLLISION_RISK,
                    outside ? displayName(lm.name) + " left the safe play area"
                            : displayName(lm.name) + " about to hit the wall"
                ));
            }
        }

        // Ceiling
        bool is_head = lm.name == "nose" || lm.name == "head";
        if (is_head && room.ceiling_height_m) {
            double clearance = *room.ceiling_height_m - lm.position.z();
            if (clearance < cfg_.head_clearance_m) {
                eval.warnings.push_back("Head too close to ceiling - lower your reach");

                if (clearance < cfg_.pose_critical_margin_m) {
                    addIncident(eval, makeCritical(
                        session_id, pose, lm, IncidentType::COLLISION_RISK,
                        "Head about to hit the ceiling"
                    ));
                }
            }
        }

        // Speed since the previous frame
        if (check_speed) {
            const Landmark* before = previous->find(lm.name);
            if (before && before->visibility > cfg_.landmark_visibility_threshold) {
                double speed = (lm.position - before->position).norm() / (dt_ms / 1000.0);
                if (speed > cfg_.pose_speed_warning_mps) {
                    eval.warnings.push_back(displayName(lm.name) + " moving too fast - slow down");

                    if (speed > cfg_.pose_speed_critical_mps) {
                        std::ostringstream ss;
                        ss.precision(1);
                        ss << std::fixed << displayName(lm.name) << " moving at " << speed
                           << " m/s - uncontrolled movement";
                        addIncident(eval, makeCritical(
                            session_id, pose, lm, IncidentType::POSE_UNSAFE, ss.str()
                        ));
                    }
                }
            }
        }
    }

    eval.safe = eval.warnings.empty();
    eval.pause_requested = !eval.incidents.empty();

    // Advisory only, does not make the pose unsafe
    if (room.safety_score < cfg_.caution_safety_score) {
        std::ostringstream ss;
        ss << "Room safety score " << static_cast<int>(room.safety_score)
           << " is below " << static_cast<int>(cfg_.caution_safety_score)
           << " - train with caution";
        eval.warnings.push_back(ss.str());
    }

    return eval;
}

SafetyIncident PoseSafetyMonitor::makeCritical(
    SessionId session_id,
    const PoseSnapshot& pose,
    const Landmark& landmark,
    IncidentType type,
    const std::string& message
) const {
    SafetyIncident incident;
    incident.session_id = session_id;
    incident.timestamp_ms = pose.timestamp_ms;
    incident.type = type;
    incident.severity = Severity::CRITICAL;
    incident.message = message;
    incident.user_position = landmark.position;
    incident.automatic_response = std::string("pause");
    incident.session_paused = false;
    return incident;
}

} // namespace training_engine
