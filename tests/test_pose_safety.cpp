/**
 * @file test_pose_safety.cpp
 * @brief Live pose checks against walls and ceiling
 */

#include <training_engine/errors.hpp>
#include <training_engine/pose_safety_monitor.hpp>
#include "test_harness.hpp"

using namespace training_engine;

namespace {

Config quietConfig() {
    Config cfg;
    cfg.verbose = false;
    return cfg;
}

RoomConstraints room3x2(std::optional<double> ceiling = 2.6, double safety = 100.0) {
    RoomConstraints room;
    room.sport = "basketball";
    room.width_m = 3.0;
    room.height_m = 2.0;
    room.area_m2 = 6.0;
    room.ceiling_height_m = ceiling;
    room.safety_score = safety;
    return room;
}

PoseSnapshot poseWith(std::vector<Landmark> landmarks, TimestampMs ts = 5000) {
    PoseSnapshot pose;
    pose.timestamp_ms = ts;
    pose.landmarks = std::move(landmarks);
    return pose;
}

} // anonymous namespace

void testCentredPoseIsSafe() {
    PoseSafetyMonitor monitor(quietConfig());
    PoseSnapshot pose = poseWith({
        {"nose", Eigen::Vector3d(1.5, 1.0, 1.7), 0.99},
        {"left_wrist", Eigen::Vector3d(1.2, 1.0, 1.1), 0.95},
        {"right_ankle", Eigen::Vector3d(1.7, 1.1, 0.1), 0.9},
    });

    SafetyEvaluation eval = monitor.evaluate(3, pose, room3x2());
    test::check(eval.safe, "eval.safe");
    test::check(eval.warnings.empty(), "eval.warnings.empty()");
    test::check(eval.incidents.empty(), "eval.incidents.empty()");
    test::check(!eval.pause_requested, "!eval.pause_requested");
}

void testWallWarning() {
    PoseSafetyMonitor monitor(quietConfig());
    PoseSnapshot pose = poseWith({
        {"left_wrist", Eigen::Vector3d(0.2, 1.0, 1.1), 0.95},
    });

    SafetyEvaluation eval = monitor.evaluate(3, pose, room3x2());
    test::check(!eval.safe, "!eval.safe");
    test::check(eval.warnings.size() == 1, "eval.warnings.size() == 1");
    test::check(eval.warnings[0] == "Left wrist too close to wall - move toward center",
                "eval.warnings[0] == \"Left wrist too close to wall - move toward center\"");
    test::check(eval.incidents.empty(), "eval.incidents.empty()");
    test::check(!eval.pause_requested, "!eval.pause_requested");
}

void testCriticalEscalation() {
    PoseSafetyMonitor monitor(quietConfig());

    // 5 cm from the far wall
    SafetyEvaluation near = monitor.evaluate(3, poseWith({
        {"right_wrist", Eigen::Vector3d(2.95, 1.0, 1.2), 0.9},
    }), room3x2());
    test::check(!near.safe, "!near.safe");
    test::check(near.pause_requested, "near.pause_requested");
    test::check(near.incidents.size() == 1, "near.incidents.size() == 1");

    const SafetyIncident& incident = near.incidents[0];
    test::check(incident.session_id == 3, "incident.session_id == 3");
    test::check(incident.timestamp_ms == 5000, "incident.timestamp_ms == 5000");
    test::check(incident.type == IncidentType::COLLISION_RISK,
                "incident.type == IncidentType::COLLISION_RISK");
    test::check(incident.severity == Severity::CRITICAL, "incident.severity == Severity::CRITICAL");
    test::check(incident.automatic_response == std::optional<std::string>("pause"),
                "incident.automatic_response == std::optional<std::string>(\"pause\")");
    test::check(!incident.session_paused, "!incident.session_paused");
    test::check(incident.user_position.has_value(), "incident.user_position.has_value()");

    // Outside the room
    SafetyEvaluation outside = monitor.evaluate(3, poseWith({
        {"left_ankle", Eigen::Vector3d(1.0, -0.2, 0.1), 0.9},
    }), room3x2());
    test::check(outside.incidents.size() == 1, "outside.incidents.size() == 1");
    test::check(outside.incidents[0].type == IncidentType::BOUNDARY_VIOLATION,
                "outside.incidents[0].type == IncidentType::BOUNDARY_VIOLATION");
}

void testCeilingClearance() {
    PoseSafetyMonitor monitor(quietConfig());

    SafetyEvaluation low_clearance = monitor.evaluate(1, poseWith({
        {"nose", Eigen::Vector3d(1.5, 1.0, 2.4), 0.95},
    }), room3x2(2.6));
    test::check(!low_clearance.safe, "!low_clearance.safe");
    test::check(low_clearance.warnings.size() == 1, "low_clearance.warnings.size() == 1");
    test::check(low_clearance.incidents.empty(), "low_clearance.incidents.empty()");

    SafetyEvaluation hit = monitor.evaluate(1, poseWith({
        {"head", Eigen::Vector3d(1.5, 1.0, 2.55), 0.95},
    }), room3x2(2.6));
    test::check(hit.incidents.size() == 1, "hit.incidents.size() == 1");
    test::check(hit.incidents[0].type == IncidentType::COLLISION_RISK,
                "hit.incidents[0].type == IncidentType::COLLISION_RISK");

    // No ceiling known: nothing to check
    SafetyEvaluation no_ceiling = monitor.evaluate(1, poseWith({
        {"nose", Eigen::Vector3d(1.5, 1.0, 2.55), 0.95},
    }), room3x2(std::nullopt));
    test::check(no_ceiling.safe, "no_ceiling.safe");
}

void testLowVisibilityIgnored() {
    PoseSafetyMonitor monitor(quietConfig());
    SafetyEvaluation eval = monitor.evaluate(1, poseWith({
        {"left_wrist", Eigen::Vector3d(-1.0, 1.0, 1.0), 0.5},
        {"right_wrist", Eigen::Vector3d(0.05, 1.0, 1.0), 0.2},
    }), room3x2());
    test::check(eval.safe, "eval.safe");
    test::check(eval.incidents.empty(), "eval.incidents.empty()");
}

void testRoomCautionAdvisory() {
    PoseSafetyMonitor monitor(quietConfig());
    SafetyEvaluation eval = monitor.evaluate(1, poseWith({
        {"nose", Eigen::Vector3d(1.5, 1.0, 1.6), 0.99},
    }), room3x2(2.6, 55.0));

    // Advisory is appended but the pose itself is fine
    test::check(eval.safe, "eval.safe");
    test::check(eval.warnings.size() == 1, "eval.warnings.size() == 1");
    test::check(eval.warnings[0].find("train with caution") != std::string::npos,
                "eval.warnings[0].find(\"train with caution\") != std::string::npos");
}

void testOrderedWarnings() {
    PoseSafetyMonitor monitor(quietConfig());
    SafetyEvaluation eval = monitor.evaluate(1, poseWith({
        {"left_wrist", Eigen::Vector3d(0.25, 1.0, 1.0), 0.9},
        {"right_wrist", Eigen::Vector3d(2.75, 1.0, 1.0), 0.9},
        {"left_ankle", Eigen::Vector3d(1.0, 0.05, 0.1), 0.9},
    }), room3x2());

    test::check(eval.warnings.size() == 3, "eval.warnings.size() == 3");
    test::check(eval.warnings[0].rfind("Left wrist", 0) == 0,
                "eval.warnings[0].rfind(\"Left wrist\", 0) == 0");
    test::check(eval.warnings[1].rfind("Right wrist", 0) == 0,
                "eval.warnings[1].rfind(\"Right wrist\", 0) == 0");
    test::check(eval.warnings[2].rfind("Left ankle", 0) == 0,
                "eval.warnings[2].rfind(\"Left ankle\", 0) == 0");
    test::check(eval.incidents.size() == 1, "eval.incidents.size() == 1");
    test::check(displayName("right_foot_index") == "Right foot index",
                "displayName(\"right_foot_index\") == \"Right foot index\"");
}

void testOneIncidentPerType() {
    PoseSafetyMonitor monitor(quietConfig());

    // Both wrists within 5 cm of opposite walls, one ankle outside
    SafetyEvaluation eval = monitor.evaluate(2, poseWith({
        {"left_wrist", Eigen::Vector3d(0.05, 1.0, 1.0), 0.9},
        {"right_wrist", Eigen::Vector3d(2.95, 1.0, 1.0), 0.9},
        {"left_ankle", Eigen::Vector3d(1.0, -0.1, 0.1), 0.9},
    }), room3x2());

    test::check(eval.warnings.size() == 3, "one warning per landmark");
    test::check(eval.incidents.size() == 2, "one incident per incident type");
    test::check(eval.incidents[0].type == IncidentType::COLLISION_RISK, "first incident is collision risk");
    test::check(eval.incidents[0].message == "Left wrist about to hit the wall",
                "collision risk reports the first landmark");
    test::check(eval.incidents[1].type == IncidentType::BOUNDARY_VIOLATION,
                "second incident is boundary violation");
}

void testSpeedChecks() {
    PoseSafetyMonitor monitor(quietConfig());
    PoseSnapshot before = poseWith({
        {"right_wrist", Eigen::Vector3d(1.0, 1.0, 1.0), 0.9},
        {"nose", Eigen::Vector3d(1.5, 1.0, 1.7), 0.95},
    }, 5000);

    // 0.5 m in 100 ms: 5 m/s, above the warning speed only
    SafetyEvaluation fast = monitor.evaluate(4, poseWith({
        {"right_wrist", Eigen::Vector3d(1.5, 1.0, 1.0), 0.9},
        {"nose", Eigen::Vector3d(1.5, 1.0, 1.7), 0.95},
    }, 5100), room3x2(), &before);
    test::check(!fast.safe, "fast wrist is unsafe");
    test::check(fast.warnings.size() == 1, "fast.warnings.size() == 1");
    test::check(fast.warnings[0] == "Right wrist moving too fast - slow down",
                "speed warning names the landmark");
    test::check(fast.incidents.empty(), "5 m/s is not critical");

    // 0.8 m in 100 ms: 8 m/s
    SafetyEvaluation flailing = monitor.evaluate(4, poseWith({
        {"right_wrist", Eigen::Vector3d(1.8, 1.0, 1.0), 0.9},
    }, 5100), room3x2(), &before);
    test::check(flailing.pause_requested, "critical speed requests a pause");
    test::check(flailing.incidents.size() == 1, "flailing.incidents.size() == 1");
    test::check(flailing.incidents[0].type == IncidentType::POSE_UNSAFE,
                "critical speed is a pose_unsafe incident");
    test::check(flailing.incidents[0].message == "Right wrist moving at 8.0 m/s - uncontrolled movement",
                "critical speed message");
    test::check(flailing.incidents[0].automatic_response == std::optional<std::string>("pause"),
                "critical speed asks for pause");

    // Frames too far apart, out of order, or without a visible earlier landmark
    SafetyEvaluation stale = monitor.evaluate(4, poseWith({
        {"right_wrist", Eigen::Vector3d(1.8, 1.0, 1.0), 0.9},
    }, 6000), room3x2(), &before);
    test::check(stale.safe, "stale previous frame is ignored");

    SafetyEvaluation reversed = monitor.evaluate(4, poseWith({
        {"right_wrist", Eigen::Vector3d(1.8, 1.0, 1.0), 0.9},
    }, 4900), room3x2(), &before);
    test::check(reversed.safe, "older frame is not compared");

    PoseSnapshot hidden = poseWith({{"right_wrist", Eigen::Vector3d(1.0, 1.0, 1.0), 0.3}}, 5000);
    SafetyEvaluation reappeared = monitor.evaluate(4, poseWith({
        {"right_wrist", Eigen::Vector3d(1.8, 1.0, 1.0), 0.9},
    }, 5100), room3x2(), &hidden);
    test::check(reappeared.safe, "landmark hidden in the previous frame is not compared");
}

void testSpeedConfigValidation() {
    Config cfg = quietConfig();
    cfg.pose_speed_critical_mps = cfg.pose_speed_warning_mps - 1.0;
    test::checkThrows<ConfigError>([&] { PoseSafetyMonitor monitor(cfg); },
                                   "critical speed below warning speed");

    Config gap = quietConfig();
    gap.pose_max_sample_gap_ms = 0;
    test::checkThrows<ConfigError>([&] { PoseSafetyMonitor monitor(gap); }, "zero sample gap");
}

int main() {
    test::run("Centred pose is safe", testCentredPoseIsSafe);
    test::run("Wall proximity warning", testWallWarning);
    test::run("Critical escalation", testCriticalEscalation);
    test::run("Ceiling clearance", testCeilingClearance);
    test::run("Low-visibility landmarks ignored", testLowVisibilityIgnored);
    test::run("Room caution advisory", testRoomCautionAdvisory);
    test::run("Warnings keep check order", testOrderedWarnings);
    test::run("One incident per type and snapshot", testOneIncidentPerType);
    test::run("Landmark speed between frames", testSpeedChecks);
    test::run("Speed threshold validation", testSpeedConfigValidation);
    return test::summary("test_pose_safety");
}
