/**
 * @file example_simple.cpp
 * @brief Simple example showing basic training engine usage
 */

#include <training_engine/training_engine.hpp>
#include <training_engine/session_log.hpp>
#include <training_engine/errors.hpp>
#include <opencv2/core.hpp>
#include <iostream>

using namespace training_engine;

int main() {
    std::cout << "=== Training Engine Simple Example ===" << std::endl;
    std::cout << std::endl;

    // Create engine with an in-process store
    std::cout << "Creating engine..." << std::endl;
    auto repo = std::make_shared<InMemorySessionRepository>();
    TrainingEngine engine(repo);

    auto session = engine.createSession(
        42,                 // user id
        "basketball",
        "dribble_box",
        Difficulty::MEDIUM, // 200 mm tolerance
        DevicePlatform::WEB
    );
    std::cout << "Session " << session.id << " created ("
              << toString(session.status) << ")" << std::endl;

    // PHASE 1: Room scan (living room, 3 m x 2 m, 2.6 m ceiling)
    std::cout << "\n--- ROOM PHASE ---" << std::endl;
    PlaneObservation plane;
    plane.width_m = 3.0;
    plane.height_m = 2.0;
    plane.obstacle_count = 1;
    plane.lighting = LightingCondition::DIM;
    plane.ceiling_height_m = 2.6;

    RoomConstraints room = engine.analyzeRoom(session.id, plane);
    std::cout << "Recommended patterns:";
    for (const auto& id : room.recommended_patterns) {
        std::cout << " " << id;
    }
    std::cout << std::endl;
    std::cout << "Tolerance x" << room.adaptations.tolerance_multiplier
              << (room.adaptations.no_overhead_movements ? ", no overhead movements" : "")
              << std::endl;

    MarkerSet markers = engine.generateMarkers(session.id);
    std::cout << "Markers for " << markers.pattern_id << " (" << markers.markers.size() << "):" << std::endl;

    // Screen positions for a 1280x720 overlay
    auto pixels = markers.toCanvas(cv::Size(1280, 720));
    for (size_t i = 0; i < markers.markers.size(); i++) {
        const auto& m = markers.markers[i];
        std::cout << "  " << m.id << ": (" << m.position_m.x() << ", " << m.position_m.y()
                  << ") m -> (" << pixels[i].x << ", " << pixels[i].y << ") px" << std::endl;
    }

    // Two taps along the near wall define the court frame
    engine.calibrateCourt(session.id, Eigen::Vector3d(0.0, 0.0, 0.0), Eigen::Vector3d(2.4, 0.0, 0.0));

    // PHASE 2: Drill (simulated bounces aimed at each marker in turn)
    std::cout << "\n--- DRILL PHASE ---" << std::endl;
    for (int i = 0; i < 18; i++) {
        const auto& target = markers.markers[i % markers.markers.size()];

        // Miss every fourth bounce by 30 cm
        double offset = (i % 4 == 3) ? 0.3 : 0.04;

        ImpactData impact;
        impact.timestamp_ms = 1000 + i * 450;
        impact.world_position = Eigen::Vector3d(
            target.position_m.x() + offset, 0.0, -target.position_m.y());
        impact.target_index = target.index;
        impact.target_position = target.position_m;
        impact.vision_confidence = 85.0;
        impact.audio_confidence = (i % 5 == 0) ? 0.0 : 70.0;

        try {
            auto event = engine.recordBounceEvent(session.id, impact);
            if (i % 3 == 0) {
                std::cout << "Bounce " << i << ": " << (event.is_hit ? "HIT " : "MISS")
                          << " error=" << event.error_distance_mm << " mm"
                          << " confidence=" << event.fusion_confidence << std::endl;
            }
        } catch (const std::exception& e) {
            std::cerr << "Error on bounce " << i << ": " << e.what() << std::endl;
            return 1;
        }
    }

    // Pose drifting toward the far wall
    PoseSnapshot pose;
    pose.timestamp_ms = 9500;
    pose.landmarks = {
        {"nose", Eigen::Vector3d(2.6, 1.0, 1.7), 0.98},
        {"right_wrist", Eigen::Vector3d(2.8, 1.1, 1.2), 0.92},
    };
    auto safety = engine.evaluatePoseSafety(session.id, pose);
    std::cout << "Pose safe: " << (safety.safe ? "YES" : "NO") << std::endl;
    for (const auto& w : safety.warnings) {
        std::cout << "  " << w << std::endl;
    }

    // Quality report from the browser client
    WebMediapipeSync sync;
    sync.metrics.average_fps = 29.0;
    sync.metrics.tracking_quality = 82.0;
    sync.context.landmark_count = 33;
    engine.syncSession(session.id, sync);

    // PHASE 3: Finish
    std::cout << "\n--- FINAL STATUS ---" << std::endl;
    auto done = engine.transitionSession(session.id, SessionTrigger::END);
    std::cout << "Bounces: " << done.total_bounces << " (" << done.successful_hits << " hits)" << std::endl;
    std::cout << "Scores: precision=" << done.scores.precision
              << " pace=" << done.scores.pace
              << " streak=" << done.scores.streak
              << " total=" << done.scores.total << std::endl;

    auto metric = engine.buildPerformanceMetric(session.id);
    std::cout << "Performance: " << toJson(metric).dump() << std::endl;

    auto analytics = engine.roomAnalytics(42);
    std::cout << "Room sessions for user 42: " << analytics.room_sessions
              << " (compliance " << analytics.safety_compliance_rate << "%, score trend "
              << toString(analytics.score_trend) << ")" << std::endl;

    auto status = engine.getStatus();
    std::cout << "System status:" << std::endl;
    for (const auto& [key, value] : status) {
        std::cout << "  " << key << ": " << value << std::endl;
    }

    std::cout << "\n=== Example Complete ===" << std::endl;
    std::cout << "\nNote: This example uses simulated impacts. For real usage," << std::endl;
    std::cout << "feed detections from the AR client and its pose tracker." << std::endl;

    return 0;
}
