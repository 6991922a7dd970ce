/**
 * @file sync_reconciler.cpp
 * @brief Implementation of the cross-platform merge rules
 */

#include "training_engine/sync_reconciler.hpp"
#include "training_engine/errors.hpp"
#include <algorithm>
#include <cmath>

namespace training_engine {

namespace {

void checkRange(const std::optional<double>& value, double lo, double hi, const char* name) {
    if (value && !(std::isfinite(*value) && *value >= lo && *value <= hi)) {
        throw ValidationError(std::string(name) + " out of range");
    }
}

void validateMetrics(const SyncMetrics& m) {
    checkRange(m.tracking_quality, 0.0, 100.0, "trackingQuality");
    checkRange(m.safety_score, 0.0, 100.0, "safetyScore");
    if (m.average_fps && !(std::isfinite(*m.average_fps) && *m.average_fps >= 0.0)) {
        throw ValidationError("averageFps must be >= 0");
    }
    if (m.scale_factor && !(std::isfinite(*m.scale_factor) && *m.scale_factor > 0.0)) {
        throw ValidationError("scaleFactor must be positive");
    }
    if (m.obstacle_count && *m.obstacle_count < 0) {
        throw ValidationError("obstacleCount must be >= 0");
    }
    if (m.room_center && !m.room_center->allFinite()) {
        throw ValidationError("roomCenter must be finite");
    }
}

template <typename T>
void keepMax(std::optional<T>& current, const std::optional<T>& incoming) {
    if (incoming) {
        current = current ? std::max(*current, *incoming) : *incoming;
    }
}

template <typename T>
void overwrite(std::optional<T>& current, const std::optional<T>& incoming) {
    if (incoming) {
        current = incoming;
    }
}

// Visitor for the per-platform parts
struct PayloadValidator {
    void operator()(const WebMediapipeSync& p) const {
        validateMetrics(p.metrics);
        checkRange(p.context.pose_detection_confidence, 0.0, 1.0, "poseDetectionConfidence");
        if (p.context.landmark_count && *p.context.landmark_count < 0) {
            throw ValidationError("landmarkCount must be >= 0");
        }
    }

    void operator()(const FlutterUnitySync& p) const {
        validateMetrics(p.metrics);
        if (p.context.plane_area_m2 &&
            !(std::isfinite(*p.context.plane_area_m2) && *p.context.plane_area_m2 >= 0.0)) {
            throw ValidationError("planeArea must be >= 0");
        }
    }
};

struct PayloadMerger {
    SessionQuality& quality;

    void operator()(const WebMediapipeSync& p) const {
        SyncReconciler::mergeMetrics(quality, p.metrics);
        WebMediapipeContext ctx = quality.web.value_or(WebMediapipeContext{});
        overwrite(ctx.pose_detection_confidence, p.context.pose_detection_confidence);
        overwrite(ctx.landmark_count, p.context.landmark_count);
        quality.web = ctx;
        quality.last_platform = SyncPlatform::WEB_MEDIAPIPE;
    }

    void operator()(const FlutterUnitySync& p) const {
        SyncReconciler::mergeMetrics(quality, p.metrics);
        FlutterUnityContext ctx = quality.unity.value_or(FlutterUnityContext{});
        overwrite(ctx.plane_area_m2, p.context.plane_area_m2);
        overwrite(ctx.device_model, p.context.device_model);
        overwrite(ctx.unity_version, p.context.unity_version);
        quality.unity = ctx;
        quality.last_platform = SyncPlatform::FLUTTER_UNITY;
    }
};

} // anonymous namespace

void SyncReconciler::validate(const SyncPayload& payload) {
    std::visit(PayloadValidator{}, payload);
}

void SyncReconciler::mergeMetrics(SessionQuality& quality, const SyncMetrics& incoming) {
    // Peak quality only ever improves
    keepMax(quality.average_fps, incoming.average_fps);
    keepMax(quality.tracking_quality, incoming.tracking_quality);

    // Current physical conditions
    overwrite(quality.safety_score, incoming.safety_score);
    overwrite(quality.room_center, incoming.room_center);
    overwrite(quality.scale_factor, incoming.scale_factor);
    overwrite(quality.obstacle_count, incoming.obstacle_count);
    overwrite(quality.lighting, incoming.lighting);
    overwrite(quality.reflective_surfaces, incoming.reflective_surfaces);
}

void SyncReconciler::merge(TrainingSession& session, const SyncPayload& payload) {
    if (isTerminal(session.status)) {
        throw SyncConflict(
            "Sync rejected: session " + std::to_string(session.id) +
            " is " + toString(session.status)
        );
    }
    validate(payload);

    std::visit(PayloadMerger{session.quality}, payload);
}

} // namespace training_engine
