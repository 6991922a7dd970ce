/**
 * @file data_types.cpp
 * @brief Implementation of small helpers on the core data structures
 */

#include "training_engine/data_types.hpp"
#include <algorithm>

namespace training_engine {

bool RoomConstraints::recommends(const std::string& pattern_id) const {
    return std::find(recommended_patterns.begin(), recommended_patterns.end(), pattern_id)
        != recommended_patterns.end();
}

std::vector<cv::Point2f> MarkerSet::toCanvas(const cv::Size& canvas) const {
    std::vector<cv::Point2f> pixels;
    pixels.reserve(markers.size());

    for (const auto& m : markers) {
        // Canvas y grows downward
        pixels.emplace_back(
            static_cast<float>(m.normalized.x() * canvas.width),
            static_cast<float>((1.0 - m.normalized.y()) * canvas.height)
        );
    }

    return pixels;
}

double MarkerSet::footprintArea() const {
    if (markers.size() < 2) {
        return 0.0;
    }

    Eigen::Vector2d lo = markers.front().position_m;
    Eigen::Vector2d hi = lo;
    for (const auto& m : markers) {
        lo = lo.cwiseMin(m.position_m);
        hi = hi.cwiseMax(m.position_m);
    }

    Eigen::Vector2d extent = hi - lo;
    return extent.x() * extent.y();
}

const Landmark* PoseSnapshot::find(const std::string& name) const {
    for (const auto& lm : landmarks) {
        if (lm.name == name) {
            return &lm;
        }
    }
    return nullptr;
}

SyncPlatform platformOf(const SyncPayload& payload) {
    return std::holds_alternative<WebMediapipeSync>(payload)
        ? SyncPlatform::WEB_MEDIAPIPE
        : SyncPlatform::FLUTTER_UNITY;
}

} // namespace training_engine
