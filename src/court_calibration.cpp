/**
 * @file court_calibration.cpp
 * @brief Implementation of two-point court calibration
 */

#include "training_engine/court_calibration.hpp"
#include "training_engine/errors.hpp"
#include <algorithm>
#include <cmath>

namespace training_engine {

CourtCalibration CourtCalibration::fromBaseline(
    const Eigen::Vector3d& a,
    const Eigen::Vector3d& b,
    const Eigen::Vector3d& up,
    bool room_mode
) {
    if (!a.allFinite() || !b.allFinite() || !up.allFinite()) {
        throw ValidationError("Calibration points must be finite");
    }
    if (up.norm() < 1e-9) {
        throw ValidationError("Up vector must be non-zero");
    }

    Eigen::Vector3d up_n = up.normalized();

    // Project the baseline onto the floor plane
    Eigen::Vector3d baseline = b - a;
    Eigen::Vector3d on_floor = baseline - baseline.dot(up_n) * up_n;
    double floor_length = on_floor.norm();

    if (baseline.norm() < 1e-6) {
        throw ValidationError("Baseline points coincide");
    }
    if (floor_length < 1e-6) {
        throw ValidationError("Baseline is vertical");
    }
    if (room_mode && floor_length < kMinRoomBaselineM) {
        throw ValidationError(
            "Room baseline too short: " + std::to_string(floor_length) +
            " m (minimum " + std::to_string(kMinRoomBaselineM) + " m)"
        );
    }

    CourtCalibration calib;
    calib.origin = a;
    calib.up = up_n;
    calib.x_axis = on_floor / floor_length;
    calib.y_axis = up_n.cross(calib.x_axis);
    calib.baseline_distance_m = floor_length;
    calib.room_mode = room_mode;

    double reference = room_mode ? kRoomReferenceDistanceM : kVenueReferenceDistanceM;
    calib.scale_factor = std::clamp(floor_length / reference, kMinScale, kMaxScale);

    return calib;
}

Eigen::Vector2d CourtCalibration::worldToCourt(const Eigen::Vector3d& world) const {
    Eigen::Vector3d d = world - origin;
    return Eigen::Vector2d(d.dot(x_axis), d.dot(y_axis)) / scale_factor;
}

Eigen::Vector3d CourtCalibration::courtToWorld(const Eigen::Vector2d& court) const {
    Eigen::Vector2d m = court * scale_factor;
    return origin + m.x() * x_axis + m.y() * y_axis;
}

} // namespace training_engine
