/**
 * @file court_calibration.hpp
 * @brief Two-point court calibration (world frame <-> court frame)
 */

#pragma once

#include "common.hpp"
#include <Eigen/Dense>

namespace training_engine {

/**
 * @brief Court frame built from two baseline taps on the floor plane
 *
 * Origin at baseline point A, x axis along A->B projected onto the floor,
 * y axis = up x x. Court coordinates are metres divided by the scale factor.
 */
struct CourtCalibration {
    Eigen::Vector3d origin = Eigen::Vector3d::Zero();
    Eigen::Vector3d x_axis = Eigen::Vector3d::UnitX();
    Eigen::Vector3d y_axis = Eigen::Vector3d::UnitZ();
    Eigen::Vector3d up = Eigen::Vector3d::UnitY();   ///< World up (Y-up AR frame)

    double baseline_distance_m = 0.0;
    double scale_factor = 1.0;
    bool room_mode = false;

    static constexpr double kMinRoomBaselineM = 0.5;
    static constexpr double kRoomReferenceDistanceM = 2.4;
    static constexpr double kVenueReferenceDistanceM = 1.0;
    static constexpr double kMinScale = 0.3;
    static constexpr double kMaxScale = 2.0;

    /**
     * @brief Create calibration from two baseline points
     *
     * @param a First baseline point (becomes the court origin)
     * @param b Second baseline point (defines the x axis)
     * @param up World up direction (need not be unit length)
     * @param room_mode Room-mode calibration scales to the room reference size
     *
     * @throws ValidationError if the points coincide, the baseline is vertical,
     *         or a room-mode baseline is shorter than kMinRoomBaselineM
     */
    static CourtCalibration fromBaseline(
        const Eigen::Vector3d& a,
        const Eigen::Vector3d& b,
        const Eigen::Vector3d& up = Eigen::Vector3d::UnitY(),
        bool room_mode = false
    );

    Eigen::Vector2d worldToCourt(const Eigen::Vector3d& world) const;
    Eigen::Vector3d courtToWorld(const Eigen::Vector2d& court) const;
};

} // namespace training_engine
