/**
 * @file geometry.hpp
 * @brief Angle, distance and tolerance utilities over landmark positions
 */

#pragma once

#include "common.hpp"
#include "data_types.hpp"
#include <Eigen/Dense>

namespace training_engine {

/**
 * @brief Angle at vertex b formed by rays b->a and b->c, in degrees [0, 180]
 *
 * The 2-D overload folds the difference of two atan2 results. The 3-D
 * overload measures in the plane of the three points,
 * atan2(|ba x bc|, ba . bc), so limbs keep their true angle whatever their
 * orientation. Both return 0 if a or c coincides with b.
 */
double angleBetween(const Eigen::Vector3d& a, const Eigen::Vector3d& b, const Eigen::Vector3d& c);
double angleBetween(const Eigen::Vector2d& a, const Eigen::Vector2d& b, const Eigen::Vector2d& c);

/**
 * @brief Euclidean distance. 2-D points are treated as z = 0.
 */
double distance(const Eigen::Vector3d& a, const Eigen::Vector3d& b);
double distance(const Eigen::Vector2d& a, const Eigen::Vector2d& b);

/**
 * @brief Result of classifying a point against a tolerance radius
 */
struct ToleranceCheck {
    double distance;          ///< Same unit as the radius
    bool within;              ///< distance <= radius
    double normalized_error;  ///< distance / radius (0 = centre, 1 = edge)
};

/**
 * @brief Classify a point against a target and radius (same units)
 *
 * @throws ValidationError if radius is not positive
 */
ToleranceCheck classifyAgainstTolerance(
    const Eigen::Vector2d& point,
    const Eigen::Vector2d& target,
    double radius
);

/**
 * @brief Angle at landmark b of a pose (e.g. hip-knee-ankle)
 * @return nullopt if any landmark is missing
 */
std::optional<double> jointAngle(
    const PoseSnapshot& pose,
    const std::string& a,
    const std::string& b,
    const std::string& c
);

/**
 * @brief Signed distance from a point to the nearest edge of a usable area
 *
 * Positive inside [0, width] x [0, height], negative outside.
 */
double distanceToBoundary(const Eigen::Vector2d& point, const UsableArea& area);

} // namespace training_engine
