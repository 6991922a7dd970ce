/**
 * @file geometry.cpp
 * @brief Implementation of angle, distance and tolerance utilities
 */

#include "training_engine/geometry.hpp"
#include "training_engine/errors.hpp"
#include <algorithm>
#include <cmath>

#ifndef M_PI
#define M_PI 3.14159265358979323846
#endif

namespace training_engine {

namespace {

constexpr double kCoincidentEps = 1e-12;

double rad2deg(double rad) {
    return rad * 180.0 / M_PI;
}

} // anonymous namespace

double angleBetween(const Eigen::Vector2d& a, const Eigen::Vector2d& b, const Eigen::Vector2d& c) {
    Eigen::Vector2d ba = a - b;
    Eigen::Vector2d bc = c - b;
    if (ba.squaredNorm() < kCoincidentEps || bc.squaredNorm() < kCoincidentEps) {
        return 0.0;
    }

    double radians = std::atan2(bc.y(), bc.x()) - std::atan2(ba.y(), ba.x());
    double angle = std::abs(rad2deg(radians));

    // Fold reflex angles back into [0, 180]
    if (angle > 180.0) {
        angle = 360.0 - angle;
    }
    return angle;
}

double angleBetween(const Eigen::Vector3d& a, const Eigen::Vector3d& b, const Eigen::Vector3d& c) {
    Eigen::Vector3d ba = a - b;
    Eigen::Vector3d bc = c - b;
    if (ba.squaredNorm() < kCoincidentEps || bc.squaredNorm() < kCoincidentEps) {
        return 0.0;
    }

    // Angle in the plane spanned by the two rays, already in [0, 180]
    return rad2deg(std::atan2(ba.cross(bc).norm(), ba.dot(bc)));
}

double distance(const Eigen::Vector3d& a, const Eigen::Vector3d& b) {
    return (a - b).norm();
}

double distance(const Eigen::Vector2d& a, const Eigen::Vector2d& b) {
    return (a - b).norm();
}

ToleranceCheck classifyAgainstTolerance(
    const Eigen::Vector2d& point,
    const Eigen::Vector2d& target,
    double radius
) {
    if (!(radius > 0.0) || !std::isfinite(radius)) {
        throw ValidationError("Tolerance radius must be positive");
    }

    ToleranceCheck check;
    check.distance = distance(point, target);
    check.within = check.distance <= radius;
    check.normalized_error = check.distance / radius;
    return check;
}

std::optional<double> jointAngle(
    const PoseSnapshot& pose,
    const std::string& a,
    const std::string& b,
    const std::string& c
) {
    const Landmark* la = pose.find(a);
    const Landmark* lb = pose.find(b);
    const Landmark* lc = pose.find(c);
    if (!la || !lb || !lc) {
        return std::nullopt;
    }
    return angleBetween(la->position, lb->position, lc->position);
}

double distanceToBoundary(const Eigen::Vector2d& point, const UsableArea& area) {
    double dx = std::min(point.x(), area.width_m - point.x());
    double dy = std::min(point.y(), area.height_m - point.y());
    return std::min(dx, dy);
}

} // namespace training_engine
