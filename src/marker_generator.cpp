/**
 * @file marker_generator.cpp
 * @brief Implementation of per-pattern marker layouts
 */

#include "training_engine/marker_generator.hpp"
#include "training_engine/drill_patterns.hpp"
#include "training_engine/errors.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>

#ifndef M_PI
#define M_PI 3.14159265358979323846
#endif

namespace training_engine {

namespace {

// Templates use at most this share of the inset half-extent
constexpr double kFillRatio = 0.95;

std::vector<Eigen::Vector2d> dribbleBox() {
    const double h = 1.0;   // 2 m box
    return {
        {-h, -h}, {0.0, -h}, {h, -h},
        {h, 0.0}, {h, h}, {0.0, h},
        {-h, h}, {-h, 0.0}, {0.0, 0.0},
    };
}

std::vector<Eigen::Vector2d> microLadder() {
    const int rungs = 6;
    const double spacing = 0.4;
    const double lane_half = 0.3;

    std::vector<Eigen::Vector2d> pts;
    for (int i = 0; i < rungs; ++i) {
        double x = (i - (rungs - 1) / 2.0) * spacing;
        pts.emplace_back(x, -lane_half);
        pts.emplace_back(x, lane_half);
    }
    return pts;
}

std::vector<Eigen::Vector2d> figureEight() {
    const double anchor = 0.5;
    const double rx = 1.2;
    const double ry = 0.5;

    std::vector<Eigen::Vector2d> pts = {{-anchor, 0.0}, {anchor, 0.0}};
    // Offset by pi/8 so no sample lands on the crossing point
    for (int k = 0; k < 8; ++k) {
        double t = M_PI / 8.0 + k * M_PI / 4.0;
        pts.emplace_back(rx * std::cos(t), ry * std::sin(2.0 * t));
    }
    return pts;
}

std::vector<Eigen::Vector2d> wallRebound() {
    const double rows[] = {0.5, 0.8, 1.1, 1.4};   // distance from the wall
    const double spreads[] = {-0.3, 0.0, 0.3};
    const double mid = (rows[0] + rows[3]) / 2.0;

    std::vector<Eigen::Vector2d> pts;
    for (double d : rows) {
        for (double s : spreads) {
            pts.emplace_back(s, d - mid);
        }
    }
    return pts;
}

std::vector<Eigen::Vector2d> seatedControl() {
    std::vector<Eigen::Vector2d> pts = {{0.0, 0.0}};
    for (int k = 0; k < 4; ++k) {
        double a = k * M_PI / 2.0;
        pts.emplace_back(0.32 * std::cos(a), 0.32 * std::sin(a));
    }
    for (int k = 0; k < 6; ++k) {
        double a = M_PI / 6.0 + k * M_PI / 3.0;
        pts.emplace_back(0.64 * std::cos(a), 0.64 * std::sin(a));
    }
    return pts;
}

std::vector<Eigen::Vector2d> zigzag() {
    const int count = 8;
    const double dx = 1.5;
    const double dy = 1.2;

    std::vector<Eigen::Vector2d> pts;
    for (int i = 0; i < count; ++i) {
        double x = (i - (count - 1) / 2.0) * dx;
        double y = (i % 2 == 0 ? -dy : dy) / 2.0;
        pts.emplace_back(x, y);
    }
    return pts;
}

// Patterns laid out along their long axis
bool followsLongSide(const std::string& pattern_id) {
    return pattern_id == "micro_ladder" || pattern_id == "zigzag";
}

} // anonymous namespace

MarkerGenerator::MarkerGenerator(const Config& config)
    : cfg_(config) {
    if (!(cfg_.marker_safety_margin_m >= 0.0)) {
        throw ConfigError("marker_safety_margin_m must be >= 0");
    }
}

std::vector<Eigen::Vector2d> MarkerGenerator::patternTemplate(const std::string& pattern_id) {
    if (pattern_id == "dribble_box")    return dribbleBox();
    if (pattern_id == "micro_ladder")   return microLadder();
    if (pattern_id == "figure_8")       return figureEight();
    if (pattern_id == "wall_rebound")   return wallRebound();
    if (pattern_id == "seated_control") return seatedControl();
    if (pattern_id == "zigzag")         return zigzag();
    throw ValidationError("Unknown drill pattern: '" + pattern_id + "'");
}

MarkerSet MarkerGenerator::generate(
    const std::string& pattern_id,
    const UsableArea& area,
    double tolerance_radius_mm,
    bool reduced_target_count
) const {
    auto spec = findDrillPattern(pattern_id);
    if (!spec) {
        throw ValidationError("Unknown drill pattern: '" + pattern_id + "'");
    }
    if (!std::isfinite(area.width_m) || !std::isfinite(area.height_m) ||
        area.width_m <= 0.0 || area.height_m <= 0.0) {
        throw ValidationError("Usable area dimensions must be positive and finite");
    }
    if (!(tolerance_radius_mm > 0.0)) {
        throw ValidationError("Marker tolerance radius must be positive");
    }
    if (area.area() < spec->min_area_m2) {
        throw ValidationError(
            "Usable area " + std::to_string(area.area()) + " m2 is below the " +
            std::to_string(spec->min_area_m2) + " m2 minimum for " + pattern_id
        );
    }

    const double margin = cfg_.marker_safety_margin_m;
    const double inner_w = area.width_m - 2.0 * margin;
    const double inner_h = area.height_m - 2.0 * margin;
    if (inner_w <= 0.0 || inner_h <= 0.0) {
        throw ValidationError(
            "Usable area too narrow for a " + std::to_string(margin) + " m safety margin"
        );
    }

    std::vector<Eigen::Vector2d> tmpl = patternTemplate(pattern_id);
    if (followsLongSide(pattern_id) && area.height_m > area.width_m) {
        for (auto& p : tmpl) {
            p = Eigen::Vector2d(p.y(), p.x());
        }
    }

    // Half extents of the template
    double hx = 0.0;
    double hy = 0.0;
    for (const auto& p : tmpl) {
        hx = std::max(hx, std::abs(p.x()));
        hy = std::max(hy, std::abs(p.y()));
    }

    if (reduced_target_count) {
        // Every other target, kept at the full template's scale
        std::vector<Eigen::Vector2d> kept;
        for (size_t i = 0; i < tmpl.size(); i += 2) {
            kept.push_back(tmpl[i]);
        }
        tmpl.swap(kept);
    }

    // Shrink to fit, never enlarge
    double scale = 1.0;
    if (hx > 0.0) scale = std::min(scale, kFillRatio * (inner_w / 2.0) / hx);
    if (hy > 0.0) scale = std::min(scale, kFillRatio * (inner_h / 2.0) / hy);

    const Eigen::Vector2d centre(area.width_m / 2.0, area.height_m / 2.0);

    MarkerSet set;
    set.pattern_id = pattern_id;
    set.area = area;
    set.safety_margin_m = margin;
    set.reduced_target_count = reduced_target_count;
    set.markers.reserve(tmpl.size());

    for (size_t i = 0; i < tmpl.size(); ++i) {
        Marker m;
        m.index = static_cast<int>(i);
        m.id = pattern_id + "_" + std::to_string(i);
        m.position_m = centre + scale * tmpl[i];
        m.normalized = Eigen::Vector2d(m.position_m.x() / area.width_m,
                                       m.position_m.y() / area.height_m);
        m.tolerance_radius_mm = tolerance_radius_mm;
        set.markers.push_back(m);
    }

    verifyContainment(set);
    return set;
}

void MarkerGenerator::verifyContainment(const MarkerSet& set) const {
    const double m = set.safety_margin_m;
    const double w = set.area.width_m;
    const double h = set.area.height_m;

    for (const auto& marker : set.markers) {
        const auto& p = marker.position_m;
        bool inside = p.x() > m && p.x() < w - m && p.y() > m && p.y() < h - m;
        if (!inside) {
            std::cerr << "[MarkerGenerator] FATAL: marker " << marker.id
                      << " at (" << p.x() << ", " << p.y() << ") violates the "
                      << m << " m margin of a " << w << " x " << h << " m area\n";
            throw ConstraintViolation("Marker " + marker.id + " outside safety margin");
        }
    }

    auto spec = findDrillPattern(set.pattern_id);
    if (!spec) {
        return;
    }
    const int expected = set.reduced_target_count ? reducedCount(spec->marker_count)
                                                  : spec->marker_count;
    if (static_cast<int>(set.markers.size()) != expected) {
        std::cerr << "[MarkerGenerator] FATAL: " << set.pattern_id << " produced "
                  << set.markers.size() << " markers, expected " << expected << "\n";
        throw ConstraintViolation("Marker count mismatch for " + set.pattern_id);
    }
}

} // namespace training_engine
