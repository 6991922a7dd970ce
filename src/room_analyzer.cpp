/**
 * @file room_analyzer.cpp
 * @brief Implementation of room safety scoring and pattern recommendation
 */

#include "training_engine/room_analyzer.hpp"
#include "training_engine/drill_patterns.hpp"
#include "training_engine/errors.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>
#include <sstream>

namespace training_engine {

namespace {

std::string fmt(double value) {
    std::ostringstream ss;
    ss.precision(2);
    ss << std::fixed << value;
    return ss.str();
}

} // anonymous namespace

RoomAnalyzer::RoomAnalyzer(const Config& config)
    : cfg_(config) {
    if (!(cfg_.confined_tolerance_multiplier >= 1.0)) {
        throw ConfigError("confined_tolerance_multiplier must be >= 1");
    }
}

double RoomAnalyzer::safetyScore(const PlaneObservation& plane, const SportProfile& profile) const {
    double score = 100.0;

    if (plane.ceiling_height_m && *plane.ceiling_height_m < profile.min_ceiling_m) {
        score -= cfg_.low_ceiling_penalty;
    }
    score -= cfg_.obstacle_penalty * std::max(0, plane.obstacle_count);
    if (!plane.is_flat) {
        score -= cfg_.non_flat_penalty;
    }
    if (plane.reflective_surfaces) {
        score -= cfg_.reflective_penalty;
    }
    if (plane.lighting == LightingCondition::POOR) {
        score -= cfg_.poor_lighting_penalty;
    } else if (plane.lighting == LightingCondition::DIM) {
        score -= cfg_.dim_lighting_penalty;
    }

    return std::clamp(score, 0.0, 100.0);
}

RoomConstraints RoomAnalyzer::analyze(const PlaneObservation& plane, const SportProfile& profile) const {
    if (!std::isfinite(plane.width_m) || !std::isfinite(plane.height_m) ||
        plane.width_m <= 0.0 || plane.height_m <= 0.0) {
        throw ValidationError("Room dimensions must be positive and finite");
    }
    if (plane.obstacle_count < 0) {
        throw ValidationError("Obstacle count must be >= 0");
    }
    if (plane.ceiling_height_m &&
        (!std::isfinite(*plane.ceiling_height_m) || *plane.ceiling_height_m <= 0.0)) {
        throw ValidationError("Ceiling height must be positive");
    }

    RoomConstraints out;
    out.sport = profile.sport;
    out.width_m = plane.width_m;
    out.height_m = plane.height_m;
    out.area_m2 = plane.width_m * plane.height_m;
    out.ceiling_height_m = plane.ceiling_height_m;
    out.is_flat = plane.is_flat;
    out.aspect_ratio = std::max(plane.width_m, plane.height_m) /
                       std::min(plane.width_m, plane.height_m);
    out.obstacle_count = plane.obstacle_count;
    out.lighting = plane.lighting;
    out.reflective_surfaces = plane.reflective_surfaces;
    out.is_room_mode = out.area_m2 < profile.venue_area_m2;
    out.safety_score = safetyScore(plane, profile);

    // Warnings in the same order as the penalties
    if (plane.ceiling_height_m && *plane.ceiling_height_m < profile.min_ceiling_m) {
        out.safety_warnings.push_back(
            "Ceiling height " + fmt(*plane.ceiling_height_m) + " m is below the " +
            fmt(profile.min_ceiling_m) + " m minimum for " + profile.sport
        );
    }
    if (plane.obstacle_count > 0) {
        out.safety_warnings.push_back(
            std::to_string(plane.obstacle_count) + " obstacle(s) detected in the play area"
        );
    }
    if (!plane.is_flat) {
        out.safety_warnings.push_back("Floor surface is not flat");
    }
    if (plane.reflective_surfaces) {
        out.safety_warnings.push_back("Reflective surfaces may reduce tracking confidence");
    }
    if (plane.lighting == LightingCondition::POOR) {
        out.safety_warnings.push_back("Poor lighting - tracking may be unreliable");
    } else if (plane.lighting == LightingCondition::DIM) {
        out.safety_warnings.push_back("Dim lighting - consider adding light");
    }

    out.adaptations = adaptationsFor(plane, profile);
    if (out.adaptations.reduced_target_count) {
        out.safety_warnings.push_back("Very confined space - reduced movement patterns only");
    }

    rankPatterns(plane, profile, out);

    if (cfg_.verbose) {
        std::cout << "[RoomAnalyzer] " << fmt(out.width_m) << " x " << fmt(out.height_m)
                  << " m (" << fmt(out.area_m2) << " m2), "
                  << (out.is_room_mode ? "room mode" : "venue mode")
                  << ", safety " << fmt(out.safety_score)
                  << ", " << out.recommended_patterns.size() << " pattern(s) recommended\n";
    }

    return out;
}

RoomAdaptations RoomAnalyzer::adaptationsFor(const PlaneObservation& plane, const SportProfile& profile) const {
    RoomAdaptations adapt;
    if (plane.width_m * plane.height_m < cfg_.confined_area_m2) {
        adapt.tolerance_multiplier = cfg_.confined_tolerance_multiplier;
        adapt.reduced_target_count = true;
    }
    adapt.no_overhead_movements =
        plane.ceiling_height_m && *plane.ceiling_height_m < profile.overhead_ceiling_m;
    return adapt;
}

void RoomAnalyzer::rankPatterns(
    const PlaneObservation& plane,
    const SportProfile& profile,
    RoomConstraints& out
) const {
    // Preferred patterns first, then the rest in catalogue order
    std::vector<const DrillPatternSpec*> order;
    for (const auto& id : profile.preferred_patterns) {
        for (const auto& p : drillPatterns()) {
            if (p.id == id &&
                std::find(order.begin(), order.end(), &p) == order.end()) {
                order.push_back(&p);
            }
        }
    }
    for (const auto& p : drillPatterns()) {
        if (std::find(order.begin(), order.end(), &p) == order.end()) {
            order.push_back(&p);
        }
    }

    // Markers must fit strictly inside the inset area
    const double narrow_side = std::min(plane.width_m, plane.height_m);
    const bool too_narrow = narrow_side <= 2.0 * cfg_.marker_safety_margin_m;

    for (const DrillPatternSpec* p : order) {
        std::string reason;

        if (out.area_m2 < p->min_area_m2) {
            reason = "needs " + fmt(p->min_area_m2) + " m2, room has " + fmt(out.area_m2) + " m2";
        } else if (too_narrow) {
            reason = "narrower than 2 x " + fmt(cfg_.marker_safety_margin_m) +
                     " m safety margin (narrow side " + fmt(narrow_side) + " m)";
        } else if (p->venue_only && out.is_room_mode) {
            reason = "venue-only pattern, space is in room mode";
        } else if (p->requires_overhead && out.adaptations.no_overhead_movements) {
            reason = "needs " + fmt(profile.overhead_ceiling_m) + " m ceiling for overhead motion, room has " +
                     fmt(*plane.ceiling_height_m) + " m";
        }

        if (reason.empty()) {
            out.recommended_patterns.push_back(p->id);
        } else {
            out.excluded_patterns.push_back({p->id, reason});
            out.safety_warnings.push_back("Pattern '" + p->id + "' excluded: " + reason);
        }
    }
}

} // namespace training_engine
