/**
 * @file config.hpp
 * @brief Engine configuration parameters
 */

#pragma once

#include <cstdint>
#include <string>

namespace training_engine {

/**
 * @brief Engine configuration with all tunable parameters
 *
 * Sport-dependent values (tolerances, weights, pace, ceilings) live in
 * SportProfile; everything here applies to every sport.
 */
struct Config {
    // =========================================================================
    // BOUNCE VALIDATION
    // =========================================================================

    // --- Sensor fusion ---
    double fusion_vision_weight = 0.6;       ///< Vision share when both sensors report
    double fusion_audio_weight = 0.4;        ///< Audio share when both sensors report
    double fusion_agreement_floor = 0.7;     ///< Multiplier at total disagreement
    double fusion_agreement_bonus = 10.0;    ///< Points added at perfect agreement (scaled by min confidence)
    double fusion_vision_only_factor = 0.8;  ///< Discount when audio is silent
    double fusion_audio_only_factor = 0.6;   ///< Discount when vision is silent

    // =========================================================================
    // ROOM ANALYSIS
    // =========================================================================

    double low_ceiling_penalty = 30.0;
    double obstacle_penalty = 10.0;          ///< Per detected obstacle
    double non_flat_penalty = 20.0;
    double reflective_penalty = 10.0;
    double poor_lighting_penalty = 15.0;
    double dim_lighting_penalty = 5.0;

    // --- Confined spaces ---
    double confined_area_m2 = 4.0;                ///< Below this, drills are thinned and loosened
    double confined_tolerance_multiplier = 1.5;   ///< Tolerance radius factor in confined spaces

    // =========================================================================
    // MARKERS
    // =========================================================================

    double marker_safety_margin_m = 0.3;     ///< Clearance from usable-area boundary

    // =========================================================================
    // POSE SAFETY
    // =========================================================================

    double landmark_visibility_threshold = 0.5;  ///< Landmarks at or below are ignored
    double pose_warning_margin_m = 0.3;          ///< Boundary distance that raises a warning
    double pose_critical_margin_m = 0.1;         ///< Boundary distance that is critical
    double head_clearance_m = 0.3;               ///< Minimum head-to-ceiling distance
    double caution_safety_score = 70.0;          ///< Room score below this adds a general warning

    // --- Movement speed ---
    double pose_speed_warning_mps = 4.0;         ///< Landmark speed that raises a warning
    double pose_speed_critical_mps = 7.0;        ///< Landmark speed that is critical
    int64_t pose_max_sample_gap_ms = 500;        ///< Older previous snapshots are not compared

    // =========================================================================
    // LOGGING
    // =========================================================================

    bool verbose = true;                     ///< Print informational [Component] lines
};

} // namespace training_engine
