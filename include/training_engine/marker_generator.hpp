/**
 * @file marker_generator.hpp
 * @brief Deterministic target marker layouts per drill pattern
 */

#pragma once

#include "common.hpp"
#include "config.hpp"
#include "data_types.hpp"
#include <Eigen/Dense>
#include <string>
#include <vector>

namespace training_engine {

/**
 * @brief Lays out target markers inside a usable area
 *
 * Each pattern has a template in metres around its own centre. The template
 * is shrunk (never enlarged) to fit the usable area inset by the safety
 * margin, then centred. Every marker lies strictly inside
 * (margin, width - margin) x (margin, height - margin).
 */
class MarkerGenerator {
public:
    explicit MarkerGenerator(const Config& config);

    /**
     * @brief Generate markers for a pattern
     *
     * @param pattern_id Known drill pattern id
     * @param area Usable area in metres
     * @param tolerance_radius_mm Radius attached to every marker
     * @param reduced_target_count Keep every other template target (confined rooms)
     *
     * @throws ValidationError for unknown patterns, areas below the pattern's
     *         minimum, or areas too narrow to keep the safety margin
     * @throws ConstraintViolation if a generated marker escapes the margin
     */
    MarkerSet generate(
        const std::string& pattern_id,
        const UsableArea& area,
        double tolerance_radius_mm = 200.0,
        bool reduced_target_count = false
    ) const;

    /**
     * @brief Template positions (metres, centred on origin) for a pattern
     */
    static std::vector<Eigen::Vector2d> patternTemplate(const std::string& pattern_id);

    double safetyMargin() const { return cfg_.marker_safety_margin_m; }

    /// Targets left when a pattern of full_count is thinned
    static int reducedCount(int full_count) { return (full_count + 1) / 2; }

private:
    void verifyContainment(const MarkerSet& set) const;

    Config cfg_;
};

} // namespace training_engine
