/**
 * @file drill_patterns.hpp
 * @brief Fixed catalogue of drill patterns
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

namespace training_engine {

/**
 * @brief Per-pattern constants
 */
struct DrillPatternSpec {
    std::string id;
    std::string name;
    std::string description;
    double min_area_m2;          ///< Smallest usable area the pattern is offered for
    int marker_count;
    bool requires_overhead;      ///< Needs overhead clearance (ball above head)
    bool venue_only;             ///< Never offered in room mode
};

/**
 * @brief All known patterns, ordered by decreasing minimum area
 */
const std::vector<DrillPatternSpec>& drillPatterns();

std::optional<DrillPatternSpec> findDrillPattern(const std::string& id);

} // namespace training_engine
