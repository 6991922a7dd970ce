/**
 * @file drill_patterns.cpp
 * @brief Drill pattern catalogue
 */

#include "training_engine/drill_patterns.hpp"

namespace training_engine {

const std::vector<DrillPatternSpec>& drillPatterns() {
    static const std::vector<DrillPatternSpec> patterns = {
        {"zigzag", "Zigzag Run",
         "Alternating cones across the full floor, venue only", 9.0, 8, false, true},
        {"dribble_box", "Dribble Box",
         "Bounce around the corners and edges of a 2 m box", 4.0, 9, false, false},
        {"figure_8", "Figure 8",
         "Continuous figure-eight around two anchor points", 3.0, 10, false, false},
        {"micro_ladder", "Micro Ladder",
         "Two-lane ladder with short rungs along the long side", 2.4, 12, false, false},
        {"wall_rebound", "Wall Rebound",
         "Throw-and-catch rows in front of a wall, ball above head", 2.0, 12, true, false},
        {"seated_control", "Seated Control",
         "Rings of close targets reachable from a seated position", 1.6, 11, false, false},
    };
    return patterns;
}

std::optional<DrillPatternSpec> findDrillPattern(const std::string& id) {
    for (const auto& p : drillPatterns()) {
        if (p.id == id) {
            return p;
        }
    }
    return std::nullopt;
}

} // namespace training_engine
