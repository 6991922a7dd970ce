/**
 * @file room_analyzer.hpp
 * @brief Safety score, room/venue classification and pattern recommendation
 */

#pragma once

#include "common.hpp"
#include "config.hpp"
#include "data_types.hpp"
#include "sport_profile.hpp"

namespace training_engine {

/**
 * @brief Derives RoomConstraints from a detected usable plane
 *
 * Deterministic: identical input yields identical constraints, including the
 * order of recommendations and warnings.
 */
class RoomAnalyzer {
public:
    explicit RoomAnalyzer(const Config& config);

    /**
     * @throws ValidationError on non-positive/non-finite dimensions, negative
     *         obstacle count or non-positive ceiling height
     */
    RoomConstraints analyze(const PlaneObservation& plane, const SportProfile& profile) const;

    /**
     * @brief 100 minus additive penalties, clamped to [0, 100]
     */
    double safetyScore(const PlaneObservation& plane, const SportProfile& profile) const;

    /**
     * @brief Confined-space and low-ceiling adjustments for a plane
     *
     * Areas below Config::confined_area_m2 get the confined tolerance
     * multiplier and a reduced target count. A known ceiling below the
     * profile's overhead limit disables overhead movements.
     */
    RoomAdaptations adaptationsFor(const PlaneObservation& plane, const SportProfile& profile) const;

private:
    void rankPatterns(const PlaneObservation& plane,
                      const SportProfile& profile,
                      RoomConstraints& out) const;

    Config cfg_;
};

} // namespace training_engine
