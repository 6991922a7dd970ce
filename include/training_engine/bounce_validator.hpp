/**
 * @file bounce_validator.hpp
 * @brief Hit/miss decision and vision/audio confidence fusion
 */

#pragma once

#include "common.hpp"
#include "config.hpp"
#include "data_types.hpp"
#include <optional>

namespace training_engine {

/**
 * @brief Turns raw impacts into validated BounceEvents
 *
 * Fusion (both sensors present, v and a in [0, 100]):
 *     base      = wv * v + wa * a
 *     agreement = 1 - |v - a| / 100
 *     fused     = base * (floor + (1 - floor) * agreement)
 *               + bonus * agreement * min(v, a) / 100
 * With one sensor silent the fused value is that sensor's confidence scaled
 * by its single-sensor factor (< 1), so it never exceeds the active input.
 */
class BounceValidator {
public:
    explicit BounceValidator(const Config& config);

    /**
     * @brief Validate one impact
     *
     * @param session_id Parent session
     * @param impact Impact with court_position already resolved
     * @param tolerance_radius_mm Radius for the session's difficulty
     * @return Immutable event; is_hit == (error_distance_mm <= tolerance_radius_mm)
     *
     * @throws ValidationError on missing target/court position, confidences
     *         outside [0, 100], non-finite coordinates, negative timestamps or
     *         non-positive radius
     */
    BounceEvent validate(
        SessionId session_id,
        const ImpactData& impact,
        double tolerance_radius_mm
    ) const;

    /**
     * @brief Fuse vision and audio confidences; absent sensors count as silent
     */
    double fuseConfidence(
        const std::optional<double>& vision,
        const std::optional<double>& audio
    ) const;

private:
    Config cfg_;
};

} // namespace training_engine
