/**
 * @file bounce_validator.cpp
 * @brief Implementation of hit/miss validation and confidence fusion
 */

#include "training_engine/bounce_validator.hpp"
#include "training_engine/errors.hpp"
#include "training_engine/geometry.hpp"
#include <algorithm>
#include <cmath>

namespace training_engine {

namespace {

constexpr double kMetresToMm = 1000.0;

void checkConfidence(const std::optional<double>& value, const char* name) {
    if (value && !(*value >= 0.0 && *value <= 100.0)) {
        throw ValidationError(std::string(name) + " must be in [0, 100]");
    }
}

} // anonymous namespace

BounceValidator::BounceValidator(const Config& config)
    : cfg_(config) {
    if (std::abs(cfg_.fusion_vision_weight + cfg_.fusion_audio_weight - 1.0) > 1e-6) {
        throw ConfigError("Fusion weights must sum to 1");
    }
    if (cfg_.fusion_agreement_floor < 0.0 || cfg_.fusion_agreement_floor > 1.0) {
        throw ConfigError("fusion_agreement_floor must be in [0, 1]");
    }
    if (cfg_.fusion_vision_only_factor > 1.0 || cfg_.fusion_audio_only_factor > 1.0) {
        throw ConfigError("Single-sensor fusion factors must not exceed 1");
    }
}

BounceEvent BounceValidator::validate(
    SessionId session_id,
    const ImpactData& impact,
    double tolerance_radius_mm
) const {
    if (!impact.target_position) {
        throw ValidationError("Impact has no target position");
    }
    if (!impact.court_position) {
        throw ValidationError("Impact has no court position and the session is not calibrated");
    }
    if (impact.target_index < 0) {
        throw ValidationError("Impact target index must be >= 0");
    }
    if (impact.timestamp_ms < 0) {
        throw ValidationError("Impact timestamp must be >= 0");
    }
    if (!impact.world_position.allFinite() ||
        !impact.court_position->allFinite() ||
        !impact.target_position->allFinite()) {
        throw ValidationError("Impact coordinates must be finite");
    }
    checkConfidence(impact.vision_confidence, "vision_confidence");
    checkConfidence(impact.audio_confidence, "audio_confidence");

    // Court metres -> millimetres against a millimetre radius
    ToleranceCheck check = classifyAgainstTolerance(
        *impact.court_position * kMetresToMm,
        *impact.target_position * kMetresToMm,
        tolerance_radius_mm
    );

    BounceEvent event;
    event.session_id = session_id;
    event.timestamp_ms = impact.timestamp_ms;
    event.world_position = impact.world_position;
    event.court_position = *impact.court_position;
    event.target_index = impact.target_index;
    event.target_position = *impact.target_position;
    event.error_distance_mm = check.distance;
    event.tolerance_radius_mm = tolerance_radius_mm;
    event.is_hit = event.error_distance_mm <= event.tolerance_radius_mm;
    event.vision_confidence = impact.vision_confidence.value_or(0.0);
    event.audio_confidence = impact.audio_confidence.value_or(0.0);
    event.fusion_confidence = fuseConfidence(impact.vision_confidence, impact.audio_confidence);

    return event;
}

double BounceValidator::fuseConfidence(
    const std::optional<double>& vision,
    const std::optional<double>& audio
) const {
    double v = vision.value_or(0.0);
    double a = audio.value_or(0.0);

    // A sensor reporting 0 is as silent as one not reporting
    bool has_v = v > 0.0;
    bool has_a = a > 0.0;

    if (!has_v && !has_a) {
        return 0.0;
    }
    if (!has_a) {
        return v * cfg_.fusion_vision_only_factor;
    }
    if (!has_v) {
        return a * cfg_.fusion_audio_only_factor;
    }

    double base = cfg_.fusion_vision_weight * v + cfg_.fusion_audio_weight * a;
    double agreement = 1.0 - std::abs(v - a) / 100.0;
    double floor = cfg_.fusion_agreement_floor;

    double fused = base * (floor + (1.0 - floor) * agreement)
                 + cfg_.fusion_agreement_bonus * agreement * std::min(v, a) / 100.0;

    return std::clamp(fused, 0.0, 100.0);
}

} // namespace training_engine
