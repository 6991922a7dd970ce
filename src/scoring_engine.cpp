/**
 * @file scoring_engine.cpp
 * @brief Implementation of precision/pace/streak scoring
 */

#include "training_engine/scoring_engine.hpp"
#include "training_engine/errors.hpp"
#include <algorithm>
#include <cmath>

namespace training_engine {

ScoringEngine::ScoringEngine(const SportProfile& profile)
    : profile_(profile) {
    profile_.weights.validate();
    if (profile_.streak_cap < 1) {
        throw ConfigError("streak_cap must be >= 1");
    }
    if (!(profile_.pace_target_hz > 0.0)) {
        throw ConfigError("pace_target_hz must be positive");
    }
}

void ScoringEngine::addEvent(const BounceEvent& event) {
    attempts_++;
    error_sum_mm_ += event.error_distance_mm;

    if (event.is_hit) {
        hits_++;
        current_streak_++;
        max_streak_ = std::max(max_streak_, current_streak_);
    } else {
        current_streak_ = 0;
    }

    first_ts_ = first_ts_ ? std::min(*first_ts_, event.timestamp_ms) : event.timestamp_ms;
    last_ts_ = last_ts_ ? std::max(*last_ts_, event.timestamp_ms) : event.timestamp_ms;
}

void ScoringEngine::reset() {
    attempts_ = 0;
    hits_ = 0;
    current_streak_ = 0;
    max_streak_ = 0;
    error_sum_mm_ = 0.0;
    first_ts_.reset();
    last_ts_.reset();
}

// =============================================================================
// SUB-SCORES
// =============================================================================

double ScoringEngine::precisionScore() const {
    if (attempts_ == 0) {
        return 0.0;
    }
    return 100.0 * hits_ / attempts_;
}

double ScoringEngine::cadenceHz() const {
    if (attempts_ < 2 || !first_ts_ || !last_ts_) {
        return 0.0;
    }
    TimestampMs elapsed = *last_ts_ - *first_ts_;
    if (elapsed <= 0) {
        return 0.0;
    }
    return (attempts_ - 1) * 1000.0 / static_cast<double>(elapsed);
}

double ScoringEngine::paceScore() const {
    double cadence = cadenceHz();
    if (cadence <= 0.0) {
        return 0.0;
    }
    double target = profile_.pace_target_hz;
    double deviation = std::abs(cadence - target) / target;
    return 100.0 * std::max(0.0, 1.0 - deviation);
}

double ScoringEngine::streakScore() const {
    int capped = std::min(max_streak_, profile_.streak_cap);
    return 100.0 * capped / profile_.streak_cap;
}

ScoreBreakdown ScoringEngine::scores() const {
    ScoreBreakdown s;
    s.precision = precisionScore();
    s.pace = paceScore();
    s.streak = streakScore();

    const auto& w = profile_.weights;
    s.total = (w.precision * s.precision + w.pace * s.pace + w.streak * s.streak) / 100.0;
    return s;
}

SessionSummary ScoringEngine::summary() const {
    SessionSummary sum;
    sum.attempts = attempts_;
    sum.hits = hits_;
    sum.accuracy_pct = precisionScore();
    sum.avg_error_mm = attempts_ > 0 ? error_sum_mm_ / attempts_ : 0.0;
    sum.avg_pace_hz = cadenceHz();
    sum.current_streak = current_streak_;
    sum.max_streak = max_streak_;

    if (first_ts_ && last_ts_) {
        sum.duration_ms = *last_ts_ - *first_ts_;
    }
    // Mean interval between consecutive bounces
    if (attempts_ >= 2) {
        sum.avg_reaction_ms = static_cast<double>(sum.duration_ms) / (attempts_ - 1);
    }
    return sum;
}

void ScoringEngine::applyTo(TrainingSession& session) const {
    SessionSummary sum = summary();

    session.total_bounces = sum.attempts;
    session.successful_hits = sum.hits;
    session.accuracy = sum.accuracy_pct;
    session.average_reaction_time_ms = sum.avg_reaction_ms;
    session.max_streak = sum.max_streak;
    session.duration_ms = sum.duration_ms;
    session.scores = scores();
}

ScoreBreakdown ScoringEngine::replay(const SportProfile& profile, const std::vector<BounceEvent>& events) {
    ScoringEngine engine(profile);
    for (const auto& e : events) {
        engine.addEvent(e);
    }
    return engine.scores();
}

} // namespace training_engine
