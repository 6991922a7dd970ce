/**
 * @file scoring_engine.hpp
 * @brief Precision/pace/streak sub-scores from a bounce stream
 */

#pragma once

#include "common.hpp"
#include "data_types.hpp"
#include "sport_profile.hpp"
#include <vector>

namespace training_engine {

/**
 * @brief Accumulates bounce events into weighted sub-scores
 *
 * - precision = hits / attempts * 100
 * - pace      = 100 * max(0, 1 - |cadence - target| / target), cadence in Hz
 *               from first to last bounce timestamp
 * - streak    = min(max_streak, cap) / cap * 100
 * - total     = (wp * precision + wpace * pace + ws * streak) / 100
 *
 * Pure function of the ordered event stream: replaying the same events
 * into a fresh engine reproduces the same scores.
 */
class ScoringEngine {
public:
    /// @throws ConfigError if the profile's weights or streak cap are invalid
    explicit ScoringEngine(const SportProfile& profile);

    void addEvent(const BounceEvent& event);
    void reset();

    ScoreBreakdown scores() const;
    SessionSummary summary() const;

    /**
     * @brief Write counters, accuracy and scores into a session record
     */
    void applyTo(TrainingSession& session) const;

    /**
     * @brief Score a whole ordered stream from scratch
     */
    static ScoreBreakdown replay(const SportProfile& profile, const std::vector<BounceEvent>& events);

    int attempts() const { return attempts_; }
    int hits() const { return hits_; }
    int currentStreak() const { return current_streak_; }
    int maxStreak() const { return max_streak_; }

private:
    double precisionScore() const;
    double paceScore() const;
    double streakScore() const;
    double cadenceHz() const;

    SportProfile profile_;

    int attempts_ = 0;
    int hits_ = 0;
    int current_streak_ = 0;
    int max_streak_ = 0;
    double error_sum_mm_ = 0.0;

    std::optional<TimestampMs> first_ts_;
    std::optional<TimestampMs> last_ts_;
};

} // namespace training_engine
