/**
 * @file sport_profile.hpp
 * @brief Per-sport tolerances, score weights and room requirements
 */

#pragma once

#include "common.hpp"
#include <nlohmann/json_fwd.hpp>
#include <map>
#include <string>
#include <vector>

namespace training_engine {

/**
 * @brief Hit tolerance radius per difficulty, in millimetres
 *
 * Must be strictly decreasing easy > medium > hard > expert.
 */
struct ToleranceTable {
    double easy_mm = 300.0;
    double medium_mm = 200.0;
    double hard_mm = 100.0;
    double expert_mm = 50.0;

    double radiusFor(Difficulty difficulty) const;

    /// @throws ConfigError if not strictly decreasing or not positive
    void validate() const;
};

/**
 * @brief Sub-score weights, in percent. Must sum to 100.
 */
struct ScoreWeights {
    double precision = 60.0;
    double pace = 30.0;
    double streak = 10.0;

    /// @throws ConfigError if any weight is negative or the sum is not 100
    void validate() const;
};

/**
 * @brief Everything sport-specific the engine needs
 */
struct SportProfile {
    std::string sport = "default";

    ToleranceTable tolerances;
    ScoreWeights weights;

    double pace_target_hz = 2.2;       ///< Target bounce cadence
    int streak_cap = 10;               ///< Streak that earns a full streak sub-score

    double venue_area_m2 = 9.0;        ///< Below this the space is room mode
    double min_ceiling_m = 2.2;        ///< Below this the room takes the ceiling penalty
    double overhead_ceiling_m = 2.6;   ///< Needed by patterns with overhead motion

    std::vector<std::string> preferred_patterns;  ///< Ranking order for recommendations

    /// @throws ConfigError on any invalid field
    void validate() const;
};

/**
 * @brief Registry of sport profiles with a generic fallback
 */
class SportCatalog {
public:
    SportCatalog();

    /**
     * @brief Catalog with the built-in sports (basketball, tennis, football,
     * volleyball, badminton)
     */
    static SportCatalog builtin();

    /**
     * @brief Add or replace a profile
     * @throws ConfigError if the profile does not validate
     */
    void add(const SportProfile& profile);

    std::optional<SportProfile> find(const std::string& sport) const;

    /**
     * @brief Profile for sport, or the generic profile renamed to sport
     */
    SportProfile profileFor(const std::string& sport) const;

    bool contains(const std::string& sport) const;
    size_t size() const { return profiles_.size(); }

    /**
     * @brief Merge profiles from a JSON document
     *
     * Accepts either an array of profile objects or {"sports": [...]}. Missing
     * keys keep the built-in/generic defaults for that sport.
     *
     * @return Number of profiles loaded
     * @throws ConfigError on malformed documents or invalid profiles
     */
    int loadFromJson(const nlohmann::json& document);

    /// @throws ConfigError if the file cannot be read or parsed
    int loadFromFile(const std::string& path);

    const SportProfile& fallback() const { return fallback_; }

private:
    std::map<std::string, SportProfile> profiles_;
    SportProfile fallback_;
};

} // namespace training_engine
