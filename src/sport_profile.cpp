/**
 * @file sport_profile.cpp
 * @brief Sport profiles, validation and JSON loading
 */

#include "training_engine/sport_profile.hpp"
#include "training_engine/drill_patterns.hpp"
#include "training_engine/errors.hpp"
#include <nlohmann/json.hpp>
#include <cmath>
#include <fstream>
#include <iostream>

namespace training_engine {

using json = nlohmann::json;

// ============================================================================
// ToleranceTable / ScoreWeights / SportProfile
// ============================================================================

double ToleranceTable::radiusFor(Difficulty difficulty) const {
    switch (difficulty) {
        case Difficulty::EASY:   return easy_mm;
        case Difficulty::MEDIUM: return medium_mm;
        case Difficulty::HARD:   return hard_mm;
        case Difficulty::EXPERT: return expert_mm;
    }
    return medium_mm;
}

void ToleranceTable::validate() const {
    if (!(expert_mm > 0.0)) {
        throw ConfigError("Tolerance radii must be positive");
    }
    if (!(easy_mm > medium_mm && medium_mm > hard_mm && hard_mm > expert_mm)) {
        throw ConfigError("Tolerance radii must strictly decrease easy > medium > hard > expert");
    }
}

void ScoreWeights::validate() const {
    if (precision < 0.0 || pace < 0.0 || streak < 0.0) {
        throw ConfigError("Score weights must be non-negative");
    }
    double sum = precision + pace + streak;
    if (std::abs(sum - 100.0) > 1e-6) {
        throw ConfigError("Score weights must sum to 100 (got " + std::to_string(sum) + ")");
    }
}

void SportProfile::validate() const {
    if (sport.empty()) {
        throw ConfigError("Sport profile needs a name");
    }
    tolerances.validate();
    weights.validate();
    if (!(pace_target_hz > 0.0)) {
        throw ConfigError(sport + ": pace_target_hz must be positive");
    }
    if (streak_cap < 1) {
        throw ConfigError(sport + ": streak_cap must be >= 1");
    }
    if (!(venue_area_m2 > 0.0)) {
        throw ConfigError(sport + ": venue_area_m2 must be positive");
    }
    if (!(min_ceiling_m > 0.0) || !(overhead_ceiling_m > 0.0)) {
        throw ConfigError(sport + ": ceiling heights must be positive");
    }
    for (const auto& id : preferred_patterns) {
        if (!findDrillPattern(id)) {
            throw ConfigError(sport + ": unknown preferred pattern '" + id + "'");
        }
    }
}

// ============================================================================
// SportCatalog
// ============================================================================

SportCatalog::SportCatalog() {
    fallback_.sport = "default";
}

SportCatalog SportCatalog::builtin() {
    SportCatalog catalog;

    SportProfile basketball;
    basketball.sport = "basketball";
    basketball.pace_target_hz = 2.2;
    basketball.venue_area_m2 = 9.0;
    basketball.min_ceiling_m = 2.5;
    basketball.overhead_ceiling_m = 2.8;
    basketball.preferred_patterns = {"dribble_box", "micro_ladder", "figure_8", "seated_control"};
    catalog.add(basketball);

    SportProfile tennis;
    tennis.sport = "tennis";
    tennis.tolerances = {400.0, 250.0, 150.0, 75.0};
    tennis.weights = {50.0, 30.0, 20.0};
    tennis.pace_target_hz = 1.0;
    tennis.venue_area_m2 = 12.0;
    tennis.min_ceiling_m = 2.4;
    tennis.overhead_ceiling_m = 3.0;
    tennis.preferred_patterns = {"wall_rebound", "micro_ladder", "figure_8"};
    catalog.add(tennis);

    SportProfile football;
    football.sport = "football";
    football.tolerances = {500.0, 350.0, 200.0, 100.0};
    football.weights = {50.0, 35.0, 15.0};
    football.pace_target_hz = 1.5;
    football.venue_area_m2 = 16.0;
    football.min_ceiling_m = 2.2;
    football.overhead_ceiling_m = 2.6;
    football.preferred_patterns = {"micro_ladder", "zigzag", "figure_8", "dribble_box"};
    catalog.add(football);

    SportProfile volleyball;
    volleyball.sport = "volleyball";
    volleyball.tolerances = {350.0, 250.0, 150.0, 75.0};
    volleyball.pace_target_hz = 1.2;
    volleyball.venue_area_m2 = 12.0;
    volleyball.min_ceiling_m = 2.6;
    volleyball.overhead_ceiling_m = 3.0;
    volleyball.preferred_patterns = {"wall_rebound", "seated_control"};
    catalog.add(volleyball);

    SportProfile badminton;
    badminton.sport = "badminton";
    badminton.tolerances = {300.0, 200.0, 120.0, 60.0};
    badminton.weights = {55.0, 30.0, 15.0};
    badminton.pace_target_hz = 1.5;
    badminton.venue_area_m2 = 10.0;
    badminton.min_ceiling_m = 2.5;
    badminton.overhead_ceiling_m = 3.0;
    badminton.preferred_patterns = {"wall_rebound", "micro_ladder"};
    catalog.add(badminton);

    return catalog;
}

void SportCatalog::add(const SportProfile& profile) {
    profile.validate();
    profiles_[profile.sport] = profile;
}

std::optional<SportProfile> SportCatalog::find(const std::string& sport) const {
    auto it = profiles_.find(sport);
    if (it == profiles_.end()) {
        return std::nullopt;
    }
    return it->second;
}

SportProfile SportCatalog::profileFor(const std::string& sport) const {
    if (auto profile = find(sport)) {
        return *profile;
    }
    SportProfile generic = fallback_;
    generic.sport = sport;
    return generic;
}

bool SportCatalog::contains(const std::string& sport) const {
    return profiles_.count(sport) > 0;
}

namespace {

template <typename T>
void readIfPresent(const json& j, const char* key, T& out) {
    auto it = j.find(key);
    if (it != j.end() && !it->is_null()) {
        out = it->get<T>();
    }
}

SportProfile profileFromJson(const json& j, const SportCatalog& base) {
    if (!j.is_object()) {
        throw ConfigError("Sport profile must be a JSON object");
    }
    if (!j.contains("sport") || !j["sport"].is_string()) {
        throw ConfigError("Sport profile needs a string 'sport' key");
    }

    SportProfile profile = base.profileFor(j["sport"].get<std::string>());

    if (j.contains("tolerance_mm")) {
        const auto& t = j["tolerance_mm"];
        readIfPresent(t, "easy", profile.tolerances.easy_mm);
        readIfPresent(t, "medium", profile.tolerances.medium_mm);
        readIfPresent(t, "hard", profile.tolerances.hard_mm);
        readIfPresent(t, "expert", profile.tolerances.expert_mm);
    }
    if (j.contains("weights")) {
        const auto& w = j["weights"];
        readIfPresent(w, "precision", profile.weights.precision);
        readIfPresent(w, "pace", profile.weights.pace);
        readIfPresent(w, "streak", profile.weights.streak);
    }
    readIfPresent(j, "pace_target_hz", profile.pace_target_hz);
    readIfPresent(j, "streak_cap", profile.streak_cap);
    readIfPresent(j, "venue_area_m2", profile.venue_area_m2);
    readIfPresent(j, "min_ceiling_m", profile.min_ceiling_m);
    readIfPresent(j, "overhead_ceiling_m", profile.overhead_ceiling_m);
    readIfPresent(j, "preferred_patterns", profile.preferred_patterns);

    return profile;
}

} // anonymous namespace

int SportCatalog::loadFromJson(const json& document) {
    const json* list = &document;
    if (document.is_object()) {
        if (!document.contains("sports")) {
            throw ConfigError("Profile document needs a 'sports' array");
        }
        list = &document["sports"];
    }
    if (!list->is_array()) {
        throw ConfigError("Profile document must be an array of sport profiles");
    }

    // Parse and validate everything before touching the catalog
    std::vector<SportProfile> loaded;
    try {
        for (const auto& entry : *list) {
            SportProfile profile = profileFromJson(entry, *this);
            profile.validate();
            loaded.push_back(profile);
        }
    } catch (const json::exception& e) {
        throw ConfigError(std::string("Malformed sport profile: ") + e.what());
    }

    for (const auto& profile : loaded) {
        profiles_[profile.sport] = profile;
    }
    return static_cast<int>(loaded.size());
}

int SportCatalog::loadFromFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw ConfigError("Cannot open sport profile file: " + path);
    }

    json document;
    try {
        file >> document;
    } catch (const json::parse_error& e) {
        throw ConfigError("Cannot parse " + path + ": " + e.what());
    }

    int count = loadFromJson(document);
    std::cout << "[SportCatalog] Loaded " << count << " profile(s) from " << path << "\n";
    return count;
}

} // namespace training_engine
