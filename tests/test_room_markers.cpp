/**
 * @file test_room_markers.cpp
 * @brief Room analysis, pattern recommendation, marker layouts and sport profiles
 */

#include <training_engine/drill_patterns.hpp>
#include <training_engine/errors.hpp>
#include <training_engine/marker_generator.hpp>
#include <training_engine/room_analyzer.hpp>
#include <training_engine/sport_profile.hpp>
#include <nlohmann/json.hpp>
#include "test_harness.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>

using namespace training_engine;
using json = nlohmann::json;
namespace fs = std::filesystem;

namespace {

Config quietConfig() {
    Config cfg;
    cfg.verbose = false;
    return cfg;
}

PlaneObservation cleanRoom(double w, double h, std::optional<double> ceiling = std::nullopt) {
    PlaneObservation plane;
    plane.width_m = w;
    plane.height_m = h;
    plane.ceiling_height_m = ceiling;
    return plane;
}

bool excludes(const RoomConstraints& room, const std::string& id) {
    for (const auto& ex : room.excluded_patterns) {
        if (ex.pattern_id == id) return true;
    }
    return false;
}

} // anonymous namespace

// ============================================================================
// Room analysis
// ============================================================================

void testBasketballRoomExample() {
    RoomAnalyzer analyzer(quietConfig());
    SportProfile basketball = SportCatalog::builtin().profileFor("basketball");

    RoomConstraints room = analyzer.analyze(cleanRoom(3.0, 2.0, 2.6), basketball);

    test::checkNear(room.area_m2, 6.0, 1e-12, "room.area_m2 ~= 6.0");
    test::checkNear(room.aspect_ratio, 1.5, 1e-12, "room.aspect_ratio ~= 1.5");
    test::check(room.is_room_mode, "room.is_room_mode");
    test::check(room.safety_score == 100.0, "room.safety_score == 100.0");
    test::check(room.recommends("dribble_box"), "room.recommends(\"dribble_box\")");
    test::check(room.recommends("micro_ladder"), "room.recommends(\"micro_ladder\")");
    test::check(!room.recommends("wall_rebound"), "!room.recommends(\"wall_rebound\")");   // needs 2.8 m
    test::check(excludes(room, "wall_rebound"), "excludes(room, \"wall_rebound\")");
    test::check(excludes(room, "zigzag"), "excludes(room, \"zigzag\")");

    // Preferred order first
    std::vector<std::string> expected = {"dribble_box", "micro_ladder", "figure_8", "seated_control"};
    test::check(room.recommended_patterns == expected, "room.recommended_patterns == expected");

    // Every exclusion is explained in the warnings
    test::check(room.safety_warnings.size() == room.excluded_patterns.size(),
                "room.safety_warnings.size() == room.excluded_patterns.size()");
    for (const auto& ex : room.excluded_patterns) {
        test::check(!ex.reason.empty(), "!ex.reason.empty()");
    }
}

void testSafetyPenalties() {
    RoomAnalyzer analyzer(quietConfig());
    SportProfile basketball = SportCatalog::builtin().profileFor("basketball");

    // Strictly decreasing with obstacle count
    double previous = 101.0;
    for (int n = 0; n <= 4; ++n) {
        PlaneObservation plane = cleanRoom(4.0, 4.0, 3.0);
        plane.obstacle_count = n;
        double score = analyzer.safetyScore(plane, basketball);
        test::checkNear(score, 100.0 - 10.0 * n, 1e-12, "score ~= 100.0 - 10.0 * n");
        test::check(score < previous, "score < previous");
        previous = score;
    }

    // Low ceiling penalty only below the sport minimum
    test::check(analyzer.safetyScore(cleanRoom(4.0, 4.0, 2.5), basketball) == 100.0,
                "analyzer.safetyScore(cleanRoom(4.0, 4.0, 2.5), basketball) == 100.0");
    test::check(analyzer.safetyScore(cleanRoom(4.0, 4.0, 2.4), basketball) == 70.0,
                "analyzer.safetyScore(cleanRoom(4.0, 4.0, 2.4), basketball) == 70.0");

    PlaneObservation everything = cleanRoom(4.0, 4.0, 2.0);
    everything.obstacle_count = 2;
    everything.is_flat = false;
    everything.reflective_surfaces = true;
    everything.lighting = LightingCondition::POOR;
    RoomConstraints bad = analyzer.analyze(everything, basketball);
    test::checkNear(bad.safety_score, 5.0, 1e-12, "bad.safety_score ~= 5.0");

    everything.obstacle_count = 3;
    test::check(analyzer.safetyScore(everything, basketball) == 0.0,
                "analyzer.safetyScore(everything, basketball) == 0.0");

    PlaneObservation dim = cleanRoom(4.0, 4.0);
    dim.lighting = LightingCondition::DIM;
    test::check(analyzer.safetyScore(dim, basketball) == 95.0,
                "analyzer.safetyScore(dim, basketball) == 95.0");
}

void testRecommendationRules() {
    RoomAnalyzer analyzer(quietConfig());
    SportProfile basketball = SportCatalog::builtin().profileFor("basketball");

    // Unknown ceiling does not block overhead patterns
    RoomConstraints no_ceiling = analyzer.analyze(cleanRoom(3.0, 2.0), basketball);
    test::check(no_ceiling.recommends("wall_rebound"), "no_ceiling.recommends(\"wall_rebound\")");

    // Venue-only pattern needs venue mode
    RoomConstraints venue = analyzer.analyze(cleanRoom(4.0, 4.0, 3.0), basketball);
    test::check(!venue.is_room_mode, "!venue.is_room_mode");
    test::check(venue.recommends("zigzag"), "venue.recommends(\"zigzag\")");
    test::check(venue.recommended_patterns.size() == drillPatterns().size(),
                "venue.recommended_patterns.size() == drillPatterns().size()");

    SportProfile football = SportCatalog::builtin().profileFor("football");
    RoomConstraints football_room = analyzer.analyze(cleanRoom(4.0, 3.0, 3.0), football);
    test::check(football_room.is_room_mode, "football_room.is_room_mode");                    // 12 < 16
    test::check(!football_room.recommends("zigzag"), "!football_room.recommends(\"zigzag\")");
    test::check(football_room.recommended_patterns.front() == "micro_ladder",
                "football_room.recommended_patterns.front() == \"micro_ladder\"");

    // Tiny space: only the seated drill
    RoomConstraints tiny = analyzer.analyze(cleanRoom(1.3, 1.3, 2.6), basketball);
    test::check(tiny.recommended_patterns.size() == 1, "tiny.recommended_patterns.size() == 1");
    test::check(tiny.recommends("seated_control"), "tiny.recommends(\"seated_control\")");

    // Deterministic
    RoomConstraints again = analyzer.analyze(cleanRoom(3.0, 2.0, 2.6), basketball);
    RoomConstraints once = analyzer.analyze(cleanRoom(3.0, 2.0, 2.6), basketball);
    test::check(again.recommended_patterns == once.recommended_patterns,
                "again.recommended_patterns == once.recommended_patterns");
    test::check(again.safety_warnings == once.safety_warnings,
                "again.safety_warnings == once.safety_warnings");
    test::check(again.safety_score == once.safety_score, "again.safety_score == once.safety_score");
}

void testRoomValidation() {
    RoomAnalyzer analyzer(quietConfig());
    SportProfile profile;

    test::checkThrows<ValidationError>([&] { analyzer.analyze(cleanRoom(0.0, 2.0), profile); },
                "analyzer.analyze(cleanRoom(0.0, 2.0), profile)");
    test::checkThrows<ValidationError>([&] { analyzer.analyze(cleanRoom(3.0, -1.0), profile); },
                "analyzer.analyze(cleanRoom(3.0, -1.0), profile)");
    test::checkThrows<ValidationError>([&] { analyzer.analyze(cleanRoom(3.0, 2.0, 0.0), profile); },
                "analyzer.analyze(cleanRoom(3.0, 2.0, 0.0), profile)");

    PlaneObservation negative = cleanRoom(3.0, 2.0);
    negative.obstacle_count = -1;
    test::checkThrows<ValidationError>([&] { analyzer.analyze(negative, profile); },
                "analyzer.analyze(negative, profile)");
}

void testNarrowRoomsRecommendNothing() {
    RoomAnalyzer analyzer(quietConfig());
    SportProfile basketball = SportCatalog::builtin().profileFor("basketball");

    // 5.5 m2 is enough area for most patterns, but 0.55 m leaves no room inside the margins
    RoomConstraints corridor = analyzer.analyze(cleanRoom(10.0, 0.55), basketball);
    test::check(corridor.recommended_patterns.empty(), "corridor recommends nothing");
    test::check(corridor.excluded_patterns.size() == drillPatterns().size(), "every pattern excluded");
    test::check(excludes(corridor, "dribble_box"), "dribble_box excluded");
    bool explained = false;
    for (const auto& ex : corridor.excluded_patterns) {
        if (ex.pattern_id == "seated_control") {
            explained = ex.reason.find("narrower than 2 x 0.30 m safety margin") != std::string::npos;
        }
    }
    test::check(explained, "narrow exclusion names the safety margin");

    // Exactly twice the margin is still too narrow
    RoomConstraints edge = analyzer.analyze(cleanRoom(0.6, 8.0), basketball);
    test::check(edge.recommended_patterns.empty(), "0.6 m side recommends nothing");
}

void testRecommendedPatternsAlwaysGenerate() {
    Config cfg = quietConfig();
    RoomAnalyzer analyzer(cfg);
    MarkerGenerator generator(cfg);
    SportCatalog catalog = SportCatalog::builtin();

    const double sides[] = {0.5, 0.55, 0.6, 0.61, 0.7, 1.0, 1.3, 1.6, 2.0, 3.0, 4.5, 10.0};
    const std::optional<double> ceilings[] = {std::nullopt, 2.4, 3.0};
    const char* sports[] = {"basketball", "football", "volleyball"};

    int generated = 0;
    for (const char* sport : sports) {
        SportProfile profile = catalog.profileFor(sport);
        for (double w : sides) {
            for (double h : sides) {
                for (const auto& ceiling : ceilings) {
                    RoomConstraints room = analyzer.analyze(cleanRoom(w, h, ceiling), profile);
                    for (const auto& id : room.recommended_patterns) {
                        MarkerSet set = generator.generate(
                            id, UsableArea{w, h},
                            200.0 * room.adaptations.tolerance_multiplier,
                            room.adaptations.reduced_target_count);
                        test::check(!set.markers.empty(), "recommended pattern has markers");
                        generated++;
                    }
                }
            }
        }
    }
    std::cout << "  " << generated << " recommended layouts generated\n";
    test::check(generated > 100, "generated > 100");
}

void testConfinedRoomAdaptations() {
    RoomAnalyzer analyzer(quietConfig());
    SportProfile basketball = SportCatalog::builtin().profileFor("basketball");

    // 3.24 m2 with a 2.6 m ceiling
    RoomConstraints confined = analyzer.analyze(cleanRoom(1.8, 1.8, 2.6), basketball);
    test::checkNear(confined.adaptations.tolerance_multiplier, 1.5, 1e-12, "confined tolerance x1.5");
    test::check(confined.adaptations.reduced_target_count, "confined room thins the targets");
    test::check(confined.adaptations.no_overhead_movements, "2.6 m ceiling blocks overhead movement");
    test::check(std::find(confined.safety_warnings.begin(), confined.safety_warnings.end(),
                          "Very confined space - reduced movement patterns only") !=
                confined.safety_warnings.end(),
                "confined room warns");
    test::check(!confined.recommends("wall_rebound"), "no overhead pattern in a low room");

    RoomConstraints living = analyzer.analyze(cleanRoom(3.0, 2.0, 2.6), basketball);
    test::checkNear(living.adaptations.tolerance_multiplier, 1.0, 1e-12, "6 m2 keeps the tolerance");
    test::check(!living.adaptations.reduced_target_count, "6 m2 keeps every target");
    test::check(living.adaptations.no_overhead_movements, "living room ceiling below 2.8 m");

    RoomConstraints unknown = analyzer.analyze(cleanRoom(1.8, 1.8), basketball);
    test::check(!unknown.adaptations.no_overhead_movements, "unknown ceiling allows overhead");

    // Exactly 4 m2 is not confined
    RoomConstraints square = analyzer.analyze(cleanRoom(2.0, 2.0, 3.0), basketball);
    test::check(!square.adaptations.reduced_target_count, "4 m2 is not confined");

    Config bad = quietConfig();
    bad.confined_tolerance_multiplier = 0.5;
    test::checkThrows<ConfigError>([&] { RoomAnalyzer tight(bad); }, "multiplier below 1");
}

// ============================================================================
// Markers
// ============================================================================

void testMarkerContainment() {
    MarkerGenerator generator(quietConfig());
    const double margin = generator.safetyMargin();
    const double sizes[] = {0.7, 0.8, 1.0, 1.3, 1.6, 2.0, 2.5, 3.0, 4.5, 6.0, 9.0, 15.0};

    int layouts = 0;
    for (const auto& pattern : drillPatterns()) {
        for (double w : sizes) {
            for (double h : sizes) {
                UsableArea area{w, h};
                if (area.area() < pattern.min_area_m2) {
                    test::checkThrows<ValidationError>([&] { generator.generate(pattern.id, area); },
                                "generator.generate(pattern.id, area)");
                    continue;
                }

                MarkerSet set = generator.generate(pattern.id, area);
                test::check(static_cast<int>(set.markers.size()) == pattern.marker_count,
                            "static_cast<int>(set.markers.size()) == pattern.marker_count");
                for (const auto& m : set.markers) {
                    bool inside = m.position_m.x() > margin && m.position_m.x() < w - margin &&
                                  m.position_m.y() > margin && m.position_m.y() < h - margin;
                    if (!inside) {
                        test::check(inside, "inside");
                        return;
                    }
                    test::checkNear(m.normalized.x(), m.position_m.x() / w, 1e-12,
                                "m.normalized.x() ~= m.position_m.x() / w");
                    test::checkNear(m.normalized.y(), m.position_m.y() / h, 1e-12,
                                "m.normalized.y() ~= m.position_m.y() / h");
                }
                layouts++;
            }
        }
    }
    std::cout << "  " << layouts << " layouts checked\n";
    test::check(layouts > 100, "layouts > 100");
}

void testMarkerLayouts() {
    MarkerGenerator generator(quietConfig());

    // Full-size template is never enlarged
    MarkerSet box = generator.generate("dribble_box", UsableArea{10.0, 10.0}, 100.0);
    test::checkNear(box.footprintArea(), 4.0, 1e-9, "box.footprintArea() ~= 4.0");
    test::check(box.markers[8].position_m.isApprox(Eigen::Vector2d(5.0, 5.0)),
                "box.markers[8].position_m.isApprox(Eigen::Vector2d(5.0, 5.0))");
    test::check(box.markers[0].id == "dribble_box_0", "box.markers[0].id == \"dribble_box_0\"");
    test::check(box.markers[0].tolerance_radius_mm == 100.0,
                "box.markers[0].tolerance_radius_mm == 100.0");

    // Shrunk into a small room
    MarkerSet small = generator.generate("dribble_box", UsableArea{2.0, 2.0});
    test::check(small.footprintArea() < 4.0, "small.footprintArea() < 4.0");

    // Ladder follows the long side
    MarkerSet wide = generator.generate("micro_ladder", UsableArea{3.0, 1.2});
    MarkerSet tall = generator.generate("micro_ladder", UsableArea{1.2, 3.0});
    auto extent = [](const MarkerSet& s) {
        Eigen::Vector2d lo = s.markers[0].position_m, hi = lo;
        for (const auto& m : s.markers) {
            lo = lo.cwiseMin(m.position_m);
            hi = hi.cwiseMax(m.position_m);
        }
        return Eigen::Vector2d(hi - lo);
    };
    test::check(extent(wide).x() > extent(wide).y(), "extent(wide).x() > extent(wide).y()");
    test::check(extent(tall).y() > extent(tall).x(), "extent(tall).y() > extent(tall).x()");

    // Same input, same layout
    MarkerSet a = generator.generate("figure_8", UsableArea{3.0, 2.0});
    MarkerSet b = generator.generate("figure_8", UsableArea{3.0, 2.0});
    for (size_t i = 0; i < a.markers.size(); ++i) {
        test::check(a.markers[i].position_m == b.markers[i].position_m,
                    "a.markers[i].position_m == b.markers[i].position_m");
    }

    // Canvas mapping (y flipped)
    std::vector<cv::Point2f> px = box.toCanvas(cv::Size(640, 480));
    test::check(px.size() == box.markers.size(), "px.size() == box.markers.size()");
    test::checkNear(px[8].x, 320.0f, 1e-3f, "px[8].x ~= 320.0f");
    test::checkNear(px[8].y, 240.0f, 1e-3f, "px[8].y ~= 240.0f");
    test::check(px[0].y > px[6].y, "px[0].y > px[6].y");   // bottom-left corner sits lower on screen than top-left
}

void testReducedTargetCount() {
    MarkerGenerator generator(quietConfig());
    const UsableArea area{1.8, 1.8};

    for (const char* id : {"figure_8", "micro_ladder", "seated_control"}) {
        MarkerSet full = generator.generate(id, area, 300.0);
        MarkerSet reduced = generator.generate(id, area, 300.0, true);

        test::check(reduced.reduced_target_count, "reduced layout is flagged");
        test::check(static_cast<int>(reduced.markers.size()) ==
                        MarkerGenerator::reducedCount(static_cast<int>(full.markers.size())),
                    "every other target kept");
        for (size_t k = 0; k < reduced.markers.size(); ++k) {
            test::check(reduced.markers[k].position_m.isApprox(full.markers[2 * k].position_m),
                        "reduced target sits on the full layout");
            test::check(reduced.markers[k].index == static_cast<int>(k), "reduced indices are dense");
            test::check(reduced.markers[k].tolerance_radius_mm == 300.0, "radius carried over");
        }
    }
    test::check(MarkerGenerator::reducedCount(11) == 6, "11 targets thin to 6");
    test::check(MarkerGenerator::reducedCount(12) == 6, "12 targets thin to 6");
}

void testMarkerRejections() {
    MarkerGenerator generator(quietConfig());

    test::checkThrows<ValidationError>([&] { generator.generate("hopscotch", UsableArea{5.0, 5.0}); },
                "generator.generate(\"hopscotch\", UsableArea{5.0, 5.0})");
    test::checkThrows<ValidationError>([&] { generator.generate("dribble_box", UsableArea{1.5, 1.5}); },
                "generator.generate(\"dribble_box\", UsableArea{1.5, 1.5})");
    test::checkThrows<ValidationError>([&] { generator.generate("dribble_box", UsableArea{20.0, 0.5}); },
                "generator.generate(\"dribble_box\", UsableArea{20.0, 0.5})");
    test::checkThrows<ValidationError>([&] { generator.generate("dribble_box", UsableArea{5.0, 5.0}, 0.0); },
                "generator.generate(\"dribble_box\", UsableArea{5.0, 5.0}, 0.0)");
    test::checkThrows<ValidationError>([&] { MarkerGenerator::patternTemplate("hopscotch"); },
                "MarkerGenerator::patternTemplate(\"hopscotch\")");
}

// ============================================================================
// Sport profiles
// ============================================================================

void testSportCatalog() {
    SportCatalog catalog = SportCatalog::builtin();
    test::check(catalog.size() == 5, "catalog.size() == 5");
    test::check(catalog.contains("volleyball"), "catalog.contains(\"volleyball\")");

    SportProfile curling = catalog.profileFor("curling");
    test::check(curling.sport == "curling", "curling.sport == \"curling\"");
    test::check(curling.venue_area_m2 == 9.0, "curling.venue_area_m2 == 9.0");
    test::check(!catalog.find("curling").has_value(), "!catalog.find(\"curling\").has_value()");

    // Partial override keeps the built-in values
    int n = catalog.loadFromJson(json::parse(R"([{"sport": "basketball", "pace_target_hz": 2.5}])"));
    test::check(n == 1, "n == 1");
    SportProfile basketball = catalog.profileFor("basketball");
    test::check(basketball.pace_target_hz == 2.5, "basketball.pace_target_hz == 2.5");
    test::check(basketball.overhead_ceiling_m == 2.8, "basketball.overhead_ceiling_m == 2.8");

    // Wrapped form adds new sports
    n = catalog.loadFromJson(json::parse(R"({"sports": [{
        "sport": "squash",
        "tolerance_mm": {"easy": 250, "medium": 180, "hard": 90, "expert": 40},
        "weights": {"precision": 70, "pace": 20, "streak": 10},
        "preferred_patterns": ["wall_rebound"]
    }]})"));
    test::check(n == 1, "n == 1");
    test::check(catalog.size() == 6, "catalog.size() == 6");
    test::check(catalog.profileFor("squash").tolerances.expert_mm == 40.0,
                "catalog.profileFor(\"squash\").tolerances.expert_mm == 40.0");

    // Invalid documents leave the catalog untouched
    test::checkThrows<ConfigError>([&] { catalog.loadFromJson(json::parse(
        R"([{"sport": "golf"}, {"sport": "polo", "weights": {"precision": 90}}])")); },
        "weights not summing to 100");
    test::check(!catalog.contains("golf"), "!catalog.contains(\"golf\")");
    test::checkThrows<ConfigError>([&] { catalog.loadFromJson(json::parse(
        R"([{"sport": "golf", "pace_target_hz": "fast"}])")); },
        "non-numeric pace target");
    test::checkThrows<ConfigError>([&] { catalog.loadFromJson(json::parse(
        R"([{"sport": "golf", "preferred_patterns": ["hopscotch"]}])")); },
        "unknown preferred pattern");
    test::checkThrows<ConfigError>([&] { catalog.loadFromJson(json::parse(R"({"profiles": []})")); },
                "catalog.loadFromJson(json::parse(R\"({\"profiles\": []})\"))");
    test::check(catalog.size() == 6, "catalog.size() == 6");
}

void testSportCatalogFile() {
    fs::path path = fs::temp_directory_path() / "training_engine_profiles_test.json";
    {
        std::ofstream out(path);
        out << R"({"sports": [{"sport": "handball", "venue_area_m2": 20.0}]})";
    }

    SportCatalog catalog;
    test::check(catalog.loadFromFile(path.string()) == 1,
                "catalog.loadFromFile(path.string()) == 1");
    test::check(catalog.profileFor("handball").venue_area_m2 == 20.0,
                "catalog.profileFor(\"handball\").venue_area_m2 == 20.0");
    fs::remove(path);

    test::checkThrows<ConfigError>([&] { catalog.loadFromFile((fs::temp_directory_path() / "missing_profiles.json").string()); },
                "catalog.loadFromFile((fs::temp_directory_path() / \"missing_profiles.json\").string())");
}

int main() {
    test::run("Basketball room example (3 x 2 m, 2.6 m ceiling)", testBasketballRoomExample);
    test::run("Safety score penalties", testSafetyPenalties);
    test::run("Pattern recommendation rules", testRecommendationRules);
    test::run("Room input validation", testRoomValidation);
    test::run("Narrow rooms recommend nothing", testNarrowRoomsRecommendNothing);
    test::run("Recommended patterns always generate", testRecommendedPatternsAlwaysGenerate);
    test::run("Confined room adaptations", testConfinedRoomAdaptations);
    test::run("Marker containment for every pattern", testMarkerContainment);
    test::run("Marker layouts", testMarkerLayouts);
    test::run("Reduced target count", testReducedTargetCount);
    test::run("Marker rejections", testMarkerRejections);
    test::run("Sport catalog and JSON profiles", testSportCatalog);
    test::run("Sport profile file loading", testSportCatalogFile);
    return test::summary("test_room_markers");
}
