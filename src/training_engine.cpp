/**
 * @file training_engine.cpp
 * @brief Implementation of the TrainingEngine facade
 */

#include "training_engine/training_engine.hpp"
#include "training_engine/bounce_validator.hpp"
#include "training_engine/drill_patterns.hpp"
#include "training_engine/errors.hpp"
#include "training_engine/marker_generator.hpp"
#include "training_engine/pose_safety_monitor.hpp"
#include "training_engine/room_analyzer.hpp"
#include "training_engine/scoring_engine.hpp"
#include "training_engine/session_state_machine.hpp"
#include "training_engine/sync_reconciler.hpp"
#include <algorithm>
#include <chrono>
#include <iostream>

namespace training_engine {

namespace {

TimestampMs nowMs() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

} // anonymous namespace

TrainingEngine::TrainingEngine(
    std::shared_ptr<SessionRepository> repository,
    SportCatalog catalog,
    const Config& config
) : repository_(std::move(repository)),
    catalog_(std::move(catalog)),
    cfg_(config) {

    if (!repository_) {
        throw std::invalid_argument("TrainingEngine needs a session repository");
    }

    validator_ = std::make_unique<BounceValidator>(cfg_);
    room_analyzer_ = std::make_unique<RoomAnalyzer>(cfg_);
    marker_generator_ = std::make_unique<MarkerGenerator>(cfg_);
    pose_monitor_ = std::make_unique<PoseSafetyMonitor>(cfg_);

    log("Ready with " + std::to_string(catalog_.size()) + " sport profile(s)");
}

TrainingEngine::~TrainingEngine() = default;

// =============================================================================
// INTERNAL
// =============================================================================

void TrainingEngine::pruneLocks() const {
    for (auto it = session_locks_.begin(); it != session_locks_.end();) {
        if (it->second.expired()) {
            it = session_locks_.erase(it);
        } else {
            ++it;
        }
    }
}

std::shared_ptr<std::mutex> TrainingEngine::sessionLock(SessionId session_id) const {
    std::lock_guard<std::mutex> lock(locks_mutex_);

    // Entries live only while some caller holds the mutex
    pruneLocks();

    auto& slot = session_locks_[session_id];
    std::shared_ptr<std::mutex> m = slot.lock();
    if (!m) {
        m = std::make_shared<std::mutex>();
        slot = m;
    }
    return m;
}

TrainingSession TrainingEngine::loadOrThrow(SessionId session_id) const {
    auto session = repository_->load(session_id);
    if (!session) {
        throw SessionNotFound(session_id);
    }
    return *session;
}

void TrainingEngine::recomputeScores(TrainingSession& session, const std::vector<BounceEvent>& events) const {
    ScoringEngine scoring(catalog_.profileFor(session.sport));
    for (const auto& e : events) {
        scoring.addEvent(e);
    }
    scoring.applyTo(session);
}

SafetyIncident TrainingEngine::appendIncident(
    TrainingSession& session,
    SafetyIncident incident,
    TimestampMs now_ms
) {
    incident.session_id = session.id;
    if (!incident.drill_pattern) {
        incident.drill_pattern = session.drill_pattern_id;
    }

    if (incident.severity == Severity::CRITICAL && !incident.session_paused) {
        if (session.status == SessionStatus::ACTIVE) {
            SessionStateMachine::apply(
                session, SessionTrigger::SAFETY_PAUSE, now_ms,
                "critical " + toString(incident.type) + " incident"
            );
            incident.session_paused = true;
            {
                std::lock_guard<std::mutex> lock(stats_mutex_);
                safety_pauses_++;
            }
            log("Session " + std::to_string(session.id) + " paused: critical " +
                toString(incident.type) + " incident");
        }
        // An already paused session is left as is; the flag stays false
    }

    session.safety_log.push_back(incident);
    return incident;
}

double TrainingEngine::toleranceRadius(const TrainingSession& session) const {
    double radius = catalog_.profileFor(session.sport).tolerances.radiusFor(session.difficulty);
    if (session.room) {
        radius *= session.room->adaptations.tolerance_multiplier;
    }
    return radius;
}

void TrainingEngine::log(const std::string& message) const {
    if (cfg_.verbose) {
        std::cout << "[TrainingEngine] " << message << "\n";
    }
}

// =============================================================================
// SESSION LIFECYCLE
// =============================================================================

TrainingSession TrainingEngine::createSession(
    UserId user_id,
    const std::string& sport,
    const std::string& drill_pattern_id,
    Difficulty difficulty,
    DevicePlatform platform
) {
    if (user_id <= 0) {
        throw ValidationError("user_id must be positive");
    }
    if (sport.empty()) {
        throw ValidationError("sport must not be empty");
    }
    if (!findDrillPattern(drill_pattern_id)) {
        throw ValidationError("Unknown drill pattern: '" + drill_pattern_id + "'");
    }

    TrainingSession session;
    session.id = repository_->nextSessionId();
    session.user_id = user_id;
    session.sport = sport;
    session.drill_pattern_id = drill_pattern_id;
    session.difficulty = difficulty;
    session.device_platform = platform;
    session.status = SessionStatus::ACTIVE;
    session.created_at_ms = nowMs();

    auto lock_ptr = sessionLock(session.id);
    std::lock_guard<std::mutex> lock(*lock_ptr);
    repository_->save(session);

    log("Created session " + std::to_string(session.id) + " (" + sport + ", " +
        drill_pattern_id + ", " + toString(difficulty) + ", " + toString(platform) + ")");
    return session;
}

TrainingSession TrainingEngine::transitionSession(
    SessionId session_id,
    SessionTrigger trigger,
    const std::string& reason
) {
    auto lock_ptr = sessionLock(session_id);
    std::lock_guard<std::mutex> lock(*lock_ptr);

    TrainingSession updated = loadOrThrow(session_id);
    SessionStatus from = updated.status;

    SessionStateMachine::apply(updated, trigger, nowMs(), reason);

    if (updated.status == SessionStatus::COMPLETED) {
        // Final recomputation from the persisted audit trail
        recomputeScores(updated, repository_->bounceEvents(session_id));
    }

    repository_->save(updated);

    if (isTerminal(updated.status)) {
        std::lock_guard<std::mutex> poses_lock(poses_mutex_);
        last_poses_.erase(session_id);
    }

    log("Session " + std::to_string(session_id) + ": " + toString(from) + " -> " +
        toString(updated.status) + " (" + toString(trigger) + ")");
    return updated;
}

TrainingSession TrainingEngine::getSession(SessionId session_id) const {
    return loadOrThrow(session_id);
}

// =============================================================================
// EVENTS
// =============================================================================

BounceEvent TrainingEngine::recordBounceEvent(SessionId session_id, const ImpactData& impact) {
    auto lock_ptr = sessionLock(session_id);
    std::lock_guard<std::mutex> lock(*lock_ptr);

    TrainingSession updated = loadOrThrow(session_id);
    SessionStateMachine::ensureWritable(updated, "recordBounceEvent");
    if (updated.status == SessionStatus::PAUSED) {
        throw IllegalTransitionError(
            updated.status,
            "recordBounceEvent rejected: session " + std::to_string(session_id) + " is paused"
        );
    }

    ImpactData resolved = impact;
    if (!resolved.court_position && updated.calibration) {
        resolved.court_position = updated.calibration->worldToCourt(resolved.world_position);
    }

    double radius = toleranceRadius(updated);

    BounceEvent event;
    try {
        event = validator_->validate(session_id, resolved, radius);
    } catch (const ValidationError& e) {
        {
            std::lock_guard<std::mutex> stats_lock(stats_mutex_);
            bounces_rejected_++;
        }
        std::cerr << "[TrainingEngine] Rejected bounce for session " << session_id
                  << ": " << e.what() << "\n";
        throw;
    }

    std::vector<BounceEvent> events = repository_->bounceEvents(session_id);
    events.push_back(event);
    recomputeScores(updated, events);

    repository_->saveWithBounceEvent(updated, event);

    std::lock_guard<std::mutex> stats_lock(stats_mutex_);
    bounces_recorded_++;
    return event;
}

std::vector<BounceEvent> TrainingEngine::bounceEvents(SessionId session_id) const {
    loadOrThrow(session_id);
    return repository_->bounceEvents(session_id);
}

CourtCalibration TrainingEngine::calibrateCourt(
    SessionId session_id,
    const Eigen::Vector3d& baseline_a,
    const Eigen::Vector3d& baseline_b,
    const Eigen::Vector3d& up
) {
    auto lock_ptr = sessionLock(session_id);
    std::lock_guard<std::mutex> lock(*lock_ptr);

    TrainingSession updated = loadOrThrow(session_id);
    SessionStateMachine::ensureWritable(updated, "calibrateCourt");

    bool room_mode = updated.room && updated.room->is_room_mode;
    CourtCalibration calib = CourtCalibration::fromBaseline(baseline_a, baseline_b, up, room_mode);
    updated.calibration = calib;

    repository_->save(updated);

    log("Session " + std::to_string(session_id) + " calibrated: baseline " +
        std::to_string(calib.baseline_distance_m) + " m, scale " +
        std::to_string(calib.scale_factor));
    return calib;
}

// =============================================================================
// ROOM & SAFETY
// =============================================================================

RoomConstraints TrainingEngine::analyzeRoom(SessionId session_id, const PlaneObservation& plane) {
    auto lock_ptr = sessionLock(session_id);
    std::lock_guard<std::mutex> lock(*lock_ptr);

    TrainingSession updated = loadOrThrow(session_id);
    SessionStateMachine::ensureWritable(updated, "analyzeRoom");

    RoomConstraints room = room_analyzer_->analyze(plane, catalog_.profileFor(updated.sport));
    updated.room = room;

    repository_->saveWithRoomSnapshot(updated, room);

    if (!room.recommends(updated.drill_pattern_id)) {
        log("Session " + std::to_string(session_id) + ": pattern '" +
            updated.drill_pattern_id + "' is not recommended for this room");
    }
    return room;
}

MarkerSet TrainingEngine::generateMarkers(const std::string& pattern_id, const UsableArea& area) const {
    return marker_generator_->generate(pattern_id, area, catalog_.fallback().tolerances.medium_mm);
}

MarkerSet TrainingEngine::generateMarkers(SessionId session_id) const {
    TrainingSession session = loadOrThrow(session_id);
    if (!session.room) {
        throw ValidationError(
            "Session " + std::to_string(session_id) + " has no analysed room"
        );
    }

    UsableArea area{session.room->width_m, session.room->height_m};
    return marker_generator_->generate(session.drill_pattern_id, area, toleranceRadius(session),
                                       session.room->adaptations.reduced_target_count);
}

SafetyEvaluation TrainingEngine::evaluatePoseSafety(SessionId session_id, const PoseSnapshot& pose) {
    auto lock_ptr = sessionLock(session_id);
    std::lock_guard<std::mutex> lock(*lock_ptr);

    TrainingSession updated = loadOrThrow(session_id);
    if (!updated.room) {
        // Nothing to check against yet
        return SafetyEvaluation{};
    }

    std::optional<PoseSnapshot> previous;
    {
        std::lock_guard<std::mutex> poses_lock(poses_mutex_);
        auto it = last_poses_.find(session_id);
        if (it != last_poses_.end()) {
            previous = it->second;
        }
        last_poses_[session_id] = pose;
    }

    SafetyEvaluation eval = pose_monitor_->evaluate(
        session_id, pose, *updated.room, previous ? &*previous : nullptr);
    if (eval.incidents.empty()) {
        return eval;
    }

    TimestampMs now = nowMs();
    for (auto& incident : eval.incidents) {
        incident = appendIncident(updated, incident, now);
    }

    repository_->save(updated);
    return eval;
}

SafetyIncident TrainingEngine::logSafetyIncident(SessionId session_id, const SafetyIncident& incident) {
    if (incident.message.empty()) {
        throw ValidationError("Safety incident needs a message");
    }

    auto lock_ptr = sessionLock(session_id);
    std::lock_guard<std::mutex> lock(*lock_ptr);

    TrainingSession updated = loadOrThrow(session_id);
    SafetyIncident stored = appendIncident(updated, incident, nowMs());

    repository_->save(updated);

    log("Session " + std::to_string(session_id) + ": " + toString(stored.severity) + " " +
        toString(stored.type) + " incident logged");
    return stored;
}

// =============================================================================
// CROSS-PLATFORM SYNC
// =============================================================================

TrainingSession TrainingEngine::syncSession(SessionId session_id, const SyncPayload& payload) {
    auto lock_ptr = sessionLock(session_id);
    std::lock_guard<std::mutex> lock(*lock_ptr);

    auto loaded = repository_->load(session_id);
    if (!loaded) {
        throw SyncConflict("Sync rejected: session " + std::to_string(session_id) + " does not exist");
    }

    TrainingSession updated = *loaded;
    SyncReconciler::merge(updated, payload);

    repository_->save(updated);

    std::lock_guard<std::mutex> stats_lock(stats_mutex_);
    syncs_applied_++;
    return updated;
}

SyncStatus TrainingEngine::syncStatus(SessionId session_id) const {
    SyncStatus status;
    status.session = loadOrThrow(session_id);
    status.bounce_events = repository_->bounceEvents(session_id).size();
    status.room_snapshots = repository_->roomSnapshotCount(session_id);
    status.safety_incidents = status.session.safety_log.size();
    status.last_platform = status.session.quality.last_platform;
    return status;
}

// =============================================================================
// ROLLUPS & STATUS
// =============================================================================

PerformanceMetric TrainingEngine::buildPerformanceMetric(SessionId session_id) {
    auto lock_ptr = sessionLock(session_id);
    std::lock_guard<std::mutex> lock(*lock_ptr);

    TrainingSession session = loadOrThrow(session_id);

    PerformanceMetric metric;
    metric.session_id = session.id;
    metric.user_id = session.user_id;
    metric.sport = session.sport;
    metric.movement_efficiency = session.accuracy;

    if (session.room) {
        const auto& room = *session.room;
        metric.adaptation_score =
            100.0 * room.recommended_patterns.size() / drillPatterns().size();
        metric.drills_modified = static_cast<int>(room.excluded_patterns.size());

        const double margin = marker_generator_->safetyMargin();
        if (room.recommends(session.drill_pattern_id) &&
            room.width_m > 2.0 * margin && room.height_m > 2.0 * margin) {
            MarkerSet markers = marker_generator_->generate(
                session.drill_pattern_id, UsableArea{room.width_m, room.height_m},
                toleranceRadius(session), room.adaptations.reduced_target_count);
            metric.space_utilization = 100.0 * markers.footprintArea() / room.area_m2;
        }
    }

    int critical = 0;
    int warnings = 0;
    for (const auto& incident : session.safety_log) {
        if (incident.severity == Severity::CRITICAL) critical++;
        else if (incident.severity == Severity::WARNING) warnings++;
    }
    metric.safety_compliance = std::clamp(100.0 - 20.0 * critical - 5.0 * warnings, 0.0, 100.0);
    metric.room_mode_score = session.scores.total * metric.safety_compliance / 100.0;

    repository_->savePerformanceMetric(metric);
    return metric;
}

RoomAnalytics TrainingEngine::roomAnalytics(UserId user_id) const {
    if (user_id <= 0) {
        throw ValidationError("user_id must be positive");
    }

    std::vector<TrainingSession> sessions;
    for (SessionId id : repository_->sessionsForUser(user_id)) {
        // Removed between listing and loading: skip
        if (auto s = repository_->load(id)) {
            sessions.push_back(*s);
        }
    }

    RoomAnalytics analytics = summarizeRoomSessions(user_id, std::move(sessions));
    log("Room analytics for user " + std::to_string(user_id) + ": " +
        std::to_string(analytics.room_sessions) + " room session(s), score " +
        toString(analytics.score_trend) + ", safety " + toString(analytics.safety_trend));
    return analytics;
}

std::map<std::string, double> TrainingEngine::getStatus() const {
    std::map<std::string, double> status;
    {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        status["bounces_recorded"] = double(bounces_recorded_);
        status["bounces_rejected"] = double(bounces_rejected_);
        status["syncs_applied"] = double(syncs_applied_);
        status["safety_pauses"] = double(safety_pauses_);
    }
    {
        std::lock_guard<std::mutex> lock(locks_mutex_);
        pruneLocks();
        status["tracked_sessions"] = double(session_locks_.size());
    }
    {
        std::lock_guard<std::mutex> lock(poses_mutex_);
        status["tracked_poses"] = double(last_poses_.size());
    }
    status["sport_profiles"] = double(catalog_.size());
    return status;
}

} // namespace training_engine
