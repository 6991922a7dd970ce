/**
 * @file training_engine.hpp
 * @brief Main training session engine (integrates all components)
 */

#pragma once

#include "common.hpp"
#include "config.hpp"
#include "data_types.hpp"
#include "room_analytics.hpp"
#include "sport_profile.hpp"
#include "session_repository.hpp"
#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace training_engine {

// Forward declarations
class BounceValidator;
class RoomAnalyzer;
class MarkerGenerator;
class PoseSafetyMonitor;

/**
 * @brief Adaptive AR training session engine
 *
 * Every operation on a session runs inside that session's critical section:
 * load snapshot -> compute on a copy -> persist -> return. A persistence
 * failure propagates as PersistenceError and the stored snapshot is left as
 * it was. Different sessions never share a lock.
 *
 * Example usage:
 * ```cpp
 * auto repo = std::make_shared<InMemorySessionRepository>();
 * TrainingEngine engine(repo);
 *
 * auto session = engine.createSession(42, "basketball", "dribble_box",
 *                                     Difficulty::MEDIUM, DevicePlatform::WEB);
 * engine.analyzeRoom(session.id, plane);
 *
 * ImpactData impact;
 * impact.timestamp_ms = 1000;
 * impact.court_position = Eigen::Vector2d(1.02, 0.95);
 * impact.target_index = 0;
 * impact.target_position = Eigen::Vector2d(1.0, 1.0);
 * auto event = engine.recordBounceEvent(session.id, impact);
 *
 * engine.transitionSession(session.id, SessionTrigger::END);
 * ```
 */
class TrainingEngine {
public:
    TrainingEngine(
        std::shared_ptr<SessionRepository> repository,
        SportCatalog catalog = SportCatalog::builtin(),
        const Config& config = Config()
    );
    ~TrainingEngine();

    // =========================================================================
    // SESSION LIFECYCLE
    // =========================================================================

    /**
     * @throws ValidationError for a non-positive user id, empty sport or an
     *         unknown drill pattern
     */
    TrainingSession createSession(
        UserId user_id,
        const std::string& sport,
        const std::string& drill_pattern_id,
        Difficulty difficulty,
        DevicePlatform platform
    );

    /**
     * @brief Apply a lifecycle trigger
     *
     * END recomputes the final scores from the stored bounce events and sets
     * the completion timestamp.
     *
     * @throws IllegalTransitionError (session unchanged)
     */
    TrainingSession transitionSession(
        SessionId session_id,
        SessionTrigger trigger,
        const std::string& reason = ""
    );

    /// @throws SessionNotFound
    TrainingSession getSession(SessionId session_id) const;

    // =========================================================================
    // EVENTS
    // =========================================================================

    /**
     * @brief Validate, score and persist one impact
     *
     * The court position is derived from the session's court calibration when
     * the impact does not carry one.
     *
     * @throws ValidationError (nothing recorded)
     * @throws IllegalTransitionError if the session is paused or terminal
     */
    BounceEvent recordBounceEvent(SessionId session_id, const ImpactData& impact);

    std::vector<BounceEvent> bounceEvents(SessionId session_id) const;

    /**
     * @brief Build the court frame for a session from two baseline taps
     * @throws ValidationError, IllegalTransitionError for terminal sessions
     */
    CourtCalibration calibrateCourt(
        SessionId session_id,
        const Eigen::Vector3d& baseline_a,
        const Eigen::Vector3d& baseline_b,
        const Eigen::Vector3d& up = Eigen::Vector3d::UnitY()
    );

    // =========================================================================
    // ROOM & SAFETY
    // =========================================================================

    /**
     * @brief Analyse a room scan and store the snapshot on the session
     *
     * Snapshots are accepted on any non-terminal session.
     */
    RoomConstraints analyzeRoom(SessionId session_id, const PlaneObservation& plane);

    /**
     * @brief Marker layout for a pattern (no session involved)
     */
    MarkerSet generateMarkers(const std::string& pattern_id, const UsableArea& area) const;

    /**
     * @brief Marker layout for a session's pattern, room and difficulty
     * @throws ValidationError if the room has not been analysed
     */
    MarkerSet generateMarkers(SessionId session_id) const;

    /**
     * @brief Check a live pose; critical findings are logged and pause the session
     *
     * The previous snapshot of the same session is kept so landmark speed
     * can be checked between frames.
     */
    SafetyEvaluation evaluatePoseSafety(SessionId session_id, const PoseSnapshot& pose);

    /**
     * @brief Append an externally reported incident
     *
     * Accepted on terminal sessions (audit log). A critical incident not yet
     * marked as having paused the session pauses an active session once.
     */
    SafetyIncident logSafetyIncident(SessionId session_id, const SafetyIncident& incident);

    // =========================================================================
    // CROSS-PLATFORM SYNC
    // =========================================================================

    /**
     * @throws SessionNotFound converted to SyncConflict, SyncConflict for
     *         terminal sessions, ValidationError for invalid payloads
     */
    TrainingSession syncSession(SessionId session_id, const SyncPayload& payload);

    SyncStatus syncStatus(SessionId session_id) const;

    // =========================================================================
    // ROLLUPS & STATUS
    // =========================================================================

    PerformanceMetric buildPerformanceMetric(SessionId session_id);

    /**
     * @brief Room-mode rollup over a user's completed sessions
     */
    RoomAnalytics roomAnalytics(UserId user_id) const;

    const SportCatalog& catalog() const { return catalog_; }
    const Config& config() const { return cfg_; }

    /**
     * @brief Counters for debugging
     */
    std::map<std::string, double> getStatus() const;

private:
    std::shared_ptr<std::mutex> sessionLock(SessionId session_id) const;
    void pruneLocks() const;   ///< Caller holds locks_mutex_
    TrainingSession loadOrThrow(SessionId session_id) const;
    void recomputeScores(TrainingSession& session, const std::vector<BounceEvent>& events) const;
    SafetyIncident appendIncident(TrainingSession& session, SafetyIncident incident, TimestampMs now_ms);
    double toleranceRadius(const TrainingSession& session) const;
    void log(const std::string& message) const;

    std::shared_ptr<SessionRepository> repository_;
    SportCatalog catalog_;
    Config cfg_;

    std::unique_ptr<BounceValidator> validator_;
    std::unique_ptr<RoomAnalyzer> room_analyzer_;
    std::unique_ptr<MarkerGenerator> marker_generator_;
    std::unique_ptr<PoseSafetyMonitor> pose_monitor_;

    mutable std::mutex locks_mutex_;
    mutable std::map<SessionId, std::weak_ptr<std::mutex>> session_locks_;

    // Last pose per session for speed checks
    mutable std::mutex poses_mutex_;
    std::map<SessionId, PoseSnapshot> last_poses_;

    // Counters
    mutable std::mutex stats_mutex_;
    size_t bounces_recorded_ = 0;
    size_t bounces_rejected_ = 0;
    size_t syncs_applied_ = 0;
    size_t safety_pauses_ = 0;
};

} // namespace training_engine
