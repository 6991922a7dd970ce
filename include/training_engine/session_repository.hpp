/**
 * @file session_repository.hpp
 * @brief Persistence boundary for sessions and their append-only records
 */

#pragma once

#include "common.hpp"
#include "data_types.hpp"
#include <map>
#include <mutex>
#include <optional>
#include <vector>

namespace training_engine {

/**
 * @brief External store for canonical session state
 *
 * Implementations throw PersistenceError when a write is not acknowledged;
 * a failed write must leave the previously stored state in place. Bounce
 * events, room snapshots and incidents cascade with their session on remove().
 */
class SessionRepository {
public:
    virtual ~SessionRepository() = default;

    virtual SessionId nextSessionId() = 0;

    virtual std::optional<TrainingSession> load(SessionId id) const = 0;
    virtual void save(const TrainingSession& session) = 0;

    /**
     * @brief Store an updated session together with the event that produced it
     */
    virtual void saveWithBounceEvent(const TrainingSession& session, const BounceEvent& event) = 0;

    virtual void saveWithRoomSnapshot(const TrainingSession& session, const RoomConstraints& room) = 0;

    virtual std::vector<BounceEvent> bounceEvents(SessionId id) const = 0;
    virtual size_t roomSnapshotCount(SessionId id) const = 0;

    virtual void savePerformanceMetric(const PerformanceMetric& metric) = 0;

    virtual std::vector<SessionId> sessionsForUser(UserId user) const = 0;

    virtual void remove(SessionId id) = 0;
};

/**
 * @brief Thread-safe in-process repository (examples and tests)
 */
class InMemorySessionRepository : public SessionRepository {
public:
    InMemorySessionRepository() = default;

    SessionId nextSessionId() override;

    std::optional<TrainingSession> load(SessionId id) const override;
    void save(const TrainingSession& session) override;
    void saveWithBounceEvent(const TrainingSession& session, const BounceEvent& event) override;
    void saveWithRoomSnapshot(const TrainingSession& session, const RoomConstraints& room) override;

    std::vector<BounceEvent> bounceEvents(SessionId id) const override;
    size_t roomSnapshotCount(SessionId id) const override;

    void savePerformanceMetric(const PerformanceMetric& metric) override;
    std::vector<PerformanceMetric> performanceMetrics(SessionId id) const;

    std::vector<SessionId> sessionsForUser(UserId user) const override;

    void remove(SessionId id) override;

    /**
     * @brief Make the next n writes fail with PersistenceError
     */
    void failNextWrites(int n);

    size_t writeCount() const;

private:
    void checkWritable();

    mutable std::mutex mutex_;
    SessionId next_id_ = 1;
    std::map<SessionId, TrainingSession> sessions_;
    std::map<SessionId, std::vector<BounceEvent>> events_;
    std::map<SessionId, std::vector<RoomConstraints>> rooms_;
    std::map<SessionId, std::vector<PerformanceMetric>> metrics_;
    int failures_pending_ = 0;
    size_t writes_ = 0;
};

} // namespace training_engine
