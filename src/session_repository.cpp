/**
 * @file session_repository.cpp
 * @brief In-memory session repository
 */

#include "training_engine/session_repository.hpp"
#include "training_engine/errors.hpp"

namespace training_engine {

SessionId InMemorySessionRepository::nextSessionId() {
    std::lock_guard<std::mutex> lock(mutex_);
    return next_id_++;
}

std::optional<TrainingSession> InMemorySessionRepository::load(SessionId id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(id);
    if (it == sessions_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void InMemorySessionRepository::checkWritable() {
    if (failures_pending_ > 0) {
        failures_pending_--;
        throw PersistenceError("Simulated store failure");
    }
    writes_++;
}

void InMemorySessionRepository::save(const TrainingSession& session) {
    std::lock_guard<std::mutex> lock(mutex_);
    checkWritable();
    sessions_[session.id] = session;
}

void InMemorySessionRepository::saveWithBounceEvent(const TrainingSession& session, const BounceEvent& event) {
    std::lock_guard<std::mutex> lock(mutex_);
    checkWritable();
    sessions_[session.id] = session;
    events_[session.id].push_back(event);
}

void InMemorySessionRepository::saveWithRoomSnapshot(const TrainingSession& session, const RoomConstraints& room) {
    std::lock_guard<std::mutex> lock(mutex_);
    checkWritable();
    sessions_[session.id] = session;
    rooms_[session.id].push_back(room);
}

std::vector<BounceEvent> InMemorySessionRepository::bounceEvents(SessionId id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = events_.find(id);
    if (it == events_.end()) {
        return {};
    }
    return it->second;
}

size_t InMemorySessionRepository::roomSnapshotCount(SessionId id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = rooms_.find(id);
    return it == rooms_.end() ? 0 : it->second.size();
}

void InMemorySessionRepository::savePerformanceMetric(const PerformanceMetric& metric) {
    std::lock_guard<std::mutex> lock(mutex_);
    checkWritable();
    metrics_[metric.session_id].push_back(metric);
}

std::vector<PerformanceMetric> InMemorySessionRepository::performanceMetrics(SessionId id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = metrics_.find(id);
    if (it == metrics_.end()) {
        return {};
    }
    return it->second;
}

std::vector<SessionId> InMemorySessionRepository::sessionsForUser(UserId user) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<SessionId> ids;
    for (const auto& entry : sessions_) {
        if (entry.second.user_id == user) {
            ids.push_back(entry.first);
        }
    }
    return ids;
}

void InMemorySessionRepository::remove(SessionId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    checkWritable();
    sessions_.erase(id);
    events_.erase(id);
    rooms_.erase(id);
    metrics_.erase(id);
}

void InMemorySessionRepository::failNextWrites(int n) {
    std::lock_guard<std::mutex> lock(mutex_);
    failures_pending_ = n;
}

size_t InMemorySessionRepository::writeCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return writes_;
}

} // namespace training_engine
