/**
 * @file errors.hpp
 * @brief Exception types raised by the engine
 */

#pragma once

#include "common.hpp"
#include <stdexcept>
#include <string>

namespace training_engine {

/**
 * @brief Malformed or out-of-range input. No record is created.
 */
class ValidationError : public std::invalid_argument {
public:
    explicit ValidationError(const std::string& what)
        : std::invalid_argument(what) {}
};

/**
 * @brief Invalid configuration (weights, tolerance table, config files)
 */
class ConfigError : public std::invalid_argument {
public:
    explicit ConfigError(const std::string& what)
        : std::invalid_argument(what) {}
};

/**
 * @brief Rejected lifecycle transition. Session state is unchanged.
 */
class IllegalTransitionError : public std::logic_error {
public:
    IllegalTransitionError(SessionStatus from, SessionTrigger trigger)
        : std::logic_error("illegal transition: " + toString(trigger) +
                           " from " + toString(from)),
          from_(from), trigger_(trigger) {}

    IllegalTransitionError(SessionStatus from, const std::string& what)
        : std::logic_error(what), from_(from) {}

    SessionStatus from() const { return from_; }

    /// Empty when the rejected operation was a write, not a trigger
    std::optional<SessionTrigger> trigger() const { return trigger_; }

private:
    SessionStatus from_;
    std::optional<SessionTrigger> trigger_;
};

/**
 * @brief Internal invariant broken (a defect, not a user error)
 */
class ConstraintViolation : public std::logic_error {
public:
    explicit ConstraintViolation(const std::string& what)
        : std::logic_error(what) {}
};

/**
 * @brief Sync payload referencing a missing or terminal session
 */
class SyncConflict : public std::runtime_error {
public:
    explicit SyncConflict(const std::string& what)
        : std::runtime_error(what) {}
};

class SessionNotFound : public std::out_of_range {
public:
    explicit SessionNotFound(SessionId id)
        : std::out_of_range("session not found: " + std::to_string(id)), id_(id) {}

    SessionId id() const { return id_; }

private:
    SessionId id_;
};

/**
 * @brief External store failed to acknowledge a write
 */
class PersistenceError : public std::runtime_error {
public:
    explicit PersistenceError(const std::string& what)
        : std::runtime_error(what) {}
};

} // namespace training_engine
