/**
 * @file session_state_machine.cpp
 * @brief Implementation of the session transition table
 */

#include "training_engine/session_state_machine.hpp"
#include "training_engine/errors.hpp"

namespace training_engine {

SessionStatus SessionStateMachine::next(SessionStatus from, SessionTrigger trigger) {
    switch (from) {
        case SessionStatus::ACTIVE:
            switch (trigger) {
                case SessionTrigger::PAUSE:
                case SessionTrigger::SAFETY_PAUSE:   return SessionStatus::PAUSED;
                case SessionTrigger::END:            return SessionStatus::COMPLETED;
                case SessionTrigger::UPSTREAM_ERROR: return SessionStatus::FAILED;
                case SessionTrigger::RESUME:         break;
            }
            break;

        case SessionStatus::PAUSED:
            switch (trigger) {
                case SessionTrigger::RESUME:         return SessionStatus::ACTIVE;
                case SessionTrigger::UPSTREAM_ERROR: return SessionStatus::FAILED;
                default:                             break;
            }
            break;

        case SessionStatus::COMPLETED:
        case SessionStatus::FAILED:
            break;
    }
    throw IllegalTransitionError(from, trigger);
}

bool SessionStateMachine::canApply(SessionStatus from, SessionTrigger trigger) {
    try {
        next(from, trigger);
        return true;
    } catch (const IllegalTransitionError&) {
        return false;
    }
}

void SessionStateMachine::apply(
    TrainingSession& session,
    SessionTrigger trigger,
    TimestampMs now_ms,
    const std::string& reason
) {
    SessionStatus target = next(session.status, trigger);

    session.status = target;
    switch (target) {
        case SessionStatus::PAUSED:
            session.pause_reason = reason.empty() ? toString(trigger) : reason;
            break;
        case SessionStatus::ACTIVE:
            session.pause_reason.reset();
            break;
        case SessionStatus::COMPLETED:
        case SessionStatus::FAILED:
            session.completed_at_ms = now_ms;
            break;
    }
}

void SessionStateMachine::ensureWritable(const TrainingSession& session, const std::string& operation) {
    if (isTerminal(session.status)) {
        throw IllegalTransitionError(
            session.status,
            operation + " rejected: session " + std::to_string(session.id) +
            " is " + toString(session.status)
        );
    }
}

} // namespace training_engine
