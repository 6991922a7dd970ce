/**
 * @file session_state_machine.hpp
 * @brief Session lifecycle transitions
 */

#pragma once

#include "common.hpp"
#include "data_types.hpp"
#include <string>

namespace training_engine {

/**
 * @brief Transition table for training sessions
 *
 *     ACTIVE  --PAUSE/SAFETY_PAUSE--> PAUSED
 *     PAUSED  --RESUME--------------> ACTIVE
 *     ACTIVE  --END-----------------> COMPLETED   (terminal)
 *     ACTIVE  --UPSTREAM_ERROR------> FAILED      (terminal)
 *     PAUSED  --UPSTREAM_ERROR------> FAILED      (terminal)
 *
 * Everything else is illegal.
 */
class SessionStateMachine {
public:
    /**
     * @brief Target state for a trigger
     * @throws IllegalTransitionError if the transition is not in the table
     */
    static SessionStatus next(SessionStatus from, SessionTrigger trigger);

    static bool canApply(SessionStatus from, SessionTrigger trigger);

    /**
     * @brief Apply a trigger to a session record
     *
     * Pauses record the reason; COMPLETED/FAILED set completed_at_ms. Final
     * score recomputation on END is the caller's job (it owns the events).
     *
     * @throws IllegalTransitionError, leaving the session unchanged
     */
    static void apply(
        TrainingSession& session,
        SessionTrigger trigger,
        TimestampMs now_ms,
        const std::string& reason = ""
    );

    /**
     * @brief Reject writes to score/metric fields of terminal sessions
     * @throws IllegalTransitionError if the session is COMPLETED or FAILED
     */
    static void ensureWritable(const TrainingSession& session, const std::string& operation);
};

} // namespace training_engine
