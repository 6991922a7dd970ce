/**
 * @file sync_reconciler.hpp
 * @brief Field-by-field merge of web and native client session reports
 */

#pragma once

#include "common.hpp"
#include "data_types.hpp"

namespace training_engine {

/**
 * @brief Deterministic merge of partial sync payloads
 *
 * - average_fps, tracking_quality: max(current, incoming)
 * - safety_score, room_center, scale_factor, obstacle_count, lighting,
 *   reflective_surfaces and platform context: last writer wins
 * - last_platform: the reporting platform
 *
 * Applying the same payload twice yields the same record as applying it once.
 */
class SyncReconciler {
public:
    /**
     * @brief Check a payload's schema
     * @throws ValidationError on out-of-range fields
     */
    static void validate(const SyncPayload& payload);

    /**
     * @brief Merge a payload into a session record
     * @throws SyncConflict if the session is terminal
     * @throws ValidationError if the payload is invalid (session unchanged)
     */
    static void merge(TrainingSession& session, const SyncPayload& payload);

    /**
     * @brief Merge metrics only (shared by both platform variants)
     */
    static void mergeMetrics(SessionQuality& quality, const SyncMetrics& incoming);
};

} // namespace training_engine
