/**
 * @file events.hpp
 * @brief Events emitted over the lifetime of one multipart upload
 *
 * NAMING CONVENTION:
 * Events are past-tense facts: PartUploadedEvent, UploadAbortedEvent.
 *
 * ORDER FOR ONE SUCCESSFUL UPLOAD:
 * UploadInitiatedEvent
 *   -> PartUploadedEvent x N (any order; PartRetryScheduledEvent in between)
 *   -> UploadCompletedEvent
 */

#pragma once

#include "mpu/core/errors.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace mpu::events {

// ════════════════════════════════════════════════════════
// Session Events
// ════════════════════════════════════════════════════════

/**
 * @brief The store issued an upload id; parts are about to be dispatched
 */
struct UploadInitiatedEvent {
    std::string upload_id;
    std::string bucket;
    std::string key;
    std::size_t part_count = 0;
    std::uint64_t total_bytes = 0;
    std::size_t concurrency = 1;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

struct UploadCompletedEvent {
    std::string upload_id;
    std::string bucket;
    std::string key;
    std::string etag;
    std::uint64_t total_bytes = 0;
    std::size_t part_count = 0;
    std::chrono::milliseconds duration{0};
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

/**
 * @brief The session ended without a verified object
 *
 * upload_id is empty when initiation itself failed (nothing to abort).
 * abort_succeeded is false when the store-side abort failed or was skipped.
 */
struct UploadAbortedEvent {
    std::string upload_id;
    std::string bucket;
    std::string key;
    UploadError cause;
    bool abort_succeeded = false;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

// ════════════════════════════════════════════════════════
// Part Events
// ════════════════════════════════════════════════════════

struct PartUploadedEvent {
    std::string upload_id;
    std::uint32_t part_index = 0;
    std::size_t part_count = 0;
    std::uint64_t bytes = 0;
    std::uint32_t attempt = 1;
    std::string digest_hex;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

struct PartRetryScheduledEvent {
    std::string upload_id;
    std::uint32_t part_index = 0;
    std::uint32_t next_attempt = 2;
    std::chrono::milliseconds delay{0};
    UploadError reason;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

/**
 * @brief A part gave up: fatal error, exhausted budget, or cancellation
 */
struct PartFailedEvent {
    std::string upload_id;
    std::uint32_t part_index = 0;
    std::uint32_t attempts = 0;
    UploadError error;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

// ════════════════════════════════════════════════════════
// Verification Events
// ════════════════════════════════════════════════════════

/**
 * @brief Store-reported combined digest differs, tolerated by policy
 */
struct CombinedDigestMismatchEvent {
    std::string upload_id;
    std::string expected_hex;
    std::string observed_hex;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

} // namespace mpu::events
