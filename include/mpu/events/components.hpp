/**
 * @file components.hpp
 * @brief Event subscribers for logging and upload statistics
 *
 * EXAMPLE:
 * EventBus bus;
 * LoggerComponent logger(bus);
 * MetricsComponent metrics(bus);
 * UploadCoordinator coordinator(store, bus, options);
 * // Every upload event is now logged and counted.
 */

#pragma once

#include "mpu/events/event_bus.hpp"
#include "mpu/events/events.hpp"

#include <spdlog/spdlog.h>

#include <atomic>
#include <cstdint>

namespace mpu::events {

/**
 * @brief Logs every upload event with spdlog
 *
 * Cancellation is reported at info level; it is an outcome, not a defect.
 */
class LoggerComponent {
public:
    explicit LoggerComponent(EventBus& bus) : bus_(bus) {
        bus_.subscribe<UploadInitiatedEvent>([this](const UploadInitiatedEvent& e) {
            on_upload_initiated(e);
        });

        bus_.subscribe<PartUploadedEvent>([this](const PartUploadedEvent& e) {
            on_part_uploaded(e);
        });

        bus_.subscribe<PartRetryScheduledEvent>([this](const PartRetryScheduledEvent& e) {
            on_part_retry(e);
        });

        bus_.subscribe<PartFailedEvent>([this](const PartFailedEvent& e) {
            on_part_failed(e);
        });

        bus_.subscribe<CombinedDigestMismatchEvent>([this](const CombinedDigestMismatchEvent& e) {
            on_combined_digest_mismatch(e);
        });

        bus_.subscribe<UploadCompletedEvent>([this](const UploadCompletedEvent& e) {
            on_upload_completed(e);
        });

        bus_.subscribe<UploadAbortedEvent>([this](const UploadAbortedEvent& e) {
            on_upload_aborted(e);
        });
    }

private:
    void on_upload_initiated(const UploadInitiatedEvent& e) {
        spdlog::info("[UploadInitiated] upload={} target={}/{} parts={} bytes={} concurrency={}",
                     e.upload_id, e.bucket, e.key, e.part_count, e.total_bytes, e.concurrency);
    }

    void on_part_uploaded(const PartUploadedEvent& e) {
        spdlog::info("[PartUploaded] upload={} part={}/{} bytes={} attempt={} digest={}",
                     e.upload_id, e.part_index, e.part_count, e.bytes, e.attempt, e.digest_hex);
    }

    void on_part_retry(const PartRetryScheduledEvent& e) {
        spdlog::warn("[PartRetry] upload={} part={} next_attempt={} delay={}ms reason={}",
                     e.upload_id, e.part_index, e.next_attempt, e.delay.count(), e.reason.describe());
    }

    void on_part_failed(const PartFailedEvent& e) {
        if (e.error.kind == ErrorKind::Cancelled) {
            spdlog::info("[PartCancelled] upload={} part={} attempts={}", e.upload_id, e.part_index, e.attempts);
            return;
        }
        spdlog::error("[PartFailed] upload={} part={} attempts={} error={}",
                      e.upload_id, e.part_index, e.attempts, e.error.describe());
    }

    void on_combined_digest_mismatch(const CombinedDigestMismatchEvent& e) {
        spdlog::warn("[CombinedDigestMismatch] upload={} expected={} observed={}",
                     e.upload_id, e.expected_hex, e.observed_hex);
    }

    void on_upload_completed(const UploadCompletedEvent& e) {
        spdlog::info("[UploadCompleted] upload={} target={}/{} etag={} bytes={} parts={} duration={}ms",
                     e.upload_id, e.bucket, e.key, e.etag, e.total_bytes, e.part_count, e.duration.count());
    }

    void on_upload_aborted(const UploadAbortedEvent& e) {
        if (e.cause.kind == ErrorKind::Cancelled) {
            spdlog::info("[UploadCancelled] upload={} target={}/{} store_abort={}",
                         e.upload_id, e.bucket, e.key, e.abort_succeeded ? "ok" : "failed");
            return;
        }
        spdlog::error("[UploadAborted] upload={} target={}/{} store_abort={} cause={}",
                      e.upload_id, e.bucket, e.key, e.abort_succeeded ? "ok" : "failed", e.cause.describe());
    }

    EventBus& bus_;
};

/**
 * @brief Counts parts, bytes, retries and session outcomes
 */
class MetricsComponent {
public:
    struct Stats {
        std::atomic<uint64_t> uploads_initiated{0};
        std::atomic<uint64_t> uploads_completed{0};
        std::atomic<uint64_t> uploads_aborted{0};
        std::atomic<uint64_t> uploads_cancelled{0};
        std::atomic<uint64_t> parts_uploaded{0};
        std::atomic<uint64_t> bytes_uploaded{0};
        std::atomic<uint64_t> part_retries{0};
        std::atomic<uint64_t> part_failures{0};
        std::atomic<uint64_t> combined_digest_mismatches{0};
    };

    explicit MetricsComponent(EventBus& bus) : bus_(bus) {
        bus_.subscribe<UploadInitiatedEvent>([this](const UploadInitiatedEvent&) {
            stats_.uploads_initiated++;
        });

        bus_.subscribe<PartUploadedEvent>([this](const PartUploadedEvent& e) {
            stats_.parts_uploaded++;
            stats_.bytes_uploaded += e.bytes;
        });

        bus_.subscribe<PartRetryScheduledEvent>([this](const PartRetryScheduledEvent&) {
            stats_.part_retries++;
        });

        bus_.subscribe<PartFailedEvent>([this](const PartFailedEvent&) {
            stats_.part_failures++;
        });

        bus_.subscribe<CombinedDigestMismatchEvent>([this](const CombinedDigestMismatchEvent&) {
            stats_.combined_digest_mismatches++;
        });

        bus_.subscribe<UploadCompletedEvent>([this](const UploadCompletedEvent&) {
            stats_.uploads_completed++;
        });

        bus_.subscribe<UploadAbortedEvent>([this](const UploadAbortedEvent& e) {
            if (e.cause.kind == ErrorKind::Cancelled) {
                stats_.uploads_cancelled++;
            } else {
                stats_.uploads_aborted++;
            }
        });
    }

    const Stats& get_stats() const {
        return stats_;
    }

    void print_stats() const {
        spdlog::info("═══════════════════════════════════════");
        spdlog::info("Upload Statistics:");
        spdlog::info("  Uploads initiated: {}", stats_.uploads_initiated.load());
        spdlog::info("  Uploads completed: {}", stats_.uploads_completed.load());
        spdlog::info("  Uploads aborted:   {}", stats_.uploads_aborted.load());
        spdlog::info("  Uploads cancelled: {}", stats_.uploads_cancelled.load());
        spdlog::info("  Parts uploaded:    {}", stats_.parts_uploaded.load());
        spdlog::info("  Bytes uploaded:    {}", stats_.bytes_uploaded.load());
        spdlog::info("  Part retries:      {}", stats_.part_retries.load());
        spdlog::info("  Part failures:     {}", stats_.part_failures.load());
        spdlog::info("  Digest mismatches: {}", stats_.combined_digest_mismatches.load());
        spdlog::info("═══════════════════════════════════════");
    }

private:
    EventBus& bus_;
    Stats stats_;
};

} // namespace mpu::events
