#pragma once

#include "mpu/core/cancellation.hpp"
#include "mpu/core/result.hpp"
#include "mpu/events/event_bus.hpp"
#include "mpu/store/object_store.hpp"
#include "mpu/upload/chunker.hpp"
#include "mpu/upload/hasher.hpp"
#include "mpu/upload/part_uploader.hpp"
#include "mpu/upload/retry_policy.hpp"
#include "mpu/upload/session.hpp"
#include "mpu/upload/source_file.hpp"
#include "mpu/upload/types.hpp"

#include <atomic>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace mpu::upload {

/**
 * @brief How a store-reported combined digest that disagrees is handled
 *
 * Some S3-compatible stores derive the combined checksum unreliably, so the
 * comparison can be demoted to a warning or skipped. Per-part digests and
 * the total size are always enforced.
 */
enum class CombinedDigestPolicy {
    Strict,
    Warn,
    Ignore
};

const char* to_string(CombinedDigestPolicy policy) noexcept;

struct CoordinatorOptions {
    std::size_t concurrency = 4;
    RetryPolicy retry;
    DigestAlgorithm digest_algorithm = DigestAlgorithm::Md5;
    CombinedDigestPolicy combined_digest_policy = CombinedDigestPolicy::Strict;
    std::uint64_t part_size_hint = 0;
    std::optional<PartLimits> limits;        ///< Overrides ObjectStore::limits()
    bool attach_file_digest = true;          ///< Whole-file digest as object metadata
    bool verify_with_head = true;            ///< head() check after complete()
};

/**
 * @brief Drives one multipart upload from initiate to complete or abort
 *
 * STATE MACHINE:
 * Initiating -> InProgress -> Completing -> Completed
 *      \______________\____________\_______> Aborted
 *
 * - Parts are uploaded by a bounded pool of worker threads. Each worker
 *   writes only the result slot of the part it owns.
 * - Retryable failures are retried per part with exponential backoff, within
 *   the per-part attempt limit and the optional session-wide budget.
 * - The first fatal error (or a cancellation) stops dispatch; in-flight
 *   parts settle, then the store upload is aborted and that error returned.
 * - Completion is accepted only if the reported size matches the plan and
 *   the reported combined digest (if any) passes the configured policy.
 *
 * One coordinator runs one upload; upload() may be called once.
 */
class UploadCoordinator {
public:
    UploadCoordinator(store::ObjectStore& store, events::EventBus& bus, CoordinatorOptions options = {});

    UploadCoordinator(const UploadCoordinator&) = delete;
    UploadCoordinator& operator=(const UploadCoordinator&) = delete;

    Result<CompletionRecord, UploadError> upload(const std::filesystem::path& source,
                                                 const std::string& bucket,
                                                 const std::string& key,
                                                 CancellationToken cancel = {});

    /**
     * @brief Abort the session if it is not finished yet
     *
     * A no-op once the session is Completed or Aborted, or if upload() never
     * created one. An upload still running on another thread must be stopped
     * through its CancellationToken instead.
     */
    Result<void, UploadError> abort();

    [[nodiscard]] UploadState state() const noexcept;
    [[nodiscard]] const UploadSession* session() const noexcept { return session_.get(); }
    [[nodiscard]] const CoordinatorOptions& options() const noexcept { return options_; }
    [[nodiscard]] std::size_t retries_used() const noexcept { return budget_ ? budget_->consumed() : 0; }

    /// Errors from other parts after the first fatal one; kept for diagnostics.
    [[nodiscard]] const std::vector<UploadError>& secondary_errors() const noexcept { return secondary_errors_; }

private:
    std::optional<UploadError> run_parts(const SourceFile& source, const Hasher& hasher,
                                         const CancellationToken& cancel);

    void upload_part_with_retry(const PartUploader& uploader, const PartSpec& spec,
                                const CancellationToken& cancel);

    Result<CompletionRecord, UploadError> complete_and_verify(const SourceFile& source,
                                                              const Hasher& hasher,
                                                              const std::optional<Digest>& file_digest,
                                                              const CancellationToken& cancel);

    /// Combined digest of the verified parts in @p algorithm, rehashing parts the store did not checksum that way.
    Result<Digest, UploadError> combined_digest_in(DigestAlgorithm algorithm, const SourceFile& source) const;

    Result<store::CompleteResponse, UploadError> complete_with_retry(const CancellationToken& cancel);

    /// Sleep for @p delay unless a fatal error or a cancellation shows up first.
    bool wait_backoff(std::chrono::milliseconds delay, const CancellationToken& cancel) const;

    void record_failure(UploadError error);

    Result<void, UploadError> advance(UploadState next_state);

    /// Abort path once an upload id exists: mark aborted, call store abort once, report.
    Result<CompletionRecord, UploadError> abort_with(UploadError error);

    /// Abort path before the store issued an upload id; no store call.
    Result<CompletionRecord, UploadError> fail_before_initiate(UploadError error);

    bool abort_remote();

    store::ObjectStore& store_;
    events::EventBus& event_bus_;
    CoordinatorOptions options_;

    std::unique_ptr<UploadSession> session_;
    std::unique_ptr<RetryBudget> budget_;
    bool remote_abort_attempted_ = false;

    std::atomic<bool> stop_{false};
    std::mutex failure_mutex_;
    std::optional<UploadError> first_error_;
    std::vector<UploadError> secondary_errors_;
};

} // namespace mpu::upload
