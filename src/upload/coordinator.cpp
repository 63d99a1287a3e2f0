#include "mpu/upload/coordinator.hpp"

#include "mpu/core/work_queue.hpp"
#include "mpu/events/events.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <exception>
#include <thread>

namespace mpu::upload {
namespace {

constexpr std::chrono::milliseconds kBackoffSlice{50};

std::string target_of(const UploadSession& session) {
    return session.bucket() + "/" + session.key();
}

} // namespace

const char* to_string(CombinedDigestPolicy policy) noexcept {
    switch (policy) {
        case CombinedDigestPolicy::Strict: return "strict";
        case CombinedDigestPolicy::Warn: return "warn";
        case CombinedDigestPolicy::Ignore: return "ignore";
    }
    return "unknown";
}

UploadCoordinator::UploadCoordinator(store::ObjectStore& store, events::EventBus& bus, CoordinatorOptions options)
    : store_(store), event_bus_(bus), options_(std::move(options)) {}

UploadState UploadCoordinator::state() const noexcept {
    return session_ ? session_->state() : UploadState::Initiating;
}

Result<CompletionRecord, UploadError> UploadCoordinator::upload(const std::filesystem::path& source,
                                                                const std::string& bucket,
                                                                const std::string& key,
                                                                CancellationToken cancel) {
    if (session_) {
        return Err(UploadError::invalid_argument("coordinator already ran an upload"));
    }
    if (options_.concurrency == 0) {
        return Err(UploadError::invalid_argument("concurrency must be >= 1"));
    }
    if (options_.retry.max_attempts == 0) {
        return Err(UploadError::invalid_argument("retry.max_attempts must be >= 1"));
    }
    if (bucket.empty() || key.empty()) {
        return Err(UploadError::invalid_argument("bucket and key must not be empty"));
    }

    auto opened = SourceFile::open(source);
    if (opened.is_error()) {
        return Err(opened.error());
    }
    const SourceFile file = std::move(opened.value());

    const PartLimits limits = options_.limits.value_or(store_.limits());
    auto planned = Chunker::plan(file.size(), limits, options_.part_size_hint);
    if (planned.is_error()) {
        return Err(planned.error());
    }

    session_ = std::make_unique<UploadSession>(bucket, key, std::move(planned.value()));
    budget_ = std::make_unique<RetryBudget>(options_.retry.max_total_retries);
    const Hasher hasher(options_.digest_algorithm);

    store::ObjectMetadata metadata;
    std::optional<Digest> file_digest;
    if (options_.attach_file_digest) {
        try {
            auto whole = hasher.file_digest(source);
            if (whole.is_error()) {
                return fail_before_initiate(whole.error());
            }
            file_digest = whole.value();
        } catch (const std::exception& e) {
            return fail_before_initiate(UploadError::io(std::string("could not digest source file: ") + e.what()));
        }
        metadata[to_string(hasher.algorithm())] = file_digest->base64();
    }

    if (cancel.is_cancelled()) {
        return fail_before_initiate(UploadError::cancelled());
    }

    auto initiated = store_.initiate(bucket, key, metadata);
    if (initiated.is_error()) {
        return fail_before_initiate(UploadError::store(initiated.error()));
    }
    if (auto begun = session_->begin(initiated.value()); begun.is_error()) {
        return fail_before_initiate(UploadError::invalid_argument(begun.error()));
    }

    const auto& plan = session_->plan();
    event_bus_.emit(events::UploadInitiatedEvent{session_->upload_id(), bucket, key, plan.part_count(),
                                                 plan.total_bytes(),
                                                 std::min(options_.concurrency, plan.part_count())});

    if (auto failure = run_parts(file, hasher, cancel)) {
        return abort_with(std::move(*failure));
    }
    if (!session_->all_parts_verified()) {
        return abort_with(UploadError::invalid_argument("parts left unverified without a recorded error"));
    }

    if (auto advanced = advance(UploadState::Completing); advanced.is_error()) {
        return abort_with(advanced.error());
    }
    return complete_and_verify(file, hasher, file_digest, cancel);
}

Result<void, UploadError> UploadCoordinator::abort() {
    if (!session_ || session_->is_terminal()) {
        return Ok();
    }
    return Err(UploadError::invalid_argument("upload still running; cancel it through its CancellationToken"));
}

std::optional<UploadError> UploadCoordinator::run_parts(const SourceFile& source,
                                                        const Hasher& hasher,
                                                        const CancellationToken& cancel) {
    WorkQueue<PartSpec> queue;
    for (const auto& spec : session_->plan().parts) {
        queue.push(spec);
    }
    queue.close();

    const PartUploader uploader(store_, source, hasher);

    auto worker = [&]() {
        while (auto spec = queue.pop()) {
            if (cancel.is_cancelled()) {
                record_failure(UploadError::cancelled());
            }
            if (stop_.load()) {
                queue.discard();
                break;
            }
            upload_part_with_retry(uploader, *spec, cancel);
        }
    };

    const std::size_t worker_count = std::min(options_.concurrency, session_->plan().part_count());
    std::vector<std::thread> workers;
    workers.reserve(worker_count);
    for (std::size_t i = 0; i < worker_count; ++i) {
        workers.emplace_back(worker);
    }
    for (auto& thread : workers) {
        thread.join();
    }

    std::lock_guard lock(failure_mutex_);
    if (!first_error_ && cancel.is_cancelled()) {
        first_error_ = UploadError::cancelled();
    }
    return first_error_;
}

void UploadCoordinator::upload_part_with_retry(const PartUploader& uploader,
                                               const PartSpec& spec,
                                               const CancellationToken& cancel) {
    PartResult& slot = session_->part_slot(spec.index);
    const auto& upload_id = session_->upload_id();

    while (true) {
        if (cancel.is_cancelled()) {
            UploadError cancelled = UploadError::cancelled();
            cancelled.part_index = spec.index;
            event_bus_.emit(events::PartFailedEvent{upload_id, spec.index, slot.attempts, cancelled});
            record_failure(std::move(cancelled));
            return;
        }
        if (stop_.load()) {
            return;
        }

        std::optional<UploadError> error;
        try {
            auto attempt = uploader.upload(*session_, spec, slot);
            if (attempt.is_error()) {
                error = attempt.error();
            }
        } catch (const std::exception& e) {
            UploadError unexpected = UploadError::io(std::string("unexpected failure: ") + e.what());
            unexpected.part_index = spec.index;
            slot.state = PartState::Failed;
            slot.last_error = unexpected;
            error = std::move(unexpected);
        }

        if (!error) {
            event_bus_.emit(events::PartUploadedEvent{upload_id, spec.index, session_->plan().part_count(),
                                                      spec.byte_length, slot.attempts,
                                                      slot.local_digest.hex()});
            return;
        }

        if (options_.retry.should_retry(*error, slot.attempts) && !stop_.load() && !cancel.is_cancelled()) {
            if (budget_->try_consume()) {
                const auto delay = options_.retry.backoff_for(slot.attempts + 1);
                event_bus_.emit(events::PartRetryScheduledEvent{upload_id, spec.index, slot.attempts + 1,
                                                                delay, *error});
                if (!wait_backoff(delay, cancel)) {
                    spdlog::debug("backoff for part {} interrupted", spec.index);
                }
                continue;
            }
            spdlog::warn("session retry budget exhausted; part {} will not be retried", spec.index);
        }

        event_bus_.emit(events::PartFailedEvent{upload_id, spec.index, slot.attempts, *error});
        record_failure(std::move(*error));
        return;
    }
}

bool UploadCoordinator::wait_backoff(std::chrono::milliseconds delay, const CancellationToken& cancel) const {
    const auto deadline = std::chrono::steady_clock::now() + delay;
    while (true) {
        if (stop_.load()) {
            return false;
        }
        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            return true;
        }
        const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        if (cancel.wait_for(std::min(remaining, kBackoffSlice))) {
            return false;
        }
    }
}

void UploadCoordinator::record_failure(UploadError error) {
    std::lock_guard lock(failure_mutex_);
    if (!first_error_) {
        first_error_ = std::move(error);
    } else {
        secondary_errors_.push_back(std::move(error));
    }
    stop_.store(true);
}

Result<CompletionRecord, UploadError> UploadCoordinator::complete_and_verify(
    const SourceFile& source,
    const Hasher& hasher,
    const std::optional<Digest>& file_digest,
    const CancellationToken& cancel) {
    const auto& plan = session_->plan();
    const std::uint64_t planned_bytes = plan.total_bytes();
    const Digest expected = hasher.combined_digest(session_->local_digests_in_order());

    auto completed = complete_with_retry(cancel);
    if (completed.is_error()) {
        return abort_with(completed.error());
    }
    const auto& response = completed.value();

    if (response.total_size != planned_bytes) {
        return abort_with(UploadError::completion_integrity("store reported a different object size",
                                                            std::to_string(planned_bytes),
                                                            std::to_string(response.total_size)));
    }

    if (response.combined_digest && options_.combined_digest_policy != CombinedDigestPolicy::Ignore) {
        const Digest& observed = *response.combined_digest;
        Digest comparable = expected;
        if (observed.algorithm != expected.algorithm) {
            auto rehashed = combined_digest_in(observed.algorithm, source);
            if (rehashed.is_error()) {
                return abort_with(rehashed.error());
            }
            comparable = rehashed.value();
        }
        if (observed != comparable) {
            if (options_.combined_digest_policy == CombinedDigestPolicy::Strict) {
                return abort_with(UploadError::completion_integrity("store reported a different combined digest",
                                                                    comparable.hex(), observed.hex()));
            }
            spdlog::warn("combined digest mismatch for {} tolerated by policy: expected {} observed {}",
                         target_of(*session_), comparable.hex(), observed.hex());
            event_bus_.emit(events::CombinedDigestMismatchEvent{session_->upload_id(), comparable.hex(),
                                                                observed.hex()});
        }
    }

    if (options_.verify_with_head) {
        auto head = store_.head(session_->bucket(), session_->key());
        if (head.is_error()) {
            return abort_with(UploadError::completion_integrity("could not verify the assembled object",
                                                                target_of(*session_),
                                                                head.error().describe()));
        }
        const auto& info = head.value();
        if (info.size != planned_bytes) {
            return abort_with(UploadError::completion_integrity("assembled object has a different size",
                                                                std::to_string(planned_bytes),
                                                                std::to_string(info.size)));
        }
        if (file_digest) {
            const auto it = info.metadata.find(to_string(file_digest->algorithm));
            const std::string found = it == info.metadata.end() ? std::string() : it->second;
            if (found != file_digest->base64()) {
                return abort_with(UploadError::completion_integrity("object metadata carries a different file digest",
                                                                    file_digest->base64(), found));
            }
        }
    }

    if (auto advanced = advance(UploadState::Completed); advanced.is_error()) {
        return abort_with(advanced.error());
    }

    CompletionRecord record;
    record.bucket = session_->bucket();
    record.key = session_->key();
    record.final_etag = response.etag;
    record.total_size_bytes = response.total_size;
    record.combined_digest_expected = expected;
    record.combined_digest_observed = response.combined_digest;

    const auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - session_->started_at());
    event_bus_.emit(events::UploadCompletedEvent{session_->upload_id(), record.bucket, record.key,
                                                 record.final_etag, record.total_size_bytes,
                                                 plan.part_count(), duration});
    return Ok(std::move(record));
}

Result<Digest, UploadError> UploadCoordinator::combined_digest_in(DigestAlgorithm algorithm,
                                                                 const SourceFile& source) const {
    const Hasher rehasher(algorithm);
    std::vector<Digest> digests;
    digests.reserve(session_->parts().size());
    try {
        for (const auto& spec : session_->plan().parts) {
            const PartResult& part = session_->part_slot(spec.index);
            // A reported part digest was already checked against the bytes sent.
            if (part.remote_digest && part.remote_digest->algorithm == algorithm) {
                digests.push_back(*part.remote_digest);
                continue;
            }
            auto bytes = source.read_part(spec);
            if (bytes.is_error()) {
                return Err(bytes.error());
            }
            digests.push_back(rehasher.digest(bytes.value()));
        }
        return Ok(rehasher.combined_digest(digests));
    } catch (const std::exception& e) {
        return Err(UploadError::io(std::string("could not rehash parts as ") + to_string(algorithm) + ": " +
                                   e.what()));
    }
}

Result<store::CompleteResponse, UploadError> UploadCoordinator::complete_with_retry(const CancellationToken& cancel) {
    const auto parts = session_->completed_parts();
    std::uint32_t attempts = 0;

    while (true) {
        ++attempts;
        auto response = store_.complete(session_->upload_id(), parts);
        if (response.is_ok()) {
            return Ok(std::move(response.value()));
        }

        UploadError error = UploadError::store(response.error());
        if (!options_.retry.should_retry(error, attempts) || !budget_->try_consume()) {
            return Err(std::move(error));
        }
        const auto delay = options_.retry.backoff_for(attempts + 1);
        spdlog::warn("complete for {} failed ({}); retrying in {}ms",
                     target_of(*session_), error.describe(), delay.count());
        if (!wait_backoff(delay, cancel)) {
            return Err(UploadError::cancelled("cancelled while retrying completion"));
        }
    }
}

Result<void, UploadError> UploadCoordinator::advance(UploadState next_state) {
    auto result = session_->transition_to(next_state);
    if (result.is_error()) {
        return Err(UploadError::invalid_argument(result.error()));
    }
    return Ok();
}

Result<CompletionRecord, UploadError> UploadCoordinator::abort_with(UploadError error) {
    if (auto marked = session_->mark_aborted(error.describe()); marked.is_error()) {
        spdlog::warn("could not mark {} aborted: {}", target_of(*session_), marked.error());
    }
    const bool aborted = abort_remote();
    event_bus_.emit(events::UploadAbortedEvent{session_->upload_id(), session_->bucket(), session_->key(),
                                               error, aborted});
    return Err(std::move(error));
}

Result<CompletionRecord, UploadError> UploadCoordinator::fail_before_initiate(UploadError error) {
    if (auto marked = session_->mark_aborted(error.describe()); marked.is_error()) {
        spdlog::warn("could not mark {} aborted: {}", target_of(*session_), marked.error());
    }
    event_bus_.emit(events::UploadAbortedEvent{std::string(), session_->bucket(), session_->key(), error, false});
    return Err(std::move(error));
}

bool UploadCoordinator::abort_remote() {
    if (remote_abort_attempted_ || session_->upload_id().empty()) {
        return false;
    }
    remote_abort_attempted_ = true;

    auto result = store_.abort(session_->upload_id());
    if (result.is_error()) {
        spdlog::warn("abort of upload {} for {} failed: {}", session_->upload_id(), target_of(*session_),
                     result.error().describe());
        return false;
    }
    spdlog::info("aborted upload {} for {}", session_->upload_id(), target_of(*session_));
    return true;
}

} // namespace mpu::upload
