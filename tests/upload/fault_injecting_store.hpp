#pragma once

#include "mpu/core/cancellation.hpp"
#include "mpu/store/memory_store.hpp"
#include "mpu/store/object_store.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <iterator>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <vector>

namespace mpu::test_support {

/**
 * @brief ObjectStore decorator that injects failures into a real store
 *
 * Configure the knobs before starting an upload; counters may be read after
 * it returns. Calls are forwarded to the wrapped InMemoryObjectStore, and
 * the injected fault is applied to the request or the response.
 */
class FaultInjectingStore : public store::ObjectStore {
public:
    explicit FaultInjectingStore(store::InMemoryObjectStore& inner) : inner_(inner) {}

    // Response-side faults
    std::optional<std::uint32_t> corrupt_part_digest;       ///< Flip a byte of the reported digest
    std::optional<std::uint32_t> short_ack_part;            ///< Report one byte less for this part
    std::int64_t total_size_delta = 0;                       ///< Added to the completed size
    bool corrupt_combined_digest = false;

    // Request-side faults
    std::optional<std::uint32_t> throttle_part;
    std::uint32_t throttle_count = 0;                        ///< Throttled responses before success
    std::set<std::uint32_t> fatal_parts;                     ///< AccessDenied on every attempt
    /// Hold each fatal part until all of them are in flight, then fail them in ascending index order.
    bool stagger_fatal_parts = false;
    std::uint32_t complete_failures = 0;                     ///< Retryable failures from complete()
    std::optional<StoreError> initiate_error;
    bool fail_abort = false;

    /// Cancel @p token once this part index has been acknowledged.
    std::optional<std::uint32_t> cancel_after_part;
    CancellationToken token_to_cancel;

    store::PartLimits limits() const override { return inner_.limits(); }

    Result<std::string, StoreError> initiate(const std::string& bucket,
                                             const std::string& key,
                                             const store::ObjectMetadata& metadata) override {
        initiate_calls++;
        if (initiate_error) {
            return Err(*initiate_error);
        }
        auto result = inner_.initiate(bucket, key, metadata);
        if (result.is_ok()) {
            std::lock_guard lock(mutex_);
            last_metadata_ = metadata;
        }
        return result;
    }

    Result<store::UploadPartResponse, StoreError> upload_part(const std::string& upload_id,
                                                              std::uint32_t part_index,
                                                              const std::vector<std::uint8_t>& data,
                                                              const store::Digest& content_digest) override {
        upload_part_calls++;
        {
            std::lock_guard lock(mutex_);
            attempts_by_part_[part_index]++;
            if (throttle_part && *throttle_part == part_index && throttled_ < throttle_count) {
                throttled_++;
                return Err(StoreError::from_code(StoreError::Code::Throttled, "slow down"));
            }
        }
        if (fatal_parts.count(part_index) > 0) {
            if (stagger_fatal_parts) {
                wait_for_fatal_peers(part_index);
            }
            return Err(StoreError::from_code(StoreError::Code::AccessDenied,
                                             "access denied for part " + std::to_string(part_index)));
        }

        auto result = inner_.upload_part(upload_id, part_index, data, content_digest);
        if (result.is_error()) {
            return result;
        }

        auto response = result.value();
        {
            std::lock_guard lock(mutex_);
            bytes_by_part_[part_index] = data.size();
        }
        if (corrupt_part_digest && *corrupt_part_digest == part_index && response.reported_digest &&
            !response.reported_digest->bytes.empty()) {
            response.reported_digest->bytes[0] ^= 0xFF;
        }
        if (short_ack_part && *short_ack_part == part_index && response.reported_size > 0) {
            response.reported_size -= 1;
        }
        if (cancel_after_part && *cancel_after_part == part_index) {
            token_to_cancel.cancel();
        }
        return Ok(std::move(response));
    }

    Result<store::CompleteResponse, StoreError> complete(const std::string& upload_id,
                                                         const std::vector<store::CompletedPart>& parts) override {
        complete_calls++;
        {
            std::lock_guard lock(mutex_);
            completed_parts_ = parts;
            if (complete_failed_ < complete_failures) {
                complete_failed_++;
                return Err(StoreError::from_code(StoreError::Code::ServiceUnavailable, "try again"));
            }
        }

        auto result = inner_.complete(upload_id, parts);
        if (result.is_error()) {
            return result;
        }
        auto response = result.value();
        response.total_size = static_cast<std::uint64_t>(static_cast<std::int64_t>(response.total_size) +
                                                         total_size_delta);
        if (corrupt_combined_digest && response.combined_digest && !response.combined_digest->bytes.empty()) {
            response.combined_digest->bytes[0] ^= 0xFF;
        }
        return Ok(std::move(response));
    }

    Result<void, StoreError> abort(const std::string& upload_id) override {
        abort_calls++;
        if (fail_abort) {
            return Err(StoreError::from_code(StoreError::Code::InternalError, "abort failed"));
        }
        return inner_.abort(upload_id);
    }

    Result<store::ObjectInfo, StoreError> head(const std::string& bucket, const std::string& key) override {
        head_calls++;
        return inner_.head(bucket, key);
    }

    std::uint32_t attempts_for(std::uint32_t part_index) const {
        std::lock_guard lock(mutex_);
        auto it = attempts_by_part_.find(part_index);
        return it == attempts_by_part_.end() ? 0 : it->second;
    }

    std::uint64_t total_bytes_sent() const {
        std::lock_guard lock(mutex_);
        std::uint64_t total = 0;
        for (const auto& [index, bytes] : bytes_by_part_) {
            total += bytes;
        }
        return total;
    }

    std::vector<store::CompletedPart> completed_parts() const {
        std::lock_guard lock(mutex_);
        return completed_parts_;
    }

    store::ObjectMetadata last_metadata() const {
        std::lock_guard lock(mutex_);
        return last_metadata_;
    }

    std::atomic<int> initiate_calls{0};
    std::atomic<int> upload_part_calls{0};
    std::atomic<int> complete_calls{0};
    std::atomic<int> abort_calls{0};
    std::atomic<int> head_calls{0};

private:
    void wait_for_fatal_peers(std::uint32_t part_index) {
        std::unique_lock lock(mutex_);
        ++fatal_arrivals_;
        fatal_arrived_.notify_all();
        fatal_arrived_.wait_for(lock, std::chrono::seconds(5),
                                [this] { return fatal_arrivals_ >= fatal_parts.size(); });
        const auto rank = std::distance(fatal_parts.begin(), fatal_parts.find(part_index));
        lock.unlock();
        std::this_thread::sleep_for(std::chrono::milliseconds(100) * rank);
    }

    store::InMemoryObjectStore& inner_;

    mutable std::mutex mutex_;
    std::uint32_t throttled_ = 0;
    std::uint32_t complete_failed_ = 0;
    std::size_t fatal_arrivals_ = 0;
    std::condition_variable fatal_arrived_;
    std::map<std::uint32_t, std::uint32_t> attempts_by_part_;
    std::map<std::uint32_t, std::uint64_t> bytes_by_part_;
    std::vector<store::CompletedPart> completed_parts_;
    store::ObjectMetadata last_metadata_;
};

} // namespace mpu::test_support
