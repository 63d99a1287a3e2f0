#pragma once

#include "mpu/store/object_store.hpp"
#include "mpu/upload/hasher.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace mpu::store {

/**
 * @brief Thread-safe in-process ObjectStore
 *
 * Behaves like an S3-style multipart API: per-part ETags are the hex digest
 * of the part, the final ETag is "<hex(combined)>-<N>", every part but the
 * last must reach the minimum part size, and completion validates each
 * listed ETag. Deterministic for identical inputs, whatever the order in
 * which parts arrive.
 *
 * CONCURRENCY MODEL:
 * std::shared_mutex; reads (head, inspection) share, mutations are
 * exclusive. Part hashing happens outside the lock.
 */
class InMemoryObjectStore : public ObjectStore {
public:
    struct Options {
        upload::DigestAlgorithm algorithm = upload::DigestAlgorithm::Md5;
        PartLimits limits{};
        bool report_part_digests = true;
        bool report_combined_digest = true;
    };

    InMemoryObjectStore();
    explicit InMemoryObjectStore(Options options);

    void create_bucket(const std::string& bucket);
    [[nodiscard]] bool has_bucket(const std::string& bucket) const;

    PartLimits limits() const override { return options_.limits; }

    Result<std::string, StoreError> initiate(const std::string& bucket,
                                             const std::string& key,
                                             const ObjectMetadata& metadata) override;

    Result<UploadPartResponse, StoreError> upload_part(const std::string& upload_id,
                                                       std::uint32_t part_index,
                                                       const std::vector<std::uint8_t>& data,
                                                       const Digest& content_digest) override;

    Result<CompleteResponse, StoreError> complete(const std::string& upload_id,
                                                  const std::vector<CompletedPart>& parts) override;

    Result<void, StoreError> abort(const std::string& upload_id) override;

    Result<ObjectInfo, StoreError> head(const std::string& bucket, const std::string& key) override;

    // Inspection helpers
    [[nodiscard]] std::optional<std::vector<std::uint8_t>> object_data(const std::string& bucket,
                                                                       const std::string& key) const;
    [[nodiscard]] bool upload_exists(const std::string& upload_id) const;
    [[nodiscard]] std::size_t pending_upload_count() const;
    [[nodiscard]] std::size_t object_count() const;

private:
    struct StoredPart {
        std::vector<std::uint8_t> data;
        Digest digest;
        std::string etag;
    };

    struct PendingUpload {
        std::string bucket;
        std::string key;
        ObjectMetadata metadata;
        std::map<std::uint32_t, StoredPart> parts;
    };

    struct StoredObject {
        std::vector<std::uint8_t> data;
        std::string etag;
        ObjectMetadata metadata;
    };

    static std::string object_key(const std::string& bucket, const std::string& key);

    Options options_;
    upload::Hasher hasher_;

    mutable std::shared_mutex mutex_;
    std::unordered_set<std::string> buckets_;
    std::unordered_map<std::string, PendingUpload> uploads_;
    std::unordered_map<std::string, StoredObject> objects_;
    std::uint64_t upload_counter_ = 0;
};

} // namespace mpu::store
