#include "mpu/store/memory_store.hpp"

#include <mutex>

namespace mpu::store {

using upload::Hasher;

InMemoryObjectStore::InMemoryObjectStore() : InMemoryObjectStore(Options{}) {}

InMemoryObjectStore::InMemoryObjectStore(Options options)
    : options_(options), hasher_(options.algorithm) {}

void InMemoryObjectStore::create_bucket(const std::string& bucket) {
    std::unique_lock lock(mutex_);
    buckets_.insert(bucket);
}

bool InMemoryObjectStore::has_bucket(const std::string& bucket) const {
    std::shared_lock lock(mutex_);
    return buckets_.count(bucket) > 0;
}

Result<std::string, StoreError> InMemoryObjectStore::initiate(const std::string& bucket,
                                                              const std::string& key,
                                                              const ObjectMetadata& metadata) {
    std::unique_lock lock(mutex_);
    if (buckets_.count(bucket) == 0) {
        return Err(StoreError::from_code(StoreError::Code::NoSuchBucket, "bucket " + bucket + " does not exist"));
    }
    if (key.empty()) {
        return Err(StoreError::from_code(StoreError::Code::InvalidRequest, "empty object key"));
    }

    const std::string upload_id = "mem-upload-" + std::to_string(++upload_counter_);
    uploads_.emplace(upload_id, PendingUpload{bucket, key, metadata, {}});
    return Ok(upload_id);
}

Result<UploadPartResponse, StoreError> InMemoryObjectStore::upload_part(const std::string& upload_id,
                                                                        std::uint32_t part_index,
                                                                        const std::vector<std::uint8_t>& data,
                                                                        const Digest& content_digest) {
    if (part_index == 0 || part_index > options_.limits.max_part_count) {
        return Err(StoreError::from_code(StoreError::Code::InvalidRequest,
                                         "part number " + std::to_string(part_index) + " out of range"));
    }
    if (data.size() > options_.limits.max_part_size) {
        return Err(StoreError::from_code(StoreError::Code::InvalidRequest, "part exceeds the maximum part size"));
    }

    const Digest digest = hasher_.digest(data);
    if (!content_digest.empty()) {
        const Digest received = content_digest.algorithm == digest.algorithm
                                    ? digest
                                    : Hasher(content_digest.algorithm).digest(data);
        if (received != content_digest) {
            return Err(StoreError::from_code(StoreError::Code::BadDigest,
                                             "content digest does not match the received bytes"));
        }
    }

    StoredPart part{data, digest, digest.hex()};

    std::unique_lock lock(mutex_);
    auto it = uploads_.find(upload_id);
    if (it == uploads_.end()) {
        return Err(StoreError::from_code(StoreError::Code::NoSuchUpload, "unknown upload " + upload_id));
    }
    // Re-uploading a part number replaces the earlier bytes.
    it->second.parts[part_index] = part;

    UploadPartResponse response;
    response.etag = part.etag;
    response.reported_size = part.data.size();
    if (options_.report_part_digests) {
        response.reported_digest = digest;
    }
    return Ok(std::move(response));
}

Result<CompleteResponse, StoreError> InMemoryObjectStore::complete(const std::string& upload_id,
                                                                   const std::vector<CompletedPart>& parts) {
    std::unique_lock lock(mutex_);
    auto it = uploads_.find(upload_id);
    if (it == uploads_.end()) {
        return Err(StoreError::from_code(StoreError::Code::NoSuchUpload, "unknown upload " + upload_id));
    }
    if (parts.empty()) {
        return Err(StoreError::from_code(StoreError::Code::InvalidRequest, "completion lists no parts"));
    }

    auto& pending = it->second;
    std::vector<Digest> digests;
    digests.reserve(parts.size());
    std::vector<std::uint8_t> assembled;
    std::uint32_t previous_index = 0;

    for (std::size_t i = 0; i < parts.size(); ++i) {
        const auto& listed = parts[i];
        if (listed.index <= previous_index) {
            return Err(StoreError::from_code(StoreError::Code::InvalidPart, "parts are not in ascending order"));
        }
        previous_index = listed.index;

        auto stored = pending.parts.find(listed.index);
        if (stored == pending.parts.end() || stored->second.etag != listed.etag) {
            return Err(StoreError::from_code(StoreError::Code::InvalidPart,
                                             "part " + std::to_string(listed.index) + " not found or ETag mismatch"));
        }
        const bool last = i + 1 == parts.size();
        if (!last && stored->second.data.size() < options_.limits.min_part_size) {
            return Err(StoreError::from_code(StoreError::Code::EntityTooSmall,
                                             "part " + std::to_string(listed.index) + " is below the minimum size"));
        }
        assembled.insert(assembled.end(), stored->second.data.begin(), stored->second.data.end());
        digests.push_back(stored->second.digest);
    }

    const Digest combined = hasher_.combined_digest(digests);

    CompleteResponse response;
    response.etag = Hasher::multipart_etag(combined, parts.size());
    response.total_size = assembled.size();
    if (options_.report_combined_digest) {
        response.combined_digest = combined;
    }

    objects_[object_key(pending.bucket, pending.key)] =
        StoredObject{std::move(assembled), response.etag, pending.metadata};
    uploads_.erase(it);
    return Ok(std::move(response));
}

Result<void, StoreError> InMemoryObjectStore::abort(const std::string& upload_id) {
    std::unique_lock lock(mutex_);
    if (uploads_.erase(upload_id) == 0) {
        return Err(StoreError::from_code(StoreError::Code::NoSuchUpload, "unknown upload " + upload_id));
    }
    return Ok();
}

Result<ObjectInfo, StoreError> InMemoryObjectStore::head(const std::string& bucket, const std::string& key) {
    std::shared_lock lock(mutex_);
    if (buckets_.count(bucket) == 0) {
        return Err(StoreError::from_code(StoreError::Code::NoSuchBucket, "bucket " + bucket + " does not exist"));
    }
    auto it = objects_.find(object_key(bucket, key));
    if (it == objects_.end()) {
        return Err(StoreError::from_code(StoreError::Code::NoSuchKey, bucket + "/" + key + " does not exist"));
    }
    return Ok(ObjectInfo{it->second.data.size(), it->second.etag, it->second.metadata});
}

std::optional<std::vector<std::uint8_t>> InMemoryObjectStore::object_data(const std::string& bucket,
                                                                           const std::string& key) const {
    std::shared_lock lock(mutex_);
    auto it = objects_.find(object_key(bucket, key));
    if (it == objects_.end()) {
        return std::nullopt;
    }
    return it->second.data;
}

bool InMemoryObjectStore::upload_exists(const std::string& upload_id) const {
    std::shared_lock lock(mutex_);
    return uploads_.count(upload_id) > 0;
}

std::size_t InMemoryObjectStore::pending_upload_count() const {
    std::shared_lock lock(mutex_);
    return uploads_.size();
}

std::size_t InMemoryObjectStore::object_count() const {
    std::shared_lock lock(mutex_);
    return objects_.size();
}

std::string InMemoryObjectStore::object_key(const std::string& bucket, const std::string& key) {
    return bucket + '\0' + key;
}

} // namespace mpu::store
