#include "mpu/store/local_store.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <fstream>
#include <iomanip>
#include <sstream>
#include <system_error>

namespace mpu::store {

namespace fs = std::filesystem;
using json = nlohmann::json;
using upload::Hasher;

namespace {

constexpr std::size_t kCopyBlockSize = 64 * 1024;

StoreError io_error(const std::string& message) {
    return StoreError::from_code(StoreError::Code::InternalError, message);
}

Result<void, StoreError> write_file(const fs::path& path, const std::uint8_t* data, std::size_t size) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        return Err(io_error("failed to create " + path.string()));
    }
    out.write(reinterpret_cast<const char*>(data), static_cast<std::streamsize>(size));
    out.flush();
    if (!out) {
        return Err(io_error("failed to write " + path.string()));
    }
    return Ok();
}

Result<void, StoreError> move_into_place(const fs::path& from, const fs::path& to) {
    std::error_code ec;
    fs::rename(from, to, ec);
    if (ec) {
        fs::remove(from, ec);
        return Err(io_error("failed to move " + from.string() + " to " + to.string()));
    }
    return Ok();
}

} // namespace

LocalObjectStore::LocalObjectStore(fs::path root, upload::DigestAlgorithm algorithm, PartLimits limits)
    : root_(std::move(root)), limits_(limits), hasher_(algorithm) {}

Result<void, StoreError> LocalObjectStore::create_bucket(const std::string& bucket) {
    if (bucket.empty() || !is_safe_key(bucket) || bucket.find('/') != std::string::npos || bucket.front() == '.') {
        return Err(StoreError::from_code(StoreError::Code::InvalidRequest, "invalid bucket name: " + bucket));
    }
    std::error_code ec;
    fs::create_directories(root_ / bucket, ec);
    if (ec) {
        return Err(io_error("failed to create bucket directory: " + (root_ / bucket).string()));
    }
    return Ok();
}

fs::path LocalObjectStore::object_path(const std::string& bucket, const std::string& key) const {
    return root_ / bucket / fs::path(key).relative_path();
}

fs::path LocalObjectStore::staging_dir(const std::string& upload_id) const {
    return root_ / ".uploads" / upload_id;
}

fs::path LocalObjectStore::metadata_path(const std::string& bucket, const std::string& key) const {
    fs::path path = root_ / ".metadata" / bucket / fs::path(key).relative_path();
    path += ".json";
    return path;
}

std::string LocalObjectStore::part_file_name(std::uint32_t part_index) {
    std::ostringstream oss;
    oss << "part-" << std::setw(5) << std::setfill('0') << part_index;
    return oss.str();
}

bool LocalObjectStore::is_safe_key(const std::string& key) {
    if (key.empty()) {
        return false;
    }
    for (const auto& component : fs::path(key)) {
        if (component == "..") {
            return false;
        }
    }
    return true;
}

Result<void, StoreError> LocalObjectStore::ensure_parent_exists(const fs::path& path) {
    const auto parent = path.parent_path();
    std::error_code ec;
    fs::create_directories(parent, ec);
    if (ec && !fs::exists(parent)) {
        return Err(io_error("failed to create directory: " + parent.string()));
    }
    return Ok();
}

Result<std::string, StoreError> LocalObjectStore::initiate(const std::string& bucket,
                                                           const std::string& key,
                                                           const ObjectMetadata& metadata) {
    std::error_code ec;
    if (bucket.empty() || !fs::is_directory(root_ / bucket, ec)) {
        return Err(StoreError::from_code(StoreError::Code::NoSuchBucket, "bucket " + bucket + " does not exist"));
    }
    if (!is_safe_key(key)) {
        return Err(StoreError::from_code(StoreError::Code::InvalidRequest, "invalid object key: " + key));
    }

    std::string upload_id;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        upload_id = "local-upload-" + std::to_string(++upload_counter_);
    }

    fs::create_directories(staging_dir(upload_id), ec);
    if (ec) {
        return Err(io_error("failed to create staging directory for " + upload_id));
    }

    std::lock_guard<std::mutex> lock(mutex_);
    uploads_.emplace(upload_id, PendingUpload{bucket, key, metadata, {}});
    spdlog::debug("[LocalStore] Initiated {} for {}/{}", upload_id, bucket, key);
    return Ok(upload_id);
}

Result<UploadPartResponse, StoreError> LocalObjectStore::upload_part(const std::string& upload_id,
                                                                     std::uint32_t part_index,
                                                                     const std::vector<std::uint8_t>& data,
                                                                     const Digest& content_digest) {
    if (part_index == 0 || part_index > limits_.max_part_count) {
        return Err(StoreError::from_code(StoreError::Code::InvalidRequest,
                                         "part number " + std::to_string(part_index) + " out of range"));
    }
    if (data.size() > limits_.max_part_size) {
        return Err(StoreError::from_code(StoreError::Code::InvalidRequest, "part exceeds the maximum part size"));
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (uploads_.count(upload_id) == 0) {
            return Err(StoreError::from_code(StoreError::Code::NoSuchUpload, "unknown upload " + upload_id));
        }
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

    // Each part lands under a private temporary name first so a concurrent
    // re-upload of the same part number never leaves a torn file behind.
    const fs::path final_path = staging_dir(upload_id) / part_file_name(part_index);
    fs::path temp_path = final_path;
    temp_path += ".tmp-" + digest.hex();

    if (auto res = write_file(temp_path, data.data(), data.size()); res.is_error()) {
        return Err(res.error());
    }
    if (auto res = move_into_place(temp_path, final_path); res.is_error()) {
        return Err(res.error());
    }

    StagedPart staged{data.size(), digest, digest.hex()};

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = uploads_.find(upload_id);
    if (it == uploads_.end()) {
        // Aborted while the part was being written.
        std::error_code ec;
        fs::remove(final_path, ec);
        return Err(StoreError::from_code(StoreError::Code::NoSuchUpload, "unknown upload " + upload_id));
    }
    it->second.parts[part_index] = staged;

    UploadPartResponse response;
    response.etag = staged.etag;
    response.reported_digest = digest;
    response.reported_size = staged.size;
    return Ok(std::move(response));
}

Result<CompleteResponse, StoreError> LocalObjectStore::complete(const std::string& upload_id,
                                                                const std::vector<CompletedPart>& parts) {
    PendingUpload pending;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = uploads_.find(upload_id);
        if (it == uploads_.end()) {
            return Err(StoreError::from_code(StoreError::Code::NoSuchUpload, "unknown upload " + upload_id));
        }
        pending = it->second;
    }
    if (parts.empty()) {
        return Err(StoreError::from_code(StoreError::Code::InvalidRequest, "completion lists no parts"));
    }

    std::vector<Digest> digests;
    digests.reserve(parts.size());
    std::uint32_t previous_index = 0;
    for (std::size_t i = 0; i < parts.size(); ++i) {
        const auto& listed = parts[i];
        if (listed.index <= previous_index) {
            return Err(StoreError::from_code(StoreError::Code::InvalidPart, "parts are not in ascending order"));
        }
        previous_index = listed.index;

        auto staged = pending.parts.find(listed.index);
        if (staged == pending.parts.end() || staged->second.etag != listed.etag) {
            return Err(StoreError::from_code(StoreError::Code::InvalidPart,
                                             "part " + std::to_string(listed.index) + " not found or ETag mismatch"));
        }
        const bool last = i + 1 == parts.size();
        if (!last && staged->second.size < limits_.min_part_size) {
            return Err(StoreError::from_code(StoreError::Code::EntityTooSmall,
                                             "part " + std::to_string(listed.index) + " is below the minimum size"));
        }
        digests.push_back(staged->second.digest);
    }

    const fs::path destination = object_path(pending.bucket, pending.key);
    if (auto res = ensure_parent_exists(destination); res.is_error()) {
        return Err(res.error());
    }
    fs::path assembling = destination;
    assembling += ".assembling-" + upload_id;

    std::uint64_t total_size = 0;
    {
        std::ofstream out(assembling, std::ios::binary | std::ios::trunc);
        if (!out) {
            return Err(io_error("failed to create " + assembling.string()));
        }

        std::vector<char> buffer(kCopyBlockSize);
        for (const auto& listed : parts) {
            const fs::path part_path = staging_dir(upload_id) / part_file_name(listed.index);
            std::ifstream in(part_path, std::ios::binary);
            if (!in) {
                out.close();
                std::error_code ec;
                fs::remove(assembling, ec);
                return Err(StoreError::from_code(StoreError::Code::InvalidPart,
                                                 "staged part missing: " + part_path.string()));
            }
            while (in) {
                in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
                const auto got = in.gcount();
                if (got > 0) {
                    out.write(buffer.data(), got);
                    total_size += static_cast<std::uint64_t>(got);
                }
            }
        }
        out.flush();
        if (!out) {
            out.close();
            std::error_code ec;
            fs::remove(assembling, ec);
            return Err(io_error("failed to write " + assembling.string()));
        }
    }

    if (auto res = move_into_place(assembling, destination); res.is_error()) {
        return Err(res.error());
    }

    const Digest combined = hasher_.combined_digest(digests);
    CompleteResponse response;
    response.etag = Hasher::multipart_etag(combined, parts.size());
    response.total_size = total_size;
    response.combined_digest = combined;

    json sidecar;
    sidecar["size"] = total_size;
    sidecar["etag"] = response.etag;
    sidecar["metadata"] = pending.metadata;

    const fs::path sidecar_path = metadata_path(pending.bucket, pending.key);
    if (auto res = ensure_parent_exists(sidecar_path); res.is_error()) {
        return Err(res.error());
    }
    const std::string serialized = sidecar.dump(2);
    if (auto res = write_file(sidecar_path, reinterpret_cast<const std::uint8_t*>(serialized.data()),
                              serialized.size());
        res.is_error()) {
        return Err(res.error());
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        uploads_.erase(upload_id);
    }
    std::error_code ec;
    fs::remove_all(staging_dir(upload_id), ec);
    if (ec) {
        spdlog::warn("[LocalStore] Failed to clean staging for {}: {}", upload_id, ec.message());
    }

    spdlog::debug("[LocalStore] Completed {} -> {} ({} bytes)", upload_id, destination.string(), total_size);
    return Ok(std::move(response));
}

Result<void, StoreError> LocalObjectStore::abort(const std::string& upload_id) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (uploads_.erase(upload_id) == 0) {
            return Err(StoreError::from_code(StoreError::Code::NoSuchUpload, "unknown upload " + upload_id));
        }
    }
    std::error_code ec;
    fs::remove_all(staging_dir(upload_id), ec);
    if (ec) {
        return Err(io_error("failed to remove staged parts for " + upload_id + ": " + ec.message()));
    }
    return Ok();
}

Result<ObjectInfo, StoreError> LocalObjectStore::head(const std::string& bucket, const std::string& key) {
    std::error_code ec;
    if (!fs::is_directory(root_ / bucket, ec)) {
        return Err(StoreError::from_code(StoreError::Code::NoSuchBucket, "bucket " + bucket + " does not exist"));
    }
    if (!is_safe_key(key)) {
        return Err(StoreError::from_code(StoreError::Code::InvalidRequest, "invalid object key: " + key));
    }

    const fs::path path = object_path(bucket, key);
    if (!fs::is_regular_file(path, ec)) {
        return Err(StoreError::from_code(StoreError::Code::NoSuchKey, bucket + "/" + key + " does not exist"));
    }

    ObjectInfo info;
    info.size = fs::file_size(path, ec);
    if (ec) {
        return Err(io_error("failed to stat " + path.string()));
    }

    std::ifstream in(metadata_path(bucket, key));
    if (!in) {
        // Objects placed in the tree by hand have no sidecar.
        return Ok(std::move(info));
    }
    const json sidecar = json::parse(in, nullptr, false);
    if (sidecar.is_discarded() || !sidecar.is_object()) {
        spdlog::warn("[LocalStore] Ignoring unreadable metadata for {}/{}", bucket, key);
        return Ok(std::move(info));
    }
    info.etag = sidecar.value("etag", std::string{});
    if (auto it = sidecar.find("metadata"); it != sidecar.end() && it->is_object()) {
        for (const auto& entry : it->items()) {
            if (entry.value().is_string()) {
                info.metadata[entry.key()] = entry.value().get<std::string>();
            }
        }
    }
    return Ok(std::move(info));
}

} // namespace mpu::store
