#pragma once

#include "mpu/store/object_store.hpp"
#include "mpu/upload/hasher.hpp"

#include <cstdint>
#include <filesystem>
#include <mutex>
#include <string>
#include <unordered_map>

namespace mpu::store {

/**
 * @brief ObjectStore backed by a local directory tree
 *
 * LAYOUT:
 * <root>/<bucket>/<key>                    assembled objects
 * <root>/.metadata/<bucket>/<key>.json     size, etag, user metadata
 * <root>/.uploads/<upload-id>/part-NNNNN   staged parts
 *
 * A bucket is a directory directly under the root. Parts are written to a
 * temporary file and renamed into place; completion concatenates them in
 * ascending part order into a temporary file that is renamed over the key.
 */
class LocalObjectStore : public ObjectStore {
public:
    explicit LocalObjectStore(std::filesystem::path root,
                              upload::DigestAlgorithm algorithm = upload::DigestAlgorithm::Md5,
                              PartLimits limits = PartLimits{});

    Result<void, StoreError> create_bucket(const std::string& bucket);

    PartLimits limits() const override { return limits_; }

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

    [[nodiscard]] const std::filesystem::path& root() const noexcept { return root_; }
    [[nodiscard]] std::filesystem::path object_path(const std::string& bucket, const std::string& key) const;

private:
    struct StagedPart {
        std::uint64_t size = 0;
        Digest digest;
        std::string etag;
    };

    struct PendingUpload {
        std::string bucket;
        std::string key;
        ObjectMetadata metadata;
        std::unordered_map<std::uint32_t, StagedPart> parts;
    };

    std::filesystem::path staging_dir(const std::string& upload_id) const;
    std::filesystem::path metadata_path(const std::string& bucket, const std::string& key) const;

    static std::string part_file_name(std::uint32_t part_index);
    static bool is_safe_key(const std::string& key);
    static Result<void, StoreError> ensure_parent_exists(const std::filesystem::path& path);

    std::filesystem::path root_;
    PartLimits limits_;
    upload::Hasher hasher_;

    std::mutex mutex_;
    std::unordered_map<std::string, PendingUpload> uploads_;
    std::uint64_t upload_counter_ = 0;
};

} // namespace mpu::store
