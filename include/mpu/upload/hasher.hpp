#pragma once

#include "mpu/core/result.hpp"
#include "mpu/upload/types.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace mpu::upload {

/**
 * @brief Incremental digest over a stream of byte ranges
 *
 * Owns its own OpenSSL context, so distinct instances may be used from
 * different threads. Throws std::runtime_error if OpenSSL cannot allocate or
 * initialise a context.
 */
class StreamingDigest {
public:
    explicit StreamingDigest(DigestAlgorithm algorithm);
    ~StreamingDigest();

    StreamingDigest(const StreamingDigest&) = delete;
    StreamingDigest& operator=(const StreamingDigest&) = delete;
    StreamingDigest(StreamingDigest&&) noexcept;
    StreamingDigest& operator=(StreamingDigest&&) noexcept;

    void update(const std::uint8_t* data, std::size_t size);
    void update(const std::vector<std::uint8_t>& data) { update(data.data(), data.size()); }

    /// Finalise; the instance must not be updated afterwards.
    Digest finish();

private:
    struct Context;
    DigestAlgorithm algorithm_;
    std::unique_ptr<Context> context_;
};

/**
 * @brief Stateless digest helpers; safe to call concurrently
 *
 * combined_digest() mirrors how S3-style stores derive the whole-object
 * checksum of a multipart upload: the digest of the concatenated raw
 * per-part digests, in ascending part order.
 */
class Hasher {
public:
    explicit Hasher(DigestAlgorithm algorithm = DigestAlgorithm::Md5) : algorithm_(algorithm) {}

    [[nodiscard]] DigestAlgorithm algorithm() const noexcept { return algorithm_; }

    Digest digest(const std::uint8_t* data, std::size_t size) const;
    Digest digest(const std::vector<std::uint8_t>& data) const { return digest(data.data(), data.size()); }
    Digest digest(const std::string& data) const;

    Digest combined_digest(const std::vector<Digest>& part_digests) const;

    /// Whole-file digest, read in fixed-size blocks.
    Result<Digest, UploadError> file_digest(const std::filesystem::path& path) const;

    /// "<hex>-<part count>", the ETag form S3 reports for multipart objects.
    static std::string multipart_etag(const Digest& combined, std::size_t part_count);

private:
    DigestAlgorithm algorithm_;
};

} // namespace mpu::upload
