#pragma once

#include "mpu/core/errors.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace mpu::upload {

enum class DigestAlgorithm {
    Md5,
    Sha256
};

const char* to_string(DigestAlgorithm algorithm) noexcept;

/**
 * @brief Raw digest bytes plus the algorithm that produced them
 */
struct Digest {
    DigestAlgorithm algorithm = DigestAlgorithm::Md5;
    std::vector<std::uint8_t> bytes;

    [[nodiscard]] bool empty() const noexcept { return bytes.empty(); }
    [[nodiscard]] std::string hex() const;
    [[nodiscard]] std::string base64() const;

    static std::optional<Digest> from_hex(DigestAlgorithm algorithm, const std::string& hex);
    static std::optional<Digest> from_base64(DigestAlgorithm algorithm, const std::string& encoded);

    friend bool operator==(const Digest& lhs, const Digest& rhs) {
        return lhs.algorithm == rhs.algorithm && lhs.bytes == rhs.bytes;
    }
    friend bool operator!=(const Digest& lhs, const Digest& rhs) { return !(lhs == rhs); }
};

/**
 * @brief One contiguous byte range of the source file
 */
struct PartSpec {
    std::uint32_t index = 0;          ///< 1-based
    std::uint64_t byte_offset = 0;
    std::uint64_t byte_length = 0;

    friend bool operator==(const PartSpec& lhs, const PartSpec& rhs) {
        return lhs.index == rhs.index && lhs.byte_offset == rhs.byte_offset &&
               lhs.byte_length == rhs.byte_length;
    }
};

/**
 * @brief Ordered, contiguous partition of a file; immutable once planned
 */
struct UploadPlan {
    std::uint64_t file_size = 0;
    std::uint64_t part_size = 0;
    std::vector<PartSpec> parts;

    [[nodiscard]] std::size_t part_count() const noexcept { return parts.size(); }
    [[nodiscard]] std::uint64_t total_bytes() const noexcept;

    friend bool operator==(const UploadPlan& lhs, const UploadPlan& rhs) {
        return lhs.file_size == rhs.file_size && lhs.part_size == rhs.part_size && lhs.parts == rhs.parts;
    }
};

enum class PartState {
    Pending,
    Uploading,
    Verified,
    Failed
};

const char* to_string(PartState state) noexcept;

struct PartResult {
    std::uint32_t index = 0;
    std::string etag;
    Digest local_digest;
    std::optional<Digest> remote_digest;   ///< Absent when the store reports none
    std::uint64_t size_bytes = 0;          ///< Size the store acknowledged
    PartState state = PartState::Pending;
    std::uint32_t attempts = 0;
    std::optional<UploadError> last_error;
};

/**
 * @brief Outcome of a verified completion; read-only once built
 */
struct CompletionRecord {
    std::string bucket;
    std::string key;
    std::string final_etag;
    std::uint64_t total_size_bytes = 0;
    Digest combined_digest_expected;
    std::optional<Digest> combined_digest_observed;

    friend bool operator==(const CompletionRecord& lhs, const CompletionRecord& rhs) {
        return lhs.bucket == rhs.bucket && lhs.key == rhs.key && lhs.final_etag == rhs.final_etag &&
               lhs.total_size_bytes == rhs.total_size_bytes &&
               lhs.combined_digest_expected == rhs.combined_digest_expected &&
               lhs.combined_digest_observed == rhs.combined_digest_observed;
    }
};

enum class UploadState {
    Initiating,
    InProgress,
    Completing,
    Completed,
    Aborted
};

const char* to_string(UploadState state) noexcept;

} // namespace mpu::upload
