#pragma once

#include "mpu/core/errors.hpp"
#include "mpu/core/result.hpp"
#include "mpu/upload/chunker.hpp"
#include "mpu/upload/coordinator.hpp"
#include "mpu/upload/retry_policy.hpp"
#include "mpu/upload/types.hpp"

#include <nlohmann/json_fwd.hpp>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace mpu::config {

constexpr std::uint64_t kDefaultPartSize = 10ULL * 1024 * 1024;

/**
 * @brief Uploader settings, from a JSON file and/or command-line flags
 *
 * Every key is optional. A missing key keeps the default below; an unknown
 * key is ignored. Example:
 *
 *   {
 *     "part_size": 16777216,
 *     "concurrency": 8,
 *     "retry": { "max_attempts": 5, "initial_backoff_ms": 100 },
 *     "digest_algorithm": "sha256",
 *     "combined_digest_policy": "warn",
 *     "limits": { "min_part_size": 5242880 },
 *     "log_level": "debug"
 *   }
 */
struct UploaderConfig {
    std::uint64_t part_size = kDefaultPartSize;
    std::size_t concurrency = 4;
    upload::RetryPolicy retry;
    upload::DigestAlgorithm digest_algorithm = upload::DigestAlgorithm::Md5;
    upload::CombinedDigestPolicy combined_digest_policy = upload::CombinedDigestPolicy::Strict;
    bool verify_with_head = true;
    bool attach_file_digest = true;
    std::optional<upload::PartLimits> limits;
    std::string log_level = "info";

    /// InvalidArgument describing the first bad value, if any.
    [[nodiscard]] Result<void, UploadError> validate() const;

    [[nodiscard]] upload::CoordinatorOptions to_coordinator_options() const;
};

std::optional<upload::DigestAlgorithm> parse_digest_algorithm(const std::string& name);
std::optional<upload::CombinedDigestPolicy> parse_combined_digest_policy(const std::string& name);
bool is_known_log_level(const std::string& name);

/// Overlay the keys present in @p document onto the defaults, then validate.
Result<UploaderConfig, UploadError> config_from_json(const nlohmann::json& document);

Result<UploaderConfig, UploadError> load_config(const std::filesystem::path& path);

} // namespace mpu::config
