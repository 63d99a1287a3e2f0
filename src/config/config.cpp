#include "mpu/config/config.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <array>
#include <fstream>

namespace mpu::config {

using json = nlohmann::json;

std::optional<upload::DigestAlgorithm> parse_digest_algorithm(const std::string& name) {
    if (name == "md5") {
        return upload::DigestAlgorithm::Md5;
    }
    if (name == "sha256") {
        return upload::DigestAlgorithm::Sha256;
    }
    return std::nullopt;
}

std::optional<upload::CombinedDigestPolicy> parse_combined_digest_policy(const std::string& name) {
    if (name == "strict") {
        return upload::CombinedDigestPolicy::Strict;
    }
    if (name == "warn") {
        return upload::CombinedDigestPolicy::Warn;
    }
    if (name == "ignore") {
        return upload::CombinedDigestPolicy::Ignore;
    }
    return std::nullopt;
}

bool is_known_log_level(const std::string& name) {
    static const std::array<const char*, 7> levels = {
        "trace", "debug", "info", "warn", "error", "critical", "off"};
    for (const char* level : levels) {
        if (name == level) {
            return true;
        }
    }
    return false;
}

Result<void, UploadError> UploaderConfig::validate() const {
    if (concurrency == 0) {
        return Err(UploadError::invalid_argument("concurrency must be at least 1"));
    }
    if (part_size == 0) {
        return Err(UploadError::invalid_argument("part_size must be positive"));
    }
    if (retry.max_attempts == 0) {
        return Err(UploadError::invalid_argument("retry.max_attempts must be at least 1"));
    }
    if (retry.backoff_multiplier < 1.0) {
        return Err(UploadError::invalid_argument("retry.backoff_multiplier must be >= 1.0"));
    }
    if (retry.initial_backoff.count() < 0 || retry.max_backoff.count() < 0) {
        return Err(UploadError::invalid_argument("retry backoff must not be negative"));
    }
    if (retry.max_backoff < retry.initial_backoff) {
        return Err(UploadError::invalid_argument("retry.max_backoff_ms is below retry.initial_backoff_ms"));
    }
    if (limits) {
        if (limits->min_part_size == 0 || limits->max_part_count == 0 ||
            limits->min_part_size > limits->max_part_size) {
            return Err(UploadError::invalid_argument("inconsistent part limits"));
        }
        if (part_size > limits->max_part_size) {
            return Err(UploadError::invalid_argument("part_size " + std::to_string(part_size) +
                                                     " exceeds limits.max_part_size"));
        }
    }
    if (!is_known_log_level(log_level)) {
        return Err(UploadError::invalid_argument("unknown log_level: " + log_level));
    }
    return Ok();
}

upload::CoordinatorOptions UploaderConfig::to_coordinator_options() const {
    upload::CoordinatorOptions options;
    options.concurrency = concurrency;
    options.retry = retry;
    options.digest_algorithm = digest_algorithm;
    options.combined_digest_policy = combined_digest_policy;
    options.part_size_hint = part_size;
    options.limits = limits;
    options.attach_file_digest = attach_file_digest;
    options.verify_with_head = verify_with_head;
    return options;
}

Result<UploaderConfig, UploadError> config_from_json(const json& document) {
    if (!document.is_object()) {
        return Err(UploadError::invalid_argument("configuration must be a JSON object"));
    }

    UploaderConfig config;
    try {
        config.part_size = document.value("part_size", config.part_size);
        config.concurrency = document.value("concurrency", config.concurrency);
        config.verify_with_head = document.value("verify_with_head", config.verify_with_head);
        config.attach_file_digest = document.value("attach_file_digest", config.attach_file_digest);
        config.log_level = document.value("log_level", config.log_level);

        if (document.contains("digest_algorithm")) {
            const auto name = document.at("digest_algorithm").get<std::string>();
            auto algorithm = parse_digest_algorithm(name);
            if (!algorithm) {
                return Err(UploadError::invalid_argument("unknown digest_algorithm: " + name));
            }
            config.digest_algorithm = *algorithm;
        }

        if (document.contains("combined_digest_policy")) {
            const auto name = document.at("combined_digest_policy").get<std::string>();
            auto policy = parse_combined_digest_policy(name);
            if (!policy) {
                return Err(UploadError::invalid_argument("unknown combined_digest_policy: " + name));
            }
            config.combined_digest_policy = *policy;
        }

        if (auto it = document.find("retry"); it != document.end()) {
            const json& retry = *it;
            auto& policy = config.retry;
            policy.max_attempts = retry.value("max_attempts", policy.max_attempts);
            policy.initial_backoff = std::chrono::milliseconds(
                retry.value("initial_backoff_ms", static_cast<std::int64_t>(policy.initial_backoff.count())));
            policy.backoff_multiplier = retry.value("backoff_multiplier", policy.backoff_multiplier);
            policy.max_backoff = std::chrono::milliseconds(
                retry.value("max_backoff_ms", static_cast<std::int64_t>(policy.max_backoff.count())));
            if (retry.contains("max_total_retries") && !retry.at("max_total_retries").is_null()) {
                policy.max_total_retries = retry.at("max_total_retries").get<std::size_t>();
            }
        }

        if (auto it = document.find("limits"); it != document.end()) {
            const json& limits = *it;
            upload::PartLimits parsed;
            parsed.min_part_size = limits.value("min_part_size", parsed.min_part_size);
            parsed.max_part_size = limits.value("max_part_size", parsed.max_part_size);
            parsed.max_part_count = limits.value("max_part_count", parsed.max_part_count);
            config.limits = parsed;
        }
    } catch (const json::exception& e) {
        return Err(UploadError::invalid_argument(std::string("malformed configuration: ") + e.what()));
    }

    if (auto valid = config.validate(); valid.is_error()) {
        return Err(valid.error());
    }
    return Ok(std::move(config));
}

Result<UploaderConfig, UploadError> load_config(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in) {
        return Err(UploadError::io("cannot open configuration file " + path.string()));
    }

    const json document = json::parse(in, nullptr, false);
    if (document.is_discarded()) {
        return Err(UploadError::invalid_argument("configuration file " + path.string() + " is not valid JSON"));
    }

    spdlog::debug("[Config] Loaded {}", path.string());
    return config_from_json(document);
}

} // namespace mpu::config
