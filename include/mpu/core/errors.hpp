#pragma once

/**
 * @file errors.hpp
 * @brief Error taxonomy shared by the planner, the part uploader, the
 *        coordinator and every ObjectStore implementation.
 *
 * Two layers:
 * - StoreError is what an ObjectStore reports. Its retryable flag is the only
 *   input the coordinator uses to decide between retry and abort.
 * - UploadError is what the upload pipeline reports to its caller. It carries
 *   enough context (part index, expected/observed values) to diagnose a
 *   failure without re-running the upload.
 */

#include <cstdint>
#include <optional>
#include <string>

namespace mpu {

/**
 * @brief Failure reported by an ObjectStore call
 */
struct StoreError {
    enum class Code {
        Timeout,
        Throttled,
        ServiceUnavailable,
        InternalError,
        BadDigest,
        AccessDenied,
        NoSuchBucket,
        NoSuchUpload,
        NoSuchKey,
        InvalidPart,
        InvalidRequest,
        EntityTooSmall,
        Unknown
    };

    Code code = Code::Unknown;
    bool retryable = false;
    std::string message;
    int http_status = 0;

    /**
     * @brief Build an error with the default retryability for its code
     *
     * Timeouts, throttling, 5xx-equivalents and digest rejections are
     * transient; everything else is fatal.
     */
    static StoreError from_code(Code code, std::string message);

    static bool default_retryable(Code code) noexcept;

    [[nodiscard]] std::string describe() const;
};

const char* to_string(StoreError::Code code) noexcept;

enum class ErrorKind {
    InvalidSize,
    EmptyFile,
    InvalidArgument,
    Io,
    Store,
    PartIntegrity,
    CompletionIntegrity,
    Cancelled
};

const char* to_string(ErrorKind kind) noexcept;

/**
 * @brief Failure surfaced by the upload pipeline
 */
struct UploadError {
    ErrorKind kind = ErrorKind::InvalidArgument;
    std::string message;
    std::optional<std::uint32_t> part_index;   ///< Set for per-part failures
    std::string expected;                      ///< Digest (hex) or size, when relevant
    std::string observed;
    std::optional<StoreError> store_error;     ///< Set when kind == Store
    bool retryable = false;

    static UploadError invalid_size(std::string message);
    static UploadError empty_file(std::string message);
    static UploadError invalid_argument(std::string message);
    static UploadError io(std::string message);
    static UploadError store(StoreError error, std::optional<std::uint32_t> part_index = std::nullopt);
    static UploadError part_integrity(std::uint32_t part_index,
                                      std::string what,
                                      std::string expected,
                                      std::string observed);
    static UploadError completion_integrity(std::string what,
                                            std::string expected,
                                            std::string observed);
    static UploadError cancelled(std::string message = "upload cancelled");

    [[nodiscard]] std::string describe() const;
};

} // namespace mpu
