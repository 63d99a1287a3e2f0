#include "mpu/core/errors.hpp"

#include <sstream>

namespace mpu {

StoreError StoreError::from_code(Code code, std::string message) {
    StoreError error;
    error.code = code;
    error.retryable = default_retryable(code);
    error.message = std::move(message);
    return error;
}

bool StoreError::default_retryable(Code code) noexcept {
    switch (code) {
        case Code::Timeout:
        case Code::Throttled:
        case Code::ServiceUnavailable:
        case Code::InternalError:
        case Code::BadDigest:
            return true;
        default:
            return false;
    }
}

std::string StoreError::describe() const {
    std::ostringstream oss;
    oss << to_string(code);
    if (http_status != 0) {
        oss << " (" << http_status << ")";
    }
    if (!message.empty()) {
        oss << ": " << message;
    }
    oss << (retryable ? " [retryable]" : " [fatal]");
    return oss.str();
}

const char* to_string(StoreError::Code code) noexcept {
    switch (code) {
        case StoreError::Code::Timeout: return "Timeout";
        case StoreError::Code::Throttled: return "Throttled";
        case StoreError::Code::ServiceUnavailable: return "ServiceUnavailable";
        case StoreError::Code::InternalError: return "InternalError";
        case StoreError::Code::BadDigest: return "BadDigest";
        case StoreError::Code::AccessDenied: return "AccessDenied";
        case StoreError::Code::NoSuchBucket: return "NoSuchBucket";
        case StoreError::Code::NoSuchUpload: return "NoSuchUpload";
        case StoreError::Code::NoSuchKey: return "NoSuchKey";
        case StoreError::Code::InvalidPart: return "InvalidPart";
        case StoreError::Code::InvalidRequest: return "InvalidRequest";
        case StoreError::Code::EntityTooSmall: return "EntityTooSmall";
        case StoreError::Code::Unknown: return "Unknown";
    }
    return "Unknown";
}

const char* to_string(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::InvalidSize: return "InvalidSizeError";
        case ErrorKind::EmptyFile: return "EmptyFileError";
        case ErrorKind::InvalidArgument: return "InvalidArgumentError";
        case ErrorKind::Io: return "IoError";
        case ErrorKind::Store: return "StoreError";
        case ErrorKind::PartIntegrity: return "PartIntegrityError";
        case ErrorKind::CompletionIntegrity: return "CompletionIntegrityError";
        case ErrorKind::Cancelled: return "CancelledError";
    }
    return "UnknownError";
}

UploadError UploadError::invalid_size(std::string message) {
    UploadError error;
    error.kind = ErrorKind::InvalidSize;
    error.message = std::move(message);
    return error;
}

UploadError UploadError::empty_file(std::string message) {
    UploadError error;
    error.kind = ErrorKind::EmptyFile;
    error.message = std::move(message);
    return error;
}

UploadError UploadError::invalid_argument(std::string message) {
    UploadError error;
    error.kind = ErrorKind::InvalidArgument;
    error.message = std::move(message);
    return error;
}

UploadError UploadError::io(std::string message) {
    UploadError error;
    error.kind = ErrorKind::Io;
    error.message = std::move(message);
    return error;
}

UploadError UploadError::store(StoreError store_error, std::optional<std::uint32_t> part_index) {
    UploadError error;
    error.kind = ErrorKind::Store;
    error.message = store_error.describe();
    error.retryable = store_error.retryable;
    error.part_index = part_index;
    error.store_error = std::move(store_error);
    return error;
}

UploadError UploadError::part_integrity(std::uint32_t part_index,
                                        std::string what,
                                        std::string expected,
                                        std::string observed) {
    UploadError error;
    error.kind = ErrorKind::PartIntegrity;
    error.message = std::move(what);
    error.part_index = part_index;
    error.expected = std::move(expected);
    error.observed = std::move(observed);
    // A fresh upload of the same part may succeed; the budget decides.
    error.retryable = true;
    return error;
}

UploadError UploadError::completion_integrity(std::string what,
                                              std::string expected,
                                              std::string observed) {
    UploadError error;
    error.kind = ErrorKind::CompletionIntegrity;
    error.message = std::move(what);
    error.expected = std::move(expected);
    error.observed = std::move(observed);
    return error;
}

UploadError UploadError::cancelled(std::string message) {
    UploadError error;
    error.kind = ErrorKind::Cancelled;
    error.message = std::move(message);
    return error;
}

std::string UploadError::describe() const {
    std::ostringstream oss;
    oss << to_string(kind);
    if (part_index) {
        oss << " part=" << *part_index;
    }
    if (!message.empty()) {
        oss << ": " << message;
    }
    if (!expected.empty() || !observed.empty()) {
        oss << " (expected " << expected << ", observed " << observed << ")";
    }
    return oss.str();
}

} // namespace mpu
