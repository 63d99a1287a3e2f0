#include "mpu/upload/types.hpp"

#include <openssl/evp.h>

#include <cctype>
#include <iomanip>
#include <numeric>
#include <sstream>

namespace mpu::upload {
namespace {

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    const char lower = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (lower >= 'a' && lower <= 'f') return lower - 'a' + 10;
    return -1;
}

} // namespace

const char* to_string(DigestAlgorithm algorithm) noexcept {
    switch (algorithm) {
        case DigestAlgorithm::Md5: return "md5";
        case DigestAlgorithm::Sha256: return "sha256";
    }
    return "unknown";
}

std::string Digest::hex() const {
    std::ostringstream oss;
    for (auto byte : bytes) {
        oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(byte);
    }
    return oss.str();
}

std::string Digest::base64() const {
    if (bytes.empty()) {
        return {};
    }
    std::string encoded(4 * ((bytes.size() + 2) / 3), '\0');
    const int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(encoded.data()),
                                        bytes.data(), static_cast<int>(bytes.size()));
    encoded.resize(static_cast<std::size_t>(written));
    return encoded;
}

std::optional<Digest> Digest::from_hex(DigestAlgorithm algorithm, const std::string& hex) {
    if (hex.size() % 2 != 0) {
        return std::nullopt;
    }
    Digest digest;
    digest.algorithm = algorithm;
    digest.bytes.reserve(hex.size() / 2);
    for (std::size_t i = 0; i < hex.size(); i += 2) {
        const int high = hex_value(hex[i]);
        const int low = hex_value(hex[i + 1]);
        if (high < 0 || low < 0) {
            return std::nullopt;
        }
        digest.bytes.push_back(static_cast<std::uint8_t>((high << 4) | low));
    }
    return digest;
}

std::optional<Digest> Digest::from_base64(DigestAlgorithm algorithm, const std::string& encoded) {
    if (encoded.empty() || encoded.size() % 4 != 0) {
        return std::nullopt;
    }
    std::vector<std::uint8_t> decoded(3 * (encoded.size() / 4));
    const int written = EVP_DecodeBlock(decoded.data(),
                                        reinterpret_cast<const unsigned char*>(encoded.data()),
                                        static_cast<int>(encoded.size()));
    if (written < 0) {
        return std::nullopt;
    }
    // EVP_DecodeBlock keeps the zero bytes produced by '=' padding.
    std::size_t length = static_cast<std::size_t>(written);
    for (auto it = encoded.rbegin(); it != encoded.rend() && *it == '='; ++it) {
        --length;
    }
    decoded.resize(length);

    Digest digest;
    digest.algorithm = algorithm;
    digest.bytes = std::move(decoded);
    return digest;
}

std::uint64_t UploadPlan::total_bytes() const noexcept {
    return std::accumulate(parts.begin(), parts.end(), std::uint64_t{0},
                           [](std::uint64_t sum, const PartSpec& part) { return sum + part.byte_length; });
}

const char* to_string(PartState state) noexcept {
    switch (state) {
        case PartState::Pending: return "Pending";
        case PartState::Uploading: return "Uploading";
        case PartState::Verified: return "Verified";
        case PartState::Failed: return "Failed";
    }
    return "Unknown";
}

const char* to_string(UploadState state) noexcept {
    switch (state) {
        case UploadState::Initiating: return "Initiating";
        case UploadState::InProgress: return "InProgress";
        case UploadState::Completing: return "Completing";
        case UploadState::Completed: return "Completed";
        case UploadState::Aborted: return "Aborted";
    }
    return "Unknown";
}

} // namespace mpu::upload
