#include "mpu/upload/hasher.hpp"

#include <openssl/evp.h>

#include <fstream>
#include <stdexcept>

namespace mpu::upload {
namespace {

const EVP_MD* evp_for(DigestAlgorithm algorithm) {
    switch (algorithm) {
        case DigestAlgorithm::Md5: return EVP_md5();
        case DigestAlgorithm::Sha256: return EVP_sha256();
    }
    return nullptr;
}

} // namespace

struct StreamingDigest::Context {
    struct Deleter {
        void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
    };
    std::unique_ptr<EVP_MD_CTX, Deleter> ctx;
};

StreamingDigest::StreamingDigest(DigestAlgorithm algorithm)
    : algorithm_(algorithm), context_(std::make_unique<Context>()) {
    context_->ctx.reset(EVP_MD_CTX_new());
    if (!context_->ctx) {
        throw std::runtime_error("EVP_MD_CTX_new failed");
    }
    const EVP_MD* md = evp_for(algorithm_);
    if (md == nullptr) {
        throw std::runtime_error("unsupported digest algorithm");
    }
    if (EVP_DigestInit_ex(context_->ctx.get(), md, nullptr) != 1) {
        throw std::runtime_error(std::string("EVP_DigestInit_ex failed for ") + to_string(algorithm_));
    }
}

StreamingDigest::~StreamingDigest() = default;
StreamingDigest::StreamingDigest(StreamingDigest&&) noexcept = default;
StreamingDigest& StreamingDigest::operator=(StreamingDigest&&) noexcept = default;

void StreamingDigest::update(const std::uint8_t* data, std::size_t size) {
    if (size == 0) {
        return;
    }
    if (EVP_DigestUpdate(context_->ctx.get(), data, size) != 1) {
        throw std::runtime_error("EVP_DigestUpdate failed");
    }
}

Digest StreamingDigest::finish() {
    unsigned char buffer[EVP_MAX_MD_SIZE];
    unsigned int length = 0;
    if (EVP_DigestFinal_ex(context_->ctx.get(), buffer, &length) != 1) {
        throw std::runtime_error("EVP_DigestFinal_ex failed");
    }
    Digest digest;
    digest.algorithm = algorithm_;
    digest.bytes.assign(buffer, buffer + length);
    return digest;
}

Digest Hasher::digest(const std::uint8_t* data, std::size_t size) const {
    StreamingDigest stream(algorithm_);
    stream.update(data, size);
    return stream.finish();
}

Digest Hasher::digest(const std::string& data) const {
    return digest(reinterpret_cast<const std::uint8_t*>(data.data()), data.size());
}

Digest Hasher::combined_digest(const std::vector<Digest>& part_digests) const {
    StreamingDigest stream(algorithm_);
    for (const auto& part : part_digests) {
        stream.update(part.bytes);
    }
    return stream.finish();
}

Result<Digest, UploadError> Hasher::file_digest(const std::filesystem::path& path) const {
    std::ifstream input(path, std::ios::binary);
    if (!input) {
        return Err(UploadError::io("failed to open " + path.string()));
    }

    StreamingDigest stream(algorithm_);
    char buffer[64 * 1024];
    while (input.read(buffer, sizeof(buffer)) || input.gcount() > 0) {
        stream.update(reinterpret_cast<const std::uint8_t*>(buffer), static_cast<std::size_t>(input.gcount()));
    }
    if (input.bad()) {
        return Err(UploadError::io("failed to read " + path.string()));
    }
    return Ok(stream.finish());
}

std::string Hasher::multipart_etag(const Digest& combined, std::size_t part_count) {
    return combined.hex() + "-" + std::to_string(part_count);
}

} // namespace mpu::upload
