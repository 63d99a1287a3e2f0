#pragma once

#include "mpu/core/result.hpp"
#include "mpu/upload/types.hpp"

#include <cstdint>
#include <filesystem>
#include <vector>

namespace mpu::upload {

/**
 * @brief Read-only handle on the file being uploaded
 *
 * Opened once per upload. Reads are positioned (pread), so there is no
 * shared cursor and workers may read disjoint ranges concurrently.
 */
class SourceFile {
public:
    static Result<SourceFile, UploadError> open(const std::filesystem::path& path);

    ~SourceFile();

    SourceFile(const SourceFile&) = delete;
    SourceFile& operator=(const SourceFile&) = delete;
    SourceFile(SourceFile&& other) noexcept;
    SourceFile& operator=(SourceFile&& other) noexcept;

    [[nodiscard]] std::uint64_t size() const noexcept { return size_; }

    /// Exactly @p length bytes starting at @p offset, or an Io error.
    Result<std::vector<std::uint8_t>, UploadError> read_range(std::uint64_t offset, std::uint64_t length) const;

    Result<std::vector<std::uint8_t>, UploadError> read_part(const PartSpec& part) const {
        return read_range(part.byte_offset, part.byte_length);
    }

private:
    SourceFile(std::filesystem::path path, int fd, std::uint64_t size);

    void close() noexcept;

    std::filesystem::path path_;
    int fd_ = -1;
    std::uint64_t size_ = 0;
};

} // namespace mpu::upload
