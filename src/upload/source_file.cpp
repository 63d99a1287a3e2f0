#include "mpu/upload/source_file.hpp"

#include <cerrno>
#include <cstring>
#include <string>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace mpu::upload {

Result<SourceFile, UploadError> SourceFile::open(const std::filesystem::path& path) {
    const int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        return Err(UploadError::io("failed to open " + path.string() + ": " + std::strerror(errno)));
    }

    struct stat info {};
    if (::fstat(fd, &info) != 0) {
        const int saved = errno;
        ::close(fd);
        return Err(UploadError::io("failed to stat " + path.string() + ": " + std::strerror(saved)));
    }
    if (!S_ISREG(info.st_mode)) {
        ::close(fd);
        return Err(UploadError::io(path.string() + " is not a regular file"));
    }

    return Ok(SourceFile(path, fd, static_cast<std::uint64_t>(info.st_size)));
}

SourceFile::SourceFile(std::filesystem::path path, int fd, std::uint64_t size)
    : path_(std::move(path)), fd_(fd), size_(size) {}

SourceFile::~SourceFile() {
    close();
}

SourceFile::SourceFile(SourceFile&& other) noexcept
    : path_(std::move(other.path_)), fd_(other.fd_), size_(other.size_) {
    other.fd_ = -1;
}

SourceFile& SourceFile::operator=(SourceFile&& other) noexcept {
    if (this != &other) {
        close();
        path_ = std::move(other.path_);
        fd_ = other.fd_;
        size_ = other.size_;
        other.fd_ = -1;
    }
    return *this;
}

void SourceFile::close() noexcept {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

Result<std::vector<std::uint8_t>, UploadError> SourceFile::read_range(std::uint64_t offset,
                                                                      std::uint64_t length) const {
    if (fd_ < 0) {
        return Err(UploadError::io("source file is closed"));
    }
    if (offset > size_ || length > size_ - offset) {
        return Err(UploadError::io("range [" + std::to_string(offset) + ", +" + std::to_string(length) +
                                   ") is outside " + path_.string()));
    }

    std::vector<std::uint8_t> buffer(static_cast<std::size_t>(length));
    std::size_t filled = 0;
    while (filled < buffer.size()) {
        const ssize_t n = ::pread(fd_, buffer.data() + filled, buffer.size() - filled,
                                  static_cast<off_t>(offset + filled));
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            return Err(UploadError::io("read failed on " + path_.string() + ": " + std::strerror(errno)));
        }
        if (n == 0) {
            // File shrank after planning.
            return Err(UploadError::io("short read on " + path_.string() + " at offset " +
                                       std::to_string(offset + filled)));
        }
        filled += static_cast<std::size_t>(n);
    }
    return Ok(std::move(buffer));
}

} // namespace mpu::upload
