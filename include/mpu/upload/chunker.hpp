#pragma once

#include "mpu/core/result.hpp"
#include "mpu/upload/types.hpp"

#include <cstdint>

namespace mpu::upload {

/**
 * @brief Part-size constraints imposed by a store
 */
struct PartLimits {
    static constexpr std::uint64_t kDefaultMinPartSize = 5ULL * 1024 * 1024;
    static constexpr std::uint64_t kDefaultMaxPartSize = 5ULL * 1024 * 1024 * 1024;
    static constexpr std::uint32_t kDefaultMaxPartCount = 10000;

    std::uint64_t min_part_size = kDefaultMinPartSize;
    std::uint64_t max_part_size = kDefaultMaxPartSize;
    std::uint32_t max_part_count = kDefaultMaxPartCount;
};

class Chunker {
public:
    /**
     * @brief Partition a file of @p file_size bytes
     *
     * Picks the smallest part size >= @p min_part_size that keeps the part
     * count within @p max_part_count. A file shorter than the minimum still
     * yields a single part covering the whole file.
     *
     * Errors: EmptyFile for a zero-byte file, InvalidSize when the file
     * cannot fit in max_part_size * max_part_count or the limits are
     * inconsistent.
     */
    static Result<UploadPlan, UploadError> plan(std::uint64_t file_size,
                                                std::uint64_t min_part_size,
                                                std::uint64_t max_part_size,
                                                std::uint32_t max_part_count);

    /**
     * @brief Same as above; a non-zero @p part_size_hint raises the minimum
     */
    static Result<UploadPlan, UploadError> plan(std::uint64_t file_size,
                                                const PartLimits& limits,
                                                std::uint64_t part_size_hint = 0);
};

} // namespace mpu::upload
