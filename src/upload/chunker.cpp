#include "mpu/upload/chunker.hpp"

#include <algorithm>
#include <string>

namespace mpu::upload {

Result<UploadPlan, UploadError> Chunker::plan(std::uint64_t file_size,
                                              std::uint64_t min_part_size,
                                              std::uint64_t max_part_size,
                                              std::uint32_t max_part_count) {
    if (file_size == 0) {
        return Err(UploadError::empty_file("cannot plan a multipart upload for an empty file"));
    }
    if (min_part_size == 0 || max_part_size < min_part_size || max_part_count == 0) {
        return Err(UploadError::invalid_size(
            "inconsistent part limits: min=" + std::to_string(min_part_size) +
            " max=" + std::to_string(max_part_size) +
            " max_count=" + std::to_string(max_part_count)));
    }

    // Overflow-safe form of file_size > max_part_size * max_part_count.
    if ((file_size - 1) / max_part_count >= max_part_size) {
        UploadError error = UploadError::invalid_size("file exceeds the largest uploadable object");
        error.expected = "<= " + std::to_string(max_part_size) + " x " + std::to_string(max_part_count);
        error.observed = std::to_string(file_size);
        return Err(std::move(error));
    }

    const std::uint64_t size_for_count = (file_size + max_part_count - 1) / max_part_count;
    const std::uint64_t part_size = std::max(min_part_size, size_for_count);
    const std::uint64_t part_count = (file_size + part_size - 1) / part_size;

    UploadPlan plan;
    plan.file_size = file_size;
    plan.part_size = part_size;
    plan.parts.reserve(static_cast<std::size_t>(part_count));

    std::uint64_t offset = 0;
    for (std::uint64_t i = 0; i < part_count; ++i) {
        PartSpec part;
        part.index = static_cast<std::uint32_t>(i + 1);
        part.byte_offset = offset;
        part.byte_length = std::min(part_size, file_size - offset);
        offset += part.byte_length;
        plan.parts.push_back(part);
    }

    return Ok(std::move(plan));
}

Result<UploadPlan, UploadError> Chunker::plan(std::uint64_t file_size,
                                              const PartLimits& limits,
                                              std::uint64_t part_size_hint) {
    if (part_size_hint > limits.max_part_size) {
        UploadError error = UploadError::invalid_size("part size hint exceeds the store maximum");
        error.expected = "<= " + std::to_string(limits.max_part_size);
        error.observed = std::to_string(part_size_hint);
        return Err(std::move(error));
    }
    const std::uint64_t min_part_size = std::max(limits.min_part_size, part_size_hint);
    return plan(file_size, min_part_size, limits.max_part_size, limits.max_part_count);
}

} // namespace mpu::upload
