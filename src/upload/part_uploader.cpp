#include "mpu/upload/part_uploader.hpp"

#include <spdlog/spdlog.h>

#include <string>

namespace mpu::upload {

PartUploader::PartUploader(store::ObjectStore& store, const SourceFile& source, Hasher hasher)
    : store_(store), source_(source), hasher_(hasher) {}

Result<void, UploadError> PartUploader::upload(const UploadSession& session,
                                               const PartSpec& spec,
                                               PartResult& slot) const {
    slot.index = spec.index;
    slot.state = PartState::Uploading;
    slot.attempts += 1;
    slot.etag.clear();
    slot.remote_digest.reset();
    slot.size_bytes = 0;

    auto bytes = source_.read_part(spec);
    if (bytes.is_error()) {
        UploadError error = bytes.error();
        error.part_index = spec.index;
        return fail(slot, std::move(error));
    }
    const auto& data = bytes.value();

    slot.local_digest = hasher_.digest(data);

    auto response = store_.upload_part(session.upload_id(), spec.index, data, slot.local_digest);
    if (response.is_error()) {
        return fail(slot, UploadError::store(response.error(), spec.index));
    }
    const auto& ack = response.value();

    if (ack.reported_size != spec.byte_length) {
        return fail(slot, UploadError::part_integrity(spec.index, "store acknowledged a different part size",
                                                      std::to_string(spec.byte_length),
                                                      std::to_string(ack.reported_size)));
    }

    if (ack.reported_digest) {
        const Digest& remote = *ack.reported_digest;
        Digest expected = slot.local_digest;
        if (remote.algorithm != expected.algorithm) {
            // Store checksums in its own algorithm; hash the same bytes that way.
            spdlog::debug("part {} digest reported as {}, rehashing locally to compare",
                          spec.index, to_string(remote.algorithm));
            expected = Hasher(remote.algorithm).digest(data);
        }
        if (remote != expected) {
            return fail(slot, UploadError::part_integrity(spec.index, "store reported a different part digest",
                                                          expected.hex(), remote.hex()));
        }
    }

    if (ack.etag.empty()) {
        return fail(slot, UploadError::part_integrity(spec.index, "store returned no ETag", "<etag>", ""));
    }

    slot.etag = ack.etag;
    slot.remote_digest = ack.reported_digest;
    slot.size_bytes = ack.reported_size;
    slot.last_error.reset();
    slot.state = PartState::Verified;
    return Ok();
}

Result<void, UploadError> PartUploader::fail(PartResult& slot, UploadError error) const {
    slot.state = PartState::Failed;
    slot.last_error = error;
    return Err(std::move(error));
}

} // namespace mpu::upload
