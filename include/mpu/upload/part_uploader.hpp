#pragma once

#include "mpu/core/result.hpp"
#include "mpu/store/object_store.hpp"
#include "mpu/upload/hasher.hpp"
#include "mpu/upload/session.hpp"
#include "mpu/upload/source_file.hpp"
#include "mpu/upload/types.hpp"

namespace mpu::upload {

/**
 * @brief Uploads one part and verifies what the store acknowledged
 *
 * A single attempt per call; retries belong to the coordinator. The only
 * state written is the PartResult slot passed in by the caller.
 */
class PartUploader {
public:
    PartUploader(store::ObjectStore& store, const SourceFile& source, Hasher hasher);

    /**
     * @brief Read, hash, upload and verify @p spec
     *
     * On success @p slot is Verified. On failure @p slot is Failed, carries the
     * error in last_error, and the same error is returned.
     */
    Result<void, UploadError> upload(const UploadSession& session, const PartSpec& spec, PartResult& slot) const;

private:
    Result<void, UploadError> fail(PartResult& slot, UploadError error) const;

    store::ObjectStore& store_;
    const SourceFile& source_;
    Hasher hasher_;
};

} // namespace mpu::upload
