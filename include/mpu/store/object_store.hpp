#pragma once

/**
 * @file object_store.hpp
 * @brief Abstract multipart-capable object store
 *
 * WHY THIS FILE EXISTS:
 * The upload pipeline never talks to a concrete storage API. It receives an
 * ObjectStore instance from its caller, which keeps transport, credentials
 * and connection pooling outside the core and lets tests substitute fakes.
 *
 * CONTRACT:
 * - Every call is independent; implementations must tolerate concurrent
 *   upload_part() calls for distinct part indexes of the same upload.
 * - Failures are reported as StoreError. The retryable flag is the only
 *   classification input the coordinator uses.
 * - abort() is best-effort. Aborting an unknown or finished upload may fail;
 *   callers log such failures and never escalate them over a prior error.
 *
 * LIFECYCLE:
 * initiate() -> upload_part() x N -> complete()   (success)
 * initiate() -> upload_part() x k -> abort()      (failure / cancellation)
 */

#include "mpu/core/errors.hpp"
#include "mpu/core/result.hpp"
#include "mpu/upload/chunker.hpp"
#include "mpu/upload/types.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace mpu::store {

using upload::Digest;
using upload::PartLimits;

/// User metadata attached to the object at initiate time.
using ObjectMetadata = std::map<std::string, std::string>;

struct UploadPartResponse {
    std::string etag;
    std::optional<Digest> reported_digest;   ///< Absent if the store computes none
    std::uint64_t reported_size = 0;
};

struct CompletedPart {
    std::uint32_t index = 0;
    std::string etag;
};

struct CompleteResponse {
    std::string etag;
    std::uint64_t total_size = 0;
    std::optional<Digest> combined_digest;   ///< Advisory; some stores never report it
};

struct ObjectInfo {
    std::uint64_t size = 0;
    std::string etag;
    ObjectMetadata metadata;
};

class ObjectStore {
public:
    virtual ~ObjectStore() = default;

    /// Part-size constraints the planner must honour.
    [[nodiscard]] virtual PartLimits limits() const { return PartLimits{}; }

    virtual Result<std::string, StoreError> initiate(const std::string& bucket,
                                                     const std::string& key,
                                                     const ObjectMetadata& metadata) = 0;

    /**
     * @param content_digest Locally computed digest of @p data, forwarded so
     *        the store can reject a corrupted transfer (BadDigest).
     */
    virtual Result<UploadPartResponse, StoreError> upload_part(const std::string& upload_id,
                                                               std::uint32_t part_index,
                                                               const std::vector<std::uint8_t>& data,
                                                               const Digest& content_digest) = 0;

    /// @p parts is ordered by ascending index.
    virtual Result<CompleteResponse, StoreError> complete(const std::string& upload_id,
                                                          const std::vector<CompletedPart>& parts) = 0;

    virtual Result<void, StoreError> abort(const std::string& upload_id) = 0;

    virtual Result<ObjectInfo, StoreError> head(const std::string& bucket, const std::string& key) = 0;
};

} // namespace mpu::store
