#pragma once

#include "mpu/core/result.hpp"
#include "mpu/store/object_store.hpp"
#include "mpu/upload/types.hpp"

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace mpu::upload {

/**
 * @brief State and per-part result table of one multipart upload
 *
 * Owned by the coordinator. The parts table has one slot per planned part;
 * a worker writes only the slot of the part it is uploading, so the table
 * itself needs no lock. State transitions are made by the coordinator
 * thread only.
 */
class UploadSession {
public:
    UploadSession(std::string bucket, std::string key, UploadPlan plan);

    [[nodiscard]] const std::string& upload_id() const noexcept { return upload_id_; }
    [[nodiscard]] const std::string& bucket() const noexcept { return bucket_; }
    [[nodiscard]] const std::string& key() const noexcept { return key_; }
    [[nodiscard]] const UploadPlan& plan() const noexcept { return plan_; }
    [[nodiscard]] UploadState state() const noexcept { return state_; }
    [[nodiscard]] const std::string& last_error() const noexcept { return last_error_; }
    [[nodiscard]] bool is_terminal() const noexcept {
        return state_ == UploadState::Completed || state_ == UploadState::Aborted;
    }

    /// Record the store-issued upload id and enter InProgress.
    Result<void> begin(std::string upload_id);
    Result<void> transition_to(UploadState next_state);
    Result<void> mark_aborted(std::string reason);

    PartResult& part_slot(std::uint32_t index);
    [[nodiscard]] const PartResult& part_slot(std::uint32_t index) const;
    [[nodiscard]] const std::vector<PartResult>& parts() const noexcept { return parts_; }

    [[nodiscard]] bool all_parts_verified() const noexcept;
    [[nodiscard]] std::size_t verified_count() const noexcept;

    /// Local digests ordered by ascending part index, whatever the completion order.
    [[nodiscard]] std::vector<Digest> local_digests_in_order() const;
    [[nodiscard]] std::vector<store::CompletedPart> completed_parts() const;

    [[nodiscard]] std::chrono::steady_clock::time_point started_at() const noexcept { return started_at_; }

private:
    [[nodiscard]] bool can_transition(UploadState target) const noexcept;

    std::string upload_id_;
    std::string bucket_;
    std::string key_;
    UploadPlan plan_;
    std::vector<PartResult> parts_;
    UploadState state_ = UploadState::Initiating;
    std::string last_error_;
    std::chrono::steady_clock::time_point started_at_{};
};

} // namespace mpu::upload
