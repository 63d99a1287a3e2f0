#include "mpu/upload/session.hpp"

#include <algorithm>
#include <stdexcept>
#include <unordered_map>

namespace mpu::upload {
namespace {

bool is_progressive(UploadState current, UploadState target) {
    static const std::unordered_map<UploadState, std::vector<UploadState>> transitions {
        {UploadState::Initiating, {UploadState::InProgress}},
        {UploadState::InProgress, {UploadState::Completing}},
        {UploadState::Completing, {UploadState::Completed}},
    };

    if (target == UploadState::Aborted) {
        return true;
    }

    const auto it = transitions.find(current);
    if (it == transitions.end()) {
        return false;
    }
    const auto& allowed_list = it->second;
    return std::find(allowed_list.begin(), allowed_list.end(), target) != allowed_list.end();
}

} // namespace

UploadSession::UploadSession(std::string bucket, std::string key, UploadPlan plan)
    : bucket_(std::move(bucket)), key_(std::move(key)), plan_(std::move(plan)) {
    parts_.reserve(plan_.parts.size());
    for (const auto& spec : plan_.parts) {
        PartResult slot;
        slot.index = spec.index;
        parts_.push_back(std::move(slot));
    }
    started_at_ = std::chrono::steady_clock::now();
}

Result<void> UploadSession::begin(std::string upload_id) {
    if (state_ != UploadState::Initiating) {
        return Err(std::string("Session already started"));
    }
    if (upload_id.empty()) {
        return Err(std::string("Store returned an empty upload id"));
    }
    upload_id_ = std::move(upload_id);
    return transition_to(UploadState::InProgress);
}

Result<void> UploadSession::transition_to(UploadState next_state) {
    if (state_ == next_state) {
        return Ok();
    }

    if (!can_transition(next_state)) {
        return Err(std::string("Illegal upload state transition ") + to_string(state_) + " -> " +
                   to_string(next_state));
    }

    state_ = next_state;
    return Ok();
}

Result<void> UploadSession::mark_aborted(std::string reason) {
    auto result = transition_to(UploadState::Aborted);
    if (result.is_ok()) {
        last_error_ = std::move(reason);
    }
    return result;
}

PartResult& UploadSession::part_slot(std::uint32_t index) {
    if (index == 0 || index > parts_.size()) {
        throw std::out_of_range("part index " + std::to_string(index) + " is not in the plan");
    }
    return parts_[index - 1];
}

const PartResult& UploadSession::part_slot(std::uint32_t index) const {
    if (index == 0 || index > parts_.size()) {
        throw std::out_of_range("part index " + std::to_string(index) + " is not in the plan");
    }
    return parts_[index - 1];
}

bool UploadSession::all_parts_verified() const noexcept {
    return verified_count() == parts_.size();
}

std::size_t UploadSession::verified_count() const noexcept {
    return static_cast<std::size_t>(std::count_if(parts_.begin(), parts_.end(), [](const PartResult& part) {
        return part.state == PartState::Verified;
    }));
}

std::vector<Digest> UploadSession::local_digests_in_order() const {
    std::vector<Digest> digests;
    digests.reserve(parts_.size());
    for (const auto& part : parts_) {
        digests.push_back(part.local_digest);
    }
    return digests;
}

std::vector<store::CompletedPart> UploadSession::completed_parts() const {
    std::vector<store::CompletedPart> completed;
    completed.reserve(parts_.size());
    for (const auto& part : parts_) {
        completed.push_back(store::CompletedPart{part.index, part.etag});
    }
    return completed;
}

bool UploadSession::can_transition(UploadState target) const noexcept {
    if (state_ == target) {
        return true;
    }

    if (state_ == UploadState::Completed || state_ == UploadState::Aborted) {
        return false;
    }

    return is_progressive(state_, target);
}

} // namespace mpu::upload
