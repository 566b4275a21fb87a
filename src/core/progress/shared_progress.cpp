#include "shared_progress.hpp"

#include <algorithm>
#include <stdexcept>

namespace segdl::core {

SharedProgress::SharedProgress(std::vector<Segment> segments, std::optional<std::uint64_t> total_size)
    : segments_(std::move(segments))
    , finished_(segments_.size(), false)
    , total_size_(total_size)
    , last_checkpoint_(std::chrono::steady_clock::now())
{
    for (std::size_t i = 0; i < segments_.size(); ++i) {
        if (segments_[i].index != i) {
            throw std::invalid_argument("segments must be indexed in order");
        }
        downloaded_ += segments_[i].downloaded;
        finished_[i] = segments_[i].complete();
    }
}

void SharedProgress::add_bytes(std::uint32_t index, std::uint64_t bytes) {
    std::lock_guard lock(mutex_);
    auto& segment = segments_.at(index);
    segment.downloaded += bytes;
    downloaded_ += bytes;
    if (segment.complete()) {
        finished_[index] = true;
    }
}

void SharedProgress::mark_finished(std::uint32_t index) {
    std::lock_guard lock(mutex_);
    finished_.at(index) = true;
}

void SharedProgress::record_error() {
    std::lock_guard lock(mutex_);
    ++errors_;
}

void SharedProgress::clear_errors() {
    std::lock_guard lock(mutex_);
    errors_ = 0;
}

auto SharedProgress::segment(std::uint32_t index) const -> Segment {
    std::lock_guard lock(mutex_);
    return segments_.at(index);
}

auto SharedProgress::finished(std::uint32_t index) const -> bool {
    std::lock_guard lock(mutex_);
    return finished_.at(index);
}

auto SharedProgress::downloaded() const -> std::uint64_t {
    std::lock_guard lock(mutex_);
    return downloaded_;
}

auto SharedProgress::error_count() const -> std::uint32_t {
    std::lock_guard lock(mutex_);
    return errors_;
}

auto SharedProgress::snapshot() const -> Snapshot {
    std::lock_guard lock(mutex_);
    return Snapshot{downloaded_, segments_, errors_};
}

auto SharedProgress::incomplete() const -> std::vector<std::uint32_t> {
    std::lock_guard lock(mutex_);
    std::vector<std::uint32_t> result;
    for (std::size_t i = 0; i < segments_.size(); ++i) {
        if (!finished_[i]) {
            result.push_back(static_cast<std::uint32_t>(i));
        }
    }
    return result;
}

auto SharedProgress::all_complete() const -> bool {
    std::lock_guard lock(mutex_);
    return all_complete_locked();
}

auto SharedProgress::all_complete_locked() const -> bool {
    if (!std::all_of(finished_.begin(), finished_.end(), [](bool done) { return done; })) {
        return false;
    }
    return !total_size_ || downloaded_ == *total_size_;
}

auto SharedProgress::claim_checkpoint(std::chrono::milliseconds interval,
                                      std::chrono::steady_clock::time_point now) -> bool
{
    std::lock_guard lock(mutex_);
    if (last_checkpoint_ && now - *last_checkpoint_ < interval) {
        return false;
    }
    last_checkpoint_ = now;
    return true;
}

} // namespace segdl::core
