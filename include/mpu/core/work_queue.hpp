#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>

namespace mpu {

/**
 * @brief Closable multi-consumer FIFO feeding the part upload workers
 *
 * The coordinator pushes every part of the plan and then closes the queue;
 * workers pop until it is drained. discard() stops dispatch early: no
 * further item is handed out after it returns.
 */
template<typename T>
class WorkQueue {
public:
    WorkQueue() = default;

    WorkQueue(const WorkQueue&) = delete;
    WorkQueue& operator=(const WorkQueue&) = delete;

    /// Ignored once the queue is closed.
    void push(T item) {
        std::unique_lock lock(mutex_);
        if (closed_) {
            return;
        }
        items_.push_back(std::move(item));
        lock.unlock();
        ready_.notify_one();
    }

    /// Blocks for the next item; nullopt once closed and drained.
    std::optional<T> pop() {
        std::unique_lock lock(mutex_);
        ready_.wait(lock, [this]() { return closed_ || !items_.empty(); });
        if (items_.empty()) {
            return std::nullopt;
        }
        std::optional<T> next(std::move(items_.front()));
        items_.pop_front();
        return next;
    }

    void close() {
        std::unique_lock lock(mutex_);
        closed_ = true;
        lock.unlock();
        ready_.notify_all();
    }

    /// Drop all pending items and close; returns how many were dropped.
    std::size_t discard() {
        std::unique_lock lock(mutex_);
        const std::size_t dropped = items_.size();
        items_.clear();
        closed_ = true;
        lock.unlock();
        ready_.notify_all();
        return dropped;
    }

    std::size_t size() const {
        std::lock_guard lock(mutex_);
        return items_.size();
    }

private:
    std::deque<T> items_;
    bool closed_ = false;
    mutable std::mutex mutex_;
    std::condition_variable ready_;
};

} // namespace mpu
