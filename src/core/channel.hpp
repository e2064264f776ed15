/*
 * Copyright 2026 Switchback Contributors
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

// Switchback Channel - Header
// Single-producer/single-consumer queue with close and cancel signals

#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <system_error>

namespace switchback::core {

/// Result of a blocking pop
enum class PopStatus : uint8_t {
    ITEM,       // An item was dequeued
    CLOSED,     // Producer finished; error() tells how
    CANCELLED,  // Consumer cancelled
    TIMEOUT     // Deadline passed with nothing queued
};

/// Bounded hand-off between one producer thread and one consumer.
///
/// The producer owns close(); the consumer owns cancel(). push() blocks
/// while `capacity` items are queued, so the producer runs no further ahead
/// of the consumer than that. A cancelled channel rejects further pushes
/// and wakes a blocked producer so it can stop promptly.
template <typename T>
class Channel {
public:
    using Clock = std::chrono::steady_clock;

    static constexpr size_t DEFAULT_CAPACITY = 16;

    explicit Channel(size_t capacity = DEFAULT_CAPACITY)
        : capacity_(capacity == 0 ? 1 : capacity) {}

    // Non-copyable, non-movable (shared by reference between threads)
    Channel(const Channel&) = delete;
    Channel& operator=(const Channel&) = delete;

    /// Producer: enqueue an item, waiting for room. Returns false once the
    /// consumer cancelled.
    bool push(T item) {
        {
            std::unique_lock<std::mutex> lock(mutex_);
            not_full_.wait(lock,
                           [this] { return cancelled_ || closed_ || items_.size() < capacity_; });
            if (cancelled_ || closed_) {
                return false;
            }
            items_.push_back(std::move(item));
        }
        not_empty_.notify_one();
        return true;
    }

    /// Producer: no more items. A non-empty error marks an abnormal end.
    void close(std::error_code error = {}) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_) {
                return;
            }
            closed_ = true;
            error_ = error;
        }
        not_empty_.notify_all();
        not_full_.notify_all();
    }

    /// Consumer: stop the producer and drop queued items
    void cancel() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            cancelled_ = true;
            items_.clear();
        }
        not_empty_.notify_all();
        not_full_.notify_all();
    }

    /// Consumer: block until an item arrives, the channel ends, or the deadline passes.
    /// Queued items are drained before CLOSED is reported.
    [[nodiscard]] PopStatus pop(T& item,
                                std::optional<Clock::time_point> deadline = std::nullopt) {
        std::unique_lock<std::mutex> lock(mutex_);
        auto ready = [this] { return cancelled_ || closed_ || !items_.empty(); };

        if (deadline) {
            if (!not_empty_.wait_until(lock, *deadline, ready)) {
                return PopStatus::TIMEOUT;
            }
        } else {
            not_empty_.wait(lock, ready);
        }

        if (cancelled_) {
            return PopStatus::CANCELLED;
        }
        if (items_.empty()) {
            return PopStatus::CLOSED;
        }
        item = std::move(items_.front());
        items_.pop_front();
        lock.unlock();
        not_full_.notify_one();
        return PopStatus::ITEM;
    }

    /// Error passed to close(), empty for a clean end
    [[nodiscard]] std::error_code error() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return error_;
    }

    [[nodiscard]] bool cancelled() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return cancelled_;
    }

    [[nodiscard]] size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return items_.size();
    }

    [[nodiscard]] size_t capacity() const noexcept { return capacity_; }

private:
    const size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable not_empty_;
    std::condition_variable not_full_;
    std::deque<T> items_;
    bool closed_ = false;
    bool cancelled_ = false;
    std::error_code error_;
};

}  // namespace switchback::core
