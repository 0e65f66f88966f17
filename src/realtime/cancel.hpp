/*
 * Copyright 2025 Wren Contributors
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

// Wren Cancellation - Header
// Cooperative cancellation shared by the push producer and its waits

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>

namespace wren::realtime {

/// One-shot cancellation flag with interruptible waits.
///
/// cancel() wakes wait_for() immediately and runs every registered waker,
/// so code blocked on its own condition variable can be woken as well.
class CancelToken {
public:
    CancelToken() = default;
    ~CancelToken() = default;

    // Non-copyable, non-movable (waiters hold references)
    CancelToken(const CancelToken&) = delete;
    CancelToken& operator=(const CancelToken&) = delete;

    /// Request cancellation (idempotent)
    void cancel();

    [[nodiscard]] bool cancelled() const noexcept {
        return cancelled_.load(std::memory_order_acquire);
    }

    /// Throws core::OperationCancelled when cancelled
    void throw_if_cancelled() const;

    /// Sleep up to timeout; returns true when woken by cancellation
    [[nodiscard]] bool wait_for(std::chrono::milliseconds timeout);

    /// Waker registration, removed on destruction
    class Registration {
    public:
        Registration() = default;
        Registration(CancelToken* token, uint64_t id) : token_(token), id_(id) {}
        ~Registration();

        Registration(const Registration&) = delete;
        Registration& operator=(const Registration&) = delete;
        Registration(Registration&& other) noexcept;
        Registration& operator=(Registration&& other) noexcept;

    private:
        void reset() noexcept;

        CancelToken* token_ = nullptr;
        uint64_t id_ = 0;
    };

    /// Run waker on cancel(); runs immediately if already cancelled
    [[nodiscard]] Registration on_cancel(std::function<void()> waker);

private:
    void remove_waker(uint64_t id) noexcept;

    std::atomic<bool> cancelled_{false};
    std::mutex mutex_;
    std::condition_variable cv_;
    std::map<uint64_t, std::function<void()>> wakers_;
    uint64_t next_id_ = 1;
};

}  // namespace wren::realtime
