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

// Wren Cancellation - Implementation

#include "cancel.hpp"

#include <vector>

#include "../core/errors.hpp"

namespace wren::realtime {

void CancelToken::cancel() {
    std::vector<std::function<void()>> wakers;
    {
        std::lock_guard lock(mutex_);
        if (cancelled_.exchange(true, std::memory_order_acq_rel)) {
            return;
        }
        wakers.reserve(wakers_.size());
        for (const auto& [id, waker] : wakers_) {
            wakers.push_back(waker);
        }
    }
    cv_.notify_all();

    // Wakers take their own locks; never call them under mutex_
    for (const auto& waker : wakers) {
        waker();
    }
}

void CancelToken::throw_if_cancelled() const {
    if (cancelled()) {
        throw core::OperationCancelled();
    }
}

bool CancelToken::wait_for(std::chrono::milliseconds timeout) {
    std::unique_lock lock(mutex_);
    return cv_.wait_for(lock, timeout, [this] { return cancelled(); });
}

CancelToken::Registration CancelToken::on_cancel(std::function<void()> waker) {
    {
        std::lock_guard lock(mutex_);
        if (!cancelled()) {
            uint64_t id = next_id_++;
            wakers_.emplace(id, std::move(waker));
            return Registration(this, id);
        }
    }
    waker();
    return Registration();
}

void CancelToken::remove_waker(uint64_t id) noexcept {
    std::lock_guard lock(mutex_);
    wakers_.erase(id);
}

// Registration

CancelToken::Registration::~Registration() {
    reset();
}

CancelToken::Registration::Registration(Registration&& other) noexcept
    : token_(other.token_), id_(other.id_) {
    other.token_ = nullptr;
}

CancelToken::Registration& CancelToken::Registration::operator=(Registration&& other) noexcept {
    if (this != &other) {
        reset();
        token_ = other.token_;
        id_ = other.id_;
        other.token_ = nullptr;
    }
    return *this;
}

void CancelToken::Registration::reset() noexcept {
    if (token_) {
        token_->remove_waker(id_);
        token_ = nullptr;
    }
}

}  // namespace wren::realtime
