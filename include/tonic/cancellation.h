// Copyright(C) 2025-2026 Advanced Micro Devices, Inc. All rights reserved.
// SPDX-License-Identifier: MIT
//
// Cooperative cancellation flag shared between a scan/fix caller and the
// worker running it. Checked between stages and between fix paths only.

#pragma once

#include <atomic>

namespace tonic {

class CancellationToken {
public:
    CancellationToken() = default;

    // Non-copyable
    CancellationToken(const CancellationToken&) = delete;
    CancellationToken& operator=(const CancellationToken&) = delete;

    void cancel() { cancelled_.store(true, std::memory_order_release); }
    void reset() { cancelled_.store(false, std::memory_order_release); }

    bool isCancelled() const { return cancelled_.load(std::memory_order_acquire); }

private:
    std::atomic<bool> cancelled_{false};
};

/// True when a token was supplied and has been cancelled.
inline bool isCancelled(const CancellationToken* token) {
    return token != nullptr && token->isCancelled();
}

} // namespace tonic
