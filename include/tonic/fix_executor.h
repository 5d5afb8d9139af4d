// Copyright(C) 2025-2026 Advanced Micro Devices, Inc. All rights reserved.
// SPDX-License-Identifier: MIT
//
// Applies safe recommendations through a FileOperations collaborator.
//
// Recommendations with safeToFix == false are never acted on. Each path is
// measured, deleted and tallied on its own; a failing path is counted as an
// error and the batch continues. Cancellation is checked between paths.

#pragma once

#include <memory>
#include <vector>

#include "cancellation.h"
#include "console.h"
#include "file_operations.h"
#include "types.h"
#include "tonic/export.h"

namespace tonic {

class TONIC_API FixExecutor {
public:
    /// @param fileOps Delete primitive; must outlive the executor
    /// @param console Output handler; nullptr for silent operation
    explicit FixExecutor(FileOperations& fileOps, OutputHandler* console = nullptr);

    // Non-copyable
    FixExecutor(const FixExecutor&) = delete;
    FixExecutor& operator=(const FixExecutor&) = delete;

    /// Fix recommendations in the given order.
    ///
    /// @param recommendations Recommendations to apply (unsafe ones are skipped)
    /// @param cancel Optional cancellation flag, checked before each path
    /// @return Accumulated result; cancelled is set if the loop stopped early
    FixOutcome fix(const std::vector<Recommendation>& recommendations,
                   const CancellationToken* cancel = nullptr);

private:
    FileOperations& fileOps_;
    std::unique_ptr<OutputHandler> ownedConsole_;
    OutputHandler* console_;
};

} // namespace tonic
