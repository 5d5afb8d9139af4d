// Copyright(C) 2025-2026 Advanced Micro Devices, Inc. All rights reserved.
// SPDX-License-Identifier: MIT

#include "tonic/fix_executor.h"

#include <algorithm>
#include <exception>
#include <string>

namespace tonic {

FixExecutor::FixExecutor(FileOperations& fileOps, OutputHandler* console)
    : fileOps_(fileOps) {
    if (console == nullptr) {
        ownedConsole_ = std::make_unique<SilentConsole>(true);
        console_ = ownedConsole_.get();
    } else {
        console_ = console;
    }
}

FixOutcome FixExecutor::fix(const std::vector<Recommendation>& recommendations,
                            const CancellationToken* cancel) {
    FixOutcome outcome;
    FixResult& result = outcome.result;

    for (const auto& rec : recommendations) {
        if (!rec.safeToFix) continue;

        console_->startProgress(rec.title);
        for (const auto& path : rec.affectedPaths) {
            if (isCancelled(cancel)) {
                console_->stopProgress();
                console_->printWarning("Cleanup cancelled");
                outcome.cancelled = true;
                return outcome;
            }

            try {
                const int64_t size = fileOps_.calculateSize(path);
                DeleteResult deleted = fileOps_.deleteFiles({path});

                if (deleted.success) {
                    result.itemsFixed += deleted.filesProcessed;
                    result.spaceFreed += size;
                } else {
                    result.errors += std::max<int>(1, static_cast<int>(deleted.errors.size()));
                    for (const auto& err : deleted.errors) {
                        console_->printWarning(err);
                    }
                }
            } catch (const std::exception& e) {
                ++result.errors;
                console_->printWarning(path + ": " + e.what());
            }
        }
        console_->stopProgress();
    }

    return outcome;
}

} // namespace tonic
