// Copyright(C) 2025-2026 Advanced Micro Devices, Inc. All rights reserved.
// SPDX-License-Identifier: MIT
//
// Smart Scan driver: staged state machine over a mutex-guarded aggregate.
//
// Stages run strictly in order:
//   PREPARING -> SCANNING_DISK -> CHECKING_APPS -> ANALYZING_SYSTEM
// and finalizeScan() produces the scored result with recommendations.
// The aggregate is read concurrently by progress observers (UI polling);
// every access takes the lock, and the lock is never held across a
// CategoryScanner call.

#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "cancellation.h"
#include "category_scanner.h"
#include "console.h"
#include "file_operations.h"
#include "fix_executor.h"
#include "recommendation_generator.h"
#include "score_calculator.h"
#include "types.h"
#include "tonic/export.h"

namespace tonic {

/// Mutable scan state. Categories stay empty until their stage has run.
struct TONIC_API ScanAggregate {
    std::optional<DiskUsageSummary> diskUsage;
    std::optional<JunkCategory> junkFiles;
    std::optional<PerformanceCategory> performanceIssues;
    std::optional<AppIssueCategory> appIssues;
    std::vector<Recommendation> recommendations;
    double stageProgress = 0.0;

    bool hasAnyCategory() const {
        return junkFiles.has_value() || performanceIssues.has_value() || appIssues.has_value();
    }

    /// Reclaimable bytes over the populated categories, each counted once.
    int64_t reclaimableBytes() const;

    /// Items flagged across the populated categories.
    int flaggedCount() const;

    json toJson() const;
};

/// Called after each stage completes or is cancelled.
using ProgressCallback = std::function<void(const StageReport&)>;

class TONIC_API ScanOrchestrator {
public:
    /// @param scanner Category source; must outlive the orchestrator
    /// @param fileOps Delete primitive for fixRecommendations(); must outlive the orchestrator
    /// @param config Scan configuration passed to every scanner call
    /// @param console Output handler; nullptr for silent operation
    ScanOrchestrator(CategoryScanner& scanner, FileOperations& fileOps,
                     const ScanConfig& config = {}, OutputHandler* console = nullptr);
    ~ScanOrchestrator();

    // Non-copyable
    ScanOrchestrator(const ScanOrchestrator&) = delete;
    ScanOrchestrator& operator=(const ScanOrchestrator&) = delete;

    /// Run one stage.
    /// PREPARING always starts a new scan; any other stage must directly
    /// follow the last completed one.
    ///
    /// @param stage Stage to run (not COMPLETE)
    /// @param cancel Optional cancellation flag, checked before and after the scan work
    /// @return Report with the cumulative progress (capped at 0.95)
    /// @throws std::logic_error on an out-of-order, re-entrant or COMPLETE stage,
    ///         or any stage after a cancellation other than PREPARING
    StageReport runStage(ScanStage stage, const CancellationToken* cancel = nullptr);

    /// Score the aggregate and generate recommendations.
    /// Repeated calls without an intervening stage return identical results.
    /// runStage() calls made while scoring is in progress throw.
    ///
    /// @return The result, or std::nullopt if the scan was cancelled
    /// @throws std::logic_error if no scan was started or a stage or
    ///         another finalize is running
    std::optional<SmartScanResult> finalizeScan();

    /// Run every stage in order, then finalize.
    /// @return The result, or std::nullopt if cancelled
    std::optional<SmartScanResult> runFullScan(const CancellationToken* cancel = nullptr);

    /// Apply the safe recommendations through the FileOperations collaborator.
    FixOutcome fixRecommendations(const std::vector<Recommendation>& recommendations,
                                  const CancellationToken* cancel = nullptr);

    // ---- Live accessors (lock, copy, return) ----

    ScanStage currentStage() const;
    ScanStatus status() const;
    double progress() const;
    std::optional<DiskUsageSummary> diskUsage() const;

    /// Reclaimable bytes found so far; nullopt until a category has been scanned.
    std::optional<int64_t> partialSpaceFoundBytes() const;

    /// Items flagged so far; nullopt until a category has been scanned.
    std::optional<int> partialFlaggedCount() const;

    ScanAggregate aggregateSnapshot() const;

    void setProgressCallback(ProgressCallback callback);

    const ScanConfig& config() const { return config_; }
    OutputHandler& console() { return *console_; }

private:
    class StageInFlight;

    void runStageWork(ScanStage stage, ScanAggregate& staged);
    StageReport markCancelled(ScanStage stage);
    void notify(const StageReport& report);

    CategoryScanner& scanner_;
    ScanConfig config_;
    std::unique_ptr<OutputHandler> ownedConsole_;
    OutputHandler* console_;
    std::unique_ptr<FixExecutor> fixExecutor_;
    ScoreCalculator calculator_;
    RecommendationGenerator generator_;
    ProgressCallback progressCallback_;

    // ---- Guarded by mutex_ ----
    mutable std::mutex mutex_;
    ScanAggregate aggregate_;
    ScanStage currentStage_ = ScanStage::PREPARING;
    std::optional<ScanStage> lastCompleted_;
    ScanStatus status_ = ScanStatus::IDLE;
    bool started_ = false;
    bool stageInFlight_ = false;
    bool finalizing_ = false;
    std::string scanId_;
    std::string scanTimestamp_;
    std::chrono::steady_clock::time_point startedAt_;
    double scanDuration_ = 0.0;
};

} // namespace tonic
