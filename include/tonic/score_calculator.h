// Copyright(C) 2025-2026 Advanced Micro Devices, Inc. All rights reserved.
// SPDX-License-Identifier: MIT
//
// Weighted health scoring.
//
// Two variants with their own rating tables:
//   - findings-based: tiered step penalties over scan category snapshots
//   - live metrics:   piecewise-linear penalties over CPU/memory/disk/IO
//
// ScoreCalculator holds no mutable state and is safe to share across threads.

#pragma once

#include <optional>
#include <string>
#include <vector>

#include "types.h"
#include "tonic/export.h"

namespace tonic {

/// Ordered breakpoint table mapping a magnitude to a penalty.
/// lookup() returns the penalty of the first tier whose bound holds,
/// or the overflow penalty past the last tier.
struct TONIC_API PenaltyTable {
    enum class Bound {
        INCLUSIVE, // value <= limit
        EXCLUSIVE  // value < limit
    };

    struct Tier {
        double limit;
        int penalty;
    };

    Bound bound = Bound::EXCLUSIVE;
    std::vector<Tier> tiers;
    int overflowPenalty = 0;

    int lookup(double value) const;

    /// Largest penalty the table can return.
    int maxPenalty() const;
};

/// Per-category penalty points. Each value is within its category weight.
struct ScorePenaltyBreakdown {
    int disk = 0;
    int cache = 0;
    int junk = 0;
    int app = 0;
    int orphaned = 0;
    int privacy = 0;

    int total() const { return disk + cache + junk + app + orphaned + privacy; }

    json toJson() const {
        return json{
            {"disk", disk}, {"cache", cache}, {"junk", junk},
            {"app", app}, {"orphaned", orphaned}, {"privacy", privacy},
            {"total", total()}
        };
    }
};

struct ScoreOutcome {
    int score = 100;
    ScorePenaltyBreakdown breakdown;
};

/// Findings-based rating: >=90 excellent, >=75 good, >=50 fair, >=25 poor.
TONIC_API HealthRating healthRating(int score);

/// Live-metrics rating: >=90 excellent, >=75 good, >=60 fair, >=40 poor.
TONIC_API HealthRating systemHealthRating(int score);

class TONIC_API ScoreCalculator {
public:
    // Category weights (maximum penalty per category)
    static constexpr int DISK_WEIGHT = 30;
    static constexpr int CACHE_WEIGHT = 25;
    static constexpr int JUNK_WEIGHT = 20;
    static constexpr int APP_WEIGHT = 15;
    static constexpr int ORPHANED_WEIGHT = 10;
    static constexpr int PRIVACY_WEIGHT = 5;

    // Penalty applied when no disk summary is available
    static constexpr int UNKNOWN_DISK_PENALTY = 5;

    // Live-metrics weights
    static constexpr double CPU_WEIGHT = 25.0;
    static constexpr double MEMORY_WEIGHT = 25.0;
    static constexpr double DISK_USAGE_WEIGHT = 20.0;
    static constexpr double DISK_IO_WEIGHT = 10.0;

    static const PenaltyTable& diskUsageTable();
    static const PenaltyTable& browserCacheTable();
    static const PenaltyTable& junkSizeTable();
    static const PenaltyTable& orphanedSizeTable();

    /// Compute per-category penalties without clamping the total.
    ///
    /// @param diskUsage Disk summary, or nullopt when unknown
    /// @param privacy Privacy findings; nullopt contributes no penalty
    ScorePenaltyBreakdown penaltyBreakdown(
        const std::optional<DiskUsageSummary>& diskUsage,
        const JunkCategory& junk,
        const PerformanceCategory& performance,
        const AppIssueCategory& appIssues,
        const std::optional<PrivacyCategory>& privacy = std::nullopt) const;

    /// Score = clamp(100 - sum of penalties, 0, 100).
    ScoreOutcome calculateScore(
        const std::optional<DiskUsageSummary>& diskUsage,
        const JunkCategory& junk,
        const PerformanceCategory& performance,
        const AppIssueCategory& appIssues,
        const std::optional<PrivacyCategory>& privacy = std::nullopt) const;

    int diskPenalty(const std::optional<DiskUsageSummary>& diskUsage) const;
    int cachePenalty(const PerformanceCategory& performance) const;
    int junkPenalty(const JunkCategory& junk) const;
    int appPenalty(const AppIssueCategory& appIssues) const;
    int orphanedPenalty(const AppIssueCategory& appIssues) const;
    int privacyPenalty(const PrivacyCategory& privacy) const;

    /// Score live system readings.
    /// The message names the readings above their "high" threshold in
    /// evaluation order: CPU, memory, memory pressure, disk, thermal, I/O.
    SystemHealthScore calculateSystemScore(const SystemHealthMetrics& metrics) const;

    /// Linear ramp from half weight at `normal` to full weight at `high`,
    /// proportional beyond `high`, zero at or below `normal`.
    static double linearPenalty(double value, double normal, double high, double weight);
};

} // namespace tonic
