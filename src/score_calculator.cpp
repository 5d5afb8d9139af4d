// Copyright(C) 2025-2026 Advanced Micro Devices, Inc. All rights reserved.
// SPDX-License-Identifier: MIT

#include "tonic/score_calculator.h"

#include <algorithm>
#include <cmath>

namespace tonic {

namespace {

constexpr double MIB = 1024.0 * 1024.0;
constexpr double GIB = 1024.0 * MIB;

// Live-metrics thresholds: no penalty at or below "normal", full weight at "high"
constexpr double CPU_NORMAL = 30.0;
constexpr double CPU_HIGH = 70.0;
constexpr double MEMORY_NORMAL = 60.0;
constexpr double MEMORY_HIGH = 85.0;
constexpr double DISK_NORMAL = 70.0;
constexpr double DISK_HIGH = 90.0;
constexpr double IO_NORMAL = 100.0; // MB/s, read + write
constexpr double IO_HIGH = 400.0;

constexpr double TEMP_WARM = 80.0;
constexpr double TEMP_HOT = 90.0;

} // namespace

// ---- PenaltyTable ----

int PenaltyTable::lookup(double value) const {
    for (const auto& tier : tiers) {
        const bool within = (bound == Bound::INCLUSIVE) ? value <= tier.limit
                                                        : value < tier.limit;
        if (within) return tier.penalty;
    }
    return overflowPenalty;
}

int PenaltyTable::maxPenalty() const {
    int result = overflowPenalty;
    for (const auto& tier : tiers) result = std::max(result, tier.penalty);
    return result;
}

// ---- Ratings ----

HealthRating healthRating(int score) {
    if (score >= 90) return HealthRating::EXCELLENT;
    if (score >= 75) return HealthRating::GOOD;
    if (score >= 50) return HealthRating::FAIR;
    if (score >= 25) return HealthRating::POOR;
    return HealthRating::CRITICAL;
}

HealthRating systemHealthRating(int score) {
    if (score >= 90) return HealthRating::EXCELLENT;
    if (score >= 75) return HealthRating::GOOD;
    if (score >= 60) return HealthRating::FAIR;
    if (score >= 40) return HealthRating::POOR;
    return HealthRating::CRITICAL;
}

// ---- Tables ----

const PenaltyTable& ScoreCalculator::diskUsageTable() {
    static const PenaltyTable table{
        PenaltyTable::Bound::INCLUSIVE,
        {{50.0, 0}, {70.0, 5}, {80.0, 10}, {90.0, 20}, {95.0, 25}},
        DISK_WEIGHT
    };
    return table;
}

const PenaltyTable& ScoreCalculator::browserCacheTable() {
    static const PenaltyTable table{
        PenaltyTable::Bound::EXCLUSIVE,
        {{1 * GIB, 0}, {2 * GIB, 5}, {5 * GIB, 10}, {10 * GIB, 15}},
        CACHE_WEIGHT
    };
    return table;
}

const PenaltyTable& ScoreCalculator::junkSizeTable() {
    static const PenaltyTable table{
        PenaltyTable::Bound::EXCLUSIVE,
        {{500 * MIB, 0}, {1 * GIB, 3}, {5 * GIB, 8}, {10 * GIB, 15}},
        JUNK_WEIGHT
    };
    return table;
}

const PenaltyTable& ScoreCalculator::orphanedSizeTable() {
    static const PenaltyTable table{
        PenaltyTable::Bound::EXCLUSIVE,
        {{100 * MIB, 0}, {500 * MIB, 2}, {1 * GIB, 4}},
        5
    };
    return table;
}

// ---- Findings-based penalties ----

int ScoreCalculator::diskPenalty(const std::optional<DiskUsageSummary>& diskUsage) const {
    if (!diskUsage.has_value()) return UNKNOWN_DISK_PENALTY;
    return diskUsageTable().lookup(diskUsage->usedPercentage());
}

int ScoreCalculator::cachePenalty(const PerformanceCategory& performance) const {
    return browserCacheTable().lookup(static_cast<double>(performance.browserCaches.size));
}

int ScoreCalculator::junkPenalty(const JunkCategory& junk) const {
    const int sizePenalty = junkSizeTable().lookup(static_cast<double>(junk.totalSize()));

    // Many small files also count, independent of their size
    const int countPenalty = std::min(junk.totalFiles() / 1000, 5);

    return std::min(sizePenalty + countPenalty, JUNK_WEIGHT);
}

int ScoreCalculator::appPenalty(const AppIssueCategory& appIssues) const {
    const int unused = std::min(static_cast<int>(appIssues.unusedApps.size()) * 2, 5);
    const int large = std::min(static_cast<int>(appIssues.largeApps.size()), 5);
    const int duplicate = std::min(static_cast<int>(appIssues.duplicateApps.size()) * 3, 5);
    return std::min(unused + large + duplicate, APP_WEIGHT);
}

int ScoreCalculator::orphanedPenalty(const AppIssueCategory& appIssues) const {
    const int countPenalty = std::min(static_cast<int>(appIssues.orphanedFiles.size()) / 5, 5);
    const int sizePenalty =
        orphanedSizeTable().lookup(static_cast<double>(appIssues.orphanedFilesSize()));
    return std::min(countPenalty + sizePenalty, ORPHANED_WEIGHT);
}

int ScoreCalculator::privacyPenalty(const PrivacyCategory& privacy) const {
    int penalty = 0;
    if (static_cast<double>(privacy.browserHistory.size) > 100 * MIB) penalty += 2;
    if (static_cast<double>(privacy.downloadHistory.size) > 1 * GIB) penalty += 2;
    return std::min(penalty, PRIVACY_WEIGHT);
}

ScorePenaltyBreakdown ScoreCalculator::penaltyBreakdown(
    const std::optional<DiskUsageSummary>& diskUsage,
    const JunkCategory& junk,
    const PerformanceCategory& performance,
    const AppIssueCategory& appIssues,
    const std::optional<PrivacyCategory>& privacy) const {

    ScorePenaltyBreakdown b;
    b.disk = diskPenalty(diskUsage);
    b.cache = cachePenalty(performance);
    b.junk = junkPenalty(junk);
    b.app = appPenalty(appIssues);
    b.orphaned = orphanedPenalty(appIssues);
    b.privacy = privacy.has_value() ? privacyPenalty(*privacy) : 0;
    return b;
}

ScoreOutcome ScoreCalculator::calculateScore(
    const std::optional<DiskUsageSummary>& diskUsage,
    const JunkCategory& junk,
    const PerformanceCategory& performance,
    const AppIssueCategory& appIssues,
    const std::optional<PrivacyCategory>& privacy) const {

    ScoreOutcome outcome;
    outcome.breakdown = penaltyBreakdown(diskUsage, junk, performance, appIssues, privacy);
    outcome.score = std::clamp(100 - outcome.breakdown.total(), 0, 100);
    return outcome;
}

// ---- Live metrics ----

double ScoreCalculator::linearPenalty(double value, double normal, double high, double weight) {
    if (value <= normal) return 0.0;
    if (value <= high) {
        return weight * (0.5 + 0.5 * (value - normal) / (high - normal));
    }
    return weight * value / high;
}

SystemHealthScore ScoreCalculator::calculateSystemScore(const SystemHealthMetrics& m) const {
    double penalty = 0.0;
    std::vector<std::string> issues;

    penalty += linearPenalty(m.cpuUsagePercent, CPU_NORMAL, CPU_HIGH, CPU_WEIGHT);
    if (m.cpuUsagePercent > CPU_HIGH) issues.push_back("high CPU usage");

    penalty += linearPenalty(m.memoryUsedPercent, MEMORY_NORMAL, MEMORY_HIGH, MEMORY_WEIGHT);
    if (m.memoryUsedPercent > MEMORY_HIGH) issues.push_back("high memory usage");

    switch (m.memoryPressure) {
        case MemoryPressure::NORMAL:
            break;
        case MemoryPressure::WARNING:
            penalty += 5.0;
            issues.push_back("memory pressure");
            break;
        case MemoryPressure::CRITICAL:
            penalty += 10.0;
            issues.push_back("memory pressure");
            break;
    }

    if (m.diskUsedPercent.has_value()) {
        const double disk = *m.diskUsedPercent;
        penalty += linearPenalty(disk, DISK_NORMAL, DISK_HIGH, DISK_USAGE_WEIGHT);
        if (disk > DISK_HIGH) issues.push_back("low disk space");
    }

    if (m.cpuTemperatureCelsius.has_value()) {
        const double temp = *m.cpuTemperatureCelsius;
        if (temp >= TEMP_HOT) {
            penalty += 10.0;
        } else if (temp >= TEMP_WARM) {
            penalty += 5.0;
        }
        if (temp >= TEMP_WARM) issues.push_back("high CPU temperature");
    }

    const double io = m.diskReadMBps + m.diskWriteMBps;
    penalty += linearPenalty(io, IO_NORMAL, IO_HIGH, DISK_IO_WEIGHT);
    if (io > IO_HIGH) issues.push_back("heavy disk I/O");

    SystemHealthScore result;
    result.score = std::clamp(static_cast<int>(std::lround(100.0 - penalty)), 0, 100);

    if (issues.empty()) {
        result.message = "System is running smoothly";
    } else {
        result.message = "Attention: ";
        for (size_t i = 0; i < issues.size(); ++i) {
            if (i > 0) result.message += ", ";
            result.message += issues[i];
        }
    }
    return result;
}

} // namespace tonic
