// Copyright(C) 2025-2026 Advanced Micro Devices, Inc. All rights reserved.
// SPDX-License-Identifier: MIT
//
// Common types for the Tonic scan core.
// Scan stages, category snapshots, recommendations, fix results and
// live system metrics.

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "format.h"

namespace tonic {

using json = nlohmann::json;

// ---- Scan Stages ----

enum class ScanStage {
    PREPARING,
    SCANNING_DISK,
    CHECKING_APPS,
    ANALYZING_SYSTEM,
    COMPLETE
};

inline std::string scanStageToString(ScanStage s) {
    switch (s) {
        case ScanStage::PREPARING:        return "Preparing";
        case ScanStage::SCANNING_DISK:    return "Scanning Disk";
        case ScanStage::CHECKING_APPS:    return "Checking Apps";
        case ScanStage::ANALYZING_SYSTEM: return "Analyzing System";
        case ScanStage::COMPLETE:         return "Complete";
    }
    return "Unknown";
}

/// Share of overall scan progress contributed by a stage.
/// Non-terminal stages sum to 1.0; COMPLETE carries none.
inline double scanStageProgressWeight(ScanStage s) {
    switch (s) {
        case ScanStage::PREPARING:        return 0.05;
        case ScanStage::SCANNING_DISK:    return 0.40;
        case ScanStage::CHECKING_APPS:    return 0.30;
        case ScanStage::ANALYZING_SYSTEM: return 0.25;
        case ScanStage::COMPLETE:         return 0.0;
    }
    return 0.0;
}

inline ScanStage nextScanStage(ScanStage s) {
    switch (s) {
        case ScanStage::PREPARING:        return ScanStage::SCANNING_DISK;
        case ScanStage::SCANNING_DISK:    return ScanStage::CHECKING_APPS;
        case ScanStage::CHECKING_APPS:    return ScanStage::ANALYZING_SYSTEM;
        case ScanStage::ANALYZING_SYSTEM: return ScanStage::COMPLETE;
        case ScanStage::COMPLETE:         return ScanStage::COMPLETE;
    }
    return ScanStage::COMPLETE;
}

enum class ScanStatus {
    IDLE,
    RUNNING,
    CANCELLED,
    READY,      // all stages done, waiting for finalize
    FINALIZED
};

inline std::string scanStatusToString(ScanStatus s) {
    switch (s) {
        case ScanStatus::IDLE:      return "idle";
        case ScanStatus::RUNNING:   return "running";
        case ScanStatus::CANCELLED: return "cancelled";
        case ScanStatus::READY:     return "ready";
        case ScanStatus::FINALIZED: return "finalized";
    }
    return "unknown";
}

/// Outcome of a single runStage() call.
struct StageReport {
    ScanStage stage = ScanStage::PREPARING;
    ScanStatus status = ScanStatus::IDLE;
    double progress = 0.0; // cumulative, capped at 0.95 until finalize

    json toJson() const {
        return json{
            {"stage", scanStageToString(stage)},
            {"status", scanStatusToString(status)},
            {"progress", progress}
        };
    }
};

// ---- File Groups ----

/// A named bundle of paths with aggregate size and count.
/// Build through fromPaths() so size/count always match the paths.
struct FileGroup {
    std::string name;
    std::string description;
    std::vector<std::string> paths;
    int64_t size = 0;
    int count = 0;

    static FileGroup empty(const std::string& name, const std::string& description = "") {
        FileGroup g;
        g.name = name;
        g.description = description;
        return g;
    }

    static FileGroup fromPaths(const std::string& name, const std::string& description,
                               const std::vector<std::pair<std::string, int64_t>>& entries) {
        FileGroup g = empty(name, description);
        g.paths.reserve(entries.size());
        for (const auto& entry : entries) {
            g.paths.push_back(entry.first);
            g.size += entry.second;
        }
        g.count = static_cast<int>(entries.size());
        return g;
    }

    bool isEmpty() const { return count == 0 && size == 0; }

    json toJson() const {
        return json{
            {"name", name},
            {"description", description},
            {"paths", paths},
            {"size", size},
            {"count", count}
        };
    }
};

// ---- Category Snapshots ----

struct JunkCategory {
    FileGroup tempFiles;
    FileGroup cacheFiles;
    FileGroup logFiles;
    FileGroup trashItems;
    FileGroup languageFiles;
    FileGroup oldFiles;

    static JunkCategory empty() {
        JunkCategory j;
        j.tempFiles = FileGroup::empty("Temp");
        j.cacheFiles = FileGroup::empty("Cache");
        j.logFiles = FileGroup::empty("Logs");
        j.trashItems = FileGroup::empty("Trash");
        j.languageFiles = FileGroup::empty("Languages");
        j.oldFiles = FileGroup::empty("Old");
        return j;
    }

    int64_t totalSize() const {
        return tempFiles.size + cacheFiles.size + logFiles.size +
               trashItems.size + languageFiles.size + oldFiles.size;
    }

    int totalFiles() const {
        return tempFiles.count + cacheFiles.count + logFiles.count +
               trashItems.count + languageFiles.count + oldFiles.count;
    }

    json toJson() const {
        return json{
            {"temp_files", tempFiles.toJson()},
            {"cache_files", cacheFiles.toJson()},
            {"log_files", logFiles.toJson()},
            {"trash_items", trashItems.toJson()},
            {"language_files", languageFiles.toJson()},
            {"old_files", oldFiles.toJson()},
            {"total_size", totalSize()},
            {"total_files", totalFiles()}
        };
    }
};

struct PerformanceCategory {
    FileGroup launchAgents;
    FileGroup loginItems;
    FileGroup browserCaches;
    std::vector<std::string> memoryIssues;
    std::optional<double> diskFragmentation;

    static PerformanceCategory empty() {
        PerformanceCategory p;
        p.launchAgents = FileGroup::empty("Launch Agents");
        p.loginItems = FileGroup::empty("Login Items");
        p.browserCaches = FileGroup::empty("Browser Cache");
        return p;
    }

    json toJson() const {
        json j{
            {"launch_agents", launchAgents.toJson()},
            {"login_items", loginItems.toJson()},
            {"browser_caches", browserCaches.toJson()},
            {"memory_issues", memoryIssues}
        };
        if (diskFragmentation.has_value()) j["disk_fragmentation"] = diskFragmentation.value();
        return j;
    }
};

struct AppMetadata {
    std::string bundleIdentifier;
    std::string appName;
    std::string path;
    std::string version;
    int64_t totalSize = 0;
    std::optional<int64_t> lastUsed; // epoch seconds

    json toJson() const {
        json j{
            {"bundle_identifier", bundleIdentifier},
            {"app_name", appName},
            {"path", path},
            {"version", version},
            {"total_size", totalSize}
        };
        if (lastUsed.has_value()) j["last_used"] = lastUsed.value();
        return j;
    }
};

struct DuplicateAppGroup {
    std::string appName;
    std::vector<AppMetadata> versions;
    int64_t totalSize = 0;

    json toJson() const {
        json v = json::array();
        for (const auto& app : versions) v.push_back(app.toJson());
        return json{{"app_name", appName}, {"versions", v}, {"total_size", totalSize}};
    }
};

enum class OrphanType {
    APP_SUPPORT,
    CACHE,
    PREFERENCES,
    CONTAINER,
    LOGS,
    LAUNCH_AGENT,
    OTHER
};

inline std::string orphanTypeToString(OrphanType t) {
    switch (t) {
        case OrphanType::APP_SUPPORT:  return "Application Support";
        case OrphanType::CACHE:        return "Cache";
        case OrphanType::PREFERENCES:  return "Preferences";
        case OrphanType::CONTAINER:    return "Container";
        case OrphanType::LOGS:         return "Logs";
        case OrphanType::LAUNCH_AGENT: return "Launch Agent";
        case OrphanType::OTHER:        return "Other";
    }
    return "Other";
}

struct OrphanedFile {
    std::string id;
    std::string path;
    int64_t size = 0;
    OrphanType type = OrphanType::OTHER;
    std::optional<std::string> possibleSourceApp;

    json toJson() const {
        json j{
            {"id", id},
            {"path", path},
            {"size", size},
            {"type", orphanTypeToString(type)}
        };
        if (possibleSourceApp.has_value()) j["possible_source_app"] = possibleSourceApp.value();
        return j;
    }
};

struct AppIssueCategory {
    std::vector<AppMetadata> unusedApps;
    std::vector<AppMetadata> largeApps;
    std::vector<DuplicateAppGroup> duplicateApps;
    std::vector<OrphanedFile> orphanedFiles;

    static AppIssueCategory empty() { return AppIssueCategory{}; }

    int64_t unusedAppsSize() const {
        int64_t total = 0;
        for (const auto& app : unusedApps) total += app.totalSize;
        return total;
    }

    int64_t largeAppsSize() const {
        int64_t total = 0;
        for (const auto& app : largeApps) total += app.totalSize;
        return total;
    }

    int64_t duplicateAppsSize() const {
        int64_t total = 0;
        for (const auto& group : duplicateApps) total += group.totalSize;
        return total;
    }

    int64_t orphanedFilesSize() const {
        int64_t total = 0;
        for (const auto& file : orphanedFiles) total += file.size;
        return total;
    }

    json toJson() const {
        json unused = json::array();
        for (const auto& app : unusedApps) unused.push_back(app.toJson());
        json large = json::array();
        for (const auto& app : largeApps) large.push_back(app.toJson());
        json dups = json::array();
        for (const auto& group : duplicateApps) dups.push_back(group.toJson());
        json orphans = json::array();
        for (const auto& file : orphanedFiles) orphans.push_back(file.toJson());
        return json{
            {"unused_apps", unused},
            {"large_apps", large},
            {"duplicate_apps", dups},
            {"orphaned_files", orphans}
        };
    }
};

struct PrivacyCategory {
    FileGroup browserHistory;
    FileGroup downloadHistory;
    FileGroup recentDocuments;
    FileGroup clipboardData;

    static PrivacyCategory empty() {
        PrivacyCategory p;
        p.browserHistory = FileGroup::empty("Browser History");
        p.downloadHistory = FileGroup::empty("Download History");
        p.recentDocuments = FileGroup::empty("Recent Documents");
        p.clipboardData = FileGroup::empty("Clipboard");
        return p;
    }

    json toJson() const {
        return json{
            {"browser_history", browserHistory.toJson()},
            {"download_history", downloadHistory.toJson()},
            {"recent_documents", recentDocuments.toJson()},
            {"clipboard_data", clipboardData.toJson()}
        };
    }
};

struct DiskUsageSummary {
    int64_t totalSpace = 0;
    int64_t usedSpace = 0;
    int64_t freeSpace = 0;
    int64_t homeDirectorySize = 0;
    int64_t cacheSize = 0;
    int64_t logSize = 0;
    int64_t tempSize = 0;

    /// Used space as a percentage of total; 0 when the total is unknown.
    double usedPercentage() const {
        if (totalSpace <= 0) return 0.0;
        return static_cast<double>(usedSpace) / static_cast<double>(totalSpace) * 100.0;
    }

    json toJson() const {
        return json{
            {"total_space", totalSpace},
            {"used_space", usedSpace},
            {"free_space", freeSpace},
            {"home_directory_size", homeDirectorySize},
            {"cache_size", cacheSize},
            {"log_size", logSize},
            {"temp_size", tempSize},
            {"used_percentage", usedPercentage()}
        };
    }
};

// ---- Health Rating ----

enum class HealthRating {
    EXCELLENT,
    GOOD,
    FAIR,
    POOR,
    CRITICAL
};

inline std::string healthRatingToString(HealthRating r) {
    switch (r) {
        case HealthRating::EXCELLENT: return "excellent";
        case HealthRating::GOOD:      return "good";
        case HealthRating::FAIR:      return "fair";
        case HealthRating::POOR:      return "poor";
        case HealthRating::CRITICAL:  return "critical";
    }
    return "unknown";
}

inline std::string ratingDescription(HealthRating r) {
    switch (r) {
        case HealthRating::EXCELLENT: return "Your system is in excellent health";
        case HealthRating::GOOD:      return "Your system is in good condition";
        case HealthRating::FAIR:      return "Your system could use some optimization";
        case HealthRating::POOR:      return "Your system needs attention";
        case HealthRating::CRITICAL:  return "Your system requires immediate attention";
    }
    return "";
}

// ---- Recommendations ----

enum class RecommendationType {
    CACHE,
    LOGS,
    TEMP_FILES,
    TRASH,
    LANGUAGE_FILES,
    OLD_FILES,
    LAUNCH_AGENTS,
    OLD_APPS,
    LARGE_APPS
};

inline std::string recommendationTypeToString(RecommendationType t) {
    switch (t) {
        case RecommendationType::CACHE:          return "cache";
        case RecommendationType::LOGS:           return "logs";
        case RecommendationType::TEMP_FILES:     return "temp_files";
        case RecommendationType::TRASH:          return "trash";
        case RecommendationType::LANGUAGE_FILES: return "language_files";
        case RecommendationType::OLD_FILES:      return "old_files";
        case RecommendationType::LAUNCH_AGENTS:  return "launch_agents";
        case RecommendationType::OLD_APPS:       return "old_apps";
        case RecommendationType::LARGE_APPS:     return "large_apps";
    }
    return "unknown";
}

struct Recommendation {
    RecommendationType type = RecommendationType::CACHE;
    std::string title;
    std::string description;
    bool actionable = true;
    bool safeToFix = false;
    int64_t spaceToReclaim = 0;
    std::vector<std::string> affectedPaths;
    int scoreImpact = 0; // marginal score gain, never negative

    json toJson() const {
        return json{
            {"type", recommendationTypeToString(type)},
            {"title", title},
            {"description", description},
            {"actionable", actionable},
            {"safe_to_fix", safeToFix},
            {"space_to_reclaim", spaceToReclaim},
            {"affected_paths", affectedPaths},
            {"score_impact", scoreImpact}
        };
    }
};

// ---- Scan Results ----

struct ScanResult {
    std::string id;
    std::string timestamp; // ISO-8601 UTC
    int healthScore = 100;
    JunkCategory junkFiles = JunkCategory::empty();
    PerformanceCategory performanceIssues = PerformanceCategory::empty();
    AppIssueCategory appIssues;
    int64_t totalReclaimableSpace = 0;

    json toJson() const {
        return json{
            {"id", id},
            {"timestamp", timestamp},
            {"health_score", healthScore},
            {"junk_files", junkFiles.toJson()},
            {"performance_issues", performanceIssues.toJson()},
            {"app_issues", appIssues.toJson()},
            {"total_reclaimable_space", totalReclaimableSpace}
        };
    }
};

/// Finalized product of a Smart Scan.
struct SmartScanResult {
    ScanResult scanResult;
    std::vector<Recommendation> recommendations;
    std::optional<DiskUsageSummary> diskUsage;
    double scanDuration = 0.0; // seconds

    json toJson() const {
        json recs = json::array();
        for (const auto& r : recommendations) recs.push_back(r.toJson());
        json j = scanResult.toJson();
        j["recommendations"] = recs;
        j["scan_duration"] = scanDuration;
        j["disk_usage"] = diskUsage.has_value() ? diskUsage->toJson() : json(nullptr);
        return j;
    }
};

// ---- Fix Results ----

struct FixResult {
    int itemsFixed = 0;
    int64_t spaceFreed = 0;
    int errors = 0;

    std::string message() const {
        if (errors > 0) {
            return "Fixed " + std::to_string(itemsFixed) + " items, freed " +
                   formatSize(spaceFreed) + ". " + std::to_string(errors) +
                   " items had errors.";
        }
        return "Successfully fixed " + std::to_string(itemsFixed) +
               " items and freed " + formatSize(spaceFreed) + "!";
    }

    json toJson() const {
        return json{
            {"items_fixed", itemsFixed},
            {"space_freed", spaceFreed},
            {"errors", errors},
            {"message", message()}
        };
    }
};

struct FixOutcome {
    FixResult result;
    bool cancelled = false;
};

// ---- Live System Metrics ----

enum class MemoryPressure {
    NORMAL,
    WARNING,
    CRITICAL
};

inline std::string memoryPressureToString(MemoryPressure p) {
    switch (p) {
        case MemoryPressure::NORMAL:   return "normal";
        case MemoryPressure::WARNING:  return "warning";
        case MemoryPressure::CRITICAL: return "critical";
    }
    return "unknown";
}

/// Snapshot of live readings. Missing optional fields mean the metric is
/// unavailable and contributes no penalty.
struct SystemHealthMetrics {
    double cpuUsagePercent = 0.0;
    double memoryUsedPercent = 0.0;
    MemoryPressure memoryPressure = MemoryPressure::NORMAL;
    std::optional<double> diskUsedPercent;
    std::optional<double> cpuTemperatureCelsius;
    double diskReadMBps = 0.0;
    double diskWriteMBps = 0.0;

    json toJson() const {
        json j{
            {"cpu_usage_percent", cpuUsagePercent},
            {"memory_used_percent", memoryUsedPercent},
            {"memory_pressure", memoryPressureToString(memoryPressure)},
            {"disk_read_mbps", diskReadMBps},
            {"disk_write_mbps", diskWriteMBps}
        };
        if (diskUsedPercent.has_value()) j["disk_used_percent"] = diskUsedPercent.value();
        if (cpuTemperatureCelsius.has_value()) j["cpu_temperature_celsius"] = cpuTemperatureCelsius.value();
        return j;
    }
};

struct SystemHealthScore {
    int score = 100;
    std::string message;
};

// ---- Scan Configuration ----

struct ScanConfig {
    bool scanTempFiles = true;
    bool scanCacheFiles = true;
    bool scanLogFiles = true;
    bool scanTrash = true;
    bool scanLanguageFiles = false;
    bool scanOldFiles = true;
    bool scanLaunchAgents = true;
    bool scanLoginItems = true;
    bool scanBrowserData = false;
    bool scanOrphanedFiles = true;
    int oldFileThresholdDays = 90;
    int maxScanDepth = 8;       // directory recursion limit for filesystem scanners
    bool debug = false;

    static ScanConfig defaults() { return ScanConfig{}; }

    static ScanConfig aggressive() {
        ScanConfig c;
        c.scanLanguageFiles = true;
        c.scanBrowserData = true;
        c.oldFileThresholdDays = 60;
        return c;
    }
};

} // namespace tonic
