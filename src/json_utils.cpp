// Copyright(C) 2025-2026 Advanced Micro Devices, Inc. All rights reserved.
// SPDX-License-Identifier: MIT

#include "tonic/json_utils.h"

#include <algorithm>
#include <fstream>
#include <regex>
#include <sstream>
#include <stdexcept>

namespace tonic {

namespace {

// Read an optional key, converting nlohmann type errors into runtime_error
// with the offending key in the message.
template <typename T>
T valueOr(const json& j, const char* key, const T& fallback) {
    if (!j.is_object() || !j.contains(key) || j[key].is_null()) {
        return fallback;
    }
    try {
        return j[key].get<T>();
    } catch (const json::type_error& e) {
        throw std::runtime_error(std::string("Invalid value for '") + key + "': " + e.what());
    }
}

template <typename T>
std::optional<T> optionalValue(const json& j, const char* key) {
    if (!j.is_object() || !j.contains(key) || j[key].is_null()) {
        return std::nullopt;
    }
    return valueOr<T>(j, key, T{});
}

const json& arrayOrEmpty(const json& j, const char* key) {
    static const json empty = json::array();
    if (!j.is_object() || !j.contains(key)) return empty;
    if (!j[key].is_array()) {
        throw std::runtime_error(std::string("Expected array for '") + key + "'");
    }
    return j[key];
}

FileGroup groupOrEmpty(const json& j, const char* key, const std::string& defaultName) {
    if (!j.is_object() || !j.contains(key)) return FileGroup::empty(defaultName);
    FileGroup g = fileGroupFromJson(j[key]);
    if (g.name.empty()) g.name = defaultName;
    return g;
}

AppMetadata appMetadataFromJson(const json& j) {
    AppMetadata app;
    app.bundleIdentifier = valueOr<std::string>(j, "bundle_identifier", "");
    app.appName = valueOr<std::string>(j, "app_name", "");
    app.path = valueOr<std::string>(j, "path", "");
    app.version = valueOr<std::string>(j, "version", "");
    app.totalSize = valueOr<int64_t>(j, "total_size", 0);
    app.lastUsed = optionalValue<int64_t>(j, "last_used");
    return app;
}

OrphanType orphanTypeFromString(const std::string& s) {
    static const OrphanType all[] = {
        OrphanType::APP_SUPPORT, OrphanType::CACHE, OrphanType::PREFERENCES,
        OrphanType::CONTAINER, OrphanType::LOGS, OrphanType::LAUNCH_AGENT,
        OrphanType::OTHER
    };
    for (OrphanType t : all) {
        if (orphanTypeToString(t) == s) return t;
    }
    return OrphanType::OTHER;
}

} // namespace

std::string fixCommonJsonErrors(const std::string& text) {
    std::string fixed = text;

    // Remove trailing commas before } or ]
    fixed = std::regex_replace(fixed, std::regex(R"(,\s*\})"), "}");
    fixed = std::regex_replace(fixed, std::regex(R"(,\s*\])"), "]");

    // Remove text before first '{' or '['
    auto startPos = std::min(fixed.find('{'), fixed.find('['));
    if (startPos != std::string::npos && startPos > 0) {
        fixed = fixed.substr(startPos);
    }

    return fixed;
}

json parseJsonText(const std::string& text) {
    try {
        return json::parse(text, nullptr, true, /*ignore_comments=*/true);
    } catch (const json::parse_error&) {
        // Retry after fixing common hand-editing mistakes
    }

    try {
        return json::parse(fixCommonJsonErrors(text), nullptr, true, true);
    } catch (const json::parse_error& e) {
        throw std::runtime_error(std::string("Failed to parse JSON: ") + e.what());
    }
}

json parseJsonFile(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("Cannot open file: " + path);
    }
    std::stringstream buffer;
    buffer << in.rdbuf();

    try {
        return parseJsonText(buffer.str());
    } catch (const std::runtime_error& e) {
        throw std::runtime_error(path + ": " + e.what());
    }
}

// ---- ScanConfig ----

ScanConfig scanConfigFromJson(const json& j) {
    return scanConfigFromJson(j, ScanConfig::defaults());
}

ScanConfig scanConfigFromJson(const json& j, const ScanConfig& base) {
    if (!j.is_object()) {
        throw std::runtime_error("Scan configuration must be a JSON object");
    }

    ScanConfig c = base;
    if (j.contains("preset")) {
        const std::string preset = valueOr<std::string>(j, "preset", "default");
        if (preset == "aggressive") {
            c = ScanConfig::aggressive();
        } else if (preset == "default") {
            c = ScanConfig::defaults();
        } else {
            throw std::runtime_error("Unknown scan preset: " + preset);
        }
    }

    c.scanTempFiles = valueOr(j, "scan_temp_files", c.scanTempFiles);
    c.scanCacheFiles = valueOr(j, "scan_cache_files", c.scanCacheFiles);
    c.scanLogFiles = valueOr(j, "scan_log_files", c.scanLogFiles);
    c.scanTrash = valueOr(j, "scan_trash", c.scanTrash);
    c.scanLanguageFiles = valueOr(j, "scan_language_files", c.scanLanguageFiles);
    c.scanOldFiles = valueOr(j, "scan_old_files", c.scanOldFiles);
    c.scanLaunchAgents = valueOr(j, "scan_launch_agents", c.scanLaunchAgents);
    c.scanLoginItems = valueOr(j, "scan_login_items", c.scanLoginItems);
    c.scanBrowserData = valueOr(j, "scan_browser_data", c.scanBrowserData);
    c.scanOrphanedFiles = valueOr(j, "scan_orphaned_files", c.scanOrphanedFiles);
    c.oldFileThresholdDays = valueOr(j, "old_file_threshold_days", c.oldFileThresholdDays);
    c.maxScanDepth = valueOr(j, "max_scan_depth", c.maxScanDepth);
    c.debug = valueOr(j, "debug", c.debug);

    if (c.oldFileThresholdDays < 0) {
        throw std::runtime_error("old_file_threshold_days must not be negative");
    }
    if (c.maxScanDepth <= 0) {
        throw std::runtime_error("max_scan_depth must be positive");
    }
    return c;
}

json scanConfigToJson(const ScanConfig& c) {
    return json{
        {"scan_temp_files", c.scanTempFiles},
        {"scan_cache_files", c.scanCacheFiles},
        {"scan_log_files", c.scanLogFiles},
        {"scan_trash", c.scanTrash},
        {"scan_language_files", c.scanLanguageFiles},
        {"scan_old_files", c.scanOldFiles},
        {"scan_launch_agents", c.scanLaunchAgents},
        {"scan_login_items", c.scanLoginItems},
        {"scan_browser_data", c.scanBrowserData},
        {"scan_orphaned_files", c.scanOrphanedFiles},
        {"old_file_threshold_days", c.oldFileThresholdDays},
        {"max_scan_depth", c.maxScanDepth},
        {"debug", c.debug}
    };
}

ScanConfig loadScanConfig(const std::string& path, const ScanConfig& base) {
    return scanConfigFromJson(parseJsonFile(path), base);
}

// ---- Findings ----

FileGroup fileGroupFromJson(const json& j) {
    if (!j.is_object()) {
        throw std::runtime_error("File group must be a JSON object");
    }

    const std::string name = valueOr<std::string>(j, "name", "");
    const std::string description = valueOr<std::string>(j, "description", "");

    if (j.contains("entries")) {
        std::vector<std::pair<std::string, int64_t>> entries;
        for (const auto& e : arrayOrEmpty(j, "entries")) {
            entries.emplace_back(valueOr<std::string>(e, "path", ""),
                                 valueOr<int64_t>(e, "size", 0));
        }
        return FileGroup::fromPaths(name, description, entries);
    }

    // Totals-only form: count is the number of paths; size is kept as given
    FileGroup g = FileGroup::empty(name, description);
    g.paths = valueOr<std::vector<std::string>>(j, "paths", {});
    g.size = valueOr<int64_t>(j, "size", 0);
    g.count = static_cast<int>(g.paths.size());

    if (j.contains("count") && valueOr<int>(j, "count", g.count) != g.count) {
        throw std::runtime_error("File group '" + name + "': count " +
                                 j["count"].dump() + " does not match " +
                                 std::to_string(g.count) + " paths");
    }
    if (g.size < 0 || (g.paths.empty() && g.size != 0)) {
        throw std::runtime_error("File group '" + name + "': size " +
                                 std::to_string(g.size) + " is invalid for " +
                                 std::to_string(g.count) + " paths");
    }
    return g;
}

JunkCategory junkCategoryFromJson(const json& j) {
    JunkCategory junk;
    junk.tempFiles = groupOrEmpty(j, "temp_files", "Temp");
    junk.cacheFiles = groupOrEmpty(j, "cache_files", "Cache");
    junk.logFiles = groupOrEmpty(j, "log_files", "Logs");
    junk.trashItems = groupOrEmpty(j, "trash_items", "Trash");
    junk.languageFiles = groupOrEmpty(j, "language_files", "Languages");
    junk.oldFiles = groupOrEmpty(j, "old_files", "Old");
    return junk;
}

PerformanceCategory performanceCategoryFromJson(const json& j) {
    PerformanceCategory perf;
    perf.launchAgents = groupOrEmpty(j, "launch_agents", "Launch Agents");
    perf.loginItems = groupOrEmpty(j, "login_items", "Login Items");
    perf.browserCaches = groupOrEmpty(j, "browser_caches", "Browser Cache");
    perf.memoryIssues = valueOr<std::vector<std::string>>(j, "memory_issues", {});
    perf.diskFragmentation = optionalValue<double>(j, "disk_fragmentation");
    return perf;
}

AppIssueCategory appIssueCategoryFromJson(const json& j) {
    AppIssueCategory apps;
    for (const auto& a : arrayOrEmpty(j, "unused_apps")) {
        apps.unusedApps.push_back(appMetadataFromJson(a));
    }
    for (const auto& a : arrayOrEmpty(j, "large_apps")) {
        apps.largeApps.push_back(appMetadataFromJson(a));
    }
    for (const auto& d : arrayOrEmpty(j, "duplicate_apps")) {
        DuplicateAppGroup group;
        group.appName = valueOr<std::string>(d, "app_name", "");
        for (const auto& v : arrayOrEmpty(d, "versions")) {
            group.versions.push_back(appMetadataFromJson(v));
        }
        group.totalSize = valueOr<int64_t>(d, "total_size", 0);
        apps.duplicateApps.push_back(std::move(group));
    }
    for (const auto& o : arrayOrEmpty(j, "orphaned_files")) {
        OrphanedFile file;
        file.id = valueOr<std::string>(o, "id", "");
        file.path = valueOr<std::string>(o, "path", "");
        file.size = valueOr<int64_t>(o, "size", 0);
        file.type = orphanTypeFromString(valueOr<std::string>(o, "type", "Other"));
        file.possibleSourceApp = optionalValue<std::string>(o, "possible_source_app");
        apps.orphanedFiles.push_back(std::move(file));
    }
    return apps;
}

DiskUsageSummary diskUsageFromJson(const json& j) {
    DiskUsageSummary d;
    d.totalSpace = valueOr<int64_t>(j, "total_space", 0);
    d.usedSpace = valueOr<int64_t>(j, "used_space", 0);
    d.freeSpace = valueOr<int64_t>(j, "free_space", d.totalSpace - d.usedSpace);
    d.homeDirectorySize = valueOr<int64_t>(j, "home_directory_size", 0);
    d.cacheSize = valueOr<int64_t>(j, "cache_size", 0);
    d.logSize = valueOr<int64_t>(j, "log_size", 0);
    d.tempSize = valueOr<int64_t>(j, "temp_size", 0);
    return d;
}

SystemHealthMetrics systemHealthMetricsFromJson(const json& j) {
    SystemHealthMetrics m;
    m.cpuUsagePercent = valueOr<double>(j, "cpu_usage_percent", 0.0);
    m.memoryUsedPercent = valueOr<double>(j, "memory_used_percent", 0.0);
    m.diskUsedPercent = optionalValue<double>(j, "disk_used_percent");
    m.cpuTemperatureCelsius = optionalValue<double>(j, "cpu_temperature_celsius");
    m.diskReadMBps = valueOr<double>(j, "disk_read_mbps", 0.0);
    m.diskWriteMBps = valueOr<double>(j, "disk_write_mbps", 0.0);

    const std::string pressure = valueOr<std::string>(j, "memory_pressure", "normal");
    if (pressure == "normal") {
        m.memoryPressure = MemoryPressure::NORMAL;
    } else if (pressure == "warning") {
        m.memoryPressure = MemoryPressure::WARNING;
    } else if (pressure == "critical") {
        m.memoryPressure = MemoryPressure::CRITICAL;
    } else {
        throw std::runtime_error("Unknown memory_pressure: " + pressure);
    }
    return m;
}

} // namespace tonic
