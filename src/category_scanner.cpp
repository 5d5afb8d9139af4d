// Copyright(C) 2025-2026 Advanced Micro Devices, Inc. All rights reserved.
// SPDX-License-Identifier: MIT

#include "tonic/category_scanner.h"

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>

#ifndef _WIN32
#include <sys/stat.h>
#include <unistd.h>
#endif

namespace fs = std::filesystem;

namespace tonic {

namespace {

std::string envOr(const char* name, const std::string& fallback) {
    const char* value = std::getenv(name);
    if (value == nullptr || *value == '\0') return fallback;
    return value;
}

std::string joinPath(const std::string& base, const std::string& child) {
    if (base.empty()) return "";
    return (fs::path(base) / child).string();
}

bool hasPrefix(const std::string& path, const std::string& prefix) {
    if (prefix.empty() || path.size() < prefix.size()) return false;
    if (path.compare(0, prefix.size(), prefix) != 0) return false;
    return path.size() == prefix.size() || path[prefix.size()] == '/';
}

// Locate an executable named in a .desktop Exec= line.
bool executableExists(const std::string& command) {
    if (command.empty()) return true; // nothing to check against
    std::error_code ec;
    if (command.find('/') != std::string::npos) {
        return fs::exists(command, ec);
    }
    std::stringstream dirs(envOr("PATH", "/usr/local/bin:/usr/bin:/bin"));
    std::string dir;
    while (std::getline(dirs, dir, ':')) {
        if (!dir.empty() && fs::exists(fs::path(dir) / command, ec)) return true;
    }
    return false;
}

bool ownedByCurrentUser(const std::string& path) {
#ifdef _WIN32
    (void)path;
    return true;
#else
    struct stat st {};
    if (::lstat(path.c_str(), &st) != 0) return false;
    return st.st_uid == ::geteuid();
#endif
}

struct DesktopEntry {
    std::string name;
    std::string execCommand; // first token of Exec=, unquoted
};

DesktopEntry readDesktopEntry(const std::string& path) {
    DesktopEntry entry;
    std::ifstream in(path);
    std::string line;
    bool inMainGroup = false;
    while (std::getline(in, line)) {
        if (!line.empty() && line[0] == '[') {
            inMainGroup = (line == "[Desktop Entry]");
            continue;
        }
        if (!inMainGroup) continue;
        if (line.rfind("Name=", 0) == 0 && entry.name.empty()) {
            entry.name = line.substr(5);
        } else if (line.rfind("Exec=", 0) == 0 && entry.execCommand.empty()) {
            std::string cmd = line.substr(5);
            if (!cmd.empty() && cmd[0] == '"') {
                auto close = cmd.find('"', 1);
                entry.execCommand = cmd.substr(1, close == std::string::npos ? std::string::npos : close - 1);
            } else {
                entry.execCommand = cmd.substr(0, cmd.find(' '));
            }
        }
    }
    return entry;
}

} // namespace

// ---- ScanLocations ----

ScanLocations ScanLocations::underHome(const std::string& home, const std::string& temp) {
    ScanLocations loc;
    loc.homeDirectory = home;
    loc.tempDirectory = temp;
    loc.cacheDirectory = joinPath(home, ".cache");
    loc.stateDirectory = joinPath(home, ".local/state");
    loc.trashDirectory = joinPath(home, ".local/share/Trash/files");
    loc.downloadsDirectory = joinPath(home, "Downloads");
    loc.autostartDirectory = joinPath(home, ".config/autostart");
    loc.applicationsDirectory = joinPath(home, ".local/share/applications");
    for (const char* browser : {"google-chrome", "chromium", "mozilla"}) {
        loc.browserCacheDirectories.push_back(joinPath(loc.cacheDirectory, browser));
    }
    return loc;
}

ScanLocations ScanLocations::fromEnvironment() {
    const std::string home = envOr("HOME", "");

    std::string temp;
    std::error_code ec;
    fs::path tempPath = fs::temp_directory_path(ec);
    if (!ec) temp = tempPath.string();

    ScanLocations loc = underHome(home, temp);

    const std::string dataHome = envOr("XDG_DATA_HOME", joinPath(home, ".local/share"));
    const std::string configHome = envOr("XDG_CONFIG_HOME", joinPath(home, ".config"));
    loc.cacheDirectory = envOr("XDG_CACHE_HOME", loc.cacheDirectory);
    loc.stateDirectory = envOr("XDG_STATE_HOME", loc.stateDirectory);
    loc.trashDirectory = joinPath(dataHome, "Trash/files");
    loc.applicationsDirectory = joinPath(dataHome, "applications");
    loc.autostartDirectory = joinPath(configHome, "autostart");

    loc.browserCacheDirectories.clear();
    for (const char* browser : {"google-chrome", "chromium", "mozilla"}) {
        loc.browserCacheDirectories.push_back(joinPath(loc.cacheDirectory, browser));
    }
    return loc;
}

// ---- FilesystemCategoryScanner ----

FilesystemCategoryScanner::FilesystemCategoryScanner(ScanLocations locations)
    : locations_(std::move(locations)) {}

DirScanResult FilesystemCategoryScanner::scanDirectory(const std::string& root, int maxDepth,
                                                       int minAgeDays,
                                                       const std::string& extension) {
    DirScanResult result;
    if (root.empty() || maxDepth <= 0) return result;

    std::error_code ec;
    if (!fs::is_directory(root, ec)) return result;

    const auto cutoff = fs::file_time_type::clock::now() -
                        std::chrono::hours(24) * minAgeDays;

    // Explicit stack so a directory that cannot be read only loses its own entries
    std::vector<std::pair<fs::path, int>> pending{{fs::path(root), 1}};
    while (!pending.empty()) {
        const fs::path dir = pending.back().first;
        const int level = pending.back().second;
        pending.pop_back();

        std::error_code dirEc;
        fs::directory_iterator it(dir, fs::directory_options::skip_permission_denied, dirEc);
        const fs::directory_iterator end;
        for (; !dirEc && it != end; it.increment(dirEc)) {
            // Skip symlinks to avoid loops and counting data outside the tree
            std::error_code statusEc;
            const fs::file_status linkStatus = it->symlink_status(statusEc);
            if (statusEc || fs::is_symlink(linkStatus)) continue;

            if (fs::is_directory(linkStatus)) {
                if (level < maxDepth) pending.emplace_back(it->path(), level + 1);
                continue;
            }
            if (!fs::is_regular_file(linkStatus)) continue;

            const fs::path& path = it->path();
            if (!extension.empty() && path.extension() != extension) continue;

            if (minAgeDays > 0) {
                auto modified = it->last_write_time(statusEc);
                if (statusEc || modified > cutoff) continue;
            }

            auto size = it->file_size(statusEc);
            if (statusEc) continue;

            result.files.emplace_back(path.string(), static_cast<int64_t>(size));
            result.totalBytes += static_cast<int64_t>(size);
        }
    }
    return result;
}

FileGroup FilesystemCategoryScanner::groupFor(const std::string& name,
                                              const std::string& description,
                                              const std::string& root, int maxDepth,
                                              int minAgeDays,
                                              const std::string& extension) const {
    auto scanned = scanDirectory(root, maxDepth, minAgeDays, extension);
    return FileGroup::fromPaths(name, description, scanned.files);
}

std::optional<DiskUsageSummary> FilesystemCategoryScanner::diskUsage() {
    const std::string target = locations_.homeDirectory.empty() ? "/" : locations_.homeDirectory;

    std::error_code ec;
    fs::space_info info = fs::space(target, ec);
    if (ec || info.capacity == 0) return std::nullopt;

    DiskUsageSummary summary;
    summary.totalSpace = static_cast<int64_t>(info.capacity);
    summary.freeSpace = static_cast<int64_t>(info.available);
    summary.usedSpace = summary.totalSpace - static_cast<int64_t>(info.free);
    return summary;
}

JunkCategory FilesystemCategoryScanner::scanJunkFiles(const ScanConfig& config) {
    JunkCategory junk = JunkCategory::empty();
    const int depth = config.maxScanDepth;

    if (config.scanTempFiles) {
        // The temp directory is shared; other users' files and recent ones may be in use
        auto scanned = scanDirectory(locations_.tempDirectory, depth, TEMP_MIN_AGE_DAYS);
        std::vector<std::pair<std::string, int64_t>> kept;
        for (auto& file : scanned.files) {
            if (ownedByCurrentUser(file.first)) kept.push_back(std::move(file));
        }
        junk.tempFiles = FileGroup::fromPaths("Temp", "Temporary files idle for a day or more", kept);
    }

    if (config.scanCacheFiles) {
        // Browser caches are reported under performance issues
        auto scanned = scanDirectory(locations_.cacheDirectory, depth);
        std::vector<std::pair<std::string, int64_t>> kept;
        for (auto& file : scanned.files) {
            bool isBrowser = std::any_of(
                locations_.browserCacheDirectories.begin(),
                locations_.browserCacheDirectories.end(),
                [&](const std::string& dir) { return hasPrefix(file.first, dir); });
            if (!isBrowser) kept.push_back(std::move(file));
        }
        junk.cacheFiles = FileGroup::fromPaths("Cache", "Application caches", kept);
    }

    if (config.scanLogFiles) {
        junk.logFiles = groupFor("Logs", "Application log files",
                                 locations_.stateDirectory, depth, 0, ".log");
    }

    if (config.scanTrash) {
        junk.trashItems = groupFor("Trash", "Items in Trash", locations_.trashDirectory, depth);
    }

    if (config.scanLanguageFiles) {
        // Locale data is owned by the package manager on this platform
        junk.languageFiles = FileGroup::empty("Languages", "Not collected on this platform");
    }

    if (config.scanOldFiles) {
        junk.oldFiles = groupFor(
            "Old", "Downloads older than " + std::to_string(config.oldFileThresholdDays) + " days",
            locations_.downloadsDirectory, depth, config.oldFileThresholdDays);
    }

    return junk;
}

AppIssueCategory FilesystemCategoryScanner::scanAppIssues(const ScanConfig& config) {
    AppIssueCategory apps;
    if (!config.scanOrphanedFiles) return apps;

    // Launchers whose program has been removed
    auto launchers = scanDirectory(locations_.applicationsDirectory, 1, 0, ".desktop");
    for (const auto& file : launchers.files) {
        DesktopEntry entry = readDesktopEntry(file.first);
        if (executableExists(entry.execCommand)) continue;

        OrphanedFile orphan;
        orphan.id = fs::path(file.first).stem().string();
        orphan.path = file.first;
        orphan.size = file.second;
        orphan.type = OrphanType::OTHER;
        if (!entry.name.empty()) orphan.possibleSourceApp = entry.name;
        apps.orphanedFiles.push_back(std::move(orphan));
    }
    return apps;
}

PerformanceCategory FilesystemCategoryScanner::scanPerformanceIssues(const ScanConfig& config) {
    PerformanceCategory perf = PerformanceCategory::empty();

    if (config.scanLaunchAgents) {
        perf.launchAgents = groupFor("Launch Agents", "Programs started at login",
                                     locations_.autostartDirectory, 1, 0, ".desktop");
    }

    if (config.scanLoginItems) {
        perf.loginItems = groupFor("Login Items", "System-wide autostart entries",
                                   locations_.systemAutostartDirectory, 1, 0, ".desktop");
    }

    if (config.scanBrowserData) {
        std::vector<std::pair<std::string, int64_t>> files;
        for (const auto& dir : locations_.browserCacheDirectories) {
            auto scanned = scanDirectory(dir, config.maxScanDepth);
            files.insert(files.end(), scanned.files.begin(), scanned.files.end());
        }
        perf.browserCaches = FileGroup::fromPaths("Browser Cache", "Web browser caches", files);
    }

    return perf;
}

} // namespace tonic
