// Copyright(C) 2025-2026 Advanced Micro Devices, Inc. All rights reserved.
// SPDX-License-Identifier: MIT
//
// Category scanners produce immutable findings snapshots for one scan.
//
// CategoryScanner is the seam the orchestrator calls through; tests and
// platform ports substitute their own implementation. The bundled
// FilesystemCategoryScanner walks the XDG locations of a Linux desktop.

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "types.h"
#include "tonic/export.h"

namespace tonic {

/// Read-only source of category findings.
/// Implementations may throw std::exception on failure; the orchestrator
/// treats a throwing scan as an empty category.
class TONIC_API CategoryScanner {
public:
    virtual ~CategoryScanner() = default;

    /// Capacity of the volume holding the user's data, or nullopt if unknown.
    virtual std::optional<DiskUsageSummary> diskUsage() = 0;

    virtual JunkCategory scanJunkFiles(const ScanConfig& config) = 0;
    virtual AppIssueCategory scanAppIssues(const ScanConfig& config) = 0;
    virtual PerformanceCategory scanPerformanceIssues(const ScanConfig& config) = 0;
};

/// Locations scanned by FilesystemCategoryScanner.
/// Empty strings disable a location.
struct TONIC_API ScanLocations {
    std::string homeDirectory;
    std::string tempDirectory;
    std::string cacheDirectory;         // $XDG_CACHE_HOME or ~/.cache
    std::string stateDirectory;         // $XDG_STATE_HOME or ~/.local/state
    std::string trashDirectory;         // ~/.local/share/Trash/files
    std::string downloadsDirectory;     // ~/Downloads
    std::string autostartDirectory;     // ~/.config/autostart
    std::string systemAutostartDirectory = "/etc/xdg/autostart";
    std::string applicationsDirectory;  // ~/.local/share/applications
    std::vector<std::string> browserCacheDirectories;

    /// Resolve locations from HOME and the XDG environment variables.
    static ScanLocations fromEnvironment();

    /// Resolve every location beneath `home` (XDG variables ignored).
    static ScanLocations underHome(const std::string& home, const std::string& temp);
};

/// Result of walking one directory tree.
struct DirScanResult {
    std::vector<std::pair<std::string, int64_t>> files; // path, size
    int64_t totalBytes = 0;
};

/// Scanner backed by std::filesystem.
class TONIC_API FilesystemCategoryScanner : public CategoryScanner {
public:
    /// Temp files are reported only when owned by the current user and
    /// unmodified for at least this many days.
    static constexpr int TEMP_MIN_AGE_DAYS = 1;

    explicit FilesystemCategoryScanner(ScanLocations locations = ScanLocations::fromEnvironment());

    std::optional<DiskUsageSummary> diskUsage() override;
    JunkCategory scanJunkFiles(const ScanConfig& config) override;
    AppIssueCategory scanAppIssues(const ScanConfig& config) override;
    PerformanceCategory scanPerformanceIssues(const ScanConfig& config) override;

    const ScanLocations& locations() const { return locations_; }

    /// Recursively collect regular files below `root`.
    /// Symlinks are not followed; unreadable entries are skipped.
    ///
    /// @param root Directory to walk (missing directories yield nothing)
    /// @param maxDepth Recursion limit, 1 = direct children only
    /// @param minAgeDays Only include files last modified at least this long ago
    /// @param extension Only include files with this extension (e.g. ".log")
    static DirScanResult scanDirectory(const std::string& root, int maxDepth,
                                       int minAgeDays = 0,
                                       const std::string& extension = "");

private:
    FileGroup groupFor(const std::string& name, const std::string& description,
                       const std::string& root, int maxDepth,
                       int minAgeDays = 0, const std::string& extension = "") const;

    ScanLocations locations_;
};

} // namespace tonic
