// Copyright(C) 2025-2026 Advanced Micro Devices, Inc. All rights reserved.
// SPDX-License-Identifier: MIT
//
// JSON loading utilities for scan configuration and recorded findings.
//   - tolerant parsing of hand-edited files (comments, trailing commas)
//   - ScanConfig <-> JSON
//   - category snapshots and live metrics from JSON fixtures

#pragma once

#include <string>

#include <nlohmann/json.hpp>

#include "types.h"
#include "tonic/export.h"

namespace tonic {

using json = nlohmann::json;

/// Fix common JSON syntax errors in hand-edited files.
/// - Remove trailing commas before } or ]
/// - Strip text before first { or [
///
/// @param text Potentially malformed JSON text
/// @return Fixed text
TONIC_API std::string fixCommonJsonErrors(const std::string& text);

/// Parse JSON text, allowing // and /* */ comments.
/// Falls back to fixCommonJsonErrors() if the text does not parse as-is.
///
/// @param text JSON text
/// @return Parsed JSON value
/// @throws std::runtime_error if the text cannot be parsed
TONIC_API json parseJsonText(const std::string& text);

/// Read and parse a JSON file.
///
/// @param path File path
/// @return Parsed JSON value
/// @throws std::runtime_error if the file cannot be read or parsed
TONIC_API json parseJsonFile(const std::string& path);

/// Build a ScanConfig from JSON. Every key is optional; missing keys keep
/// the ScanConfig::defaults() value.
///
/// Recognized keys: scan_temp_files, scan_cache_files, scan_log_files,
/// scan_trash, scan_language_files, scan_old_files, scan_launch_agents,
/// scan_login_items, scan_browser_data, scan_orphaned_files,
/// old_file_threshold_days, max_scan_depth, debug, and "preset"
/// ("default" or "aggressive") which is applied before the other keys.
///
/// @throws std::runtime_error on a wrong value type or unknown preset
TONIC_API ScanConfig scanConfigFromJson(const json& j);

/// Same as scanConfigFromJson(j), with missing keys taken from `base`.
/// A "preset" key replaces `base` before the other keys are applied.
TONIC_API ScanConfig scanConfigFromJson(const json& j, const ScanConfig& base);

/// Inverse of scanConfigFromJson().
TONIC_API json scanConfigToJson(const ScanConfig& config);

/// Load a ScanConfig from a JSON file, layered over `base`.
/// @throws std::runtime_error on I/O, parse or type errors
TONIC_API ScanConfig loadScanConfig(const std::string& path,
                                    const ScanConfig& base = ScanConfig::defaults());

// ---- Findings ----
// Inverse of the toJson() members in types.h. Sizes and counts of a
// FileGroup are recomputed from its paths when "entries" is given.

TONIC_API FileGroup fileGroupFromJson(const json& j);
TONIC_API JunkCategory junkCategoryFromJson(const json& j);
TONIC_API PerformanceCategory performanceCategoryFromJson(const json& j);
TONIC_API AppIssueCategory appIssueCategoryFromJson(const json& j);
TONIC_API DiskUsageSummary diskUsageFromJson(const json& j);

/// Parse a live metrics snapshot. Absent optional readings stay empty.
/// @throws std::runtime_error on an unknown memory_pressure value
TONIC_API SystemHealthMetrics systemHealthMetricsFromJson(const json& j);

} // namespace tonic
