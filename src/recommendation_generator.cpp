// Copyright(C) 2025-2026 Advanced Micro Devices, Inc. All rights reserved.
// SPDX-License-Identifier: MIT

#include "tonic/recommendation_generator.h"

#include <algorithm>
#include <string>

#include "tonic/format.h"

namespace tonic {

namespace {

// One junk group and how it is presented when it crosses its threshold.
struct JunkFinding {
    FileGroup JunkCategory::*group;
    int64_t threshold;
    RecommendationType type;
    const char* title;
    const char* verb;
    const char* noun;
    const char* note;
    bool safeToFix;
};

const JunkFinding JUNK_FINDINGS[] = {
    {&JunkCategory::tempFiles, RecommendationGenerator::TEMP_FILES_THRESHOLD,
     RecommendationType::TEMP_FILES, "Clear Temporary Files",
     "Remove ", " temporary files", " These are safe to delete.", true},
    {&JunkCategory::cacheFiles, RecommendationGenerator::CACHE_FILES_THRESHOLD,
     RecommendationType::CACHE, "Clear Application Caches",
     "Remove ", " cache files", " Apps will rebuild cache as needed.", true},
    {&JunkCategory::logFiles, RecommendationGenerator::LOG_FILES_THRESHOLD,
     RecommendationType::LOGS, "Clear Old Log Files",
     "Remove ", " log files", " Old logs are safe to delete.", true},
    {&JunkCategory::trashItems, RecommendationGenerator::TRASH_THRESHOLD,
     RecommendationType::TRASH, "Empty Trash",
     "Permanently remove ", " items from Trash", "", true},
    {&JunkCategory::languageFiles, RecommendationGenerator::LANGUAGE_FILES_THRESHOLD,
     RecommendationType::LANGUAGE_FILES, "Remove Unused Language Files",
     "Remove ", " language files", " Keep only languages you use.", false},
    {&JunkCategory::oldFiles, RecommendationGenerator::OLD_FILES_THRESHOLD,
     RecommendationType::OLD_FILES, "Remove Old Downloads",
     "Delete ", " old files in Downloads folder", "", false},
};

int impactOf(int basePenalty, int counterfactualPenalty) {
    return std::max(0, basePenalty - counterfactualPenalty);
}

std::string sized(int64_t bytes) {
    return " (" + formatSize(bytes) + ").";
}

} // namespace

ScorePenaltyBreakdown RecommendationGenerator::breakdown(
    const JunkCategory& junk,
    const PerformanceCategory& performance,
    const AppIssueCategory& apps) const {
    // Disk usage is not affected by any single recommendation
    return calculator_.penaltyBreakdown(std::nullopt, junk, performance, apps);
}

std::vector<Recommendation> RecommendationGenerator::generate(const ScanResult& scanResult) const {
    std::vector<Recommendation> recommendations;

    const ScorePenaltyBreakdown base = breakdown(scanResult.junkFiles,
                                                 scanResult.performanceIssues,
                                                 scanResult.appIssues);

    addJunkRecommendations(scanResult, base, recommendations);
    addPerformanceRecommendations(scanResult, base, recommendations);
    addAppRecommendations(scanResult, base, recommendations);

    sortRecommendations(recommendations);
    return recommendations;
}

void RecommendationGenerator::sortRecommendations(std::vector<Recommendation>& recommendations) {
    std::stable_sort(recommendations.begin(), recommendations.end(),
        [](const Recommendation& a, const Recommendation& b) {
            if (a.spaceToReclaim != b.spaceToReclaim) {
                return a.spaceToReclaim > b.spaceToReclaim;
            }
            return a.safeToFix && !b.safeToFix;
        });
}

// ---- Junk ----

void RecommendationGenerator::addJunkRecommendations(
    const ScanResult& scan, const ScorePenaltyBreakdown& base,
    std::vector<Recommendation>& out) const {

    const JunkCategory& junk = scan.junkFiles;

    for (const auto& finding : JUNK_FINDINGS) {
        const FileGroup& group = junk.*(finding.group);
        if (group.size <= finding.threshold) continue;

        JunkCategory remediated = junk;
        remediated.*(finding.group) = FileGroup::empty(group.name, group.description);
        const auto counterfactual = breakdown(remediated, scan.performanceIssues, scan.appIssues);

        Recommendation rec;
        rec.type = finding.type;
        rec.title = finding.title;
        rec.description = finding.verb + formatFileCount(group.count) + finding.noun +
                          sized(group.size) + finding.note;
        rec.actionable = true;
        rec.safeToFix = finding.safeToFix;
        rec.spaceToReclaim = group.size;
        rec.affectedPaths = group.paths;
        rec.scoreImpact = impactOf(base.junk, counterfactual.junk);
        out.push_back(std::move(rec));
    }
}

// ---- Performance ----

void RecommendationGenerator::addPerformanceRecommendations(
    const ScanResult& scan, const ScorePenaltyBreakdown& base,
    std::vector<Recommendation>& out) const {

    const PerformanceCategory& perf = scan.performanceIssues;

    if (perf.browserCaches.size > BROWSER_CACHE_THRESHOLD) {
        PerformanceCategory remediated = perf;
        remediated.browserCaches = FileGroup::empty(perf.browserCaches.name,
                                                    perf.browserCaches.description);
        const auto counterfactual = breakdown(scan.junkFiles, remediated, scan.appIssues);

        Recommendation rec;
        rec.type = RecommendationType::CACHE;
        rec.title = "Clear Browser Caches";
        rec.description = "Remove " + formatFileCount(perf.browserCaches.count) +
                          " browser cache files" + sized(perf.browserCaches.size) +
                          " Browsers will rebuild them as needed.";
        rec.safeToFix = true;
        rec.spaceToReclaim = perf.browserCaches.size;
        rec.affectedPaths = perf.browserCaches.paths;
        rec.scoreImpact = impactOf(base.cache, counterfactual.cache);
        out.push_back(std::move(rec));
    }

    // Launch agents do not feed any penalty; review only
    if (perf.launchAgents.count > 0) {
        Recommendation rec;
        rec.type = RecommendationType::LAUNCH_AGENTS;
        rec.title = "Review Launch Agents";
        rec.description = "Found " + std::to_string(perf.launchAgents.count) +
                          " launch agents. Review and disable unnecessary ones.";
        rec.safeToFix = false;
        rec.spaceToReclaim = 0;
        rec.affectedPaths = perf.launchAgents.paths;
        rec.scoreImpact = 0;
        out.push_back(std::move(rec));
    }
}

// ---- Apps ----

void RecommendationGenerator::addAppRecommendations(
    const ScanResult& scan, const ScorePenaltyBreakdown& base,
    std::vector<Recommendation>& out) const {

    const AppIssueCategory& apps = scan.appIssues;

    auto appImpact = [&](const AppIssueCategory& remediated) {
        return impactOf(base.app, breakdown(scan.junkFiles, scan.performanceIssues, remediated).app);
    };

    if (!apps.unusedApps.empty()) {
        AppIssueCategory remediated = apps;
        remediated.unusedApps.clear();

        Recommendation rec;
        rec.type = RecommendationType::OLD_APPS;
        rec.title = "Uninstall Unused Applications";
        rec.description = "Found " + std::to_string(apps.unusedApps.size()) +
                          " unused apps" + sized(apps.unusedAppsSize()) +
                          " Remove to free up space.";
        rec.safeToFix = false;
        rec.spaceToReclaim = apps.unusedAppsSize();
        for (const auto& app : apps.unusedApps) rec.affectedPaths.push_back(app.path);
        rec.scoreImpact = appImpact(remediated);
        out.push_back(std::move(rec));
    }

    if (!apps.duplicateApps.empty()) {
        AppIssueCategory remediated = apps;
        remediated.duplicateApps.clear();

        Recommendation rec;
        rec.type = RecommendationType::OLD_APPS;
        rec.title = "Remove Duplicate Applications";
        rec.description = "Found " + std::to_string(apps.duplicateApps.size()) +
                          " apps with multiple versions" + sized(apps.duplicateAppsSize()) +
                          " Keep only the latest version.";
        rec.safeToFix = false;
        rec.spaceToReclaim = apps.duplicateAppsSize();
        // The first version of each group is the one kept
        for (const auto& group : apps.duplicateApps) {
            for (size_t i = 1; i < group.versions.size(); ++i) {
                rec.affectedPaths.push_back(group.versions[i].path);
            }
        }
        rec.scoreImpact = appImpact(remediated);
        out.push_back(std::move(rec));
    }

    if (!apps.largeApps.empty()) {
        AppIssueCategory remediated = apps;
        remediated.largeApps.clear();

        Recommendation rec;
        rec.type = RecommendationType::LARGE_APPS;
        rec.title = "Review Large Applications";
        rec.description = "Found " + std::to_string(apps.largeApps.size()) +
                          " very large apps. Consider if you need them all.";
        rec.safeToFix = false;
        rec.spaceToReclaim = 0;
        for (const auto& app : apps.largeApps) rec.affectedPaths.push_back(app.path);
        rec.scoreImpact = appImpact(remediated);
        out.push_back(std::move(rec));
    }

    if (!apps.orphanedFiles.empty()) {
        AppIssueCategory remediated = apps;
        remediated.orphanedFiles.clear();
        const auto counterfactual = breakdown(scan.junkFiles, scan.performanceIssues, remediated);

        Recommendation rec;
        rec.type = RecommendationType::OLD_APPS;
        rec.title = "Remove Orphaned Application Files";
        rec.description = "Found " + std::to_string(apps.orphanedFiles.size()) +
                          " files from uninstalled apps" + sized(apps.orphanedFilesSize()) +
                          " Safe to remove.";
        rec.safeToFix = true;
        rec.spaceToReclaim = apps.orphanedFilesSize();
        for (const auto& file : apps.orphanedFiles) rec.affectedPaths.push_back(file.path);
        rec.scoreImpact = impactOf(base.orphaned, counterfactual.orphaned);
        out.push_back(std::move(rec));
    }
}

} // namespace tonic
