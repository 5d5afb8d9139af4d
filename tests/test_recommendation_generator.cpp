// Copyright(C) 2025-2026 Advanced Micro Devices, Inc. All rights reserved.
// SPDX-License-Identifier: MIT

#include <gtest/gtest.h>
#include <tonic/recommendation_generator.h>

#include <algorithm>
#include <numeric>
#include <random>
#include <tuple>

#include "test_helpers.h"

using namespace tonic;
using namespace tonic_test;

class RecommendationGeneratorTest : public ::testing::Test {
protected:
    RecommendationGenerator generator;
    ScanResult scan;

    const Recommendation* findByTitle(const std::vector<Recommendation>& recs,
                                      const std::string& title) {
        auto it = std::find_if(recs.begin(), recs.end(),
                               [&](const Recommendation& r) { return r.title == title; });
        return it == recs.end() ? nullptr : &*it;
    }
};

TEST_F(RecommendationGeneratorTest, CleanScanProducesNothing) {
    EXPECT_TRUE(generator.generate(scan).empty());
}

TEST_F(RecommendationGeneratorTest, TemporaryFilesAboveThreshold) {
    scan.junkFiles.tempFiles = makeGroup("Temp", 600 * MiB, 1);

    auto recs = generator.generate(scan);
    ASSERT_EQ(recs.size(), 1u);
    const auto& rec = recs[0];
    EXPECT_EQ(rec.type, RecommendationType::TEMP_FILES);
    EXPECT_EQ(rec.title, "Clear Temporary Files");
    EXPECT_EQ(rec.description, "Remove 1 temporary files (600 MB). These are safe to delete.");
    EXPECT_TRUE(rec.actionable);
    EXPECT_TRUE(rec.safeToFix);
    EXPECT_EQ(rec.spaceToReclaim, 600 * MiB);
    EXPECT_EQ(rec.affectedPaths, scan.junkFiles.tempFiles.paths);
    EXPECT_EQ(rec.scoreImpact, 3);
}

TEST_F(RecommendationGeneratorTest, ThresholdsAreStrict) {
    scan.junkFiles.tempFiles = makeGroup("Temp", RecommendationGenerator::TEMP_FILES_THRESHOLD);
    scan.junkFiles.trashItems = makeGroup("Trash", RecommendationGenerator::TRASH_THRESHOLD);
    scan.performanceIssues.browserCaches =
        makeGroup("Browser Cache", RecommendationGenerator::BROWSER_CACHE_THRESHOLD);
    EXPECT_TRUE(generator.generate(scan).empty());

    scan.junkFiles.tempFiles = makeGroup("Temp", RecommendationGenerator::TEMP_FILES_THRESHOLD + 1);
    scan.junkFiles.trashItems = makeGroup("Trash", RecommendationGenerator::TRASH_THRESHOLD + 1);
    EXPECT_EQ(generator.generate(scan).size(), 2u);
}

TEST_F(RecommendationGeneratorTest, ImpactIsMarginalPerFinding) {
    scan.junkFiles.tempFiles = makeGroup("Temp", 3 * GiB);
    scan.junkFiles.cacheFiles = makeGroup("Cache", 3 * GiB);

    auto recs = generator.generate(scan);
    ASSERT_EQ(recs.size(), 2u);
    // 6 GiB costs 15 points; either group alone costs 8
    EXPECT_EQ(recs[0].scoreImpact, 7);
    EXPECT_EQ(recs[1].scoreImpact, 7);
}

TEST_F(RecommendationGeneratorTest, SafetyFollowsCategory) {
    scan.junkFiles.tempFiles = makeGroup("Temp", 200 * MiB);
    scan.junkFiles.cacheFiles = makeGroup("Cache", 200 * MiB);
    scan.junkFiles.logFiles = makeGroup("Logs", 200 * MiB);
    scan.junkFiles.trashItems = makeGroup("Trash", 200 * MiB);
    scan.junkFiles.languageFiles = makeGroup("Languages", 200 * MiB);
    scan.junkFiles.oldFiles = makeGroup("Old", 200 * MiB);

    auto recs = generator.generate(scan);
    ASSERT_EQ(recs.size(), 6u);

    EXPECT_TRUE(findByTitle(recs, "Clear Temporary Files")->safeToFix);
    EXPECT_TRUE(findByTitle(recs, "Clear Application Caches")->safeToFix);
    EXPECT_TRUE(findByTitle(recs, "Clear Old Log Files")->safeToFix);
    EXPECT_TRUE(findByTitle(recs, "Empty Trash")->safeToFix);
    EXPECT_FALSE(findByTitle(recs, "Remove Unused Language Files")->safeToFix);
    EXPECT_FALSE(findByTitle(recs, "Remove Old Downloads")->safeToFix);

    // Equal sizes: the four safe ones come first, in emission order
    EXPECT_EQ(recs[0].type, RecommendationType::TEMP_FILES);
    EXPECT_EQ(recs[1].type, RecommendationType::CACHE);
    EXPECT_EQ(recs[2].type, RecommendationType::LOGS);
    EXPECT_EQ(recs[3].type, RecommendationType::TRASH);
    EXPECT_EQ(recs[4].type, RecommendationType::LANGUAGE_FILES);
    EXPECT_EQ(recs[5].type, RecommendationType::OLD_FILES);
}

TEST_F(RecommendationGeneratorTest, BrowserCacheAndLaunchAgents) {
    scan.performanceIssues.browserCaches = makeGroup("Browser Cache", GiB + GiB / 2, 40);
    scan.performanceIssues.launchAgents = makeGroup("Launch Agents", 4 * KiB, 3);

    auto recs = generator.generate(scan);
    ASSERT_EQ(recs.size(), 2u);

    EXPECT_EQ(recs[0].title, "Clear Browser Caches");
    EXPECT_EQ(recs[0].type, RecommendationType::CACHE);
    EXPECT_TRUE(recs[0].safeToFix);
    EXPECT_EQ(recs[0].scoreImpact, 5);
    EXPECT_EQ(recs[0].affectedPaths.size(), 40u);

    EXPECT_EQ(recs[1].type, RecommendationType::LAUNCH_AGENTS);
    EXPECT_EQ(recs[1].description, "Found 3 launch agents. Review and disable unnecessary ones.");
    EXPECT_FALSE(recs[1].safeToFix);
    EXPECT_EQ(recs[1].spaceToReclaim, 0);
    EXPECT_EQ(recs[1].scoreImpact, 0);
    EXPECT_EQ(recs[1].affectedPaths.size(), 3u);
}

TEST_F(RecommendationGeneratorTest, AppFindings) {
    scan.appIssues.unusedApps = {makeApp("editor", 300 * MiB)};
    scan.appIssues.largeApps = {makeApp("suite", 4 * GiB)};

    DuplicateAppGroup dup;
    dup.appName = "player";
    dup.versions = {makeApp("player-3", 100 * MiB), makeApp("player-2", 90 * MiB),
                    makeApp("player-1", 80 * MiB)};
    dup.totalSize = 270 * MiB;
    scan.appIssues.duplicateApps = {dup};

    for (int i = 0; i < 12; ++i) {
        scan.appIssues.orphanedFiles.push_back(makeOrphan("leftover" + std::to_string(i), 10 * MiB));
    }

    auto recs = generator.generate(scan);
    ASSERT_EQ(recs.size(), 4u);

    const auto* unused = findByTitle(recs, "Uninstall Unused Applications");
    ASSERT_NE(unused, nullptr);
    EXPECT_EQ(unused->type, RecommendationType::OLD_APPS);
    EXPECT_FALSE(unused->safeToFix);
    EXPECT_EQ(unused->spaceToReclaim, 300 * MiB);
    EXPECT_EQ(unused->scoreImpact, 2);
    EXPECT_EQ(unused->affectedPaths, std::vector<std::string>{"/opt/editor"});

    const auto* duplicate = findByTitle(recs, "Remove Duplicate Applications");
    ASSERT_NE(duplicate, nullptr);
    EXPECT_EQ(duplicate->spaceToReclaim, 270 * MiB);
    EXPECT_EQ(duplicate->scoreImpact, 3);
    EXPECT_EQ(duplicate->affectedPaths,
              (std::vector<std::string>{"/opt/player-2", "/opt/player-1"}));

    const auto* large = findByTitle(recs, "Review Large Applications");
    ASSERT_NE(large, nullptr);
    EXPECT_EQ(large->type, RecommendationType::LARGE_APPS);
    EXPECT_EQ(large->spaceToReclaim, 0);
    EXPECT_EQ(large->scoreImpact, 1);

    const auto* orphaned = findByTitle(recs, "Remove Orphaned Application Files");
    ASSERT_NE(orphaned, nullptr);
    EXPECT_TRUE(orphaned->safeToFix);
    EXPECT_EQ(orphaned->spaceToReclaim, 120 * MiB);
    EXPECT_EQ(orphaned->scoreImpact, 4);
    EXPECT_EQ(orphaned->affectedPaths.size(), 12u);

    // Large apps reclaim nothing and sort last
    EXPECT_EQ(recs.back().type, RecommendationType::LARGE_APPS);
}

TEST_F(RecommendationGeneratorTest, SortedBySpaceThenSafety) {
    scan.junkFiles.tempFiles = makeGroup("Temp", 80 * MiB);
    scan.junkFiles.oldFiles = makeGroup("Old", 2 * GiB);
    scan.junkFiles.trashItems = makeGroup("Trash", 700 * MiB);
    scan.performanceIssues.launchAgents = makeGroup("Launch Agents", 0, 2);
    scan.appIssues.largeApps = {makeApp("suite", 4 * GiB)};

    auto recs = generator.generate(scan);
    ASSERT_EQ(recs.size(), 5u);
    EXPECT_EQ(recs[0].type, RecommendationType::OLD_FILES);
    EXPECT_EQ(recs[1].type, RecommendationType::TRASH);
    EXPECT_EQ(recs[2].type, RecommendationType::TEMP_FILES);
    // Zero-space reviews keep emission order
    EXPECT_EQ(recs[3].type, RecommendationType::LAUNCH_AGENTS);
    EXPECT_EQ(recs[4].type, RecommendationType::LARGE_APPS);

    for (size_t i = 1; i < recs.size(); ++i) {
        EXPECT_GE(recs[i - 1].spaceToReclaim, recs[i].spaceToReclaim);
    }
}

TEST_F(RecommendationGeneratorTest, SortIsStableForEqualKeys) {
    std::vector<Recommendation> recs(4);
    recs[0].title = "a";
    recs[0].spaceToReclaim = 10;
    recs[1].title = "b";
    recs[1].spaceToReclaim = 10;
    recs[1].safeToFix = true;
    recs[2].title = "c";
    recs[2].spaceToReclaim = 10;
    recs[3].title = "d";
    recs[3].spaceToReclaim = 10;
    recs[3].safeToFix = true;

    RecommendationGenerator::sortRecommendations(recs);
    EXPECT_EQ(recs[0].title, "b");
    EXPECT_EQ(recs[1].title, "d");
    EXPECT_EQ(recs[2].title, "a");
    EXPECT_EQ(recs[3].title, "c");
}

TEST_F(RecommendationGeneratorTest, ImpactNeverNegativeOrAboveWeight) {
    scan.junkFiles.tempFiles = makeGroup("Temp", 12 * GiB, 3);
    scan.junkFiles.cacheFiles = makeGroup("Cache", 200 * MiB);
    scan.junkFiles.logFiles = makeGroup("Logs", 9 * GiB);
    scan.performanceIssues.browserCaches = makeGroup("Browser Cache", 20 * GiB);
    for (int i = 0; i < 30; ++i) {
        scan.appIssues.orphanedFiles.push_back(makeOrphan(std::to_string(i), 100 * MiB));
    }

    for (const auto& rec : generator.generate(scan)) {
        EXPECT_GE(rec.scoreImpact, 0) << rec.title;
        EXPECT_LE(rec.scoreImpact, ScoreCalculator::CACHE_WEIGHT) << rec.title;
    }
}

namespace {

ScanResult randomScan(std::mt19937& rng) {
    std::uniform_int_distribution<int64_t> size(0, 3 * GiB);
    std::uniform_int_distribution<int> count(1, 5);
    std::uniform_int_distribution<int> items(0, 6);

    ScanResult scan;
    scan.junkFiles.tempFiles = makeGroup("Temp", size(rng), count(rng));
    scan.junkFiles.cacheFiles = makeGroup("Cache", size(rng), count(rng));
    scan.junkFiles.logFiles = makeGroup("Logs", size(rng), count(rng));
    scan.junkFiles.trashItems = makeGroup("Trash", size(rng), count(rng));
    scan.junkFiles.oldFiles = makeGroup("Old", size(rng), count(rng));
    scan.performanceIssues.browserCaches = makeGroup("Browser Cache", size(rng), count(rng));
    const int agents = items(rng);
    if (agents > 0) {
        scan.performanceIssues.launchAgents = makeGroup("Launch Agents", agents * 4 * KiB, agents);
    }

    const int apps = items(rng);
    for (int i = 0; i < apps; ++i) {
        scan.appIssues.unusedApps.push_back(makeApp("unused-" + std::to_string(i), size(rng) / 4));
        scan.appIssues.largeApps.push_back(makeApp("large-" + std::to_string(i), size(rng)));
    }
    if (apps > 1) {
        DuplicateAppGroup dup;
        dup.appName = "player";
        dup.versions = {makeApp("player-1", size(rng) / 8), makeApp("player-2", size(rng) / 8)};
        dup.totalSize = dup.versions[0].totalSize + dup.versions[1].totalSize;
        scan.appIssues.duplicateApps.push_back(dup);
    }
    const int orphans = items(rng);
    for (int i = 0; i < orphans; ++i) {
        scan.appIssues.orphanedFiles.push_back(makeOrphan(std::to_string(i), size(rng) / 16));
    }
    return scan;
}

// Penalty of the category a recommendation remediates, before remediation.
int categoryPenalty(const Recommendation& rec, const ScorePenaltyBreakdown& base) {
    if (rec.title == "Clear Browser Caches") return base.cache;
    if (rec.title == "Review Launch Agents") return 0;
    if (rec.title == "Remove Orphaned Application Files") return base.orphaned;
    if (rec.type == RecommendationType::OLD_APPS || rec.type == RecommendationType::LARGE_APPS) {
        return base.app;
    }
    return base.junk;
}

} // namespace

TEST_F(RecommendationGeneratorTest, SortMatchesReferenceOrderingOnRandomInput) {
    std::mt19937 rng(20240611);
    std::uniform_int_distribution<int> length(0, 24);
    std::uniform_int_distribution<int> spaceBucket(0, 5);
    std::bernoulli_distribution safe(0.5);

    for (int round = 0; round < 200; ++round) {
        std::vector<Recommendation> recs(static_cast<size_t>(length(rng)));
        for (size_t i = 0; i < recs.size(); ++i) {
            recs[i].title = "rec-" + std::to_string(i);
            recs[i].spaceToReclaim = spaceBucket(rng) * MiB;
            recs[i].safeToFix = safe(rng);
        }

        // Reference: space descending, safe first, then original position
        std::vector<size_t> order(recs.size());
        std::iota(order.begin(), order.end(), 0);
        std::sort(order.begin(), order.end(), [&](size_t a, size_t b) {
            return std::make_tuple(-recs[a].spaceToReclaim, !recs[a].safeToFix, a) <
                   std::make_tuple(-recs[b].spaceToReclaim, !recs[b].safeToFix, b);
        });

        std::vector<Recommendation> sorted = recs;
        RecommendationGenerator::sortRecommendations(sorted);
        ASSERT_EQ(sorted.size(), order.size());
        for (size_t i = 0; i < order.size(); ++i) {
            EXPECT_EQ(sorted[i].title, recs[order[i]].title) << "round " << round << " index " << i;
        }
    }
}

TEST_F(RecommendationGeneratorTest, GenerateIsDeterministic) {
    std::mt19937 rng(7);
    for (int round = 0; round < 25; ++round) {
        ScanResult randomized = randomScan(rng);
        auto first = generator.generate(randomized);
        auto second = generator.generate(randomized);
        ASSERT_EQ(first.size(), second.size());
        for (size_t i = 0; i < first.size(); ++i) {
            EXPECT_EQ(first[i].toJson(), second[i].toJson()) << "round " << round;
        }
    }
}

TEST_F(RecommendationGeneratorTest, ImpactWithinOwnCategoryPenalty) {
    ScoreCalculator calculator;
    std::mt19937 rng(99);
    for (int round = 0; round < 50; ++round) {
        ScanResult randomized = randomScan(rng);
        const ScorePenaltyBreakdown base = calculator.penaltyBreakdown(
            std::nullopt, randomized.junkFiles, randomized.performanceIssues,
            randomized.appIssues);

        for (const auto& rec : generator.generate(randomized)) {
            EXPECT_GE(rec.scoreImpact, 0) << rec.title;
            EXPECT_LE(rec.scoreImpact, categoryPenalty(rec, base))
                << rec.title << " in round " << round;
        }
    }
}

TEST_F(RecommendationGeneratorTest, LargeCountsAbbreviated) {
    scan.junkFiles.cacheFiles = makeGroup("Cache", 200 * MiB, 1500);
    auto recs = generator.generate(scan);
    ASSERT_EQ(recs.size(), 1u);
    EXPECT_EQ(recs[0].description,
              "Remove 1.5 K cache files (200 MB). Apps will rebuild cache as needed.");
}
