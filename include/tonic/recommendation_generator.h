// Copyright(C) 2025-2026 Advanced Micro Devices, Inc. All rights reserved.
// SPDX-License-Identifier: MIT
//
// Turns scan findings into a prioritized, safety-annotated action list.
//
// Each finding is emitted only above its size (or count) threshold and
// carries its marginal score impact: the drop in its category's penalty
// when just that finding is emptied, all other findings held fixed.

#pragma once

#include <cstdint>
#include <vector>

#include "score_calculator.h"
#include "types.h"
#include "tonic/export.h"

namespace tonic {

class TONIC_API RecommendationGenerator {
public:
    // Emission thresholds (strictly greater than)
    static constexpr int64_t TEMP_FILES_THRESHOLD = 50LL * 1024 * 1024;
    static constexpr int64_t CACHE_FILES_THRESHOLD = 100LL * 1024 * 1024;
    static constexpr int64_t LOG_FILES_THRESHOLD = 50LL * 1024 * 1024;
    static constexpr int64_t TRASH_THRESHOLD = 10LL * 1024 * 1024;
    static constexpr int64_t LANGUAGE_FILES_THRESHOLD = 50LL * 1024 * 1024;
    static constexpr int64_t OLD_FILES_THRESHOLD = 100LL * 1024 * 1024;
    static constexpr int64_t BROWSER_CACHE_THRESHOLD = 500LL * 1024 * 1024;

    RecommendationGenerator() = default;
    explicit RecommendationGenerator(const ScoreCalculator& calculator)
        : calculator_(calculator) {}

    /// Generate recommendations for a scan result.
    /// Sorted by spaceToReclaim descending, safe before unsafe on ties;
    /// equal keys keep emission order (junk, performance, apps).
    ///
    /// @param scanResult Finalized or in-progress scan findings
    /// @return Ordered recommendations (empty when nothing crosses a threshold)
    std::vector<Recommendation> generate(const ScanResult& scanResult) const;

    /// Sort in place with the ordering generate() uses.
    static void sortRecommendations(std::vector<Recommendation>& recommendations);

private:
    void addJunkRecommendations(const ScanResult& scan, const ScorePenaltyBreakdown& base,
                                std::vector<Recommendation>& out) const;
    void addPerformanceRecommendations(const ScanResult& scan, const ScorePenaltyBreakdown& base,
                                       std::vector<Recommendation>& out) const;
    void addAppRecommendations(const ScanResult& scan, const ScorePenaltyBreakdown& base,
                               std::vector<Recommendation>& out) const;

    ScorePenaltyBreakdown breakdown(const JunkCategory& junk,
                                    const PerformanceCategory& performance,
                                    const AppIssueCategory& apps) const;

    ScoreCalculator calculator_;
};

} // namespace tonic
