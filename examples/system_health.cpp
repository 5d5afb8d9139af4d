// Copyright(C) 2025-2026 Advanced Micro Devices, Inc. All rights reserved.
// SPDX-License-Identifier: MIT
//
// Live system health check.
// Samples CPU, memory, memory pressure, disk and thermal readings from
// procfs/sysfs (or a recorded JSON snapshot) and scores them.
//
// Usage:
//   ./system_health                        # sample this machine
//   ./system_health --metrics snap.json    # score a recorded snapshot
//   ./system_health --json                 # machine-readable output

#include <iostream>
#include <string>

#include <tonic/console.h>
#include <tonic/json_utils.h>
#include <tonic/metrics_provider.h>
#include <tonic/score_calculator.h>

int main(int argc, char** argv) {
    std::string metricsPath;
    bool jsonOutput = false;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--metrics" && i + 1 < argc) {
            metricsPath = argv[++i];
        } else if (arg == "--json") {
            jsonOutput = true;
        } else {
            std::cout << "Usage: " << argv[0] << " [--metrics FILE] [--json]" << std::endl;
            return 2;
        }
    }

    try {
        tonic::SystemHealthMetrics metrics;
        if (metricsPath.empty()) {
            tonic::ProcMetricsProvider provider;
            metrics = provider.snapshot();
        } else {
            metrics = tonic::systemHealthMetricsFromJson(tonic::parseJsonFile(metricsPath));
        }

        tonic::ScoreCalculator calculator;
        const tonic::SystemHealthScore health = calculator.calculateSystemScore(metrics);
        const tonic::HealthRating rating = tonic::systemHealthRating(health.score);

        if (jsonOutput) {
            tonic::json out{
                {"metrics", metrics.toJson()},
                {"score", health.score},
                {"rating", tonic::healthRatingToString(rating)},
                {"message", health.message}
            };
            std::cout << out.dump(2) << std::endl;
            return 0;
        }

        tonic::TerminalConsole console;
        console.prettyPrintJson(metrics.toJson(), "Readings");
        console.printScore(health.score, rating);
        console.printInfo(health.message);
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
