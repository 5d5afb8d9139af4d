// Copyright(C) 2025-2026 Advanced Micro Devices, Inc. All rights reserved.
// SPDX-License-Identifier: MIT
//
// Smart Scan of the current user's desktop.
// Runs every scan stage, prints the health score and the recommendation
// list, and optionally cleans up the safe items.
//
// Usage:
//   ./smart_scan                     # scan with default settings
//   ./smart_scan --aggressive        # include browser caches, 60-day downloads
//   ./smart_scan --config scan.json  # load a ScanConfig file
//   ./smart_scan --json              # print the result as JSON only
//   ./smart_scan --fix               # ask before deleting safe items
//   ./smart_scan --debug             # stage tracing on stderr

#include <iostream>
#include <memory>
#include <string>

#include <tonic/category_scanner.h>
#include <tonic/console.h>
#include <tonic/file_operations.h>
#include <tonic/json_utils.h>
#include <tonic/scan_orchestrator.h>
#include <tonic/score_calculator.h>

namespace {

struct Options {
    std::string configPath;
    bool aggressive = false;
    bool jsonOutput = false;
    bool fix = false;
    bool debug = false;
};

void printUsage(const char* program) {
    std::cout << "Usage: " << program
              << " [--config FILE] [--aggressive] [--json] [--fix] [--debug]" << std::endl;
}

bool parseArgs(int argc, char** argv, Options& opts) {
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            opts.configPath = argv[++i];
        } else if (arg == "--aggressive") {
            opts.aggressive = true;
        } else if (arg == "--json") {
            opts.jsonOutput = true;
        } else if (arg == "--fix") {
            opts.fix = true;
        } else if (arg == "--debug") {
            opts.debug = true;
        } else {
            return false;
        }
    }
    return true;
}

} // namespace

int main(int argc, char** argv) {
    Options opts;
    if (!parseArgs(argc, argv, opts)) {
        printUsage(argv[0]);
        return 2;
    }

    try {
        tonic::ScanConfig config = opts.aggressive ? tonic::ScanConfig::aggressive()
                                                   : tonic::ScanConfig::defaults();
        if (!opts.configPath.empty()) {
            // --aggressive is the base; keys in the file override it
            config = tonic::loadScanConfig(opts.configPath, config);
        }
        if (opts.debug) config.debug = true;

        std::unique_ptr<tonic::OutputHandler> console;
        if (opts.jsonOutput) {
            console = std::make_unique<tonic::SilentConsole>(true);
        } else {
            console = std::make_unique<tonic::TerminalConsole>();
        }

        tonic::FilesystemCategoryScanner scanner;
        tonic::LocalFileOperations fileOps;
        tonic::ScanOrchestrator orchestrator(scanner, fileOps, config, console.get());

        auto result = orchestrator.runFullScan();
        if (!result) {
            console->printWarning("Scan did not complete");
            return 1;
        }

        if (opts.jsonOutput) {
            std::cout << result->toJson().dump(2) << std::endl;
            return 0;
        }

        const int score = result->scanResult.healthScore;
        console->printScore(score, tonic::healthRating(score));
        if (result->diskUsage) {
            console->printInfo("Disk " + tonic::formatPercent(result->diskUsage->usedPercentage()) +
                               " used, " + tonic::formatSize(result->diskUsage->freeSpace) + " free");
        }
        console->printInfo(tonic::formatSize(result->scanResult.totalReclaimableSpace) +
                           " reclaimable");

        console->printHeader("Recommendations");
        console->printSeparator();
        if (result->recommendations.empty()) {
            console->printInfo("Nothing to clean up");
        }
        for (std::size_t i = 0; i < result->recommendations.size(); ++i) {
            console->printRecommendation(i + 1, result->recommendations[i]);
        }

        if (opts.fix && !result->recommendations.empty()) {
            std::cout << "\nDelete the safe items listed above? [y/N] " << std::flush;
            std::string answer;
            std::getline(std::cin, answer);
            if (answer == "y" || answer == "Y" || answer == "yes") {
                orchestrator.fixRecommendations(result->recommendations);
            } else {
                console->printInfo("Nothing deleted");
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
