// Copyright(C) 2025-2026 Advanced Micro Devices, Inc. All rights reserved.
// SPDX-License-Identifier: MIT

#include "tonic/console.h"

#include <iomanip>
#include <iostream>

namespace tonic {

// ---- TerminalConsole ----

const char* TerminalConsole::ratingColor(HealthRating rating) {
    switch (rating) {
        case HealthRating::EXCELLENT:
        case HealthRating::GOOD:
            return GREEN;
        case HealthRating::FAIR:
            return YELLOW;
        case HealthRating::POOR:
        case HealthRating::CRITICAL:
            return RED;
    }
    return RESET;
}

void TerminalConsole::printStageStart(ScanStage stage) {
    std::cout << BOLD << BLUE << "--- " << scanStageToString(stage)
              << " ---" << RESET << "\n";
}

void TerminalConsole::printStageComplete(const StageReport& report) {
    const int percent = static_cast<int>(report.progress * 100.0 + 0.5);
    std::cout << DIM << "[" << scanStageToString(report.stage) << ": "
              << scanStatusToString(report.status) << ", " << percent << "%]"
              << RESET << "\n";
}

void TerminalConsole::printScore(int score, HealthRating rating) {
    const char* color = ratingColor(rating);
    std::cout << "\n" << BOLD << "Health score: " << color << score << "/100"
              << RESET << " (" << color << healthRatingToString(rating) << RESET << ")\n";
    std::cout << DIM << ratingDescription(rating) << RESET << "\n";
}

void TerminalConsole::printRecommendation(std::size_t index, const Recommendation& rec) {
    const char* marker = rec.safeToFix ? GREEN : YELLOW;
    std::cout << marker << std::setw(2) << index << ". " << RESET << BOLD << rec.title << RESET;
    if (rec.spaceToReclaim > 0) {
        std::cout << DIM << " (" << formatSize(rec.spaceToReclaim) << ")" << RESET;
    }
    if (rec.scoreImpact > 0) {
        std::cout << CYAN << " +" << rec.scoreImpact << " score" << RESET;
    }
    std::cout << "\n    " << rec.description << "\n";
    if (!rec.safeToFix) {
        std::cout << DIM << "    Requires review before removal." << RESET << "\n";
    }
}

void TerminalConsole::printFixResult(const FixResult& result, bool cancelled) {
    const char* color = result.errors > 0 ? YELLOW : GREEN;
    std::cout << "\n" << color << result.message() << RESET << "\n";
    if (cancelled) {
        std::cout << YELLOW << "Cleanup was cancelled before all items were processed."
                  << RESET << "\n";
    }
}

void TerminalConsole::prettyPrintJson(const json& data, const std::string& title) {
    if (!title.empty()) {
        std::cout << DIM << title << ":" << RESET << "\n";
    }

    std::string formatted = data.dump(2);

    // Truncate if very long
    if (formatted.size() > 4000) {
        formatted = formatted.substr(0, 2000) + "\n...[truncated]...\n" +
                    formatted.substr(formatted.size() - 1000);
    }

    std::cout << formatted << "\n";
}

void TerminalConsole::printError(const std::string& message) {
    std::cout << RED << "ERROR: " << RESET << message << "\n";
}

void TerminalConsole::printWarning(const std::string& message) {
    std::cout << YELLOW << "WARNING: " << RESET << message << "\n";
}

void TerminalConsole::printInfo(const std::string& message) {
    std::cout << BLUE << "INFO: " << RESET << message << "\n";
}

void TerminalConsole::startProgress(const std::string& message) {
    std::cout << DIM << message << "..." << RESET << std::flush;
}

void TerminalConsole::stopProgress() {
    std::cout << "\n";
}

void TerminalConsole::printSummary(const std::string& summary) {
    std::cout << "\n" << BOLD << GREEN << "Summary:" << RESET << "\n" << summary << "\n";
}

void TerminalConsole::printHeader(const std::string& text) {
    std::cout << "\n" << BOLD << text << RESET << "\n";
}

void TerminalConsole::printSeparator(int length) {
    std::cout << std::string(static_cast<size_t>(length), '-') << "\n";
}

// ---- SilentConsole ----

void SilentConsole::printSummary(const std::string& summary) {
    if (!silenceSummary_) {
        std::cout << summary << "\n";
    }
}

} // namespace tonic
