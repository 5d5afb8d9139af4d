// Copyright(C) 2025-2026 Advanced Micro Devices, Inc. All rights reserved.
// SPDX-License-Identifier: MIT
//
// Console output system for scan and fix display.
//
// An abstract OutputHandler with TerminalConsole (ANSI) and SilentConsole.
// The orchestrator and fix executor report progress and recoverable
// problems through it; nothing in the core writes to stdout directly.

#pragma once

#include <cstddef>
#include <string>

#include <nlohmann/json.hpp>

#include "types.h"
#include "tonic/export.h"

namespace tonic {

using json = nlohmann::json;

/// Abstract output handler interface.
class TONIC_API OutputHandler {
public:
    virtual ~OutputHandler() = default;

    // === Stage Progress ===
    virtual void printStageStart(ScanStage stage) = 0;
    virtual void printStageComplete(const StageReport& report) = 0;

    // === Results ===
    virtual void printScore(int score, HealthRating rating) = 0;
    virtual void printRecommendation(std::size_t index, const Recommendation& rec) = 0;
    virtual void printFixResult(const FixResult& result, bool cancelled) = 0;
    virtual void prettyPrintJson(const json& data, const std::string& title = "") = 0;

    // === Status Messages ===
    virtual void printError(const std::string& message) = 0;
    virtual void printWarning(const std::string& message) = 0;
    virtual void printInfo(const std::string& message) = 0;

    // === Progress Indicators ===
    virtual void startProgress(const std::string& message) = 0;
    virtual void stopProgress() = 0;

    // === Completion ===
    virtual void printSummary(const std::string& summary) = 0;

    // === Optional Methods (default no-op) ===
    virtual void printHeader(const std::string& /*text*/) {}
    virtual void printSeparator(int /*length*/ = 50) {}
};

/// Terminal console with ANSI color output.
class TONIC_API TerminalConsole : public OutputHandler {
public:
    void printStageStart(ScanStage stage) override;
    void printStageComplete(const StageReport& report) override;
    void printScore(int score, HealthRating rating) override;
    void printRecommendation(std::size_t index, const Recommendation& rec) override;
    void printFixResult(const FixResult& result, bool cancelled) override;
    void prettyPrintJson(const json& data, const std::string& title = "") override;
    void printError(const std::string& message) override;
    void printWarning(const std::string& message) override;
    void printInfo(const std::string& message) override;
    void startProgress(const std::string& message) override;
    void stopProgress() override;
    void printSummary(const std::string& summary) override;
    void printHeader(const std::string& text) override;
    void printSeparator(int length = 50) override;

private:
    static const char* ratingColor(HealthRating rating);

    // ANSI color codes
    static constexpr const char* RESET   = "\033[0m";
    static constexpr const char* BOLD    = "\033[1m";
    static constexpr const char* DIM     = "\033[90m";
    static constexpr const char* RED     = "\033[91m";
    static constexpr const char* GREEN   = "\033[92m";
    static constexpr const char* YELLOW  = "\033[93m";
    static constexpr const char* BLUE    = "\033[94m";
    static constexpr const char* CYAN    = "\033[96m";
};

/// Silent console that suppresses all output.
/// Used for testing and JSON-only operation.
class TONIC_API SilentConsole : public OutputHandler {
public:
    explicit SilentConsole(bool silenceSummary = false)
        : silenceSummary_(silenceSummary) {}

    void printStageStart(ScanStage) override {}
    void printStageComplete(const StageReport&) override {}
    void printScore(int, HealthRating) override {}
    void printRecommendation(std::size_t, const Recommendation&) override {}
    void printFixResult(const FixResult&, bool) override {}
    void prettyPrintJson(const json&, const std::string&) override {}
    void printError(const std::string&) override {}
    void printWarning(const std::string&) override {}
    void printInfo(const std::string&) override {}
    void startProgress(const std::string&) override {}
    void stopProgress() override {}
    void printSummary(const std::string& summary) override;

private:
    bool silenceSummary_;
};

} // namespace tonic
