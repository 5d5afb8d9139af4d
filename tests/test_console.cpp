// Copyright(C) 2025-2026 Advanced Micro Devices, Inc. All rights reserved.
// SPDX-License-Identifier: MIT

#include <gtest/gtest.h>
#include <tonic/console.h>

#include <iostream>
#include <sstream>

using namespace tonic;

namespace {

// Redirects std::cout for the lifetime of the object.
class CaptureStdout {
public:
    CaptureStdout() : oldBuf_(std::cout.rdbuf(captured_.rdbuf())) {}
    ~CaptureStdout() { std::cout.rdbuf(oldBuf_); }

    std::string str() const { return captured_.str(); }

private:
    std::ostringstream captured_;
    std::streambuf* oldBuf_;
};

Recommendation sampleRecommendation(bool safe) {
    Recommendation rec;
    rec.type = RecommendationType::TEMP_FILES;
    rec.title = "Clear Temporary Files";
    rec.description = "Remove 12 temporary files (600 MB). These are safe to delete.";
    rec.safeToFix = safe;
    rec.spaceToReclaim = 600LL * 1024 * 1024;
    rec.scoreImpact = 3;
    return rec;
}

} // namespace

// ---- SilentConsole Tests ----

TEST(ConsoleTest, SilentConsoleNoOutput) {
    CaptureStdout capture;
    SilentConsole console(true);

    console.printStageStart(ScanStage::SCANNING_DISK);
    console.printStageComplete(StageReport{});
    console.printScore(80, HealthRating::GOOD);
    console.printRecommendation(1, sampleRecommendation(true));
    console.printFixResult(FixResult{}, false);
    console.prettyPrintJson(json::object(), "title");
    console.printError("error");
    console.printWarning("warning");
    console.printInfo("info");
    console.startProgress("progress");
    console.stopProgress();
    console.printSummary("summary");
    console.printHeader("header");
    console.printSeparator();

    EXPECT_TRUE(capture.str().empty());
}

TEST(ConsoleTest, SilentConsoleSummaryShown) {
    CaptureStdout capture;
    SilentConsole console(false);
    console.printSummary("Freed 1.2 GB");
    EXPECT_NE(capture.str().find("Freed 1.2 GB"), std::string::npos);
}

// ---- TerminalConsole Tests ----

TEST(ConsoleTest, TerminalConsoleStageComplete) {
    CaptureStdout capture;
    TerminalConsole console;

    StageReport report;
    report.stage = ScanStage::CHECKING_APPS;
    report.status = ScanStatus::RUNNING;
    report.progress = 0.75;
    console.printStageComplete(report);

    std::string output = capture.str();
    EXPECT_NE(output.find("Checking Apps"), std::string::npos);
    EXPECT_NE(output.find("running"), std::string::npos);
    EXPECT_NE(output.find("75%"), std::string::npos);
}

TEST(ConsoleTest, TerminalConsoleScore) {
    CaptureStdout capture;
    TerminalConsole console;
    console.printScore(72, HealthRating::FAIR);

    std::string output = capture.str();
    EXPECT_NE(output.find("72/100"), std::string::npos);
    EXPECT_NE(output.find("fair"), std::string::npos);
    EXPECT_NE(output.find(ratingDescription(HealthRating::FAIR)), std::string::npos);
}

TEST(ConsoleTest, TerminalConsoleRecommendation) {
    CaptureStdout capture;
    TerminalConsole console;
    console.printRecommendation(1, sampleRecommendation(true));
    console.printRecommendation(2, sampleRecommendation(false));

    std::string output = capture.str();
    EXPECT_NE(output.find("Clear Temporary Files"), std::string::npos);
    EXPECT_NE(output.find("600 MB"), std::string::npos);
    EXPECT_NE(output.find("+3 score"), std::string::npos);
    // Only the unsafe one asks for review
    auto first = output.find("Requires review");
    ASSERT_NE(first, std::string::npos);
    EXPECT_EQ(output.find("Requires review", first + 1), std::string::npos);
}

TEST(ConsoleTest, TerminalConsoleFixResult) {
    CaptureStdout capture;
    TerminalConsole console;

    FixResult result;
    result.itemsFixed = 2;
    result.spaceFreed = 2048;
    console.printFixResult(result, true);

    std::string output = capture.str();
    EXPECT_NE(output.find(result.message()), std::string::npos);
    EXPECT_NE(output.find("cancelled"), std::string::npos);
}

TEST(ConsoleTest, TerminalConsoleMessages) {
    CaptureStdout capture;
    TerminalConsole console;
    console.printError("disk unreadable");
    console.printWarning("skipped /proc");
    console.printInfo("3 recommendations");

    std::string output = capture.str();
    EXPECT_NE(output.find("ERROR"), std::string::npos);
    EXPECT_NE(output.find("disk unreadable"), std::string::npos);
    EXPECT_NE(output.find("WARNING"), std::string::npos);
    EXPECT_NE(output.find("skipped /proc"), std::string::npos);
    EXPECT_NE(output.find("INFO"), std::string::npos);
}

TEST(ConsoleTest, TerminalConsolePrettyPrintTruncates) {
    CaptureStdout capture;
    TerminalConsole console;

    json big = json::array();
    for (int i = 0; i < 1000; ++i) big.push_back("/home/user/.cache/entry-" + std::to_string(i));
    console.prettyPrintJson(big, "Paths");

    std::string output = capture.str();
    EXPECT_NE(output.find("Paths:"), std::string::npos);
    EXPECT_NE(output.find("...[truncated]..."), std::string::npos);
    EXPECT_LT(output.size(), 3200u);
}
