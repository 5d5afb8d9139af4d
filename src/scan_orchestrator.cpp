// Copyright(C) 2025-2026 Advanced Micro Devices, Inc. All rights reserved.
// SPDX-License-Identifier: MIT

#include "tonic/scan_orchestrator.h"

#include <algorithm>
#include <ctime>
#include <exception>
#include <iomanip>
#include <iostream>
#include <random>
#include <sstream>
#include <stdexcept>

namespace tonic {

namespace {

constexpr double MAX_STAGE_PROGRESS = 0.95;

// Sum of the weights of every stage up to and including `last`.
double cumulativeProgress(ScanStage last) {
    double total = 0.0;
    ScanStage s = ScanStage::PREPARING;
    while (true) {
        total += scanStageProgressWeight(s);
        if (s == last || s == ScanStage::COMPLETE) break;
        s = nextScanStage(s);
    }
    return std::min(total, MAX_STAGE_PROGRESS);
}

std::string generateScanId() {
    static thread_local std::mt19937_64 rng{std::random_device{}()};
    uint64_t hi = rng();
    uint64_t lo = rng();

    // RFC 4122 version 4, variant 1
    hi = (hi & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
    lo = (lo & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

    std::ostringstream out;
    out << std::hex << std::setfill('0')
        << std::setw(8) << (hi >> 32) << '-'
        << std::setw(4) << ((hi >> 16) & 0xFFFF) << '-'
        << std::setw(4) << (hi & 0xFFFF) << '-'
        << std::setw(4) << (lo >> 48) << '-'
        << std::setw(12) << (lo & 0xFFFFFFFFFFFFULL);
    return out.str();
}

std::string utcTimestamp() {
    std::time_t now = std::time(nullptr);
    std::tm tm{};
#ifdef _WIN32
    gmtime_s(&tm, &now);
#else
    gmtime_r(&now, &tm);
#endif
    std::ostringstream out;
    out << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return out.str();
}

int64_t reclaimable(const JunkCategory* junk, const PerformanceCategory* perf,
                    const AppIssueCategory* apps) {
    int64_t total = 0;
    if (junk != nullptr) {
        total += junk->totalSize();
    }
    if (perf != nullptr) {
        total += perf->browserCaches.size + perf->launchAgents.size + perf->loginItems.size;
    }
    if (apps != nullptr) {
        total += apps->unusedAppsSize() + apps->largeAppsSize() +
                 apps->duplicateAppsSize() + apps->orphanedFilesSize();
    }
    return total;
}

} // namespace

// ---- ScanAggregate ----

int64_t ScanAggregate::reclaimableBytes() const {
    return reclaimable(junkFiles ? &*junkFiles : nullptr,
                       performanceIssues ? &*performanceIssues : nullptr,
                       appIssues ? &*appIssues : nullptr);
}

int ScanAggregate::flaggedCount() const {
    int total = 0;
    if (junkFiles) {
        total += junkFiles->totalFiles();
    }
    if (performanceIssues) {
        total += performanceIssues->launchAgents.count;
        total += performanceIssues->loginItems.count;
        total += performanceIssues->browserCaches.count;
    }
    if (appIssues) {
        total += static_cast<int>(appIssues->unusedApps.size());
        total += static_cast<int>(appIssues->largeApps.size());
        total += static_cast<int>(appIssues->duplicateApps.size());
        total += static_cast<int>(appIssues->orphanedFiles.size());
    }
    return total;
}

json ScanAggregate::toJson() const {
    json recs = json::array();
    for (const auto& r : recommendations) recs.push_back(r.toJson());
    return json{
        {"disk_usage", diskUsage ? diskUsage->toJson() : json(nullptr)},
        {"junk_files", junkFiles ? junkFiles->toJson() : json(nullptr)},
        {"performance_issues", performanceIssues ? performanceIssues->toJson() : json(nullptr)},
        {"app_issues", appIssues ? appIssues->toJson() : json(nullptr)},
        {"recommendations", recs},
        {"stage_progress", stageProgress}
    };
}

// ---- StageInFlight ----

// Clears the in-flight flags if runStage() or finalizeScan() exits by exception.
class ScanOrchestrator::StageInFlight {
public:
    explicit StageInFlight(ScanOrchestrator& owner) : owner_(owner) {}
    ~StageInFlight() {
        if (!armed_) return;
        std::lock_guard<std::mutex> lock(owner_.mutex_);
        owner_.stageInFlight_ = false;
        owner_.finalizing_ = false;
    }

    StageInFlight(const StageInFlight&) = delete;
    StageInFlight& operator=(const StageInFlight&) = delete;

    /// The stage cleared the flag itself under the lock.
    void dismiss() { armed_ = false; }

private:
    ScanOrchestrator& owner_;
    bool armed_ = true;
};

// ---- ScanOrchestrator ----

ScanOrchestrator::ScanOrchestrator(CategoryScanner& scanner, FileOperations& fileOps,
                                   const ScanConfig& config, OutputHandler* console)
    : scanner_(scanner), config_(config), console_(console) {
    if (console_ == nullptr) {
        ownedConsole_ = std::make_unique<SilentConsole>(true);
        console_ = ownedConsole_.get();
    }
    fixExecutor_ = std::make_unique<FixExecutor>(fileOps, console_);
}

ScanOrchestrator::~ScanOrchestrator() = default;

void ScanOrchestrator::setProgressCallback(ProgressCallback callback) {
    progressCallback_ = std::move(callback);
}

StageReport ScanOrchestrator::runStage(ScanStage stage, const CancellationToken* cancel) {
    if (stage == ScanStage::COMPLETE) {
        throw std::logic_error("COMPLETE is reached through finalizeScan(), not runStage()");
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);

        if (stageInFlight_) {
            const std::string running = finalizing_ ? std::string("finalizeScan()")
                                                    : scanStageToString(currentStage_);
            throw std::logic_error("runStage(" + scanStageToString(stage) +
                                   ") called while " + running + " is still running");
        }

        if (stage == ScanStage::PREPARING) {
            aggregate_ = ScanAggregate{};
            lastCompleted_.reset();
            started_ = true;
            scanId_ = generateScanId();
            scanTimestamp_ = utcTimestamp();
            startedAt_ = std::chrono::steady_clock::now();
            scanDuration_ = 0.0;
        } else {
            if (!started_) {
                throw std::logic_error("runStage(" + scanStageToString(stage) +
                                       ") called before PREPARING");
            }
            if (status_ == ScanStatus::CANCELLED) {
                throw std::logic_error("Scan was cancelled; restart with PREPARING");
            }
            if (!lastCompleted_.has_value() || nextScanStage(*lastCompleted_) != stage) {
                const std::string expected = lastCompleted_.has_value()
                    ? scanStageToString(nextScanStage(*lastCompleted_))
                    : scanStageToString(ScanStage::PREPARING);
                throw std::logic_error("Stage " + scanStageToString(stage) +
                                       " out of order; expected " + expected);
            }
        }

        stageInFlight_ = true;
        currentStage_ = stage;
        status_ = ScanStatus::RUNNING;
    }

    StageInFlight inFlight(*this);
    console_->printStageStart(stage);
    if (config_.debug) {
        std::cerr << "[scan] Stage " << scanStageToString(stage) << " started" << std::endl;
    }

    if (isCancelled(cancel)) {
        inFlight.dismiss();
        return markCancelled(stage);
    }

    ScanAggregate staged;
    runStageWork(stage, staged);

    if (isCancelled(cancel)) {
        inFlight.dismiss();
        return markCancelled(stage);
    }

    StageReport report;
    {
        std::lock_guard<std::mutex> lock(mutex_);

        switch (stage) {
            case ScanStage::PREPARING:
                aggregate_.diskUsage = staged.diskUsage;
                break;
            case ScanStage::SCANNING_DISK:
                aggregate_.junkFiles = staged.junkFiles;
                if (aggregate_.diskUsage.has_value() && staged.junkFiles.has_value()) {
                    aggregate_.diskUsage->cacheSize = staged.junkFiles->cacheFiles.size;
                    aggregate_.diskUsage->logSize = staged.junkFiles->logFiles.size;
                    aggregate_.diskUsage->tempSize = staged.junkFiles->tempFiles.size;
                }
                break;
            case ScanStage::CHECKING_APPS:
                aggregate_.appIssues = staged.appIssues;
                break;
            case ScanStage::ANALYZING_SYSTEM:
                aggregate_.performanceIssues = staged.performanceIssues;
                break;
            case ScanStage::COMPLETE:
                break;
        }

        lastCompleted_ = stage;
        stageInFlight_ = false;
        aggregate_.stageProgress = cumulativeProgress(stage);
        status_ = (stage == ScanStage::ANALYZING_SYSTEM) ? ScanStatus::READY : ScanStatus::RUNNING;
        scanDuration_ = std::chrono::duration<double>(
            std::chrono::steady_clock::now() - startedAt_).count();

        report.stage = stage;
        report.status = status_;
        report.progress = aggregate_.stageProgress;
    }
    inFlight.dismiss();

    if (config_.debug) {
        std::cerr << "[scan] Stage " << scanStageToString(stage) << " complete, progress "
                  << report.progress << std::endl;
    }
    notify(report);
    return report;
}

void ScanOrchestrator::runStageWork(ScanStage stage, ScanAggregate& staged) {
    // Runs without the lock; scanner calls may be slow
    try {
        switch (stage) {
            case ScanStage::PREPARING:
                staged.diskUsage = scanner_.diskUsage();
                break;
            case ScanStage::SCANNING_DISK:
                staged.junkFiles = scanner_.scanJunkFiles(config_);
                break;
            case ScanStage::CHECKING_APPS:
                staged.appIssues = scanner_.scanAppIssues(config_);
                break;
            case ScanStage::ANALYZING_SYSTEM:
                staged.performanceIssues = scanner_.scanPerformanceIssues(config_);
                break;
            case ScanStage::COMPLETE:
                break;
        }
    } catch (const std::exception& e) {
        console_->printWarning(scanStageToString(stage) + " failed: " + e.what() +
                               " (continuing with no findings)");
        switch (stage) {
            case ScanStage::PREPARING:
                staged.diskUsage.reset();
                break;
            case ScanStage::SCANNING_DISK:
                staged.junkFiles = JunkCategory::empty();
                break;
            case ScanStage::CHECKING_APPS:
                staged.appIssues = AppIssueCategory::empty();
                break;
            case ScanStage::ANALYZING_SYSTEM:
                staged.performanceIssues = PerformanceCategory::empty();
                break;
            case ScanStage::COMPLETE:
                break;
        }
    }
}

StageReport ScanOrchestrator::markCancelled(ScanStage stage) {
    StageReport report;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        status_ = ScanStatus::CANCELLED;
        stageInFlight_ = false;
        report.stage = stage;
        report.status = status_;
        report.progress = aggregate_.stageProgress;
    }

    console_->printWarning("Scan cancelled during " + scanStageToString(stage));
    if (config_.debug) {
        std::cerr << "[scan] Cancelled during " << scanStageToString(stage) << std::endl;
    }
    notify(report);
    return report;
}

void ScanOrchestrator::notify(const StageReport& report) {
    console_->printStageComplete(report);
    if (progressCallback_) {
        progressCallback_(report);
    }
}

std::optional<SmartScanResult> ScanOrchestrator::finalizeScan() {
    ScanAggregate snapshot;
    SmartScanResult result;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!started_) {
            throw std::logic_error("finalizeScan() called before any stage was run");
        }
        if (stageInFlight_) {
            const std::string running = finalizing_ ? std::string("finalizeScan()")
                                                    : scanStageToString(currentStage_);
            throw std::logic_error("finalizeScan() called while " + running + " is running");
        }
        if (status_ == ScanStatus::CANCELLED) {
            return std::nullopt;
        }
        snapshot = aggregate_;
        result.scanResult.id = scanId_;
        result.scanResult.timestamp = scanTimestamp_;
        result.scanDuration = scanDuration_;

        // Holds off runStage() until the result is written back
        stageInFlight_ = true;
        finalizing_ = true;
    }

    StageInFlight inFlight(*this);
    console_->startProgress("Scoring findings");

    ScanResult& scan = result.scanResult;
    scan.junkFiles = snapshot.junkFiles.value_or(JunkCategory::empty());
    scan.performanceIssues = snapshot.performanceIssues.value_or(PerformanceCategory::empty());
    scan.appIssues = snapshot.appIssues.value_or(AppIssueCategory::empty());
    scan.totalReclaimableSpace = reclaimable(&scan.junkFiles, &scan.performanceIssues, &scan.appIssues);

    // Scan-derived score only, so unchanged findings always score the same
    const ScoreOutcome outcome = calculator_.calculateScore(
        snapshot.diskUsage, scan.junkFiles, scan.performanceIssues, scan.appIssues);
    scan.healthScore = outcome.score;

    result.recommendations = generator_.generate(scan);
    result.diskUsage = snapshot.diskUsage;
    console_->stopProgress();

    {
        std::lock_guard<std::mutex> lock(mutex_);
        aggregate_.recommendations = result.recommendations;
        aggregate_.stageProgress = 1.0;
        currentStage_ = ScanStage::COMPLETE;
        status_ = ScanStatus::FINALIZED;
        stageInFlight_ = false;
        finalizing_ = false;
    }
    inFlight.dismiss();

    if (config_.debug) {
        std::cerr << "[scan] Finalized " << scan.id << ": score " << scan.healthScore
                  << ", penalties " << outcome.breakdown.toJson().dump()
                  << ", " << result.recommendations.size() << " recommendations" << std::endl;
    }
    return result;
}

std::optional<SmartScanResult> ScanOrchestrator::runFullScan(const CancellationToken* cancel) {
    for (ScanStage stage = ScanStage::PREPARING; stage != ScanStage::COMPLETE;
         stage = nextScanStage(stage)) {
        StageReport report = runStage(stage, cancel);
        if (report.status == ScanStatus::CANCELLED) {
            return std::nullopt;
        }
    }
    return finalizeScan();
}

FixOutcome ScanOrchestrator::fixRecommendations(const std::vector<Recommendation>& recommendations,
                                                const CancellationToken* cancel) {
    FixOutcome outcome = fixExecutor_->fix(recommendations, cancel);
    console_->printFixResult(outcome.result, outcome.cancelled);
    return outcome;
}

// ---- Accessors ----

ScanStage ScanOrchestrator::currentStage() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return currentStage_;
}

ScanStatus ScanOrchestrator::status() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return status_;
}

double ScanOrchestrator::progress() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return aggregate_.stageProgress;
}

std::optional<DiskUsageSummary> ScanOrchestrator::diskUsage() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return aggregate_.diskUsage;
}

std::optional<int64_t> ScanOrchestrator::partialSpaceFoundBytes() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!aggregate_.hasAnyCategory()) return std::nullopt;
    return aggregate_.reclaimableBytes();
}

std::optional<int> ScanOrchestrator::partialFlaggedCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!aggregate_.hasAnyCategory()) return std::nullopt;
    return aggregate_.flaggedCount();
}

ScanAggregate ScanOrchestrator::aggregateSnapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return aggregate_;
}

} // namespace tonic
