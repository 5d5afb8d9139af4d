// Copyright(C) 2025-2026 Advanced Micro Devices, Inc. All rights reserved.
// SPDX-License-Identifier: MIT

#include "tonic/metrics_provider.h"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>
#include <thread>
#include <utility>

namespace fs = std::filesystem;

namespace tonic {

namespace {

std::optional<std::string> readFile(const std::string& path) {
    std::ifstream in(path);
    if (!in) return std::nullopt;
    std::stringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

} // namespace

ProcMetricsProvider::ProcMetricsProvider(std::chrono::milliseconds sampleInterval, ProcPaths paths)
    : sampleInterval_(sampleInterval), paths_(std::move(paths)) {}

// ---- Parsers ----

std::optional<ProcMetricsProvider::CpuTimes> ProcMetricsProvider::parseCpuTimes(
    const std::string& statText) {
    std::istringstream in(statText);
    std::string line;
    while (std::getline(in, line)) {
        if (line.rfind("cpu ", 0) != 0) continue;

        std::istringstream fields(line.substr(4));
        // user nice system idle iowait irq softirq steal
        uint64_t values[8] = {};
        int read = 0;
        while (read < 8 && fields >> values[read]) ++read;
        if (read < 4) return std::nullopt;

        CpuTimes times;
        times.idle = values[3] + values[4];
        for (int i = 0; i < read; ++i) times.total += values[i];
        return times;
    }
    return std::nullopt;
}

std::optional<double> ProcMetricsProvider::cpuUsageBetween(const CpuTimes& before,
                                                           const CpuTimes& after) {
    if (after.total <= before.total) return std::nullopt;
    const double total = static_cast<double>(after.total - before.total);
    const double idle = static_cast<double>(after.idle >= before.idle ? after.idle - before.idle : 0);
    return std::clamp((total - idle) / total * 100.0, 0.0, 100.0);
}

std::optional<double> ProcMetricsProvider::parseMemoryUsedPercent(const std::string& meminfoText) {
    std::istringstream in(meminfoText);
    std::string key;
    uint64_t value = 0;
    std::string unit;
    std::optional<uint64_t> total;
    std::optional<uint64_t> available;

    std::string line;
    while (std::getline(in, line)) {
        std::istringstream fields(line);
        if (!(fields >> key >> value)) continue;
        if (key == "MemTotal:") total = value;
        else if (key == "MemAvailable:") available = value;
    }

    if (!total.has_value() || !available.has_value() || *total == 0) return std::nullopt;
    const double used = static_cast<double>(*total - std::min(*available, *total));
    return used / static_cast<double>(*total) * 100.0;
}

MemoryPressure ProcMetricsProvider::parseMemoryPressure(const std::string& psiText) {
    // some avg10=0.00 avg60=0.00 avg300=0.00 total=0
    std::istringstream in(psiText);
    std::string line;
    while (std::getline(in, line)) {
        if (line.rfind("some ", 0) != 0) continue;
        auto pos = line.find("avg10=");
        if (pos == std::string::npos) break;

        double avg10 = 0.0;
        std::istringstream value(line.substr(pos + 6));
        if (!(value >> avg10)) break;

        if (avg10 > 30.0) return MemoryPressure::CRITICAL;
        if (avg10 > 10.0) return MemoryPressure::WARNING;
        return MemoryPressure::NORMAL;
    }
    return MemoryPressure::NORMAL;
}

// ---- Readers ----

std::optional<double> ProcMetricsProvider::readCpuUsage() {
    auto first = readFile(paths_.stat);
    if (!first) return std::nullopt;
    auto before = parseCpuTimes(*first);
    if (!before) return std::nullopt;

    std::this_thread::sleep_for(sampleInterval_);

    auto second = readFile(paths_.stat);
    if (!second) return std::nullopt;
    auto after = parseCpuTimes(*second);
    if (!after) return std::nullopt;

    return cpuUsageBetween(*before, *after);
}

std::optional<double> ProcMetricsProvider::readMaxThermalZone() {
    std::error_code ec;
    if (!fs::is_directory(paths_.thermalRoot, ec)) return std::nullopt;

    std::optional<double> hottest;
    fs::directory_iterator it(paths_.thermalRoot, ec);
    const fs::directory_iterator end;
    for (; !ec && it != end; it.increment(ec)) {
        const fs::directory_entry& entry = *it;
        if (entry.path().filename().string().rfind("thermal_zone", 0) != 0) continue;

        auto text = readFile((entry.path() / "temp").string());
        if (!text) continue;

        long milliCelsius = 0;
        std::istringstream in(*text);
        if (!(in >> milliCelsius)) continue;

        const double celsius = static_cast<double>(milliCelsius) / 1000.0;
        if (!hottest || celsius > *hottest) hottest = celsius;
    }
    return hottest;
}

std::optional<double> ProcMetricsProvider::readDiskUsedPercent() {
    std::error_code ec;
    fs::space_info info = fs::space(paths_.diskMount, ec);
    if (ec || info.capacity == 0) return std::nullopt;
    const double used = static_cast<double>(info.capacity - info.free);
    return used / static_cast<double>(info.capacity) * 100.0;
}

SystemHealthMetrics ProcMetricsProvider::snapshot() {
    SystemHealthMetrics metrics;

    metrics.cpuUsagePercent = readCpuUsage().value_or(0.0);

    if (auto meminfo = readFile(paths_.meminfo)) {
        metrics.memoryUsedPercent = parseMemoryUsedPercent(*meminfo).value_or(0.0);
    }

    if (auto psi = readFile(paths_.memoryPressure)) {
        metrics.memoryPressure = parseMemoryPressure(*psi);
    }

    metrics.diskUsedPercent = readDiskUsedPercent();
    metrics.cpuTemperatureCelsius = readMaxThermalZone();

    // Per-device throughput needs two /proc/diskstats samples per device;
    // not collected, reported as idle.
    metrics.diskReadMBps = 0.0;
    metrics.diskWriteMBps = 0.0;
    return metrics;
}

} // namespace tonic
