// Copyright(C) 2025-2026 Advanced Micro Devices, Inc. All rights reserved.
// SPDX-License-Identifier: MIT
//
// Live system readings for the metrics-based health score.
//
// ProcMetricsProvider reads the Linux procfs/sysfs interfaces. Readings
// that cannot be obtained are reported as absent, never as errors.

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

#include "types.h"
#include "tonic/export.h"

namespace tonic {

class TONIC_API MetricsProvider {
public:
    virtual ~MetricsProvider() = default;

    /// Take a snapshot of current readings.
    virtual SystemHealthMetrics snapshot() = 0;
};

/// Paths read by ProcMetricsProvider; overridable for tests.
struct ProcPaths {
    std::string stat = "/proc/stat";
    std::string meminfo = "/proc/meminfo";
    std::string memoryPressure = "/proc/pressure/memory";
    std::string thermalRoot = "/sys/class/thermal";
    std::string diskMount = "/";
};

class TONIC_API ProcMetricsProvider : public MetricsProvider {
public:
    /// @param sampleInterval Gap between the two /proc/stat samples used
    ///        to compute CPU utilisation
    explicit ProcMetricsProvider(std::chrono::milliseconds sampleInterval = std::chrono::milliseconds(250),
                                 ProcPaths paths = {});

    SystemHealthMetrics snapshot() override;

    // ---- Parsers (exposed for testing) ----

    struct CpuTimes {
        uint64_t idle = 0;
        uint64_t total = 0;
    };

    /// Parse the aggregate "cpu" line of /proc/stat.
    static std::optional<CpuTimes> parseCpuTimes(const std::string& statText);

    /// Busy percentage between two samples; nullopt if no time elapsed.
    static std::optional<double> cpuUsageBetween(const CpuTimes& before, const CpuTimes& after);

    /// Used memory percentage from /proc/meminfo (MemTotal - MemAvailable).
    static std::optional<double> parseMemoryUsedPercent(const std::string& meminfoText);

    /// Pressure level from the PSI "some avg10" value:
    /// above 10 is WARNING, above 30 is CRITICAL.
    static MemoryPressure parseMemoryPressure(const std::string& psiText);

private:
    std::optional<double> readCpuUsage();
    std::optional<double> readMaxThermalZone();
    std::optional<double> readDiskUsedPercent();

    std::chrono::milliseconds sampleInterval_;
    ProcPaths paths_;
};

} // namespace tonic
