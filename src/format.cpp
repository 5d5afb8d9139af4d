// Copyright(C) 2025-2026 Advanced Micro Devices, Inc. All rights reserved.
// SPDX-License-Identifier: MIT

#include "tonic/format.h"

#include <cstdio>

namespace tonic {

namespace {
constexpr double KIB = 1024.0;
constexpr double MIB = 1024.0 * 1024.0;
constexpr double GIB = 1024.0 * 1024.0 * 1024.0;
} // namespace

std::string formatSize(int64_t bytes) {
    const auto size = static_cast<double>(bytes);
    char buf[64];

    if (size / GIB >= 1.0) {
        std::snprintf(buf, sizeof(buf), "%.1f GB", size / GIB);
    } else if (size / MIB >= 1.0) {
        std::snprintf(buf, sizeof(buf), "%.0f MB", size / MIB);
    } else {
        std::snprintf(buf, sizeof(buf), "%.0f KB", size / KIB);
    }
    return buf;
}

std::string formatFileCount(int count) {
    if (count >= 1000) {
        char buf[32];
        std::snprintf(buf, sizeof(buf), "%.1f K", static_cast<double>(count) / 1000.0);
        return buf;
    }
    return std::to_string(count);
}

std::string formatPercent(double percent) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.1f%%", percent);
    return buf;
}

} // namespace tonic
