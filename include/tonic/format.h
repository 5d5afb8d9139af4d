// Copyright(C) 2025-2026 Advanced Micro Devices, Inc. All rights reserved.
// SPDX-License-Identifier: MIT
//
// Human-readable formatting for sizes, counts and percentages.

#pragma once

#include <cstdint>
#include <string>

#include "tonic/export.h"

namespace tonic {

/// Format a byte count with binary units.
/// "1.5 GB" at or above 1 GiB, "120 MB" at or above 1 MiB, else "12 KB".
TONIC_API std::string formatSize(int64_t bytes);

/// Format a file count, abbreviating thousands ("1.2 K").
TONIC_API std::string formatFileCount(int count);

/// Format a percentage with one decimal ("87.5%").
TONIC_API std::string formatPercent(double percent);

} // namespace tonic
