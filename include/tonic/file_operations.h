// Copyright(C) 2025-2026 Advanced Micro Devices, Inc. All rights reserved.
// SPDX-License-Identifier: MIT
//
// Delete primitive used by the fix executor.
//
// FileOperations is the seam; LocalFileOperations removes paths with
// std::filesystem after rejecting protected system locations.

#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "types.h"
#include "tonic/export.h"

namespace tonic {

struct DeleteResult {
    bool success = false;
    int filesProcessed = 0;
    int64_t bytesFreed = 0;
    std::vector<std::string> errors;
    double durationSeconds = 0.0;

    json toJson() const {
        return json{
            {"success", success},
            {"files_processed", filesProcessed},
            {"bytes_freed", bytesFreed},
            {"errors", errors},
            {"duration_seconds", durationSeconds}
        };
    }
};

class TONIC_API FileOperations {
public:
    virtual ~FileOperations() = default;

    /// Delete the given paths.
    /// success is true only when every path was removed.
    virtual DeleteResult deleteFiles(const std::vector<std::string>& paths) = 0;

    /// Size in bytes of a file or directory tree; 0 if it does not exist.
    virtual int64_t calculateSize(const std::string& path) = 0;
};

class TONIC_API LocalFileOperations : public FileOperations {
public:
    /// Uses defaultProtectedPaths() and defaultProtectedTrees().
    LocalFileOperations();

    /// @param protectedPaths Paths that may never be deleted, nor any of
    ///        their ancestors
    /// @param protectedTrees Like protectedPaths, and nothing below them
    ///        may be deleted either
    explicit LocalFileOperations(std::vector<std::string> protectedPaths,
                                 std::vector<std::string> protectedTrees = {});

    DeleteResult deleteFiles(const std::vector<std::string>& paths) override;
    int64_t calculateSize(const std::string& path) override;

    /// Check a path before deletion.
    /// @return Empty string if the path may be deleted, else the reason
    std::string validatePath(const std::string& path) const;

    /// The filesystem root and the current user's home directory.
    static std::vector<std::string> defaultProtectedPaths();

    /// System directories.
    static std::vector<std::string> defaultProtectedTrees();

private:
    std::vector<std::string> protectedPaths_;
    std::vector<std::string> protectedTrees_;
};

} // namespace tonic
