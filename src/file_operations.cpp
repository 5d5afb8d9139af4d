// Copyright(C) 2025-2026 Advanced Micro Devices, Inc. All rights reserved.
// SPDX-License-Identifier: MIT

#include "tonic/file_operations.h"

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

namespace tonic {

namespace {

std::string normalize(const std::string& path) {
    std::string normal = fs::path(path).lexically_normal().string();
    while (normal.size() > 1 && normal.back() == '/') normal.pop_back();
    return normal;
}

bool isAncestorOf(const std::string& ancestor, const std::string& path) {
    if (ancestor.size() >= path.size()) return false;
    if (path.compare(0, ancestor.size(), ancestor) != 0) return false;
    return ancestor == "/" || path[ancestor.size()] == '/';
}

} // namespace

LocalFileOperations::LocalFileOperations()
    : LocalFileOperations(defaultProtectedPaths(), defaultProtectedTrees()) {}

LocalFileOperations::LocalFileOperations(std::vector<std::string> protectedPaths,
                                         std::vector<std::string> protectedTrees) {
    for (const auto& p : protectedPaths) {
        if (!p.empty()) protectedPaths_.push_back(normalize(p));
    }
    for (const auto& p : protectedTrees) {
        if (!p.empty()) protectedTrees_.push_back(normalize(p));
    }
}

std::vector<std::string> LocalFileOperations::defaultProtectedPaths() {
    std::vector<std::string> paths = {"/"};
    const char* home = std::getenv("HOME");
    if (home != nullptr && *home != '\0') paths.emplace_back(home);
    return paths;
}

std::vector<std::string> LocalFileOperations::defaultProtectedTrees() {
    return {"/bin", "/boot", "/dev", "/etc", "/lib", "/lib64", "/proc",
            "/sbin", "/sys", "/usr", "/var"};
}

std::string LocalFileOperations::validatePath(const std::string& path) const {
    if (path.empty()) return "empty path";
    for (const auto& part : fs::path(path)) {
        if (part.string() == "..") return "path traversal not allowed";
    }
    if (!fs::path(path).is_absolute()) return "path must be absolute";

    const std::string target = normalize(path);
    for (const auto& guarded : protectedPaths_) {
        if (target == guarded) return "protected path";
    }
    for (const auto& tree : protectedTrees_) {
        if (target == tree || isAncestorOf(tree, target)) return "inside protected path " + tree;
        if (isAncestorOf(target, tree)) return "contains protected path " + tree;
    }
    for (const auto& guarded : protectedPaths_) {
        if (isAncestorOf(target, guarded)) return "contains protected path " + guarded;
    }
    return "";
}

int64_t LocalFileOperations::calculateSize(const std::string& path) {
    std::error_code ec;
    auto status = fs::symlink_status(path, ec);
    if (ec || !fs::exists(status)) return 0;

    if (fs::is_regular_file(status)) {
        auto size = fs::file_size(path, ec);
        return ec ? 0 : static_cast<int64_t>(size);
    }
    if (!fs::is_directory(status)) return 0;

    int64_t total = 0;
    fs::recursive_directory_iterator it(path, fs::directory_options::skip_permission_denied, ec);
    const fs::recursive_directory_iterator end;
    for (; !ec && it != end; it.increment(ec)) {
        std::error_code entryEc;
        if (it->is_regular_file(entryEc) && !it->is_symlink(entryEc)) {
            auto size = it->file_size(entryEc);
            if (!entryEc) total += static_cast<int64_t>(size);
        }
    }
    return total;
}

DeleteResult LocalFileOperations::deleteFiles(const std::vector<std::string>& paths) {
    const auto start = std::chrono::steady_clock::now();
    DeleteResult result;

    for (const auto& path : paths) {
        std::string reason = validatePath(path);
        if (!reason.empty()) {
            result.errors.push_back(path + ": " + reason);
            continue;
        }

        std::error_code ec;
        if (!fs::exists(fs::symlink_status(path, ec))) {
            result.errors.push_back(path + ": no such file or directory");
            continue;
        }

        const int64_t size = calculateSize(path);
        fs::remove_all(path, ec);
        if (ec) {
            result.errors.push_back(path + ": " + ec.message());
            continue;
        }

        ++result.filesProcessed;
        result.bytesFreed += size;
    }

    result.success = result.errors.empty();
    result.durationSeconds = std::chrono::duration<double>(
        std::chrono::steady_clock::now() - start).count();
    return result;
}

} // namespace tonic
