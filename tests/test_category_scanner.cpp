// Copyright(C) 2025-2026 Advanced Micro Devices, Inc. All rights reserved.
// SPDX-License-Identifier: MIT

#include <gtest/gtest.h>
#include <tonic/category_scanner.h>

#include <algorithm>
#include <filesystem>

#include <sys/stat.h>
#include <unistd.h>

#include "test_helpers.h"

using namespace tonic;
using namespace tonic_test;

namespace fs = std::filesystem;

class FilesystemCategoryScannerTest : public ::testing::Test {
protected:
    ScratchDirectory scratch;
    ScanLocations locations;

    void SetUp() override {
        locations = ScanLocations::underHome((scratch.path() / "home").string(),
                                             (scratch.path() / "tmp").string());
        locations.systemAutostartDirectory = (scratch.path() / "etc-autostart").string();
    }

    std::string home(const std::string& relative) const {
        return (scratch.path() / "home" / relative).string();
    }

    static bool containsPath(const FileGroup& group, const std::string& path) {
        return std::find(group.paths.begin(), group.paths.end(), path) != group.paths.end();
    }
};

// ---- ScanLocations ----

TEST(ScanLocationsTest, UnderHomeLayout) {
    ScanLocations loc = ScanLocations::underHome("/home/ada", "/tmp");
    EXPECT_EQ(loc.cacheDirectory, "/home/ada/.cache");
    EXPECT_EQ(loc.stateDirectory, "/home/ada/.local/state");
    EXPECT_EQ(loc.trashDirectory, "/home/ada/.local/share/Trash/files");
    EXPECT_EQ(loc.downloadsDirectory, "/home/ada/Downloads");
    EXPECT_EQ(loc.autostartDirectory, "/home/ada/.config/autostart");
    EXPECT_EQ(loc.applicationsDirectory, "/home/ada/.local/share/applications");
    EXPECT_EQ(loc.browserCacheDirectories.size(), 3u);
}

TEST(ScanLocationsTest, EmptyHomeDisablesLocations) {
    ScanLocations loc = ScanLocations::underHome("", "");
    EXPECT_TRUE(loc.cacheDirectory.empty());
    EXPECT_TRUE(loc.downloadsDirectory.empty());
}

// ---- scanDirectory ----

TEST_F(FilesystemCategoryScannerTest, ScanDirectoryHonoursDepth) {
    scratch.writeFile("walk/top.txt", 1);
    scratch.writeFile("walk/a/mid.txt", 2);
    scratch.writeFile("walk/a/b/deep.txt", 4);
    const std::string root = (scratch.path() / "walk").string();

    EXPECT_EQ(FilesystemCategoryScanner::scanDirectory(root, 1).totalBytes, 1);
    EXPECT_EQ(FilesystemCategoryScanner::scanDirectory(root, 2).totalBytes, 3);
    EXPECT_EQ(FilesystemCategoryScanner::scanDirectory(root, 8).totalBytes, 7);
    EXPECT_TRUE(FilesystemCategoryScanner::scanDirectory(root, 0).files.empty());
    EXPECT_TRUE(FilesystemCategoryScanner::scanDirectory(
        (scratch.path() / "nowhere").string(), 8).files.empty());
}

TEST_F(FilesystemCategoryScannerTest, ScanDirectoryFilters) {
    auto oldLog = scratch.writeFile("logs/old.log", 10);
    scratch.writeFile("logs/new.log", 20);
    scratch.writeFile("logs/notes.txt", 40);
    ScratchDirectory::age(oldLog, 120);
    const std::string root = (scratch.path() / "logs").string();

    EXPECT_EQ(FilesystemCategoryScanner::scanDirectory(root, 4, 0, ".log").totalBytes, 30);
    auto aged = FilesystemCategoryScanner::scanDirectory(root, 4, 90);
    ASSERT_EQ(aged.files.size(), 1u);
    EXPECT_EQ(aged.files[0].first, oldLog);
}

TEST_F(FilesystemCategoryScannerTest, ScanDirectorySkipsSymlinks) {
    scratch.writeFile("outside/big.bin", 5000);
    scratch.writeFile("linked/own.bin", 5);
    fs::create_directory_symlink(scratch.path() / "outside", scratch.path() / "linked" / "loop");

    auto result = FilesystemCategoryScanner::scanDirectory((scratch.path() / "linked").string(), 8);
    EXPECT_EQ(result.totalBytes, 5);
}

TEST_F(FilesystemCategoryScannerTest, UnreadableDirectoryDoesNotStopWalk) {
    scratch.writeFile("walk/a-locked/secret.bin", 1000);
    scratch.writeFile("walk/b/inner.bin", 20);
    scratch.writeFile("walk/c.bin", 3);
    const fs::path locked = scratch.path() / "walk" / "a-locked";
    fs::permissions(locked, fs::perms::none);

    auto result = FilesystemCategoryScanner::scanDirectory((scratch.path() / "walk").string(), 8);
    fs::permissions(locked, fs::perms::owner_all);

    // Permission bits do not apply to root, so the locked file may be counted
    const int64_t lockedBytes = ::geteuid() == 0 ? 1000 : 0;
    EXPECT_EQ(result.totalBytes, 23 + lockedBytes);
    EXPECT_EQ(result.files.size(), lockedBytes > 0 ? 3u : 2u);
}

// ---- Categories ----

TEST_F(FilesystemCategoryScannerTest, TempFilesMustBeIdleAndOwned) {
    auto idle = scratch.writeFile("tmp/build-1234/obj.o", 100);
    auto fresh = scratch.writeFile("tmp/session.sock.lock", 50);
    ScratchDirectory::age(idle, 2);

    FilesystemCategoryScanner scanner(locations);
    JunkCategory junk = scanner.scanJunkFiles(ScanConfig::defaults());
    EXPECT_TRUE(containsPath(junk.tempFiles, idle));
    EXPECT_FALSE(containsPath(junk.tempFiles, fresh));
    EXPECT_EQ(junk.tempFiles.size, 100);

    // Files of another user are left alone (needs root to hand one over)
    if (::geteuid() == 0) {
        auto foreign = scratch.writeFile("tmp/other-user.dat", 70);
        ScratchDirectory::age(foreign, 2);
        ASSERT_EQ(::chown(foreign.c_str(), 65534, 65534), 0);

        JunkCategory again = scanner.scanJunkFiles(ScanConfig::defaults());
        EXPECT_FALSE(containsPath(again.tempFiles, foreign));
        EXPECT_EQ(again.tempFiles.size, 100);
    }
}

TEST_F(FilesystemCategoryScannerTest, JunkFilesFromXdgLocations) {
    auto temp = scratch.writeFile("tmp/session.tmp", 100);
    ScratchDirectory::age(temp, 3);
    scratch.writeFile("home/.cache/thumbnails/t1.png", 200);
    scratch.writeFile("home/.cache/mozilla/profile/cache2", 5000);
    scratch.writeFile("home/.local/state/app/app.log", 300);
    scratch.writeFile("home/.local/state/app/state.db", 999);
    scratch.writeFile("home/.local/share/Trash/files/deleted.doc", 400);
    auto download = scratch.writeFile("home/Downloads/installer.run", 500);
    scratch.writeFile("home/Downloads/fresh.pdf", 600);
    ScratchDirectory::age(download, 200);

    FilesystemCategoryScanner scanner(locations);
    JunkCategory junk = scanner.scanJunkFiles(ScanConfig::defaults());

    EXPECT_EQ(junk.tempFiles.size, 100);
    EXPECT_EQ(junk.cacheFiles.size, 200); // browser cache excluded
    EXPECT_EQ(junk.logFiles.size, 300);
    EXPECT_EQ(junk.trashItems.size, 400);
    EXPECT_EQ(junk.oldFiles.size, 500);
    EXPECT_TRUE(containsPath(junk.oldFiles, download));
    EXPECT_TRUE(junk.languageFiles.isEmpty());
    EXPECT_EQ(junk.totalFiles(), 5);
}

TEST_F(FilesystemCategoryScannerTest, DisabledGroupsStayEmpty) {
    scratch.writeFile("tmp/session.tmp", 100);
    scratch.writeFile("home/.local/share/Trash/files/deleted.doc", 400);

    ScanConfig config;
    config.scanTempFiles = false;
    config.scanTrash = false;

    FilesystemCategoryScanner scanner(locations);
    JunkCategory junk = scanner.scanJunkFiles(config);
    EXPECT_EQ(junk.totalSize(), 0);
    EXPECT_EQ(junk.tempFiles.name, "Temp");
}

TEST_F(FilesystemCategoryScannerTest, BrowserCachesOnlyWhenEnabled) {
    scratch.writeFile("home/.cache/google-chrome/Default/Cache/data_1", 700);
    scratch.writeFile("home/.cache/chromium/Default/Cache/data_2", 300);

    FilesystemCategoryScanner scanner(locations);
    EXPECT_TRUE(scanner.scanPerformanceIssues(ScanConfig::defaults()).browserCaches.isEmpty());

    PerformanceCategory perf = scanner.scanPerformanceIssues(ScanConfig::aggressive());
    EXPECT_EQ(perf.browserCaches.size, 1000);
    EXPECT_EQ(perf.browserCaches.count, 2);
}

TEST_F(FilesystemCategoryScannerTest, AutostartEntries) {
    scratch.writeFile("home/.config/autostart/syncer.desktop", 0,
                      "[Desktop Entry]\nName=Syncer\nExec=syncer --background\n");
    scratch.writeFile("home/.config/autostart/readme.txt", 12);
    scratch.writeFile("etc-autostart/agent.desktop", 0, "[Desktop Entry]\nName=Agent\n");

    FilesystemCategoryScanner scanner(locations);
    PerformanceCategory perf = scanner.scanPerformanceIssues(ScanConfig::defaults());
    EXPECT_EQ(perf.launchAgents.count, 1);
    EXPECT_TRUE(containsPath(perf.launchAgents, home(".config/autostart/syncer.desktop")));
    EXPECT_EQ(perf.loginItems.count, 1);
}

TEST_F(FilesystemCategoryScannerTest, OrphanedLaunchers) {
    scratch.writeFile("home/.local/share/applications/gone.desktop", 0,
                      "[Desktop Entry]\nName=Gone Tool\nExec=/nonexistent/tonic/gone-tool %U\n");
    scratch.writeFile("home/.local/share/applications/shell.desktop", 0,
                      "[Desktop Entry]\nName=Shell\nExec=\"/bin/sh\" -c true\n");
    scratch.writeFile("home/.local/share/applications/hidden.desktop", 0,
                      "[Desktop Action x]\nExec=/nonexistent/also-gone\n");

    FilesystemCategoryScanner scanner(locations);
    AppIssueCategory apps = scanner.scanAppIssues(ScanConfig::defaults());
    ASSERT_EQ(apps.orphanedFiles.size(), 1u);
    EXPECT_EQ(apps.orphanedFiles[0].id, "gone");
    EXPECT_EQ(apps.orphanedFiles[0].possibleSourceApp, "Gone Tool");
    EXPECT_GT(apps.orphanedFiles[0].size, 0);

    ScanConfig off;
    off.scanOrphanedFiles = false;
    EXPECT_TRUE(scanner.scanAppIssues(off).orphanedFiles.empty());
}

TEST_F(FilesystemCategoryScannerTest, DiskUsageOfHomeVolume) {
    fs::create_directories(scratch.path() / "home");
    FilesystemCategoryScanner scanner(locations);
    auto disk = scanner.diskUsage();
    ASSERT_TRUE(disk.has_value());
    EXPECT_GT(disk->totalSpace, 0);
    EXPECT_GE(disk->usedPercentage(), 0.0);
    EXPECT_LE(disk->usedPercentage(), 100.0);
}
