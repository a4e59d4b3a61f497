/*
 * debridarr - Debrid-backed fetch orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include <gtest/gtest.h>

#include "debridarr/logger.hpp"
#include "debridarr/scanner.hpp"
#include "test_support.hpp"

using namespace debridarr;
using namespace debridarr::test;

namespace {

void setMtime(const std::filesystem::path& path, std::chrono::seconds offset) {
    std::filesystem::last_write_time(path, std::filesystem::file_time_type::clock::now() + offset);
}

TEST(ScannerTest, ReturnsDescriptorsOldestFirst) {
    Logger::setLevel(LogLevel::ERROR);
    TempDir dir;
    writeFile(dir.path() / "c.magnet", magnetFor("c"));
    writeFile(dir.path() / "a.torrent", "d8:announce0:e");
    writeFile(dir.path() / "b.magnet", magnetFor("b"));
    setMtime(dir.path() / "c.magnet", std::chrono::seconds(-300));
    setMtime(dir.path() / "a.torrent", std::chrono::seconds(-100));
    setMtime(dir.path() / "b.magnet", std::chrono::seconds(-200));

    Scanner scanner(dir.path());
    auto found = scanner.scan();

    ASSERT_EQ(found.size(), 3u);
    EXPECT_EQ(found[0].name(), "c.magnet");
    EXPECT_EQ(found[1].name(), "b.magnet");
    EXPECT_EQ(found[2].name(), "a.torrent");
    EXPECT_EQ(found[2].kind, DescriptorKind::ContainerFile);
    EXPECT_TRUE(found[0].payload.empty());
}

TEST(ScannerTest, IgnoresHiddenEmptyAndForeignFiles) {
    TempDir dir;
    writeFile(dir.path() / ".pending.magnet.tmp", magnetFor("x"));
    writeFile(dir.path() / ".hidden.magnet", magnetFor("x"));
    writeFile(dir.path() / "empty.magnet", "");
    writeFile(dir.path() / "notes.txt", "hello");
    std::filesystem::create_directories(dir.path() / "folder.magnet");
    writeFile(dir.path() / "real.MAGNET", magnetFor("real"));

    Scanner scanner(dir.path());
    auto found = scanner.scan();

    ASSERT_EQ(found.size(), 1u);
    EXPECT_EQ(found[0].name(), "real.MAGNET");
    EXPECT_EQ(scanner.pendingCount(), 1u);
}

TEST(ScannerTest, StaleEmptyDescriptorIsReported) {
    TempDir dir;
    writeFile(dir.path() / "fresh.magnet", "");
    writeFile(dir.path() / "stale.magnet", "");
    setMtime(dir.path() / "stale.magnet", std::chrono::seconds(-60));

    Scanner scanner(dir.path(), std::chrono::seconds(5));
    auto found = scanner.scan();

    ASSERT_EQ(found.size(), 1u);
    EXPECT_EQ(found[0].name(), "stale.magnet");
    EXPECT_EQ(scanner.pendingCount(), 1u);
}

TEST(ScannerTest, MissingInboxYieldsNothing) {
    TempDir dir;
    Scanner scanner(dir.path() / "absent");
    EXPECT_TRUE(scanner.scan().empty());
    EXPECT_EQ(scanner.pendingCount(), 0u);
}

}
