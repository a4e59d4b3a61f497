/*
 * debridarr - Debrid-backed fetch orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include <gtest/gtest.h>

#include "debridarr/descriptor.hpp"
#include "debridarr/job.hpp"
#include "test_support.hpp"

using namespace debridarr;
using namespace debridarr::test;

namespace {

TEST(DescriptorTest, KindFollowsExtension) {
    EXPECT_EQ(descriptorKind("a.magnet"), DescriptorKind::Link);
    EXPECT_EQ(descriptorKind("A.Torrent"), DescriptorKind::ContainerFile);
    EXPECT_FALSE(descriptorKind("a.txt").has_value());
    EXPECT_FALSE(descriptorKind("magnet").has_value());
}

TEST(DescriptorTest, InfoHashFromHexAndBase32) {
    EXPECT_EQ(magnetInfoHash("magnet:?xt=urn:btih:0123456789ABCDEF0123456789ABCDEF01234567&dn=x"),
              "0123456789abcdef0123456789abcdef01234567");
    // base32 of twenty zero bytes
    EXPECT_EQ(magnetInfoHash("magnet:?dn=x&xt=urn:btih:AAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAA"),
              std::string(40, '0'));
    EXPECT_FALSE(magnetInfoHash("magnet:?dn=only-a-name").has_value());
    EXPECT_FALSE(magnetInfoHash("magnet:?xt=urn:sha1:abcdef").has_value());
}

TEST(DescriptorTest, DisplayNameIsDecoded) {
    EXPECT_EQ(magnetDisplayName("magnet:?xt=urn:btih:abc&dn=Some+Show%20S01"), "Some Show S01");
    EXPECT_FALSE(magnetDisplayName("magnet:?xt=urn:btih:abc&dn=").has_value());
}

TEST(DescriptorTest, LoadPayloadTrimsLinksOnly) {
    TempDir dir;
    Descriptor link{dir.path() / "a.magnet", DescriptorKind::Link};
    writeFile(link.path, "  magnet:?xt=urn:btih:abc \n");
    ASSERT_EQ(loadPayload(link), PayloadStatus::Ok);
    EXPECT_EQ(link.payload, "magnet:?xt=urn:btih:abc");

    Descriptor container{dir.path() / "a.torrent", DescriptorKind::ContainerFile};
    writeFile(container.path, std::string("d4:info\0e\n", 10));
    ASSERT_EQ(loadPayload(container), PayloadStatus::Ok);
    EXPECT_EQ(container.payload.size(), 10u);
}

TEST(DescriptorTest, LoadPayloadReportsMissingAndEmpty) {
    TempDir dir;
    Descriptor missing{dir.path() / "gone.magnet", DescriptorKind::Link};
    EXPECT_EQ(loadPayload(missing), PayloadStatus::Missing);

    Descriptor blank{dir.path() / "blank.magnet", DescriptorKind::Link};
    writeFile(blank.path, " \n\t");
    EXPECT_EQ(loadPayload(blank), PayloadStatus::Empty);
}

TEST(JobTest, IdIsStableForSameSourceAndTime) {
    auto t = std::chrono::system_clock::now();
    EXPECT_EQ(makeJobId("inbox/a.magnet", t), makeJobId("inbox/a.magnet", t));
    EXPECT_NE(makeJobId("inbox/a.magnet", t), makeJobId("inbox/b.magnet", t));
    EXPECT_NE(makeJobId("inbox/a.magnet", t), makeJobId("inbox/a.magnet", t + std::chrono::seconds(1)));
}

TEST(JobTest, CancelTokenFollowsParent) {
    std::atomic<bool> stop{false};
    CancelToken token(&stop);
    EXPECT_FALSE(token.cancelled());
    stop = true;
    EXPECT_TRUE(token.cancelled());

    CancelToken standalone;
    standalone.cancel();
    EXPECT_TRUE(standalone.cancelled());
}

}
