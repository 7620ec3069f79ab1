//===----------------------------------------------------------------------===//
//
// Part of the ENTFS project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tests/unit/FsImageTests.cpp
// Purpose: Verify sector splitting, node kinds, and image concatenation order.
// Key invariants: Image bytes are boot code, then superblock, then nodes in
//                 push order, each node exactly one sector.
// Ownership/Lifetime: Images are consumed by build().
// Links: src/fs/Node.hpp, src/fs/Image.hpp
//
//===----------------------------------------------------------------------===//

#include <gtest/gtest.h>

#include "fs/Image.hpp"
#include "fs/MkfsError.hpp"

#include <algorithm>
#include <vector>

using namespace entfs::fs;

TEST(FsNodeTest, SplitPadsTrailingSector)
{
    std::vector<Byte> payload(1000, 0xAB);
    auto sectors = splitSectors(payload);
    ASSERT_EQ(sectors.size(), 2u);
    for (const auto &s : sectors)
        EXPECT_EQ(s.bytes.size(), kSectorSize);

    EXPECT_EQ(sectors[1].bytes[1000 - 512 - 1], 0xAB);
    EXPECT_TRUE(std::all_of(sectors[1].bytes.begin() + (1000 - 512),
                            sectors[1].bytes.end(),
                            [](Byte b) { return b == 0; }));
}

TEST(FsNodeTest, SplitExactMultipleHasNoPadding)
{
    std::vector<Byte> payload(1024, 0x11);
    auto sectors = splitSectors(payload);
    ASSERT_EQ(sectors.size(), 2u);
    EXPECT_EQ(sectors[1].bytes.back(), 0x11);
    EXPECT_TRUE(splitSectors({}).empty());
}

TEST(FsNodeTest, KindFollowsPayload)
{
    Node inode{Inode{}};
    Node data{DataSector{std::vector<Byte>(kSectorSize, 0)}};
    EXPECT_EQ(inode.kind(), Node::Kind::Inode);
    EXPECT_NE(inode.inode(), nullptr);
    EXPECT_EQ(inode.data(), nullptr);
    EXPECT_EQ(data.kind(), Node::Kind::Data);
    EXPECT_EQ(data.serializedSize(), kSectorSize);
}

TEST(FsImageTest, BuildConcatenatesInOrder)
{
    Superblock sb(kVersion, kDefaultBlockSize);
    sb.setDirectboot(Extent{2, 2});
    Image image(sb, {0xEB, 0x3C, 0x90});

    Inode inode;
    ASSERT_TRUE(inode.setName("kernel.bin"));
    ASSERT_TRUE(inode.setExtent(0, Extent{2, 2}));
    image.push(Node(std::move(inode)));
    image.push(Node(DataSector{std::vector<Byte>(kSectorSize, 0x5A)}));

    EXPECT_EQ(image.inodeCount(), 1u);
    EXPECT_EQ(image.dataCount(), 1u);
    const size_t expected = 3 + 512 + 2 * 512;
    EXPECT_EQ(image.byteSize(), expected);

    auto bytes = std::move(image).build();
    ASSERT_TRUE(bytes);
    const auto &out = bytes.value();
    ASSERT_EQ(out.size(), expected);

    EXPECT_EQ(out[0], 0xEB);
    EXPECT_EQ(out[2], 0x90);
    EXPECT_EQ(loadLE32(&out[3]), kMagic);
    EXPECT_EQ(out[3 + 512], 'k');
    EXPECT_EQ(out[3 + 1024], 0x5A);
    EXPECT_EQ(out.back(), 0x5A);
}

TEST(FsImageTest, BuildRejectsShortDataNode)
{
    Image image(Superblock(kVersion, kDefaultBlockSize), {0x00});
    image.push(Node(Inode{}));
    image.push(Node(DataSector{std::vector<Byte>(100, 0)}));

    auto bytes = std::move(image).build();
    ASSERT_FALSE(bytes);
    EXPECT_TRUE(isError(bytes.error(), MkfsError::InvalidNode));
    EXPECT_EQ(bytes.error().message, "node 1 is 100 bytes, expected 512");
}
