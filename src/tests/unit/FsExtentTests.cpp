//===----------------------------------------------------------------------===//
//
// Part of the ENTFS project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tests/unit/FsExtentTests.cpp
// Purpose: Verify extent arithmetic and the 4-byte little-endian encoding.
// Key invariants: An extent covers ceil(len / 512) sectors; [0, 0] means empty.
// Ownership/Lifetime: Tests own all extents by value.
// Links: src/fs/Extent.hpp
//
//===----------------------------------------------------------------------===//

#include <gtest/gtest.h>

#include "fs/Extent.hpp"
#include "fs/MkfsError.hpp"

#include <array>

using namespace entfs::fs;

TEST(FsExtentTest, SectorsForRoundsUp)
{
    EXPECT_EQ(sectorsFor(0), 0u);
    EXPECT_EQ(sectorsFor(1), 1u);
    EXPECT_EQ(sectorsFor(512), 1u);
    EXPECT_EQ(sectorsFor(513), 2u);
    EXPECT_EQ(sectorsFor(1024), 2u);
}

TEST(FsExtentTest, EmptyPayloadYieldsEmptyExtent)
{
    auto extent = Extent::forPayload(kNodesOffset, 0);
    ASSERT_TRUE(extent);
    EXPECT_TRUE(extent.value().isEmpty());
    EXPECT_EQ(extent.value().sectorCount(), 0u);
}

TEST(FsExtentTest, PayloadEndIsInclusive)
{
    auto single = Extent::forPayload(kNodesOffset, 512);
    ASSERT_TRUE(single);
    EXPECT_EQ(single.value(), (Extent{2, 2}));
    EXPECT_EQ(single.value().sectorCount(), 1u);

    auto partial = Extent::forPayload(kNodesOffset, 1000);
    ASSERT_TRUE(partial);
    EXPECT_EQ(partial.value(), (Extent{2, 3}));
    EXPECT_EQ(partial.value().sectorCount(), 2u);
}

TEST(FsExtentTest, LargestAddressablePayloadEndsAtLastSector)
{
    auto extent = Extent::forPayload(kNodesOffset, size_t{65534} * kSectorSize);
    ASSERT_TRUE(extent);
    EXPECT_EQ(extent.value().start, 2);
    EXPECT_EQ(extent.value().end, 65535);
}

TEST(FsExtentTest, RejectsPayloadBeyondAddressSpace)
{
    auto extent = Extent::forPayload(kNodesOffset, size_t{65535} * kSectorSize);
    ASSERT_FALSE(extent);
    EXPECT_TRUE(isError(extent.error(), MkfsError::PayloadTooLarge));
    EXPECT_EQ(extent.error().message,
              "payload needs 65535 sectors, at most 65534 are addressable");
}

TEST(FsExtentTest, EncodesStartThenEndLittleEndian)
{
    std::array<Byte, Extent::kEncodedSize> raw{};
    Extent{0x0102, 0x0304}.encode(raw.data());
    EXPECT_EQ(raw[0], 0x02);
    EXPECT_EQ(raw[1], 0x01);
    EXPECT_EQ(raw[2], 0x04);
    EXPECT_EQ(raw[3], 0x03);
    EXPECT_EQ(Extent::decode(raw.data()), (Extent{0x0102, 0x0304}));
}
