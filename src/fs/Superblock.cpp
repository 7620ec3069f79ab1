//===----------------------------------------------------------------------===//
//
// Part of the ENTFS project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: fs/Superblock.cpp
// Purpose: Fixed-layout encoding and decoding of the superblock.
// Key invariants: serialize() always returns kRecordSize bytes; parse() accepts
//                 exactly what serialize() writes.
// Ownership/Lifetime: Value type.
// Links: fs/Superblock.hpp
//
//===----------------------------------------------------------------------===//

#include "fs/Superblock.hpp"

#include "fs/MkfsError.hpp"

#include <string>

namespace entfs::fs
{
namespace
{
constexpr size_t kMagicOffset = 0;
constexpr size_t kVersionOffset = 4;
constexpr size_t kBlockSizeOffset = 6;
constexpr size_t kDirectbootFlagOffset = 8;
constexpr size_t kDirectbootOffset = 10;
} // namespace

Superblock::Superblock(uint16_t version, uint16_t blockSize)
    : version_(version), blockSize_(blockSize), directboot_(std::nullopt)
{
}

void Superblock::setDirectboot(Extent extent)
{
    directboot_ = extent;
}

std::vector<Byte> Superblock::serialize() const
{
    std::vector<Byte> out(kRecordSize, 0);
    storeLE32(&out[kMagicOffset], kMagic);
    storeLE16(&out[kVersionOffset], version_);
    storeLE16(&out[kBlockSizeOffset], blockSize_);
    if (directboot_)
    {
        out[kDirectbootFlagOffset] = 1;
        directboot_->encode(&out[kDirectbootOffset]);
    }
    return out;
}

support::Expected<Superblock> Superblock::parse(std::span<const Byte> bytes)
{
    if (bytes.size() < kRecordSize)
    {
        return makeDiag(MkfsError::CorruptImage,
                        {},
                        {{"detail",
                          "superblock truncated to " + std::to_string(bytes.size()) + " bytes"}});
    }

    const uint32_t magic = loadLE32(&bytes[kMagicOffset]);
    if (magic != kMagic)
    {
        return makeDiag(
            MkfsError::CorruptImage, {}, {{"detail", "superblock magic mismatch"}});
    }

    Superblock sb(loadLE16(&bytes[kVersionOffset]), loadLE16(&bytes[kBlockSizeOffset]));
    switch (bytes[kDirectbootFlagOffset])
    {
        case 0:
            break;
        case 1:
            sb.setDirectboot(Extent::decode(&bytes[kDirectbootOffset]));
            break;
        default:
            return makeDiag(
                MkfsError::CorruptImage, {}, {{"detail", "invalid directboot flag"}});
    }
    return sb;
}

} // namespace entfs::fs
