//===----------------------------------------------------------------------===//
//
// Part of the ENTFS project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: fs/Inode.cpp
// Purpose: Inode field updates and the fixed-layout record encoding.
// Key invariants: serialize() emits kRecordSize bytes in field order.
// Ownership/Lifetime: Value type.
// Links: fs/Inode.hpp
//
//===----------------------------------------------------------------------===//

#include "fs/Inode.hpp"

#include "fs/MkfsError.hpp"

#include <algorithm>
#include <cstring>

namespace entfs::fs
{

support::Expected<void> Inode::setName(std::string_view name)
{
    if (name.size() > kNameCapacity)
    {
        return makeDiag(MkfsError::NameTooLong,
                        {},
                        {{"name", name},
                         {"length", std::to_string(name.size())},
                         {"limit", std::to_string(kNameCapacity)}});
    }
    name_.fill('\0');
    std::copy(name.begin(), name.end(), name_.begin());
    return {};
}

std::string Inode::name() const
{
    const auto end = std::find(name_.begin(), name_.end(), '\0');
    return std::string(name_.begin(), end);
}

support::Expected<void> Inode::setExtent(size_t index, Extent extent)
{
    if (index >= kExtentSlots)
    {
        return makeDiag(
            MkfsError::InvalidExtentSlot,
            {},
            {{"index", std::to_string(index)}, {"slots", std::to_string(kExtentSlots)}});
    }
    dat_[index] = extent;
    return {};
}

std::vector<Byte> Inode::serialize() const
{
    std::vector<Byte> out(kRecordSize, 0);
    std::memcpy(out.data(), name_.data(), kNameCapacity);
    Byte *cursor = out.data() + kNameCapacity;
    for (const Extent &e : dat_)
    {
        e.encode(cursor);
        cursor += Extent::kEncodedSize;
    }
    return out;
}

support::Expected<Inode> Inode::parse(std::span<const Byte> bytes)
{
    if (bytes.size() < kRecordSize)
    {
        return makeDiag(MkfsError::CorruptImage,
                        {},
                        {{"detail", "inode truncated to " + std::to_string(bytes.size()) + " bytes"}});
    }

    Inode inode;
    std::memcpy(inode.name_.data(), bytes.data(), kNameCapacity);
    const Byte *cursor = bytes.data() + kNameCapacity;
    for (Extent &e : inode.dat_)
    {
        e = Extent::decode(cursor);
        cursor += Extent::kEncodedSize;
    }
    return inode;
}

support::Expected<void> Inode::checkRecordSize(size_t actual)
{
    if (actual != kSectorSize)
    {
        return makeDiag(MkfsError::InvalidInode,
                        {},
                        {{"size", std::to_string(actual)},
                         {"expected", std::to_string(kSectorSize)}});
    }
    return {};
}

} // namespace entfs::fs
