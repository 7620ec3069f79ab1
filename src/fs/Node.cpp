//===----------------------------------------------------------------------===//
//
// Part of the ENTFS project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: fs/Node.cpp
// Purpose: Sector splitting and node serialization.
// Key invariants: splitSectors() produces sectorsFor(payload.size()) sectors of
//                 kSectorSize bytes each.
// Ownership/Lifetime: appendTo() moves data sectors into the output buffer.
// Links: fs/Node.hpp
//
//===----------------------------------------------------------------------===//

#include "fs/Node.hpp"

#include "fs/Extent.hpp"

#include <algorithm>

namespace entfs::fs
{

std::vector<DataSector> splitSectors(std::span<const Byte> payload)
{
    std::vector<DataSector> sectors;
    sectors.reserve(sectorsFor(payload.size()));
    for (size_t offset = 0; offset < payload.size(); offset += kSectorSize)
    {
        const size_t chunk = std::min(kSectorSize, payload.size() - offset);
        DataSector sector{std::vector<Byte>(kSectorSize, 0)};
        std::copy_n(payload.begin() + offset, chunk, sector.bytes.begin());
        sectors.push_back(std::move(sector));
    }
    return sectors;
}

size_t Node::serializedSize() const
{
    if (const Inode *record = inode())
        return record->serialize().size();
    return data()->bytes.size();
}

void Node::appendTo(std::vector<Byte> &out) &&
{
    if (const Inode *record = inode())
    {
        const std::vector<Byte> bytes = record->serialize();
        out.insert(out.end(), bytes.begin(), bytes.end());
        return;
    }
    std::vector<Byte> &bytes = std::get<DataSector>(payload_).bytes;
    out.insert(out.end(), bytes.begin(), bytes.end());
    bytes.clear();
    bytes.shrink_to_fit();
}

} // namespace entfs::fs
