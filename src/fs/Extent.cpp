//===----------------------------------------------------------------------===//
//
// Part of the ENTFS project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: fs/Extent.cpp
// Purpose: Extent sizing and its fixed four-byte encoding.
// Key invariants: forPayload never produces an extent whose end overflows Addr.
// Ownership/Lifetime: Value type.
// Links: fs/Extent.hpp
//
//===----------------------------------------------------------------------===//

#include "fs/Extent.hpp"

#include "fs/MkfsError.hpp"

#include <limits>
#include <string>

namespace entfs::fs
{

support::Expected<Extent> Extent::forPayload(Addr start, size_t length)
{
    const size_t sectors = sectorsFor(length);
    if (sectors == 0)
        return Extent{};

    constexpr size_t kMaxAddr = std::numeric_limits<Addr>::max();
    const size_t limit = kMaxAddr - start + 1;
    if (sectors > limit)
    {
        return makeDiag(MkfsError::PayloadTooLarge,
                        {},
                        {{"sectors", std::to_string(sectors)}, {"limit", std::to_string(limit)}});
    }
    return Extent{start, static_cast<Addr>(start + sectors - 1)};
}

void Extent::encode(Byte *out) const
{
    storeLE16(out, start);
    storeLE16(out + 2, end);
}

Extent Extent::decode(const Byte *in)
{
    return Extent{loadLE16(in), loadLE16(in + 2)};
}

} // namespace entfs::fs
