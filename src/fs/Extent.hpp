//===----------------------------------------------------------------------===//
//
// Part of the ENTFS project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: fs/Extent.hpp
// Purpose: Contiguous inclusive sector range ("cluster") owned by one entity.
// Key invariants: start <= end; [0, 0] is the empty extent since sector 0
//                 always holds boot code.
// Ownership/Lifetime: Value type.
// Links: fs/Inode.hpp, fs/Superblock.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "fs/Layout.hpp"
#include "support/diag_expected.hpp"

#include <cstddef>

namespace entfs::fs
{

/// @brief Number of sectors needed to hold @p length bytes.
[[nodiscard]] constexpr size_t sectorsFor(size_t length)
{
    return length / kSectorSize + (length % kSectorSize != 0 ? 1 : 0);
}

/// @brief Inclusive range of sector addresses.
struct Extent
{
    /// @brief Encoded width: two little-endian 16-bit addresses.
    static constexpr size_t kEncodedSize = 4;

    Addr start = 0; ///< First sector of the range.
    Addr end = 0;   ///< Last sector of the range, inclusive.

    /// @brief Extent covering a payload of @p length bytes placed at @p start.
    /// @details The range ends at `start + ceil(length / kSectorSize) - 1`.  An
    ///          empty payload yields the empty extent.
    /// @return The extent, or PayloadTooLarge when the last sector is not
    ///         addressable.
    [[nodiscard]] static support::Expected<Extent> forPayload(Addr start, size_t length);

    /// @brief True for the "no data" extent.
    [[nodiscard]] bool isEmpty() const
    {
        return start == 0 && end == 0;
    }

    /// @brief Number of sectors covered; zero for the empty extent.
    [[nodiscard]] size_t sectorCount() const
    {
        return isEmpty() ? 0 : static_cast<size_t>(end - start) + 1;
    }

    /// @brief Write the extent as @ref kEncodedSize bytes at @p out.
    void encode(Byte *out) const;

    /// @brief Read an extent previously written by @ref encode.
    [[nodiscard]] static Extent decode(const Byte *in);

    bool operator==(const Extent &) const = default;
};

} // namespace entfs::fs
