//===----------------------------------------------------------------------===//
//
// Part of the ENTFS project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// This file declares the Superblock, the one-sector record written right after
// the boot code.  It carries the format discriminator (magic and version), the
// configured block size, and an optional pointer to the extent the boot loader
// should execute directly without any directory walk.
//
// Serialized layout (little-endian, kSectorSize bytes):
//   0   u32  magic "ENTF"
//   4   u16  version
//   6   u16  block_size
//   8   u8   directboot present (0 or 1)
//   9   u8   reserved
//   10  u16  directboot.start
//   12  u16  directboot.end
//   14       reserved, zero up to the end of the sector
//
// The layout has no variable-length fields; readers rely on it bit for bit.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "fs/Extent.hpp"
#include "fs/Layout.hpp"
#include "support/diag_expected.hpp"

#include <cstdint>
#include <optional>
#include <span>
#include <vector>

namespace entfs::fs
{

/// @brief Filesystem-wide parameters stored at sector 1.
class Superblock
{
  public:
    /// @brief Serialized record width.
    static constexpr size_t kRecordSize = kSectorSize;

    /// @brief Create a superblock with no direct-boot extent.
    Superblock(uint16_t version, uint16_t blockSize);

    /// @brief Mark @p extent as the entity executed directly at boot.
    void setDirectboot(Extent extent);

    [[nodiscard]] uint16_t version() const
    {
        return version_;
    }

    [[nodiscard]] uint16_t blockSize() const
    {
        return blockSize_;
    }

    [[nodiscard]] const std::optional<Extent> &directboot() const
    {
        return directboot_;
    }

    /// @brief Encode the record into exactly @ref kRecordSize bytes.
    [[nodiscard]] std::vector<Byte> serialize() const;

    /// @brief Decode a record from the first @ref kRecordSize bytes of @p bytes.
    /// @return The superblock, or CorruptImage on short input, a foreign magic
    ///         number, or an invalid direct-boot flag.
    [[nodiscard]] static support::Expected<Superblock> parse(std::span<const Byte> bytes);

    bool operator==(const Superblock &) const = default;

  private:
    uint16_t version_;
    uint16_t blockSize_;
    std::optional<Extent> directboot_;
};

} // namespace entfs::fs
