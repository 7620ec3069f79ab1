//===----------------------------------------------------------------------===//
//
// Part of the ENTFS project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: fs/Layout.hpp
// Purpose: On-disk constants shared by the image builder and reader.
// Key invariants: Sector 0 holds boot code, sector 1 the superblock, and the
//                 node stream starts at sector 2.
// Ownership/Lifetime: Compile-time constants only.
// Links: fs/Superblock.hpp, fs/Inode.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "entfs/version.h"

#include <cstddef>
#include <cstdint>

namespace entfs::fs
{

/// @brief Sector index into the image, counted from the start of the boot code.
using Addr = uint16_t;

/// @brief Raw byte as stored on disk.
using Byte = uint8_t;

/** @name Layout constants
 *  @brief Geometry shared by mkfs.entfs, entfs-inspect, and the boot loader.
 *  @{
 */
constexpr size_t kSectorSize = 512;       ///< Bytes per sector and per node
constexpr Addr kNodesOffset = 2;          ///< First sector of the node stream
constexpr uint32_t kMagic = 0x46544E45;   ///< "ENTF" read as little-endian
constexpr uint16_t kVersion = ENTFS_FORMAT_VERSION; ///< On-disk format version
constexpr uint16_t kDefaultBlockSize = 512;
/** @} */

/// @brief Store @p value at @p out in little-endian order.
inline void storeLE16(Byte *out, uint16_t value)
{
    out[0] = static_cast<Byte>(value & 0xFF);
    out[1] = static_cast<Byte>(value >> 8);
}

/// @brief Store @p value at @p out in little-endian order.
inline void storeLE32(Byte *out, uint32_t value)
{
    for (int i = 0; i < 4; ++i)
        out[i] = static_cast<Byte>((value >> (8 * i)) & 0xFF);
}

inline uint16_t loadLE16(const Byte *in)
{
    return static_cast<uint16_t>(in[0] | (in[1] << 8));
}

inline uint32_t loadLE32(const Byte *in)
{
    uint32_t value = 0;
    for (int i = 0; i < 4; ++i)
        value |= static_cast<uint32_t>(in[i]) << (8 * i);
    return value;
}

} // namespace entfs::fs
