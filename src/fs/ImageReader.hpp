//===----------------------------------------------------------------------===//
//
// Part of the ENTFS project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: fs/ImageReader.hpp
// Purpose: Parse an assembled image at the documented offsets and check it.
// Key invariants: parseImage() never reads past the buffer it is given.
// Ownership/Lifetime: ParsedImage owns copies of every region it decodes.
// Links: fs/Image.hpp, tools/entfs-inspect/driver.cpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "fs/Inode.hpp"
#include "fs/Layout.hpp"
#include "fs/Node.hpp"
#include "fs/Superblock.hpp"
#include "support/diag_expected.hpp"
#include "support/diagnostics.hpp"

#include <span>
#include <vector>

namespace entfs::fs
{

/// @brief Decoded view of an ENTFS image.
struct ParsedImage
{
    std::vector<Byte> boot;              ///< Boot code region.
    Superblock superblock;               ///< Record following the boot code.
    Inode inode;                         ///< First node of the stream.
    std::vector<DataSector> dataSectors; ///< Remaining nodes in stream order.
};

/// @brief Split @p image into boot code, superblock, inode, and data sectors.
///
/// @param image Full image bytes.
/// @param bootSize Length of the boot code preceding the superblock.
/// @return The decoded regions, or CorruptImage when the image is too short
///         for its fixed records, the superblock does not parse, or the node
///         stream does not end on a sector boundary.
[[nodiscard]] support::Expected<ParsedImage> parseImage(std::span<const Byte> image,
                                                        size_t bootSize = kSectorSize);

/// @brief Check the cross-record invariants of a parsed image.
///
/// Reports every violation to @p diags rather than stopping at the first:
/// - fragment 0 must start at kNodesOffset and cover exactly the data sectors;
/// - slots other than 0 must be empty;
/// - the inode must carry a name;
/// - a direct-boot extent must equal fragment 0.
///
/// @return True when no error was reported.
bool verifyImage(const ParsedImage &image, support::DiagnosticEngine &diags);

} // namespace entfs::fs
