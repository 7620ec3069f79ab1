//===----------------------------------------------------------------------===//
//
// Part of the ENTFS project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: fs/Image.hpp
// Purpose: Assemble boot code, superblock, and node stream into one buffer.
// Key invariants: Output is boot ++ superblock ++ nodes in insertion order with
//                 no padding, reordering, or omission.
// Ownership/Lifetime: Image owns every buffer it was handed and is consumed by
//                     build(); nothing stays usable afterwards.
// Links: fs/Node.hpp, fs/Superblock.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "fs/Layout.hpp"
#include "fs/Node.hpp"
#include "fs/Superblock.hpp"
#include "support/diag_expected.hpp"

#include <vector>

namespace entfs::fs
{

/// @brief In-memory image under construction.
class Image
{
  public:
    /// @brief Take ownership of the superblock and the boot code.
    Image(Superblock superblock, std::vector<Byte> boot);

    [[nodiscard]] Superblock &superblock()
    {
        return superblock_;
    }

    [[nodiscard]] const Superblock &superblock() const
    {
        return superblock_;
    }

    /// @brief Append @p node to the node stream.
    void push(Node node);

    [[nodiscard]] size_t nodeCount() const
    {
        return nodes_.size();
    }

    [[nodiscard]] size_t inodeCount() const;

    [[nodiscard]] size_t dataCount() const;

    /// @brief Size of the buffer build() would return.
    [[nodiscard]] size_t byteSize() const;

    /// @brief Concatenate everything into the final image bytes.
    /// @details Every node is checked to be exactly one sector before any byte
    ///          is produced.
    /// @return The image, or InvalidInode / InvalidNode naming the offending
    ///         node's size.
    [[nodiscard]] support::Expected<std::vector<Byte>> build() &&;

  private:
    Superblock superblock_;
    std::vector<Byte> boot_;
    std::vector<Node> nodes_;
};

} // namespace entfs::fs
