//===----------------------------------------------------------------------===//
//
// Part of the ENTFS project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// This file declares Node, the one-sector unit of the image body.  A node is
// either an inode record or a raw data sector.  In memory the distinction is an
// explicit std::variant; on disk it is positional only: the first node after
// the superblock is the inode, and the nodes that follow are its data sectors
// in payload order.  No tag byte is ever written.
//
// Nodes own their bytes.  Appending a node to an output buffer consumes it so
// large payload sectors are moved, not copied, into the final image.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "fs/Inode.hpp"
#include "fs/Layout.hpp"

#include <span>
#include <variant>
#include <vector>

namespace entfs::fs
{

/// @brief One raw sector of payload data.
/// @invariant Built by splitSectors() it holds exactly kSectorSize bytes.
struct DataSector
{
    std::vector<Byte> bytes;
};

/// @brief Split @p payload into kSectorSize chunks, preserving order.
/// @details The last chunk is zero-padded on its tail.  An empty payload
///          yields no sectors and a payload whose length is a multiple of
///          kSectorSize yields no padding.
[[nodiscard]] std::vector<DataSector> splitSectors(std::span<const Byte> payload);

/// @brief Unit of the node stream: an inode or a data sector.
class Node
{
  public:
    enum class Kind
    {
        Inode,
        Data
    };

    explicit Node(Inode inode) : payload_(std::move(inode)) {}

    explicit Node(DataSector sector) : payload_(std::move(sector)) {}

    [[nodiscard]] Kind kind() const
    {
        return std::holds_alternative<Inode>(payload_) ? Kind::Inode : Kind::Data;
    }

    /// @brief Inode payload, or nullptr for a data node.
    [[nodiscard]] const Inode *inode() const
    {
        return std::get_if<Inode>(&payload_);
    }

    /// @brief Data payload, or nullptr for an inode node.
    [[nodiscard]] const DataSector *data() const
    {
        return std::get_if<DataSector>(&payload_);
    }

    /// @brief Number of bytes appendTo() would emit.
    [[nodiscard]] size_t serializedSize() const;

    /// @brief Append the node's bytes to @p out, consuming the node.
    void appendTo(std::vector<Byte> &out) &&;

  private:
    std::variant<Inode, DataSector> payload_;
};

} // namespace entfs::fs
