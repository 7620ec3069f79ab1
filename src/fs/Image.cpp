//===----------------------------------------------------------------------===//
//
// Part of the ENTFS project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: fs/Image.cpp
// Purpose: Order-preserving image concatenation.
// Key invariants: build() either fails before writing anything or returns
//                 exactly byteSize() bytes.
// Ownership/Lifetime: The boot buffer becomes the head of the output; data
//                     sectors are moved out of their nodes.
// Links: fs/Image.hpp
//
//===----------------------------------------------------------------------===//

#include "fs/Image.hpp"

#include "fs/MkfsError.hpp"

#include <algorithm>
#include <string>
#include <utility>

namespace entfs::fs
{

Image::Image(Superblock superblock, std::vector<Byte> boot)
    : superblock_(std::move(superblock)), boot_(std::move(boot))
{
}

void Image::push(Node node)
{
    nodes_.push_back(std::move(node));
}

size_t Image::inodeCount() const
{
    return static_cast<size_t>(std::count_if(
        nodes_.begin(), nodes_.end(), [](const Node &n) { return n.kind() == Node::Kind::Inode; }));
}

size_t Image::dataCount() const
{
    return nodes_.size() - inodeCount();
}

size_t Image::byteSize() const
{
    return boot_.size() + Superblock::kRecordSize + nodes_.size() * kSectorSize;
}

support::Expected<std::vector<Byte>> Image::build() &&
{
    for (size_t i = 0; i < nodes_.size(); ++i)
    {
        const size_t size = nodes_[i].serializedSize();
        if (size == kSectorSize)
            continue;
        if (nodes_[i].kind() == Node::Kind::Inode)
        {
            return makeDiag(MkfsError::InvalidInode,
                            {},
                            {{"size", std::to_string(size)},
                             {"expected", std::to_string(kSectorSize)}});
        }
        return makeDiag(MkfsError::InvalidNode,
                        {},
                        {{"index", std::to_string(i)},
                         {"size", std::to_string(size)},
                         {"expected", std::to_string(kSectorSize)}});
    }

    const size_t total = byteSize();
    std::vector<Byte> out = std::move(boot_);
    boot_ = {};
    out.reserve(total);

    const std::vector<Byte> sb = superblock_.serialize();
    out.insert(out.end(), sb.begin(), sb.end());

    for (Node &node : nodes_)
        std::move(node).appendTo(out);
    nodes_.clear();

    return support::Expected<std::vector<Byte>>(std::move(out));
}

} // namespace entfs::fs
