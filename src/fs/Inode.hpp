//===----------------------------------------------------------------------===//
//
// Part of the ENTFS project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: fs/Inode.hpp
// Purpose: One-sector record describing an entity: its name and its extents.
// Key invariants: The serialized record is exactly kSectorSize bytes; the name
//                 never exceeds kNameCapacity bytes.
// Ownership/Lifetime: Value type; the node stream owns inodes by value.
// Links: fs/Node.hpp, fs/Extent.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "fs/Extent.hpp"
#include "fs/Layout.hpp"
#include "support/diag_expected.hpp"

#include <array>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace entfs::fs
{

/// @brief Entity record: a fixed name buffer followed by a fixed extent array.
///
/// Serialized layout:
///   0    name, NUL-padded; a name of exactly kNameCapacity bytes has no NUL
///   128  kExtentSlots extents of Extent::kEncodedSize bytes each
///
/// The builder populates slot 0 only.  The remaining slots stay empty; the
/// array leaves room for fragmented storage without changing the format.
class Inode
{
  public:
    static constexpr size_t kNameCapacity = 128;
    static constexpr size_t kExtentSlots = 96;

    /// @brief Width implied by the field layout.
    static constexpr size_t kRecordSize = kNameCapacity + kExtentSlots * Extent::kEncodedSize;

    /// @brief Zeroed record: empty name, every slot the empty extent.
    Inode() = default;

    /// @brief Copy @p name into the name buffer.
    /// @return NameTooLong when @p name exceeds @ref kNameCapacity bytes; the
    ///         previous name is kept in that case.
    support::Expected<void> setName(std::string_view name);

    /// @brief Name stored in the buffer, without NUL padding.
    [[nodiscard]] std::string name() const;

    /// @brief Store @p extent in fragment slot @p index.
    /// @return InvalidExtentSlot when @p index is not below @ref kExtentSlots.
    support::Expected<void> setExtent(size_t index, Extent extent);

    /// @brief Extent stored in slot @p index.
    /// @pre index < kExtentSlots.
    [[nodiscard]] const Extent &extent(size_t index) const
    {
        return dat_[index];
    }

    [[nodiscard]] const std::array<Extent, kExtentSlots> &extents() const
    {
        return dat_;
    }

    /// @brief Encode the record.
    [[nodiscard]] std::vector<Byte> serialize() const;

    /// @brief Decode a record from the first @ref kRecordSize bytes of @p bytes.
    [[nodiscard]] static support::Expected<Inode> parse(std::span<const Byte> bytes);

    /// @brief Verify that a serialized inode of @p actual bytes fills exactly
    ///        one sector.
    /// @return InvalidInode carrying @p actual otherwise.
    [[nodiscard]] static support::Expected<void> checkRecordSize(size_t actual);

    bool operator==(const Inode &) const = default;

  private:
    std::array<char, kNameCapacity> name_{};
    std::array<Extent, kExtentSlots> dat_{};
};

} // namespace entfs::fs
