//===----------------------------------------------------------------------===//
//
// Part of the ENTFS project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: fs/MkfsError.hpp
// Purpose: Descriptor table for every error the image tools can report.
// Key invariants: Enum values and codes are stable; do not reorder.
// Ownership/Lifetime: All returned string_views point to static storage.
// Links: support/diag_expected.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/diag_expected.hpp"

#include <initializer_list>
#include <string>
#include <string_view>

namespace entfs::fs
{

/// @brief Enumeration of all image construction and parsing errors.
/// @details Each enumerator maps to a stable error code and a message format
///          string with `{key}` placeholders.
enum class MkfsError
{
    BadConfig,         ///< Target of an unsupported kind for its role.
    FileNotFound,      ///< Configured path could not be opened for reading.
    EmptyBootloader,   ///< Boot code has zero length.
    InvalidInode,      ///< Inode record is not exactly one sector.
    NameTooLong,       ///< Entity name exceeds the inode name field.
    PayloadTooLarge,   ///< Payload sectors do not fit the 16-bit address space.
    WriteFailed,       ///< Output image could not be written.
    InvalidExtentSlot, ///< Extent slot index outside the inode's array.
    InvalidNode,       ///< Data node is not exactly one sector.
    CorruptImage       ///< Image bytes do not follow the ENTFS layout.
};

/// @brief A key/value pair used for placeholder substitution in messages.
struct Replacement
{
    std::string_view key;   ///< Placeholder name (without braces).
    std::string_view value; ///< Replacement text to substitute.
};

/// @brief Static metadata record for a single error kind.
struct MkfsErrorInfo
{
    std::string_view id;     ///< Enumerator name, e.g. "FileNotFound".
    std::string_view code;   ///< Stable code carried in Diagnostic::code.
    std::string_view format; ///< Message format string with placeholders.
};

/// @brief Retrieve the full metadata record for @p error.
[[nodiscard]] const MkfsErrorInfo &getInfo(MkfsError error);

/// @brief Retrieve the stable code string for @p error.
[[nodiscard]] std::string_view getCode(MkfsError error);

/// @brief Format the message of @p error with placeholder substitution.
/// @param error The error kind.
/// @param replacements Key/value pairs substituted into the format string.
/// @return The formatted message; unknown placeholders are left untouched.
[[nodiscard]] std::string formatMessage(MkfsError error,
                                        std::initializer_list<Replacement> replacements = {});

/// @brief Build an error diagnostic for @p error concerning @p path.
[[nodiscard]] support::Diag makeDiag(MkfsError error,
                                     std::string path = {},
                                     std::initializer_list<Replacement> replacements = {});

/// @brief Check whether @p diag was produced for @p error.
[[nodiscard]] bool isError(const support::Diag &diag, MkfsError error);

} // namespace entfs::fs
