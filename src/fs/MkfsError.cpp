//===----------------------------------------------------------------------===//
//
// Part of the ENTFS project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: fs/MkfsError.cpp
// Purpose: Error descriptor table and message formatting.
// Key invariants: The table is indexed by MkfsError and has one row per
//                 enumerator.
// Ownership/Lifetime: Static storage only.
// Links: fs/MkfsError.hpp
//
//===----------------------------------------------------------------------===//

#include "fs/MkfsError.hpp"

#include <array>
#include <cstddef>

namespace entfs::fs
{
namespace
{
constexpr std::array<MkfsErrorInfo, 10> kInfos{{
    {"BadConfig", "E001", "bad configuration: {detail}"},
    {"FileNotFound", "E002", "file not found"},
    {"EmptyBootloader", "E003", "bootloader is empty"},
    {"InvalidInode", "E004", "inode record is {size} bytes, expected {expected}"},
    {"NameTooLong", "E005", "name '{name}' is {length} bytes, limit is {limit}"},
    {"PayloadTooLarge", "E006", "payload needs {sectors} sectors, at most {limit} are addressable"},
    {"WriteFailed", "E007", "cannot write image: {detail}"},
    {"InvalidExtentSlot", "E008", "extent slot {index} out of range, inode has {slots}"},
    {"InvalidNode", "E009", "node {index} is {size} bytes, expected {expected}"},
    {"CorruptImage", "E010", "corrupt image: {detail}"},
}};
} // namespace

const MkfsErrorInfo &getInfo(MkfsError error)
{
    return kInfos[static_cast<size_t>(error)];
}

std::string_view getCode(MkfsError error)
{
    return getInfo(error).code;
}

std::string formatMessage(MkfsError error, std::initializer_list<Replacement> replacements)
{
    std::string text(getInfo(error).format);
    for (const auto &r : replacements)
    {
        std::string placeholder = "{" + std::string(r.key) + "}";
        size_t pos = 0;
        while ((pos = text.find(placeholder, pos)) != std::string::npos)
        {
            text.replace(pos, placeholder.size(), r.value);
            pos += r.value.size();
        }
    }
    return text;
}

support::Diag makeDiag(MkfsError error,
                       std::string path,
                       std::initializer_list<Replacement> replacements)
{
    return support::makeError(
        std::move(path), formatMessage(error, replacements), std::string(getCode(error)));
}

bool isError(const support::Diag &diag, MkfsError error)
{
    return diag.code == getCode(error);
}

} // namespace entfs::fs
