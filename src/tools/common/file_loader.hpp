//===----------------------------------------------------------------------===//
//
// Part of the ENTFS project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tools/common/file_loader.hpp
// Purpose: Shared helpers for reading and writing whole host files.
// Key invariants: A loaded buffer contains the complete file contents; a failed
//                 write leaves no partial file behind.
// Ownership/Lifetime: The caller owns the returned buffers.
// Links: tools/mkfs/driver.cpp, tools/entfs-inspect/driver.cpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "fs/Layout.hpp"
#include "support/diag_expected.hpp"

#include <string>
#include <vector>

namespace entfs::tools::common
{

/// @brief Load a host file into memory.
///
/// @param path Filesystem path of a regular file.
/// @return File contents; FileNotFound when @p path is missing, is a
///         directory, or cannot be read.
support::Expected<std::vector<fs::Byte>> loadHostFile(const std::string &path);

/// @brief Replace the contents of @p path with @p bytes.
///
/// @return Success, or WriteFailed when the file cannot be opened or the write
///         comes up short; the partial file is removed in that case.
support::Expected<void> storeHostFile(const std::string &path, const std::vector<fs::Byte> &bytes);

} // namespace entfs::tools::common
