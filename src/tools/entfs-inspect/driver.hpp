//===----------------------------------------------------------------------===//
//
// Part of the ENTFS project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Declares the helper routines powering the `entfs-inspect` CLI.  The pipeline
// is factored into its own unit so tests can check images produced in memory
// and observe the tool's output without spawning the executable.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "fs/Layout.hpp"
#include "tools/common/ArgvView.hpp"

#include <cstddef>
#include <iosfwd>
#include <span>
#include <string_view>

namespace entfs::tools::inspect
{

/// @brief Parse, verify, and describe an in-memory image.
///
/// @param image Full image bytes.
/// @param bootSize Length of the boot code region.
/// @param out Stream receiving the description and the final "OK".
/// @param err Stream receiving every diagnostic found.
/// @return True when the image parses and passes every check.
bool inspectImage(std::span<const fs::Byte> image,
                  size_t bootSize,
                  std::ostream &out,
                  std::ostream &err);

/// @brief Load @p path from the host and run inspectImage() on it.
bool inspectFile(std::string_view path, size_t bootSize, std::ostream &out, std::ostream &err);

/// @brief Execute the entfs-inspect CLI workflow with injectable streams.
/// @param args Full argument vector including the program name.
/// @return Zero when the image is well formed; one otherwise.
int runCLI(ArgvView args, std::ostream &out, std::ostream &err);

} // namespace entfs::tools::inspect
