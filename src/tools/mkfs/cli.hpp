// File: src/tools/mkfs/cli.hpp
// Purpose: Command-line front end of mkfs.entfs with injectable streams.
// Key invariants: Returns 0 only when an image was written or help/version
//                 was requested.
// Ownership/Lifetime: Borrows argv and the streams for the call only.
// Links: src/tools/mkfs/driver.hpp

#pragma once

#include "tools/common/ArgvView.hpp"

#include <iosfwd>

namespace entfs::tools::mkfs
{

/// @brief Execute the mkfs.entfs workflow.
/// @param args Full argument vector including the program name.
/// @param out Stream receiving the report, help text, and version banner.
/// @param err Stream receiving diagnostics and the verbose trace.
/// @return Zero on success; one on any configuration or build error.
int runCLI(ArgvView args, std::ostream &out, std::ostream &err);

} // namespace entfs::tools::mkfs
