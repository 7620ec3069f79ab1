//===----------------------------------------------------------------------===//
//
// Part of the ENTFS project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Provides the `mkfs.entfs` executable.  It reads a boot loader and a single
// payload file from the host, lays them out as an ENTFS image, writes the
// image, and prints a short report.  All state is local to one invocation.
//
//===----------------------------------------------------------------------===//

#include "tools/mkfs/cli.hpp"

#include <iostream>

/// @brief Entry point for the `mkfs.entfs` binary.
///
/// @return Zero on success or when printing help/version; one when the
///         configuration is rejected or the build fails.
int main(int argc, char **argv)
{
    return entfs::tools::mkfs::runCLI(entfs::tools::ArgvView{argc, argv}, std::cout, std::cerr);
}
