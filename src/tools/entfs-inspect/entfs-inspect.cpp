//===----------------------------------------------------------------------===//
//
// Part of the ENTFS project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Provides the standalone `entfs-inspect` CLI.  The executable reads an image
// produced by mkfs.entfs, prints its superblock and inode, verifies the
// layout invariants, and prints "OK" when the image is well formed.
//
//===----------------------------------------------------------------------===//

#include "tools/entfs-inspect/driver.hpp"

#include <iostream>

int main(int argc, char **argv)
{
    return entfs::tools::inspect::runCLI(
        entfs::tools::ArgvView{argc, argv}, std::cout, std::cerr);
}
