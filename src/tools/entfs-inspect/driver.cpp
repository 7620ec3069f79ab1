//===----------------------------------------------------------------------===//
//
// Part of the ENTFS project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements entfs-inspect: read an image back at the fixed offsets mkfs.entfs
// writes, print what each region holds, and report every structural
// inconsistency found before giving a verdict.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Image inspection pipeline shared by the CLI and the tests.
/// @details Parsing failures stop the run immediately because later regions
///          cannot be located; cross-record checks are collected in a
///          DiagnosticEngine so one run lists every problem.

#include "tools/entfs-inspect/driver.hpp"

#include "entfs/version.h"
#include "fs/ImageReader.hpp"
#include "fs/MkfsError.hpp"
#include "support/diagnostics.hpp"
#include "tools/common/file_loader.hpp"

#include <charconv>
#include <system_error>
#include <ostream>
#include <string>

namespace entfs::tools::inspect
{
namespace
{
void printExtent(std::ostream &os, const fs::Extent &e)
{
    if (e.isEmpty())
    {
        os << "none";
        return;
    }
    os << '[' << e.start << ", " << e.end << "] (" << e.sectorCount() << " sectors)";
}

void printUsage(std::ostream &os)
{
    os << "Usage: entfs-inspect [--boot-size N] <image>\n"
       << "\n"
       << "Options:\n"
       << "  --boot-size N                  Bytes of boot code before the superblock (default "
       << fs::kSectorSize << ")\n"
       << "  -h, --help                     Show this help message\n"
       << "  --version                      Show version information\n";
}
} // namespace

bool inspectImage(std::span<const fs::Byte> image,
                  size_t bootSize,
                  std::ostream &out,
                  std::ostream &err)
{
    auto parsed = fs::parseImage(image, bootSize);
    if (!parsed)
    {
        support::printDiag(parsed.error(), err);
        return false;
    }

    const fs::ParsedImage &img = parsed.value();
    out << "image: " << image.size() << " bytes\n";
    out << "boot: " << img.boot.size() << " bytes\n";
    out << "superblock: version " << img.superblock.version() << ", block size "
        << img.superblock.blockSize() << ", directboot ";
    if (img.superblock.directboot())
        printExtent(out, *img.superblock.directboot());
    else
        out << "absent";
    out << "\n";
    out << "inode: '" << img.inode.name() << "', extent ";
    printExtent(out, img.inode.extent(0));
    out << "\n";
    out << "data sectors: " << img.dataSectors.size() << "\n";

    support::DiagnosticEngine diags;
    if (!fs::verifyImage(img, diags))
    {
        diags.printAll(err);
        return false;
    }
    out << "OK\n";
    return true;
}

bool inspectFile(std::string_view path, size_t bootSize, std::ostream &out, std::ostream &err)
{
    auto bytes = common::loadHostFile(std::string(path));
    if (!bytes)
    {
        support::printDiag(bytes.error(), err);
        return false;
    }
    return inspectImage(bytes.value(), bootSize, out, err);
}

int runCLI(ArgvView args, std::ostream &out, std::ostream &err)
{
    size_t bootSize = fs::kSectorSize;
    std::string_view path;
    ArgvCursor cursor(args.drop_front());

    while (!cursor.done())
    {
        const std::string_view arg = cursor.next();
        if (arg == "-h" || arg == "--help")
        {
            printUsage(out);
            return 0;
        }
        if (arg == "--version")
        {
            out << "entfs-inspect v" << ENTFS_VERSION_STRING << "\n";
            return 0;
        }
        if (arg == "--boot-size")
        {
            auto value = cursor.value();
            size_t parsedSize = 0;
            if (value)
            {
                auto [ptr, ec] =
                    std::from_chars(value->data(), value->data() + value->size(), parsedSize);
                if (ec == std::errc{} && ptr == value->data() + value->size() && !value->empty())
                {
                    bootSize = parsedSize;
                    continue;
                }
            }
            support::printDiag(
                fs::makeDiag(fs::MkfsError::BadConfig,
                             {},
                             {{"detail", "--boot-size requires a byte count"}}),
                err);
            return 1;
        }
        if (!path.empty() || (arg.size() > 1 && arg.front() == '-'))
        {
            printUsage(err);
            return 1;
        }
        path = arg;
    }

    if (path.empty())
    {
        printUsage(err);
        return 1;
    }
    return inspectFile(path, bootSize, out, err) ? 0 : 1;
}

} // namespace entfs::tools::inspect
