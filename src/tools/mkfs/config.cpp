//===----------------------------------------------------------------------===//
//
// Part of the ENTFS project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements option parsing for mkfs.entfs.  Options override the defaults of
// Config one by one in command-line order, so a later `--no-directboot` wins
// over an earlier `--directboot`.  Every malformed command line is reported as
// a BadConfig diagnostic; nothing here touches the host filesystem.
//
//===----------------------------------------------------------------------===//

#include "tools/mkfs/config.hpp"

#include "fs/MkfsError.hpp"

#include <charconv>
#include <limits>
#include <system_error>

namespace entfs::tools::mkfs
{
namespace
{
support::Diag badConfig(const std::string &detail)
{
    return fs::makeDiag(fs::MkfsError::BadConfig, {}, {{"detail", detail}});
}

support::Diag missingValue(std::string_view option)
{
    return badConfig(std::string(option) + " requires an argument");
}

support::Expected<uint16_t> parseBlockSize(std::string_view text)
{
    unsigned long value = 0;
    const char *first = text.data();
    const char *last = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(first, last, value);
    if (text.empty() || ec != std::errc{} || ptr != last)
    {
        return badConfig("block size '" + std::string(text) + "' is not a number");
    }
    if (value > std::numeric_limits<uint16_t>::max())
    {
        return badConfig("block size " + std::string(text) + " is outside 0..65535");
    }
    return static_cast<uint16_t>(value);
}
} // namespace

support::Expected<CliOptions> parseArgs(ArgvView args)
{
    CliOptions opts;
    Config &cfg = opts.config;
    ArgvCursor cursor(args);

    while (!cursor.done())
    {
        const std::string_view arg = cursor.next();

        if (arg == "-h" || arg == "--help")
        {
            opts.action = CliAction::Help;
            return opts;
        }
        if (arg == "--version")
        {
            opts.action = CliAction::Version;
            return opts;
        }
        if (arg == "--directboot")
        {
            cfg.directboot = true;
            continue;
        }
        if (arg == "--no-directboot")
        {
            cfg.directboot = false;
            continue;
        }
        if (arg == "-v" || arg == "--verbose")
        {
            cfg.verbose = true;
            continue;
        }

        if (arg == "-b" || arg == "--bootloader" || arg == "-o" || arg == "--output" ||
            arg == "-s" || arg == "--source" || arg == "--block_size" || arg == "--block-size" ||
            arg == "--directboot-target")
        {
            auto value = cursor.value();
            if (!value)
                return missingValue(arg);

            if (arg == "-b" || arg == "--bootloader")
                cfg.bootloader = Target::file(std::string(*value));
            else if (arg == "-o" || arg == "--output")
                cfg.output = Target::file(std::string(*value));
            else if (arg == "-s" || arg == "--source")
                cfg.source = Target::file(std::string(*value));
            else if (arg == "--directboot-target")
                cfg.directbootTarget = std::string(*value);
            else
            {
                auto blockSize = parseBlockSize(*value);
                if (!blockSize)
                    return blockSize.error();
                cfg.blockSize = blockSize.value();
            }
            continue;
        }

        return badConfig("unknown option '" + std::string(arg) + "'");
    }
    return opts;
}

void printUsage(std::ostream &os, std::string_view prog)
{
    os << "Usage: " << prog << " [options]\n"
       << "\n"
       << "Builds a bootable ENTFS image: boot code, superblock, one inode, and the\n"
       << "payload's data sectors.\n"
       << "\n"
       << "Options:\n"
       << "  -b, --bootloader FILE          Boot code (default " << kDefaultBootloader << ")\n"
       << "  -s, --source FILE              Payload (default " << kDefaultSource << ")\n"
       << "  -o, --output FILE              Image to write (default " << kDefaultOutput << ")\n"
       << "  --directboot                   Mark the payload for direct boot (default)\n"
       << "  --no-directboot                Never mark a direct-boot extent\n"
       << "  --directboot-target NAME       Payload name eligible for direct boot (default "
       << kDefaultDirectbootTarget << ")\n"
       << "  --block_size N                 Block size recorded in the superblock (default "
       << fs::kDefaultBlockSize << ")\n"
       << "  -v, --verbose                  Trace build steps to stderr\n"
       << "  -h, --help                     Show this help message\n"
       << "  --version                      Show version information\n";
}

} // namespace entfs::tools::mkfs
