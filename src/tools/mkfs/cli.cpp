//===----------------------------------------------------------------------===//
//
// Part of the ENTFS project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the user-facing glue of mkfs.entfs: option parsing, help and
// version output, and turning a failed build into a printed diagnostic plus a
// non-zero exit status.  The build itself lives in driver.cpp.
//
//===----------------------------------------------------------------------===//

#include "tools/mkfs/cli.hpp"

#include "entfs/version.h"
#include "tools/mkfs/config.hpp"
#include "tools/mkfs/driver.hpp"

#include <ostream>
#include <string>

namespace entfs::tools::mkfs
{

int runCLI(ArgvView args, std::ostream &out, std::ostream &err)
{
    const std::string prog = args.empty() ? std::string("mkfs.entfs") : std::string(args.at(0));

    auto parsed = parseArgs(args.drop_front());
    if (!parsed)
    {
        support::printDiag(parsed.error(), err);
        printUsage(err, prog);
        return 1;
    }

    CliOptions &opts = parsed.value();
    switch (opts.action)
    {
        case CliAction::Help:
            printUsage(out, prog);
            return 0;
        case CliAction::Version:
            out << "mkfs.entfs v" << ENTFS_VERSION_STRING << "\n";
            out << "ENTFS format: " << ENTFS_FORMAT_VERSION << "\n";
            return 0;
        case CliAction::Build:
            break;
    }

    std::ostream *trace = opts.config.verbose ? &err : nullptr;
    auto report = mkfs(std::move(opts.config), trace);
    if (!report)
    {
        support::printDiag(report.error(), err);
        return 1;
    }
    out << report.value();
    return 0;
}

} // namespace entfs::tools::mkfs
