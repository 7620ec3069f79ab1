//===----------------------------------------------------------------------===//
//
// Part of the ENTFS project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tools/mkfs/config.hpp
// Purpose: Configuration record for mkfs.entfs and its command-line parser.
// Key invariants: A default-constructed Config reproduces the stock build
//                 layout (build/boot.bin + build/kernel.bin -> build/image.bin).
// Ownership/Lifetime: Config owns its targets, including raw byte buffers.
// Links: tools/mkfs/driver.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "fs/Layout.hpp"
#include "support/diag_expected.hpp"
#include "tools/common/ArgvView.hpp"

#include <cstdint>
#include <ostream>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace entfs::tools::mkfs
{

/** @name Defaults
 *  @{
 */
inline constexpr std::string_view kDefaultBootloader = "build/boot.bin";
inline constexpr std::string_view kDefaultOutput = "build/image.bin";
inline constexpr std::string_view kDefaultSource = "build/kernel.bin";
inline constexpr bool kDefaultDirectboot = true;
inline constexpr std::string_view kDefaultDirectbootTarget = "kernel.bin";
/** @} */

/// @brief Host file named by path.
struct FileTarget
{
    std::string path;
};

/// @brief Bytes supplied in memory.
struct RawTarget
{
    std::vector<fs::Byte> bytes;
};

struct Target;

/// @brief Set of sub-targets for directory-style input.
/// @note Accepted by the configuration shape only; the driver rejects it.
struct DirTarget
{
    std::vector<Target> entries;
};

/// @brief Source or destination of a build role.
struct Target
{
    std::variant<FileTarget, RawTarget, DirTarget> kind;

    static Target file(std::string path)
    {
        return Target{FileTarget{std::move(path)}};
    }

    static Target raw(std::vector<fs::Byte> bytes)
    {
        return Target{RawTarget{std::move(bytes)}};
    }

    static Target dir(std::vector<Target> entries)
    {
        return Target{DirTarget{std::move(entries)}};
    }
};

/// @brief Everything mkfs needs to produce one image.
struct Config
{
    Target bootloader = Target::file(std::string(kDefaultBootloader));
    Target output = Target::file(std::string(kDefaultOutput));
    Target source = Target::file(std::string(kDefaultSource));

    /// @brief Record the payload's extent as the superblock's direct-boot pointer
    ///        when its name matches @ref directbootTarget.
    bool directboot = kDefaultDirectboot;

    /// @brief Block size recorded in the superblock.
    uint16_t blockSize = fs::kDefaultBlockSize;

    std::string directbootTarget = std::string(kDefaultDirectbootTarget);

    /// @brief Print each build step to the trace stream.
    bool verbose = false;
};

/// @brief What the command line asked for.
enum class CliAction
{
    Build,
    Help,
    Version
};

struct CliOptions
{
    CliAction action = CliAction::Build;
    Config config;
};

/// @brief Parse mkfs options from @p args (program name already dropped).
/// @return Parsed options, or a BadConfig diagnostic for a missing option
///         value, an unusable block size, or an unknown option.
support::Expected<CliOptions> parseArgs(ArgvView args);

/// @brief Print usage text for @p prog.
void printUsage(std::ostream &os, std::string_view prog);

} // namespace entfs::tools::mkfs
