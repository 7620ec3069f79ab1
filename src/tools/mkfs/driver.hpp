//===----------------------------------------------------------------------===//
//
// Part of the ENTFS project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Declares the build pipeline behind the `mkfs.entfs` executable.  The pipeline
// is factored out of main so tests can assemble images in memory, inspect the
// bytes, and observe every error without spawning the CLI.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Exposes the reusable image build pipeline.
/// @details assemble() performs every step up to and including the final
///          concatenation; mkfs() adds the single write to the output target
///          and the report.  Nothing is written unless the whole image was
///          assembled first.

#pragma once

#include "fs/Layout.hpp"
#include "support/diag_expected.hpp"
#include "tools/mkfs/config.hpp"

#include <cstddef>
#include <iosfwd>
#include <vector>

namespace entfs::tools::mkfs
{

/// @brief Summary printed after a successful build.
struct MkfsReport
{
    size_t imageSize = 0;  ///< Bytes written.
    size_t inodeCount = 0; ///< Inode nodes in the stream.
    size_t dataCount = 0;  ///< Data sectors in the stream.
};

/// @brief Render @p report in the "[MKFS REPORT]" format.
std::ostream &operator<<(std::ostream &os, const MkfsReport &report);

/// @brief Image bytes plus the counts describing them.
struct AssembledImage
{
    std::vector<fs::Byte> bytes;
    MkfsReport report;
};

/// @brief Run build steps 1-8: load, validate, lay out, and concatenate.
///
/// @param cfg Configuration; raw target buffers are moved into the image.
/// @param trace Optional stream receiving one line per step.
/// @return The assembled image, or the first error encountered.  The
///         bootloader is always checked before the payload is read.
support::Expected<AssembledImage> assemble(Config cfg, std::ostream *trace = nullptr);

/// @brief Build the image and write it to the configured output.
///
/// @param cfg Configuration; consumed by the build.
/// @param trace Optional stream receiving one line per step.
/// @return The report, or the first error encountered.  On error no output
///         file is created, and a partially written file is removed.
support::Expected<MkfsReport> mkfs(Config cfg, std::ostream *trace = nullptr);

} // namespace entfs::tools::mkfs
