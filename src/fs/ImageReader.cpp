//===----------------------------------------------------------------------===//
//
// Part of the ENTFS project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the read side of the image format.  parseImage() cuts the buffer
// into its regions using the same fixed offsets the builder writes, and
// verifyImage() cross-checks the records the way a boot loader relies on them:
// the inode's first fragment must describe the data sectors that follow it and
// the superblock's direct-boot pointer must land on that same fragment.
//
//===----------------------------------------------------------------------===//

#include "fs/ImageReader.hpp"

#include "fs/MkfsError.hpp"

#include <string>

namespace entfs::fs
{
namespace
{
std::string describe(const Extent &e)
{
    return "[" + std::to_string(e.start) + ", " + std::to_string(e.end) + "]";
}

support::Diag corrupt(const std::string &detail)
{
    return makeDiag(MkfsError::CorruptImage, {}, {{"detail", detail}});
}
} // namespace

support::Expected<ParsedImage> parseImage(std::span<const Byte> image, size_t bootSize)
{
    constexpr size_t kRecordsSize = Superblock::kRecordSize + kSectorSize;
    if (bootSize > image.size())
    {
        return corrupt("boot size " + std::to_string(bootSize) + " exceeds image of " +
                       std::to_string(image.size()) + " bytes");
    }
    if (image.size() - bootSize < kRecordsSize)
    {
        return corrupt("image is " + std::to_string(image.size()) + " bytes, need at least " +
                       std::to_string(bootSize + kRecordsSize));
    }

    auto sb = Superblock::parse(image.subspan(bootSize, Superblock::kRecordSize));
    if (!sb)
        return sb.error();

    const size_t nodesStart = bootSize + Superblock::kRecordSize;
    auto inode = Inode::parse(image.subspan(nodesStart, kSectorSize));
    if (!inode)
        return inode.error();

    const size_t dataStart = nodesStart + kSectorSize;
    const size_t dataBytes = image.size() - dataStart;
    if (dataBytes % kSectorSize != 0)
    {
        return corrupt("node stream ends " + std::to_string(dataBytes % kSectorSize) +
                       " bytes past a sector boundary");
    }

    ParsedImage parsed{std::vector<Byte>(image.begin(), image.begin() + bootSize),
                       sb.value(),
                       inode.value(),
                       {}};
    parsed.dataSectors.reserve(dataBytes / kSectorSize);
    for (size_t offset = dataStart; offset < image.size(); offset += kSectorSize)
    {
        auto sector = image.subspan(offset, kSectorSize);
        parsed.dataSectors.push_back(DataSector{std::vector<Byte>(sector.begin(), sector.end())});
    }
    return support::Expected<ParsedImage>(std::move(parsed));
}

bool verifyImage(const ParsedImage &image, support::DiagnosticEngine &diags)
{
    const size_t before = diags.errorCount();
    const Extent &fragment = image.inode.extent(0);
    const size_t dataCount = image.dataSectors.size();

    if (image.inode.name().empty())
        diags.report(corrupt("inode has no name"));

    if (fragment.isEmpty())
    {
        if (dataCount != 0)
        {
            diags.report(corrupt("inode has no extent but " + std::to_string(dataCount) +
                                 " data sectors follow it"));
        }
    }
    else
    {
        if (fragment.start > fragment.end)
            diags.report(corrupt("extent " + describe(fragment) + " is reversed"));
        else if (fragment.start != kNodesOffset)
        {
            diags.report(corrupt("extent " + describe(fragment) + " does not start at sector " +
                                 std::to_string(kNodesOffset)));
        }
        else if (fragment.sectorCount() != dataCount)
        {
            diags.report(corrupt("extent " + describe(fragment) + " covers " +
                                 std::to_string(fragment.sectorCount()) + " sectors but " +
                                 std::to_string(dataCount) + " follow the inode"));
        }
    }

    for (size_t slot = 1; slot < Inode::kExtentSlots; ++slot)
    {
        if (!image.inode.extent(slot).isEmpty())
        {
            diags.report(corrupt("extent slot " + std::to_string(slot) + " is populated"));
        }
    }

    const auto &directboot = image.superblock.directboot();
    if (directboot && directboot->isEmpty())
        diags.report(corrupt("directboot is set but points at no sectors"));
    else if (directboot && !(*directboot == fragment))
    {
        diags.report(corrupt("directboot " + describe(*directboot) +
                             " does not match the inode extent " + describe(fragment)));
    }

    return diags.errorCount() == before;
}

} // namespace entfs::fs
