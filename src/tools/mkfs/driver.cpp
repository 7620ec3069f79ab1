//===----------------------------------------------------------------------===//
//
// Part of the ENTFS project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the mkfs.entfs build pipeline.  The steps run strictly in order
// and every failure is terminal:
//
//   1. load the boot code and reject an empty one
//   2. check that an inode record fills exactly one sector
//   3. load the payload (a single host file)
//   4. compute the payload extent starting at the first node sector
//   5. name the inode after the payload, store the extent in slot 0, and
//      point the superblock's direct-boot field at it when enabled and the
//      payload occupies at least one sector
//   6. cut the payload into zero-padded sectors
//   7. queue the inode followed by its sectors
//   8. concatenate boot code, superblock, and nodes
//   9. write the image in one go
//  10. report sizes
//
//===----------------------------------------------------------------------===//

#include "tools/mkfs/driver.hpp"

#include "fs/Extent.hpp"
#include "fs/Image.hpp"
#include "fs/Inode.hpp"
#include "fs/MkfsError.hpp"
#include "fs/Node.hpp"
#include "fs/Superblock.hpp"
#include "support/path_utils.hpp"
#include "tools/common/file_loader.hpp"

#include <ostream>
#include <string>
#include <utility>

namespace entfs::tools::mkfs
{
namespace
{
using fs::Byte;
using fs::MkfsError;

support::Diag badConfig(const std::string &detail)
{
    return fs::makeDiag(MkfsError::BadConfig, {}, {{"detail", detail}});
}

/// @brief Attach @p path to a diagnostic raised below the driver.
support::Diag withPath(support::Diag diag, const std::string &path)
{
    diag.path = path;
    return diag;
}

/// @brief Step 1: boot code may come from a file or from memory.
support::Expected<std::vector<Byte>> loadBootloader(Target target)
{
    if (auto *file = std::get_if<FileTarget>(&target.kind))
        return common::loadHostFile(file->path);
    if (auto *raw = std::get_if<RawTarget>(&target.kind))
        return support::Expected<std::vector<Byte>>(std::move(raw->bytes));
    return badConfig("bootloader must be a file or raw bytes");
}

std::string describeBootloader(const Target &target)
{
    if (auto *file = std::get_if<FileTarget>(&target.kind))
        return file->path;
    return {};
}
} // namespace

std::ostream &operator<<(std::ostream &os, const MkfsReport &report)
{
    os << "[MKFS REPORT]\n"
       << "Size: " << report.imageSize << " Bytes\n"
       << "Inode count: " << report.inodeCount << "\n"
       << "Datanode count: " << report.dataCount << "\n";
    return os;
}

support::Expected<AssembledImage> assemble(Config cfg, std::ostream *trace)
{
    const std::string bootName = describeBootloader(cfg.bootloader);
    auto boot = loadBootloader(std::move(cfg.bootloader));
    if (!boot)
        return boot.error();
    if (boot.value().empty())
        return fs::makeDiag(MkfsError::EmptyBootloader, bootName);
    if (trace)
        *trace << "bootloader: " << boot.value().size() << " bytes\n";

    auto record = fs::Inode::checkRecordSize(fs::Inode{}.serialize().size());
    if (!record)
        return record.error();

    const auto *source = std::get_if<FileTarget>(&cfg.source.kind);
    if (!source)
        return badConfig("source must be a single file");
    const std::string sourcePath = source->path;
    auto payload = common::loadHostFile(sourcePath);
    if (!payload)
        return payload.error();

    auto extent = fs::Extent::forPayload(fs::kNodesOffset, payload.value().size());
    if (!extent)
        return withPath(extent.error(), sourcePath);
    if (trace)
    {
        *trace << "payload: " << sourcePath << ", " << payload.value().size() << " bytes in sectors ["
               << extent.value().start << ", " << extent.value().end << "]\n";
    }

    fs::Superblock superblock(fs::kVersion, cfg.blockSize);
    const std::string name = support::basename(sourcePath);
    fs::Inode inode;
    if (auto named = inode.setName(name); !named)
        return withPath(named.error(), sourcePath);
    if (auto slot = inode.setExtent(0, extent.value()); !slot)
        return slot.error();
    if (cfg.directboot && name == cfg.directbootTarget && !extent.value().isEmpty())
    {
        superblock.setDirectboot(extent.value());
        if (trace)
            *trace << "directboot: " << name << "\n";
    }

    std::vector<fs::DataSector> sectors = fs::splitSectors(payload.value());
    payload.value().clear();
    payload.value().shrink_to_fit();

    fs::Image image(std::move(superblock), std::move(boot.value()));
    image.push(fs::Node(std::move(inode)));
    for (fs::DataSector &sector : sectors)
        image.push(fs::Node(std::move(sector)));
    sectors.clear();

    MkfsReport report{image.byteSize(), image.inodeCount(), image.dataCount()};
    if (trace)
        *trace << "nodes: " << image.nodeCount() << " (" << report.dataCount << " data)\n";

    auto bytes = std::move(image).build();
    if (!bytes)
        return bytes.error();
    report.imageSize = bytes.value().size();

    return support::Expected<AssembledImage>(AssembledImage{std::move(bytes.value()), report});
}

support::Expected<MkfsReport> mkfs(Config cfg, std::ostream *trace)
{
    const auto *output = std::get_if<FileTarget>(&cfg.output.kind);
    if (!output)
        return badConfig("output must be a file");
    const std::string outputPath = output->path;

    auto built = assemble(std::move(cfg), trace);
    if (!built)
        return built.error();

    if (auto written = common::storeHostFile(outputPath, built.value().bytes); !written)
        return written.error();
    if (trace)
        *trace << "wrote " << outputPath << "\n";

    return built.value().report;
}

} // namespace entfs::tools::mkfs
