//===----------------------------------------------------------------------===//
//
// Part of the ENTFS project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tests/tools/MkfsDriverTests.cpp
// Purpose: Run the mkfs build pipeline against real files in a scratch
//          directory and check the resulting images and failures.
// Key invariants: A successful build writes boot + 512 + 512 * (1 + n) bytes;
//                 a failed build leaves no output behind.
// Ownership/Lifetime: Each test owns a unique temporary directory and removes
//                     it on teardown.
// Links: src/tools/mkfs/driver.hpp, src/fs/ImageReader.hpp
//
//===----------------------------------------------------------------------===//

#include <gtest/gtest.h>

#include "fs/ImageReader.hpp"
#include "fs/MkfsError.hpp"
#include "tools/common/file_loader.hpp"
#include "tools/mkfs/driver.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

using namespace entfs;
using namespace entfs::tools::mkfs;
using fs::Byte;

namespace
{
class MkfsDriverTest : public ::testing::Test
{
  protected:
    void SetUp() override
    {
        const auto *info = ::testing::UnitTest::GetInstance()->current_test_info();
        dir_ = std::filesystem::temp_directory_path() /
               (std::string("entfs-mkfs-") + info->name());
        std::filesystem::remove_all(dir_);
        std::filesystem::create_directories(dir_);
    }

    void TearDown() override
    {
        std::error_code ec;
        std::filesystem::remove_all(dir_, ec);
    }

    std::string path(const std::string &name) const
    {
        return (dir_ / name).string();
    }

    std::string writeFile(const std::string &name, const std::vector<Byte> &bytes) const
    {
        const std::string p = path(name);
        std::ofstream out(p, std::ios::binary);
        out.write(reinterpret_cast<const char *>(bytes.data()),
                  static_cast<std::streamsize>(bytes.size()));
        return p;
    }

    Config makeConfig(const std::string &boot, const std::string &source) const
    {
        Config cfg;
        cfg.bootloader = Target::file(boot);
        cfg.source = Target::file(source);
        cfg.output = Target::file(path("image.bin"));
        return cfg;
    }

    std::vector<Byte> readOutput() const
    {
        auto bytes = tools::common::loadHostFile(path("image.bin"));
        EXPECT_TRUE(bytes);
        if (!bytes)
            return {};
        return std::move(bytes.value());
    }

    std::filesystem::path dir_;
};

std::vector<Byte> pattern(size_t size)
{
    std::vector<Byte> bytes(size);
    for (size_t i = 0; i < size; ++i)
        bytes[i] = static_cast<Byte>(i * 7 + 1);
    return bytes;
}
} // namespace

TEST_F(MkfsDriverTest, BuildsBootableImage)
{
    const auto boot = writeFile("boot.bin", std::vector<Byte>(512, 0xEB));
    const auto payload = pattern(1000);
    const auto source = writeFile("kernel.bin", payload);

    auto report = mkfs(makeConfig(boot, source));
    ASSERT_TRUE(report) << report.error().message;
    EXPECT_EQ(report.value().imageSize, 512u + 512u + 512u * 3);
    EXPECT_EQ(report.value().inodeCount, 1u);
    EXPECT_EQ(report.value().dataCount, 2u);

    const auto image = readOutput();
    ASSERT_EQ(image.size(), report.value().imageSize);
    EXPECT_EQ(image[0], 0xEB);
    EXPECT_EQ(image[511], 0xEB);

    auto parsed = fs::parseImage(image);
    ASSERT_TRUE(parsed);
    const fs::ParsedImage &img = parsed.value();
    EXPECT_EQ(img.inode.name(), "kernel.bin");
    EXPECT_EQ(img.inode.extent(0), (fs::Extent{2, 3}));
    ASSERT_TRUE(img.superblock.directboot().has_value());
    EXPECT_EQ(*img.superblock.directboot(), (fs::Extent{2, 3}));
    EXPECT_EQ(img.superblock.version(), fs::kVersion);
    EXPECT_EQ(img.superblock.blockSize(), fs::kDefaultBlockSize);

    std::vector<Byte> data;
    for (const auto &sector : img.dataSectors)
        data.insert(data.end(), sector.bytes.begin(), sector.bytes.end());
    ASSERT_EQ(data.size(), 1024u);
    EXPECT_TRUE(std::equal(payload.begin(), payload.end(), data.begin()));
    EXPECT_TRUE(std::all_of(data.begin() + 1000, data.end(), [](Byte b) { return b == 0; }));

    support::DiagnosticEngine diags;
    EXPECT_TRUE(fs::verifyImage(img, diags));
}

TEST_F(MkfsDriverTest, BootCodeSizeIsPreserved)
{
    const auto boot = writeFile("boot.bin", std::vector<Byte>(446, 0x90));
    const auto source = writeFile("kernel.bin", pattern(512));

    auto report = mkfs(makeConfig(boot, source));
    ASSERT_TRUE(report);
    EXPECT_EQ(report.value().imageSize, 446u + 512u + 512u * 2);
    EXPECT_EQ(readOutput().size(), report.value().imageSize);
}

TEST_F(MkfsDriverTest, DirectbootCanBeDisabled)
{
    const auto boot = writeFile("boot.bin", std::vector<Byte>(512, 1));
    const auto source = writeFile("kernel.bin", pattern(600));
    Config cfg = makeConfig(boot, source);
    cfg.directboot = false;

    ASSERT_TRUE(mkfs(std::move(cfg)));
    const auto image = readOutput();
    EXPECT_EQ(image[512 + 8], 0);
    auto parsed = fs::parseImage(image);
    ASSERT_TRUE(parsed);
    EXPECT_FALSE(parsed.value().superblock.directboot().has_value());
}

TEST_F(MkfsDriverTest, DirectbootRequiresMatchingName)
{
    const auto boot = writeFile("boot.bin", std::vector<Byte>(512, 1));
    const auto source = writeFile("shell.elf", pattern(600));

    ASSERT_TRUE(mkfs(makeConfig(boot, source)));
    auto parsed = fs::parseImage(readOutput());
    ASSERT_TRUE(parsed);
    EXPECT_EQ(parsed.value().inode.name(), "shell.elf");
    EXPECT_FALSE(parsed.value().superblock.directboot().has_value());
}

TEST_F(MkfsDriverTest, DirectbootTargetIsConfigurable)
{
    const auto boot = writeFile("boot.bin", std::vector<Byte>(512, 1));
    const auto source = writeFile("shell.elf", pattern(600));
    Config cfg = makeConfig(boot, source);
    cfg.directbootTarget = "shell.elf";

    ASSERT_TRUE(mkfs(std::move(cfg)));
    auto parsed = fs::parseImage(readOutput());
    ASSERT_TRUE(parsed);
    ASSERT_TRUE(parsed.value().superblock.directboot().has_value());
    EXPECT_EQ(*parsed.value().superblock.directboot(), (fs::Extent{2, 3}));
}

TEST_F(MkfsDriverTest, RecordsBlockSize)
{
    const auto boot = writeFile("boot.bin", std::vector<Byte>(512, 1));
    const auto source = writeFile("kernel.bin", pattern(10));
    Config cfg = makeConfig(boot, source);
    cfg.blockSize = 4096;

    ASSERT_TRUE(mkfs(std::move(cfg)));
    auto parsed = fs::parseImage(readOutput());
    ASSERT_TRUE(parsed);
    EXPECT_EQ(parsed.value().superblock.blockSize(), 4096);
}

TEST_F(MkfsDriverTest, RebuildIsByteIdentical)
{
    const auto boot = writeFile("boot.bin", std::vector<Byte>(512, 0xEB));
    const auto source = writeFile("kernel.bin", pattern(3000));

    ASSERT_TRUE(mkfs(makeConfig(boot, source)));
    const auto first = readOutput();
    ASSERT_TRUE(mkfs(makeConfig(boot, source)));
    EXPECT_EQ(readOutput(), first);
}

TEST_F(MkfsDriverTest, EmptyPayloadProducesInodeOnly)
{
    const auto boot = writeFile("boot.bin", std::vector<Byte>(512, 0xEB));
    const auto source = writeFile("kernel.bin", {});

    auto report = mkfs(makeConfig(boot, source));
    ASSERT_TRUE(report);
    EXPECT_EQ(report.value().imageSize, 512u * 3);
    EXPECT_EQ(report.value().dataCount, 0u);

    const auto image = readOutput();
    EXPECT_EQ(image[512 + 8], 0);
    auto parsed = fs::parseImage(image);
    ASSERT_TRUE(parsed);
    EXPECT_TRUE(parsed.value().inode.extent(0).isEmpty());
    EXPECT_FALSE(parsed.value().superblock.directboot().has_value());

    support::DiagnosticEngine diags;
    EXPECT_TRUE(fs::verifyImage(parsed.value(), diags));
}

TEST_F(MkfsDriverTest, MissingSourceWritesNothing)
{
    const auto boot = writeFile("boot.bin", std::vector<Byte>(512, 1));
    const std::string source = path("absent.bin");

    auto report = mkfs(makeConfig(boot, source));
    ASSERT_FALSE(report);
    EXPECT_TRUE(fs::isError(report.error(), fs::MkfsError::FileNotFound));
    EXPECT_EQ(report.error().path, source);
    EXPECT_FALSE(std::filesystem::exists(path("image.bin")));
}

TEST_F(MkfsDriverTest, MissingBootloaderIsReported)
{
    const std::string boot = path("absent-boot.bin");
    const auto source = writeFile("kernel.bin", pattern(10));

    auto report = mkfs(makeConfig(boot, source));
    ASSERT_FALSE(report);
    EXPECT_TRUE(fs::isError(report.error(), fs::MkfsError::FileNotFound));
    EXPECT_EQ(report.error().path, boot);
}

TEST_F(MkfsDriverTest, EmptyBootloaderIsCheckedBeforeSource)
{
    const auto boot = writeFile("boot.bin", {});

    auto report = mkfs(makeConfig(boot, path("never-read.bin")));
    ASSERT_FALSE(report);
    EXPECT_TRUE(fs::isError(report.error(), fs::MkfsError::EmptyBootloader));
    EXPECT_EQ(report.error().path, boot);
    EXPECT_FALSE(std::filesystem::exists(path("image.bin")));
}

TEST_F(MkfsDriverTest, DirectorySourceIsNotAFile)
{
    const auto boot = writeFile("boot.bin", std::vector<Byte>(512, 1));
    std::filesystem::create_directories(dir_ / "payload");

    auto report = mkfs(makeConfig(boot, path("payload")));
    ASSERT_FALSE(report);
    EXPECT_TRUE(fs::isError(report.error(), fs::MkfsError::FileNotFound));
}

TEST_F(MkfsDriverTest, RejectsNonFileSource)
{
    const auto boot = writeFile("boot.bin", std::vector<Byte>(512, 1));

    Config dirCfg = makeConfig(boot, "unused");
    dirCfg.source = Target::dir({Target::file(path("a.bin"))});
    auto dirReport = mkfs(std::move(dirCfg));
    ASSERT_FALSE(dirReport);
    EXPECT_TRUE(fs::isError(dirReport.error(), fs::MkfsError::BadConfig));

    Config rawCfg = makeConfig(boot, "unused");
    rawCfg.source = Target::raw(pattern(10));
    auto rawReport = mkfs(std::move(rawCfg));
    ASSERT_FALSE(rawReport);
    EXPECT_EQ(rawReport.error().message, "bad configuration: source must be a single file");
}

TEST_F(MkfsDriverTest, RejectsNonFileOutput)
{
    const auto boot = writeFile("boot.bin", std::vector<Byte>(512, 1));
    const auto source = writeFile("kernel.bin", pattern(10));
    Config cfg = makeConfig(boot, source);
    cfg.output = Target::raw({});

    auto report = mkfs(std::move(cfg));
    ASSERT_FALSE(report);
    EXPECT_EQ(report.error().message, "bad configuration: output must be a file");
}

TEST_F(MkfsDriverTest, RejectsOverlongPayloadName)
{
    const auto boot = writeFile("boot.bin", std::vector<Byte>(512, 1));
    const auto source = writeFile(std::string(130, 'k'), pattern(10));

    auto report = mkfs(makeConfig(boot, source));
    ASSERT_FALSE(report);
    EXPECT_TRUE(fs::isError(report.error(), fs::MkfsError::NameTooLong));
    EXPECT_EQ(report.error().path, source);
}

TEST_F(MkfsDriverTest, UnwritableOutputFails)
{
    const auto boot = writeFile("boot.bin", std::vector<Byte>(512, 1));
    const auto source = writeFile("kernel.bin", pattern(10));
    Config cfg = makeConfig(boot, source);
    cfg.output = Target::file(path("missing-dir/image.bin"));

    auto report = mkfs(std::move(cfg));
    ASSERT_FALSE(report);
    EXPECT_TRUE(fs::isError(report.error(), fs::MkfsError::WriteFailed));
}

TEST_F(MkfsDriverTest, AssembleAcceptsRawBootloader)
{
    const auto source = writeFile("kernel.bin", pattern(700));
    Config cfg = makeConfig("unused", source);
    cfg.bootloader = Target::raw(std::vector<Byte>(512, 0xCC));

    std::ostringstream trace;
    auto built = assemble(std::move(cfg), &trace);
    ASSERT_TRUE(built);
    EXPECT_EQ(built.value().bytes.size(), 512u * 4);
    EXPECT_EQ(built.value().bytes[0], 0xCC);
    EXPECT_NE(trace.str().find("bootloader: 512 bytes"), std::string::npos);
    EXPECT_NE(trace.str().find("directboot: kernel.bin"), std::string::npos);
    EXPECT_FALSE(std::filesystem::exists(path("image.bin")));
}

TEST_F(MkfsDriverTest, AssembleRejectsDirectoryBootloader)
{
    const auto source = writeFile("kernel.bin", pattern(10));
    Config cfg = makeConfig("unused", source);
    cfg.bootloader = Target::dir({});

    auto built = assemble(std::move(cfg));
    ASSERT_FALSE(built);
    EXPECT_TRUE(fs::isError(built.error(), fs::MkfsError::BadConfig));
}

TEST(MkfsReportTest, PrintsReportBlock)
{
    std::ostringstream os;
    os << MkfsReport{2048, 1, 2};
    EXPECT_EQ(os.str(), "[MKFS REPORT]\nSize: 2048 Bytes\nInode count: 1\nDatanode count: 2\n");
}
