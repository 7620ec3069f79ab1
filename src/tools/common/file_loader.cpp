//===----------------------------------------------------------------------===//
//
// Part of the ENTFS project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/tools/common/file_loader.cpp
// Purpose: Standardise how the image tools move whole files in and out.
// Key invariants: Errors carry the offending path in Diagnostic::path.
// Ownership/Lifetime: Returned buffers are owned by the caller.
// Links: src/tools/common/file_loader.hpp
//
//===----------------------------------------------------------------------===//

#include "tools/common/file_loader.hpp"

#include "fs/MkfsError.hpp"

#include <filesystem>
#include <fstream>
#include <iterator>
#include <system_error>

namespace entfs::tools::common
{

support::Expected<std::vector<fs::Byte>> loadHostFile(const std::string &path)
{
    std::error_code ec;
    if (std::filesystem::is_directory(path, ec))
        return fs::makeDiag(fs::MkfsError::FileNotFound, path);

    std::ifstream in(path, std::ios::binary);
    if (!in)
        return fs::makeDiag(fs::MkfsError::FileNotFound, path);

    std::vector<fs::Byte> bytes((std::istreambuf_iterator<char>(in)),
                                std::istreambuf_iterator<char>());
    if (in.bad())
        return fs::makeDiag(fs::MkfsError::FileNotFound, path);
    return support::Expected<std::vector<fs::Byte>>(std::move(bytes));
}

support::Expected<void> storeHostFile(const std::string &path, const std::vector<fs::Byte> &bytes)
{
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out)
    {
        return fs::makeDiag(
            fs::MkfsError::WriteFailed, path, {{"detail", "cannot open for writing"}});
    }
    out.write(reinterpret_cast<const char *>(bytes.data()),
              static_cast<std::streamsize>(bytes.size()));
    out.close();
    if (!out)
    {
        std::error_code ec;
        std::filesystem::remove(path, ec);
        return fs::makeDiag(fs::MkfsError::WriteFailed, path, {{"detail", "short write"}});
    }
    return {};
}

} // namespace entfs::tools::common
