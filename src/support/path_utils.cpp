// File: src/support/path_utils.cpp
// Purpose: Implement helpers for taking host paths apart.
// Key invariants: Both forward and backward slashes act as separators.
// Ownership/Lifetime: Stateless.
// Links: src/support/path_utils.hpp

#include "support/path_utils.hpp"

namespace entfs::support
{
namespace
{
#if defined(_WIN32)
constexpr std::string_view kSeparators = "/\\";
#else
constexpr std::string_view kSeparators = "/";
#endif
} // namespace

std::string basename(std::string_view path)
{
    if (path.empty())
        return {};
    size_t pos = path.find_last_of(kSeparators);
    if (pos == std::string_view::npos)
        return std::string(path);
    if (pos + 1 >= path.size())
        return {};
    return std::string(path.substr(pos + 1));
}

} // namespace entfs::support
