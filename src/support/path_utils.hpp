// File: src/support/path_utils.hpp
// Purpose: Declare helpers for taking host paths apart.
// Key invariants: Both forward and backward slashes act as separators.
// Ownership/Lifetime: Free functions returning owned strings.
// Links: src/tools/mkfs/driver.cpp
#pragma once

#include <string>
#include <string_view>

namespace entfs::support
{

/// @brief Compute basename component of @p path.
/// @param path Host path.  Only '/' separates components, except on Windows
///             hosts where '\' does too.
/// @return Last path component or empty string when none exists.
[[nodiscard]] std::string basename(std::string_view path);

} // namespace entfs::support
