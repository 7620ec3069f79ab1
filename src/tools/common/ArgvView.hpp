//===----------------------------------------------------------------------===//
//
// Part of the ENTFS project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tools/common/ArgvView.hpp
// Purpose: Non-owning view and cursor over argv-style argument arrays.
// Key invariants: Never modifies or owns the underlying argument storage.
// Ownership/Lifetime: Borrows pointers from the C runtime; callers must ensure
//                     validity through the view's lifetime.
// Links: tools/mkfs/config.cpp, tools/entfs-inspect/driver.cpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include <optional>
#include <string_view>

namespace entfs::tools
{

/// @brief Lightweight non-owning view over argv-style argument arrays.
struct ArgvView
{
    int argc;
    char **argv;

    /// @brief Determine whether the view contains no arguments.
    [[nodiscard]] bool empty() const
    {
        return argc <= 0 || argv == nullptr;
    }

    /// @brief Read the argument at @p index, returning an empty view on overflow.
    [[nodiscard]] std::string_view at(int index) const
    {
        if (index < 0 || index >= argc || argv == nullptr)
        {
            return std::string_view{};
        }
        return std::string_view(argv[index]);
    }

    /// @brief Produce a suffix view that skips the first @p count entries.
    [[nodiscard]] ArgvView drop_front(int count = 1) const
    {
        if (count >= argc)
        {
            return ArgvView{0, nullptr};
        }
        return ArgvView{argc - count, argv + count};
    }
};

/// @brief Forward-only walk over an ArgvView for option parsing.
/// @details `next()` yields the option word; `value()` then consumes the
///          argument that follows it, if any.
class ArgvCursor
{
  public:
    explicit ArgvCursor(ArgvView args) : args_(args) {}

    [[nodiscard]] bool done() const
    {
        return index_ >= args_.argc || args_.empty();
    }

    /// @brief Consume and return the current argument.
    std::string_view next()
    {
        return args_.at(index_++);
    }

    /// @brief Consume the argument following an option.
    /// @return The value, or nullopt when the argument list is exhausted.
    std::optional<std::string_view> value()
    {
        if (done())
            return std::nullopt;
        return next();
    }

  private:
    ArgvView args_;
    int index_ = 0;
};

} // namespace entfs::tools
