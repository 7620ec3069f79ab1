//===----------------------------------------------------------------------===//
//
// File: src/console/BoundedLog.hpp
// Purpose: Fixed-capacity console log that mirrors every write to a raw sink.
//
// Key invariants:
//   - size() never exceeds capacity().
//   - A write either lands completely (buffered and mirrored) or not at all.
//   - There is no reset; once full the log rejects every further non-empty write.
//
// Ownership/Lifetime:
//   - The log owns its buffer and a copy of the sink callable.
//   - Written text is copied; callers keep ownership of their strings.
//
// Links: src/support/diag_expected.hpp
//
//===----------------------------------------------------------------------===//
#pragma once

#include "support/diag_expected.hpp"

#include <cstddef>
#include <functional>
#include <string>
#include <string_view>

namespace entfs::console
{

/// @brief Default capacity of the boot console log in characters.
inline constexpr size_t kDefaultLogCapacity = 65535;

/// @brief Bounded text buffer mirrored to an output sink.
class BoundedLog
{
  public:
    /// @brief Receives each accepted write verbatim.
    using Sink = std::function<void(std::string_view)>;

    /// @brief Create an empty log.
    /// @param capacity Maximum number of characters the log retains.
    /// @param sink Raw output receiving every accepted write; may be empty.
    explicit BoundedLog(size_t capacity = kDefaultLogCapacity, Sink sink = {});

    /// @brief Append @p text and mirror it to the sink.
    /// @return An error diagnostic ("log buffer full") when @p text does not fit
    ///         in the remaining capacity; nothing is buffered or mirrored then.
    support::Expected<void> write(std::string_view text);

    [[nodiscard]] const std::string &contents() const
    {
        return buffer_;
    }

    [[nodiscard]] size_t size() const
    {
        return buffer_.size();
    }

    [[nodiscard]] size_t capacity() const
    {
        return capacity_;
    }

    [[nodiscard]] size_t remaining() const
    {
        return capacity_ - buffer_.size();
    }

  private:
    size_t capacity_;
    Sink sink_;
    std::string buffer_;
};

} // namespace entfs::console
