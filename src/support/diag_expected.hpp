//===----------------------------------------------------------------------===//
//
// Part of the ENTFS project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/diag_expected.hpp
// Purpose: Provides diagnostic helpers and a lightweight Expected container for CLI tools.
// Key invariants: An Expected holds exactly one of a value or an error diagnostic.
// Ownership/Lifetime: Expected owns the stored value or diagnostic.
// Links: support/diagnostics.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/diagnostics.hpp"

#include <optional>
#include <ostream>
#include <string>
#include <type_traits>
#include <utility>

namespace entfs::support
{
using Diag = Diagnostic;

/// @brief Result of a fallible format or tool operation: a @p T, or the
///        Diagnostic explaining why there is none.
template <class T> class Expected
{
  public:
    /// @brief Success carrying @p value.
    template <class U = T, class = std::enable_if_t<!std::is_same_v<std::decay_t<U>, Diag>>>
    Expected(U &&value) : value_(std::forward<U>(value))
    {
    }

    /// @brief Failure carrying @p diag.
    Expected(Diag diag) : error_(std::move(diag)) {}

    [[nodiscard]] bool hasValue() const
    {
        return value_.has_value();
    }

    explicit operator bool() const
    {
        return hasValue();
    }

    /// @pre hasValue()
    T &value()
    {
        return *value_;
    }

    const T &value() const
    {
        return *value_;
    }

    /// @pre !hasValue()
    const Diag &error() const &
    {
        return *error_;
    }

  private:
    std::optional<T> value_;
    std::optional<Diag> error_;
};

/// @brief Outcome of an operation that yields nothing on success.
template <> class Expected<void>
{
  public:
    /// @brief Construct a successful result with no payload.
    Expected() = default;

    /// @brief Construct an error result holding diagnostic @p diag.
    /// @param diag Diagnostic describing the failure.
    Expected(Diag diag);

    /// @brief Check whether the Expected represents success.
    [[nodiscard]] bool hasValue() const;

    /// @brief Allow use in boolean contexts to test success.
    explicit operator bool() const;

    /// @brief Access the diagnostic describing the failure.
    const Diag &error() const &;

  private:
    std::optional<Diag> error_;
};

namespace detail
{
/// @brief Convert diagnostic severity to lowercase string.
const char *diagSeverityToString(Severity severity);
} // namespace detail

/// @brief Create an error diagnostic for @p path with @p msg.
/// @param path Host path the error concerns; may be empty.
/// @param msg Human-readable diagnostic message.
/// @param code Optional stable error code.
/// @return Diagnostic marked as an error severity.
Diag makeError(std::string path, std::string msg, std::string code = {});

/// @brief Write @p diag to @p os as one line; DiagnosticEngine::printAll uses
///        the same format.
void printDiag(const Diag &diag, std::ostream &os);
} // namespace entfs::support
