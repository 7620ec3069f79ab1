//===----------------------------------------------------------------------===//
//
// Part of the ENTFS project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Out-of-line pieces of the diagnostic Expected helpers: the Expected<void>
// members, error construction, and the single printer every ENTFS tool uses
// for its stderr output.
//
//===----------------------------------------------------------------------===//

#include "diag_expected.hpp"

namespace entfs::support
{

Expected<void>::Expected(Diag diag) : error_(std::move(diag)) {}

bool Expected<void>::hasValue() const
{
    return !error_.has_value();
}

Expected<void>::operator bool() const
{
    return hasValue();
}

/// @pre !hasValue()
const Diag &Expected<void>::error() const &
{
    return *error_;
}

namespace detail
{
const char *diagSeverityToString(Severity severity)
{
    switch (severity)
    {
        case Severity::Note:
            return "note";
        case Severity::Warning:
            return "warning";
        case Severity::Error:
            return "error";
    }
    return "";
}
} // namespace detail

Diag makeError(std::string path, std::string msg, std::string code)
{
    return Diag{Severity::Error, std::move(msg), std::move(path), std::move(code)};
}

/// @brief Print @p diag as `<path>: <severity>[<code>]: <message>`.
///
/// @details The path prefix is dropped for diagnostics that concern no host
///          file, and the bracketed code is dropped when none was assigned.
///          Output always ends with a newline.
void printDiag(const Diag &diag, std::ostream &os)
{
    if (!diag.path.empty())
        os << diag.path << ": ";
    os << detail::diagSeverityToString(diag.severity);
    if (!diag.code.empty())
        os << '[' << diag.code << ']';
    os << ": " << diag.message << '\n';
}

} // namespace entfs::support
