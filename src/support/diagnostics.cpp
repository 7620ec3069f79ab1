//===----------------------------------------------------------------------===//
//
// Part of the ENTFS project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/diagnostics.cpp
// Purpose: Collects diagnostics raised while an image is checked and renders
//          them in report order.
// Key invariants: errorCount() and warningCount() match the stored records;
//                 notes are stored but not counted.
// Ownership/Lifetime: The engine owns every diagnostic passed to report().
// Links: support/diagnostics.hpp, support/diag_expected.hpp
//
//===----------------------------------------------------------------------===//

#include "diagnostics.hpp"
#include "diag_expected.hpp"

namespace entfs::support
{

void DiagnosticEngine::report(Diagnostic d)
{
    switch (d.severity)
    {
        case Severity::Error:
            ++errors_;
            break;
        case Severity::Warning:
            ++warnings_;
            break;
        case Severity::Note:
            break;
    }
    diags_.push_back(std::move(d));
}

/// @brief Render every stored diagnostic through printDiag(), one per line.
void DiagnosticEngine::printAll(std::ostream &os) const
{
    for (const Diagnostic &d : diags_)
        printDiag(d, os);
}

const std::vector<Diagnostic> &DiagnosticEngine::diagnostics() const
{
    return diags_;
}

size_t DiagnosticEngine::errorCount() const
{
    return errors_;
}

size_t DiagnosticEngine::warningCount() const
{
    return warnings_;
}

} // namespace entfs::support
