//===----------------------------------------------------------------------===//
//
// Part of the LionCode project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// The diagnostic engine aggregates messages produced by the compiler pipeline
// and keeps track of severity counts. Diagnostics are stored until callers
// explicitly print or inspect them.
//
//===----------------------------------------------------------------------===//

#include "support/diagnostics.hpp"

#include "support/diag_expected.hpp"
#include "support/source_manager.hpp"

namespace lion::support
{
/// @brief Append @p d and bump the matching severity counter.
void DiagnosticEngine::report(Diagnostic d)
{
    if (d.severity == Severity::Error)
        ++errors_;
    else if (d.severity == Severity::Warning)
        ++warnings_;
    diags_.push_back(std::move(d));
}

/// @brief Print every stored diagnostic through printDiag().
void DiagnosticEngine::printAll(std::ostream &os, const SourceManager *sm) const
{
    for (const auto &d : diags_)
    {
        printDiag(d, os, sm);
    }
}

size_t DiagnosticEngine::errorCount() const
{
    return errors_;
}

size_t DiagnosticEngine::warningCount() const
{
    return warnings_;
}
} // namespace lion::support
