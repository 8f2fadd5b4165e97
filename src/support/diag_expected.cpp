//===----------------------------------------------------------------------===//
//
// Part of the LionCode project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the diagnostic-oriented Expected helpers. Every stage of the
// compiler reports its failure as a Diag carried by an Expected, and every tool
// prints them through printDiag so the wording stays uniform.
//
//===----------------------------------------------------------------------===//

#include "support/diag_expected.hpp"

namespace lion::support
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

Diag makeError(SourceLoc loc, std::string msg)
{
    return Diag{Severity::Error, std::move(msg), loc, {}};
}

Diag makeError(SourceLoc loc, std::string msg, std::string code)
{
    return Diag{Severity::Error, std::move(msg), loc, std::move(code)};
}

/// @brief Print @p diag followed by a newline.
///
/// @details Location prefix rules: the file path comes from @p sm when both the
///          manager and a file id are present; `line:col` follows whenever the
///          line is known. The diagnostic code, when set, is appended to the
///          severity in brackets as in `error[L2000]`.
void printDiag(const Diag &diag, std::ostream &os, const SourceManager *sm)
{
    bool wrotePrefix = false;
    if (sm && diag.loc.hasFile())
    {
        auto path = sm->getPath(diag.loc.file_id);
        if (!path.empty())
        {
            os << path;
            wrotePrefix = true;
        }
    }
    if (diag.loc.hasLine())
    {
        if (wrotePrefix)
            os << ':';
        os << diag.loc.line;
        if (diag.loc.hasColumn())
            os << ':' << diag.loc.column;
        wrotePrefix = true;
    }
    if (wrotePrefix)
        os << ": ";

    os << detail::diagSeverityToString(diag.severity);
    if (!diag.code.empty())
        os << '[' << diag.code << ']';
    os << ": " << diag.message << '\n';
}
} // namespace lion::support
