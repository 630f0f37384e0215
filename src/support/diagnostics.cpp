//===----------------------------------------------------------------------===//
//
// Part of the Fusion project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/diagnostics.cpp
// Purpose: Implements the diagnostic engine and the shared diagnostic printer.
// Key invariants: printDiag always terminates its output with a newline.
// Ownership/Lifetime: See diagnostics.hpp.
// Links: docs/architecture.md
//
//===----------------------------------------------------------------------===//

#include "support/diagnostics.hpp"
#include "support/diag_expected.hpp"
#include "support/source_manager.hpp"

namespace fusion::support
{

void DiagnosticEngine::report(Diagnostic d)
{
    if (d.severity == Severity::Error)
        ++errors_;
    else if (d.severity == Severity::Warning)
        ++warnings_;
    diags_.push_back(std::move(d));
}

void DiagnosticEngine::append(const DiagnosticEngine &other)
{
    for (const auto &d : other.diags_)
        report(d);
}

void DiagnosticEngine::printAll(std::ostream &os, const SourceManager *sm) const
{
    for (const auto &d : diags_)
        printDiag(d, os, sm);
}

size_t DiagnosticEngine::errorCount() const
{
    return errors_;
}

size_t DiagnosticEngine::warningCount() const
{
    return warnings_;
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
    return Diag{Severity::Error, std::move(msg), loc, {}, std::nullopt};
}

Diag makeError(std::string code, SourceLoc loc, std::string msg)
{
    return Diag{Severity::Error, std::move(msg), loc, std::move(code), std::nullopt};
}

Diag makeWarning(std::string code, SourceLoc loc, std::string msg)
{
    return Diag{Severity::Warning, std::move(msg), loc, std::move(code), std::nullopt};
}

void printDiag(const Diag &diag, std::ostream &os, const SourceManager *sm)
{
    std::string_view path;
    if (sm && diag.loc.hasFile())
        path = sm->getPath(diag.loc.file_id);

    if (!path.empty())
    {
        os << path;
        if (diag.loc.hasLine())
            os << ':' << diag.loc.line;
        os << ": ";
    }
    else if (diag.loc.hasLine())
    {
        os << "line " << diag.loc.line << ": ";
    }

    os << detail::diagSeverityToString(diag.severity);
    if (!diag.code.empty())
        os << '[' << diag.code << ']';
    os << ": " << diag.message;
    if (diag.block)
        os << " (block " << *diag.block << ')';
    os << '\n';
}

} // namespace fusion::support
