//===----------------------------------------------------------------------===//
//
// Part of the llvm-derive project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements diagnostic collection and formatting helpers.
///
/// The diagnostic engine records schema-located notes, warnings, and errors
/// consumed throughout the generation pipeline.
///
//===----------------------------------------------------------------------===//

#include "llvmderive/Support/Diagnostics.h"

#include <algorithm>
#include <utility>

namespace llvmderive
{

llvm::StringRef diagnosticCodeName(const DiagnosticCode code)
{
    switch (code)
    {
    case DiagnosticCode::MalformedSchema:
        return "malformed-schema";
    case DiagnosticCode::DuplicateDefinition:
        return "duplicate-definition";
    case DiagnosticCode::UnresolvedType:
        return "unresolved-type";
    case DiagnosticCode::DependencyCycle:
        return "dependency-cycle";
    case DiagnosticCode::UnsupportedShape:
        return "unsupported-shape";
    case DiagnosticCode::InvalidAttributeCombination:
        return "invalid-attribute-combination";
    case DiagnosticCode::UnknownAttribute:
        return "unknown-attribute";
    case DiagnosticCode::InvalidAttributeValue:
        return "invalid-attribute-value";
    case DiagnosticCode::DuplicateAttribute:
        return "duplicate-attribute";
    case DiagnosticCode::AmbiguousWireLabel:
        return "ambiguous-wire-label";
    case DiagnosticCode::ContractOmitted:
        return "contract-omitted";
    }
    return "unknown";
}

std::string Diagnostic::str() const
{
    llvm::StringRef levelName = "note";
    if (level == DiagnosticLevel::Warning)
    {
        levelName = "warning";
    }
    else if (level == DiagnosticLevel::Error)
    {
        levelName = "error";
    }
    return location.str() + ": " + levelName.str() + "[" + diagnosticCodeName(code).str() + "]: " + message;
}

void DiagnosticEngine::report(DiagnosticLevel       level,
                              const DiagnosticCode  code,
                              const SourceLocation& location,
                              std::string           message)
{
    diagnostics_.push_back(Diagnostic{level, code, location, std::move(message)});
}

void DiagnosticEngine::note(const DiagnosticCode code, const SourceLocation& location, std::string message)
{
    report(DiagnosticLevel::Note, code, location, std::move(message));
}

void DiagnosticEngine::warning(const DiagnosticCode code, const SourceLocation& location, std::string message)
{
    report(DiagnosticLevel::Warning, code, location, std::move(message));
}

void DiagnosticEngine::error(const DiagnosticCode code, const SourceLocation& location, std::string message)
{
    report(DiagnosticLevel::Error, code, location, std::move(message));
}

void DiagnosticEngine::append(const DiagnosticEngine& other)
{
    diagnostics_.insert(diagnostics_.end(), other.diagnostics_.begin(), other.diagnostics_.end());
}

bool DiagnosticEngine::hasErrors() const
{
    for (const Diagnostic& d : diagnostics_)
    {
        if (d.level == DiagnosticLevel::Error)
        {
            return true;
        }
    }
    return false;
}

std::size_t DiagnosticEngine::count(const DiagnosticLevel level) const
{
    return static_cast<std::size_t>(
        std::count_if(diagnostics_.begin(), diagnostics_.end(), [level](const Diagnostic& d) {
            return d.level == level;
        }));
}

}  // namespace llvmderive
