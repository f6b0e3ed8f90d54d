//===----------------------------------------------------------------------===//
//
// Part of the llvm-derive project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Declarations for diagnostic reporting interfaces used across schema reading, classification, and code generation.
///
//===----------------------------------------------------------------------===//
#ifndef LLVMDERIVE_SUPPORT_DIAGNOSTICS_H
#define LLVMDERIVE_SUPPORT_DIAGNOSTICS_H

#include "llvmderive/Frontend/SourceLocation.h"

#include <cstddef>
#include <string>
#include <vector>

#include "llvm/ADT/StringRef.h"

namespace llvmderive
{

/// @file
/// @brief Diagnostic collection and reporting interfaces.

/// @brief Severity level for a diagnostic message.
enum class DiagnosticLevel
{

    /// @brief Informational note.
    Note,

    /// @brief Non-fatal warning.
    Warning,

    /// @brief Fatal error.
    Error,
};

/// @brief Stable category attached to every diagnostic.
enum class DiagnosticCode
{
    /// @brief Schema document is not well-formed.
    MalformedSchema,

    /// @brief Two definitions share one name.
    DuplicateDefinition,

    /// @brief Member type names nothing the generator can spell.
    UnresolvedType,

    /// @brief Definitions reference each other by value.
    DependencyCycle,

    /// @brief Type shape is not one of the four encodable shapes.
    UnsupportedShape,

    /// @brief Attribute is not legal for the shape it is attached to.
    InvalidAttributeCombination,

    /// @brief Attribute name is not part of the metadata grammar.
    UnknownAttribute,

    /// @brief Attribute value is missing or not acceptable.
    InvalidAttributeValue,

    /// @brief Attribute given more than once on one target.
    DuplicateAttribute,

    /// @brief Two strong enum variants encode to the same label.
    AmbiguousWireLabel,

    /// @brief A contract was skipped because the backend lacks the capability.
    ContractOmitted,
};

/// @brief Returns the kebab-case spelling used when printing a code.
/// @param[in] code Diagnostic code.
/// @return Stable code name.
llvm::StringRef diagnosticCodeName(DiagnosticCode code);

/// @brief Single diagnostic record produced by the pipeline.
struct Diagnostic
{
    /// @brief Severity level.
    DiagnosticLevel level;

    /// @brief Category.
    DiagnosticCode code;

    /// @brief Schema location associated with the message.
    SourceLocation location;

    /// @brief Human-readable message text.
    std::string message;

    /// @brief Renders `<location>: <level>[<code>]: <message>`.
    /// @return Printable diagnostic line without trailing newline.
    [[nodiscard]] std::string str() const;
};

/// @brief Accumulates diagnostics emitted across all generation stages.
class DiagnosticEngine final
{
public:
    /// @brief Appends a diagnostic entry.
    /// @param[in] level Severity level.
    /// @param[in] code Diagnostic category.
    /// @param[in] location Schema location associated with the message.
    /// @param[in] message Human-readable message text.
    void report(DiagnosticLevel level, DiagnosticCode code, const SourceLocation& location, std::string message);

    /// @brief Emits a note-level diagnostic.
    void note(DiagnosticCode code, const SourceLocation& location, std::string message);

    /// @brief Emits a warning-level diagnostic.
    void warning(DiagnosticCode code, const SourceLocation& location, std::string message);

    /// @brief Emits an error-level diagnostic.
    void error(DiagnosticCode code, const SourceLocation& location, std::string message);

    /// @brief Appends every diagnostic of another engine, preserving order.
    /// @param[in] other Engine whose diagnostics are copied.
    void append(const DiagnosticEngine& other);

    /// @brief Indicates whether any error diagnostics were recorded.
    /// @return True when at least one error exists.
    [[nodiscard]] bool hasErrors() const;

    /// @brief Counts recorded diagnostics of one level.
    /// @param[in] level Severity level.
    /// @return Number of matching diagnostics.
    [[nodiscard]] std::size_t count(DiagnosticLevel level) const;

    /// @brief Returns all recorded diagnostics in insertion order.
    /// @return Immutable diagnostic list.
    [[nodiscard]] const std::vector<Diagnostic>& diagnostics() const
    {
        return diagnostics_;
    }

private:
    /// @brief Backing storage for collected diagnostics.
    std::vector<Diagnostic> diagnostics_;
};

}  // namespace llvmderive

#endif  // LLVMDERIVE_SUPPORT_DIAGNOSTICS_H
