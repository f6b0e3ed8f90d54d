//===----------------------------------------------------------------------===//
//
// Part of the llvm-derive project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Database backend selection and the capabilities it grants generation.
///
//===----------------------------------------------------------------------===//
#ifndef LLVMDERIVE_CODEGEN_BACKEND_CAPABILITIES_H
#define LLVMDERIVE_CODEGEN_BACKEND_CAPABILITIES_H

#include <optional>
#include <string>

#include "llvm/ADT/StringRef.h"

namespace llvmderive
{

/// @brief Backend the generated code is built against.
enum class BackendSelection
{
    /// @brief Only contracts generic over any backend.
    Generic,

    /// @brief PostgreSQL: composite records and named types.
    Postgres,

    /// @brief MySQL: no composite records.
    MySql,
};

/// @brief Capabilities granted by a backend selection.
struct BackendCapabilities final
{
    /// @brief Record shapes may be encoded as composite records.
    bool compositeRecords{false};

    /// @brief Strong enumerations and records may name a backend type.
    bool namedTypeIdentity{false};

    /// @brief Runtime tag type used for backend-specific specializations.
    std::optional<std::string> concreteBackend;
};

/// @brief Parses `generic`, `postgres` or `mysql`.
std::optional<BackendSelection> parseBackendSelection(llvm::StringRef text);

/// @brief Returns the command-line spelling of a selection.
llvm::StringRef backendSelectionName(BackendSelection selection);

/// @brief Returns the capabilities of a selection.
BackendCapabilities backendCapabilities(BackendSelection selection);

}  // namespace llvmderive

#endif  // LLVMDERIVE_CODEGEN_BACKEND_CAPABILITIES_H
