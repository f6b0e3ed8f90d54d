//===----------------------------------------------------------------------===//
//
// Part of the llvm-derive project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Naming-policy helpers for generated C++.
///
/// This interface centralizes identifier sanitization, namespace paths and
/// include-guard macros used by the renderers.
///
//===----------------------------------------------------------------------===//
#ifndef LLVMDERIVE_CODEGEN_NAMING_POLICY_H
#define LLVMDERIVE_CODEGEN_NAMING_POLICY_H

#include <string>
#include <vector>

#include "llvm/ADT/StringRef.h"

namespace llvmderive
{

/// @brief Returns true when an identifier is a C++ keyword.
/// @param[in] name Candidate identifier.
/// @return True when the identifier is reserved.
bool isCppKeyword(llvm::StringRef name);

/// @brief Sanitizes one identifier for C++.
/// @param[in] name Candidate identifier.
/// @return C++-safe identifier; keywords gain a trailing underscore.
std::string sanitizeCppIdentifier(llvm::StringRef name);

/// @brief Renders namespace components as a `::`-joined path.
/// @param[in] components Namespace components, outermost first.
/// @return Path such as `demo::types`, or empty for the global namespace.
std::string cppNamespacePath(const std::vector<std::string>& components);

/// @brief Renders a fully-qualified name for a schema definition.
/// @param[in] components Namespace components of the schema module.
/// @param[in] name Definition name.
/// @return Name such as `::demo::types::Item`.
std::string cppQualifiedName(const std::vector<std::string>& components, llvm::StringRef name);

/// @brief Builds an include-guard macro for a generated header.
/// @param[in] components Namespace components of the schema module.
/// @param[in] headerName Header file stem.
/// @return Macro such as `LLVMDERIVE_GENERATED_DEMO_TYPES_HPP`.
std::string cppHeaderGuard(const std::vector<std::string>& components, llvm::StringRef headerName);

}  // namespace llvmderive

#endif  // LLVMDERIVE_CODEGEN_NAMING_POLICY_H
