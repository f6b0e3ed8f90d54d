//===----------------------------------------------------------------------===//
//
// Part of the llvm-derive project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Identifier casing conventions used to derive wire labels.
///
/// Word boundaries are found at lower-to-upper and digit-to-upper transitions,
/// at the end of an uppercase run followed by a lowercase letter, and at any
/// non-alphanumeric character.
///
//===----------------------------------------------------------------------===//
#ifndef LLVMDERIVE_SUPPORT_CASING_H
#define LLVMDERIVE_SUPPORT_CASING_H

#include <optional>
#include <string>
#include <vector>

#include "llvm/ADT/StringRef.h"

namespace llvmderive
{

/// @brief Naming convention accepted by the `rename_all` attribute.
enum class CasingConvention
{
    /// @brief `HelloWorld` -> `helloworld`.
    Lowercase,

    /// @brief `HelloWorld` -> `HELLOWORLD`.
    Uppercase,

    /// @brief `HelloWorld` -> `hello_world`.
    SnakeCase,

    /// @brief `HelloWorld` -> `HELLO_WORLD`.
    ScreamingSnakeCase,

    /// @brief `HelloWorld` -> `hello-world`.
    KebabCase,

    /// @brief `HelloWorld` -> `helloWorld`.
    CamelCase,

    /// @brief `hello_world` -> `HelloWorld`.
    PascalCase,
};

/// @brief Parses a convention from its attribute spelling.
/// @param[in] text Spelling such as `snake_case` or `kebab-case`.
/// @return Convention, or `std::nullopt` for unknown spellings.
std::optional<CasingConvention> parseCasingConvention(llvm::StringRef text);

/// @brief Returns the attribute spelling of a convention.
llvm::StringRef casingConventionName(CasingConvention convention);

/// @brief Splits an identifier into lowercase words.
/// @param[in] identifier Source identifier.
/// @return Words in order; empty when the identifier has no alphanumerics.
std::vector<std::string> splitIdentifierWords(llvm::StringRef identifier);

/// @brief Projects an identifier into a convention.
/// @param[in] identifier Source identifier.
/// @param[in] convention Target convention.
/// @return Transformed label.
std::string applyCasingConvention(llvm::StringRef identifier, CasingConvention convention);

}  // namespace llvmderive

#endif  // LLVMDERIVE_SUPPORT_CASING_H
