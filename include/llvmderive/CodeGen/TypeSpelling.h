//===----------------------------------------------------------------------===//
//
// Part of the llvm-derive project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Projection of schema member types into C++ type spellings.
///
//===----------------------------------------------------------------------===//
#ifndef LLVMDERIVE_CODEGEN_TYPE_SPELLING_H
#define LLVMDERIVE_CODEGEN_TYPE_SPELLING_H

#include <string>
#include <vector>

#include "llvmderive/Frontend/TypeDefinition.h"
#include "llvmderive/Semantics/TypeResolution.h"

namespace llvmderive
{

/// @brief Spells member types of one definition as C++ types.
class TypeSpeller final
{
public:
    /// @brief Creates a speller for members of one definition.
    /// @param[in] owner Definition whose generic parameters are in scope.
    /// @param[in] index Definition index of the owning module.
    /// @param[in] namespaceComponents Namespace of the owning module.
    TypeSpeller(const TypeDefinition&           owner,
                const DefinitionIndex&          index,
                const std::vector<std::string>& namespaceComponents);

    /// @brief Spells one member type.
    /// @param[in] expr Resolved member type spelling.
    /// @return C++ type such as `std::optional<std::int32_t>`.
    std::string spell(const TypeExpr& expr) const;

    /// @brief Spells the owning definition with its generic parameters applied.
    /// @return Fully-qualified type such as `::demo::Pair<T>`.
    std::string spellSubject() const;

    /// @brief Sanitized generic parameter names of the owning definition.
    std::vector<std::string> genericParams() const;

private:
    std::string spellArgs(const std::vector<TypeExpr>& args) const;

    const TypeDefinition&           owner_;
    const DefinitionIndex&          index_;
    const std::vector<std::string>& namespaceComponents_;
};

}  // namespace llvmderive

#endif  // LLVMDERIVE_CODEGEN_TYPE_SPELLING_H
