//===----------------------------------------------------------------------===//
//
// Part of the llvm-derive project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Definition lookup and member type reference resolution.
///
/// Resolution validates every member type spelling of a schema module and
/// computes a deterministic order in which each definition follows all of the
/// definitions it holds by value.
///
//===----------------------------------------------------------------------===//
#ifndef LLVMDERIVE_SEMANTICS_TYPE_RESOLUTION_H
#define LLVMDERIVE_SEMANTICS_TYPE_RESOLUTION_H

#include <cstddef>
#include <optional>
#include <vector>

#include "llvmderive/Frontend/TypeDefinition.h"

#include "llvm/ADT/StringMap.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"

namespace llvmderive
{
class DiagnosticEngine;

/// @brief Category of a resolved member type reference.
enum class TypeRefKind
{
    /// @brief Scalar builtin such as `i32` or `string`.
    Builtin,

    /// @brief `optional<T>` wrapper.
    Optional,

    /// @brief Generic parameter of the owning definition.
    GenericParam,

    /// @brief Another definition of the same schema module.
    Definition,

    /// @brief `::`-qualified C++ type supplied by the consuming build.
    External,
};

/// @brief Lookup index for schema definitions by name.
class DefinitionIndex final
{
public:
    /// @brief Builds an index for a schema module.
    /// @param[in] module Module to index; must outlive the index.
    explicit DefinitionIndex(const SchemaModule& module);

    /// @brief Finds a definition by name.
    /// @param[in] name Definition name.
    /// @return Matching definition, or `nullptr` when missing.
    const TypeDefinition* find(llvm::StringRef name) const;

    /// @brief Finds the declaration position of a definition.
    std::optional<std::size_t> indexOf(llvm::StringRef name) const;

private:
    const SchemaModule*     module_;
    llvm::StringMap<std::size_t> byName_;
};

/// @brief Categorizes the head of one member type spelling.
/// @param[in] owner Definition that declares the member.
/// @param[in] expr Member type spelling.
/// @param[in] index Definition index of the owning module.
/// @return Reference kind, or `std::nullopt` when the name is unknown.
std::optional<TypeRefKind> classifyTypeRef(const TypeDefinition&  owner,
                                           const TypeExpr&        expr,
                                           const DefinitionIndex& index);

/// @brief Result of resolving a whole schema module.
struct ModuleResolution final
{
    /// @brief Definition positions, each after everything it depends on.
    std::vector<std::size_t> dependencyOrder;

    /// @brief Per-definition positions of the definitions it references.
    std::vector<std::vector<std::size_t>> dependencies;
};

/// @brief Validates member type references and orders definitions.
/// @param[in] module Schema module.
/// @param[in] index Definition index built over `module`.
/// @param[in,out] diagnostics Sink for duplicate, unresolved and cycle errors.
/// @return Resolution result, or an error when any error diagnostic was reported.
llvm::Expected<ModuleResolution> resolveModuleTypes(const SchemaModule&    module,
                                                    const DefinitionIndex& index,
                                                    DiagnosticEngine&      diagnostics);

}  // namespace llvmderive

#endif  // LLVMDERIVE_SEMANTICS_TYPE_RESOLUTION_H
