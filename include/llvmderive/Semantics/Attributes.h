//===----------------------------------------------------------------------===//
//
// Part of the llvm-derive project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Validated container and member attribute models.
///
/// Container options are `representation`, `rename` and `rename_all`; the only
/// member option is `rename`. Each value keeps the location it was read from so
/// shape-dependent checks can point at the offending attribute.
///
//===----------------------------------------------------------------------===//
#ifndef LLVMDERIVE_SEMANTICS_ATTRIBUTES_H
#define LLVMDERIVE_SEMANTICS_ATTRIBUTES_H

#include <optional>
#include <string>
#include <vector>

#include "llvmderive/Frontend/SourceLocation.h"
#include "llvmderive/Semantics/BuiltinTypes.h"
#include "llvmderive/Support/Casing.h"

#include "llvm/ADT/StringRef.h"

namespace llvmderive
{

/// @brief Integer type backing a weak enumeration.
enum class IntegerRepr
{
    I8,
    I16,
    I32,
    I64,
    U8,
    U16,
    U32,
    U64,
};

/// @brief Parses a representation spelling such as `i32`.
std::optional<IntegerRepr> parseIntegerRepr(llvm::StringRef text);

/// @brief Returns the builtin matching a representation.
BuiltinType integerReprBuiltin(IntegerRepr repr);

/// @brief Returns the schema spelling of a representation.
llvm::StringRef integerReprName(IntegerRepr repr);

/// @brief One validated attribute value with the location it came from.
template <typename T>
struct AttributeValue final
{
    T              value;
    SourceLocation location;
};

/// @brief Validated type-level metadata.
struct ContainerAttributes final
{
    /// @brief Integer representation; set only for weak enumerations.
    std::optional<AttributeValue<IntegerRepr>> representation;

    /// @brief Backend type name override.
    std::optional<AttributeValue<std::string>> rename;

    /// @brief Default label convention for strong enumeration variants.
    std::optional<AttributeValue<CasingConvention>> renameAll;
};

/// @brief Validated member-level metadata.
struct MemberAttributes final
{
    /// @brief Explicit wire label.
    std::optional<AttributeValue<std::string>> rename;
};

/// @brief Container metadata plus per-member metadata for one definition.
struct ResolvedAttributes final
{
    ContainerAttributes container;

    /// @brief Parallel to the definition's fields, or variants for enums.
    std::vector<MemberAttributes> members;
};

}  // namespace llvmderive

#endif  // LLVMDERIVE_SEMANTICS_ATTRIBUTES_H
