//===----------------------------------------------------------------------===//
//
// Part of the llvm-derive project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Encoding strategy model selected for each type definition.
///
//===----------------------------------------------------------------------===//
#ifndef LLVMDERIVE_SEMANTICS_STRATEGY_H
#define LLVMDERIVE_SEMANTICS_STRATEGY_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <variant>
#include <vector>

#include "llvmderive/Frontend/TypeDefinition.h"
#include "llvmderive/Semantics/Attributes.h"

namespace llvmderive
{

/// @brief Strategy family, decided before attributes are validated.
enum class StrategyKind
{
    /// @brief Single unnamed field; encodes exactly as its inner type.
    Transparent,

    /// @brief Enumeration encoded as its integer representation.
    WeakEnum,

    /// @brief Enumeration encoded as a text label.
    StrongEnum,

    /// @brief Named fields encoded as a composite record.
    Record,

    /// @brief Shape with no encoding.
    Unsupported,
};

/// @brief Returns a stable lowercase name for a strategy kind.
const char* strategyKindName(StrategyKind kind);

/// @brief Delegates to the single unnamed field.
struct TransparentStrategy final
{
    TypeExpr inner;
};

/// @brief One weak enumeration variant with its effective discriminant.
struct WeakEnumVariant final
{
    std::string  name;
    std::int64_t discriminant{0};
};

/// @brief Casts to the representation integer.
struct WeakEnumStrategy final
{
    IntegerRepr                  representation{IntegerRepr::I32};
    std::vector<WeakEnumVariant> variants;
};

/// @brief Variant to wire label mapping entry.
struct EnumLabel final
{
    std::string variant;
    std::string label;
};

/// @brief Encodes each variant as its label.
struct StrongEnumStrategy final
{
    /// @brief Labels in declaration order.
    std::vector<EnumLabel> labels;

    /// @brief Backend type name: container `rename` or the identifier.
    std::string typeName;
};

/// @brief One record column.
struct RecordField final
{
    std::string name;
    TypeExpr    type;
};

/// @brief Encodes fields positionally as a composite record.
struct RecordStrategy final
{
    /// @brief Columns in declaration order.
    std::vector<RecordField> fields;

    /// @brief Backend composite type name: container `rename` or the identifier.
    std::string compositeTypeName;
};

/// @brief No encoding exists for the shape.
struct UnsupportedStrategy final
{
    std::string reason;
};

/// @brief Strategy selected for one definition.
using Strategy =
    std::variant<TransparentStrategy, WeakEnumStrategy, StrongEnumStrategy, RecordStrategy, UnsupportedStrategy>;

/// @brief Returns the kind of a selected strategy.
StrategyKind strategyKindOf(const Strategy& strategy);

}  // namespace llvmderive

#endif  // LLVMDERIVE_SEMANTICS_STRATEGY_H
