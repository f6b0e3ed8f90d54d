//===----------------------------------------------------------------------===//
//
// Part of the llvm-derive project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Catalog of builtin member types understood by the schema front end.
///
//===----------------------------------------------------------------------===//
#ifndef LLVMDERIVE_SEMANTICS_BUILTIN_TYPES_H
#define LLVMDERIVE_SEMANTICS_BUILTIN_TYPES_H

#include <cstdint>
#include <optional>

#include "llvm/ADT/StringRef.h"

namespace llvmderive
{

/// @brief Scalar builtin member types.
enum class BuiltinType
{
    Bool,
    I8,
    I16,
    I32,
    I64,
    U8,
    U16,
    U32,
    U64,
    F32,
    F64,
    String,
    Bytes,
};

/// @brief Name of the single-argument nullable wrapper type.
inline constexpr llvm::StringLiteral kOptionalTypeName = "optional";

/// @brief Looks up a scalar builtin by schema spelling.
/// @param[in] name Schema spelling, e.g. `i32`.
/// @return Builtin type, or `std::nullopt` when not a scalar builtin.
std::optional<BuiltinType> lookupBuiltinType(llvm::StringRef name);

/// @brief Returns the schema spelling of a builtin.
llvm::StringRef builtinTypeName(BuiltinType type);

/// @brief Returns the C++ spelling of a builtin.
/// @param[in] type Builtin type.
/// @return Fully-qualified C++ type, e.g. `std::int32_t`.
llvm::StringRef builtinCppSpelling(BuiltinType type);

/// @brief Indicates whether a builtin is a fixed-width integer.
bool isIntegerBuiltin(BuiltinType type);

/// @brief Checks whether a value is representable by an integer builtin.
/// @param[in] type Integer builtin.
/// @param[in] value Candidate value.
/// @return True when `value` lies within the range of `type`.
bool integerBuiltinFits(BuiltinType type, std::int64_t value);

}  // namespace llvmderive

#endif  // LLVMDERIVE_SEMANTICS_BUILTIN_TYPES_H
