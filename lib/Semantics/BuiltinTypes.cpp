//===----------------------------------------------------------------------===//
//
// Part of the llvm-derive project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

#include "llvmderive/Semantics/BuiltinTypes.h"

#include <limits>

#include "llvm/ADT/StringSwitch.h"

namespace llvmderive
{

std::optional<BuiltinType> lookupBuiltinType(llvm::StringRef name)
{
    return llvm::StringSwitch<std::optional<BuiltinType>>(name)
        .Case("bool", BuiltinType::Bool)
        .Case("i8", BuiltinType::I8)
        .Case("i16", BuiltinType::I16)
        .Case("i32", BuiltinType::I32)
        .Case("i64", BuiltinType::I64)
        .Case("u8", BuiltinType::U8)
        .Case("u16", BuiltinType::U16)
        .Case("u32", BuiltinType::U32)
        .Case("u64", BuiltinType::U64)
        .Case("f32", BuiltinType::F32)
        .Case("f64", BuiltinType::F64)
        .Case("string", BuiltinType::String)
        .Case("bytes", BuiltinType::Bytes)
        .Default(std::nullopt);
}

llvm::StringRef builtinTypeName(const BuiltinType type)
{
    switch (type)
    {
    case BuiltinType::Bool:
        return "bool";
    case BuiltinType::I8:
        return "i8";
    case BuiltinType::I16:
        return "i16";
    case BuiltinType::I32:
        return "i32";
    case BuiltinType::I64:
        return "i64";
    case BuiltinType::U8:
        return "u8";
    case BuiltinType::U16:
        return "u16";
    case BuiltinType::U32:
        return "u32";
    case BuiltinType::U64:
        return "u64";
    case BuiltinType::F32:
        return "f32";
    case BuiltinType::F64:
        return "f64";
    case BuiltinType::String:
        return "string";
    case BuiltinType::Bytes:
        return "bytes";
    }
    return "unknown";
}

llvm::StringRef builtinCppSpelling(const BuiltinType type)
{
    switch (type)
    {
    case BuiltinType::Bool:
        return "bool";
    case BuiltinType::I8:
        return "std::int8_t";
    case BuiltinType::I16:
        return "std::int16_t";
    case BuiltinType::I32:
        return "std::int32_t";
    case BuiltinType::I64:
        return "std::int64_t";
    case BuiltinType::U8:
        return "std::uint8_t";
    case BuiltinType::U16:
        return "std::uint16_t";
    case BuiltinType::U32:
        return "std::uint32_t";
    case BuiltinType::U64:
        return "std::uint64_t";
    case BuiltinType::F32:
        return "float";
    case BuiltinType::F64:
        return "double";
    case BuiltinType::String:
        return "std::string";
    case BuiltinType::Bytes:
        return "std::vector<std::uint8_t>";
    }
    return "void";
}

bool isIntegerBuiltin(const BuiltinType type)
{
    switch (type)
    {
    case BuiltinType::I8:
    case BuiltinType::I16:
    case BuiltinType::I32:
    case BuiltinType::I64:
    case BuiltinType::U8:
    case BuiltinType::U16:
    case BuiltinType::U32:
    case BuiltinType::U64:
        return true;
    default:
        return false;
    }
}

bool integerBuiltinFits(const BuiltinType type, const std::int64_t value)
{
    const auto within = [value](const std::int64_t lo, const std::int64_t hi) { return value >= lo && value <= hi; };
    switch (type)
    {
    case BuiltinType::I8:
        return within(std::numeric_limits<std::int8_t>::min(), std::numeric_limits<std::int8_t>::max());
    case BuiltinType::I16:
        return within(std::numeric_limits<std::int16_t>::min(), std::numeric_limits<std::int16_t>::max());
    case BuiltinType::I32:
        return within(std::numeric_limits<std::int32_t>::min(), std::numeric_limits<std::int32_t>::max());
    case BuiltinType::I64:
        return true;
    case BuiltinType::U8:
        return within(0, std::numeric_limits<std::uint8_t>::max());
    case BuiltinType::U16:
        return within(0, std::numeric_limits<std::uint16_t>::max());
    case BuiltinType::U32:
        return within(0, std::numeric_limits<std::uint32_t>::max());
    case BuiltinType::U64:
        return value >= 0;
    default:
        return false;
    }
}

}  // namespace llvmderive
