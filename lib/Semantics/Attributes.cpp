//===----------------------------------------------------------------------===//
//
// Part of the llvm-derive project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

#include "llvmderive/Semantics/Attributes.h"

#include "llvm/ADT/StringSwitch.h"

namespace llvmderive
{

std::optional<IntegerRepr> parseIntegerRepr(llvm::StringRef text)
{
    return llvm::StringSwitch<std::optional<IntegerRepr>>(text)
        .Case("i8", IntegerRepr::I8)
        .Case("i16", IntegerRepr::I16)
        .Case("i32", IntegerRepr::I32)
        .Case("i64", IntegerRepr::I64)
        .Case("u8", IntegerRepr::U8)
        .Case("u16", IntegerRepr::U16)
        .Case("u32", IntegerRepr::U32)
        .Case("u64", IntegerRepr::U64)
        .Default(std::nullopt);
}

BuiltinType integerReprBuiltin(const IntegerRepr repr)
{
    switch (repr)
    {
    case IntegerRepr::I8:
        return BuiltinType::I8;
    case IntegerRepr::I16:
        return BuiltinType::I16;
    case IntegerRepr::I32:
        return BuiltinType::I32;
    case IntegerRepr::I64:
        return BuiltinType::I64;
    case IntegerRepr::U8:
        return BuiltinType::U8;
    case IntegerRepr::U16:
        return BuiltinType::U16;
    case IntegerRepr::U32:
        return BuiltinType::U32;
    case IntegerRepr::U64:
        return BuiltinType::U64;
    }
    return BuiltinType::I64;
}

llvm::StringRef integerReprName(const IntegerRepr repr)
{
    return builtinTypeName(integerReprBuiltin(repr));
}

}  // namespace llvmderive
