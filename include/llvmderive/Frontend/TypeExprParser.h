//===----------------------------------------------------------------------===//
//
// Part of the llvm-derive project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Parser for member type spellings used in schema documents.
///
/// Grammar: `type := name ('<' type (',' type)* '>')?` where `name` is an
/// identifier optionally qualified with `::` separators.
///
//===----------------------------------------------------------------------===//
#ifndef LLVMDERIVE_FRONTEND_TYPE_EXPR_PARSER_H
#define LLVMDERIVE_FRONTEND_TYPE_EXPR_PARSER_H

#include "llvmderive/Frontend/TypeDefinition.h"

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"

namespace llvmderive
{

/// @brief Parses one member type spelling.
/// @param[in] text Type spelling, e.g. `optional<i32>`.
/// @return Parsed expression or an error naming the offending column.
llvm::Expected<TypeExpr> parseTypeExpr(llvm::StringRef text);

}  // namespace llvmderive

#endif  // LLVMDERIVE_FRONTEND_TYPE_EXPR_PARSER_H
