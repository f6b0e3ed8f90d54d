//===----------------------------------------------------------------------===//
//
// Part of the llvm-derive project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// C++ literal rendering helpers for generated code.
///
//===----------------------------------------------------------------------===//
#ifndef LLVMDERIVE_CODEGEN_LITERAL_RENDER_H
#define LLVMDERIVE_CODEGEN_LITERAL_RENDER_H

#include <cstdint>
#include <string>

#include "llvm/ADT/StringRef.h"

namespace llvmderive
{

/// @brief Renders text as a quoted C++ string literal.
/// @param[in] value Raw text; any byte value is allowed.
/// @return Literal with quotes, backslashes and non-printable bytes escaped.
std::string renderCppStringLiteral(llvm::StringRef value);

/// @brief Renders a signed integer as a C++ expression of its exact value.
/// @param[in] value Integer value.
/// @return Decimal literal; the minimum 64-bit value is rendered as an expression.
std::string renderCppIntegerLiteral(std::int64_t value);

}  // namespace llvmderive

#endif  // LLVMDERIVE_CODEGEN_LITERAL_RENDER_H
