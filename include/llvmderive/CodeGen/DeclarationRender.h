//===----------------------------------------------------------------------===//
//
// Part of the llvm-derive project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Rendering of C++ type declarations for classified definitions.
///
//===----------------------------------------------------------------------===//
#ifndef LLVMDERIVE_CODEGEN_DECLARATION_RENDER_H
#define LLVMDERIVE_CODEGEN_DECLARATION_RENDER_H

#include <sstream>

#include "llvmderive/CodeGen/TypeSpelling.h"
#include "llvmderive/Semantics/Strategy.h"

namespace llvmderive
{

/// @brief Renders the C++ declaration of one definition.
///
/// @details
/// Wrappers and records become aggregates with a defaulted equality operator;
/// enumerations become scoped enumerations with their effective discriminants.
/// Unsupported strategies render nothing.
///
/// @param[in,out] out Destination stream.
/// @param[in] def Definition to declare.
/// @param[in] strategy Strategy selected for `def`.
/// @param[in] speller Type speller for members of `def`.
void renderTypeDeclaration(std::ostringstream&   out,
                           const TypeDefinition& def,
                           const Strategy&       strategy,
                           const TypeSpeller&    speller);

}  // namespace llvmderive

#endif  // LLVMDERIVE_CODEGEN_DECLARATION_RENDER_H
