//===----------------------------------------------------------------------===//
//
// Part of the llvm-derive project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Rendering of generated contracts as C++ template specializations.
///
//===----------------------------------------------------------------------===//
#ifndef LLVMDERIVE_CODEGEN_CONTRACT_RENDER_H
#define LLVMDERIVE_CODEGEN_CONTRACT_RENDER_H

#include <sstream>

#include "llvmderive/CodeGen/GeneratedContract.h"

namespace llvmderive
{

/// @brief Renders an `Encode<Subject, Backend>` specialization.
/// @param[in,out] out Destination stream.
/// @param[in] contract Contract to render.
void renderEncodeContract(std::ostringstream& out, const GeneratedContract& contract);

/// @brief Renders a `TypeInfo<Subject, Backend>` specialization.
/// @param[in,out] out Destination stream.
/// @param[in] typeInfo Type identity to render.
void renderTypeInfoContract(std::ostringstream& out, const GeneratedTypeInfo& typeInfo);

}  // namespace llvmderive

#endif  // LLVMDERIVE_CODEGEN_CONTRACT_RENDER_H
