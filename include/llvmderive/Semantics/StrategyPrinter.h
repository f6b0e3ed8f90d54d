//===----------------------------------------------------------------------===//
//
// Part of the llvm-derive project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Human-readable rendering of selected strategies.
///
//===----------------------------------------------------------------------===//
#ifndef LLVMDERIVE_SEMANTICS_STRATEGY_PRINTER_H
#define LLVMDERIVE_SEMANTICS_STRATEGY_PRINTER_H

#include <string>

#include "llvmderive/Semantics/Strategy.h"

namespace llvmderive
{

/// @file
/// @brief Strategy pretty-printer entry points.

/// @brief Produces a one-line description of a strategy.
/// @param[in] typeName Name of the classified definition.
/// @param[in] strategy Selected strategy.
/// @return Text such as `weak-enum Weak : i32 { One = 0, Two = 2 }`.
std::string printStrategy(const std::string& typeName, const Strategy& strategy);

}  // namespace llvmderive

#endif  // LLVMDERIVE_SEMANTICS_STRATEGY_PRINTER_H
