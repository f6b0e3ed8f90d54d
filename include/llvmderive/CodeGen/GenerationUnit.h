//===----------------------------------------------------------------------===//
//
// Part of the llvm-derive project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Per-definition generation results handed from the driver to emitters.
///
//===----------------------------------------------------------------------===//
#ifndef LLVMDERIVE_CODEGEN_GENERATION_UNIT_H
#define LLVMDERIVE_CODEGEN_GENERATION_UNIT_H

#include <cstddef>
#include <optional>
#include <vector>

#include "llvmderive/CodeGen/GeneratedContract.h"
#include "llvmderive/Semantics/Strategy.h"

namespace llvmderive
{

/// @brief Generation output for one definition.
struct GenerationUnit final
{
    /// @brief Position of the definition in its schema module.
    std::size_t definitionIndex{0};

    /// @brief Selected strategy.
    Strategy strategy{UnsupportedStrategy{}};

    /// @brief Encode contract; empty when the backend cannot encode the shape.
    std::optional<GeneratedContract> contract;

    /// @brief Type-identity contracts.
    std::vector<GeneratedTypeInfo> typeInfos;
};

/// @brief Generation output for a schema module.
struct GenerationResult final
{
    /// @brief Units in dependency order.
    std::vector<GenerationUnit> units;
};

}  // namespace llvmderive

#endif  // LLVMDERIVE_CODEGEN_GENERATION_UNIT_H
