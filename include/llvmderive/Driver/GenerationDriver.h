//===----------------------------------------------------------------------===//
//
// Part of the llvm-derive project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Orchestration of attribute resolution, classification and generation.
///
/// Each selected definition is an independent unit of work. Units may run on
/// worker threads; their diagnostics are merged in dependency order so output
/// does not depend on the number of workers.
///
//===----------------------------------------------------------------------===//
#ifndef LLVMDERIVE_DRIVER_GENERATION_DRIVER_H
#define LLVMDERIVE_DRIVER_GENERATION_DRIVER_H

#include <string>
#include <vector>

#include "llvmderive/CodeGen/BackendCapabilities.h"
#include "llvmderive/CodeGen/GenerationUnit.h"
#include "llvmderive/Frontend/TypeDefinition.h"
#include "llvmderive/Semantics/TypeResolution.h"

#include "llvm/Support/Error.h"
#include "llvm/Support/raw_ostream.h"

namespace llvmderive
{
class DiagnosticEngine;

/// @brief Configuration options for contract generation.
struct GenerationOptions final
{
    /// @brief Backend the contracts are generated for.
    BackendSelection backend{BackendSelection::Generic};

    /// @brief Number of worker threads; values below one mean one.
    unsigned jobs{1};

    /// @brief Definitions to generate; empty selects all. Dependencies are added.
    std::vector<std::string> selectedTypes;

    /// @brief Optional sink of one trace line per generated definition.
    llvm::raw_ostream* trace{nullptr};
};

/// @brief Generates contracts for the selected definitions of a module.
/// @param[in] module Schema module.
/// @param[in] index Definition index built over `module`.
/// @param[in] resolution Type resolution of `module`.
/// @param[in] options Generation options.
/// @param[in,out] diagnostics Diagnostic sink.
/// @return Units in dependency order, or an error when any error diagnostic was reported.
llvm::Expected<GenerationResult> generateContracts(const SchemaModule&      module,
                                                   const DefinitionIndex&   index,
                                                   const ModuleResolution&  resolution,
                                                   const GenerationOptions& options,
                                                   DiagnosticEngine&        diagnostics);

}  // namespace llvmderive

#endif  // LLVMDERIVE_DRIVER_GENERATION_DRIVER_H
