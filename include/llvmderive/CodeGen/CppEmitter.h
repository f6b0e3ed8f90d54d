//===----------------------------------------------------------------------===//
//
// Part of the llvm-derive project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Public entry points and options for C++ header emission.
///
//===----------------------------------------------------------------------===//
#ifndef LLVMDERIVE_CODEGEN_CPPEMITTER_H
#define LLVMDERIVE_CODEGEN_CPPEMITTER_H

#include "llvmderive/CodeGen/EmitCommon.h"
#include "llvmderive/CodeGen/GenerationUnit.h"

#include <string>

#include "llvm/Support/Error.h"

namespace llvmderive
{
class DiagnosticEngine;
class DefinitionIndex;
struct SchemaModule;

/// @brief File name of the runtime support header shipped next to generated code.
inline constexpr const char* kRuntimeHeaderName = "llvmderive_runtime.hpp";

/// @brief Configuration options for C++ header emission.
struct CppEmitOptions final
{
    /// @brief Output directory root.
    std::string outDir;

    /// @brief Generated header file stem; `.hpp` is appended.
    std::string headerName;

    /// @brief Include path the generated header uses for the runtime.
    std::string runtimeInclude{kRuntimeHeaderName};

    /// @brief Copies the runtime header into the output directory.
    bool emitRuntimeHeader{true};

    /// @brief Writes a make-style depfile next to the generated header.
    bool emitDepfile{false};

    /// @brief Output write policy.
    EmitWritePolicy writePolicy;
};

/// @brief Renders the generated header for one schema module.
/// @param[in] module Parsed schema module.
/// @param[in] index Definition lookup for the module.
/// @param[in] result Generated units in dependency order.
/// @param[in] headerName Header stem used for the include guard.
/// @param[in] runtimeInclude Include path of the runtime header.
/// @return Complete header text.
std::string renderCppHeader(const SchemaModule&     module,
                            const DefinitionIndex&  index,
                            const GenerationResult& result,
                            const std::string&      headerName,
                            const std::string&      runtimeInclude);

/// @brief Emits the generated header (and optionally runtime and depfile).
/// @param[in] module Parsed schema module.
/// @param[in] index Definition lookup for the module.
/// @param[in] result Generated units in dependency order.
/// @param[in] options Backend configuration.
/// @param[in,out] diagnostics Diagnostic sink; nothing is written when it holds errors.
/// @return Success or detailed failure.
llvm::Error emitCpp(const SchemaModule&     module,
                    const DefinitionIndex&  index,
                    const GenerationResult& result,
                    const CppEmitOptions&   options,
                    DiagnosticEngine&       diagnostics);

}  // namespace llvmderive

#endif  // LLVMDERIVE_CODEGEN_CPPEMITTER_H
