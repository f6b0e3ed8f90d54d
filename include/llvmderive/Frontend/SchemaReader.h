//===----------------------------------------------------------------------===//
//
// Part of the llvm-derive project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Schema reader declarations for loading type definitions from JSON documents.
///
/// A schema document describes one module of type definitions, each with its
/// structural shape, members, and the raw declarative attributes attached to
/// the type and its members.
///
//===----------------------------------------------------------------------===//
#ifndef LLVMDERIVE_FRONTEND_SCHEMA_READER_H
#define LLVMDERIVE_FRONTEND_SCHEMA_READER_H

#include "llvmderive/Frontend/TypeDefinition.h"

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"

namespace llvmderive
{
class DiagnosticEngine;

/// @file
/// @brief Schema document loading.

/// @brief Reads a schema document from disk.
/// @param[in] filePath Path to the JSON schema document.
/// @param[in,out] diagnostics Diagnostic sink for I/O and structural issues.
/// @return Schema module, or an error when the document is unusable.
llvm::Expected<SchemaModule> readSchemaFile(llvm::StringRef filePath, DiagnosticEngine& diagnostics);

/// @brief Reads a schema document from memory.
/// @param[in] filePath Path recorded in source locations.
/// @param[in] text JSON document text.
/// @param[in,out] diagnostics Diagnostic sink for structural issues.
/// @return Schema module, or an error when any structural issue was reported.
llvm::Expected<SchemaModule> readSchemaText(llvm::StringRef filePath, llvm::StringRef text, DiagnosticEngine& diagnostics);

}  // namespace llvmderive

#endif  // LLVMDERIVE_FRONTEND_SCHEMA_READER_H
