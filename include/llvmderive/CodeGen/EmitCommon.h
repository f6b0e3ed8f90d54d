//===----------------------------------------------------------------------===//
//
// Part of the llvm-derive project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Line output and file-write helpers used by the header emitter.
///
//===----------------------------------------------------------------------===//
#ifndef LLVMDERIVE_CODEGEN_EMITCOMMON_H
#define LLVMDERIVE_CODEGEN_EMITCOMMON_H

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"

#include <cstdint>
#include <filesystem>
#include <sstream>
#include <string>
#include <vector>

namespace llvmderive
{

/// @brief How derivec touches the output directory.
struct EmitWritePolicy final
{
    /// @brief Report outputs without writing them.
    bool dryRun{false};

    /// @brief Fail instead of replacing a file that already exists.
    bool noOverwrite{false};

    /// @brief POSIX permission bits given to every written file.
    std::uint32_t fileMode{0444U};

    /// @brief When set, receives the absolute path of every output, dry run included.
    std::vector<std::string>* recordedOutputs{nullptr};
};

/// @brief Appends @p line to @p out, indented two spaces per level. Empty lines carry no indent.
void emitLine(std::ostringstream& out, int indent, const std::string& line);

/// @brief Writes @p content to @p path, creating parent directories as needed.
///
/// An existing file is replaced unless @ref EmitWritePolicy::noOverwrite is set,
/// in which case the write fails and the file is left untouched.
///
/// @return Success or an error naming the path that could not be written.
llvm::Error writeGeneratedFile(const std::filesystem::path& path, llvm::StringRef content, const EmitWritePolicy& policy);

/// @brief Renders the make rule `<header>: <schema>` with make-special characters escaped.
std::string renderSchemaDepfile(llvm::StringRef headerPath, llvm::StringRef schemaPath);

/// @brief Writes `<headerPath>.d` recording that the header depends on the schema file.
///
/// Both paths are made absolute before rendering so the rule is independent of the
/// build tool's working directory.
llvm::Error writeSchemaDepfile(const std::filesystem::path& headerPath,
                               const std::filesystem::path& schemaPath,
                               const EmitWritePolicy&       policy);

}  // namespace llvmderive

#endif  // LLVMDERIVE_CODEGEN_EMITCOMMON_H
