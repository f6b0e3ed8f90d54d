//===----------------------------------------------------------------------===//
//
// Part of the llvm-derive project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

#include "llvmderive/CodeGen/EmitCommon.h"

#include "llvm/ADT/SmallString.h"
#include "llvm/Support/FileSystem.h"
#include "llvm/Support/Path.h"
#include "llvm/Support/raw_ostream.h"

#include <system_error>

namespace llvmderive
{

namespace
{

std::string absolutePath(llvm::StringRef path)
{
    llvm::SmallString<256> buffer(path);
    if (llvm::sys::fs::make_absolute(buffer))
    {
        // No usable working directory; keep the path as given.
        buffer = path;
    }
    llvm::sys::path::remove_dots(buffer, /*remove_dot_dot=*/true);
    return std::string(buffer.str());
}

void appendMakeEscaped(std::string& out, llvm::StringRef path)
{
    for (const char c : path)
    {
        if (c == '$')
        {
            out += "$$";
            continue;
        }
        if (c == ' ' || c == '#')
        {
            out += '\\';
        }
        out += c;
    }
}

}  // namespace

void emitLine(std::ostringstream& out, const int indent, const std::string& line)
{
    if (!line.empty())
    {
        out << std::string(static_cast<std::size_t>(indent) * 2U, ' ') << line;
    }
    out << '\n';
}

llvm::Error writeGeneratedFile(const std::filesystem::path& path, llvm::StringRef content, const EmitWritePolicy& policy)
{
    const std::string target = path.string();
    if (policy.recordedOutputs != nullptr)
    {
        policy.recordedOutputs->push_back(absolutePath(target));
    }
    if (policy.dryRun)
    {
        return llvm::Error::success();
    }

    const llvm::StringRef directory = llvm::sys::path::parent_path(target);
    if (!directory.empty())
    {
        if (const std::error_code ec = llvm::sys::fs::create_directories(directory))
        {
            return llvm::createStringError(ec, "cannot create output directory '%s'", directory.str().c_str());
        }
    }

    // Existing outputs are usually read-only; unlink instead of truncating.
    if (!policy.noOverwrite)
    {
        if (const std::error_code ec = llvm::sys::fs::remove(target))
        {
            return llvm::createStringError(ec, "cannot replace '%s'", target.c_str());
        }
    }

    std::error_code      ec;
    llvm::raw_fd_ostream os(target, ec, llvm::sys::fs::CD_CreateNew, llvm::sys::fs::FA_Write, llvm::sys::fs::OF_Text);
    if (ec == std::errc::file_exists)
    {
        return llvm::createStringError(ec, "refusing to overwrite existing output file: %s", target.c_str());
    }
    if (ec)
    {
        return llvm::createStringError(ec, "cannot open '%s' for writing", target.c_str());
    }
    os << content;
    os.close();
    if (os.has_error())
    {
        const std::error_code writeError = os.error();
        os.clear_error();
        return llvm::createStringError(writeError, "cannot write '%s'", target.c_str());
    }

    const auto mode = static_cast<llvm::sys::fs::perms>(policy.fileMode & llvm::sys::fs::all_perms);
    if (const std::error_code modeError = llvm::sys::fs::setPermissions(target, mode))
    {
        return llvm::createStringError(modeError, "cannot set mode %o on '%s'", policy.fileMode, target.c_str());
    }
    return llvm::Error::success();
}

std::string renderSchemaDepfile(llvm::StringRef headerPath, llvm::StringRef schemaPath)
{
    std::string rule;
    appendMakeEscaped(rule, headerPath);
    rule += ": ";
    appendMakeEscaped(rule, schemaPath);
    rule += '\n';
    return rule;
}

llvm::Error writeSchemaDepfile(const std::filesystem::path& headerPath,
                               const std::filesystem::path& schemaPath,
                               const EmitWritePolicy&       policy)
{
    const std::string rule =
        renderSchemaDepfile(absolutePath(headerPath.string()), absolutePath(schemaPath.string()));
    return writeGeneratedFile(headerPath.string() + ".d", rule, policy);
}

}  // namespace llvmderive
