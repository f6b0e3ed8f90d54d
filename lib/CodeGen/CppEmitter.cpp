//===----------------------------------------------------------------------===//
//
// Part of the llvm-derive project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements C++ header emission for derived encode contracts.
///
/// Layout of the emitted header: type declarations in the schema namespace,
/// then type identity entries and encode contracts inside the runtime
/// namespace, both in dependency order.
///
//===----------------------------------------------------------------------===//

#include "llvmderive/CodeGen/CppEmitter.h"

#include "llvmderive/CodeGen/ContractRender.h"
#include "llvmderive/CodeGen/DeclarationRender.h"
#include "llvmderive/CodeGen/NamingPolicy.h"
#include "llvmderive/CodeGen/TypeSpelling.h"
#include "llvmderive/Frontend/TypeDefinition.h"
#include "llvmderive/Semantics/TypeResolution.h"
#include "llvmderive/Support/Diagnostics.h"

#include <filesystem>
#include <fstream>
#include <sstream>

namespace llvmderive
{
namespace
{

void emitNamespaceOpen(std::ostringstream& out, const std::vector<std::string>& components)
{
    if (components.empty())
    {
        return;
    }
    out << "namespace " << cppNamespacePath(components) << " {\n\n";
}

void emitNamespaceClose(std::ostringstream& out, const std::vector<std::string>& components)
{
    if (components.empty())
    {
        return;
    }
    out << "\n}  // namespace " << cppNamespacePath(components) << "\n";
}

llvm::Expected<std::string> loadCppRuntimeHeader()
{
    const std::filesystem::path absoluteRuntimeHeader =
        std::filesystem::path(LLVMDERIVE_SOURCE_DIR) / "runtime" / "cpp" / kRuntimeHeaderName;
    std::ifstream in(absoluteRuntimeHeader.string());
    if (!in)
    {
        in.open((std::filesystem::path("runtime") / "cpp" / kRuntimeHeaderName).string());
    }
    if (!in)
    {
        return llvm::createStringError(llvm::inconvertibleErrorCode(), "failed to read C++ runtime header");
    }
    std::ostringstream content;
    content << in.rdbuf();
    return content.str();
}

}  // namespace

std::string renderCppHeader(const SchemaModule&     module,
                            const DefinitionIndex&  index,
                            const GenerationResult& result,
                            const std::string&      headerName,
                            const std::string&      runtimeInclude)
{
    const std::string guard = cppHeaderGuard(module.namespaceComponents, headerName);
    std::ostringstream out;

    out << "// Generated by derivec from " << std::filesystem::path(module.filePath).filename().string()
        << ". Do not edit.\n";
    out << "#ifndef " << guard << "\n";
    out << "#define " << guard << "\n\n";
    for (const char* header : {"cstddef", "cstdint", "optional", "string", "string_view", "vector"})
    {
        out << "#include <" << header << ">\n";
    }
    out << "\n#include \"" << runtimeInclude << "\"\n\n";

    emitNamespaceOpen(out, module.namespaceComponents);
    bool first = true;
    for (const auto& unit : result.units)
    {
        const TypeDefinition& def = module.definitions[unit.definitionIndex];
        const TypeSpeller     speller(def, index, module.namespaceComponents);
        if (!first)
        {
            out << "\n";
        }
        first = false;
        renderTypeDeclaration(out, def, unit.strategy, speller);
    }
    emitNamespaceClose(out, module.namespaceComponents);

    out << "\nnamespace llvmderive::runtime {\n";
    for (const auto& unit : result.units)
    {
        const TypeDefinition& def = module.definitions[unit.definitionIndex];
        out << "\n// " << def.name << "\n";
        for (const auto& typeInfo : unit.typeInfos)
        {
            renderTypeInfoContract(out, typeInfo);
            out << "\n";
        }
        if (unit.contract)
        {
            renderEncodeContract(out, *unit.contract);
        }
    }
    out << "\n}  // namespace llvmderive::runtime\n";

    out << "\n#endif  // " << guard << "\n";
    return out.str();
}

llvm::Error emitCpp(const SchemaModule&     module,
                    const DefinitionIndex&  index,
                    const GenerationResult& result,
                    const CppEmitOptions&   options,
                    DiagnosticEngine&       diagnostics)
{
    if (diagnostics.hasErrors())
    {
        return llvm::createStringError(llvm::inconvertibleErrorCode(),
                                       "refusing to emit C++ for a schema with errors");
    }
    if (options.outDir.empty())
    {
        return llvm::createStringError(llvm::inconvertibleErrorCode(), "output directory is required");
    }
    if (options.headerName.empty())
    {
        return llvm::createStringError(llvm::inconvertibleErrorCode(), "header name is required");
    }

    const std::filesystem::path outRoot(options.outDir);
    const std::filesystem::path headerPath = outRoot / (options.headerName + ".hpp");

    if (options.emitRuntimeHeader)
    {
        auto runtime = loadCppRuntimeHeader();
        if (!runtime)
        {
            return runtime.takeError();
        }
        if (auto err = writeGeneratedFile(outRoot / kRuntimeHeaderName, *runtime, options.writePolicy))
        {
            return err;
        }
    }

    const std::string header =
        renderCppHeader(module, index, result, options.headerName, options.runtimeInclude);
    if (auto err = writeGeneratedFile(headerPath, header, options.writePolicy))
    {
        return err;
    }

    if (options.emitDepfile)
    {
        return writeSchemaDepfile(headerPath, module.filePath, options.writePolicy);
    }
    return llvm::Error::success();
}

}  // namespace llvmderive
