//===----------------------------------------------------------------------===//
//
// Part of the llvm-derive project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Entry point for the `derivec` command-line contract generator.
///
/// This tool reads a type schema, resolves member types, classifies every
/// definition into an encode strategy and either prints the strategies
/// (`classify`) or emits a C++ header with the generated contracts (`cpp`).
///
//===----------------------------------------------------------------------===//

#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include "llvmderive/CodeGen/BackendCapabilities.h"
#include "llvmderive/CodeGen/CppEmitter.h"
#include "llvmderive/Driver/GenerationDriver.h"
#include "llvmderive/Frontend/SchemaReader.h"
#include "llvmderive/Semantics/StrategyPrinter.h"
#include "llvmderive/Semantics/TypeResolution.h"
#include "llvmderive/Support/Diagnostics.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"
#include "llvm/Support/InitLLVM.h"
#include "llvm/Support/raw_ostream.h"

namespace
{

/// @brief Checks whether a command token is implemented by `derivec`.
///
/// @param[in] command Command token from argv.
/// @return `true` if the command is one of the supported subcommands.
bool isKnownCommand(llvm::StringRef command)
{
    return command == "classify" || command == "cpp";
}

bool isHelpToken(llvm::StringRef arg)
{
    return arg == "--help" || arg == "-h";
}

/// @brief Prints compact usage guidance for invalid CLI invocations.
void printUsage()
{
    llvm::errs() << "Usage: derivec <classify|cpp> --schema <file> [options]\n"
                 << "Try: derivec --help\n";
}

/// @brief Prints the full help text and optional command-focused details.
///
/// @param[in] selectedCommand Optional command name used for focused help.
void printHelp(const std::string& selectedCommand = "")
{
    llvm::errs() << "NAME\n"
                 << "  derivec - derive database encode contracts for schema-described types\n\n"
                 << "SYNOPSIS\n"
                 << "  derivec <command> --schema <file> [options]\n"
                 << "  derivec --help\n"
                 << "  derivec <command> --help\n\n"
                 << "DESCRIPTION\n"
                 << "  derivec reads a JSON type schema, resolves member types, and classifies every\n"
                 << "  definition as transparent, weak-enum, strong-enum or record. Each definition gets\n"
                 << "  an encode contract and a type identity entry for the selected backend.\n\n"
                 << "COMMANDS\n"
                 << "  classify  Print the resolved encode strategy of every definition.\n"
                 << "  cpp       Generate a C++20 header with declarations and contracts.\n\n"
                 << "COMMON OPTIONS\n"
                 << "  --schema <file>\n"
                 << "      Schema document to read. Required for all commands except --help.\n"
                 << "  --backend <generic|postgres|mysql>\n"
                 << "      Backend capabilities used for generation (default: generic).\n"
                 << "      postgres enables composite records and named type identities.\n"
                 << "  --type <name>\n"
                 << "      Restrict generation to the named definition and its dependencies. Repeatable.\n"
                 << "  --jobs <N>\n"
                 << "      Number of worker threads used for generation (default: 1).\n"
                 << "  --verbose\n"
                 << "      Trace each classified definition to stderr.\n"
                 << "  --help, -h\n"
                 << "      Print this help text. With a command, prints command-focused guidance.\n\n"
                 << "CODEGEN OPTIONS (cpp)\n"
                 << "  --out-dir <dir>\n"
                 << "      Output directory for the generated header and runtime.\n"
                 << "  --header-name <stem>\n"
                 << "      Generated header stem (default: schema file stem).\n"
                 << "  --no-runtime\n"
                 << "      Do not copy llvmderive_runtime.hpp into the output directory.\n"
                 << "  --depfile\n"
                 << "      Write a make-style depfile next to the generated header.\n"
                 << "  --dry-run\n"
                 << "      Plan outputs without writing files.\n"
                 << "  --no-overwrite\n"
                 << "      Fail instead of replacing existing outputs.\n\n"
                 << "RUN SUMMARY\n"
                 << "  On successful command execution, derivec prints a summary to stderr with:\n"
                 << "    - files generated\n"
                 << "    - output root\n"
                 << "    - elapsed wall time\n\n"
                 << "EXAMPLES\n"
                 << "  derivec classify --schema types.json\n"
                 << "  derivec cpp --schema types.json --backend postgres --out-dir build/generated\n\n"
                 << "EXIT STATUS\n"
                 << "  0 on success, non-zero on schema/resolution/generation failure or invalid CLI usage.\n";

    if (!selectedCommand.empty() && isKnownCommand(selectedCommand))
    {
        llvm::errs() << "\nCOMMAND FOCUS (" << selectedCommand << ")\n";
        if (selectedCommand == "classify")
        {
            llvm::errs() << "  Emits one strategy line per definition to stdout. --out-dir is not used.\n";
        }
        else if (selectedCommand == "cpp")
        {
            llvm::errs() << "  Requires --out-dir. Honors --header-name, --no-runtime, --depfile, --dry-run and "
                            "--no-overwrite.\n";
        }
    }
}

/// @brief Emits collected diagnostics to stderr.
///
/// @param[in] diag Diagnostic engine containing accumulated diagnostics.
void printDiagnostics(const llvmderive::DiagnosticEngine& diag)
{
    for (const auto& d : diag.diagnostics())
    {
        llvm::errs() << d.str() << "\n";
    }
}

/// @brief Resolves a path to an absolute output-root string when possible.
///
/// @param[in] root Requested output directory.
/// @return Absolute path string when resolution succeeds; otherwise the original
///         input string (or `"stdout"` for empty input).
std::string resolveOutputRoot(const std::string& root)
{
    if (root.empty())
    {
        return "stdout";
    }
    std::error_code ec;
    const auto      abs = std::filesystem::absolute(root, ec);
    if (!ec)
    {
        return abs.string();
    }
    return root;
}

/// @brief Prints the post-run command summary.
///
/// @param[in] command Executed top-level command.
/// @param[in] outputRoot Resolved output root description.
/// @param[in] generatedFiles Number of generated files.
/// @param[in] elapsed Wall-clock execution duration.
void printRunSummary(llvm::StringRef                           command,
                     llvm::StringRef                           outputRoot,
                     const std::uint64_t                       generatedFiles,
                     const std::chrono::steady_clock::duration elapsed)
{
    const auto elapsedMs         = std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count();
    const auto elapsedWholeSec   = elapsedMs / 1000;
    const auto elapsedFractionMs = elapsedMs % 1000;
    llvm::errs() << "Run summary:\n"
                 << "  command: " << command << "\n"
                 << "  output root: " << outputRoot << "\n"
                 << "  files generated: " << generatedFiles << "\n"
                 << "  elapsed: " << elapsedWholeSec << ".";
    if (elapsedFractionMs < 100)
    {
        llvm::errs() << "0";
    }
    if (elapsedFractionMs < 10)
    {
        llvm::errs() << "0";
    }
    llvm::errs() << elapsedFractionMs << "s\n";
}

}  // namespace

/// @brief Program entry point for `derivec`.
///
/// @param[in] argc Argument count.
/// @param[in] argv Argument vector.
/// @return Zero on success, non-zero on CLI, schema, resolution or generation failure.
int main(int argc, char** argv)
{
    llvm::InitLLVM y(argc, argv);

    if (argc < 2)
    {
        printUsage();
        return 1;
    }

    const std::string command = argv[1];
    if (isHelpToken(command) || command == "help")
    {
        printHelp();
        return 0;
    }
    if (!isKnownCommand(command))
    {
        llvm::errs() << "Unknown command: " << command << "\n";
        printUsage();
        return 1;
    }

    std::string                    schemaPath;
    std::string                    outDir;
    std::string                    headerName;
    bool                           helpRequested = false;
    bool                           verbose       = false;
    llvmderive::GenerationOptions  generation;
    llvmderive::CppEmitOptions     emitOptions;

    for (int i = 2; i < argc; ++i)
    {
        const std::string arg          = argv[i];
        auto              requireValue = [&](const std::string& name) -> std::string {
            if (i + 1 >= argc)
            {
                llvm::errs() << "Missing value for " << name << "\n";
                printUsage();
                std::exit(1);
            }
            return argv[++i];
        };

        if (arg == "--schema")
        {
            schemaPath = requireValue(arg);
        }
        else if (isHelpToken(arg))
        {
            helpRequested = true;
        }
        else if (arg == "--out-dir")
        {
            outDir = requireValue(arg);
        }
        else if (arg == "--header-name")
        {
            headerName = requireValue(arg);
        }
        else if (arg == "--backend")
        {
            const auto value   = requireValue(arg);
            const auto backend = llvmderive::parseBackendSelection(value);
            if (!backend)
            {
                llvm::errs() << "Invalid --backend value: " << value << "\n";
                printUsage();
                return 1;
            }
            generation.backend = *backend;
        }
        else if (arg == "--type")
        {
            generation.selectedTypes.push_back(requireValue(arg));
        }
        else if (arg == "--jobs")
        {
            const auto            value = requireValue(arg);
            unsigned              jobs  = 0;
            const llvm::StringRef valueRef(value);
            if (valueRef.getAsInteger(10, jobs) || jobs == 0U)
            {
                llvm::errs() << "Invalid --jobs value: " << value << "\n";
                printUsage();
                return 1;
            }
            generation.jobs = jobs;
        }
        else if (arg == "--verbose")
        {
            verbose = true;
        }
        else if (arg == "--no-runtime")
        {
            emitOptions.emitRuntimeHeader = false;
        }
        else if (arg == "--depfile")
        {
            emitOptions.emitDepfile = true;
        }
        else if (arg == "--dry-run")
        {
            emitOptions.writePolicy.dryRun = true;
        }
        else if (arg == "--no-overwrite")
        {
            emitOptions.writePolicy.noOverwrite = true;
        }
        else
        {
            llvm::errs() << "Unknown argument: " << arg << "\n";
            printUsage();
            return 1;
        }
    }

    if (helpRequested)
    {
        printHelp(command);
        return 0;
    }

    if (schemaPath.empty())
    {
        llvm::errs() << "--schema is required\n";
        return 1;
    }

    const auto                   startTime = std::chrono::steady_clock::now();
    llvmderive::DiagnosticEngine diagnostics;
    auto                         finish = [&](const std::string& outputRoot, const std::uint64_t generatedFiles) -> int {
        printDiagnostics(diagnostics);
        printRunSummary(command, outputRoot, generatedFiles, std::chrono::steady_clock::now() - startTime);
        return diagnostics.hasErrors() ? 1 : 0;
    };

    auto module = llvmderive::readSchemaFile(schemaPath, diagnostics);
    if (!module)
    {
        llvm::errs() << llvm::toString(module.takeError()) << "\n";
        printDiagnostics(diagnostics);
        return 1;
    }

    const llvmderive::DefinitionIndex index(*module);
    auto                              resolution = llvmderive::resolveModuleTypes(*module, index, diagnostics);
    if (!resolution)
    {
        llvm::errs() << llvm::toString(resolution.takeError()) << "\n";
        printDiagnostics(diagnostics);
        return 1;
    }

    if (verbose)
    {
        generation.trace = &llvm::errs();
    }
    auto result = llvmderive::generateContracts(*module, index, *resolution, generation, diagnostics);
    if (!result)
    {
        llvm::errs() << llvm::toString(result.takeError()) << "\n";
        printDiagnostics(diagnostics);
        return 1;
    }

    if (command == "classify")
    {
        for (const auto& unit : result->units)
        {
            llvm::outs() << llvmderive::printStrategy(module->definitions[unit.definitionIndex].name, unit.strategy)
                         << "\n";
        }
        return finish("stdout", 0);
    }

    if (command == "cpp")
    {
        if (outDir.empty())
        {
            llvm::errs() << "--out-dir is required for 'cpp' command\n";
            return 1;
        }
        std::vector<std::string> outputs;
        emitOptions.outDir                      = outDir;
        emitOptions.headerName                  = headerName.empty()
                                                      ? std::filesystem::path(schemaPath).stem().string()
                                                      : headerName;
        emitOptions.writePolicy.recordedOutputs = &outputs;

        if (llvm::Error err = llvmderive::emitCpp(*module, index, *result, emitOptions, diagnostics))
        {
            llvm::errs() << llvm::toString(std::move(err)) << "\n";
            printDiagnostics(diagnostics);
            return 1;
        }

        return finish(resolveOutputRoot(outDir), emitOptions.writePolicy.dryRun ? 0U : outputs.size());
    }

    llvm::errs() << "Unhandled command path: " << command << "\n";
    return 1;
}
