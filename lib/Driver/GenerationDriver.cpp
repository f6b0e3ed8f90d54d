//===----------------------------------------------------------------------===//
//
// Part of the llvm-derive project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements the generation driver.
///
/// Per definition: parse container attributes, pick the strategy kind, report
/// unsupported shapes, validate attributes for the kind, build the strategy and
/// run the matching generator. Workers share only read-only inputs and write
/// into their own result slot.
///
//===----------------------------------------------------------------------===//

#include "llvmderive/Driver/GenerationDriver.h"

#include "llvmderive/CodeGen/ContractGenerators.h"
#include "llvmderive/Semantics/AttributeResolver.h"
#include "llvmderive/Semantics/ShapeClassifier.h"
#include "llvmderive/Semantics/StrategyPrinter.h"
#include "llvmderive/Support/Diagnostics.h"

#include <algorithm>
#include <atomic>
#include <thread>
#include <type_traits>
#include <utility>

namespace llvmderive
{
namespace
{

/// Result slot for one unit of work.
struct UnitOutcome final
{
    GenerationUnit   unit;
    DiagnosticEngine diagnostics;
    std::string      trace;
    bool             generated{false};
};

class UnitGenerator final
{
public:
    UnitGenerator(const SchemaModule& module, const DefinitionIndex& index, const GenerationOptions& options)
        : module_(module)
        , index_(index)
        , capabilities_(backendCapabilities(options.backend))
        , backendName_(backendSelectionName(options.backend).str())
        , tracing_(options.trace != nullptr)
    {
    }

    void run(const std::size_t position, UnitOutcome& outcome) const
    {
        const TypeDefinition& def   = module_.definitions[position];
        DiagnosticEngine&     diag  = outcome.diagnostics;
        outcome.unit.definitionIndex = position;

        auto container = parseContainerAttributes(def, diag);
        if (!container)
        {
            llvm::consumeError(container.takeError());
            return;
        }

        const StrategyKind kind = classifyShapeKind(def, container->representation.has_value());
        if (kind == StrategyKind::Unsupported)
        {
            diag.error(DiagnosticCode::UnsupportedShape,
                       def.location,
                       "cannot derive an encoding for '" + def.name + "': " + unsupportedShapeReason(def));
            return;
        }

        auto resolved = resolveAttributes(def, *container, kind, diag);
        if (!resolved)
        {
            llvm::consumeError(resolved.takeError());
            return;
        }

        outcome.unit.strategy = classify(def, *resolved);
        const ContractContext ctx(def, index_, module_.namespaceComponents, capabilities_);

        std::visit(
            [&](const auto& node) {
                using T = std::decay_t<decltype(node)>;
                if constexpr (std::is_same_v<T, TransparentStrategy>)
                {
                    outcome.unit.contract = generateTransparentContract(ctx, node);
                }
                else if constexpr (std::is_same_v<T, WeakEnumStrategy>)
                {
                    outcome.unit.contract = generateWeakEnumContract(ctx, node);
                }
                else if constexpr (std::is_same_v<T, StrongEnumStrategy>)
                {
                    reportAmbiguousLabels(def, node, diag);
                    outcome.unit.contract = generateStrongEnumContract(ctx, node);
                }
                else if constexpr (std::is_same_v<T, RecordStrategy>)
                {
                    outcome.unit.contract = generateRecordContract(ctx, node);
                    if (!outcome.unit.contract)
                    {
                        diag.note(DiagnosticCode::ContractOmitted,
                                  def.location,
                                  "record '" + def.name + "' is declared without an encode contract: backend '" +
                                      backendName_ + "' does not support composite records");
                    }
                }
            },
            outcome.unit.strategy);

        outcome.unit.typeInfos = generateTypeIdentity(ctx, outcome.unit.strategy);
        outcome.generated      = true;
        if (tracing_)
        {
            outcome.trace = "derivec: " + printStrategy(def.name, outcome.unit.strategy) + "\n";
        }
    }

private:
    static void reportAmbiguousLabels(const TypeDefinition&     def,
                                      const StrongEnumStrategy& strategy,
                                      DiagnosticEngine&         diag)
    {
        for (const auto& [first, later] : findAmbiguousLabels(strategy))
        {
            diag.warning(DiagnosticCode::AmbiguousWireLabel,
                         def.variants[later].location,
                         "variants '" + strategy.labels[first].variant + "' and '" + strategy.labels[later].variant +
                             "' of '" + def.name + "' both encode as label '" + strategy.labels[later].label + "'");
        }
    }

    const SchemaModule&    module_;
    const DefinitionIndex& index_;
    BackendCapabilities    capabilities_;
    std::string            backendName_;
    bool                   tracing_;
};

/// Selected definitions plus everything they depend on, in dependency order.
std::vector<std::size_t> selectWork(const SchemaModule&      module,
                                    const DefinitionIndex&   index,
                                    const ModuleResolution&  resolution,
                                    const GenerationOptions& options,
                                    DiagnosticEngine&        diagnostics)
{
    if (options.selectedTypes.empty())
    {
        return resolution.dependencyOrder;
    }

    std::vector<bool>        needed(module.definitions.size(), false);
    std::vector<std::size_t> pending;
    for (const auto& name : options.selectedTypes)
    {
        const auto position = index.indexOf(name);
        if (!position)
        {
            diagnostics.error(DiagnosticCode::UnresolvedType,
                              SourceLocation{module.filePath, ""},
                              "selected type '" + name + "' is not defined in the schema");
            continue;
        }
        pending.push_back(*position);
    }
    while (!pending.empty())
    {
        const std::size_t position = pending.back();
        pending.pop_back();
        if (needed[position])
        {
            continue;
        }
        needed[position] = true;
        for (const auto dep : resolution.dependencies[position])
        {
            pending.push_back(dep);
        }
    }

    std::vector<std::size_t> out;
    for (const auto position : resolution.dependencyOrder)
    {
        if (needed[position])
        {
            out.push_back(position);
        }
    }
    return out;
}

}  // namespace

llvm::Expected<GenerationResult> generateContracts(const SchemaModule&      module,
                                                   const DefinitionIndex&   index,
                                                   const ModuleResolution&  resolution,
                                                   const GenerationOptions& options,
                                                   DiagnosticEngine&        diagnostics)
{
    const std::vector<std::size_t> work = selectWork(module, index, resolution, options, diagnostics);
    if (diagnostics.hasErrors())
    {
        return llvm::createStringError(llvm::inconvertibleErrorCode(), "type selection failed");
    }

    const UnitGenerator      generator(module, index, options);
    std::vector<UnitOutcome> outcomes(work.size());

    const std::size_t workerCount =
        std::min<std::size_t>(std::max(options.jobs, 1U), std::max<std::size_t>(work.size(), 1U));
    if (workerCount <= 1U)
    {
        for (std::size_t i = 0; i < work.size(); ++i)
        {
            generator.run(work[i], outcomes[i]);
        }
    }
    else
    {
        std::atomic<std::size_t> next{0};
        const auto               worker = [&]() {
            for (std::size_t i = next.fetch_add(1U); i < work.size(); i = next.fetch_add(1U))
            {
                generator.run(work[i], outcomes[i]);
            }
        };
        std::vector<std::thread> threads;
        threads.reserve(workerCount);
        for (std::size_t t = 0; t < workerCount; ++t)
        {
            threads.emplace_back(worker);
        }
        for (auto& thread : threads)
        {
            thread.join();
        }
    }

    GenerationResult result;
    for (auto& outcome : outcomes)
    {
        diagnostics.append(outcome.diagnostics);
        if (options.trace != nullptr && !outcome.trace.empty())
        {
            *options.trace << outcome.trace;
        }
        if (outcome.generated)
        {
            result.units.push_back(std::move(outcome.unit));
        }
    }

    if (diagnostics.hasErrors())
    {
        return llvm::createStringError(llvm::inconvertibleErrorCode(), "contract generation failed");
    }
    return result;
}

}  // namespace llvmderive
