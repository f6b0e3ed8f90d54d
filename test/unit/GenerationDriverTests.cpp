//===----------------------------------------------------------------------===//
//
// Part of the llvm-derive project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

#include <algorithm>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "llvmderive/CodeGen/CppEmitter.h"
#include "llvmderive/Driver/GenerationDriver.h"
#include "llvmderive/Frontend/SchemaReader.h"
#include "llvmderive/Support/Diagnostics.h"

#include "llvm/Support/Error.h"
#include "llvm/Support/raw_ostream.h"

namespace
{

constexpr const char* kDriverSchema = R"({
  "namespace": "shop",
  "types": [
    {"name": "InventoryItem", "kind": "struct", "attributes": [{"name": "rename", "value": "inventory_item"}],
     "fields": [{"name": "name", "type": "string"}, {"name": "weight", "type": "optional<Grams>"}]},
    {"name": "Grams", "kind": "tuple_struct", "fields": [{"type": "i64"}]},
    {"name": "Weak", "kind": "enum", "attributes": [{"name": "representation", "value": "i32"}],
     "variants": [{"name": "One", "discriminant": 0}, {"name": "Two", "discriminant": 2}]},
    {"name": "Strong", "kind": "enum", "attributes": [{"name": "rename_all", "value": "lowercase"}],
     "variants": [{"name": "One"}, {"name": "Two"}]}
  ]
})";

struct DriverFixture final
{
    llvmderive::SchemaModule                     module;
    std::unique_ptr<llvmderive::DefinitionIndex> index;
    llvmderive::ModuleResolution                 resolution;
};

std::unique_ptr<DriverFixture> loadFixture(const char* text)
{
    llvmderive::DiagnosticEngine diag;
    auto                         module = llvmderive::readSchemaText("driver.json", text, diag);
    if (!module)
    {
        std::cerr << "driver fixture rejected: " << llvm::toString(module.takeError()) << "\n";
        return nullptr;
    }
    auto fixture    = std::make_unique<DriverFixture>();
    fixture->module = std::move(*module);
    fixture->index  = std::make_unique<llvmderive::DefinitionIndex>(fixture->module);
    auto resolution = llvmderive::resolveModuleTypes(fixture->module, *fixture->index, diag);
    if (!resolution)
    {
        std::cerr << "driver fixture failed to resolve: " << llvm::toString(resolution.takeError()) << "\n";
        return nullptr;
    }
    fixture->resolution = std::move(*resolution);
    return fixture;
}

std::vector<std::string> unitNames(const DriverFixture& fixture, const llvmderive::GenerationResult& result)
{
    std::vector<std::string> out;
    for (const auto& unit : result.units)
    {
        out.push_back(fixture.module.definitions[unit.definitionIndex].name);
    }
    return out;
}

bool hasDiagnostic(const llvmderive::DiagnosticEngine& diag,
                   const llvmderive::DiagnosticLevel   level,
                   const llvmderive::DiagnosticCode    code,
                   const std::string&                  fragment)
{
    const bool found = std::any_of(diag.diagnostics().begin(), diag.diagnostics().end(), [&](const auto& d) {
        return d.level == level && d.code == code && d.message.find(fragment) != std::string::npos;
    });
    if (!found)
    {
        std::cerr << "missing " << llvmderive::diagnosticCodeName(code).str() << " containing '" << fragment << "'\n";
        for (const auto& d : diag.diagnostics())
        {
            std::cerr << "  " << d.str() << "\n";
        }
    }
    return found;
}

}  // namespace

bool runGenerationDriverTests()
{
    using llvmderive::BackendSelection;
    using llvmderive::DiagnosticCode;
    using llvmderive::DiagnosticLevel;

    const auto fixture = loadFixture(kDriverSchema);
    if (!fixture)
    {
        return false;
    }

    {
        llvmderive::GenerationOptions options;
        options.backend = BackendSelection::Postgres;
        llvmderive::DiagnosticEngine diag;
        auto result = llvmderive::generateContracts(fixture->module, *fixture->index, fixture->resolution, options, diag);
        if (!result)
        {
            std::cerr << "postgres generation failed: " << llvm::toString(result.takeError()) << "\n";
            return false;
        }
        const auto names = unitNames(*fixture, *result);
        const auto grams = std::find(names.begin(), names.end(), "Grams");
        const auto item  = std::find(names.begin(), names.end(), "InventoryItem");
        if (names.size() != 4U || grams == names.end() || item == names.end() || grams > item)
        {
            std::cerr << "units must cover every definition with dependencies first\n";
            return false;
        }
        if (!diag.diagnostics().empty())
        {
            std::cerr << "clean schema produced diagnostics\n";
            return false;
        }
        const auto& itemUnit = result->units[static_cast<std::size_t>(item - names.begin())];
        if (!itemUnit.contract || itemUnit.typeInfos.size() != 1U || itemUnit.typeInfos[0].name != "inventory_item")
        {
            std::cerr << "postgres record unit is incomplete\n";
            return false;
        }

        const std::string header =
            llvmderive::renderCppHeader(fixture->module, *fixture->index, *result, "shop_derives", "runtime.hpp");
        const auto declGrams = header.find("struct Grams\n");
        const auto declItem  = header.find("struct InventoryItem\n");
        const auto runtimeNs = header.find("namespace llvmderive::runtime {\n");
        if (header.rfind("// Generated by derivec from driver.json. Do not edit.\n", 0) != 0 ||
            header.find("#ifndef LLVMDERIVE_GENERATED_SHOP_SHOP_DERIVES_HPP\n") == std::string::npos ||
            header.find("#include \"runtime.hpp\"\n") == std::string::npos ||
            header.find("namespace shop {\n") == std::string::npos || declGrams == std::string::npos ||
            declItem == std::string::npos || declGrams > declItem || runtimeNs == std::string::npos ||
            runtimeNs < declItem || header.find("struct Encode<::shop::InventoryItem, Postgres>") < runtimeNs ||
            header.find("std::optional<::shop::Grams> weight{};") == std::string::npos)
        {
            std::cerr << "rendered header layout mismatch:\n" << header;
            return false;
        }

        options.jobs = 4;
        llvmderive::DiagnosticEngine parallelDiag;
        auto parallel =
            llvmderive::generateContracts(fixture->module, *fixture->index, fixture->resolution, options, parallelDiag);
        if (!parallel)
        {
            std::cerr << "parallel generation failed: " << llvm::toString(parallel.takeError()) << "\n";
            return false;
        }
        if (llvmderive::renderCppHeader(fixture->module, *fixture->index, *parallel, "shop_derives", "runtime.hpp") !=
            header)
        {
            std::cerr << "parallel generation is not deterministic\n";
            return false;
        }
    }

    {
        llvmderive::GenerationOptions options;
        llvmderive::DiagnosticEngine  diag;
        auto result = llvmderive::generateContracts(fixture->module, *fixture->index, fixture->resolution, options, diag);
        if (!result)
        {
            std::cerr << "generic generation failed: " << llvm::toString(result.takeError()) << "\n";
            return false;
        }
        if (!hasDiagnostic(diag,
                           DiagnosticLevel::Note,
                           DiagnosticCode::ContractOmitted,
                           "record 'InventoryItem' is declared without an encode contract: backend 'generic'"))
        {
            return false;
        }
        for (const auto& unit : result->units)
        {
            if (fixture->module.definitions[unit.definitionIndex].name == "InventoryItem" &&
                (unit.contract || !unit.typeInfos.empty()))
            {
                std::cerr << "generic record unit must carry neither contract nor identity\n";
                return false;
            }
        }
    }

    {
        llvmderive::GenerationOptions options;
        options.selectedTypes = {"InventoryItem"};
        std::string              traceText;
        llvm::raw_string_ostream trace(traceText);
        options.trace   = &trace;
        options.backend = BackendSelection::Postgres;
        llvmderive::DiagnosticEngine diag;
        auto result = llvmderive::generateContracts(fixture->module, *fixture->index, fixture->resolution, options, diag);
        if (!result)
        {
            std::cerr << "selected generation failed: " << llvm::toString(result.takeError()) << "\n";
            return false;
        }
        if (unitNames(*fixture, *result) != std::vector<std::string>{"Grams", "InventoryItem"})
        {
            std::cerr << "selection must pull in dependencies in dependency order\n";
            return false;
        }
        trace.flush();
        if (traceText != "derivec: transparent Grams(i64)\n"
                         "derivec: record InventoryItem as \"inventory_item\" { name: string, weight: optional<Grams> }\n")
        {
            std::cerr << "trace output mismatch:\n" << traceText;
            return false;
        }
    }

    {
        llvmderive::GenerationOptions options;
        options.selectedTypes = {"Missing"};
        llvmderive::DiagnosticEngine diag;
        auto result = llvmderive::generateContracts(fixture->module, *fixture->index, fixture->resolution, options, diag);
        if (result)
        {
            std::cerr << "unknown selected type must fail\n";
            return false;
        }
        llvm::consumeError(result.takeError());
        if (!hasDiagnostic(diag, DiagnosticLevel::Error, DiagnosticCode::UnresolvedType, "selected type 'Missing'"))
        {
            return false;
        }
    }

    {
        const auto broken = loadFixture(R"({"types": [
            {"name": "Pair", "kind": "tuple_struct", "fields": [{"type": "i32"}, {"type": "i32"}]},
            {"name": "Ok", "kind": "tuple_struct", "fields": [{"type": "i32"}]},
            {"name": "Bad", "kind": "enum", "attributes": [{"name": "representation", "value": "i8"}],
             "variants": [{"name": "A", "discriminant": 300}]},
            {"name": "Dup", "kind": "enum", "attributes": [{"name": "rename_all", "value": "lowercase"}],
             "variants": [{"name": "Red"}, {"name": "RED"}]}
        ]})");
        if (!broken)
        {
            return false;
        }
        llvmderive::GenerationOptions options;
        options.jobs = 3;
        llvmderive::DiagnosticEngine diag;
        auto result = llvmderive::generateContracts(broken->module, *broken->index, broken->resolution, options, diag);
        if (result)
        {
            std::cerr << "schema with invalid shapes must fail generation\n";
            return false;
        }
        llvm::consumeError(result.takeError());
        if (!hasDiagnostic(diag, DiagnosticLevel::Error, DiagnosticCode::UnsupportedShape, "cannot derive an encoding for 'Pair'") ||
            !hasDiagnostic(diag,
                           DiagnosticLevel::Error,
                           DiagnosticCode::InvalidAttributeCombination,
                           "does not fit representation 'i8'") ||
            !hasDiagnostic(diag,
                           DiagnosticLevel::Warning,
                           DiagnosticCode::AmbiguousWireLabel,
                           "variants 'Red' and 'RED' of 'Dup' both encode as label 'red'"))
        {
            return false;
        }
        if (diag.count(DiagnosticLevel::Error) != 2U)
        {
            std::cerr << "each broken definition must report exactly one error\n";
            return false;
        }
    }

    return true;
}
