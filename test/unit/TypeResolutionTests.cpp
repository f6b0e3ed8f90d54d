//===----------------------------------------------------------------------===//
//
// Part of the llvm-derive project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

#include <algorithm>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>

#include "llvmderive/Frontend/SchemaReader.h"
#include "llvmderive/Semantics/TypeResolution.h"
#include "llvmderive/Support/Diagnostics.h"

#include "llvm/Support/Error.h"

namespace
{

std::optional<llvmderive::SchemaModule> parseModule(const char* text)
{
    llvmderive::DiagnosticEngine diag;
    auto                         module = llvmderive::readSchemaText("resolve.json", text, diag);
    if (!module)
    {
        std::cerr << "fixture schema rejected: " << llvm::toString(module.takeError()) << "\n";
        return std::nullopt;
    }
    return std::move(*module);
}

bool expectResolutionError(const char* text, const llvmderive::DiagnosticCode code, std::string_view fragment)
{
    auto module = parseModule(text);
    if (!module)
    {
        return false;
    }
    const llvmderive::DefinitionIndex index(*module);
    llvmderive::DiagnosticEngine      diag;
    auto                              resolution = llvmderive::resolveModuleTypes(*module, index, diag);
    if (resolution)
    {
        std::cerr << "resolution unexpectedly succeeded for: " << text << "\n";
        return false;
    }
    llvm::consumeError(resolution.takeError());
    const bool found = std::any_of(diag.diagnostics().begin(), diag.diagnostics().end(), [&](const auto& d) {
        return d.code == code && d.message.find(fragment) != std::string::npos;
    });
    if (!found)
    {
        std::cerr << "expected " << llvmderive::diagnosticCodeName(code).str() << " containing '" << fragment
                  << "'\n";
        for (const auto& d : diag.diagnostics())
        {
            std::cerr << "  " << d.str() << "\n";
        }
        return false;
    }
    return true;
}

}  // namespace

bool runTypeResolutionTests()
{
    using llvmderive::DiagnosticCode;

    {
        // Declared out of dependency order on purpose.
        auto module = parseModule(R"({"types": [
            {"name": "Order", "kind": "struct", "fields": [
                {"name": "item", "type": "Item"}, {"name": "note", "type": "optional<Note>"},
                {"name": "when", "type": "::std::chrono::seconds"}]},
            {"name": "Item", "kind": "struct", "fields": [{"name": "id", "type": "Id"}]},
            {"name": "Id", "kind": "tuple_struct", "fields": [{"type": "i64"}]},
            {"name": "Note", "kind": "tuple_struct", "fields": [{"type": "string"}]}
        ]})");
        if (!module)
        {
            return false;
        }
        const llvmderive::DefinitionIndex index(*module);
        llvmderive::DiagnosticEngine      diag;
        auto                              resolution = llvmderive::resolveModuleTypes(*module, index, diag);
        if (!resolution)
        {
            std::cerr << "resolution failed: " << llvm::toString(resolution.takeError()) << "\n";
            return false;
        }
        const auto& order    = resolution->dependencyOrder;
        const auto  position = [&](std::size_t def) {
            return std::find(order.begin(), order.end(), def) - order.begin();
        };
        if (order.size() != 4U || position(2) > position(1) || position(1) > position(0) || position(3) > position(0))
        {
            std::cerr << "dependency order mismatch\n";
            return false;
        }
        if (resolution->dependencies[0] != std::vector<std::size_t>{1, 3})
        {
            std::cerr << "direct dependency list mismatch\n";
            return false;
        }
        const auto& orderDef = module->definitions[0];
        if (llvmderive::classifyTypeRef(orderDef, orderDef.fields[2].type, index) !=
                llvmderive::TypeRefKind::External ||
            llvmderive::classifyTypeRef(orderDef, orderDef.fields[1].type, index) !=
                llvmderive::TypeRefKind::Optional ||
            llvmderive::classifyTypeRef(orderDef, orderDef.fields[0].type, index) !=
                llvmderive::TypeRefKind::Definition)
        {
            std::cerr << "type reference classification mismatch\n";
            return false;
        }
    }

    {
        auto module = parseModule(R"({"types": [
            {"name": "Pair", "kind": "struct", "generics": ["T"], "fields": [
                {"name": "a", "type": "T"}, {"name": "b", "type": "optional<T>"}]},
            {"name": "Holder", "kind": "struct", "fields": [{"name": "p", "type": "Pair<i32>"}]}
        ]})");
        if (!module)
        {
            return false;
        }
        const llvmderive::DefinitionIndex index(*module);
        llvmderive::DiagnosticEngine      diag;
        auto                              resolution = llvmderive::resolveModuleTypes(*module, index, diag);
        if (!resolution)
        {
            std::cerr << "generic resolution failed: " << llvm::toString(resolution.takeError()) << "\n";
            return false;
        }
        if (llvmderive::classifyTypeRef(module->definitions[0], module->definitions[0].fields[0].type, index) !=
            llvmderive::TypeRefKind::GenericParam)
        {
            std::cerr << "generic parameter classification mismatch\n";
            return false;
        }
    }

    if (!expectResolutionError(R"({"types": [{"name": "A", "kind": "struct", "fields": [{"name": "x", "type": "Missing"}]}]})",
                               DiagnosticCode::UnresolvedType,
                               "unknown type 'Missing'") ||
        !expectResolutionError(R"({"types": [{"name": "A", "kind": "struct", "fields": [{"name": "x", "type": "i32<u8>"}]}]})",
                               DiagnosticCode::UnresolvedType,
                               "takes no type arguments") ||
        !expectResolutionError(
            R"({"types": [{"name": "A", "kind": "struct", "fields": [{"name": "x", "type": "optional<i32, i64>"}]}]})",
            DiagnosticCode::UnresolvedType,
            "exactly one type argument") ||
        !expectResolutionError(R"({"types": [
                {"name": "P", "kind": "struct", "generics": ["T"], "fields": [{"name": "a", "type": "T"}]},
                {"name": "A", "kind": "struct", "fields": [{"name": "x", "type": "P"}]}]})",
                               DiagnosticCode::UnresolvedType,
                               "expects 1 type argument(s), got 0") ||
        !expectResolutionError(R"({"types": [
                {"name": "A", "kind": "tuple_struct", "fields": [{"type": "i32"}]},
                {"name": "A", "kind": "tuple_struct", "fields": [{"type": "i64"}]}]})",
                               DiagnosticCode::DuplicateDefinition,
                               "already defined at resolve.json:/types/0") ||
        !expectResolutionError(R"({"types": [
                {"name": "A", "kind": "struct", "fields": [{"name": "b", "type": "B"}]},
                {"name": "B", "kind": "struct", "fields": [{"name": "a", "type": "optional<A>"}]}]})",
                               DiagnosticCode::DependencyCycle,
                               "A -> B -> A") ||
        !expectResolutionError(
            R"({"types": [{"name": "A", "kind": "struct", "generics": ["i32"], "fields": [{"name": "x", "type": "i32"}]}]})",
            DiagnosticCode::MalformedSchema,
            "shadows a type") ||
        !expectResolutionError(R"({"types": [{"name": "E", "kind": "enum", "variants": [
                {"name": "A", "discriminant": 1}, {"name": "B", "discriminant": 0}, {"name": "C"}]}]})",
                               DiagnosticCode::MalformedSchema,
                               "discriminant 1 of 'E::C' is already used by 'A'") ||
        !expectResolutionError(R"({"types": [{"name": "Kw", "kind": "enum", "variants": [
                {"name": "class"}, {"name": "class_"}]}]})",
                               DiagnosticCode::MalformedSchema,
                               "member 'class_' of 'Kw' and member 'class' both map to the C++ identifier 'class_'") ||
        !expectResolutionError(R"({"types": [{"name": "Row", "kind": "struct", "fields": [
                {"name": "new", "type": "i32"}, {"name": "new_", "type": "i64"}]}]})",
                               DiagnosticCode::MalformedSchema,
                               "member 'new_' of 'Row' and member 'new' both map to the C++ identifier 'new_'") ||
        !expectResolutionError(R"({"types": [
                {"name": "delete", "kind": "tuple_struct", "fields": [{"type": "i32"}]},
                {"name": "delete_", "kind": "tuple_struct", "fields": [{"type": "i64"}]}]})",
                               DiagnosticCode::MalformedSchema,
                               "type 'delete_' and type 'delete' both map to the C++ identifier 'delete_'"))
    {
        return false;
    }

    return true;
}
