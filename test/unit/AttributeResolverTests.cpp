//===----------------------------------------------------------------------===//
//
// Part of the llvm-derive project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

#include <iostream>
#include <optional>
#include <string>
#include <string_view>

#include "llvmderive/Frontend/SchemaReader.h"
#include "llvmderive/Semantics/AttributeResolver.h"
#include "llvmderive/Semantics/ShapeClassifier.h"
#include "llvmderive/Support/Diagnostics.h"

#include "llvm/Support/Error.h"

namespace
{

std::optional<llvmderive::TypeDefinition> parseDefinition(const std::string& typeJson)
{
    llvmderive::DiagnosticEngine diag;
    auto module = llvmderive::readSchemaText("attrs.json", "{\"types\": [" + typeJson + "]}", diag);
    if (!module)
    {
        std::cerr << "fixture definition rejected: " << llvm::toString(module.takeError()) << "\n";
        return std::nullopt;
    }
    return module->definitions.front();
}

/// Runs both attribute phases the way the generation driver does.
llvm::Expected<llvmderive::ResolvedAttributes> resolve(const llvmderive::TypeDefinition& def,
                                                       llvmderive::DiagnosticEngine&    diag)
{
    auto container = llvmderive::parseContainerAttributes(def, diag);
    if (!container)
    {
        return container.takeError();
    }
    const auto kind = llvmderive::classifyShapeKind(def, container->representation.has_value());
    return llvmderive::resolveAttributes(def, *container, kind, diag);
}

bool expectRejected(const std::string&             typeJson,
                    const llvmderive::DiagnosticCode code,
                    std::string_view               pointer,
                    std::string_view               fragment)
{
    auto def = parseDefinition(typeJson);
    if (!def)
    {
        return false;
    }
    llvmderive::DiagnosticEngine diag;
    auto                         resolved = resolve(*def, diag);
    if (resolved)
    {
        std::cerr << "attributes unexpectedly accepted: " << typeJson << "\n";
        return false;
    }
    llvm::consumeError(resolved.takeError());
    if (diag.diagnostics().size() != 1U)
    {
        std::cerr << "expected exactly one diagnostic, got " << diag.diagnostics().size() << "\n";
        return false;
    }
    const auto& d = diag.diagnostics().front();
    if (d.code != code || d.location.pointer != pointer || d.message.find(fragment) == std::string::npos)
    {
        std::cerr << "diagnostic mismatch for " << typeJson << ": " << d.str() << "\n";
        return false;
    }
    return true;
}

}  // namespace

bool runAttributeResolverTests()
{
    using llvmderive::DiagnosticCode;

    {
        auto def = parseDefinition(R"({"name": "Strong", "kind": "enum",
            "attributes": [{"name": "rename", "value": "text"}, {"name": "rename_all", "value": "lowercase"}],
            "variants": [{"name": "One"}, {"name": "Two"},
                         {"name": "Three", "attributes": [{"name": "rename", "value": "four"}]}]})");
        if (!def)
        {
            return false;
        }
        llvmderive::DiagnosticEngine diag;
        auto                         resolved = resolve(*def, diag);
        if (!resolved)
        {
            std::cerr << "strong enum attributes rejected: " << llvm::toString(resolved.takeError()) << "\n";
            return false;
        }
        if (!resolved->container.rename || resolved->container.rename->value != "text" ||
            !resolved->container.renameAll ||
            resolved->container.renameAll->value != llvmderive::CasingConvention::Lowercase ||
            resolved->members.size() != 3U || resolved->members[0].rename || !resolved->members[2].rename ||
            resolved->members[2].rename->value != "four")
        {
            std::cerr << "strong enum resolved attributes mismatch\n";
            return false;
        }
        if (resolved->container.rename->location.pointer != "/types/0/attributes/0")
        {
            std::cerr << "attribute location not retained\n";
            return false;
        }
    }

    {
        auto def = parseDefinition(R"({"name": "Weak", "kind": "enum",
            "attributes": [{"name": "representation", "value": "u8"}],
            "variants": [{"name": "Low", "discriminant": 0}, {"name": "High", "discriminant": 255}]})");
        if (!def)
        {
            return false;
        }
        llvmderive::DiagnosticEngine diag;
        auto                         resolved = resolve(*def, diag);
        if (!resolved || resolved->container.representation->value != llvmderive::IntegerRepr::U8)
        {
            if (!resolved)
            {
                llvm::consumeError(resolved.takeError());
            }
            std::cerr << "weak enum representation mismatch\n";
            return false;
        }
    }

    {
        auto def = parseDefinition(R"({"name": "Item", "kind": "struct",
            "attributes": [{"name": "rename", "value": "inventory_item"}],
            "fields": [{"name": "name", "type": "string"}]})");
        if (!def)
        {
            return false;
        }
        llvmderive::DiagnosticEngine diag;
        auto                         resolved = resolve(*def, diag);
        if (!resolved || resolved->members.size() != 1U || !diag.diagnostics().empty())
        {
            if (!resolved)
            {
                llvm::consumeError(resolved.takeError());
            }
            std::cerr << "renamed record attributes rejected\n";
            return false;
        }
    }

    if (!expectRejected(R"({"name": "S", "kind": "struct", "attributes": [{"name": "transparent"}],
                            "fields": [{"name": "a", "type": "i32"}]})",
                        DiagnosticCode::UnknownAttribute,
                        "/types/0/attributes/0",
                        "unknown attribute 'transparent'") ||
        !expectRejected(R"({"name": "S", "kind": "struct",
                            "attributes": [{"name": "rename", "value": "a"}, {"name": "rename", "value": "b"}],
                            "fields": [{"name": "a", "type": "i32"}]})",
                        DiagnosticCode::DuplicateAttribute,
                        "/types/0/attributes/1",
                        "first at attrs.json:/types/0/attributes/0") ||
        !expectRejected(R"({"name": "E", "kind": "enum", "attributes": [{"name": "representation", "value": "i128"}],
                            "variants": [{"name": "A"}]})",
                        DiagnosticCode::InvalidAttributeValue,
                        "/types/0/attributes/0",
                        "representation 'i128'") ||
        !expectRejected(R"({"name": "E", "kind": "enum", "attributes": [{"name": "rename_all", "value": "Title Case"}],
                            "variants": [{"name": "A"}]})",
                        DiagnosticCode::InvalidAttributeValue,
                        "/types/0/attributes/0",
                        "rename_all 'Title Case'") ||
        !expectRejected(R"({"name": "E", "kind": "enum", "attributes": [{"name": "rename"}],
                            "variants": [{"name": "A"}]})",
                        DiagnosticCode::InvalidAttributeValue,
                        "/types/0/attributes/0",
                        "requires a string value") ||
        !expectRejected(R"({"name": "E", "kind": "enum", "attributes": [{"name": "rename", "value": ""}],
                            "variants": [{"name": "A"}]})",
                        DiagnosticCode::InvalidAttributeValue,
                        "/types/0/attributes/0",
                        "non-empty name") ||
        !expectRejected(R"({"name": "E", "kind": "enum",
                            "variants": [{"name": "A", "attributes": [{"name": "rename_all", "value": "lowercase"}]}]})",
                        DiagnosticCode::UnknownAttribute,
                        "/types/0/variants/0/attributes/0",
                        "unknown member attribute 'rename_all'") ||
        !expectRejected(R"({"name": "T", "kind": "tuple_struct", "attributes": [{"name": "rename", "value": "x"}],
                            "fields": [{"type": "i32"}]})",
                        DiagnosticCode::InvalidAttributeCombination,
                        "/types/0/attributes/0",
                        "is transparent") ||
        !expectRejected(R"({"name": "T", "kind": "tuple_struct",
                            "fields": [{"type": "i32", "attributes": [{"name": "rename", "value": "x"}]}]})",
                        DiagnosticCode::InvalidAttributeCombination,
                        "/types/0/fields/0/attributes/0",
                        "is transparent") ||
        !expectRejected(R"({"name": "W", "kind": "enum",
                            "attributes": [{"name": "representation", "value": "i32"}, {"name": "rename_all", "value": "lowercase"}],
                            "variants": [{"name": "A"}]})",
                        DiagnosticCode::InvalidAttributeCombination,
                        "/types/0/attributes/1",
                        "rename_all") ||
        !expectRejected(R"({"name": "W", "kind": "enum", "attributes": [{"name": "representation", "value": "i32"}],
                            "variants": [{"name": "A", "attributes": [{"name": "rename", "value": "a"}]}]})",
                        DiagnosticCode::InvalidAttributeCombination,
                        "/types/0/variants/0/attributes/0",
                        "encodes as an integer") ||
        !expectRejected(R"({"name": "W", "kind": "enum", "attributes": [{"name": "representation", "value": "i8"}],
                            "variants": [{"name": "A", "discriminant": 127}, {"name": "B"}]})",
                        DiagnosticCode::InvalidAttributeCombination,
                        "/types/0/variants/1",
                        "discriminant 128 of 'W::B' does not fit representation 'i8'") ||
        !expectRejected(R"({"name": "R", "kind": "struct", "attributes": [{"name": "representation", "value": "i32"}],
                            "fields": [{"name": "a", "type": "i32"}]})",
                        DiagnosticCode::InvalidAttributeCombination,
                        "/types/0/attributes/0",
                        "is a record") ||
        !expectRejected(R"({"name": "R", "kind": "struct", "attributes": [{"name": "rename_all", "value": "snake_case"}],
                            "fields": [{"name": "a", "type": "i32"}]})",
                        DiagnosticCode::InvalidAttributeCombination,
                        "/types/0/attributes/0",
                        "is a record") ||
        !expectRejected(R"({"name": "R", "kind": "struct",
                            "fields": [{"name": "a", "type": "i32", "attributes": [{"name": "rename", "value": "b"}]}]})",
                        DiagnosticCode::InvalidAttributeCombination,
                        "/types/0/fields/0/attributes/0",
                        "positional") ||
        !expectRejected(R"({"name": "U", "kind": "union", "fields": [{"name": "a", "type": "i32"}]})",
                        DiagnosticCode::UnsupportedShape,
                        "/types/0",
                        "no encodable shape"))
    {
        return false;
    }

    return true;
}
