//===----------------------------------------------------------------------===//
//
// Part of the llvm-derive project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

#include <cstdint>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

#include "llvmderive/Frontend/SchemaReader.h"
#include "llvmderive/Support/Diagnostics.h"

#include "llvm/Support/Error.h"

namespace
{

bool hasDiagnostic(const llvmderive::DiagnosticEngine& diag,
                   const llvmderive::DiagnosticCode    code,
                   std::string_view                    pointer,
                   std::string_view                    messageFragment)
{
    for (const auto& d : diag.diagnostics())
    {
        if (d.code == code && d.location.pointer == pointer && d.message.find(messageFragment) != std::string::npos)
        {
            return true;
        }
    }
    return false;
}

void dump(const llvmderive::DiagnosticEngine& diag)
{
    for (const auto& d : diag.diagnostics())
    {
        std::cerr << "  " << d.str() << "\n";
    }
}

bool expectMalformed(const char* text, std::string_view pointer, std::string_view fragment)
{
    llvmderive::DiagnosticEngine diag;
    auto                         module = llvmderive::readSchemaText("bad.json", text, diag);
    if (module)
    {
        std::cerr << "malformed schema was accepted: " << text << "\n";
        return false;
    }
    llvm::consumeError(module.takeError());
    if (!hasDiagnostic(diag, llvmderive::DiagnosticCode::MalformedSchema, pointer, fragment))
    {
        std::cerr << "missing malformed-schema diagnostic at '" << pointer << "' containing '" << fragment << "'\n";
        dump(diag);
        return false;
    }
    return true;
}

}  // namespace

bool runSchemaReaderTests()
{
    {
        const char* text = R"json({
          "namespace": "shop.inventory",
          "types": [
            {"name": "Transparent", "kind": "tuple_struct", "fields": [{"type": "i32"}]},
            {"name": "Strong", "kind": "enum",
             "attributes": [{"name": "rename", "value": "text"}, {"name": "rename_all", "value": "lowercase"}],
             "variants": [{"name": "One"}, {"name": "Two", "discriminant": 7},
                          {"name": "Three", "attributes": [{"name": "rename", "value": "four"}]}]},
            {"name": "Pair", "kind": "struct", "generics": ["T"],
             "fields": [{"name": "first", "type": "T"}, {"name": "second", "type": "optional<T>"}]}
          ]
        })json";

        llvmderive::DiagnosticEngine diag;
        auto                         module = llvmderive::readSchemaText("derives.json", text, diag);
        if (!module)
        {
            std::cerr << "valid schema rejected: " << llvm::toString(module.takeError()) << "\n";
            dump(diag);
            return false;
        }
        if (module->namespaceComponents != std::vector<std::string>{"shop", "inventory"} ||
            module->definitions.size() != 3U)
        {
            std::cerr << "schema module shape mismatch\n";
            return false;
        }
        const auto& transparent = module->definitions[0];
        if (transparent.shape != llvmderive::TypeShapeKind::TupleStruct || transparent.fields.size() != 1U ||
            !transparent.fields[0].name.empty() || transparent.fields[0].type.name != "i32")
        {
            std::cerr << "tuple struct fields mismatch\n";
            return false;
        }
        const auto& strong = module->definitions[1];
        if (!strong.isEnum() || strong.variants.size() != 3U || strong.attributes.size() != 2U ||
            strong.variants[1].discriminant.value_or(-1) != 7 || strong.variants[2].attributes.size() != 1U ||
            strong.variants[2].attributes[0].value.value_or("") != "four")
        {
            std::cerr << "enum variants mismatch\n";
            return false;
        }
        if (strong.variants[2].location.str() != "derives.json:/types/1/variants/2")
        {
            std::cerr << "variant location mismatch: " << strong.variants[2].location.str() << "\n";
            return false;
        }
        if (llvmderive::effectiveDiscriminants(strong) != std::vector<std::int64_t>{0, 7, 8})
        {
            std::cerr << "effective discriminants mismatch\n";
            return false;
        }
        const auto& pair = module->definitions[2];
        if (!pair.isGeneric() || !pair.hasGenericParam("T") || pair.fields[1].type.str() != "optional<T>")
        {
            std::cerr << "generic struct mismatch\n";
            return false;
        }
        if (!diag.diagnostics().empty())
        {
            std::cerr << "valid schema produced diagnostics\n";
            dump(diag);
            return false;
        }
    }

    if (!expectMalformed("[1, 2]", "", "must be a JSON object") ||
        !expectMalformed(R"({"namespace": "a"})", "", "requires a 'types' array") ||
        !expectMalformed(R"({"types": [], "version": 2})", "/version", "unknown key 'version'") ||
        !expectMalformed(R"({"namespace": "a..b", "types": []})", "/namespace", "not a valid identifier") ||
        !expectMalformed(R"({"types": [{"name": "X", "kind": "class"}]})", "/types/0/kind", "unknown kind 'class'") ||
        !expectMalformed(R"({"types": [{"name": "9X", "kind": "struct"}]})", "/types/0/name", "not a valid identifier") ||
        !expectMalformed(R"({"types": [{"name": "E", "kind": "enum", "fields": []}]})",
                         "/types/0/fields",
                         "has no fields") ||
        !expectMalformed(R"({"types": [{"name": "S", "kind": "struct", "variants": []}]})",
                         "/types/0/variants",
                         "has no variants") ||
        !expectMalformed(
            R"({"types": [{"name": "T", "kind": "tuple_struct", "fields": [{"name": "a", "type": "i32"}]}]})",
            "/types/0/fields/0/name",
            "unnamed") ||
        !expectMalformed(
            R"({"types": [{"name": "S", "kind": "struct", "fields": [{"name": "a", "type": "i32"}, {"name": "a", "type": "i64"}]}]})",
            "/types/0/fields/1/name",
            "declared twice") ||
        !expectMalformed(
            R"({"types": [{"name": "S", "kind": "struct", "fields": [{"name": "a", "type": "optional<"}]}]})",
            "/types/0/fields/0/type",
            "expected identifier") ||
        !expectMalformed(
            R"({"types": [{"name": "E", "kind": "enum", "variants": [{"name": "A", "discriminant": 1.5}]}]})",
            "/types/0/variants/0/discriminant",
            "64-bit signed integer") ||
        !expectMalformed(R"({"types": [{"name": "S", "kind": "struct", "generics": ["T", "T"]}]})",
                         "/types/0/generics/1",
                         "declared twice") ||
        !expectMalformed(
            R"({"types": [{"name": "S", "kind": "struct", "attributes": [{"name": "rename", "value": 3}]}]})",
            "/types/0/attributes/0/value",
            "must be a string") ||
        !expectMalformed(R"({"types": [{"name": "S", "kind": "struct", "attributes": [{"name": ""}]}]})",
                         "/types/0/attributes/0",
                         "non-empty string 'name'"))
    {
        return false;
    }

    {
        llvmderive::DiagnosticEngine diag;
        auto module = llvmderive::readSchemaFile("/nonexistent/llvmderive/schema.json", diag);
        if (module)
        {
            std::cerr << "missing schema file was read\n";
            return false;
        }
        llvm::consumeError(module.takeError());
        if (!hasDiagnostic(diag, llvmderive::DiagnosticCode::MalformedSchema, "", "cannot read schema"))
        {
            std::cerr << "missing schema file produced no diagnostic\n";
            return false;
        }
    }

    return true;
}
