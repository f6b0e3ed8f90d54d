//===----------------------------------------------------------------------===//
//
// Part of the llvm-derive project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

#include <iostream>
#include <sstream>
#include <string>

#include "llvmderive/CodeGen/DeclarationRender.h"
#include "llvmderive/Frontend/SchemaReader.h"
#include "llvmderive/Semantics/AttributeResolver.h"
#include "llvmderive/Semantics/ShapeClassifier.h"
#include "llvmderive/Support/Diagnostics.h"

#include "llvm/Support/Error.h"

namespace
{

constexpr const char* kDeclarationSchema = R"({
  "namespace": "demo",
  "types": [
    {"name": "Meters", "kind": "tuple_struct", "fields": [{"type": "i32"}]},
    {"name": "Weak", "kind": "enum", "attributes": [{"name": "representation", "value": "u8"}],
     "variants": [{"name": "One", "discriminant": 1}, {"name": "Two"}]},
    {"name": "Mood", "kind": "enum", "variants": [{"name": "Happy"}, {"name": "Sad", "discriminant": 7}]},
    {"name": "Huge", "kind": "enum", "variants": [{"name": "Big", "discriminant": 5000000000}]},
    {"name": "Item", "kind": "struct",
     "fields": [{"name": "name", "type": "string"}, {"name": "class", "type": "optional<Meters>"}]},
    {"name": "Boxed", "kind": "tuple_struct", "generics": ["T"], "fields": [{"type": "optional<T>"}]}
  ]
})";

}  // namespace

bool runDeclarationRenderTests()
{
    llvmderive::DiagnosticEngine diag;
    auto                         module = llvmderive::readSchemaText("declarations.json", kDeclarationSchema, diag);
    if (!module)
    {
        std::cerr << "declaration fixture rejected: " << llvm::toString(module.takeError()) << "\n";
        return false;
    }
    const llvmderive::DefinitionIndex index(*module);

    const std::string expected[] = {
        "struct Meters\n"
        "{\n"
        "  std::int32_t value{};\n"
        "\n"
        "  bool operator==(const Meters&) const = default;\n"
        "};\n",

        "enum class Weak : std::uint8_t\n"
        "{\n"
        "  One = 1,\n"
        "  Two = 2,\n"
        "};\n",

        "enum class Mood\n"
        "{\n"
        "  Happy = 0,\n"
        "  Sad = 7,\n"
        "};\n",

        "enum class Huge : std::int64_t\n"
        "{\n"
        "  Big = 5000000000,\n"
        "};\n",

        "struct Item\n"
        "{\n"
        "  std::string name{};\n"
        "  std::optional<::demo::Meters> class_{};\n"
        "\n"
        "  bool operator==(const Item&) const = default;\n"
        "};\n",

        "template <typename T>\n"
        "struct Boxed\n"
        "{\n"
        "  std::optional<T> value{};\n"
        "\n"
        "  bool operator==(const Boxed&) const = default;\n"
        "};\n",
    };

    for (std::size_t i = 0; i < module->definitions.size(); ++i)
    {
        const auto& def       = module->definitions[i];
        auto        container = llvmderive::parseContainerAttributes(def, diag);
        if (!container)
        {
            std::cerr << llvm::toString(container.takeError()) << "\n";
            return false;
        }
        const auto kind     = llvmderive::classifyShapeKind(def, container->representation.has_value());
        auto       resolved = llvmderive::resolveAttributes(def, *container, kind, diag);
        if (!resolved)
        {
            std::cerr << llvm::toString(resolved.takeError()) << "\n";
            return false;
        }

        const llvmderive::TypeSpeller speller(def, index, module->namespaceComponents);
        std::ostringstream            out;
        llvmderive::renderTypeDeclaration(out, def, llvmderive::classify(def, *resolved), speller);
        if (out.str() != expected[i])
        {
            std::cerr << "declaration mismatch for '" << def.name << "':\n" << out.str() << "--- expected ---\n"
                      << expected[i];
            return false;
        }
    }
    return true;
}
