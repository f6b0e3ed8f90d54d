//===----------------------------------------------------------------------===//
//
// Part of the llvm-derive project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

#include "llvmderive/CodeGen/DeclarationRender.h"

#include "llvmderive/CodeGen/ContractGenerators.h"
#include "llvmderive/CodeGen/EmitCommon.h"
#include "llvmderive/CodeGen/LiteralRender.h"
#include "llvmderive/CodeGen/NamingPolicy.h"

#include <algorithm>
#include <string>
#include <type_traits>
#include <vector>

namespace llvmderive
{
namespace
{

void renderTemplateHead(std::ostringstream& out, const TypeSpeller& speller)
{
    const auto params = speller.genericParams();
    if (params.empty())
    {
        return;
    }
    std::string head = "template <";
    for (std::size_t i = 0; i < params.size(); ++i)
    {
        if (i > 0)
        {
            head += ", ";
        }
        head += "typename " + params[i];
    }
    emitLine(out, 0, head + ">");
}

void renderAggregate(std::ostringstream&                                     out,
                     const std::string&                                      name,
                     const TypeSpeller&                                      speller,
                     const std::vector<std::pair<std::string, std::string>>& members)
{
    renderTemplateHead(out, speller);
    emitLine(out, 0, "struct " + name);
    emitLine(out, 0, "{");
    for (const auto& [type, member] : members)
    {
        emitLine(out, 1, type + " " + member + "{};");
    }
    emitLine(out, 0, "");
    emitLine(out, 1, "bool operator==(const " + name + "&) const = default;");
    emitLine(out, 0, "};");
}

void renderEnumeration(std::ostringstream&                                  out,
                       const std::string&                                   name,
                       const std::string&                                   underlying,
                       const std::vector<std::pair<std::string, std::int64_t>>& enumerators)
{
    emitLine(out, 0, "enum class " + name + (underlying.empty() ? "" : " : " + underlying));
    emitLine(out, 0, "{");
    for (const auto& [enumerator, value] : enumerators)
    {
        emitLine(out, 1, enumerator + " = " + renderCppIntegerLiteral(value) + ",");
    }
    emitLine(out, 0, "};");
}

}  // namespace

void renderTypeDeclaration(std::ostringstream&   out,
                           const TypeDefinition& def,
                           const Strategy&       strategy,
                           const TypeSpeller&    speller)
{
    const std::string name = sanitizeCppIdentifier(def.name);
    std::visit(
        [&](const auto& node) {
            using T = std::decay_t<decltype(node)>;
            if constexpr (std::is_same_v<T, TransparentStrategy>)
            {
                renderAggregate(out, name, speller, {{speller.spell(node.inner), kTransparentMemberName.str()}});
            }
            else if constexpr (std::is_same_v<T, WeakEnumStrategy>)
            {
                std::vector<std::pair<std::string, std::int64_t>> enumerators;
                for (const auto& variant : node.variants)
                {
                    enumerators.emplace_back(ContractContext::memberName(variant.name), variant.discriminant);
                }
                renderEnumeration(out,
                                  name,
                                  builtinCppSpelling(integerReprBuiltin(node.representation)).str(),
                                  enumerators);
            }
            else if constexpr (std::is_same_v<T, StrongEnumStrategy>)
            {
                const auto values = effectiveDiscriminants(def);
                std::vector<std::pair<std::string, std::int64_t>> enumerators;
                for (std::size_t i = 0; i < def.variants.size(); ++i)
                {
                    enumerators.emplace_back(ContractContext::memberName(def.variants[i].name), values[i]);
                }
                const bool wide = std::any_of(values.begin(), values.end(), [](const std::int64_t value) {
                    return !integerBuiltinFits(BuiltinType::I32, value);
                });
                renderEnumeration(out, name, wide ? "std::int64_t" : "", enumerators);
            }
            else if constexpr (std::is_same_v<T, RecordStrategy>)
            {
                std::vector<std::pair<std::string, std::string>> members;
                for (const auto& field : node.fields)
                {
                    members.emplace_back(speller.spell(field.type), ContractContext::memberName(field.name));
                }
                renderAggregate(out, name, speller, members);
            }
        },
        strategy);
}

}  // namespace llvmderive
