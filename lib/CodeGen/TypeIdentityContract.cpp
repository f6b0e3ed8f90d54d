//===----------------------------------------------------------------------===//
//
// Part of the llvm-derive project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements the type-identity contract generator.
///
/// Wrappers and weak enumerations report the identity of the type they encode
/// as. Strong enumerations and records name their backend type when the backend
/// supports named types; builtin PostgreSQL names map to fixed OIDs.
///
//===----------------------------------------------------------------------===//

#include "llvmderive/CodeGen/ContractGenerators.h"

#include <type_traits>

#include "llvm/ADT/StringSwitch.h"

namespace llvmderive
{
namespace
{

GeneratedTypeInfo inheritedTypeInfo(const ContractContext& ctx, const std::string& base)
{
    GeneratedTypeInfo out;
    out.backend        = ctx.genericBackend();
    out.subject        = ctx.speller().spellSubject();
    out.templateParams = ctx.templateParams(out.backend);
    out.constraints.push_back("HasTypeInfo<" + base + ", " + out.backend.name + ">");
    out.inheritFrom = "TypeInfo<" + base + ", " + out.backend.name + ">";
    return out;
}

GeneratedTypeInfo namedTypeInfo(const ContractContext& ctx, const std::string& typeName)
{
    GeneratedTypeInfo out;
    out.backend        = ctx.concreteBackend();
    out.subject        = ctx.speller().spellSubject();
    out.templateParams = ctx.templateParams(out.backend);
    out.oid            = pgBuiltinTypeOid(typeName);
    out.name           = typeName;
    return out;
}

}  // namespace

std::uint32_t pgBuiltinTypeOid(llvm::StringRef typeName)
{
    return llvm::StringSwitch<std::uint32_t>(typeName)
        .Case("bool", 16U)
        .Case("bytea", 17U)
        .Case("char", 18U)
        .Case("name", 19U)
        .Case("int8", 20U)
        .Case("int2", 21U)
        .Case("int4", 23U)
        .Case("text", 25U)
        .Case("oid", 26U)
        .Case("float4", 700U)
        .Case("float8", 701U)
        .Case("bpchar", 1042U)
        .Case("varchar", 1043U)
        .Case("record", 2249U)
        .Default(0U);
}

std::vector<GeneratedTypeInfo> generateTypeIdentity(const ContractContext& ctx, const Strategy& strategy)
{
    std::vector<GeneratedTypeInfo> out;
    const auto&                    caps = ctx.capabilities();
    std::visit(
        [&](const auto& node) {
            using T = std::decay_t<decltype(node)>;
            if constexpr (std::is_same_v<T, TransparentStrategy>)
            {
                out.push_back(inheritedTypeInfo(ctx, ctx.speller().spell(node.inner)));
            }
            else if constexpr (std::is_same_v<T, WeakEnumStrategy>)
            {
                out.push_back(
                    inheritedTypeInfo(ctx, builtinCppSpelling(integerReprBuiltin(node.representation)).str()));
            }
            else if constexpr (std::is_same_v<T, StrongEnumStrategy>)
            {
                out.push_back(inheritedTypeInfo(ctx, "std::string_view"));
                if (caps.namedTypeIdentity)
                {
                    out.push_back(namedTypeInfo(ctx, node.typeName));
                }
            }
            else if constexpr (std::is_same_v<T, RecordStrategy>)
            {
                if (caps.compositeRecords && caps.namedTypeIdentity)
                {
                    out.push_back(namedTypeInfo(ctx, node.compositeTypeName));
                }
            }
        },
        strategy);
    return out;
}

}  // namespace llvmderive
