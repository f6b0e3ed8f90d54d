//===----------------------------------------------------------------------===//
//
// Part of the llvm-derive project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements contract rendering.
///
/// Output is meant to be placed inside `namespace llvmderive::runtime`.
///
//===----------------------------------------------------------------------===//

#include "llvmderive/CodeGen/ContractRender.h"

#include "llvmderive/CodeGen/EmitCommon.h"
#include "llvmderive/CodeGen/LiteralRender.h"

#include <string>
#include <vector>

namespace llvmderive
{
namespace
{

void renderTemplateHead(std::ostringstream&             out,
                        const std::vector<std::string>& params,
                        const std::vector<std::string>& constraints)
{
    std::string head = "template <";
    for (std::size_t i = 0; i < params.size(); ++i)
    {
        if (i > 0)
        {
            head += ", ";
        }
        head += "typename " + params[i];
    }
    head += ">";
    emitLine(out, 0, head);

    for (std::size_t i = 0; i < constraints.size(); ++i)
    {
        emitLine(out, 2, std::string(i == 0 ? "requires " : "&& ") + constraints[i]);
    }
}

void renderBlock(std::ostringstream& out, const int indent, const std::vector<CodeLine>& lines)
{
    for (const auto& line : lines)
    {
        emitLine(out, indent + line.indent, line.text);
    }
}

void renderFunction(std::ostringstream& out, const std::string& signature, const std::vector<CodeLine>& body)
{
    emitLine(out, 1, signature);
    emitLine(out, 1, "{");
    renderBlock(out, 2, body);
    emitLine(out, 1, "}");
}

}  // namespace

void renderEncodeContract(std::ostringstream& out, const GeneratedContract& contract)
{
    renderTemplateHead(out, contract.templateParams, contract.constraints);
    emitLine(out, 0, "struct Encode<" + contract.subject + ", " + contract.backend.name + ">");
    emitLine(out, 0, "{");

    for (const auto& assertion : contract.staticAssertions)
    {
        emitLine(out, 1,
                 "static_assert(" + assertion.condition + ", " + renderCppStringLiteral(assertion.message) + ");");
    }
    if (!contract.staticAssertions.empty())
    {
        emitLine(out, 0, "");
    }
    if (!contract.helpers.empty())
    {
        renderBlock(out, 1, contract.helpers);
        emitLine(out, 0, "");
    }

    const std::string valueParam  = "const " + contract.subject + "& value";
    const std::string bufferParam = contract.backend.rawBufferType() + "& buf";
    renderFunction(out, "static void encode(" + valueParam + ", " + bufferParam + ")", contract.encodeBody);
    emitLine(out, 0, "");
    renderFunction(out, "static IsNull encodeNullable(" + valueParam + ", " + bufferParam + ")",
                   contract.encodeNullableBody);
    emitLine(out, 0, "");
    renderFunction(out, "static std::size_t sizeHint(" + valueParam + ")", contract.sizeHintBody);
    emitLine(out, 0, "};");
}

void renderTypeInfoContract(std::ostringstream& out, const GeneratedTypeInfo& typeInfo)
{
    renderTemplateHead(out, typeInfo.templateParams, typeInfo.constraints);
    std::string head = "struct TypeInfo<" + typeInfo.subject + ", " + typeInfo.backend.name + ">";
    if (typeInfo.inheritFrom)
    {
        emitLine(out, 0, head + " : " + *typeInfo.inheritFrom);
        emitLine(out, 0, "{");
        emitLine(out, 0, "};");
        return;
    }
    emitLine(out, 0, head);
    emitLine(out, 0, "{");
    emitLine(out, 1, "static constexpr std::uint32_t oid = " + std::to_string(typeInfo.oid) + "U;");
    emitLine(out, 1, "static constexpr std::string_view name = " + renderCppStringLiteral(typeInfo.name) + ";");
    emitLine(out, 0, "};");
}

}  // namespace llvmderive
