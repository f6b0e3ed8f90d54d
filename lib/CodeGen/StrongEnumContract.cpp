//===----------------------------------------------------------------------===//
//
// Part of the llvm-derive project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements the strong enumeration contract generator.
///
/// The label table is fixed at generation time. The generated `label()` switch
/// covers every declared variant; values outside the declared set reach the
/// fallback and throw instead of encoding an arbitrary label.
///
//===----------------------------------------------------------------------===//

#include "llvmderive/CodeGen/ContractGenerators.h"
#include "llvmderive/CodeGen/LiteralRender.h"

namespace llvmderive
{

GeneratedContract generateStrongEnumContract(const ContractContext& ctx, const StrongEnumStrategy& strategy)
{
    GeneratedContract out;
    out.backend        = ctx.genericBackend();
    out.subject        = ctx.speller().spellSubject();
    out.templateParams = ctx.templateParams(out.backend);

    const std::string delegate = "Encode<std::string_view, " + out.backend.name + ">";
    out.constraints.push_back("Encodable<std::string_view, " + out.backend.name + ">");

    out.helpers.push_back({0, "static std::string_view label(const " + out.subject + "& value)"});
    out.helpers.push_back({0, "{"});
    out.helpers.push_back({1, "switch (value)"});
    out.helpers.push_back({1, "{"});
    for (const auto& entry : strategy.labels)
    {
        out.helpers.push_back({1, "case " + out.subject + "::" + ContractContext::memberName(entry.variant) + ":"});
        out.helpers.push_back({2, "return " + renderCppStringLiteral(entry.label) + ";"});
    }
    out.helpers.push_back({1, "}"});
    out.helpers.push_back({1,
                           "throwInvalidVariant(" + renderCppStringLiteral(ctx.definition().name) +
                               ", static_cast<std::int64_t>(value));"});
    out.helpers.push_back({0, "}"});

    out.encodeBody.push_back({0, delegate + "::encode(label(value), buf);"});
    out.encodeNullableBody.push_back({0, "return " + delegate + "::encodeNullable(label(value), buf);"});
    out.sizeHintBody.push_back({0, "return " + delegate + "::sizeHint(label(value));"});
    return out;
}

}  // namespace llvmderive
