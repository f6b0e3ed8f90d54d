//===----------------------------------------------------------------------===//
//
// Part of the llvm-derive project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements the transparent wrapper contract generator.
///
/// A transparent wrapper has no wire presence of its own: every operation,
/// nullability included, is forwarded to the inner field's contract.
///
//===----------------------------------------------------------------------===//

#include "llvmderive/CodeGen/ContractGenerators.h"

namespace llvmderive
{

GeneratedContract generateTransparentContract(const ContractContext& ctx, const TransparentStrategy& strategy)
{
    GeneratedContract out;
    out.backend        = ctx.genericBackend();
    out.subject        = ctx.speller().spellSubject();
    out.templateParams = ctx.templateParams(out.backend);

    const std::string inner    = ctx.speller().spell(strategy.inner);
    const std::string delegate = "Encode<" + inner + ", " + out.backend.name + ">";
    const std::string member   = "value." + kTransparentMemberName.str();

    out.constraints.push_back("Encodable<" + inner + ", " + out.backend.name + ">");
    out.encodeBody.push_back({0, delegate + "::encode(" + member + ", buf);"});
    out.encodeNullableBody.push_back({0, "return " + delegate + "::encodeNullable(" + member + ", buf);"});
    out.sizeHintBody.push_back({0, "return " + delegate + "::sizeHint(" + member + ");"});
    return out;
}

}  // namespace llvmderive
