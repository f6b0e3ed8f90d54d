//===----------------------------------------------------------------------===//
//
// Part of the llvm-derive project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements the weak enumeration contract generator.
///
/// The enumeration is declared with its representation as the underlying type
/// and the declared discriminants, so a plain cast yields the wire value.
///
//===----------------------------------------------------------------------===//

#include "llvmderive/CodeGen/ContractGenerators.h"

namespace llvmderive
{

GeneratedContract generateWeakEnumContract(const ContractContext& ctx, const WeakEnumStrategy& strategy)
{
    GeneratedContract out;
    out.backend        = ctx.genericBackend();
    out.subject        = ctx.speller().spellSubject();
    out.templateParams = ctx.templateParams(out.backend);

    const std::string repr     = builtinCppSpelling(integerReprBuiltin(strategy.representation)).str();
    const std::string delegate = "Encode<" + repr + ", " + out.backend.name + ">";
    const std::string cast     = "static_cast<" + repr + ">(value)";

    out.constraints.push_back("Encodable<" + repr + ", " + out.backend.name + ">");
    out.encodeBody.push_back({0, delegate + "::encode(" + cast + ", buf);"});
    out.encodeNullableBody.push_back({0, "return " + delegate + "::encodeNullable(" + cast + ", buf);"});
    out.sizeHintBody.push_back({0, "return " + delegate + "::sizeHint(" + cast + ");"});
    return out;
}

}  // namespace llvmderive
