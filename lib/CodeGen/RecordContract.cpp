//===----------------------------------------------------------------------===//
//
// Part of the llvm-derive project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements the composite record contract generator.
///
/// Wire layout: a 4-byte field count, then per field a 4-byte type OID, a
/// 4-byte length (-1 for null) and the payload, in declaration order. The
/// per-field overhead is accounted for in `sizeHint` as `kPgRecordFieldOverhead`.
///
//===----------------------------------------------------------------------===//

#include "llvmderive/CodeGen/ContractGenerators.h"

namespace llvmderive
{

std::optional<GeneratedContract> generateRecordContract(const ContractContext& ctx, const RecordStrategy& strategy)
{
    if (!ctx.capabilities().compositeRecords)
    {
        return std::nullopt;
    }

    GeneratedContract out;
    out.backend        = ctx.concreteBackend();
    out.subject        = ctx.speller().spellSubject();
    out.templateParams = ctx.templateParams(out.backend);

    const std::string& backend  = out.backend.name;
    const std::string& typeName = ctx.definition().name;
    out.staticAssertions.push_back(
        {backend + "::kSupportsRecords", "backend '" + backend + "' does not encode composite records"});
    for (const auto& field : strategy.fields)
    {
        const std::string type = ctx.speller().spell(field.type);
        out.staticAssertions.push_back(
            {"Encodable<" + type + ", " + backend + ">",
             "field '" + field.name + "' of '" + typeName + "' has no " + backend + " encoding"});
        out.staticAssertions.push_back(
            {"HasTypeInfo<" + type + ", " + backend + ">",
             "field '" + field.name + "' of '" + typeName + "' has no " + backend + " type"});
    }

    out.helpers.push_back({0, "static constexpr std::size_t kColumnCount = " + std::to_string(strategy.fields.size()) + ";"});

    out.encodeBody.push_back({0, "PgRecordEncoder encoder(buf);"});
    for (const auto& field : strategy.fields)
    {
        out.encodeBody.push_back({0, "encoder.encode(value." + ContractContext::memberName(field.name) + ");"});
    }
    out.encodeBody.push_back({0, "encoder.finish();"});

    out.encodeNullableBody.push_back({0, "encode(value, buf);"});
    out.encodeNullableBody.push_back({0, "return IsNull::No;"});

    out.sizeHintBody.push_back({0, "return kColumnCount * kPgRecordFieldOverhead"});
    for (const auto& field : strategy.fields)
    {
        out.sizeHintBody.push_back({2,
                                    "+ Encode<" + ctx.speller().spell(field.type) + ", " + backend + ">::sizeHint(value." +
                                        ContractContext::memberName(field.name) + ")"});
    }
    out.sizeHintBody.back().text += ";";
    return out;
}

}  // namespace llvmderive
