//===----------------------------------------------------------------------===//
//
// Part of the llvm-derive project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements shape classification and strategy construction.
///
/// Classification looks only at the structural shape and at whether a
/// representation was given. Strategy construction assumes attributes were
/// already validated for that shape.
///
//===----------------------------------------------------------------------===//

#include "llvmderive/Semantics/ShapeClassifier.h"

#include "llvm/ADT/StringMap.h"

namespace llvmderive
{

StrategyKind classifyShapeKind(const TypeDefinition& def, const bool hasRepresentation)
{
    switch (def.shape)
    {
    case TypeShapeKind::TupleStruct:
        return def.fields.size() == 1U ? StrategyKind::Transparent : StrategyKind::Unsupported;
    case TypeShapeKind::Enum:
        if (def.variants.empty() || def.isGeneric())
        {
            return StrategyKind::Unsupported;
        }
        return hasRepresentation ? StrategyKind::WeakEnum : StrategyKind::StrongEnum;
    case TypeShapeKind::Struct:
        return def.fields.empty() ? StrategyKind::Unsupported : StrategyKind::Record;
    case TypeShapeKind::Union:
    case TypeShapeKind::UnitStruct:
        return StrategyKind::Unsupported;
    }
    return StrategyKind::Unsupported;
}

std::string unsupportedShapeReason(const TypeDefinition& def)
{
    switch (def.shape)
    {
    case TypeShapeKind::Union:
        return "unions are not supported";
    case TypeShapeKind::UnitStruct:
        return "unit structs are not supported";
    case TypeShapeKind::TupleStruct:
        return "structs with zero or more than one unnamed field are not supported (found " +
               std::to_string(def.fields.size()) + ")";
    case TypeShapeKind::Enum:
        if (def.variants.empty())
        {
            return "enumerations without variants are not supported";
        }
        return "generic enumerations are not supported";
    case TypeShapeKind::Struct:
        return "structs without fields are not supported";
    }
    return "unsupported shape";
}

Strategy classify(const TypeDefinition& def, const ResolvedAttributes& resolved)
{
    const auto& container = resolved.container;
    switch (classifyShapeKind(def, container.representation.has_value()))
    {
    case StrategyKind::Transparent:
        return TransparentStrategy{def.fields.front().type};

    case StrategyKind::WeakEnum: {
        WeakEnumStrategy out;
        out.representation = container.representation->value;
        const auto values  = effectiveDiscriminants(def);
        for (std::size_t i = 0; i < def.variants.size(); ++i)
        {
            out.variants.push_back(WeakEnumVariant{def.variants[i].name, values[i]});
        }
        return out;
    }

    case StrategyKind::StrongEnum: {
        StrongEnumStrategy out;
        out.typeName = container.rename ? container.rename->value : def.name;
        for (std::size_t i = 0; i < def.variants.size(); ++i)
        {
            const auto& variant = def.variants[i];
            std::string label;
            if (i < resolved.members.size() && resolved.members[i].rename)
            {
                label = resolved.members[i].rename->value;
            }
            else if (container.renameAll)
            {
                label = applyCasingConvention(variant.name, container.renameAll->value);
            }
            else
            {
                label = variant.name;
            }
            out.labels.push_back(EnumLabel{variant.name, std::move(label)});
        }
        return out;
    }

    case StrategyKind::Record: {
        RecordStrategy out;
        out.compositeTypeName = container.rename ? container.rename->value : def.name;
        for (const auto& field : def.fields)
        {
            out.fields.push_back(RecordField{field.name, field.type});
        }
        return out;
    }

    case StrategyKind::Unsupported:
        break;
    }
    return UnsupportedStrategy{unsupportedShapeReason(def)};
}

std::vector<std::pair<std::size_t, std::size_t>> findAmbiguousLabels(const StrongEnumStrategy& strategy)
{
    std::vector<std::pair<std::size_t, std::size_t>> out;
    llvm::StringMap<std::size_t>                     firstByLabel;
    for (std::size_t i = 0; i < strategy.labels.size(); ++i)
    {
        const auto [it, inserted] = firstByLabel.try_emplace(strategy.labels[i].label, i);
        if (!inserted)
        {
            out.emplace_back(it->second, i);
        }
    }
    return out;
}

}  // namespace llvmderive
