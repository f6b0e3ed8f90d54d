//===----------------------------------------------------------------------===//
//
// Part of the llvm-derive project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements container and member attribute validation.
///
/// Every entry point stops at the first violation, reports it with the
/// location of the offending attribute and returns an error.
///
//===----------------------------------------------------------------------===//

#include "llvmderive/Semantics/AttributeResolver.h"

#include "llvmderive/Support/Diagnostics.h"

#include <string>
#include <utility>

namespace llvmderive
{
namespace
{

constexpr const char* kRepresentation = "representation";
constexpr const char* kRename         = "rename";
constexpr const char* kRenameAll      = "rename_all";

llvm::Error fail(DiagnosticEngine&     diagnostics,
                 const DiagnosticCode  code,
                 const SourceLocation& location,
                 std::string           message)
{
    diagnostics.error(code, location, message);
    return llvm::createStringError(llvm::inconvertibleErrorCode(), "%s", message.c_str());
}

/// Rejects a value already seen for the same option.
template <typename T>
llvm::Error checkNotSeen(DiagnosticEngine&                       diagnostics,
                         const std::optional<AttributeValue<T>>& existing,
                         const RawAttribute&                     attribute)
{
    if (!existing)
    {
        return llvm::Error::success();
    }
    return fail(diagnostics,
                DiagnosticCode::DuplicateAttribute,
                attribute.location,
                "attribute '" + attribute.name + "' given more than once (first at " + existing->location.str() + ")");
}

llvm::Expected<std::string> requireValue(DiagnosticEngine& diagnostics, const RawAttribute& attribute)
{
    if (!attribute.value)
    {
        return fail(diagnostics,
                    DiagnosticCode::InvalidAttributeValue,
                    attribute.location,
                    "attribute '" + attribute.name + "' requires a string value");
    }
    return *attribute.value;
}

llvm::Expected<std::string> requireLabel(DiagnosticEngine& diagnostics, const RawAttribute& attribute)
{
    auto value = requireValue(diagnostics, attribute);
    if (!value)
    {
        return value.takeError();
    }
    if (value->empty())
    {
        return fail(diagnostics,
                    DiagnosticCode::InvalidAttributeValue,
                    attribute.location,
                    "attribute '" + attribute.name + "' requires a non-empty name");
    }
    return value;
}

template <typename T>
llvm::Error forbid(DiagnosticEngine&                       diagnostics,
                   const std::optional<AttributeValue<T>>& attribute,
                   const char* const                       name,
                   const std::string&                      rule)
{
    if (!attribute)
    {
        return llvm::Error::success();
    }
    return fail(diagnostics,
                DiagnosticCode::InvalidAttributeCombination,
                attribute->location,
                std::string("attribute '") + name + "' is not allowed: " + rule);
}

llvm::Expected<std::vector<MemberAttributes>> parseMembers(const TypeDefinition& def, DiagnosticEngine& diagnostics)
{
    std::vector<MemberAttributes> out;
    const auto                    parseAll = [&](const auto& members) -> llvm::Error {
        for (const auto& member : members)
        {
            auto attrs = parseMemberAttributes(member.attributes, diagnostics);
            if (!attrs)
            {
                return attrs.takeError();
            }
            out.push_back(std::move(*attrs));
        }
        return llvm::Error::success();
    };

    if (auto err = def.isEnum() ? parseAll(def.variants) : parseAll(def.fields))
    {
        return std::move(err);
    }
    return out;
}

llvm::Error checkTransparent(const TypeDefinition&             def,
                             const ContainerAttributes&        container,
                             const std::vector<MemberAttributes>& members,
                             DiagnosticEngine&                 diagnostics)
{
    const std::string rule = "'" + def.name + "' is transparent and encodes exactly as its inner field";
    if (auto err = forbid(diagnostics, container.representation, kRepresentation, rule))
    {
        return err;
    }
    if (auto err = forbid(diagnostics, container.renameAll, kRenameAll, rule))
    {
        return err;
    }
    if (auto err = forbid(diagnostics, container.rename, kRename, rule))
    {
        return err;
    }
    return forbid(diagnostics, members.front().rename, kRename, rule);
}

llvm::Error checkWeakEnum(const TypeDefinition&                def,
                          const ContainerAttributes&           container,
                          const std::vector<MemberAttributes>& members,
                          DiagnosticEngine&                    diagnostics)
{
    const std::string rule =
        "'" + def.name + "' has a representation and encodes as an integer, so labels have no meaning";
    if (!container.representation)
    {
        return fail(diagnostics,
                    DiagnosticCode::InvalidAttributeCombination,
                    def.location,
                    "enumeration '" + def.name + "' encoded as an integer requires 'representation'");
    }
    if (auto err = forbid(diagnostics, container.renameAll, kRenameAll, rule))
    {
        return err;
    }
    if (auto err = forbid(diagnostics, container.rename, kRename, rule))
    {
        return err;
    }
    for (const auto& member : members)
    {
        if (auto err = forbid(diagnostics, member.rename, kRename, rule))
        {
            return err;
        }
    }

    const IntegerRepr repr   = container.representation->value;
    const auto        values = effectiveDiscriminants(def);
    for (std::size_t i = 0; i < values.size(); ++i)
    {
        if (!integerBuiltinFits(integerReprBuiltin(repr), values[i]))
        {
            return fail(diagnostics,
                        DiagnosticCode::InvalidAttributeCombination,
                        def.variants[i].location,
                        "discriminant " + std::to_string(values[i]) + " of '" + def.name + "::" +
                            def.variants[i].name + "' does not fit representation '" + integerReprName(repr).str() +
                            "'");
        }
    }
    return llvm::Error::success();
}

llvm::Error checkStrongEnum(const TypeDefinition& def, const ContainerAttributes& container, DiagnosticEngine& diagnostics)
{
    return forbid(diagnostics,
                  container.representation,
                  kRepresentation,
                  "'" + def.name + "' is encoded as a text label");
}

llvm::Error checkRecord(const TypeDefinition&                def,
                        const ContainerAttributes&           container,
                        const std::vector<MemberAttributes>& members,
                        DiagnosticEngine&                    diagnostics)
{
    const std::string rule = "'" + def.name + "' is a record and its fields are positional on the wire";
    if (auto err = forbid(diagnostics, container.representation, kRepresentation, rule))
    {
        return err;
    }
    if (auto err = forbid(diagnostics, container.renameAll, kRenameAll, rule))
    {
        return err;
    }
    for (const auto& member : members)
    {
        if (auto err = forbid(diagnostics, member.rename, kRename, rule))
        {
            return err;
        }
    }
    return llvm::Error::success();
}

}  // namespace

llvm::Expected<ContainerAttributes> parseContainerAttributes(const TypeDefinition& def, DiagnosticEngine& diagnostics)
{
    ContainerAttributes out;
    for (const auto& attribute : def.attributes)
    {
        if (attribute.name == kRepresentation)
        {
            if (auto err = checkNotSeen(diagnostics, out.representation, attribute))
            {
                return std::move(err);
            }
            auto value = requireValue(diagnostics, attribute);
            if (!value)
            {
                return value.takeError();
            }
            const auto repr = parseIntegerRepr(*value);
            if (!repr)
            {
                return fail(diagnostics,
                            DiagnosticCode::InvalidAttributeValue,
                            attribute.location,
                            "representation '" + *value + "' is not one of i8, i16, i32, i64, u8, u16, u32, u64");
            }
            out.representation = AttributeValue<IntegerRepr>{*repr, attribute.location};
        }
        else if (attribute.name == kRename)
        {
            if (auto err = checkNotSeen(diagnostics, out.rename, attribute))
            {
                return std::move(err);
            }
            auto value = requireLabel(diagnostics, attribute);
            if (!value)
            {
                return value.takeError();
            }
            out.rename = AttributeValue<std::string>{std::move(*value), attribute.location};
        }
        else if (attribute.name == kRenameAll)
        {
            if (auto err = checkNotSeen(diagnostics, out.renameAll, attribute))
            {
                return std::move(err);
            }
            auto value = requireValue(diagnostics, attribute);
            if (!value)
            {
                return value.takeError();
            }
            const auto convention = parseCasingConvention(*value);
            if (!convention)
            {
                return fail(diagnostics,
                            DiagnosticCode::InvalidAttributeValue,
                            attribute.location,
                            "rename_all '" + *value +
                                "' is not one of lowercase, UPPERCASE, snake_case, SCREAMING_SNAKE_CASE, "
                                "kebab-case, camelCase, PascalCase");
            }
            out.renameAll = AttributeValue<CasingConvention>{*convention, attribute.location};
        }
        else
        {
            return fail(diagnostics,
                        DiagnosticCode::UnknownAttribute,
                        attribute.location,
                        "unknown attribute '" + attribute.name + "' on '" + def.name +
                            "' (expected representation, rename or rename_all)");
        }
    }
    return out;
}

llvm::Expected<MemberAttributes> parseMemberAttributes(const std::vector<RawAttribute>& attributes,
                                                       DiagnosticEngine&                diagnostics)
{
    MemberAttributes out;
    for (const auto& attribute : attributes)
    {
        if (attribute.name != kRename)
        {
            return fail(diagnostics,
                        DiagnosticCode::UnknownAttribute,
                        attribute.location,
                        "unknown member attribute '" + attribute.name + "' (expected rename)");
        }
        if (auto err = checkNotSeen(diagnostics, out.rename, attribute))
        {
            return std::move(err);
        }
        auto value = requireLabel(diagnostics, attribute);
        if (!value)
        {
            return value.takeError();
        }
        out.rename = AttributeValue<std::string>{std::move(*value), attribute.location};
    }
    return out;
}

llvm::Expected<ResolvedAttributes> resolveAttributes(const TypeDefinition&      def,
                                                     const ContainerAttributes& container,
                                                     const StrategyKind         kind,
                                                     DiagnosticEngine&          diagnostics)
{
    auto members = parseMembers(def, diagnostics);
    if (!members)
    {
        return members.takeError();
    }

    auto err = [&]() -> llvm::Error {
        switch (kind)
        {
        case StrategyKind::Transparent:
            return checkTransparent(def, container, *members, diagnostics);
        case StrategyKind::WeakEnum:
            return checkWeakEnum(def, container, *members, diagnostics);
        case StrategyKind::StrongEnum:
            return checkStrongEnum(def, container, diagnostics);
        case StrategyKind::Record:
            return checkRecord(def, container, *members, diagnostics);
        case StrategyKind::Unsupported:
            break;
        }
        return fail(diagnostics,
                    DiagnosticCode::UnsupportedShape,
                    def.location,
                    "'" + def.name + "' has no encodable shape");
    }();
    if (err)
    {
        return std::move(err);
    }

    ResolvedAttributes out;
    out.container = container;
    out.members   = std::move(*members);
    return out;
}

}  // namespace llvmderive
