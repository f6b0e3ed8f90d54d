//===----------------------------------------------------------------------===//
//
// Part of the llvm-derive project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements definition lookup, type reference checks and dependency ordering.
///
/// Dependencies are collected per definition, de-duplicated and kept in first
/// reference order so that the emitted declaration order is reproducible.
///
//===----------------------------------------------------------------------===//

#include "llvmderive/Semantics/TypeResolution.h"

#include "llvmderive/CodeGen/NamingPolicy.h"
#include "llvmderive/Semantics/BuiltinTypes.h"
#include "llvmderive/Support/Diagnostics.h"

#include "llvm/ADT/StringMap.h"

#include <algorithm>
#include <string>

namespace llvmderive
{

DefinitionIndex::DefinitionIndex(const SchemaModule& module)
    : module_(&module)
{
    for (std::size_t i = 0; i < module.definitions.size(); ++i)
    {
        byName_.try_emplace(module.definitions[i].name, i);
    }
}

const TypeDefinition* DefinitionIndex::find(llvm::StringRef name) const
{
    const auto position = indexOf(name);
    return position ? &module_->definitions[*position] : nullptr;
}

std::optional<std::size_t> DefinitionIndex::indexOf(llvm::StringRef name) const
{
    const auto it = byName_.find(name);
    if (it == byName_.end())
    {
        return std::nullopt;
    }
    return it->second;
}

std::optional<TypeRefKind> classifyTypeRef(const TypeDefinition&  owner,
                                           const TypeExpr&        expr,
                                           const DefinitionIndex& index)
{
    if (expr.isQualified())
    {
        return TypeRefKind::External;
    }
    if (owner.hasGenericParam(expr.name))
    {
        return TypeRefKind::GenericParam;
    }
    if (expr.name == kOptionalTypeName)
    {
        return TypeRefKind::Optional;
    }
    if (lookupBuiltinType(expr.name))
    {
        return TypeRefKind::Builtin;
    }
    if (index.find(expr.name) != nullptr)
    {
        return TypeRefKind::Definition;
    }
    return std::nullopt;
}

namespace
{

class ModuleResolver final
{
public:
    ModuleResolver(const SchemaModule& module, const DefinitionIndex& index, DiagnosticEngine& diagnostics)
        : module_(module)
        , index_(index)
        , diagnostics_(diagnostics)
    {
    }

    llvm::Expected<ModuleResolution> run()
    {
        checkDuplicateDefinitions();

        result_.dependencies.resize(module_.definitions.size());
        for (std::size_t i = 0; i < module_.definitions.size(); ++i)
        {
            const auto& def = module_.definitions[i];
            checkGenericParams(def);
            checkDiscriminants(def);
            checkMemberSpellings(def);
            for (const auto& field : def.fields)
            {
                checkTypeExpr(def, field.type, field.location.child("type"), result_.dependencies[i]);
            }
        }

        if (!diagnostics_.hasErrors())
        {
            orderDefinitions();
        }

        if (diagnostics_.hasErrors())
        {
            return llvm::createStringError(llvm::inconvertibleErrorCode(), "type resolution failed");
        }
        return std::move(result_);
    }

private:
    enum class VisitState
    {
        Unvisited,
        InProgress,
        Done,
    };

    void checkDuplicateDefinitions()
    {
        llvm::StringMap<std::string> typeSpellings;
        for (std::size_t i = 0; i < module_.definitions.size(); ++i)
        {
            const auto& def   = module_.definitions[i];
            const auto  first = index_.indexOf(def.name);
            if (first && *first != i)
            {
                diagnostics_.error(DiagnosticCode::DuplicateDefinition,
                                   def.location.child("name"),
                                   "type '" + def.name + "' is already defined at " +
                                       module_.definitions[*first].location.str());
                continue;
            }
            const std::string spelling = sanitizeCppIdentifier(def.name);
            const auto [it, inserted]  = typeSpellings.try_emplace(spelling, def.name);
            if (!inserted)
            {
                diagnostics_.error(DiagnosticCode::MalformedSchema,
                                   def.location.child("name"),
                                   "type '" + def.name + "' and type '" + it->second +
                                       "' both map to the C++ identifier '" + spelling + "'");
            }
        }
    }

    void checkGenericParams(const TypeDefinition& def)
    {
        for (std::size_t i = 0; i < def.generics.size(); ++i)
        {
            const auto& param = def.generics[i];
            if (param == kOptionalTypeName || lookupBuiltinType(param) || index_.find(param) != nullptr)
            {
                diagnostics_.error(DiagnosticCode::MalformedSchema,
                                   def.location.child("generics").child(i),
                                   "generic parameter '" + param + "' of '" + def.name +
                                       "' shadows a type of the same name");
            }
        }
    }

    void checkDiscriminants(const TypeDefinition& def)
    {
        const auto values = effectiveDiscriminants(def);
        for (std::size_t i = 0; i < values.size(); ++i)
        {
            for (std::size_t j = 0; j < i; ++j)
            {
                if (values[i] == values[j])
                {
                    diagnostics_.error(DiagnosticCode::MalformedSchema,
                                       def.variants[i].location,
                                       "discriminant " + std::to_string(values[i]) + " of '" + def.name + "::" +
                                           def.variants[i].name + "' is already used by '" + def.variants[j].name +
                                           "'");
                    return;
                }
            }
        }
    }

    /// Distinct member names must stay distinct once spelled as C++ identifiers.
    void checkMemberSpellings(const TypeDefinition& def)
    {
        llvm::StringMap<std::string> fieldSpellings;
        for (const auto& field : def.fields)
        {
            if (!field.name.empty())
            {
                reportSpellingClash(def, field.name, field.location.child("name"), fieldSpellings);
            }
        }
        llvm::StringMap<std::string> variantSpellings;
        for (const auto& variant : def.variants)
        {
            reportSpellingClash(def, variant.name, variant.location.child("name"), variantSpellings);
        }
    }

    void reportSpellingClash(const TypeDefinition&         def,
                             const std::string&            name,
                             const SourceLocation&         location,
                             llvm::StringMap<std::string>& seen)
    {
        const std::string spelling = sanitizeCppIdentifier(name);
        const auto [it, inserted]  = seen.try_emplace(spelling, name);
        if (!inserted)
        {
            diagnostics_.error(DiagnosticCode::MalformedSchema,
                               location,
                               "member '" + name + "' of '" + def.name + "' and member '" + it->second +
                                   "' both map to the C++ identifier '" + spelling + "'");
        }
    }

    void checkTypeExpr(const TypeDefinition&     owner,
                       const TypeExpr&           expr,
                       const SourceLocation&     location,
                       std::vector<std::size_t>& deps)
    {
        const auto kind = classifyTypeRef(owner, expr, index_);
        if (!kind)
        {
            diagnostics_.error(DiagnosticCode::UnresolvedType,
                               location,
                               "unknown type '" + expr.name + "' in member of '" + owner.name +
                                   "' (expected a builtin, a generic parameter, a schema type or a ::-qualified type)");
            return;
        }

        switch (*kind)
        {
        case TypeRefKind::Builtin:
        case TypeRefKind::GenericParam:
            if (!expr.args.empty())
            {
                diagnostics_.error(DiagnosticCode::UnresolvedType,
                                   location,
                                   "type '" + expr.name + "' takes no type arguments");
                return;
            }
            break;
        case TypeRefKind::Optional:
            if (expr.args.size() != 1U)
            {
                diagnostics_.error(DiagnosticCode::UnresolvedType,
                                   location,
                                   "'optional' takes exactly one type argument, got " +
                                       std::to_string(expr.args.size()));
                return;
            }
            break;
        case TypeRefKind::Definition: {
            const auto  position = *index_.indexOf(expr.name);
            const auto& target   = module_.definitions[position];
            if (expr.args.size() != target.generics.size())
            {
                diagnostics_.error(DiagnosticCode::UnresolvedType,
                                   location,
                                   "type '" + target.name + "' expects " + std::to_string(target.generics.size()) +
                                       " type argument(s), got " + std::to_string(expr.args.size()));
                return;
            }
            if (std::find(deps.begin(), deps.end(), position) == deps.end())
            {
                deps.push_back(position);
            }
            break;
        }
        case TypeRefKind::External:
            break;
        }

        for (const auto& arg : expr.args)
        {
            checkTypeExpr(owner, arg, location, deps);
        }
    }

    void orderDefinitions()
    {
        states_.assign(module_.definitions.size(), VisitState::Unvisited);
        for (std::size_t i = 0; i < module_.definitions.size(); ++i)
        {
            visit(i);
        }
    }

    void visit(const std::size_t position)
    {
        if (states_[position] == VisitState::Done)
        {
            return;
        }
        if (states_[position] == VisitState::InProgress)
        {
            reportCycle(position);
            return;
        }

        states_[position] = VisitState::InProgress;
        path_.push_back(position);
        for (const auto dep : result_.dependencies[position])
        {
            visit(dep);
        }
        path_.pop_back();
        states_[position] = VisitState::Done;
        result_.dependencyOrder.push_back(position);
    }

    void reportCycle(const std::size_t position)
    {
        const auto begin = std::find(path_.begin(), path_.end(), position);
        std::string chain;
        for (auto it = begin; it != path_.end(); ++it)
        {
            chain += module_.definitions[*it].name + " -> ";
        }
        chain += module_.definitions[position].name;

        diagnostics_.error(DiagnosticCode::DependencyCycle,
                           module_.definitions[position].location,
                           "type '" + module_.definitions[position].name +
                               "' contains itself by value: " + chain);
    }

    const SchemaModule&      module_;
    const DefinitionIndex&   index_;
    DiagnosticEngine&        diagnostics_;
    ModuleResolution         result_;
    std::vector<VisitState>  states_;
    std::vector<std::size_t> path_;
};

}  // namespace

llvm::Expected<ModuleResolution> resolveModuleTypes(const SchemaModule&    module,
                                                    const DefinitionIndex& index,
                                                    DiagnosticEngine&      diagnostics)
{
    return ModuleResolver(module, index, diagnostics).run();
}

}  // namespace llvmderive
