//===----------------------------------------------------------------------===//
//
// Part of the llvm-derive project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

#include "llvmderive/CodeGen/TypeSpelling.h"

#include "llvmderive/CodeGen/NamingPolicy.h"
#include "llvmderive/Semantics/BuiltinTypes.h"

namespace llvmderive
{

TypeSpeller::TypeSpeller(const TypeDefinition&           owner,
                         const DefinitionIndex&          index,
                         const std::vector<std::string>& namespaceComponents)
    : owner_(owner)
    , index_(index)
    , namespaceComponents_(namespaceComponents)
{
}

std::string TypeSpeller::spell(const TypeExpr& expr) const
{
    const auto kind = classifyTypeRef(owner_, expr, index_);
    if (!kind)
    {
        // Unresolved names are rejected before generation.
        return expr.str();
    }
    switch (*kind)
    {
    case TypeRefKind::Builtin:
        return builtinCppSpelling(*lookupBuiltinType(expr.name)).str();
    case TypeRefKind::Optional:
        return "std::optional" + spellArgs(expr.args);
    case TypeRefKind::GenericParam:
        return sanitizeCppIdentifier(expr.name);
    case TypeRefKind::Definition:
        return cppQualifiedName(namespaceComponents_, expr.name) + spellArgs(expr.args);
    case TypeRefKind::External:
        return expr.name + spellArgs(expr.args);
    }
    return expr.str();
}

std::string TypeSpeller::spellSubject() const
{
    std::string out = cppQualifiedName(namespaceComponents_, owner_.name);
    if (!owner_.isGeneric())
    {
        return out;
    }
    out += '<';
    const auto params = genericParams();
    for (std::size_t i = 0; i < params.size(); ++i)
    {
        if (i > 0)
        {
            out += ", ";
        }
        out += params[i];
    }
    out += '>';
    return out;
}

std::vector<std::string> TypeSpeller::genericParams() const
{
    std::vector<std::string> out;
    out.reserve(owner_.generics.size());
    for (const auto& param : owner_.generics)
    {
        out.push_back(sanitizeCppIdentifier(param));
    }
    return out;
}

std::string TypeSpeller::spellArgs(const std::vector<TypeExpr>& args) const
{
    if (args.empty())
    {
        return "";
    }
    std::string out = "<";
    for (std::size_t i = 0; i < args.size(); ++i)
    {
        if (i > 0)
        {
            out += ", ";
        }
        out += spell(args[i]);
    }
    out += '>';
    return out;
}

}  // namespace llvmderive
