//===----------------------------------------------------------------------===//
//
// Part of the llvm-derive project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

#include "llvmderive/CodeGen/ContractGenerators.h"

#include <algorithm>
#include <utility>

#include "llvmderive/CodeGen/NamingPolicy.h"

namespace llvmderive
{

ContractContext::ContractContext(const TypeDefinition&           def,
                                 const DefinitionIndex&          index,
                                 const std::vector<std::string>& namespaceComponents,
                                 BackendCapabilities             capabilities)
    : def_(def)
    , speller_(def, index, namespaceComponents)
    , capabilities_(std::move(capabilities))
{
}

BackendBinding ContractContext::genericBackend() const
{
    const auto  params = speller_.genericParams();
    std::string name   = "DB";
    while (std::find(params.begin(), params.end(), name) != params.end())
    {
        name += "_";
    }
    return BackendBinding{name, true};
}

BackendBinding ContractContext::concreteBackend() const
{
    return BackendBinding{capabilities_.concreteBackend.value_or(""), false};
}

std::vector<std::string> ContractContext::templateParams(const BackendBinding& backend) const
{
    std::vector<std::string> out;
    if (backend.generic)
    {
        out.push_back(backend.name);
    }
    for (auto& param : speller_.genericParams())
    {
        out.push_back(std::move(param));
    }
    return out;
}

std::string ContractContext::memberName(llvm::StringRef name)
{
    return sanitizeCppIdentifier(name);
}

}  // namespace llvmderive
