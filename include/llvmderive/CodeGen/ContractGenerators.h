//===----------------------------------------------------------------------===//
//
// Part of the llvm-derive project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Strategy generators producing encode and type-identity contracts.
///
/// Each generator is a pure function of one definition, its strategy and the
/// backend capabilities. Generated code refers to runtime names unqualified and
/// is rendered inside `namespace llvmderive::runtime`.
///
//===----------------------------------------------------------------------===//
#ifndef LLVMDERIVE_CODEGEN_CONTRACT_GENERATORS_H
#define LLVMDERIVE_CODEGEN_CONTRACT_GENERATORS_H

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "llvmderive/CodeGen/BackendCapabilities.h"
#include "llvmderive/CodeGen/GeneratedContract.h"
#include "llvmderive/CodeGen/TypeSpelling.h"
#include "llvmderive/Semantics/Strategy.h"

#include "llvm/ADT/StringRef.h"

namespace llvmderive
{

/// @brief Member name of the single field of a transparent wrapper.
inline constexpr llvm::StringLiteral kTransparentMemberName = "value";

/// @brief Inputs shared by all strategy generators for one definition.
class ContractContext final
{
public:
    /// @brief Creates a context for one definition.
    /// @param[in] def Definition being generated.
    /// @param[in] index Definition index of the owning module.
    /// @param[in] namespaceComponents Namespace of the owning module.
    /// @param[in] capabilities Capabilities of the selected backend.
    ContractContext(const TypeDefinition&           def,
                    const DefinitionIndex&          index,
                    const std::vector<std::string>& namespaceComponents,
                    BackendCapabilities             capabilities);

    const TypeDefinition& definition() const
    {
        return def_;
    }

    const TypeSpeller& speller() const
    {
        return speller_;
    }

    const BackendCapabilities& capabilities() const
    {
        return capabilities_;
    }

    /// @brief Template parameter binding for contracts generic over the backend.
    /// @return `DB`, suffixed with underscores until distinct from every generic parameter.
    BackendBinding genericBackend() const;

    /// @brief Binding to the concrete backend tag of the capabilities.
    /// @return Concrete binding; empty name when the selection has no concrete backend.
    BackendBinding concreteBackend() const;

    /// @brief Template parameter list for a contract under a binding.
    std::vector<std::string> templateParams(const BackendBinding& backend) const;

    /// @brief Sanitized C++ name of a field or variant.
    static std::string memberName(llvm::StringRef name);

private:
    const TypeDefinition& def_;
    TypeSpeller           speller_;
    BackendCapabilities   capabilities_;
};

/// @brief Delegates all contract operations to the inner field.
GeneratedContract generateTransparentContract(const ContractContext& ctx, const TransparentStrategy& strategy);

/// @brief Casts to the representation and delegates to its contract.
GeneratedContract generateWeakEnumContract(const ContractContext& ctx, const WeakEnumStrategy& strategy);

/// @brief Maps each variant to its label and delegates to the text contract.
GeneratedContract generateStrongEnumContract(const ContractContext& ctx, const StrongEnumStrategy& strategy);

/// @brief Encodes fields as a composite record.
/// @return Contract, or `std::nullopt` when the backend lacks composite records.
std::optional<GeneratedContract> generateRecordContract(const ContractContext& ctx, const RecordStrategy& strategy);

/// @brief Generates `TypeInfo` specializations for a strategy.
/// @param[in] ctx Generation context.
/// @param[in] strategy Selected strategy.
/// @return Zero or more type-identity contracts.
std::vector<GeneratedTypeInfo> generateTypeIdentity(const ContractContext& ctx, const Strategy& strategy);

/// @brief Returns the OID of a builtin PostgreSQL type name.
/// @param[in] typeName Backend type name, e.g. `text`.
/// @return OID, or 0 for names resolved by the server at bind time.
std::uint32_t pgBuiltinTypeOid(llvm::StringRef typeName);

}  // namespace llvmderive

#endif  // LLVMDERIVE_CODEGEN_CONTRACT_GENERATORS_H
