//===----------------------------------------------------------------------===//
//
// Part of the llvm-derive project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Language-level model of generated encode and type-identity contracts.
///
/// Strategy generators fill these records; the contract renderer turns them
/// into `Encode<T, DB>` and `TypeInfo<T, DB>` specializations.
///
//===----------------------------------------------------------------------===//
#ifndef LLVMDERIVE_CODEGEN_GENERATED_CONTRACT_H
#define LLVMDERIVE_CODEGEN_GENERATED_CONTRACT_H

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace llvmderive
{

/// @brief One line of generated code with its indentation relative to the enclosing block.
struct CodeLine final
{
    int         indent{0};
    std::string text;
};

/// @brief Constraint checked when the consuming build compiles the contract.
struct StaticAssertion final
{
    std::string condition;
    std::string message;
};

/// @brief How a contract is bound to a database backend.
struct BackendBinding final
{
    /// @brief Template parameter name (e.g. `DB`) or concrete tag (e.g. `Postgres`).
    std::string name;

    /// @brief True when `name` is a template parameter.
    bool generic{true};

    /// @brief Spelling of the raw buffer type for this binding.
    std::string rawBufferType() const
    {
        return generic ? "typename " + name + "::RawBuffer" : name + "::RawBuffer";
    }
};

/// @brief Generated `Encode<Subject, Backend>` specialization.
struct GeneratedContract final
{
    /// @brief Fully-qualified subject type, with generic parameters applied.
    std::string subject;

    /// @brief Template parameter names, backend parameter first when generic.
    std::vector<std::string> templateParams;

    /// @brief Backend binding.
    BackendBinding backend;

    /// @brief `requires` constraints on the template parameters.
    std::vector<std::string> constraints;

    /// @brief Member `static_assert`s.
    std::vector<StaticAssertion> staticAssertions;

    /// @brief Static helper members emitted before the contract operations.
    std::vector<CodeLine> helpers;

    /// @brief Body of `encode(const Subject& value, RawBuffer& buf)`.
    std::vector<CodeLine> encodeBody;

    /// @brief Body of `encodeNullable(const Subject& value, RawBuffer& buf) -> IsNull`.
    std::vector<CodeLine> encodeNullableBody;

    /// @brief Body of `sizeHint(const Subject& value) -> std::size_t`.
    std::vector<CodeLine> sizeHintBody;
};

/// @brief Generated `TypeInfo<Subject, Backend>` specialization.
struct GeneratedTypeInfo final
{
    std::string                  subject;
    std::vector<std::string>     templateParams;
    BackendBinding               backend;
    std::vector<std::string>     constraints;

    /// @brief Base specialization whose identity is inherited.
    std::optional<std::string> inheritFrom;

    /// @brief Explicit backend type OID; used when `inheritFrom` is empty.
    std::uint32_t oid{0};

    /// @brief Explicit backend type name; used when `inheritFrom` is empty.
    std::string name;
};

}  // namespace llvmderive

#endif  // LLVMDERIVE_CODEGEN_GENERATED_CONTRACT_H
