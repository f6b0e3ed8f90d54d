//===----------------------------------------------------------------------===//
//
// Part of the llvm-derive project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Attribute validation for type definitions.
///
/// Validation runs in two phases. Container attributes are parsed first so the
/// presence of `representation` can steer shape classification; the resolved
/// strategy kind then decides which combinations are legal.
///
//===----------------------------------------------------------------------===//
#ifndef LLVMDERIVE_SEMANTICS_ATTRIBUTE_RESOLVER_H
#define LLVMDERIVE_SEMANTICS_ATTRIBUTE_RESOLVER_H

#include <vector>

#include "llvmderive/Frontend/TypeDefinition.h"
#include "llvmderive/Semantics/Attributes.h"
#include "llvmderive/Semantics/Strategy.h"

#include "llvm/Support/Error.h"

namespace llvmderive
{
class DiagnosticEngine;

/// @brief Parses type-level attributes without regard to shape.
/// @param[in] def Definition whose attributes are parsed.
/// @param[in,out] diagnostics Receives the first violation.
/// @return Container attributes, or an error after one diagnostic was reported.
llvm::Expected<ContainerAttributes> parseContainerAttributes(const TypeDefinition& def,
                                                             DiagnosticEngine&     diagnostics);

/// @brief Parses member-level attributes without regard to shape.
/// @param[in] attributes Raw attributes of one field or variant.
/// @param[in,out] diagnostics Receives the first violation.
/// @return Member attributes, or an error after one diagnostic was reported.
llvm::Expected<MemberAttributes> parseMemberAttributes(const std::vector<RawAttribute>& attributes,
                                                       DiagnosticEngine&                diagnostics);

/// @brief Applies the shape-dependent rules and resolves member attributes.
/// @param[in] def Definition being resolved.
/// @param[in] container Attributes from @ref parseContainerAttributes.
/// @param[in] kind Strategy kind selected for `def`; must not be `Unsupported`.
/// @param[in,out] diagnostics Receives the first violation.
/// @return Resolved attributes, or an error after one diagnostic was reported.
llvm::Expected<ResolvedAttributes> resolveAttributes(const TypeDefinition&      def,
                                                     const ContainerAttributes& container,
                                                     StrategyKind               kind,
                                                     DiagnosticEngine&          diagnostics);

}  // namespace llvmderive

#endif  // LLVMDERIVE_SEMANTICS_ATTRIBUTE_RESOLVER_H
