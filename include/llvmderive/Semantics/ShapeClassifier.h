//===----------------------------------------------------------------------===//
//
// Part of the llvm-derive project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Shape classification of type definitions into encoding strategies.
///
//===----------------------------------------------------------------------===//
#ifndef LLVMDERIVE_SEMANTICS_SHAPE_CLASSIFIER_H
#define LLVMDERIVE_SEMANTICS_SHAPE_CLASSIFIER_H

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

#include "llvmderive/Frontend/TypeDefinition.h"
#include "llvmderive/Semantics/Attributes.h"
#include "llvmderive/Semantics/Strategy.h"

namespace llvmderive
{

/// @brief Selects the strategy family from shape and representation presence.
/// @param[in] def Definition to classify.
/// @param[in] hasRepresentation Whether a `representation` attribute is present.
/// @return Strategy kind; total over all shapes.
StrategyKind classifyShapeKind(const TypeDefinition& def, bool hasRepresentation);

/// @brief Explains why a definition has no encoding.
/// @param[in] def Definition classified as `Unsupported`.
/// @return Reason naming the violated shape rule.
std::string unsupportedShapeReason(const TypeDefinition& def);

/// @brief Builds the full strategy of a definition.
/// @param[in] def Definition to classify.
/// @param[in] resolved Attributes validated for the kind of `def`.
/// @return Strategy; `UnsupportedStrategy` for shapes with no encoding.
Strategy classify(const TypeDefinition& def, const ResolvedAttributes& resolved);

/// @brief Finds strong enumeration variants that share one wire label.
/// @param[in] strategy Strong enumeration strategy.
/// @return Pairs of label positions `(first, later)` with equal labels.
std::vector<std::pair<std::size_t, std::size_t>> findAmbiguousLabels(const StrongEnumStrategy& strategy);

}  // namespace llvmderive

#endif  // LLVMDERIVE_SEMANTICS_SHAPE_CLASSIFIER_H
