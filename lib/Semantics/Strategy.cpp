//===----------------------------------------------------------------------===//
//
// Part of the llvm-derive project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

#include "llvmderive/Semantics/Strategy.h"

namespace llvmderive
{

const char* strategyKindName(const StrategyKind kind)
{
    switch (kind)
    {
    case StrategyKind::Transparent:
        return "transparent";
    case StrategyKind::WeakEnum:
        return "weak-enum";
    case StrategyKind::StrongEnum:
        return "strong-enum";
    case StrategyKind::Record:
        return "record";
    case StrategyKind::Unsupported:
        return "unsupported";
    }
    return "unknown";
}

StrategyKind strategyKindOf(const Strategy& strategy)
{
    // Alternatives are declared in StrategyKind order.
    return static_cast<StrategyKind>(strategy.index());
}

}  // namespace llvmderive
