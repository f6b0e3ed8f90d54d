//===----------------------------------------------------------------------===//
//
// Part of the llvm-derive project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

#include "llvmderive/CodeGen/BackendCapabilities.h"

#include "llvm/ADT/StringSwitch.h"

namespace llvmderive
{

std::optional<BackendSelection> parseBackendSelection(llvm::StringRef text)
{
    return llvm::StringSwitch<std::optional<BackendSelection>>(text)
        .Case("generic", BackendSelection::Generic)
        .Case("postgres", BackendSelection::Postgres)
        .Case("mysql", BackendSelection::MySql)
        .Default(std::nullopt);
}

llvm::StringRef backendSelectionName(const BackendSelection selection)
{
    switch (selection)
    {
    case BackendSelection::Generic:
        return "generic";
    case BackendSelection::Postgres:
        return "postgres";
    case BackendSelection::MySql:
        return "mysql";
    }
    return "generic";
}

BackendCapabilities backendCapabilities(const BackendSelection selection)
{
    BackendCapabilities out;
    switch (selection)
    {
    case BackendSelection::Generic:
        break;
    case BackendSelection::Postgres:
        out.compositeRecords  = true;
        out.namedTypeIdentity = true;
        out.concreteBackend   = "Postgres";
        break;
    case BackendSelection::MySql:
        out.concreteBackend = "MySql";
        break;
    }
    return out;
}

}  // namespace llvmderive
