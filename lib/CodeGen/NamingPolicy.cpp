//===----------------------------------------------------------------------===//
//
// Part of the llvm-derive project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements naming-policy helpers for generated C++.
///
//===----------------------------------------------------------------------===//

#include "llvmderive/CodeGen/NamingPolicy.h"

#include <cctype>

#include "llvmderive/Support/Casing.h"

#include "llvm/ADT/StringSet.h"

namespace llvmderive
{
namespace
{

const llvm::StringSet<>& cppKeywordSet()
{
    static const llvm::StringSet<> keywords =
        {"alignas",  "alignof",   "and",          "and_eq",        "asm",         "atomic_cancel", "atomic_commit",
         "atomic_noexcept", "auto", "bitand",     "bitor",         "bool",        "break",         "case",
         "catch",    "char",      "char8_t",      "char16_t",      "char32_t",    "class",         "compl",
         "concept",  "const",     "consteval",    "constexpr",     "constinit",   "const_cast",    "continue",
         "co_await", "co_return", "co_yield",     "decltype",      "default",     "delete",        "do",
         "double",   "dynamic_cast", "else",      "enum",          "explicit",    "export",        "extern",
         "false",    "float",     "for",          "friend",        "goto",        "if",            "inline",
         "int",      "long",      "mutable",      "namespace",     "new",         "noexcept",      "not",
         "not_eq",   "nullptr",   "operator",     "or",            "or_eq",       "private",       "protected",
         "public",   "register",  "reinterpret_cast", "requires",  "return",      "short",         "signed",
         "sizeof",   "static",    "static_assert", "static_cast",  "struct",      "switch",        "template",
         "this",     "thread_local", "throw",     "true",          "try",         "typedef",       "typeid",
         "typename", "union",     "unsigned",     "using",         "virtual",     "void",          "volatile",
         "wchar_t",  "while",     "xor",          "xor_eq"};
    return keywords;
}

}  // namespace

bool isCppKeyword(const llvm::StringRef name)
{
    return cppKeywordSet().contains(name);
}

std::string sanitizeCppIdentifier(llvm::StringRef name)
{
    std::string out = name.str();
    if (out.empty())
    {
        return "_";
    }
    for (char& c : out)
    {
        if (!(std::isalnum(static_cast<unsigned char>(c)) || c == '_'))
        {
            c = '_';
        }
    }
    if (std::isdigit(static_cast<unsigned char>(out.front())))
    {
        out.insert(out.begin(), '_');
    }
    if (isCppKeyword(out))
    {
        out += "_";
    }
    return out;
}

std::string cppNamespacePath(const std::vector<std::string>& components)
{
    std::string out;
    for (const auto& component : components)
    {
        if (!out.empty())
        {
            out += "::";
        }
        out += sanitizeCppIdentifier(component);
    }
    return out;
}

std::string cppQualifiedName(const std::vector<std::string>& components, llvm::StringRef name)
{
    std::string out = "::";
    const auto  ns  = cppNamespacePath(components);
    if (!ns.empty())
    {
        out += ns + "::";
    }
    out += sanitizeCppIdentifier(name);
    return out;
}

std::string cppHeaderGuard(const std::vector<std::string>& components, llvm::StringRef headerName)
{
    std::string guard = "LLVMDERIVE_GENERATED";
    const auto  append = [&guard](llvm::StringRef token) {
        guard += "_";
        guard += applyCasingConvention(token, CasingConvention::ScreamingSnakeCase);
    };
    for (const auto& component : components)
    {
        append(component);
    }
    append(headerName);
    guard += "_HPP";
    return guard;
}

}  // namespace llvmderive
