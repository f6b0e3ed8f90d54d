//===----------------------------------------------------------------------===//
//
// Part of the llvm-derive project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements identifier casing conventions.
///
//===----------------------------------------------------------------------===//

#include "llvmderive/Support/Casing.h"

#include <cctype>
#include <cstddef>

#include "llvm/ADT/StringSwitch.h"

namespace llvmderive
{
namespace
{

char toLower(const char c)
{
    return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
}

char toUpper(const char c)
{
    return static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
}

std::string joinWords(const std::vector<std::string>& words, llvm::StringRef separator, const bool upper)
{
    std::string out;
    for (std::size_t i = 0; i < words.size(); ++i)
    {
        if (i > 0)
        {
            out += separator.str();
        }
        for (const char c : words[i])
        {
            out.push_back(upper ? toUpper(c) : c);
        }
    }
    return out;
}

std::string joinCapitalized(const std::vector<std::string>& words, const bool lowerFirstWord)
{
    std::string out;
    for (std::size_t i = 0; i < words.size(); ++i)
    {
        std::string word = words[i];
        if (!(lowerFirstWord && i == 0) && !word.empty())
        {
            word.front() = toUpper(word.front());
        }
        out += word;
    }
    return out;
}

}  // namespace

std::optional<CasingConvention> parseCasingConvention(llvm::StringRef text)
{
    return llvm::StringSwitch<std::optional<CasingConvention>>(text)
        .Case("lowercase", CasingConvention::Lowercase)
        .Case("UPPERCASE", CasingConvention::Uppercase)
        .Case("snake_case", CasingConvention::SnakeCase)
        .Case("SCREAMING_SNAKE_CASE", CasingConvention::ScreamingSnakeCase)
        .Case("kebab-case", CasingConvention::KebabCase)
        .Case("camelCase", CasingConvention::CamelCase)
        .Case("PascalCase", CasingConvention::PascalCase)
        .Default(std::nullopt);
}

llvm::StringRef casingConventionName(const CasingConvention convention)
{
    switch (convention)
    {
    case CasingConvention::Lowercase:
        return "lowercase";
    case CasingConvention::Uppercase:
        return "UPPERCASE";
    case CasingConvention::SnakeCase:
        return "snake_case";
    case CasingConvention::ScreamingSnakeCase:
        return "SCREAMING_SNAKE_CASE";
    case CasingConvention::KebabCase:
        return "kebab-case";
    case CasingConvention::CamelCase:
        return "camelCase";
    case CasingConvention::PascalCase:
        return "PascalCase";
    }
    return "unknown";
}

std::vector<std::string> splitIdentifierWords(llvm::StringRef identifier)
{
    std::vector<std::string> words;
    std::string              current;
    const auto               flush = [&]() {
        if (!current.empty())
        {
            words.push_back(current);
            current.clear();
        }
    };

    for (std::size_t i = 0; i < identifier.size(); ++i)
    {
        const auto c    = static_cast<unsigned char>(identifier[i]);
        const auto prev = static_cast<unsigned char>((i > 0) ? identifier[i - 1] : '\0');
        const auto next = static_cast<unsigned char>((i + 1 < identifier.size()) ? identifier[i + 1] : '\0');
        if (!std::isalnum(c))
        {
            flush();
            continue;
        }
        if (std::isupper(c))
        {
            const bool boundary = std::islower(prev) || std::isdigit(prev) ||
                                  (std::isupper(prev) && std::islower(next));
            if (boundary)
            {
                flush();
            }
        }
        current.push_back(toLower(static_cast<char>(c)));
    }
    flush();
    return words;
}

std::string applyCasingConvention(llvm::StringRef identifier, const CasingConvention convention)
{
    switch (convention)
    {
    case CasingConvention::Lowercase: {
        std::string out = identifier.str();
        for (char& c : out)
        {
            c = toLower(c);
        }
        return out;
    }
    case CasingConvention::Uppercase: {
        std::string out = identifier.str();
        for (char& c : out)
        {
            c = toUpper(c);
        }
        return out;
    }
    case CasingConvention::SnakeCase:
        return joinWords(splitIdentifierWords(identifier), "_", false);
    case CasingConvention::ScreamingSnakeCase:
        return joinWords(splitIdentifierWords(identifier), "_", true);
    case CasingConvention::KebabCase:
        return joinWords(splitIdentifierWords(identifier), "-", false);
    case CasingConvention::CamelCase:
        return joinCapitalized(splitIdentifierWords(identifier), true);
    case CasingConvention::PascalCase:
        return joinCapitalized(splitIdentifierWords(identifier), false);
    }
    return identifier.str();
}

}  // namespace llvmderive
