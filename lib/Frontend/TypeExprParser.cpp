//===----------------------------------------------------------------------===//
//
// Part of the llvm-derive project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements the recursive-descent parser for member type spellings.
///
//===----------------------------------------------------------------------===//

#include "llvmderive/Frontend/TypeExprParser.h"

#include <cctype>
#include <cstddef>
#include <string>
#include <utility>

namespace llvmderive
{
namespace
{

/// Nesting bound for `optional<optional<...>>` style spellings.
constexpr std::size_t kMaxTypeExprDepth = 32U;

class TypeExprParser final
{
public:
    explicit TypeExprParser(llvm::StringRef text)
        : text_(text)
    {
    }

    llvm::Expected<TypeExpr> parse()
    {
        auto expr = parseType(0);
        if (!expr)
        {
            return expr.takeError();
        }
        skipSpace();
        if (pos_ != text_.size())
        {
            return fail("unexpected trailing input");
        }
        return expr;
    }

private:
    llvm::Expected<TypeExpr> parseType(const std::size_t depth)
    {
        if (depth > kMaxTypeExprDepth)
        {
            return fail("type spelling nests too deeply");
        }

        TypeExpr out;
        auto     name = parseName();
        if (!name)
        {
            return name.takeError();
        }
        out.name = std::move(*name);

        if (!consume('<'))
        {
            return out;
        }

        while (true)
        {
            auto arg = parseType(depth + 1U);
            if (!arg)
            {
                return arg.takeError();
            }
            out.args.push_back(std::move(*arg));
            skipSpace();
            if (consume(','))
            {
                continue;
            }
            if (consume('>'))
            {
                break;
            }
            return fail("expected ',' or '>' in type argument list");
        }
        return out;
    }

    llvm::Expected<std::string> parseName()
    {
        skipSpace();
        std::string out;
        if (text_.substr(pos_).take_front(2) == "::")
        {
            out += "::";
            pos_ += 2U;
        }
        while (true)
        {
            const std::size_t begin = pos_;
            if (pos_ >= text_.size() || !isIdentStart(text_[pos_]))
            {
                return fail("expected identifier");
            }
            while (pos_ < text_.size() && isIdentContinue(text_[pos_]))
            {
                ++pos_;
            }
            out += text_.slice(begin, pos_).str();
            if (text_.substr(pos_).take_front(2) != "::")
            {
                return out;
            }
            out += "::";
            pos_ += 2U;
        }
    }

    void skipSpace()
    {
        while (pos_ < text_.size() && std::isspace(static_cast<unsigned char>(text_[pos_])))
        {
            ++pos_;
        }
    }

    bool consume(const char c)
    {
        skipSpace();
        if (pos_ < text_.size() && text_[pos_] == c)
        {
            ++pos_;
            return true;
        }
        return false;
    }

    static bool isIdentStart(const char c)
    {
        return std::isalpha(static_cast<unsigned char>(c)) || c == '_';
    }

    static bool isIdentContinue(const char c)
    {
        return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
    }

    llvm::Error fail(const char* const what) const
    {
        return llvm::createStringError(llvm::inconvertibleErrorCode(),
                                       "%s at column %zu of type '%s'",
                                       what,
                                       pos_ + 1U,
                                       text_.str().c_str());
    }

    llvm::StringRef text_;
    std::size_t     pos_{0};
};

}  // namespace

llvm::Expected<TypeExpr> parseTypeExpr(llvm::StringRef text)
{
    return TypeExprParser(text).parse();
}

}  // namespace llvmderive
