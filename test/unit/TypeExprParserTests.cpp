//===----------------------------------------------------------------------===//
//
// Part of the llvm-derive project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

#include <iostream>
#include <string>

#include "llvmderive/Frontend/TypeExprParser.h"

#include "llvm/Support/Error.h"

bool runTypeExprParserTests()
{
    {
        auto expr = llvmderive::parseTypeExpr(" optional< Pair<i32,string> > ");
        if (!expr)
        {
            std::cerr << "nested type parse failed: " << llvm::toString(expr.takeError()) << "\n";
            return false;
        }
        if (expr->name != "optional" || expr->args.size() != 1U || expr->args[0].name != "Pair" ||
            expr->args[0].args.size() != 2U || expr->str() != "optional<Pair<i32, string>>")
        {
            std::cerr << "nested type structure mismatch: " << expr->str() << "\n";
            return false;
        }
    }

    {
        auto expr = llvmderive::parseTypeExpr("::std::chrono::seconds");
        if (!expr || !expr->isQualified() || expr->name != "::std::chrono::seconds")
        {
            if (!expr)
            {
                llvm::consumeError(expr.takeError());
            }
            std::cerr << "qualified type parse mismatch\n";
            return false;
        }
    }

    {
        auto expr = llvmderive::parseTypeExpr("i32");
        if (!expr || expr->isQualified() || !expr->args.empty())
        {
            if (!expr)
            {
                llvm::consumeError(expr.takeError());
            }
            std::cerr << "plain type parse mismatch\n";
            return false;
        }
    }

    for (const char* bad : {"", "optional<", "a b", "Pair<i32,>", "9lives", "a::", "Map<i32;string>"})
    {
        auto expr = llvmderive::parseTypeExpr(bad);
        if (expr)
        {
            std::cerr << "expected parse failure for '" << bad << "'\n";
            return false;
        }
        llvm::consumeError(expr.takeError());
    }

    {
        std::string deep;
        for (int i = 0; i < 40; ++i)
        {
            deep += "optional<";
        }
        deep += "i32";
        deep += std::string(40, '>');
        auto expr = llvmderive::parseTypeExpr(deep);
        if (expr)
        {
            std::cerr << "deeply nested type was accepted\n";
            return false;
        }
        const std::string message = llvm::toString(expr.takeError());
        if (message.find("nests too deeply") == std::string::npos)
        {
            std::cerr << "unexpected depth-limit message: " << message << "\n";
            return false;
        }
    }

    return true;
}
