//===----------------------------------------------------------------------===//
//
// Part of the llvm-derive project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements C++ literal rendering helpers.
///
//===----------------------------------------------------------------------===//

#include "llvmderive/CodeGen/LiteralRender.h"

#include <limits>

namespace llvmderive
{
namespace
{

void appendOctalEscape(std::string& out, const unsigned char c)
{
    out.push_back('\\');
    out.push_back(static_cast<char>('0' + ((c >> 6U) & 7U)));
    out.push_back(static_cast<char>('0' + ((c >> 3U) & 7U)));
    out.push_back(static_cast<char>('0' + (c & 7U)));
}

}  // namespace

std::string renderCppStringLiteral(llvm::StringRef value)
{
    std::string out;
    out.reserve(value.size() + 2);
    out.push_back('"');
    for (const char c : value)
    {
        const auto byte = static_cast<unsigned char>(c);
        switch (c)
        {
        case '\\':
            out.append("\\\\");
            break;
        case '"':
            out.append("\\\"");
            break;
        case '\n':
            out.append("\\n");
            break;
        case '\r':
            out.append("\\r");
            break;
        case '\t':
            out.append("\\t");
            break;
        case '?':
            // `??` followed by a punctuator reads as a trigraph.
            out.append("\\?");
            break;
        default:
            if (byte < 0x20U || byte >= 0x7FU)
            {
                appendOctalEscape(out, byte);
            }
            else
            {
                out.push_back(c);
            }
            break;
        }
    }
    out.push_back('"');
    return out;
}

std::string renderCppIntegerLiteral(const std::int64_t value)
{
    if (value == std::numeric_limits<std::int64_t>::min())
    {
        return "(-9223372036854775807LL - 1)";
    }
    return std::to_string(value);
}

}  // namespace llvmderive
