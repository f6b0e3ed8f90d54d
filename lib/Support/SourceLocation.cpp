//===----------------------------------------------------------------------===//
///
/// @file
/// Implements source-location rendering helpers.
///
/// Locations address schema nodes by JSON pointer; keys are escaped as
/// required by RFC 6901 (`~` becomes `~0`, `/` becomes `~1`).
///
//===----------------------------------------------------------------------===//

#include "llvmderive/Frontend/SourceLocation.h"

#include <sstream>

namespace llvmderive
{
namespace
{

std::string escapePointerToken(const std::string& key)
{
    std::string out;
    out.reserve(key.size());
    for (const char c : key)
    {
        if (c == '~')
        {
            out += "~0";
        }
        else if (c == '/')
        {
            out += "~1";
        }
        else
        {
            out.push_back(c);
        }
    }
    return out;
}

}  // namespace

SourceLocation SourceLocation::child(const std::string& key) const
{
    return SourceLocation{file, pointer + "/" + escapePointerToken(key)};
}

SourceLocation SourceLocation::child(const std::size_t index) const
{
    return SourceLocation{file, pointer + "/" + std::to_string(index)};
}

std::string SourceLocation::str() const
{
    std::ostringstream out;
    out << file << ':' << (pointer.empty() ? "/" : pointer);
    return out.str();
}

}  // namespace llvmderive
