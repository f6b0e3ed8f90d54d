//===----------------------------------------------------------------------===//
///
/// @file
/// Source location primitives shared by schema reading, diagnostics, and classification.
///
//===----------------------------------------------------------------------===//
#ifndef LLVMDERIVE_FRONTEND_SOURCE_LOCATION_H
#define LLVMDERIVE_FRONTEND_SOURCE_LOCATION_H

#include <cstddef>
#include <string>

namespace llvmderive
{

/// @file
/// @brief Source location primitives shared across frontend and diagnostics.

/// @brief Identifies one node of a schema document.
struct SourceLocation
{
    /// @brief Path to the schema file.
    std::string file;

    /// @brief JSON pointer (RFC 6901) of the node inside the schema document.
    std::string pointer;

    /// @brief Returns a location for a child object member.
    /// @param[in] key Member key.
    /// @return Location of the child node.
    [[nodiscard]] SourceLocation child(const std::string& key) const;

    /// @brief Returns a location for a child array element.
    /// @param[in] index Element index.
    /// @return Location of the child node.
    [[nodiscard]] SourceLocation child(std::size_t index) const;

    /// @brief Formats this location as a human-readable string.
    /// @return Formatted location text.
    [[nodiscard]] std::string str() const;
};

}  // namespace llvmderive

#endif  // LLVMDERIVE_FRONTEND_SOURCE_LOCATION_H
