//===----------------------------------------------------------------------===//
//
// Part of the LionCode project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/source_location.hpp
// Purpose: Declares the source position value attached to tokens, parse tree
//          nodes, AST nodes and diagnostics.
// Key invariants: line/column are 1-based when known; 0 means unknown.
//                 file_id == 0 means the text was not registered with a
//                 SourceManager (e.g. a string handed straight to parse()).
// Ownership/Lifetime: Value type with no dynamic ownership.
//
//===----------------------------------------------------------------------===//

#pragma once

#include <cstdint>

namespace lion::support
{

/// @brief Represents a position within a LionCode source text.
struct SourceLoc
{
    /// @brief Identifier assigned by SourceManager; 0 when no file is attached.
    uint32_t file_id = 0;

    /// @brief One-based line number; 0 when unknown.
    uint32_t line = 0;

    /// @brief One-based column number; 0 when unknown.
    uint32_t column = 0;

    /// @brief Check whether the location carries at least a line number.
    [[nodiscard]] bool isValid() const;

    [[nodiscard]] bool hasFile() const
    {
        return file_id != 0;
    }

    [[nodiscard]] bool hasLine() const
    {
        return line != 0;
    }

    [[nodiscard]] bool hasColumn() const
    {
        return column != 0;
    }
};

/// @brief Equality over all three coordinates.
bool operator==(const SourceLoc &a, const SourceLoc &b);

} // namespace lion::support
