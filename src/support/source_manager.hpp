//===----------------------------------------------------------------------===//
//
// Part of the LionCode project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/source_manager.hpp
// Purpose: Maps numeric file identifiers to the paths of compiled sources.
// Key invariants: File ID 0 is invalid; identical normalized paths share an id.
// Ownership/Lifetime: Manager owns file path strings.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/source_location.hpp"

#include <cstdint>
#include <deque>
#include <string>
#include <string_view>
#include <unordered_map>

namespace lion::support
{

/// Maintains the mapping between numeric file identifiers and their
/// filesystem paths so diagnostics can be printed as `path:line:col`.
class SourceManager
{
  public:
    /// @brief Register file path @p path and return its id.
    /// @return New or existing file identifier (>0 on success, 0 on overflow).
    uint32_t addFile(std::string path);

    /// @brief Retrieve path for @p file_id, or an empty view when unknown.
    std::string_view getPath(uint32_t file_id) const;

    /// @brief Number of registered files.
    [[nodiscard]] size_t fileCount() const
    {
        return files_.size();
    }

  private:
    /// Index i holds the path of file id i + 1. A deque keeps references stable.
    std::deque<std::string> files_;

    uint64_t next_file_id_ = 1;

    std::unordered_map<std::string, uint32_t> path_to_id_;
};
} // namespace lion::support
