//===----------------------------------------------------------------------===//
//
// Part of the LionCode project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tools/common/source_loader.hpp
// Purpose: Loading `.lion` source files for the command-line tools.
// Key invariants: LoadedSource holds the complete file contents and the id
//                 the SourceManager assigned to the path.
// Ownership/Lifetime: The caller owns the returned LoadedSource.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/diag_expected.hpp"
#include "support/source_manager.hpp"

#include <cstdint>
#include <string>

namespace lion::tools::common
{

/// @brief Result of loading a source file into memory.
struct LoadedSource
{
    std::string buffer; ///< Full contents of the source file.
    uint32_t fileId{0}; ///< Identifier assigned by SourceManager.
};

/// @brief Read @p path and register it with @p sm.
/// @return The loaded buffer, or a diagnostic describing the I/O failure,
///         an oversized file or SourceManager overflow.
lion::support::Expected<LoadedSource> loadSourceBuffer(const std::string &path,
                                                       lion::support::SourceManager &sm);

} // namespace lion::tools::common
