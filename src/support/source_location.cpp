//===----------------------------------------------------------------------===//
//
// Part of the LionCode project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Out-of-line helpers for SourceLoc. Unlike file-backed tooling, LionCode
// sources are frequently compiled straight from a string, so a location is
// considered meaningful as soon as it has a line; the file id is optional and
// only used to prefix diagnostics with a path.
//
//===----------------------------------------------------------------------===//

#include "support/source_location.hpp"

namespace lion::support
{
bool SourceLoc::isValid() const
{
    return line != 0;
}

bool operator==(const SourceLoc &a, const SourceLoc &b)
{
    return a.file_id == b.file_id && a.line == b.line && a.column == b.column;
}
} // namespace lion::support
