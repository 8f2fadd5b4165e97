//===----------------------------------------------------------------------===//
//
// Part of the LionCode project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: frontends/lioncode/Types.hpp
// Purpose: The four primitive LionCode types.
// Key invariants: Unknown only appears where inference cannot decide, such as
//                 a function name used as a value.
// Ownership/Lifetime: Plain enumeration.
//
//===----------------------------------------------------------------------===//
#pragma once

namespace lion::frontends::lioncode
{

enum class Type
{
    Number,
    String,
    Boolean,
    Unknown,
};

/// @brief Lowercase type name used in diagnostics (`number`, `string`, ...).
const char *toString(Type type);

/// @brief True unless @p type is Unknown.
inline bool isKnown(Type type)
{
    return type != Type::Unknown;
}

} // namespace lion::frontends::lioncode
