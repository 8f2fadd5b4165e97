//===----------------------------------------------------------------------===//
//
// Part of the LionCode project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/number_format.hpp
// Purpose: Renders doubles the way JavaScript's Number#toString does, so that
//          compile-time string folding and emitted literals agree with the
//          runtime behaviour of the generated program.
// Key invariants: Output round-trips through strtod to the same double.
// Ownership/Lifetime: Stateless.
//
//===----------------------------------------------------------------------===//

#pragma once

#include <string>

namespace lion::support
{

/// @brief Format @p value using the shortest round-tripping digits and the
///        JavaScript placement rules for decimal point and exponent.
/// @details Integers print without a fractional part (`13`, not `13.0`),
///          magnitudes at or above 1e21 or below 1e-6 use exponent notation
///          (`1e+21`, `1e-7`), `-0` prints as `0`, and the non-finite values
///          print as `NaN`, `Infinity` and `-Infinity`.
[[nodiscard]] std::string formatNumber(double value);

} // namespace lion::support
