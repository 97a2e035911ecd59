// === Time Formatting =========================================================
//
// ISO-8601 conversions for timestamps crossing the wire or landing in SQL.

#pragma once

#include <string>
#include <string_view>

#include "freight_tracking/types.hpp"

namespace freight_tracking {

/** @brief Render as `YYYY-MM-DDTHH:MM:SS.mmmZ` (UTC). */
[[nodiscard]] std::string format_iso8601(TimePoint instant);

/**
 * @brief Parse `YYYY-MM-DD[THH:MM:SS[.fff]][Z|+HH:MM]`.
 *
 * Fractions beyond milliseconds are truncated. Throws ValidationError for
 * anything else.
 */
[[nodiscard]] TimePoint parse_iso8601(std::string_view text);

}  // namespace freight_tracking
