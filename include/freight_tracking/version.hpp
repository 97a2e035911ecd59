// === Version Metadata ========================================================
//
// Exposes the tracking core's semantic version string used in logs and the
// upstream handshake.

#pragma once

#include <string_view>

namespace freight_tracking {

inline constexpr std::string_view k_version{"0.1.0"};

}  // namespace freight_tracking
