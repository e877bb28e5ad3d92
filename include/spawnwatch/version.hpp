// === Version Metadata ========================================================
//
// Exposes the tracker's semantic version string used in logs.

#pragma once

#include <string_view>

namespace spawnwatch {

inline constexpr std::string_view k_version{"0.1.0"};

}  // namespace spawnwatch
