// === Version Metadata ========================================================
//
// Exposes the renderer's semantic version string used by `--version` and logs.

#pragma once

#include <string_view>

namespace roar {

inline constexpr std::string_view k_version{"0.3.0"};

}  // namespace roar
