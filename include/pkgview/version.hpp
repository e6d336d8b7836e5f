#pragma once

#include <string_view>

namespace pkgview {

inline constexpr int version_major = 0;
inline constexpr int version_minor = 3;
inline constexpr int version_patch = 0;

inline constexpr std::string_view version_string = "0.3.0";

} // namespace pkgview
