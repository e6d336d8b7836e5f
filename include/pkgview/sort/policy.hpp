#pragma once

#include <array>
#include <string_view>


namespace pkgview::sort {

// -----------------------------
// Sort policy
// -----------------------------
enum class SortPolicy {
    ByType,   // type, then parent, then member; stable on ties
    AsIs      // document order
};

inline constexpr std::array<std::string_view, 2> SORT_POLICY_NAMES = {"by-type", "as-is"};

constexpr std::string_view to_string(SortPolicy p) noexcept {
    switch (p) {
        case SortPolicy::ByType: return "by-type";
        case SortPolicy::AsIs:   return "as-is";
    }
    return "unknown";
}

// Boundary mapping for command-line values
[[nodiscard]]
constexpr bool from_string(std::string_view name, SortPolicy& out) noexcept {
    if (name == "by-type") { out = SortPolicy::ByType; return true; }
    if (name == "as-is")   { out = SortPolicy::AsIs;   return true; }
    return false;
}

} // namespace pkgview::sort
