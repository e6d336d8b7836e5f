#pragma once

#include <cstdint>
#include <ostream>
#include <string>
#include <string_view>

#include "pkgview/manifest/component.hpp"
#include "pkgview/render/columns.hpp"
#include "pkgview/render/format.hpp"


namespace pkgview::render {

// -----------------------------
// Render options
// -----------------------------
struct Options {
    OutputFormat format = OutputFormat::Table;
    Columns columns = Columns::TypeMember;
};

// ===============================================
// RENDER RESULT ENUM
// ===============================================
enum class Result : std::uint8_t {
    Written   = 0,
    IoFailure = 1      // Output stream failed (closed pipe, full disk, ...)
};

[[nodiscard]]
inline constexpr std::string_view to_string(Result r) noexcept {
    switch (r) {
        case Result::Written:   return "Written";
        case Result::IoFailure: return "IoFailure";
        default:                return "unknown";
    }
}

// Every component appears exactly once, in list order. The list is never
// reordered or deduplicated here.
[[nodiscard]]
std::string render(const manifest::ComponentList& list, const Options& options);

// Writes already-rendered text and flushes
[[nodiscard]]
Result write(std::string_view text, std::ostream& os);

} // namespace pkgview::render
