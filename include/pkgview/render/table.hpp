#pragma once

#include <cstddef>
#include <string>
#include <string_view>

#include "pkgview/manifest/component.hpp"
#include "pkgview/render/columns.hpp"

/*
================================================================================
Box-drawn table
================================================================================

    ┌───────────┬────────────────┐
    │ Type      │ Member         │
    ├───────────┼────────────────┤
    │ ApexClass │ AccountHandler │
    ├───────────┼────────────────┤
    │ ApexClass │ ContactService │
    └───────────┴────────────────┘

  • One header row, then one row per component in list order
  • A separator line follows the header and every data row but the last
  • Column width = widest cell (header included) + one space on each side
  • Width counts UTF-8 code points; double-width glyphs are not accounted for
  • A cell containing '\n' spans several lines inside the same row
  • The output ends with '\n'
================================================================================
*/

namespace pkgview::render::table {

// Display width of a UTF-8 string (code points)
[[nodiscard]]
std::size_t display_width(std::string_view text) noexcept;

[[nodiscard]]
std::string render(const manifest::ComponentList& list, Columns columns);

} // namespace pkgview::render::table
