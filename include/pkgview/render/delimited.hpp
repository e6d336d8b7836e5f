#pragma once

#include <string>
#include <string_view>

#include "pkgview/manifest/component.hpp"
#include "pkgview/render/columns.hpp"


namespace pkgview::render::delimited {

// -----------------------------------------------------------------------------
// CSV (RFC 4180)
//
// Header line, then one line per component. Fields holding ',', '"', '\r' or
// '\n' are quoted with inner quotes doubled. Every line, the last included,
// ends with a single '\n'.
// -----------------------------------------------------------------------------
[[nodiscard]]
std::string csv(const manifest::ComponentList& list, Columns columns);

// -----------------------------------------------------------------------------
// TSV
//
// Same layout as CSV with '\t' between fields. Nothing is quoted or escaped:
// a field that itself holds a tab or a newline is written verbatim and will
// not read back as a single field.
// -----------------------------------------------------------------------------
[[nodiscard]]
std::string tsv(const manifest::ComponentList& list, Columns columns);

// Quotes a single CSV field when required
[[nodiscard]]
std::string csv_field(std::string_view field);

} // namespace pkgview::render::delimited
