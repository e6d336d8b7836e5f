#pragma once

#include <array>
#include <string_view>


namespace pkgview::render {

// -----------------------------
// Output format
// -----------------------------
enum class OutputFormat {
    Table,
    Csv,
    Tsv
};

inline constexpr std::array<std::string_view, 3> OUTPUT_FORMAT_NAMES = {"table", "csv", "tsv"};

constexpr std::string_view to_string(OutputFormat f) noexcept {
    switch (f) {
        case OutputFormat::Table: return "table";
        case OutputFormat::Csv:   return "csv";
        case OutputFormat::Tsv:   return "tsv";
    }
    return "unknown";
}

// Boundary mapping for command-line values
[[nodiscard]]
constexpr bool from_string(std::string_view name, OutputFormat& out) noexcept {
    if (name == "table") { out = OutputFormat::Table; return true; }
    if (name == "csv")   { out = OutputFormat::Csv;   return true; }
    if (name == "tsv")   { out = OutputFormat::Tsv;   return true; }
    return false;
}

} // namespace pkgview::render
