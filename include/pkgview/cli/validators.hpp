#pragma once

#include <string>
#include <string_view>

#include <CLI/CLI.hpp>

#include "lcr/log/logger.hpp"

#include "pkgview/render/format.hpp"
#include "pkgview/sort/policy.hpp"


namespace pkgview::cli {

// "a | b | c"
template <typename Names>
[[nodiscard]]
inline std::string join_names(const Names& names) {
    std::string out;
    for (std::string_view n : names) {
        if (!out.empty()) {
            out += " | ";
        }
        out += n;
    }
    return out;
}

// -------------------------------------------------------------
// Output format validator
// -------------------------------------------------------------
inline auto format_validator = CLI::Validator(
    [](std::string& value) -> std::string {
        render::OutputFormat f;
        if (render::from_string(value, f)) {
            return {};
        }
        return "Format must be one of: " + join_names(render::OUTPUT_FORMAT_NAMES);
    },
    "FORMAT"
);

// -------------------------------------------------------------
// Sort policy validator
// -------------------------------------------------------------
inline auto sort_validator = CLI::Validator(
    [](std::string& value) -> std::string {
        sort::SortPolicy p;
        if (sort::from_string(value, p)) {
            return {};
        }
        return "Sort must be one of: " + join_names(sort::SORT_POLICY_NAMES);
    },
    "SORT"
);

// -------------------------------------------------------------
// Log level validator
// -------------------------------------------------------------
inline auto log_level_validator = CLI::Validator(
    [](std::string& value) -> std::string {
        lcr::log::Level lvl;
        if (lcr::log::parse_level(value, lvl)) {
            return {};
        }
        return "Log level must be one of: trace | debug | info | warn | error | fatal";
    },
    "LEVEL"
);

} // namespace pkgview::cli
