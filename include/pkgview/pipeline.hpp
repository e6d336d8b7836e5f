#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "pkgview/error.hpp"
#include "pkgview/render/format.hpp"
#include "pkgview/sort/policy.hpp"


namespace pkgview {

// -----------------------------
// Per-run configuration, threaded into the pipeline
// -----------------------------
struct Config {
    render::OutputFormat format = render::OutputFormat::Table;
    sort::SortPolicy sort = sort::SortPolicy::ByType;
    bool split_parent = false;
};

// Result of one parse -> split -> sort -> render pass.
// Exactly one of `output` / `failure` is set.
struct Outcome {
    std::optional<std::string> output;
    std::optional<error> failure;

    [[nodiscard]] bool ok() const noexcept { return output.has_value(); }
};

// -----------------------------------------------------------------------------
// (manifest text) -> (rendered text)
//
// Pure: no I/O, no global state besides the logger. Rendering only happens
// once parsing succeeded.
// -----------------------------------------------------------------------------
[[nodiscard]]
Outcome transform(std::string_view xml, const Config& config);

} // namespace pkgview
