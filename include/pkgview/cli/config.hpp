#pragma once

#include <ostream>
#include <string>

#include "pkgview/error.hpp"
#include "pkgview/pipeline.hpp"


namespace pkgview::cli {

// -------------------------------------------------------------
// Command-line parameters (raw values, as typed by the user)
// -------------------------------------------------------------
struct Params {
    std::string path;
    std::string format    = "table";
    std::string sort      = "by-type";
    bool split_parent     = false;
    std::string log_level = "warn";

    inline void dump(const std::string& header, std::ostream& os) const {
        os << header << ":\n"
           << "  Path         : " << path << "\n"
           << "  Format       : " << format << "\n"
           << "  Sort         : " << sort << "\n"
           << "  Split parent : " << (split_parent ? "true" : "false") << "\n"
           << "  Log Level    : " << log_level << "\n";
    }
};

// What the caller should do after configure()
struct Action {
    bool run = true;       // false: help / version / bad arguments were handled
    int exit_code = 0;     // meaningful when run == false
};

// -------------------------------------------------------------
// Parses argv into `params`. Help, version and usage errors are
// printed to `out` / `err` and reported through the returned Action.
// -------------------------------------------------------------
[[nodiscard]]
Action configure(int argc, const char* const* argv, Params& params, std::ostream& out, std::ostream& err);

// Maps raw parameter strings to the typed pipeline configuration and
// applies the log level.
[[nodiscard]]
bool to_config(const Params& params, Config& config, error& err);

} // namespace pkgview::cli
