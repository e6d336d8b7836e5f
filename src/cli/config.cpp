#include "pkgview/cli/config.hpp"
#include "pkgview/cli/validators.hpp"
#include "pkgview/version.hpp"

#include <cstdlib>
#include <sstream>

#include <CLI/CLI.hpp>

#include "lcr/log/logger.hpp"


namespace pkgview::cli {

Action configure(int argc, const char* const* argv, Params& params, std::ostream& out, std::ostream& err) {
    CLI::App app{"Salesforce package.xml viewer - displays metadata components in readable formats", "pkgview"};

    app.add_option("path", params.path, "Path to the package.xml file")->required();
    app.add_option("-f,--format", params.format, "Output format: " + join_names(render::OUTPUT_FORMAT_NAMES))->check(format_validator)->default_val(params.format);
    app.add_option("-s,--sort", params.sort, "Sort order: " + join_names(sort::SORT_POLICY_NAMES))->check(sort_validator)->default_val(params.sort);
    app.add_flag("--split-parent", params.split_parent, "Split Parent.Member / Parent-Member names into a separate Parent column");
    app.add_option("-l,--log-level", params.log_level, "Log level: trace | debug | info | warn | error | fatal")->check(log_level_validator)->default_val(params.log_level);
    app.set_version_flag("-V,--version", std::string(version_string));

    app.footer(
        "Diagnostics are written to stderr; the listing goes to stdout.\n"
        "Exit status is 0 on success and 1 on any error."
    );

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        int code = app.exit(e, out, err);
        return Action{false, code == static_cast<int>(CLI::ExitCodes::Success) ? EXIT_SUCCESS : EXIT_FAILURE};
    }

    return Action{};
}

bool to_config(const Params& params, Config& config, error& err) {
    Config parsed;

    if (!render::from_string(params.format, parsed.format)) {
        err = error{error_code::invalid_option,
                    "Invalid format '" + params.format + "' (allowed: " + join_names(render::OUTPUT_FORMAT_NAMES) + ")"};
        return false;
    }
    if (!sort::from_string(params.sort, parsed.sort)) {
        err = error{error_code::invalid_option,
                    "Invalid sort '" + params.sort + "' (allowed: " + join_names(sort::SORT_POLICY_NAMES) + ")"};
        return false;
    }
    lcr::log::Level level;
    if (!lcr::log::parse_level(params.log_level, level)) {
        err = error{error_code::invalid_option,
                    "Invalid log level '" + params.log_level + "' (allowed: trace | debug | info | warn | error | fatal)"};
        return false;
    }
    parsed.split_parent = params.split_parent;

    lcr::log::Logger::instance().set_level(level);
    if (lcr::log::Logger::instance().enabled(lcr::log::Level::Debug)) {
        std::ostringstream oss;
        params.dump("Effective configuration", oss);
        PV_DEBUG(oss.str());
    }

    config = parsed;
    return true;
}

} // namespace pkgview::cli
