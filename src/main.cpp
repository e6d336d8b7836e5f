// ============================================================================
// pkgview
//
// Reads a Salesforce package.xml and prints its metadata components as a
// table, CSV or TSV listing on stdout.
//
//   pkgview package.xml
//   pkgview package.xml -f csv -s as-is
//   pkgview package.xml --split-parent -f tsv
// ============================================================================
#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <string>

#ifdef _WIN32
#include <io.h>
#else
#include <unistd.h>
#endif

#include "pkgview/cli/config.hpp"
#include "pkgview/error.hpp"
#include "pkgview/io/file.hpp"
#include "pkgview/pipeline.hpp"
#include "pkgview/render/renderer.hpp"

#include "lcr/log/logger.hpp"


namespace {

inline bool stderr_is_terminal() {
#ifdef _WIN32
    return _isatty(2) != 0;
#else
    return ::isatty(STDERR_FILENO) != 0;
#endif
}

int report(const pkgview::error& e) {
    PV_DEBUG("[pkgview] Run failed (" << pkgview::to_string(e.code) << ")");
    std::cerr << "Error: " << e.message << std::endl;
    return EXIT_FAILURE;
}

} // namespace


int main(int argc, char** argv) {
#ifdef SIGPIPE
    // A closed pipe (pkgview ... | head) surfaces as EPIPE on write
    std::signal(SIGPIPE, SIG_IGN);
#endif

    lcr::log::Logger::instance().enable_color(stderr_is_terminal());

    // -------------------------------------------------------------------------
    // Configuration
    // -------------------------------------------------------------------------
    pkgview::cli::Params params;
    auto action = pkgview::cli::configure(argc, argv, params, std::cout, std::cerr);
    if (!action.run) {
        return action.exit_code;
    }

    pkgview::Config config;
    pkgview::error err{pkgview::error_code::invalid_option, {}};
    if (!pkgview::cli::to_config(params, config, err)) {
        return report(err);
    }

    // -------------------------------------------------------------------------
    // Input
    // -------------------------------------------------------------------------
    std::string xml;
    if (!pkgview::io::read_file(params.path, xml, err)) {
        return report(err);
    }

    // -------------------------------------------------------------------------
    // Parse -> sort -> render
    // -------------------------------------------------------------------------
    auto outcome = pkgview::transform(xml, config);
    if (!outcome.ok()) {
        auto failure = *outcome.failure;
        failure.message = "Failed to parse " + params.path + ": " + failure.message;
        return report(failure);
    }

    // -------------------------------------------------------------------------
    // Output
    // -------------------------------------------------------------------------
    errno = 0;
    if (pkgview::render::write(*outcome.output, std::cout) != pkgview::render::Result::Written) {
        if (errno == EPIPE) {
            PV_DEBUG("[pkgview] Output pipe closed by reader");
            return EXIT_SUCCESS;
        }
        return report(pkgview::error{pkgview::error_code::io_failure, "Error writing output"});
    }

    return EXIT_SUCCESS;
}
