#include "pkgview/pipeline.hpp"

#include <utility>

#include "pkgview/manifest/parser.hpp"
#include "pkgview/manifest/split.hpp"
#include "pkgview/render/renderer.hpp"
#include "pkgview/sort/sorter.hpp"

#include "lcr/log/logger.hpp"


namespace pkgview {

Outcome transform(std::string_view xml, const Config& config) {
    Outcome outcome;

    manifest::Manifest m;
    manifest::parser::Error perr;
    auto r = manifest::parser::package::parse(xml, m, perr);
    if (r != manifest::parser::Result::Parsed) {
        PV_DEBUG("[PIPELINE] Parse failed: " << manifest::parser::to_string(r));
        outcome.failure = error{error_code::parse, manifest::parser::describe(perr)};
        return outcome;
    }

    auto components = std::move(m.components);
    if (config.split_parent) {
        components = manifest::split_parents(std::move(components));
    }
    components = sort::sort(std::move(components), config.sort);

    if (lcr::log::Logger::instance().enabled(lcr::log::Level::Trace)) {
        for (const auto& c : components) {
            PV_TRACE("[PIPELINE] " << c);
        }
    }

    render::Options options;
    options.format = config.format;
    options.columns = config.split_parent ? render::Columns::TypeParentMember : render::Columns::TypeMember;

    outcome.output = render::render(components, options);
    return outcome;
}

} // namespace pkgview
