#include "pkgview/render/renderer.hpp"
#include "pkgview/render/delimited.hpp"
#include "pkgview/render/table.hpp"

#include "lcr/log/logger.hpp"


namespace pkgview::render {

std::string render(const manifest::ComponentList& list, const Options& options) {
    PV_DEBUG("[RENDER] " << list.size() << " component(s) as " << to_string(options.format));
    switch (options.format) {
        case OutputFormat::Table: return table::render(list, options.columns);
        case OutputFormat::Csv:   return delimited::csv(list, options.columns);
        case OutputFormat::Tsv:   return delimited::tsv(list, options.columns);
    }
    return {};
}

Result write(std::string_view text, std::ostream& os) {
    os.write(text.data(), static_cast<std::streamsize>(text.size()));
    os.flush();
    if (!os) {
        PV_DEBUG("[RENDER] Output stream failed after " << text.size() << " byte(s)");
        return Result::IoFailure;
    }
    return Result::Written;
}

} // namespace pkgview::render
