#include "pkgview/manifest/parser.hpp"
#include "pkgview/manifest/parser/helpers.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <pugixml.hpp>

#include "lcr/log/logger.hpp"


namespace pkgview::manifest::parser {

namespace {

// In-progress state of one <types> block, resolved when the block closes
struct TypeBlock {
    std::vector<std::string> members;
    std::optional<std::string> name;
    std::size_t name_count = 0;
};

// pugixml offsets index its working buffer, which matches the input bytes
// only when no transcoding took place. Otherwise line and column stay 0.
[[nodiscard]]
Result fail_malformed(std::string_view xml, std::size_t offset, bool raw_offset,
                      std::string detail, Error& error) {
    error = Error{};
    error.code = Result::MalformedXml;
    error.offset = offset;
    if (raw_offset) {
        auto pos = helper::position_of(xml, offset);
        error.line = pos.line;
        error.column = pos.column;
    }
    error.detail = std::move(detail);
    return error.code;
}

[[nodiscard]]
std::size_t node_offset(const pugi::xml_node& node, std::size_t fallback) noexcept {
    auto offset = node.offset_debug();
    return offset < 0 ? fallback : static_cast<std::size_t>(offset);
}

[[nodiscard]]
Result fail_block(Result code, std::size_t block_index, std::string detail, Error& error) {
    error = Error{};
    error.code = code;
    error.block_index = block_index;
    error.detail = std::move(detail);
    return error.code;
}

[[nodiscard]]
TypeBlock collect_block(const pugi::xml_node& types) {
    TypeBlock block;
    for (auto child : types.children()) {
        if (helper::is_element(child, "members")) {
            block.members.push_back(helper::element_text(child));
        }
        else if (helper::is_element(child, "name")) {
            ++block.name_count;
            if (!block.name) {
                block.name = helper::element_text(child);
            }
        }
    }
    return block;
}

} // namespace


Result package::parse(std::string_view xml, Manifest& out, Error& error) {
    // Fragment mode keeps document-level text as nodes, so stray text
    // around the root can be rejected below instead of being dropped.
    pugi::xml_document doc;
    auto loaded = doc.load_buffer(xml.data(), xml.size(),
                                  pugi::parse_default | pugi::parse_fragment, pugi::encoding_auto);
    const bool utf8 = loaded.encoding == pugi::encoding_utf8;
    if (!loaded) {
        auto offset = loaded.offset < 0 ? std::size_t{0} : static_cast<std::size_t>(loaded.offset);
        PV_DEBUG("[PARSER] XML rejected at offset " << offset << ": " << loaded.description());
        return fail_malformed(xml, offset, utf8, loaded.description(), error);
    }

    // pugixml passes UTF-8 through unchecked
    if (utf8) {
        auto bad = helper::invalid_utf8_offset(xml);
        if (bad != std::string_view::npos) {
            PV_DEBUG("[PARSER] Invalid UTF-8 byte at offset " << bad << " -> reject document.");
            return fail_malformed(xml, bad, true, "Invalid UTF-8 sequence", error);
        }
    }

    // Exactly one root element, no text beside it
    pugi::xml_node root;
    for (auto child : doc.children()) {
        auto type = child.type();
        if (type == pugi::node_pcdata || type == pugi::node_cdata) {
            std::string_view text{child.value()};
            auto trimmed = helper::trim(text);
            if (!trimmed.empty()) {
                auto offset = node_offset(child, xml.size());
                if (offset < xml.size()) {
                    offset += static_cast<std::size_t>(trimmed.data() - text.data());
                }
                PV_DEBUG("[PARSER] Text outside the root element -> reject document.");
                return fail_malformed(xml, offset, utf8, "Text outside the root element", error);
            }
            continue;
        }
        if (type != pugi::node_element) {
            continue;
        }
        if (root) {
            PV_DEBUG("[PARSER] Second root element <" << child.name() << "> -> reject document.");
            return fail_malformed(xml, node_offset(child, xml.size()), utf8,
                                  "Multiple root elements", error);
        }
        root = child;
    }
    if (!root) {
        PV_DEBUG("[PARSER] Document has no root element -> reject document.");
        return fail_malformed(xml, xml.size(), utf8, "No document element found", error);
    }

    Manifest parsed;

    auto ns = helper::namespace_uri(root);
    if (ns != METADATA_NAMESPACE) {
        parsed.namespace_matches = false;
        if (ns.empty()) {
            PV_WARN("[PARSER] Root <" << root.name() << "> declares no namespace (expected " << METADATA_NAMESPACE << ")");
        } else {
            PV_WARN("[PARSER] Root <" << root.name() << "> namespace '" << ns << "' differs from " << METADATA_NAMESPACE);
        }
    }

    for (auto child : root.children()) {
        if (helper::is_element(child, "types")) {
            auto index = parsed.type_blocks++;
            auto block = collect_block(child);

            if (block.name_count > 1) {
                PV_DEBUG("[PARSER] <types> block #" << index << " has " << block.name_count << " <name> elements.");
                return fail_block(Result::DuplicateTypeName, index,
                                  "more than one <name> element", error);
            }
            if (!block.name || block.name->empty()) {
                PV_DEBUG("[PARSER] <types> block #" << index << " has no type name.");
                return fail_block(Result::MissingTypeName, index,
                                  block.name ? "empty <name> element" : "no <name> element", error);
            }
            if (block.members.empty()) {
                PV_TRACE("[PARSER] <types> block #" << index << " (" << *block.name << ") has no members.");
            }

            for (auto& member : block.members) {
                parsed.components.emplace_back(*block.name, std::move(member));
            }
        }
        else if (helper::is_element(child, "version")) {
            if (!parsed.version) {
                parsed.version = helper::element_text(child);
            }
        }
    }

    PV_DEBUG("[PARSER] Parsed " << parsed.type_blocks << " type block(s), "
             << parsed.components.size() << " component(s)"
             << (parsed.version ? ", version " + *parsed.version : std::string{}));

    out = std::move(parsed);
    return Result::Parsed;
}


std::string describe(const Error& e) {
    std::string text{to_string(e.code)};
    switch (e.code) {
        case Result::Parsed:
            return text;
        case Result::MalformedXml:
            if (e.line == 0) {
                text += " at offset " + std::to_string(e.offset) + " of the decoded text";
            } else {
                text += " at line " + std::to_string(e.line) + ", column " + std::to_string(e.column)
                      + " (offset " + std::to_string(e.offset) + ")";
            }
            break;
        case Result::MissingTypeName:
        case Result::DuplicateTypeName:
            text += " in <types> block #" + std::to_string(e.block_index);
            break;
    }
    if (!e.detail.empty()) {
        text += ": " + e.detail;
    }
    return text;
}

} // namespace pkgview::manifest::parser
