#pragma once

#include <cstddef>
#include <string>
#include <string_view>

#include <pugixml.hpp>

/*
================================================================================
Manifest XML Helpers (Low-Level Primitives)
================================================================================

Low-level helpers used by the manifest parser to inspect pugixml DOM nodes.

Responsibilities:
  • Compare element names by local name (namespace prefix stripped)
  • Extract and trim element text content (PCDATA and CDATA children)
  • Resolve the namespace URI that applies to an element
  • Locate the first invalid UTF-8 sequence in the input
  • Translate byte offsets into line / column positions

These helpers never log and never decide whether a document is acceptable;
that is the parser's job.

================================================================================
*/


namespace pkgview::manifest::parser::helper {

// ============================================================================
// NAMES
// ============================================================================

// "md:types" -> "types", "types" -> "types"
[[nodiscard]]
inline std::string_view local_name(const pugi::xml_node& node) noexcept {
    std::string_view name{node.name()};
    auto colon = name.find(':');
    return (colon == std::string_view::npos) ? name : name.substr(colon + 1);
}

// "md:types" -> "md", "types" -> ""
[[nodiscard]]
inline std::string_view name_prefix(const pugi::xml_node& node) noexcept {
    std::string_view name{node.name()};
    auto colon = name.find(':');
    return (colon == std::string_view::npos) ? std::string_view{} : name.substr(0, colon);
}

[[nodiscard]]
inline bool is_element(const pugi::xml_node& node, std::string_view local) noexcept {
    return node.type() == pugi::node_element && local_name(node) == local;
}

// ------------------------------------------------------------
// Namespace URI bound to the element's prefix, looked up on the
// element and then its ancestors. Empty when unbound.
// ------------------------------------------------------------
[[nodiscard]]
inline std::string_view namespace_uri(const pugi::xml_node& node) {
    auto prefix = name_prefix(node);
    std::string attr = prefix.empty() ? std::string("xmlns") : "xmlns:" + std::string(prefix);
    for (auto n = node; n && n.type() == pugi::node_element; n = n.parent()) {
        auto a = n.attribute(attr.c_str());
        if (a) {
            return a.value();
        }
    }
    return {};
}

// ============================================================================
// TEXT
// ============================================================================

[[nodiscard]]
inline bool is_space(char c) noexcept {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

[[nodiscard]]
inline std::string_view trim(std::string_view sv) noexcept {
    while (!sv.empty() && is_space(sv.front())) sv.remove_prefix(1);
    while (!sv.empty() && is_space(sv.back()))  sv.remove_suffix(1);
    return sv;
}

// ------------------------------------------------------------
// Concatenated text of the element's direct PCDATA / CDATA
// children, trimmed. Comments and processing instructions
// between text runs are skipped.
// ------------------------------------------------------------
[[nodiscard]]
inline std::string element_text(const pugi::xml_node& node) {
    std::string text;
    for (auto child : node.children()) {
        auto t = child.type();
        if (t == pugi::node_pcdata || t == pugi::node_cdata) {
            text += child.value();
        }
    }
    return std::string(trim(text));
}

// ============================================================================
// ENCODING
// ============================================================================

// ------------------------------------------------------------
// Offset of the first byte that does not begin a well-formed
// UTF-8 sequence (overlong forms, surrogates and code points
// above U+10FFFF included), or npos when the text is valid.
// ------------------------------------------------------------
[[nodiscard]]
inline std::size_t invalid_utf8_offset(std::string_view text) noexcept {
    const auto* s = reinterpret_cast<const unsigned char*>(text.data());
    const std::size_t n = text.size();
    std::size_t i = 0;
    while (i < n) {
        const unsigned char c = s[i];
        if (c < 0x80) {
            ++i;
            continue;
        }
        std::size_t len = 0;
        unsigned char lo = 0x80;
        unsigned char hi = 0xBF;
        if (c >= 0xC2 && c <= 0xDF)      { len = 2; }
        else if (c == 0xE0)              { len = 3; lo = 0xA0; }
        else if (c == 0xED)              { len = 3; hi = 0x9F; }
        else if (c >= 0xE1 && c <= 0xEF) { len = 3; }
        else if (c == 0xF0)              { len = 4; lo = 0x90; }
        else if (c >= 0xF1 && c <= 0xF3) { len = 4; }
        else if (c == 0xF4)              { len = 4; hi = 0x8F; }
        else {
            return i;
        }
        if (n - i < len || s[i + 1] < lo || s[i + 1] > hi) {
            return i;
        }
        for (std::size_t k = 2; k < len; ++k) {
            if (s[i + k] < 0x80 || s[i + k] > 0xBF) {
                return i;
            }
        }
        i += len;
    }
    return std::string_view::npos;
}

// ============================================================================
// POSITIONS
// ============================================================================

struct Position {
    std::size_t line = 1;     // 1-based
    std::size_t column = 1;   // 1-based, in bytes
};

// Line / column of a byte offset into text. Offsets past the end
// resolve to the position just after the last byte.
[[nodiscard]]
inline Position position_of(std::string_view text, std::size_t offset) noexcept {
    Position pos{};
    if (offset > text.size()) {
        offset = text.size();
    }
    for (std::size_t i = 0; i < offset; ++i) {
        if (text[i] == '\n') {
            ++pos.line;
            pos.column = 1;
        } else {
            ++pos.column;
        }
    }
    return pos;
}

} // namespace pkgview::manifest::parser::helper
