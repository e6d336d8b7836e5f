#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>


namespace pkgview::manifest::parser {

// ===============================================
// PARSER RESULT ENUM
// ===============================================
enum class Result : std::uint8_t {
    Parsed            = 0,     // Parsed successfully
    MalformedXml      = 1,     // Structural failure (unclosed tags, bad encoding, no root element)
    MissingTypeName   = 2,     // A <types> block without a (non-empty) <name>
    DuplicateTypeName = 3      // A <types> block with more than one <name>
};

// -----------------------------------------------------------------------------
// Convert enum → string (for logging / diagnostics)
// -----------------------------------------------------------------------------
[[nodiscard]]
inline constexpr std::string_view to_string(Result r) noexcept {
    switch (r) {
        case Result::Parsed:            return "Parsed";
        case Result::MalformedXml:      return "MalformedXml";
        case Result::MissingTypeName:   return "MissingTypeName";
        case Result::DuplicateTypeName: return "DuplicateTypeName";
        default:                        return "unknown";
    }
}

// -----------------------------------------------------------------------------
// Failure detail
//
// MalformedXml fills offset/line/column (1-based line and column, byte offset
// into the input). When the input was transcoded (UTF-16, a latin1
// declaration) the offset indexes the decoded text and line/column stay 0. The type name errors fill block_index (0-based position of
// the offending <types> block among its siblings).
// -----------------------------------------------------------------------------
struct Error {
    Result code = Result::Parsed;
    std::size_t block_index = 0;
    std::size_t offset = 0;
    std::size_t line = 0;
    std::size_t column = 0;
    std::string detail;
};

// Human-readable one-line description of a parse failure
[[nodiscard]]
std::string describe(const Error& e);

} // namespace pkgview::manifest::parser
