#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

#include "pkgview/manifest/component.hpp"


namespace pkgview::manifest {

// Default namespace of a Metadata API package.xml
inline constexpr std::string_view METADATA_NAMESPACE = "http://soap.sforce.com/2006/04/metadata";

// -----------------------------
// Parsed package.xml
// -----------------------------
struct Manifest {
    ComponentList components;
    std::optional<std::string> version;   // informational, root-level <version>
    std::size_t type_blocks = 0;          // number of <types> blocks seen
    bool namespace_matches = true;        // advisory only
};

} // namespace pkgview::manifest
