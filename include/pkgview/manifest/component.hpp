#pragma once

#include <string>
#include <vector>
#include <ostream>
#include <utility>


namespace pkgview::manifest {

// -----------------------------
// Component (one <members> entry under one <types> block)
// -----------------------------
struct Component {
    std::string type_name;
    std::string member_name;
    std::string parent_name;   // empty unless parent splitting was applied

    Component() = default;

    Component(std::string type, std::string member, std::string parent = {})
        : type_name(std::move(type))
        , member_name(std::move(member))
        , parent_name(std::move(parent))
    {}

    [[nodiscard]] bool has_parent() const noexcept { return !parent_name.empty(); }

    friend bool operator==(const Component&, const Component&) = default;
};

// Document order: type blocks in order, members in order within a block.
// Duplicates are kept as they appear.
using ComponentList = std::vector<Component>;


std::ostream& operator<<(std::ostream&, const Component&);

} // namespace pkgview::manifest
