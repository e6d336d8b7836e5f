#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "pkgview/manifest/component.hpp"


namespace pkgview::render {

// -----------------------------
// Column layout shared by every format
// -----------------------------
enum class Columns {
    TypeMember,         // Type | Member
    TypeParentMember    // Type | Parent | Member
};

[[nodiscard]]
inline std::vector<std::string_view> header(Columns columns) {
    if (columns == Columns::TypeParentMember) {
        return {"Type", "Parent", "Member"};
    }
    return {"Type", "Member"};
}

// Cells of one component, in header order
[[nodiscard]]
inline std::vector<std::string_view> cells(const manifest::Component& c, Columns columns) {
    if (columns == Columns::TypeParentMember) {
        return {c.type_name, c.parent_name, c.member_name};
    }
    return {c.type_name, c.member_name};
}

} // namespace pkgview::render
