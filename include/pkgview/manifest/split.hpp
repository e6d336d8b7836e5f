#pragma once

#include <array>
#include <optional>
#include <string_view>

#include "pkgview/manifest/component.hpp"


namespace pkgview::manifest {

// Types whose members are written "Parent.Child"
inline constexpr std::array<std::string_view, 7> SPLIT_BY_DOT = {
    "AssignmentRule",
    "CustomField",
    "ListView",
    "RecordType",
    "SharingCriteriaRule",
    "SharingOwnerRule",
    "SharingTerritoryRule"
};

// Types whose members are written "Parent-Child"
inline constexpr std::array<std::string_view, 1> SPLIT_BY_HYPHEN = {
    "Layout"
};

// Separator used to split members of the given type, if any
[[nodiscard]]
std::optional<char> parent_separator(std::string_view type_name) noexcept;

// -----------------------------------------------------------------------------
// Moves the parent prefix of splittable members into Component::parent_name.
//
// Splits at the first separator only ("Account.Sub.Field__c" -> "Account" +
// "Sub.Field__c"). Members without the separator, and members of other types,
// come back unchanged. Order and count are preserved.
// -----------------------------------------------------------------------------
[[nodiscard]]
ComponentList split_parents(ComponentList list);

} // namespace pkgview::manifest
