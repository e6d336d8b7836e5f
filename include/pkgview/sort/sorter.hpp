#pragma once

#include "pkgview/manifest/component.hpp"
#include "pkgview/sort/policy.hpp"


namespace pkgview::sort {

// Strict weak ordering used by SortPolicy::ByType
[[nodiscard]]
bool by_type_less(const manifest::Component& a, const manifest::Component& b) noexcept;

// -----------------------------------------------------------------------------
// Reorders a component list.
//
//   AsIs   -> returned unchanged
//   ByType -> stable sort on (type_name, parent_name, member_name), byte-wise
//             ascending; equal components keep their input order
//
// Total over any list, the empty list included.
// -----------------------------------------------------------------------------
[[nodiscard]]
manifest::ComponentList sort(manifest::ComponentList list, SortPolicy policy);

} // namespace pkgview::sort
