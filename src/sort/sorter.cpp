#include "pkgview/sort/sorter.hpp"

#include <algorithm>

#include "lcr/log/logger.hpp"


namespace pkgview::sort {

bool by_type_less(const manifest::Component& a, const manifest::Component& b) noexcept {
    if (int c = a.type_name.compare(b.type_name); c != 0) {
        return c < 0;
    }
    if (int c = a.parent_name.compare(b.parent_name); c != 0) {
        return c < 0;
    }
    return a.member_name.compare(b.member_name) < 0;
}

manifest::ComponentList sort(manifest::ComponentList list, SortPolicy policy) {
    switch (policy) {
        case SortPolicy::AsIs:
            break;
        case SortPolicy::ByType:
            std::stable_sort(list.begin(), list.end(), by_type_less);
            break;
    }
    PV_DEBUG("[SORT] " << list.size() << " component(s) ordered " << to_string(policy));
    return list;
}

} // namespace pkgview::sort
