#include "pkgview/manifest/component.hpp"

#include <ostream>


namespace pkgview::manifest {

// ---------------------------------
// Debug / logging helper
// ---------------------------------

std::ostream& operator<<(std::ostream& os, const Component& c) {
    os << "[component] {"
       << "type=" << c.type_name;

    if (c.has_parent()) {
        os << ", parent=" << c.parent_name;
    }

    os << ", member=" << c.member_name
       << "}";

    return os;
}

} // namespace pkgview::manifest
