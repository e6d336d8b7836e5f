#include "pkgview/manifest/split.hpp"

#include <algorithm>
#include <string>

#include "lcr/log/logger.hpp"


namespace pkgview::manifest {

std::optional<char> parent_separator(std::string_view type_name) noexcept {
    if (std::find(SPLIT_BY_DOT.begin(), SPLIT_BY_DOT.end(), type_name) != SPLIT_BY_DOT.end()) {
        return '.';
    }
    if (std::find(SPLIT_BY_HYPHEN.begin(), SPLIT_BY_HYPHEN.end(), type_name) != SPLIT_BY_HYPHEN.end()) {
        return '-';
    }
    return std::nullopt;
}

ComponentList split_parents(ComponentList list) {
    std::size_t split = 0;
    for (auto& c : list) {
        auto sep = parent_separator(c.type_name);
        if (!sep) {
            continue;
        }
        auto pos = c.member_name.find(*sep);
        if (pos == std::string::npos) {
            continue;
        }
        c.parent_name = c.member_name.substr(0, pos);
        c.member_name.erase(0, pos + 1);
        ++split;
    }
    PV_DEBUG("[SPLIT] " << split << " of " << list.size() << " component(s) split into parent/member");
    return list;
}

} // namespace pkgview::manifest
