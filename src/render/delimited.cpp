#include "pkgview/render/delimited.hpp"

#include <vector>


namespace pkgview::render::delimited {

namespace {

[[nodiscard]]
bool needs_quotes(std::string_view field) noexcept {
    return field.find_first_of(",\"\r\n") != std::string_view::npos;
}

template <typename FieldWriter>
void append_line(std::string& out, const std::vector<std::string_view>& fields, char sep, FieldWriter&& write) {
    for (std::size_t i = 0; i < fields.size(); ++i) {
        if (i != 0) {
            out += sep;
        }
        write(out, fields[i]);
    }
    out += '\n';
}

template <typename FieldWriter>
[[nodiscard]]
std::string write_all(const manifest::ComponentList& list, Columns columns, char sep, FieldWriter&& write) {
    std::string out;
    append_line(out, header(columns), sep, write);
    for (const auto& c : list) {
        append_line(out, cells(c, columns), sep, write);
    }
    return out;
}

} // namespace


std::string csv_field(std::string_view field) {
    if (!needs_quotes(field)) {
        return std::string(field);
    }
    std::string quoted;
    quoted.reserve(field.size() + 2);
    quoted += '"';
    for (char ch : field) {
        if (ch == '"') {
            quoted += '"';
        }
        quoted += ch;
    }
    quoted += '"';
    return quoted;
}

std::string csv(const manifest::ComponentList& list, Columns columns) {
    return write_all(list, columns, ',', [](std::string& out, std::string_view field) {
        out += csv_field(field);
    });
}

std::string tsv(const manifest::ComponentList& list, Columns columns) {
    return write_all(list, columns, '\t', [](std::string& out, std::string_view field) {
        out += field;
    });
}

} // namespace pkgview::render::delimited
