#include "pkgview/render/table.hpp"

#include <algorithm>
#include <vector>


namespace pkgview::render::table {

namespace {

// ---------------------------------
// Box drawing glyphs
// ---------------------------------
constexpr std::string_view H  = "─";
constexpr std::string_view V  = "│";

struct Border {
    std::string_view left;
    std::string_view junction;
    std::string_view right;
};

constexpr Border TOP    {"┌", "┬", "┐"};
constexpr Border MIDDLE {"├", "┼", "┤"};
constexpr Border BOTTOM {"└", "┴", "┘"};

using Row = std::vector<std::string_view>;

// Splits a cell on '\n' into the lines it occupies
[[nodiscard]]
std::vector<std::string_view> cell_lines(std::string_view cell) {
    std::vector<std::string_view> lines;
    std::size_t start = 0;
    while (true) {
        auto nl = cell.find('\n', start);
        if (nl == std::string_view::npos) {
            lines.push_back(cell.substr(start));
            break;
        }
        lines.push_back(cell.substr(start, nl - start));
        start = nl + 1;
    }
    return lines;
}

[[nodiscard]]
std::size_t cell_width(std::string_view cell) {
    std::size_t w = 0;
    for (auto line : cell_lines(cell)) {
        w = std::max(w, display_width(line));
    }
    return w;
}

void append_border(std::string& out, const Border& b, const std::vector<std::size_t>& widths) {
    out += b.left;
    for (std::size_t i = 0; i < widths.size(); ++i) {
        if (i != 0) {
            out += b.junction;
        }
        for (std::size_t k = 0; k < widths[i] + 2; ++k) {
            out += H;
        }
    }
    out += b.right;
    out += '\n';
}

void append_row(std::string& out, const Row& row, const std::vector<std::size_t>& widths) {
    std::vector<std::vector<std::string_view>> lines;
    lines.reserve(row.size());
    std::size_t height = 1;
    for (auto cell : row) {
        lines.push_back(cell_lines(cell));
        height = std::max(height, lines.back().size());
    }

    for (std::size_t h = 0; h < height; ++h) {
        for (std::size_t i = 0; i < row.size(); ++i) {
            std::string_view text = h < lines[i].size() ? lines[i][h] : std::string_view{};
            out += V;
            out += ' ';
            out += text;
            out.append(widths[i] - display_width(text), ' ');
            out += ' ';
        }
        out += V;
        out += '\n';
    }
}

} // namespace


std::size_t display_width(std::string_view text) noexcept {
    std::size_t n = 0;
    for (unsigned char c : text) {
        // count every byte that is not a UTF-8 continuation byte
        if ((c & 0xC0) != 0x80) {
            ++n;
        }
    }
    return n;
}

std::string render(const manifest::ComponentList& list, Columns columns) {
    const Row head = header(columns);

    std::vector<Row> rows;
    rows.reserve(list.size());
    for (const auto& c : list) {
        rows.push_back(cells(c, columns));
    }

    std::vector<std::size_t> widths(head.size(), 0);
    for (std::size_t i = 0; i < head.size(); ++i) {
        widths[i] = cell_width(head[i]);
    }
    for (const auto& row : rows) {
        for (std::size_t i = 0; i < row.size(); ++i) {
            widths[i] = std::max(widths[i], cell_width(row[i]));
        }
    }

    std::string out;
    append_border(out, TOP, widths);
    append_row(out, head, widths);
    for (const auto& row : rows) {
        append_border(out, MIDDLE, widths);
        append_row(out, row, widths);
    }
    append_border(out, BOTTOM, widths);
    return out;
}

} // namespace pkgview::render::table
