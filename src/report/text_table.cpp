#include "report/text_table.hpp"

#include <algorithm>

namespace anonymizer {

namespace {

size_t display_width(const std::string& s) {
    return static_cast<size_t>(std::count_if(s.begin(), s.end(), [](char c) {
        return (static_cast<unsigned char>(c) & 0xC0) != 0x80;
    }));
}

std::string pad(const std::string& s, size_t width, Align align) {
    const size_t w = display_width(s);
    if (w >= width) return s;
    const std::string fill(width - w, ' ');
    return align == Align::RIGHT ? fill + s : s + fill;
}

} // anonymous namespace

std::string render_github_table(
    const std::vector<std::string>& headers,
    const std::vector<std::vector<std::string>>& rows,
    const std::vector<Align>& align) {

    const size_t cols = headers.size();
    std::vector<size_t> widths(cols);
    for (size_t c = 0; c < cols; ++c) {
        widths[c] = display_width(headers[c]);
        for (const auto& row : rows) {
            if (c < row.size()) widths[c] = std::max(widths[c], display_width(row[c]));
        }
    }
    auto align_of = [&](size_t c) { return c < align.size() ? align[c] : Align::LEFT; };

    auto render_row = [&](const std::vector<std::string>& cells) {
        std::string line = "|";
        for (size_t c = 0; c < cols; ++c) {
            const std::string& cell = c < cells.size() ? cells[c] : std::string{};
            line += ' ';
            line += pad(cell, widths[c], align_of(c));
            line += " |";
        }
        return line;
    };

    std::string out = render_row(headers);
    out += "\n|";
    for (size_t c = 0; c < cols; ++c) {
        if (align_of(c) == Align::RIGHT) {
            out += std::string(widths[c] + 1, '-') + ":|";
        } else {
            out += std::string(widths[c] + 2, '-') + '|';
        }
    }
    for (const auto& row : rows) {
        out += '\n';
        out += render_row(row);
    }
    return out;
}

} // namespace anonymizer
