#include "shell/Table.hpp"

#include <algorithm>
#include <iterator>
#include <numeric>
#include <utility>

#include <fmt/format.h>

namespace uc::shell {

namespace {

constexpr std::size_t kIndent = 2;
constexpr std::size_t kGap = 2;

}

Table::Table(std::vector<Column> cols, const std::size_t term_width)
    : cols_(std::move(cols)), term_width_(term_width) {}

void Table::add_row(std::vector<std::string> cells) {
    cells.resize(cols_.size());
    rows_.push_back(std::move(cells));
}

std::vector<std::size_t> Table::widths() const {
    std::vector<std::size_t> w;
    w.reserve(cols_.size());
    for (const auto& c : cols_) w.push_back(std::max(c.min, c.header.size()));

    for (const auto& row : rows_)
        for (std::size_t i = 0; i < cols_.size(); ++i)
            w[i] = std::max(w[i], std::min(cols_[i].max, row[i].size()));

    const auto used = std::accumulate(w.begin(), w.end(), kIndent + kGap * (cols_.size() - 1));
    if (used > term_width_) {
        const auto excess = used - term_width_;
        auto& last = w.back();
        last = std::max(cols_.back().min, last > excess ? last - excess : 0);
    }
    return w;
}

std::string Table::cell(const std::string& text, const std::size_t col, const std::size_t width) const {
    if (text.size() <= width) return text;
    if (!cols_[col].ellipsize_middle || width <= 3) return text.substr(0, width);

    const std::size_t head = (width - 3) / 2;
    const std::size_t tail = width - 3 - head;
    return text.substr(0, head) + "..." + text.substr(text.size() - tail);
}

std::string Table::render() const {
    if (cols_.empty()) return {};
    const auto w = widths();

    std::string out;
    const auto line = [&](const std::vector<std::string>& cells) {
        out.append(kIndent, ' ');
        for (std::size_t i = 0; i < cols_.size(); ++i) {
            if (i) out.append(kGap, ' ');
            const auto text = cell(cells[i], i, w[i]);
            if (cols_[i].align == Align::Right) fmt::format_to(std::back_inserter(out), "{:>{}}", text, w[i]);
            else fmt::format_to(std::back_inserter(out), "{:<{}}", text, w[i]);
        }
        out += '\n';
    };

    std::vector<std::string> header, rule;
    for (std::size_t i = 0; i < cols_.size(); ++i) {
        header.push_back(cols_[i].header);
        rule.emplace_back(w[i], '-');
    }

    line(header);
    line(rule);
    for (const auto& row : rows_) line(row);
    return out;
}

}
