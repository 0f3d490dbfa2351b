#pragma once

#include <cstddef>
#include <limits>
#include <string>
#include <vector>

namespace uc::shell {

enum class Align { Left, Right };

struct Column {
    std::string header;
    Align align = Align::Left;
    std::size_t min = 1;
    std::size_t max = std::numeric_limits<std::size_t>::max();
    bool ellipsize_middle = false;   // keep both ends of long paths
};

/// Plain-text table: header, dashed rule, one line per row. Cells wider than
/// their column are clamped; the last column shrinks to fit the terminal.
class Table {
public:
    explicit Table(std::vector<Column> cols, std::size_t term_width = 100);

    void add_row(std::vector<std::string> cells);

    [[nodiscard]] std::string render() const;

private:
    [[nodiscard]] std::vector<std::size_t> widths() const;
    [[nodiscard]] std::string cell(const std::string& text, std::size_t col, std::size_t width) const;

    std::vector<Column> cols_;
    std::vector<std::vector<std::string>> rows_;
    std::size_t term_width_;
};

}
