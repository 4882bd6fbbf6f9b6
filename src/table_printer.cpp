#include "table_printer.hpp"

#include <algorithm>
#include <utility>

namespace sqlbatch {

void TablePrinter::print(const ResultTable& table, std::ostream& out) {
    std::vector<std::vector<std::string>> rows;
    rows.reserve(table.rows.size());
    for (const auto& row : table.rows) {
        std::vector<std::string> cells;
        cells.reserve(row.size());
        for (const auto& value : row) {
            cells.push_back(value ? *value : NULL_TEXT);
        }
        rows.push_back(std::move(cells));
    }

    auto widths = columnWidths(table.columns, rows);
    auto separator = formatSeparator(widths);

    out << separator << "\n";
    out << formatRow(table.columns, widths) << "\n";
    out << separator << "\n";
    for (const auto& row : rows) {
        out << formatRow(row, widths) << "\n";
    }
    out << separator << "\n";
}

std::vector<std::size_t> TablePrinter::columnWidths(const std::vector<std::string>& headers,
                                                    const std::vector<std::vector<std::string>>& rows) {
    std::vector<std::size_t> widths;
    widths.reserve(headers.size());
    for (const auto& header : headers) {
        widths.push_back(header.size());
    }
    for (const auto& row : rows) {
        for (std::size_t i = 0; i < row.size() && i < widths.size(); ++i) {
            widths[i] = std::max(widths[i], row[i].size());
        }
    }
    return widths;
}

std::string TablePrinter::formatSeparator(const std::vector<std::size_t>& widths) {
    std::string line = "+";
    for (auto width : widths) {
        line.append(width + 2, '-');
        line += '+';
    }
    return line;
}

std::string TablePrinter::formatRow(const std::vector<std::string>& cells,
                                    const std::vector<std::size_t>& widths) {
    std::string line = "|";
    for (std::size_t i = 0; i < cells.size() && i < widths.size(); ++i) {
        line += ' ';
        line += cells[i];
        line.append(widths[i] - cells[i].size() + 1, ' ');
        line += '|';
    }
    return line;
}

} // namespace sqlbatch
