#pragma once

#include <cstddef>
#include <ostream>
#include <string>
#include <vector>

#include "database_session.hpp"

namespace sqlbatch {

/**
 * Renders query results as a fixed-width bordered text table:
 *
 *   +----+-------+
 *   | id | name  |
 *   +----+-------+
 *   | 1  | alice |
 *   | 2  | NULL  |
 *   +----+-------+
 *
 * Column width is the longest header or cell in bytes. NULL values print as "NULL".
 */
class TablePrinter {
public:
    static constexpr const char* NULL_TEXT = "NULL";

    static void print(const ResultTable& table, std::ostream& out);

    static std::vector<std::size_t> columnWidths(const std::vector<std::string>& headers,
                                                 const std::vector<std::vector<std::string>>& rows);
    static std::string formatSeparator(const std::vector<std::size_t>& widths);
    static std::string formatRow(const std::vector<std::string>& cells,
                                 const std::vector<std::size_t>& widths);
};

} // namespace sqlbatch
