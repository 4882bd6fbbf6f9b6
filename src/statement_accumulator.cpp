#include "statement_accumulator.hpp"
#include "sql_utils.hpp"

#include <utility>

namespace sqlbatch {

void StatementAccumulator::flush() {
    std::string statement = trimSqlString(buffer_);
    if (!statement.empty()) {
        statements_.push_back(std::move(statement));
    }
    buffer_.clear();
}

std::vector<std::string> StatementAccumulator::finish() {
    flush();
    std::vector<std::string> result;
    result.swap(statements_);
    return result;
}

} // namespace sqlbatch
