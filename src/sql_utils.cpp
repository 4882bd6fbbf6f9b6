#include "sql_utils.hpp"
#include "sql_lexer.hpp"
#include "statement_accumulator.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>
#include <crow/logging.h>

namespace sqlbatch {

namespace {
    bool startsWithIgnoreCase(const std::string& str, const std::string& prefix) {
        if (str.size() < prefix.size()) {
            return false;
        }
        return std::equal(prefix.begin(), prefix.end(), str.begin(),
            [](char a, char b) {
                return std::tolower(static_cast<unsigned char>(a)) ==
                       std::tolower(static_cast<unsigned char>(b));
            });
    }
}

std::string trimSqlString(const std::string& str) {
    const auto start = std::find_if_not(str.begin(), str.end(),
        [](unsigned char ch) { return std::isspace(ch); });
    const auto end = std::find_if_not(str.rbegin(), str.rend(),
        [](unsigned char ch) { return std::isspace(ch); }).base();

    if (start >= end) {
        return "";
    }
    return std::string(start, end);
}

std::vector<std::string> splitSqlStatements(ICharacterSource& source) {
    SqlLexer lexer(source);
    StatementAccumulator accumulator;

    ScanStep step;
    while (lexer.next(step)) {
        if (step.boundary) {
            accumulator.flush();
        } else {
            accumulator.append(step.text);
        }
    }

    if (lexer.suspended()) {
        CROW_LOG_DEBUG << "SQL script ends inside an unterminated comment, quote or dollar-quoted body";
    }

    // Don't forget the last statement (may not have trailing semicolon)
    return accumulator.finish();
}

std::vector<std::string> splitSqlStatements(std::istream& input) {
    StreamCharacterSource source(input);
    return splitSqlStatements(source);
}

std::vector<std::string> splitSqlStatements(const std::string& script) {
    std::istringstream input(script);
    return splitSqlStatements(input);
}

Result<std::vector<std::string>> readSqlScript(const std::string& path) {
    try {
        FileCharacterSource source(path);
        auto statements = splitSqlStatements(source);
        CROW_LOG_DEBUG << "Read " << statements.size() << " statements from " << path;
        return statements;
    } catch (const SourceReadError& e) {
        return Error::SourceRead("failed to read SQL file", e.what());
    }
}

bool isQueryStatement(const std::string& statement) {
    std::string trimmed = trimSqlString(statement);
    return startsWithIgnoreCase(trimmed, "select") || startsWithIgnoreCase(trimmed, "with");
}

} // namespace sqlbatch
