#pragma once

#include <istream>
#include <string>
#include <vector>

#include "character_source.hpp"
#include "error.hpp"

namespace sqlbatch {

/**
 * Splits a SQL script into statements by semicolons, in a single pass.
 *
 * A ';' ends a statement only outside of:
 * - Line comments: -- text; up to the end of the line
 * - Block comments, which do not nest
 * - Single quotes: 'text; with '' doubled quote'
 * - Double quotes: "identifier; with semicolon"
 * - Dollar-quoting: $tag$content; here$tag$ (PostgreSQL style)
 *
 * Comments are kept as part of the statement they are adjacent to.
 * Backslash is NOT an escape character, so 'it\'s' closes at the second quote.
 * Unclosed quotes or comments run to the end of the input and become part of
 * the last statement; this is never an error.
 * Empty statements are filtered out.
 *
 * @param source Character source to read the script from
 * @return Vector of individual SQL statements, trimmed of whitespace
 * @throws SourceReadError if the source cannot be read
 */
std::vector<std::string> splitSqlStatements(ICharacterSource& source);

/**
 * Splits a SQL script held in a stream.
 * @throws SourceReadError if the stream reports an I/O error
 */
std::vector<std::string> splitSqlStatements(std::istream& input);

/**
 * Splits a SQL script held in memory.
 */
std::vector<std::string> splitSqlStatements(const std::string& script);

/**
 * Reads a script file and splits it into statements.
 * @param path Path to the SQL file
 * @return The statements, or a SourceRead error if the file cannot be read
 */
Result<std::vector<std::string>> readSqlScript(const std::string& path);

/**
 * Trims whitespace from both ends of a string.
 * @param str The string to trim
 * @return Trimmed string
 */
std::string trimSqlString(const std::string& str);

/**
 * Whether a statement returns rows that should be printed: true if it starts,
 * case-insensitively and after trimming, with "select" or "with".
 * A leading comment therefore makes a statement non-query.
 */
bool isQueryStatement(const std::string& statement);

} // namespace sqlbatch
