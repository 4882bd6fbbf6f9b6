#pragma once

#include <string>
#include <vector>

namespace sqlbatch {

/**
 * Collects scanned text into statements.
 * Owns the current statement buffer and the ordered list of completed
 * statements; only trimmed, non-empty statements are ever emitted.
 */
class StatementAccumulator {
public:
    void append(char c) { buffer_ += c; }
    void append(const std::string& text) { buffer_ += text; }

    /**
     * Close the current statement: trim it, keep it if anything is left,
     * and start a new empty buffer.
     */
    void flush();

    /**
     * Final flush for a trailing statement without a terminating ';'.
     * Hands over the completed statements; the accumulator is empty afterwards.
     */
    std::vector<std::string> finish();

    const std::string& buffer() const { return buffer_; }
    const std::vector<std::string>& statements() const { return statements_; }

private:
    std::string buffer_;
    std::vector<std::string> statements_;
};

} // namespace sqlbatch
