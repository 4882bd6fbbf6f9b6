#pragma once

#include <string>
#include <variant>

#include "character_source.hpp"

namespace sqlbatch {

// Lexical contexts of the statement scanner. Exactly one is active at a time.
struct NormalState {};
struct LineCommentState {};
struct BlockCommentState {};
struct SingleQuotedState {};
struct DoubleQuotedState {};
struct DollarQuotedState {
    std::string tag;  // opening delimiter including both '$', e.g. "$$" or "$body$"
};

using LexerState = std::variant<NormalState,
                                LineCommentState,
                                BlockCommentState,
                                SingleQuotedState,
                                DoubleQuotedState,
                                DollarQuotedState>;

// Result of scanning one character (plus any lookahead it consumed)
struct ScanStep {
    std::string text;       // verbatim text to append to the current statement
    bool boundary = false;  // true for a statement-terminating ';' (text is empty)
};

/**
 * Character-by-character state machine that decides where SQL statements end.
 *
 * A ';' is a statement boundary only in the Normal state. Comments, quoted
 * literals and dollar-quoted bodies suspend boundary detection until their own
 * closing delimiter is seen. Quotes have no backslash escapes; '' works as a
 * close immediately followed by a reopen. Unterminated constructs at end of
 * input are not an error.
 */
class SqlLexer {
public:
    explicit SqlLexer(ICharacterSource& source);

    /**
     * Scan the next character.
     *
     * @param step Receives the text to append or the boundary signal
     * @return false once the source is exhausted
     * @throws SourceReadError if the source cannot be read
     */
    bool next(ScanStep& step);

    const LexerState& state() const { return state_; }

    // True while a statement boundary cannot be recognized
    bool suspended() const { return !std::holds_alternative<NormalState>(state_); }

    /**
     * Detect a dollar-quote opening tag after a '$' that was just consumed.
     * Searches the lookahead window for the closing '$' of the tag; a space,
     * tab or newline first, or no '$' within the window, means no tag.
     *
     * @return the tag including both '$', or an empty string
     */
    static std::string detectDollarTag(const std::string& lookahead);

private:
    void scanNormal(char c, ScanStep& step);
    void scanLineComment(char c);
    void scanBlockComment(char c, ScanStep& step);
    void scanQuoted(char c, char quote);
    void scanDollarQuoted(char c, ScanStep& step);

    // Move n characters from the source into the step's text
    void consume(std::size_t n, ScanStep& step);

    ICharacterSource& source_;
    LexerState state_;
};

} // namespace sqlbatch
