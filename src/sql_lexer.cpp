#include "sql_lexer.hpp"

#include <utility>

namespace sqlbatch {

SqlLexer::SqlLexer(ICharacterSource& source)
    : source_(source), state_(NormalState{}) {}

bool SqlLexer::next(ScanStep& step) {
    char c;
    if (!source_.get(c)) {
        return false;
    }

    step.text.assign(1, c);
    step.boundary = false;

    if (std::holds_alternative<NormalState>(state_)) {
        scanNormal(c, step);
    } else if (std::holds_alternative<LineCommentState>(state_)) {
        scanLineComment(c);
    } else if (std::holds_alternative<BlockCommentState>(state_)) {
        scanBlockComment(c, step);
    } else if (std::holds_alternative<SingleQuotedState>(state_)) {
        scanQuoted(c, '\'');
    } else if (std::holds_alternative<DoubleQuotedState>(state_)) {
        scanQuoted(c, '"');
    } else {
        scanDollarQuoted(c, step);
    }
    return true;
}

void SqlLexer::scanNormal(char c, ScanStep& step) {
    switch (c) {
        case '-':
            if (source_.peek(1) == "-") {
                consume(1, step);
                state_ = LineCommentState{};
            }
            break;
        case '/':
            if (source_.peek(1) == "*") {
                consume(1, step);
                state_ = BlockCommentState{};
            }
            break;
        case '$': {
            std::string tag = detectDollarTag(source_.peek(ICharacterSource::MAX_LOOKAHEAD));
            if (!tag.empty()) {
                consume(tag.size() - 1, step);
                state_ = DollarQuotedState{std::move(tag)};
            }
            break;
        }
        case '\'':
            state_ = SingleQuotedState{};
            break;
        case '"':
            state_ = DoubleQuotedState{};
            break;
        case ';':
            step.text.clear();
            step.boundary = true;
            break;
        default:
            break;
    }
}

void SqlLexer::scanLineComment(char c) {
    if (c == '\n') {
        state_ = NormalState{};
    }
}

void SqlLexer::scanBlockComment(char c, ScanStep& step) {
    if (c == '*' && source_.peek(1) == "/") {
        consume(1, step);
        state_ = NormalState{};
    }
}

void SqlLexer::scanQuoted(char c, char quote) {
    if (c == quote) {
        state_ = NormalState{};
    }
}

void SqlLexer::scanDollarQuoted(char c, ScanStep& step) {
    if (c != '$') {
        return;
    }

    // Copy: the assignment below destroys the active alternative
    const std::string rest = std::get<DollarQuotedState>(state_).tag.substr(1);
    if (source_.peek(rest.size()) == rest) {
        consume(rest.size(), step);
        state_ = NormalState{};
    }
}

void SqlLexer::consume(std::size_t n, ScanStep& step) {
    char c;
    for (std::size_t i = 0; i < n && source_.get(c); ++i) {
        step.text += c;
    }
}

std::string SqlLexer::detectDollarTag(const std::string& lookahead) {
    for (std::size_t i = 0; i < lookahead.size(); ++i) {
        char c = lookahead[i];
        if (c == '$') {
            return "$" + lookahead.substr(0, i + 1);
        }
        if (c == ' ' || c == '\n' || c == '\t') {
            return "";
        }
    }
    return "";
}

} // namespace sqlbatch
