#include "character_source.hpp"

#include <algorithm>
#include <filesystem>

namespace sqlbatch {

// ============================================================================
// StreamCharacterSource Implementation
// ============================================================================

StreamCharacterSource::StreamCharacterSource(std::istream& stream)
    : stream_(stream), position_(0), exhausted_(false) {}

void StreamCharacterSource::fill(std::size_t n) {
    while (lookahead_.size() < n && !exhausted_) {
        auto ch = stream_.get();
        if (ch == std::istream::traits_type::eof()) {
            if (stream_.bad()) {
                throw SourceReadError("I/O error while reading SQL script at offset " +
                                      std::to_string(position_ + lookahead_.size()));
            }
            exhausted_ = true;
            break;
        }
        lookahead_.push_back(std::istream::traits_type::to_char_type(ch));
    }
}

bool StreamCharacterSource::get(char& c) {
    fill(1);
    if (lookahead_.empty()) {
        return false;
    }
    c = lookahead_.front();
    lookahead_.pop_front();
    ++position_;
    return true;
}

std::string StreamCharacterSource::peek(std::size_t n) {
    if (n > MAX_LOOKAHEAD) {
        throw std::invalid_argument("lookahead of " + std::to_string(n) +
                                    " characters exceeds the limit of " +
                                    std::to_string(MAX_LOOKAHEAD));
    }
    fill(n);
    auto count = std::min(n, lookahead_.size());
    return std::string(lookahead_.begin(), lookahead_.begin() + count);
}

// ============================================================================
// FileCharacterSource Implementation
// ============================================================================

FileCharacterSource::FileCharacterSource(const std::string& path)
    : path_(path), file_(), reader_(file_) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path_, ec)) {
        throw SourceReadError("File not found: " + path_);
    }

    file_.open(path_, std::ios::in | std::ios::binary);
    if (!file_) {
        throw SourceReadError("Failed to open file: " + path_);
    }
}

} // namespace sqlbatch
