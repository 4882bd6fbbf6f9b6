#pragma once

#include <cstddef>
#include <deque>
#include <fstream>
#include <istream>
#include <stdexcept>
#include <string>

namespace sqlbatch {

/**
 * Exception thrown when the underlying character source cannot be read.
 * This is the only failure the statement splitter knows about.
 */
class SourceReadError : public std::runtime_error {
public:
    explicit SourceReadError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * Abstract interface for a forward-only character stream with bounded lookahead.
 *
 * Implementations:
 * - StreamCharacterSource: any std::istream (strings, files, pipes)
 * - FileCharacterSource: a script file on the local filesystem
 */
class ICharacterSource {
public:
    // Largest number of characters peek() will ever look ahead
    static constexpr std::size_t MAX_LOOKAHEAD = 64;

    virtual ~ICharacterSource() = default;

    /**
     * Consume the next character.
     *
     * @param c Receives the character
     * @return false once the input is exhausted
     * @throws SourceReadError on a read fault
     */
    virtual bool get(char& c) = 0;

    /**
     * Look at up to n upcoming characters without consuming them.
     * Returns fewer than n characters only at the end of the input.
     *
     * @throws std::invalid_argument if n exceeds MAX_LOOKAHEAD
     * @throws SourceReadError on a read fault
     */
    virtual std::string peek(std::size_t n) = 0;
};

/**
 * Character source over a std::istream. Peeked characters are held in a
 * buffer of at most MAX_LOOKAHEAD characters; the stream is never rewound.
 */
class StreamCharacterSource : public ICharacterSource {
public:
    explicit StreamCharacterSource(std::istream& stream);

    bool get(char& c) override;
    std::string peek(std::size_t n) override;

    // Characters consumed through get() so far
    std::size_t position() const { return position_; }

private:
    // Pull from the stream until the buffer holds n characters or the input ends
    void fill(std::size_t n);

    std::istream& stream_;
    std::deque<char> lookahead_;
    std::size_t position_;
    bool exhausted_;
};

/**
 * Character source reading a script file from disk.
 */
class FileCharacterSource : public ICharacterSource {
public:
    /**
     * @throws SourceReadError if the file does not exist or cannot be opened
     */
    explicit FileCharacterSource(const std::string& path);

    bool get(char& c) override { return reader_.get(c); }
    std::string peek(std::size_t n) override { return reader_.peek(n); }

    const std::string& path() const { return path_; }

private:
    std::string path_;
    std::ifstream file_;
    StreamCharacterSource reader_;
};

} // namespace sqlbatch
