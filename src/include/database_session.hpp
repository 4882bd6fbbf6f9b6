#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace sqlbatch {

/**
 * Exception thrown when a database operation fails
 * (connection, transaction control or statement execution).
 */
class DatabaseError : public std::runtime_error {
public:
    explicit DatabaseError(const std::string& message)
        : std::runtime_error(message) {}
};

// Rows returned by a query, values already rendered as text
struct ResultTable {
    std::vector<std::string> columns;
    std::vector<std::vector<std::optional<std::string>>> rows;  // nullopt is SQL NULL
};

/**
 * Abstract interface for a connection that runs one script transaction.
 *
 * Implementations:
 * - DuckDBSession: in-process DuckDB, optionally attached to a remote engine
 *
 * All operations throw DatabaseError on failure.
 */
class IDatabaseSession {
public:
    virtual ~IDatabaseSession() = default;

    virtual void begin() = 0;
    virtual void commit() = 0;
    virtual void rollback() = 0;

    /**
     * Run a row-returning statement and collect its result.
     */
    virtual ResultTable query(const std::string& sql) = 0;

    /**
     * Run a statement for effect.
     *
     * @return The number of affected rows, or nullopt when the engine does not report one
     */
    virtual std::optional<int64_t> execute(const std::string& sql) = 0;

    /**
     * Ask the currently running statement to stop. Safe to call from another thread.
     */
    virtual void interrupt() = 0;
};

} // namespace sqlbatch
