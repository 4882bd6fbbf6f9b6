#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <ostream>
#include <string>
#include <vector>

#include "database_session.hpp"
#include "error.hpp"

namespace sqlbatch {

struct ExecutionSummary {
    std::size_t statements_executed = 0;
    std::size_t queries = 0;
    int64_t rows_affected = 0;  // sum over statements that reported a count
    std::size_t rows_printed = 0;
};

/**
 * Runs split statements in order inside a single transaction.
 *
 * Statements starting with SELECT or WITH are queried and printed as a table;
 * everything else is executed and reports its affected-row count (or OK).
 * The first failing statement rolls the whole transaction back. Output that
 * was already printed for earlier statements stays printed. Once the batch
 * deadline has passed no further statement starts and nothing is committed.
 */
class ScriptExecutor {
public:
    /**
     * @param session Open database session, used for this batch only
     * @param out Stream receiving statement headers and result tables
     * @param timeout Deadline for the whole batch, zero for none
     */
    ScriptExecutor(IDatabaseSession& session, std::ostream& out,
                   std::chrono::milliseconds timeout = std::chrono::milliseconds::zero());

    /**
     * Execute all statements and commit.
     * @return A summary, or a Database error naming the failed step
     */
    Result<ExecutionSummary> run(const std::vector<std::string>& statements);

private:
    void executeStatement(std::size_t index, const std::string& statement, ExecutionSummary& summary);
    void rollbackQuietly();
    std::string timeoutNote() const;

    IDatabaseSession& session_;
    std::ostream& out_;
    std::chrono::milliseconds timeout_;
};

} // namespace sqlbatch
