#include "script_executor.hpp"
#include "batch_deadline.hpp"
#include "sql_utils.hpp"
#include "table_printer.hpp"

#include <crow/logging.h>
#include <fmt/core.h>

namespace sqlbatch {

ScriptExecutor::ScriptExecutor(IDatabaseSession& session, std::ostream& out,
                               std::chrono::milliseconds timeout)
    : session_(session), out_(out), timeout_(timeout) {}

Result<ExecutionSummary> ScriptExecutor::run(const std::vector<std::string>& statements) {
    ExecutionSummary summary;

    try {
        session_.begin();
    } catch (const DatabaseError& e) {
        return Error::Database("failed to start transaction", e.what());
    }

    CROW_LOG_INFO << "Executing " << statements.size() << " statements in one transaction";

    BatchDeadline deadline(session_, timeout_);
    deadline.start();

    for (std::size_t i = 0; i < statements.size(); ++i) {
        const std::size_t index = i + 1;

        // An interrupt sent between statements is dropped by the engine
        if (deadline.expired()) {
            deadline.stop();
            rollbackQuietly();
            return Error::Database(fmt::format("statement {} failed", index),
                                   "not started" + timeoutNote());
        }

        try {
            executeStatement(index, statements[i], summary);
        } catch (const DatabaseError& e) {
            deadline.stop();
            rollbackQuietly();

            std::string details = e.what();
            if (deadline.expired()) {
                details += timeoutNote();
            }
            return Error::Database(fmt::format("statement {} failed", index), details);
        }
    }

    deadline.stop();
    if (deadline.expired()) {
        rollbackQuietly();
        return Error::Database("failed to commit transaction", "not attempted" + timeoutNote());
    }

    try {
        session_.commit();
    } catch (const DatabaseError& e) {
        return Error::Database("failed to commit transaction", e.what());
    }

    CROW_LOG_INFO << "Committed " << summary.statements_executed << " statements ("
                  << summary.queries << " queries, " << summary.rows_affected << " rows affected)";
    return summary;
}

void ScriptExecutor::executeStatement(std::size_t index, const std::string& statement,
                                      ExecutionSummary& summary) {
    CROW_LOG_DEBUG << "Statement " << index << ": " << statement;

    if (isQueryStatement(statement)) {
        auto table = session_.query(statement);
        out_ << fmt::format("\n-- Statement {} (query)\n", index);
        TablePrinter::print(table, out_);
        summary.queries++;
        summary.rows_printed += table.rows.size();
    } else {
        auto rows_affected = session_.execute(statement);
        out_ << fmt::format("\n-- Statement {} (execution)\n", index);
        if (rows_affected && *rows_affected >= 0) {
            out_ << fmt::format("Rows affected: {}\n", *rows_affected);
            summary.rows_affected += *rows_affected;
        } else {
            out_ << "OK\n";
        }
    }
    out_.flush();
    summary.statements_executed++;
}

std::string ScriptExecutor::timeoutNote() const {
    return fmt::format(" (batch timeout of {:g}s exceeded)",
                       std::chrono::duration<double>(timeout_).count());
}

void ScriptExecutor::rollbackQuietly() {
    try {
        session_.rollback();
    } catch (const DatabaseError& e) {
        CROW_LOG_ERROR << "Rollback failed: " << e.what();
    }
}

} // namespace sqlbatch
