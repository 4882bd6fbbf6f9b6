#pragma once

#include <duckdb.h>
#include <map>
#include <memory>
#include <string>

#include "database_session.hpp"
#include "duckdb_raii.hpp"
#include "runner_config.hpp"

namespace sqlbatch {

/**
 * Database session backed by an in-process DuckDB instance.
 *
 * Remote engines are reached through DuckDB extensions: connect() loads the
 * engine's extension, attaches the target database as catalog "target" and
 * makes it the default catalog, so script statements run against it.
 */
class DuckDBSession : public IDatabaseSession {
public:
    static constexpr const char* TARGET_CATALOG = "target";

    /**
     * Open a DuckDB database (":memory:" for a throwaway one).
     *
     * @param database_path Path of the DuckDB database file
     * @param settings Extra DuckDB configuration options
     * @throws DatabaseError if the database cannot be opened
     */
    explicit DuckDBSession(const std::string& database_path = ":memory:",
                           const std::map<std::string, std::string>& settings = {});
    ~DuckDBSession() override;

    DuckDBSession(const DuckDBSession&) = delete;
    DuckDBSession& operator=(const DuckDBSession&) = delete;

    /**
     * Create a session attached to the engine described by a validated config.
     * @throws DatabaseError if the extension cannot be loaded or the attach fails
     */
    static std::unique_ptr<DuckDBSession> connect(const RunnerConfig& config);

    /**
     * Load an extension and attach a database through it as the default catalog.
     */
    void attach(const EngineProfile& profile, const std::string& connection_string);

    void begin() override;
    void commit() override;
    void rollback() override;
    ResultTable query(const std::string& sql) override;
    std::optional<int64_t> execute(const std::string& sql) override;
    void interrupt() override;

    // Quote a string as a SQL literal, doubling embedded single quotes
    static std::string quoteLiteral(const std::string& value);

private:
    void run(const std::string& sql, DuckDBResult& result, const std::string& context = "");
    void logDuckDBVersion();

    duckdb_database db_;
    duckdb_connection conn_;
};

} // namespace sqlbatch
