#include "duckdb_session.hpp"

#include <crow/logging.h>

namespace sqlbatch {

DuckDBSession::DuckDBSession(const std::string& database_path,
                             const std::map<std::string, std::string>& settings)
    : db_(nullptr), conn_(nullptr) {
    DuckDBConfig config;
    if (!config.is_valid()) {
        throw DatabaseError("Failed to create DuckDB configuration");
    }

    // Extensions for remote engines are installed on demand
    if (!config.set("allow_unsigned_extensions", "true")) {
        throw DatabaseError("Failed to set DuckDB configuration: allow_unsigned_extensions");
    }
    if (!config.set("autoinstall_known_extensions", "true")) {
        throw DatabaseError("Failed to set DuckDB configuration: autoinstall_known_extensions");
    }
    if (!config.set("autoload_known_extensions", "true")) {
        throw DatabaseError("Failed to set DuckDB configuration: autoload_known_extensions");
    }

    for (const auto& [key, value] : settings) {
        if (!config.set(key, value)) {
            throw DatabaseError("Failed to set DuckDB configuration: " + key);
        }
    }

    char* error = nullptr;
    if (duckdb_open_ext(database_path.c_str(), &db_, config.get(), &error) == DuckDBError) {
        std::string error_message = error ? error : "Unknown error";
        duckdb_free(error);
        throw DatabaseError("Failed to open database: " + error_message);
    }

    if (duckdb_connect(db_, &conn_) == DuckDBError) {
        duckdb_close(&db_);
        throw DatabaseError("Failed to create database connection");
    }

    logDuckDBVersion();
}

DuckDBSession::~DuckDBSession() {
    if (conn_) {
        duckdb_disconnect(&conn_);
    }
    if (db_) {
        duckdb_close(&db_);
    }
}

std::unique_ptr<DuckDBSession> DuckDBSession::connect(const RunnerConfig& config) {
    auto engine = parseEngine(config.engine);
    if (!engine) {
        throw DatabaseError("unsupported engine: " + config.engine);
    }

    auto session = std::make_unique<DuckDBSession>(":memory:", config.duckdb_settings);
    session->attach(engineProfile(*engine, config), buildConnectionString(config));

    CROW_LOG_INFO << "Connected to " << engineName(*engine) << " database " << config.dbname
                  << " at " << config.host << ":" << config.port;
    return session;
}

void DuckDBSession::attach(const EngineProfile& profile, const std::string& connection_string) {
    DuckDBResult result;

    CROW_LOG_DEBUG << "Loading DuckDB extension: " << profile.extension;
    run("INSTALL " + profile.extension, result, "extension install");
    run("LOAD " + profile.extension, result, "extension load");

    CROW_LOG_DEBUG << "Attaching " << TARGET_CATALOG << " (TYPE " << profile.attach_type << ")";
    run("ATTACH " + quoteLiteral(connection_string) + " AS " + TARGET_CATALOG +
        " (TYPE " + profile.attach_type + ")", result, "attach");
    run(std::string("USE ") + TARGET_CATALOG, result, "attach");
}

void DuckDBSession::begin() {
    DuckDBResult result;
    run("BEGIN TRANSACTION", result, "begin");
    CROW_LOG_DEBUG << "Transaction started";
}

void DuckDBSession::commit() {
    DuckDBResult result;
    run("COMMIT", result, "commit");
    CROW_LOG_DEBUG << "Transaction committed";
}

void DuckDBSession::rollback() {
    DuckDBResult result;
    run("ROLLBACK", result, "rollback");
    CROW_LOG_DEBUG << "Transaction rolled back";
}

ResultTable DuckDBSession::query(const std::string& sql) {
    DuckDBResult result;
    run(sql, result);

    ResultTable table;
    idx_t column_count = duckdb_column_count(result.get());
    idx_t row_count = duckdb_row_count(result.get());

    for (idx_t col = 0; col < column_count; col++) {
        const char* name = duckdb_column_name(result.get(), col);
        table.columns.push_back(name ? name : "");
    }

    for (idx_t row = 0; row < row_count; row++) {
        std::vector<std::optional<std::string>> values;
        values.reserve(column_count);
        for (idx_t col = 0; col < column_count; col++) {
            if (duckdb_value_is_null(result.get(), col, row)) {
                values.push_back(std::nullopt);
                continue;
            }
            DuckDBString value(duckdb_value_varchar(result.get(), col, row));
            values.push_back(value.to_string());
        }
        table.rows.push_back(std::move(values));
    }

    return table;
}

std::optional<int64_t> DuckDBSession::execute(const std::string& sql) {
    DuckDBResult result;
    run(sql, result);

    if (duckdb_result_return_type(*result.get()) != DUCKDB_RESULT_TYPE_CHANGED_ROWS) {
        return std::nullopt;
    }
    return static_cast<int64_t>(duckdb_rows_changed(result.get()));
}

void DuckDBSession::interrupt() {
    if (conn_) {
        duckdb_interrupt(conn_);
    }
}

std::string DuckDBSession::quoteLiteral(const std::string& value) {
    std::string quoted = "'";
    for (char c : value) {
        if (c == '\'') {
            quoted += '\'';
        }
        quoted += c;
    }
    quoted += '\'';
    return quoted;
}

void DuckDBSession::run(const std::string& sql, DuckDBResult& result, const std::string& context) {
    result.reset();

    auto state = duckdb_query(conn_, sql.c_str(), result.get());
    result.set_initialized();

    if (state == DuckDBError) {
        const char* error = duckdb_result_error(result.get());
        std::string error_message = error ? error : "Unknown error";
        if (context.empty()) {
            throw DatabaseError(error_message);
        }
        throw DatabaseError("Query execution failed during " + context + ": " + error_message);
    }
}

void DuckDBSession::logDuckDBVersion() {
    CROW_LOG_DEBUG << "DuckDB Library Version: " << duckdb_library_version();
}

} // namespace sqlbatch
