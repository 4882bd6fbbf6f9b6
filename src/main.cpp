#include <argparse/argparse.hpp>
#include <crow/logging.h>
#include <exception>
#include <iostream>
#include <cstdlib>
#include <memory>
#include <string>

#include "duckdb_session.hpp"
#include "runner_config.hpp"
#include "script_executor.hpp"
#include "sql_utils.hpp"

using namespace sqlbatch;

void set_log_level(const std::string& log_level) {
    if (log_level == "debug") {
        crow::logger::setLogLevel(crow::LogLevel::Debug);
    } else if (log_level == "info") {
        crow::logger::setLogLevel(crow::LogLevel::Info);
    } else if (log_level == "warning") {
        crow::logger::setLogLevel(crow::LogLevel::Warning);
    } else if (log_level == "error") {
        crow::logger::setLogLevel(crow::LogLevel::Error);
    } else {
        std::cerr << "Invalid log level: " << log_level << ". Using default (info)." << std::endl;
        crow::logger::setLogLevel(crow::LogLevel::Info);
    }
}

void terminateHandler() {
    CROW_LOG_ERROR << "Unhandled exception caught! sqlbatch is giving up :-(";

    auto ex = std::current_exception();
    if (ex) {
        try {
            std::rethrow_exception(ex);
        } catch (const std::exception& e) {
            CROW_LOG_ERROR << "exception caught: " << e.what();
        }
    }
    std::abort();
}

// Command line values override the config file, but only when actually given
void applyArguments(const argparse::ArgumentParser& program, RunnerConfig& config) {
    if (auto engine = program.present<std::string>("--engine")) {
        config.engine = *engine;
    }
    if (auto host = program.present<std::string>("--host")) {
        config.host = *host;
    }
    if (auto port = program.present<int>("--port")) {
        config.port = *port;
    }
    if (auto username = program.present<std::string>("--username")) {
        config.username = *username;
    }
    if (auto password = program.present<std::string>("--password")) {
        config.password = *password;
    }
    if (auto dbname = program.present<std::string>("--dbname")) {
        config.dbname = *dbname;
    }
    if (auto sql = program.present<std::string>("--sql")) {
        config.sql_path = *sql;
    }
    if (auto timeout = program.present<int>("--timeout")) {
        config.timeout = std::chrono::seconds(*timeout);
    }
}

int main(int argc, char* argv[])
{
    std::set_terminate(terminateHandler);

    argparse::ArgumentParser program("sqlbatch");

    program.add_argument("--engine")
        .help("Database engine: oracle, sqlserver, postgres");

    program.add_argument("--host")
        .help("Database host");

    program.add_argument("--port")
        .help("Database port (defaults to the engine's standard port)")
        .scan<'i', int>();

    program.add_argument("--username")
        .help("Database username (default: db_admin)");

    program.add_argument("--password")
        .help("Database password (or set SQLBATCH_PASSWORD)");

    program.add_argument("--dbname")
        .help("Database name or service");

    program.add_argument("--sql")
        .help("Path to the SQL file to run");

    program.add_argument("--timeout")
        .help("Timeout for the whole script in seconds, 0 disables")
        .scan<'i', int>();

    program.add_argument("-c", "--config")
        .help("Optional YAML file with connection settings");

    program.add_argument("--log-level")
        .help("Set the log level (debug, info, warning, error)")
        .default_value(std::string("info"));

    try {
        program.parse_args(argc, argv);
    } catch (const std::exception& err) {
        std::cerr << err.what() << std::endl;
        std::cerr << program;
        return 1;
    }

    set_log_level(program.get<std::string>("--log-level"));

    RunnerConfig config;
    if (auto config_file = program.present<std::string>("--config")) {
        try {
            RunnerConfigLoader(*config_file).loadInto(config);
        } catch (const std::exception& e) {
            std::cerr << "Error while loading configuration, Details: " << e.what() << std::endl;
            return 1;
        }
    }
    applyArguments(program, config);
    applyEnvironment(config);

    auto validation = RunnerConfigValidator::validate(config);
    if (!validation.valid) {
        for (const auto& error : validation.errors) {
            std::cerr << error << std::endl;
        }
        return 1;
    }

    auto statements = readSqlScript(config.sql_path);
    if (!statements) {
        std::cerr << statements.error().toString() << std::endl;
        return 1;
    }
    if (statements->empty()) {
        std::cerr << Error::Validation("no SQL statements found in file").toString() << std::endl;
        return 1;
    }

    std::unique_ptr<DuckDBSession> session;
    try {
        session = DuckDBSession::connect(config);
    } catch (const std::exception& e) {
        std::cerr << Error::Database("failed to connect", e.what()).toString() << std::endl;
        return 1;
    }

    ScriptExecutor executor(*session, std::cout, config.timeout);
    auto summary = executor.run(*statements);
    if (!summary) {
        std::cerr << summary.error().toString() << std::endl;
        return 1;
    }

    return 0;
}
