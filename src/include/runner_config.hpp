#pragma once

#include <chrono>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <yaml-cpp/yaml.h>

namespace sqlbatch {

enum class DatabaseEngine {
    Oracle,
    SqlServer,
    Postgres
};

/**
 * How DuckDB reaches an engine: the extension to install/load and the
 * TYPE used in ATTACH.
 */
struct EngineProfile {
    std::string extension;
    std::string attach_type;
};

struct RunnerConfig {
    std::string engine;
    std::string host;
    int port = 0;  // 0 means the engine's default port
    std::string username = "db_admin";
    std::string password;
    std::string dbname;
    std::string sql_path;
    std::chrono::seconds timeout{300};  // whole-batch deadline, 0 disables

    // Engine profile overrides, empty means the engine default
    std::string extension;
    std::string attach_type;

    // Extra DuckDB settings applied when the session is opened
    std::map<std::string, std::string> duckdb_settings;
};

/**
 * Parse an engine name ("oracle", "sqlserver", "postgres"), case-insensitively.
 */
std::optional<DatabaseEngine> parseEngine(const std::string& name);

std::string engineName(DatabaseEngine engine);

// 1521 / 1433 / 5432
int defaultPort(DatabaseEngine engine);

/**
 * The engine's DuckDB profile, with the config's extension/attach_type
 * overrides applied.
 */
EngineProfile engineProfile(DatabaseEngine engine, const RunnerConfig& config);

/**
 * Build the connection string handed to the engine's DuckDB extension.
 *
 * - postgres:  host=H port=P user=U password=W dbname=D sslmode=disable
 * - sqlserver: sqlserver://U:W@H:P?database=D
 * - oracle:    oracle://U:W@H:P/D
 *
 * @throws std::invalid_argument for an unsupported engine
 */
std::string buildConnectionString(const RunnerConfig& config);

/**
 * Percent-encode everything except RFC 3986 unreserved characters.
 * With space_as_plus, spaces become '+' (query string form).
 */
std::string urlEscape(const std::string& value, bool space_as_plus = false);

/**
 * Loads runner settings from a YAML file on top of an existing config.
 * Keys that are absent leave the current value untouched.
 */
class RunnerConfigLoader {
public:
    explicit RunnerConfigLoader(const std::filesystem::path& config_file_path);

    /**
     * @throws std::runtime_error if the file is missing, unreadable or not valid YAML
     */
    void loadInto(RunnerConfig& config) const;

    /**
     * Apply an already parsed YAML document.
     * Relative "sql" paths resolve against base_path.
     */
    static void applyYaml(const YAML::Node& node, const std::filesystem::path& base_path,
                          RunnerConfig& config);

    std::filesystem::path getConfigFilePath() const { return config_file_path_; }

private:
    std::filesystem::path config_file_path_;
    std::filesystem::path base_path_;
};

/**
 * Fill in secrets from the environment: SQLBATCH_PASSWORD supplies the
 * password when none was configured.
 */
void applyEnvironment(RunnerConfig& config);

/**
 * Checks a runner config before any I/O happens.
 * Collects every problem instead of stopping at the first one.
 */
class RunnerConfigValidator {
public:
    // Upper bound for the batch timeout: one year
    static constexpr long long MAX_TIMEOUT_SECONDS = 365LL * 24 * 60 * 60;

    struct ValidationResult {
        bool valid = true;
        std::vector<std::string> errors;

        std::string getErrorSummary() const;
    };

    /**
     * Validate the config and resolve the default port when none was given.
     */
    static ValidationResult validate(RunnerConfig& config);
};

} // namespace sqlbatch
