#include "runner_config.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <crow/logging.h>
#include <fmt/core.h>

namespace sqlbatch {

namespace {
    constexpr const char* PASSWORD_ENV = "SQLBATCH_PASSWORD";

    std::string toLower(std::string value) {
        std::transform(value.begin(), value.end(), value.begin(),
            [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return value;
    }

    template<typename T>
    T safeGet(const YAML::Node& node, const std::string& key, const T& defaultValue) {
        if (!node[key]) {
            return defaultValue;
        }
        try {
            return node[key].as<T>();
        } catch (const YAML::Exception& e) {
            throw std::runtime_error("Invalid value for key: " + key + ", Error: " + e.what());
        }
    }
}

std::optional<DatabaseEngine> parseEngine(const std::string& name) {
    auto normalized = toLower(name);
    if (normalized == "oracle") {
        return DatabaseEngine::Oracle;
    }
    if (normalized == "sqlserver") {
        return DatabaseEngine::SqlServer;
    }
    if (normalized == "postgres") {
        return DatabaseEngine::Postgres;
    }
    return std::nullopt;
}

std::string engineName(DatabaseEngine engine) {
    switch (engine) {
        case DatabaseEngine::Oracle:
            return "oracle";
        case DatabaseEngine::SqlServer:
            return "sqlserver";
        case DatabaseEngine::Postgres:
            return "postgres";
        default:
            return "unknown";
    }
}

int defaultPort(DatabaseEngine engine) {
    switch (engine) {
        case DatabaseEngine::Oracle:
            return 1521;
        case DatabaseEngine::SqlServer:
            return 1433;
        case DatabaseEngine::Postgres:
            return 5432;
        default:
            return 0;
    }
}

EngineProfile engineProfile(DatabaseEngine engine, const RunnerConfig& config) {
    EngineProfile profile;
    switch (engine) {
        case DatabaseEngine::Oracle:
            profile = EngineProfile{"oracle", "oracle"};
            break;
        case DatabaseEngine::SqlServer:
            profile = EngineProfile{"mssql", "mssql"};
            break;
        case DatabaseEngine::Postgres:
            profile = EngineProfile{"postgres", "postgres"};
            break;
    }

    if (!config.extension.empty()) {
        profile.extension = config.extension;
    }
    if (!config.attach_type.empty()) {
        profile.attach_type = config.attach_type;
    }
    return profile;
}

std::string urlEscape(const std::string& value, bool space_as_plus) {
    std::string escaped;
    escaped.reserve(value.size());
    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            escaped += static_cast<char>(c);
        } else if (c == ' ' && space_as_plus) {
            escaped += '+';
        } else {
            escaped += fmt::format("%{:02X}", static_cast<unsigned int>(c));
        }
    }
    return escaped;
}

std::string buildConnectionString(const RunnerConfig& config) {
    auto engine = parseEngine(config.engine);
    if (!engine) {
        throw std::invalid_argument("unsupported engine: " + config.engine);
    }

    switch (*engine) {
        case DatabaseEngine::Oracle:
            return fmt::format("oracle://{}:{}@{}:{}/{}",
                               urlEscape(config.username), urlEscape(config.password),
                               config.host, config.port, config.dbname);
        case DatabaseEngine::SqlServer:
            return fmt::format("sqlserver://{}:{}@{}:{}?database={}",
                               urlEscape(config.username), urlEscape(config.password),
                               config.host, config.port, urlEscape(config.dbname, true));
        case DatabaseEngine::Postgres:
            return fmt::format("host={} port={} user={} password={} dbname={} sslmode=disable",
                               config.host, config.port, config.username, config.password,
                               config.dbname);
    }
    throw std::invalid_argument("unsupported engine: " + config.engine);
}

// ------------------------------------------------------------------------------------------------

RunnerConfigLoader::RunnerConfigLoader(const std::filesystem::path& config_file_path)
    : config_file_path_(std::filesystem::absolute(config_file_path)),
      base_path_(config_file_path_.parent_path()) {
    CROW_LOG_DEBUG << "RunnerConfigLoader initialized with config file: " << config_file_path_.string();
}

void RunnerConfigLoader::loadInto(RunnerConfig& config) const {
    if (!std::filesystem::exists(config_file_path_)) {
        throw std::runtime_error("Configuration file not found: " + config_file_path_.string());
    }

    std::ifstream file(config_file_path_);
    if (!file) {
        throw std::runtime_error("Failed to open configuration file: " + config_file_path_.string());
    }
    std::stringstream content;
    content << file.rdbuf();

    CROW_LOG_INFO << "Loading configuration file: " << config_file_path_.string();
    try {
        YAML::Node node = YAML::Load(content.str());
        applyYaml(node, base_path_, config);
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("Failed to parse YAML file '" + config_file_path_.string() + "': " + e.what());
    }
}

void RunnerConfigLoader::applyYaml(const YAML::Node& node, const std::filesystem::path& base_path,
                                   RunnerConfig& config) {
    if (!node || node.IsNull()) {
        return;
    }
    if (!node.IsMap()) {
        throw std::runtime_error("Configuration root must be a mapping");
    }

    config.engine = safeGet<std::string>(node, "engine", config.engine);
    config.host = safeGet<std::string>(node, "host", config.host);
    config.port = safeGet<int>(node, "port", config.port);
    config.username = safeGet<std::string>(node, "username", config.username);
    config.password = safeGet<std::string>(node, "password", config.password);
    config.dbname = safeGet<std::string>(node, "dbname", config.dbname);
    config.extension = safeGet<std::string>(node, "extension", config.extension);
    config.attach_type = safeGet<std::string>(node, "attach_type", config.attach_type);
    config.timeout = std::chrono::seconds(
        safeGet<long long>(node, "timeout_seconds", static_cast<long long>(config.timeout.count())));

    if (node["sql"]) {
        std::filesystem::path sql_path = safeGet<std::string>(node, "sql", "");
        if (!sql_path.empty() && sql_path.is_relative()) {
            sql_path = base_path / sql_path;
        }
        config.sql_path = sql_path.string();
    }

    if (node["duckdb"] && node["duckdb"]["settings"]) {
        auto settings = node["duckdb"]["settings"];
        if (!settings.IsMap()) {
            throw std::runtime_error("duckdb.settings must be a mapping");
        }
        for (const auto& setting : settings) {
            config.duckdb_settings[setting.first.as<std::string>()] = setting.second.as<std::string>();
        }
    }
}

void applyEnvironment(RunnerConfig& config) {
    if (!config.password.empty()) {
        return;
    }
    const char* value = std::getenv(PASSWORD_ENV);
    if (value) {
        CROW_LOG_DEBUG << "Using password from " << PASSWORD_ENV;
        config.password = value;
    }
}

// ------------------------------------------------------------------------------------------------

std::string RunnerConfigValidator::ValidationResult::getErrorSummary() const {
    if (errors.empty()) {
        return "";
    }

    std::stringstream ss;
    ss << "Errors (" << errors.size() << "):\n";
    for (size_t i = 0; i < errors.size(); ++i) {
        ss << "  " << (i + 1) << ". " << errors[i] << "\n";
    }
    return ss.str();
}

RunnerConfigValidator::ValidationResult RunnerConfigValidator::validate(RunnerConfig& config) {
    ValidationResult result;

    if (config.engine.empty()) {
        result.errors.push_back("engine is required");
    }
    if (config.host.empty()) {
        result.errors.push_back("host is required");
    }
    if (config.dbname.empty()) {
        result.errors.push_back("dbname is required");
    }
    if (config.sql_path.empty()) {
        result.errors.push_back("sql path is required");
    }

    auto engine = parseEngine(config.engine);
    if (!config.engine.empty() && !engine) {
        result.errors.push_back("unsupported engine: " + config.engine);
    }

    if (config.port == 0 && engine) {
        config.port = defaultPort(*engine);
    } else if (config.port < 0 || config.port > 65535) {
        result.errors.push_back("port must be between 1 and 65535");
    }

    if (config.timeout.count() < 0) {
        result.errors.push_back("timeout must not be negative");
    } else if (config.timeout.count() > MAX_TIMEOUT_SECONDS) {
        result.errors.push_back(fmt::format("timeout must not exceed {} seconds", MAX_TIMEOUT_SECONDS));
    }

    result.valid = result.errors.empty();
    return result;
}

} // namespace sqlbatch
