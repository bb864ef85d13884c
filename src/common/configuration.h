#ifndef AUTHMAP_CONFIGURATION_H_
#define AUTHMAP_CONFIGURATION_H_

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace Authmap {

/**
 * Configuration value that can be overridden by environment variables
 */
template<typename T>
class ConfigValue {
public:
    ConfigValue() = default;
    ConfigValue(T default_value, const std::string& env_var = "")
        : value_(default_value), env_var_(env_var) {}

    T get() const {
        if (!env_var_.empty()) {
            auto env_value = getEnvValue();
            if (env_value.has_value()) {
                return env_value.value();
            }
        }
        return value_;
    }

    void set(T value) { value_ = value; }
    const std::string& env_var() const { return env_var_; }

private:
    T value_{};
    std::string env_var_;

    std::optional<T> getEnvValue() const;
};

enum class Backend {
    kPostgreSQL,
    kSQLite,
};

std::optional<Backend> ParseBackend(const std::string& name);
const char* BackendName(Backend backend);

/**
 * The three logical reads of one snapshot run. Every statement must
 * return the column shapes documented next to the defaults in
 * configuration.cc.
 */
struct QuerySet {
    std::string identities;
    std::string site_roles;
    std::string group_roles;
};

QuerySet DefaultQuerySet();

/**
 * Connection parameters a database profile name resolves to.
 * `connection` is a libpq conninfo string or an SQLite file path and can
 * be replaced at run time with AUTHMAP_DB_<NAME>_CONNECTION so secrets
 * stay out of the file.
 */
struct DatabaseProfile {
    std::string name;
    Backend backend = Backend::kPostgreSQL;
    ConfigValue<std::string> connection;
    QuerySet queries = DefaultQuerySet();
};

/**
 * Main configuration structure
 */
struct AuthmapConfig {
    struct Runtime {
        // Hard wall-clock limit for one run, enforced by the entry point.
        ConfigValue<int> watchdog_seconds{60, "AUTHMAP_WATCHDOG_SECONDS"};
    } runtime;

    std::map<std::string, DatabaseProfile> databases;
};

/**
 * Configuration manager singleton
 */
class Configuration {
public:
    static Configuration& getInstance();

    // Load configuration from file. Replaces anything loaded before.
    bool loadFromFile(const std::string& filename);

    // Load configuration from YAML string
    bool loadFromString(const std::string& yaml_content);

    const AuthmapConfig& config() const { return config_; }
    AuthmapConfig& config() { return config_; }

    int getWatchdogSeconds() const { return config_.runtime.watchdog_seconds.get(); }

    // Throws ConfigError for an unknown name.
    const DatabaseProfile& getDatabase(const std::string& name) const;

    // Validation
    bool validate() const;
    std::vector<std::string> getValidationErrors() const;

private:
    Configuration() = default;
    Configuration(const Configuration&) = delete;
    Configuration& operator=(const Configuration&) = delete;

    AuthmapConfig config_;
    mutable std::vector<std::string> validation_errors_;
};

// Template specializations for getEnvValue
template<>
std::optional<int> ConfigValue<int>::getEnvValue() const;

template<>
std::optional<std::string> ConfigValue<std::string>::getEnvValue() const;

} // namespace Authmap

#endif // AUTHMAP_CONFIGURATION_H_
