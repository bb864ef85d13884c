#include "configuration.h"

#include <cstdlib>
#include <glog/logging.h>
#include <yaml-cpp/yaml.h>

#include "absl/strings/ascii.h"

#include "errors.h"

namespace Authmap {

namespace {

// (id, login, forename, surname, distinguishedName, credential)
constexpr char kIdentitiesQuery[] =
    "SELECT c.id, c.username, c.forename, c.surname, c.dn, c.passwd "
    "FROM contact c";

// (grantKind, identityId, roleTitle, entityName)
constexpr char kSiteRolesQuery[] =
    "SELECT 'site', sr.contact, r.title, s.name "
    "FROM site_responsibility sr "
    "JOIN role r ON r.id = sr.role "
    "JOIN site s ON s.id = sr.site";

constexpr char kGroupRolesQuery[] =
    "SELECT 'group', gr.contact, r.title, g.name "
    "FROM group_responsibility gr "
    "JOIN role r ON r.id = gr.role "
    "JOIN user_group g ON g.id = gr.user_group";

std::string ConnectionEnvVar(const std::string& profile) {
    std::string var = "AUTHMAP_DB_";
    for (char c : profile) {
        var += std::isalnum(static_cast<unsigned char>(c))
            ? static_cast<char>(std::toupper(static_cast<unsigned char>(c)))
            : '_';
    }
    return var + "_CONNECTION";
}

void ParseDatabases(const YAML::Node& databases, AuthmapConfig& config) {
    for (const auto& entry : databases) {
        const std::string name = entry.first.as<std::string>();
        const YAML::Node& node = entry.second;

        DatabaseProfile profile;
        profile.name = name;
        profile.connection = ConfigValue<std::string>(
            node["connection"] ? node["connection"].as<std::string>() : std::string(),
            ConnectionEnvVar(name));

        if (node["backend"]) {
            const std::string backend = node["backend"].as<std::string>();
            auto parsed = ParseBackend(backend);
            if (!parsed) {
                throw ConfigError("database '" + name + "': unknown backend '" + backend + "'");
            }
            profile.backend = *parsed;
        }

        if (node["queries"]) {
            auto queries = node["queries"];
            if (queries["identities"]) profile.queries.identities = queries["identities"].as<std::string>();
            if (queries["site_roles"]) profile.queries.site_roles = queries["site_roles"].as<std::string>();
            if (queries["group_roles"]) profile.queries.group_roles = queries["group_roles"].as<std::string>();
        }

        config.databases[name] = std::move(profile);
    }
}

void ParseRoot(const YAML::Node& yaml, AuthmapConfig& config) {
    if (!yaml["authmap"]) {
        throw ConfigError("missing top-level 'authmap' section");
    }
    auto root = yaml["authmap"];

    // Runtime
    if (root["runtime"]) {
        auto runtime = root["runtime"];
        if (runtime["watchdog_seconds"]) config.runtime.watchdog_seconds.set(runtime["watchdog_seconds"].as<int>());
    }

    // Databases
    if (root["databases"]) {
        if (!root["databases"].IsMap()) {
            throw ConfigError("'databases' must be a mapping of profile name to parameters");
        }
        ParseDatabases(root["databases"], config);
    }
}

} // namespace

// Template specializations for environment variable parsing
template<>
std::optional<int> ConfigValue<int>::getEnvValue() const {
    const char* env_val = std::getenv(env_var_.c_str());
    if (env_val) {
        try {
            return std::stoi(env_val);
        } catch (const std::exception& e) {
            LOG(WARNING) << "Failed to parse env var " << env_var_ << ": " << e.what();
        }
    }
    return std::nullopt;
}

template<>
std::optional<std::string> ConfigValue<std::string>::getEnvValue() const {
    const char* env_val = std::getenv(env_var_.c_str());
    if (env_val) {
        return std::string(env_val);
    }
    return std::nullopt;
}

std::optional<Backend> ParseBackend(const std::string& name) {
    const std::string val = absl::AsciiStrToLower(name);
    if (val == "postgresql" || val == "postgres" || val == "pg") {
        return Backend::kPostgreSQL;
    }
    if (val == "sqlite" || val == "sqlite3") {
        return Backend::kSQLite;
    }
    return std::nullopt;
}

const char* BackendName(Backend backend) {
    switch (backend) {
        case Backend::kPostgreSQL:
            return "postgresql";
        case Backend::kSQLite:
            return "sqlite";
    }
    return "unknown";
}

QuerySet DefaultQuerySet() {
    return QuerySet{kIdentitiesQuery, kSiteRolesQuery, kGroupRolesQuery};
}

Configuration& Configuration::getInstance() {
    static Configuration instance;
    return instance;
}

bool Configuration::loadFromFile(const std::string& filename) {
    try {
        YAML::Node yaml = YAML::LoadFile(filename);
        config_ = AuthmapConfig{};
        ParseRoot(yaml, config_);
        return validate();
    } catch (const YAML::Exception& e) {
        LOG(ERROR) << "Failed to parse configuration file " << filename << ": " << e.what();
        return false;
    } catch (const ConfigError& e) {
        LOG(ERROR) << "Invalid configuration file " << filename << ": " << e.what();
        return false;
    }
}

bool Configuration::loadFromString(const std::string& yaml_content) {
    try {
        YAML::Node yaml = YAML::Load(yaml_content);
        config_ = AuthmapConfig{};
        ParseRoot(yaml, config_);
        return validate();
    } catch (const YAML::Exception& e) {
        LOG(ERROR) << "Failed to parse configuration string: " << e.what();
        return false;
    } catch (const ConfigError& e) {
        LOG(ERROR) << "Invalid configuration: " << e.what();
        return false;
    }
}

const DatabaseProfile& Configuration::getDatabase(const std::string& name) const {
    auto it = config_.databases.find(name);
    if (it == config_.databases.end()) {
        throw ConfigError("no database profile named '" + name + "'");
    }
    return it->second;
}

bool Configuration::validate() const {
    validation_errors_.clear();

    if (config_.runtime.watchdog_seconds.get() < 1) {
        validation_errors_.push_back("Watchdog timeout must be at least 1 second");
    }

    for (const auto& [name, profile] : config_.databases) {
        if (profile.connection.get().empty()) {
            validation_errors_.push_back("Database '" + name + "' has no connection parameters");
        }
        if (profile.queries.identities.empty() || profile.queries.site_roles.empty() ||
            profile.queries.group_roles.empty()) {
            validation_errors_.push_back("Database '" + name + "' has an empty query");
        }
    }

    return validation_errors_.empty();
}

std::vector<std::string> Configuration::getValidationErrors() const {
    return validation_errors_;
}

} // namespace Authmap
