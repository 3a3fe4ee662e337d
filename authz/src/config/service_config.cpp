#include "config/service_config.hpp"

#include "errors/errors.hpp"

#include <yaml-cpp/yaml.h>

#include <fstream>
#include <sstream>
#include <stdexcept>

static const auto LOG = // NOLINT(cert-err58-cpp)
    authz::logging::Logger::of("authz.config.ConfigReader");

namespace authz::config {

    static constexpr auto AUTHORIZATION_KEY = "authorization";
    static constexpr auto LOGGING_KEY = "logging";

    static std::string scalar(const YAML::Node &node, const std::string &key) {
        if(!node.IsScalar()) {
            throw errors::ConfigError("Expected a scalar value for '" + key + "'");
        }
        return node.as<std::string>();
    }

    static std::chrono::milliseconds parseTimeout(const std::string &value, const std::string &key) {
        try {
            size_t consumed = 0;
            auto millis = std::stoll(value, &consumed);
            if(consumed != value.size()) {
                throw errors::ConfigError("Invalid number for '" + key + "': " + value);
            }
            return std::chrono::milliseconds{millis};
        } catch(const std::invalid_argument &) {
            throw errors::ConfigError("Invalid number for '" + key + "': " + value);
        } catch(const std::out_of_range &) {
            throw errors::ConfigError("Number out of range for '" + key + "': " + value);
        }
    }

    static logging::Level parseLevel(const std::string &value, const std::string &key) {
        auto level = logging::levelFromString(value);
        if(!level.has_value()) {
            throw errors::ConfigError("Unknown log level for '" + key + "': " + value);
        }
        return level.value();
    }

    void LoggingConfig::apply() const {
        auto &manager = logging::LogManager::get();
        manager.setLevel(level);
        manager.setFormat(format);
        if(!outputPath.empty()) {
            try {
                manager.setOutputFile(outputPath);
            } catch(const std::runtime_error &e) {
                throw errors::ConfigError(
                    "Unable to open log output " + outputPath + ": " + e.what());
            }
        }
    }

    void ServiceConfig::validate() const {
        if(policiesPath.empty()) {
            throw errors::ConfigError("Policies path must not be empty");
        }
        if(databasePath.empty()) {
            throw errors::ConfigError("Database path must not be empty");
        }
        if(tenants.empty()) {
            throw errors::ConfigError("At least one tenant must be configured");
        }
        for(const auto &tenant : tenants) {
            if(tenant.empty()) {
                throw errors::ConfigError("Tenant identifiers must not be empty");
            }
        }
        if(storageTimeout.count() <= 0) {
            throw errors::ConfigError(
                "Storage timeout must be positive, got "
                + std::to_string(storageTimeout.count()) + "ms");
        }
    }

    std::vector<std::string> ConfigReader::splitList(std::string_view value) {
        std::vector<std::string> items;
        size_t start = 0;
        while(start <= value.size()) {
            auto end = value.find(',', start);
            if(end == std::string_view::npos) {
                end = value.size();
            }
            auto item = value.substr(start, end - start);
            auto first = item.find_first_not_of(" \t");
            if(first != std::string_view::npos) {
                auto last = item.find_last_not_of(" \t");
                items.emplace_back(item.substr(first, last - first + 1));
            }
            start = end + 1;
        }
        return items;
    }

    ServiceConfig ConfigReader::read(const std::filesystem::path &path) const {
        std::ifstream stream{path};
        if(!stream.is_open()) {
            LOG.atError("config-read-error").kv("path", path.string()).log();
            throw errors::ConfigError("Unable to read configuration file " + path.string());
        }
        LOG.atDebug("config-read").kv("path", path.string()).log("Reading configuration");
        return read(stream);
    }

    ServiceConfig ConfigReader::parse(std::string_view document) const {
        std::istringstream stream{std::string(document)};
        return read(stream);
    }

    ServiceConfig ConfigReader::read(std::istream &stream) const {
        YAML::Node root;
        try {
            root = YAML::Load(stream);
        } catch(const YAML::Exception &e) {
            LOG.atError("config-parse-error").kv("line", e.mark.line + 1).log(e.what());
            throw errors::ConfigError(std::string("Failed to parse configuration: ") + e.what());
        }

        ServiceConfig config;
        if(root.IsDefined() && !root.IsNull()) {
            if(!root.IsMap()) {
                throw errors::ConfigError("Configuration document must be a map");
            }
            try {
                for(const auto &entry : root) {
                    auto key = entry.first.as<std::string>();
                    if(key == AUTHORIZATION_KEY) {
                        readAuthorization(config, entry.second);
                    } else if(key == LOGGING_KEY) {
                        readLogging(config, entry.second);
                    } else {
                        LOG.atDebug("config-key-ignored").kv("key", key).log();
                    }
                }
            } catch(const YAML::Exception &e) {
                throw errors::ConfigError(std::string("Invalid configuration: ") + e.what());
            }
        }
        applyEnvironment(config);
        config.validate();
        return config;
    }

    ServiceConfig ConfigReader::fromEnvironment() const {
        ServiceConfig config;
        applyEnvironment(config);
        config.validate();
        return config;
    }

    void ConfigReader::readAuthorization(ServiceConfig &config, const YAML::Node &node) const {
        if(node.IsNull()) {
            return;
        }
        if(!node.IsMap()) {
            throw errors::ConfigError("'authorization' must be a map");
        }
        for(const auto &entry : node) {
            auto key = entry.first.as<std::string>();
            const auto &value = entry.second;
            if(key == "policiesPath") {
                config.policiesPath = scalar(value, key);
            } else if(key == "databasePath") {
                config.databasePath = scalar(value, key);
            } else if(key == "storageTimeoutMs") {
                config.storageTimeout = parseTimeout(scalar(value, key), key);
            } else if(key == "tenants") {
                config.tenants.clear();
                if(value.IsSequence()) {
                    for(const auto &tenant : value) {
                        config.tenants.push_back(scalar(tenant, key));
                    }
                } else if(value.IsScalar()) {
                    config.tenants = splitList(value.as<std::string>());
                } else if(!value.IsNull()) {
                    throw errors::ConfigError("'tenants' must be a list of tenant identifiers");
                }
            } else {
                LOG.atDebug("config-key-ignored").kv("key", "authorization." + key).log();
            }
        }
    }

    void ConfigReader::readLogging(ServiceConfig &config, const YAML::Node &node) const {
        if(node.IsNull()) {
            return;
        }
        if(!node.IsMap()) {
            throw errors::ConfigError("'logging' must be a map");
        }
        for(const auto &entry : node) {
            auto key = entry.first.as<std::string>();
            const auto &value = entry.second;
            if(key == "level") {
                config.logging.level = parseLevel(scalar(value, key), key);
            } else if(key == "format") {
                auto text = scalar(value, key);
                auto format = logging::formatFromString(text);
                if(!format.has_value()) {
                    throw errors::ConfigError("Unknown log format: " + text);
                }
                config.logging.format = format.value();
            } else if(key == "outputPath") {
                config.logging.outputPath = value.IsNull() ? std::string{} : scalar(value, key);
            } else {
                LOG.atDebug("config-key-ignored").kv("key", "logging." + key).log();
            }
        }
    }

    void ConfigReader::applyEnvironment(ServiceConfig &config) const {
        if(auto value = _env.get(ENV_POLICIES_PATH); value.has_value()) {
            config.policiesPath = value.value();
        }
        if(auto value = _env.get(ENV_DATABASE_PATH); value.has_value()) {
            config.databasePath = value.value();
        }
        if(auto value = _env.get(ENV_TENANTS); value.has_value()) {
            config.tenants = splitList(value.value());
        }
        if(auto value = _env.get(ENV_STORAGE_TIMEOUT_MS); value.has_value()) {
            config.storageTimeout = parseTimeout(value.value(), ENV_STORAGE_TIMEOUT_MS);
        }
        if(auto value = _env.get(ENV_LOG_LEVEL); value.has_value()) {
            config.logging.level = parseLevel(value.value(), ENV_LOG_LEVEL);
        }
    }

} // namespace authz::config
