#pragma once

#include "config/sys_properties.hpp"
#include "logging/logger.hpp"

#include <chrono>
#include <filesystem>
#include <istream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace YAML {
    class Node;
}

namespace authz::config {

    struct LoggingConfig {
        logging::Level level{logging::Level::Info};
        logging::Format format{logging::Format::Text};
        std::string outputPath;

        /**
         * Push this configuration into the process wide LogManager.
         */
        void apply() const;
    };

    struct ServiceConfig {
        static constexpr auto DEFAULT_POLICIES_PATH = "policies.yaml";
        static constexpr auto DEFAULT_DATABASE_PATH = "authz.db";
        static constexpr std::chrono::milliseconds DEFAULT_STORAGE_TIMEOUT{5000};

        std::filesystem::path policiesPath{DEFAULT_POLICIES_PATH};
        std::string databasePath{DEFAULT_DATABASE_PATH};
        std::vector<std::string> tenants;
        std::chrono::milliseconds storageTimeout{DEFAULT_STORAGE_TIMEOUT};
        LoggingConfig logging;

        /**
         * Throws errors::ConfigError if a required value is missing or out of range.
         */
        void validate() const;
    };

    /**
     * Reads the service configuration from YAML and applies environment overrides:
     *
     *     authorization:
     *       policiesPath: policies.yaml
     *       databasePath: authz.db
     *       storageTimeoutMs: 5000
     *       tenants: [tenant1, tenant2]
     *     logging:
     *       level: INFO
     *       format: TEXT
     *       outputPath: ""
     *
     * Overrides: AUTHZ_POLICIES_PATH, AUTHZ_DATABASE_PATH, AUTHZ_TENANTS (comma separated),
     * AUTHZ_STORAGE_TIMEOUT_MS, AUTHZ_LOG_LEVEL.
     */
    class ConfigReader {
        SysProperties _env;

        void readAuthorization(ServiceConfig &config, const YAML::Node &node) const;
        void readLogging(ServiceConfig &config, const YAML::Node &node) const;

    public:
        static constexpr auto ENV_POLICIES_PATH = "AUTHZ_POLICIES_PATH";
        static constexpr auto ENV_DATABASE_PATH = "AUTHZ_DATABASE_PATH";
        static constexpr auto ENV_TENANTS = "AUTHZ_TENANTS";
        static constexpr auto ENV_STORAGE_TIMEOUT_MS = "AUTHZ_STORAGE_TIMEOUT_MS";
        static constexpr auto ENV_LOG_LEVEL = "AUTHZ_LOG_LEVEL";

        explicit ConfigReader(SysProperties env = SysProperties::fromProcess())
            : _env(std::move(env)) {
        }

        [[nodiscard]] ServiceConfig read(const std::filesystem::path &path) const;
        [[nodiscard]] ServiceConfig read(std::istream &stream) const;
        [[nodiscard]] ServiceConfig parse(std::string_view document) const;

        /**
         * Defaults plus environment overrides, no file.
         */
        [[nodiscard]] ServiceConfig fromEnvironment() const;

        void applyEnvironment(ServiceConfig &config) const;

        [[nodiscard]] static std::vector<std::string> splitList(std::string_view value);
    };

} // namespace authz::config
