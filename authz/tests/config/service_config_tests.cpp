#include "config/service_config.hpp"
#include "errors/errors.hpp"
#include "test_util.hpp"
#include <catch2/catch_all.hpp>

// NOLINTBEGIN

using authz::config::ConfigReader;
using authz::config::SysProperties;

SCENARIO("Service configuration is read from YAML", "[config]") {
    GIVEN("A complete configuration document") {
        ConfigReader reader{SysProperties::isolated()};
        auto config = reader.parse(R"(
authorization:
  policiesPath: /etc/authz/policies.yaml
  databasePath: /var/lib/authz/authz.db
  storageTimeoutMs: 250
  tenants: [tenant1, tenant2]
logging:
  level: debug
  format: JSON
  outputPath: ""
unrelated:
  key: value
)");
        THEN("Every value is taken from the document") {
            REQUIRE(config.policiesPath == "/etc/authz/policies.yaml");
            REQUIRE(config.databasePath == "/var/lib/authz/authz.db");
            REQUIRE(config.storageTimeout == std::chrono::milliseconds{250});
            REQUIRE(config.tenants == std::vector<std::string>{"tenant1", "tenant2"});
            REQUIRE(config.logging.level == authz::logging::Level::Debug);
            REQUIRE(config.logging.format == authz::logging::Format::Json);
            REQUIRE(config.logging.outputPath.empty());
        }
    }
    GIVEN("A document listing tenants as a string") {
        ConfigReader reader{SysProperties::isolated()};
        auto config = reader.parse("authorization:\n  tenants: \"acme, beta ,,gamma\"\n");
        THEN("The list is split and trimmed") {
            REQUIRE(config.tenants == std::vector<std::string>{"acme", "beta", "gamma"});
        }
        THEN("Unset values keep their defaults") {
            REQUIRE(config.policiesPath == "policies.yaml");
            REQUIRE(config.databasePath == "authz.db");
            REQUIRE(config.storageTimeout == std::chrono::milliseconds{5000});
            REQUIRE(config.logging.level == authz::logging::Level::Info);
        }
    }
    GIVEN("A configuration file") {
        authz::test::TempDir dir;
        auto path = dir.write("authz.yaml", "authorization:\n  tenants: [acme]\n");
        ConfigReader reader{SysProperties::isolated()};
        THEN("It can be read from disk") {
            REQUIRE(reader.read(path).tenants == std::vector<std::string>{"acme"});
        }
        THEN("A missing file is a configuration error") {
            REQUIRE_THROWS_AS(reader.read(dir.file("missing.yaml")), authz::errors::ConfigError);
        }
    }
}

SCENARIO("Environment variables override the configuration", "[config]") {
    GIVEN("Overrides for every supported variable") {
        auto env = SysProperties::isolated();
        env.put(ConfigReader::ENV_POLICIES_PATH, "/env/policies.yaml")
            .put(ConfigReader::ENV_DATABASE_PATH, "/env/authz.db")
            .put(ConfigReader::ENV_TENANTS, "x,y")
            .put(ConfigReader::ENV_STORAGE_TIMEOUT_MS, "1500")
            .put(ConfigReader::ENV_LOG_LEVEL, "warn");
        ConfigReader reader{env};
        WHEN("A document sets the same values") {
            auto config = reader.parse(
                "authorization:\n  policiesPath: file.yaml\n  tenants: [a]\n"
                "  storageTimeoutMs: 10\n");
            THEN("The environment wins") {
                REQUIRE(config.policiesPath == "/env/policies.yaml");
                REQUIRE(config.databasePath == "/env/authz.db");
                REQUIRE(config.tenants == std::vector<std::string>{"x", "y"});
                REQUIRE(config.storageTimeout == std::chrono::milliseconds{1500});
                REQUIRE(config.logging.level == authz::logging::Level::Warn);
            }
        }
        WHEN("There is no document") {
            auto config = reader.fromEnvironment();
            THEN("The environment alone is enough") {
                REQUIRE(config.tenants == std::vector<std::string>{"x", "y"});
            }
        }
    }
}

SCENARIO("Invalid configuration is rejected", "[config]") {
    GIVEN("A reader with no environment") {
        ConfigReader reader{SysProperties::isolated()};
        THEN("A configuration with no tenants fails") {
            REQUIRE_THROWS_AS(reader.parse("authorization: {}\n"), authz::errors::ConfigError);
            REQUIRE_THROWS_AS(reader.fromEnvironment(), authz::errors::ConfigError);
        }
        THEN("A non-numeric timeout fails") {
            REQUIRE_THROWS_AS(
                reader.parse("authorization:\n  tenants: [a]\n  storageTimeoutMs: soon\n"),
                authz::errors::ConfigError);
        }
        THEN("A non-positive timeout fails") {
            REQUIRE_THROWS_AS(
                reader.parse("authorization:\n  tenants: [a]\n  storageTimeoutMs: 0\n"),
                authz::errors::ConfigError);
        }
        THEN("An unknown log level fails") {
            REQUIRE_THROWS_AS(
                reader.parse("authorization:\n  tenants: [a]\nlogging:\n  level: loud\n"),
                authz::errors::ConfigError);
        }
        THEN("An empty database path fails") {
            REQUIRE_THROWS_AS(
                reader.parse("authorization:\n  tenants: [a]\n  databasePath: \"\"\n"),
                authz::errors::ConfigError);
        }
        THEN("Malformed YAML fails") {
            REQUIRE_THROWS_AS(reader.parse("authorization: [\n"), authz::errors::ConfigError);
        }
        THEN("A document that is not a map fails") {
            REQUIRE_THROWS_AS(reader.parse("- a\n"), authz::errors::ConfigError);
        }
    }
    GIVEN("An invalid environment override") {
        auto env = SysProperties::isolated();
        env.put(ConfigReader::ENV_TENANTS, "a").put(ConfigReader::ENV_STORAGE_TIMEOUT_MS, "12ms");
        ConfigReader reader{env};
        THEN("It fails with a configuration error") {
            REQUIRE_THROWS_AS(reader.fromEnvironment(), authz::errors::ConfigError);
        }
    }
    GIVEN("A log output that cannot be opened") {
        authz::config::LoggingConfig logging;
        logging.outputPath = "/nonexistent-authz-dir/sub/authz.log";
        THEN("Applying it fails with a configuration error") {
            REQUIRE_THROWS_AS(logging.apply(), authz::errors::ConfigError);
        }
    }
}

// NOLINTEND
