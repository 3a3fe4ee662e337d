#pragma once

#include "command_line_arguments.hpp"
#include "config/service_config.hpp"
#include "config/sys_properties.hpp"

#include <filesystem>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace authzctl {

    /**
     * Parses `authzctl [options] <command> [command args...]`. Options come first; the first
     * non-option word is the command and everything after it belongs to the command.
     */
    class CommandLine {
        std::optional<std::filesystem::path> _configPath;
        authz::config::SysProperties _overrides;
        bool _helpRequested{false};
        std::string _command;
        std::vector<std::string> _commandArgs;

        static const std::unique_ptr<argument> argumentList[];

    public:
        explicit CommandLine(authz::config::SysProperties env = authz::config::SysProperties::fromProcess())
            : _overrides(std::move(env)) {
        }

        void parseRawProgramNameAndArgs(int argc, const char *const *argv);
        void parseArgs(const std::vector<std::string> &args);

        /**
         * Service configuration: file (if given), then environment, then command line options.
         */
        [[nodiscard]] authz::config::ServiceConfig buildConfig() const;

        static void helpPrinter(std::ostream &out);

        [[nodiscard]] bool helpRequested() const noexcept {
            return _helpRequested;
        }

        [[nodiscard]] const std::optional<std::filesystem::path> &configPath() const noexcept {
            return _configPath;
        }

        [[nodiscard]] const std::string &command() const noexcept {
            return _command;
        }

        [[nodiscard]] const std::vector<std::string> &commandArgs() const noexcept {
            return _commandArgs;
        }
    };

} // namespace authzctl
