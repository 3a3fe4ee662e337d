#include "command_line.hpp"

#include "logging/logger.hpp"

#include <iterator>

static const auto LOG = // NOLINT(cert-err58-cpp)
    authz::logging::Logger::of("authzctl.CommandLine");

namespace authzctl {

    using authz::config::ConfigReader;

    const std::unique_ptr<argument> CommandLine::argumentList[] = {
        makeEntry<argumentFlag>(
            [](CommandLine &self) { self._helpRequested = true; },
            "h",
            "help",
            "Print this usage information"),
        makeEntry<argumentValue<std::string>>(
            [](CommandLine &self, const std::string &arg) { self._configPath = arg; },
            "c",
            "config",
            "Service configuration file"),
        makeEntry<argumentValue<std::string>>(
            [](CommandLine &self, const std::string &arg) {
                self._overrides.put(ConfigReader::ENV_POLICIES_PATH, arg);
            },
            "p",
            "policies",
            "Policy document path"),
        makeEntry<argumentValue<std::string>>(
            [](CommandLine &self, const std::string &arg) {
                self._overrides.put(ConfigReader::ENV_DATABASE_PATH, arg);
            },
            "d",
            "database",
            "Assignment database path"),
        makeEntry<argumentValue<std::string>>(
            [](CommandLine &self, const std::string &arg) {
                self._overrides.put(ConfigReader::ENV_TENANTS, arg);
            },
            "t",
            "tenants",
            "Comma separated tenant list")};

    void CommandLine::parseRawProgramNameAndArgs(int argc, const char *const *argv) {
        if(argc < 1 || argv == nullptr) {
            throw authz::errors::InvalidArgument("No program name given");
        }
        std::vector<std::string> args;
        for(int i = 1; i < argc; ++i) {
            if(argv[i] == nullptr) {
                throw authz::errors::InvalidArgument("Null pointer in arguments");
            }
            args.emplace_back(argv[i]);
        }
        parseArgs(args);
    }

    void CommandLine::parseArgs(const std::vector<std::string> &args) {
        auto end = args.end();
        for(auto i = args.begin(); i != end; ++i) {
            if(i->empty() || i->front() != '-') {
                _command = *i;
                _commandArgs.assign(std::next(i), end);
                return;
            }
            bool handled = false;
            for(const auto &j : argumentList) {
                if(j->process(*this, i, end)) {
                    handled = true;
                    break;
                }
            }
            if(!handled) {
                LOG.atError()
                    .event("parse-args-error")
                    .kv("arg", *i)
                    .logAndThrow(
                        authz::errors::InvalidArgument(std::string("Unrecognized option: ") + *i));
            }
        }
    }

    authz::config::ServiceConfig CommandLine::buildConfig() const {
        ConfigReader reader{_overrides};
        if(_configPath.has_value()) {
            return reader.read(_configPath.value());
        }
        return reader.fromEnvironment();
    }

    void CommandLine::helpPrinter(std::ostream &out) {
        out << "Usage: authzctl [options] <command> [args...]\n\nOptions:\n";
        for(const auto &a : argumentList) {
            out << "  " << a->getDescription() << "\n";
        }
        out << "\nCommands:\n"
            << "  check <user> <resource> <action> <tenant>\n"
            << "  assign <user> <role> <tenant>\n"
            << "  remove <user> <role> <tenant>\n"
            << "  roles <user> <tenant>\n"
            << "  tenants-for-role <user> <role>\n"
            << "  has-role <user> <role> <tenant>\n"
            << "  available-roles\n"
            << "  dump\n";
    }

} // namespace authzctl
