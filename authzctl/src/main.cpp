#include "command_line.hpp"
#include "commands.hpp"

#include "errors/errors.hpp"
#include "logging/logger.hpp"
#include "service/authorization_service.hpp"

#include <iostream>

static const auto LOG = // NOLINT(cert-err58-cpp)
    authz::logging::Logger::of("authzctl");

int main(int argc, char *argv[]) { // NOLINT(bugprone-exception-escape)
    using namespace authzctl;
    namespace errors = authz::errors;

    try {
        CommandLine commandLine;
        commandLine.parseRawProgramNameAndArgs(argc, argv);
        if(commandLine.helpRequested()) {
            CommandLine::helpPrinter(std::cout);
            return exit_code::SUCCESS;
        }
        if(commandLine.command().empty()) {
            CommandLine::helpPrinter(std::cerr);
            return exit_code::USAGE_ERROR;
        }

        auto config = commandLine.buildConfig();
        config.logging.apply();
        auto service = authz::service::AuthorizationService::fromConfig(config);
        return runCommand(*service, commandLine.command(), commandLine.commandArgs(), std::cout);
    } catch(const errors::InvalidArgument &e) {
        std::cerr << "authzctl: " << e.what() << std::endl;
        return exit_code::USAGE_ERROR;
    } catch(const errors::ConfigError &e) {
        std::cerr << "authzctl: " << e.what() << std::endl;
        return exit_code::USAGE_ERROR;
    } catch(const errors::StorageError &e) {
        LOG.atError("storage-error").kv("retryable", e.isRetryable()).cause(e).log();
        std::cerr << "authzctl: " << e.what() << std::endl;
        return exit_code::FAILURE;
    } catch(const std::exception &e) {
        auto error = errors::Error::of(e);
        LOG.atError("command-failed").kv("kind", error.kind()).cause(e).log();
        std::cerr << "authzctl: " << e.what() << std::endl;
        return exit_code::FAILURE;
    }
}
