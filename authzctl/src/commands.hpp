#pragma once

#include "service/authorization_service.hpp"

#include <ostream>
#include <string>
#include <vector>

namespace authzctl {

    namespace exit_code {
        inline constexpr int SUCCESS = 0;
        inline constexpr int NEGATIVE = 1;
        inline constexpr int USAGE_ERROR = 2;
        inline constexpr int FAILURE = 3;
    } // namespace exit_code

    /**
     * Run one administrative command against the service and print its result. Returns the
     * process exit code; errors propagate to the caller.
     */
    int runCommand(
        authz::service::AuthorizationService &service,
        const std::string &command,
        const std::vector<std::string> &args,
        std::ostream &out);

} // namespace authzctl
