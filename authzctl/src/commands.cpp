#include "commands.hpp"

#include "errors/errors.hpp"

#include <functional>
#include <map>

namespace authzctl {

    using authz::service::AuthorizationService;
    using Args = std::vector<std::string>;

    struct CommandSpec {
        size_t arity;
        std::function<int(AuthorizationService &, const Args &, std::ostream &)> run;
    };

    template<typename Range>
    static void printLines(std::ostream &out, const Range &values) {
        for(const auto &value : values) {
            out << value << "\n";
        }
    }

    static int yesNo(std::ostream &out, bool value) {
        out << (value ? "true" : "false") << "\n";
        return value ? exit_code::SUCCESS : exit_code::NEGATIVE;
    }

    static const std::map<std::string, CommandSpec> &commands() {
        static const std::map<std::string, CommandSpec> table{
            {"check",
             {4,
              [](AuthorizationService &service, const Args &a, std::ostream &out) {
                  bool allowed = service.canDo(a[0], a[1], a[2], a[3]);
                  out << (allowed ? "allow" : "deny") << "\n";
                  return allowed ? exit_code::SUCCESS : exit_code::NEGATIVE;
              }}},
            {"assign",
             {3,
              [](AuthorizationService &service, const Args &a, std::ostream &out) {
                  bool added = service.assignRole(a[0], a[1], a[2]);
                  out << (added ? "assigned" : "already assigned") << "\n";
                  return exit_code::SUCCESS;
              }}},
            {"remove",
             {3,
              [](AuthorizationService &service, const Args &a, std::ostream &out) {
                  bool removed = service.removeRole(a[0], a[1], a[2]);
                  out << (removed ? "removed" : "not assigned") << "\n";
                  return exit_code::SUCCESS;
              }}},
            {"roles",
             {2,
              [](AuthorizationService &service, const Args &a, std::ostream &out) {
                  printLines(out, service.getUserRoles(a[0], a[1]));
                  return exit_code::SUCCESS;
              }}},
            {"tenants-for-role",
             {2,
              [](AuthorizationService &service, const Args &a, std::ostream &out) {
                  printLines(out, service.getUserTenantsForRole(a[0], a[1]));
                  return exit_code::SUCCESS;
              }}},
            {"has-role",
             {3,
              [](AuthorizationService &service, const Args &a, std::ostream &out) {
                  return yesNo(out, service.hasRole(a[0], a[1], a[2]));
              }}},
            {"available-roles",
             {0,
              [](AuthorizationService &service, const Args &, std::ostream &out) {
                  printLines(out, service.getAvailableRoles());
                  return exit_code::SUCCESS;
              }}},
            {"dump",
             {0,
              [](AuthorizationService &service, const Args &, std::ostream &out) {
                  service.dumpState(out);
                  return exit_code::SUCCESS;
              }}},
        };
        return table;
    }

    int runCommand(
        AuthorizationService &service,
        const std::string &command,
        const std::vector<std::string> &args,
        std::ostream &out) {
        auto it = commands().find(command);
        if(it == commands().end()) {
            throw authz::errors::InvalidArgument("Unknown command: " + command);
        }
        if(args.size() != it->second.arity) {
            throw authz::errors::InvalidArgument(
                "Command " + command + " takes " + std::to_string(it->second.arity)
                + " arguments, got " + std::to_string(args.size()));
        }
        return it->second.run(service, args, out);
    }

} // namespace authzctl
