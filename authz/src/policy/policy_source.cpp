#include "policy/policy_source.hpp"

#include "errors/errors.hpp"
#include "logging/logger.hpp"
#include "policy/wildcard.hpp"

#include <yaml-cpp/yaml.h>

#include <fstream>
#include <sstream>

static const auto LOG = // NOLINT(cert-err58-cpp)
    authz::logging::Logger::of("authz.policy.PolicySource");

namespace authz::policy {

    Catalog PolicySource::parse(std::string_view document) {
        std::istringstream stream{std::string(document)};
        return parse(stream);
    }

    Catalog PolicySource::parse(std::istream &stream) {
        YAML::Node root;
        try {
            root = YAML::Load(stream);
        } catch(const YAML::Exception &e) {
            LOG.atError("policy-parse-error").kv("line", e.mark.line + 1).log(e.what());
            throw errors::ConfigError(std::string("Failed to parse policy document: ") + e.what());
        }
        return fromNode(root);
    }

    Catalog PolicySource::parseFile(const std::filesystem::path &path) {
        std::ifstream stream{path};
        if(!stream.is_open()) {
            LOG.atError("policy-read-error").kv("path", path.string()).log();
            throw errors::ConfigError("Unable to read policy file " + path.string());
        }
        LOG.atDebug("policy-read").kv("path", path.string()).log("Reading policy file");
        return parse(stream);
    }

    Catalog PolicySource::fromNode(const YAML::Node &root) {
        if(!root.IsMap()) {
            throw errors::ConfigError("Policy document must be a map with a 'roles' key");
        }
        auto rolesNode = root[ROLES_KEY];
        if(!rolesNode) {
            throw errors::ConfigError("Policy document has no 'roles' key");
        }
        Catalog catalog;
        if(rolesNode.IsNull()) {
            return catalog;
        }
        if(!rolesNode.IsMap()) {
            throw errors::ConfigError("'roles' must be a map of role name to role definition");
        }
        for(const auto &entry : rolesNode) {
            auto roleName = parseToken(entry.first, "role name");
            catalog.roles[roleName] = parseRole(roleName, entry.second);
        }
        return catalog;
    }

    RoleDefinition PolicySource::parseRole(const std::string &roleName, const YAML::Node &node) {
        RoleDefinition role;
        if(node.IsNull()) {
            return role;
        }
        if(!node.IsMap()) {
            throw errors::ConfigError("Role '" + roleName + "' must be a map");
        }
        auto permissionsNode = node[PERMISSIONS_KEY];
        if(!permissionsNode || permissionsNode.IsNull()) {
            return role;
        }
        if(!permissionsNode.IsMap()) {
            throw errors::ConfigError(
                "Role '" + roleName + "' permissions must be a map of resource to actions");
        }
        for(const auto &entry : permissionsNode) {
            auto resource = parseToken(entry.first, "resource of role '" + roleName + "'");
            auto &actions = role.permissions[resource];
            const auto &actionsNode = entry.second;
            if(actionsNode.IsNull()) {
                continue;
            }
            if(!actionsNode.IsSequence()) {
                throw errors::ConfigError(
                    "Role '" + roleName + "' resource '" + resource
                    + "' must list its actions as a sequence");
            }
            for(const auto &action : actionsNode) {
                actions.push_back(parseToken(
                    action, "action of role '" + roleName + "' resource '" + resource + "'"));
            }
        }
        return role;
    }

    std::string PolicySource::parseToken(const YAML::Node &node, const std::string &where) {
        if(!node.IsScalar()) {
            throw errors::ConfigError("Expected a scalar for " + where);
        }
        auto token = node.as<std::string>();
        if(token.empty()) {
            throw errors::ConfigError("Empty value for " + where);
        }
        if(token == WILDCARD) {
            throw errors::ConfigError(
                std::string("Reserved token '") + WILDCARD + "' used for " + where + ", use '"
                + ALL_TOKEN + "' instead");
        }
        return token;
    }

    Catalog PolicySource::normalize(Catalog catalog) {
        Catalog normalized;
        for(auto &[roleName, role] : catalog.roles) {
            auto &target = normalized.roles[roleName];
            for(auto &[resource, actions] : role.permissions) {
                auto &targetActions = target.permissions[normalizeToken(resource)];
                for(const auto &action : actions) {
                    targetActions.push_back(normalizeToken(action));
                }
            }
        }
        return normalized;
    }

    void PolicySource::validate(const Catalog &catalog) {
        if(catalog.roles.empty()) {
            throw errors::ConfigError("No roles defined in policy document");
        }
        for(const auto &[roleName, role] : catalog.roles) {
            if(role.permissions.empty()) {
                throw errors::ConfigError("Role '" + roleName + "' has no permissions defined");
            }
            for(const auto &[resource, actions] : role.permissions) {
                if(resource.empty()) {
                    throw errors::ConfigError("Role '" + roleName + "' has an empty resource");
                }
                if(actions.empty()) {
                    throw errors::ConfigError(
                        "Role '" + roleName + "' resource '" + resource
                        + "' has no actions defined");
                }
                for(const auto &action : actions) {
                    if(action.empty()) {
                        throw errors::ConfigError(
                            "Role '" + roleName + "' resource '" + resource
                            + "' has an empty action");
                    }
                }
            }
        }
    }

    std::vector<std::string> PolicySource::roles(const Catalog &catalog) {
        std::vector<std::string> names;
        names.reserve(catalog.roles.size());
        for(const auto &entry : catalog.roles) {
            names.push_back(entry.first);
        }
        return names;
    }

    Catalog PolicySource::load(std::string_view document) {
        auto catalog = normalize(parse(document));
        validate(catalog);
        return catalog;
    }

    Catalog PolicySource::loadFile(const std::filesystem::path &path) {
        auto catalog = normalize(parseFile(path));
        validate(catalog);
        LOG.atInfo("policy-loaded")
            .kv("path", path.string())
            .kv("roles", catalog.roles.size())
            .log("Loaded policy catalog");
        return catalog;
    }

    std::set<Permission> RoleDefinition::expand() const {
        std::set<Permission> out;
        for(const auto &[resource, actions] : permissions) {
            for(const auto &action : actions) {
                out.insert(Permission{normalizeToken(resource), normalizeToken(action)});
            }
        }
        return out;
    }

} // namespace authz::policy
