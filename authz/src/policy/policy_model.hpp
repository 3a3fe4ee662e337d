#pragma once

#include <map>
#include <set>
#include <string>
#include <tuple>
#include <vector>

namespace authz::policy {

    /**
     * Internal wildcard sentinel. Never appears literally in a policy document; the human
     * token "all" is translated to it during normalization.
     */
    static constexpr auto WILDCARD = "*";

    /**
     * Human readable token in a policy document meaning "every value".
     */
    static constexpr auto ALL_TOKEN = "all";

    /**
     * A (resource, action) pair. Each side is a literal token or WILDCARD.
     */
    struct Permission {
        std::string resource;
        std::string action;

        bool operator<(const Permission &other) const {
            return std::tie(resource, action) < std::tie(other.resource, other.action);
        }
        bool operator==(const Permission &other) const {
            return resource == other.resource && action == other.action;
        }
    };

    /**
     * A role as declared in the policy document: resource name to the list of allowed actions.
     * Document order of resources is irrelevant.
     */
    struct RoleDefinition {
        std::map<std::string, std::vector<std::string>> permissions;

        [[nodiscard]] std::set<Permission> expand() const;
    };

    /**
     * Static permission catalog, keyed by role name.
     */
    struct Catalog {
        std::map<std::string, RoleDefinition> roles;
    };

    /**
     * Compiled (role, resource, action, tenant) tuple. Lives in memory only and is never
     * written to the assignment store.
     */
    struct PolicyFact {
        std::string role;
        std::string resource;
        std::string action;
        std::string tenant;

        bool operator<(const PolicyFact &other) const {
            return std::tie(role, resource, action, tenant)
                   < std::tie(other.role, other.resource, other.action, other.tenant);
        }
        bool operator==(const PolicyFact &other) const {
            return role == other.role && resource == other.resource && action == other.action
                   && tenant == other.tenant;
        }
    };

    using PolicyFactSet = std::set<PolicyFact>;

    /**
     * Durable (user, role, tenant) binding. The only fact category ever persisted.
     */
    struct Assignment {
        std::string user;
        std::string role;
        std::string tenant;

        bool operator<(const Assignment &other) const {
            return std::tie(user, role, tenant) < std::tie(other.user, other.role, other.tenant);
        }
        bool operator==(const Assignment &other) const {
            return user == other.user && role == other.role && tenant == other.tenant;
        }
    };

    using AssignmentSet = std::set<Assignment>;

} // namespace authz::policy
