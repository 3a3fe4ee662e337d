#include "enforcement/enforcement_engine.hpp"

#include "logging/logger.hpp"
#include "policy/wildcard.hpp"

#include <mutex>

static const auto LOG = // NOLINT(cert-err58-cpp)
    authz::logging::Logger::of("authz.enforcement.EnforcementEngine");

static const auto FAILED_CLOSED_ERROR = // NOLINT(cert-err58-cpp)
    std::make_shared<const authz::errors::EnforcementError>("Authorization evaluation failed");

namespace authz::enforcement {

    Decision Decision::failedClosed() noexcept {
        Decision decision;
        decision.error = FAILED_CLOSED_ERROR;
        return decision;
    }

    void EnforcementEngine::replaceFacts(std::shared_ptr<const PolicySnapshot> snapshot) {
        if(!snapshot) {
            throw errors::EnforcementError("Cannot load an empty policy snapshot");
        }
        std::unique_lock guard{_mutex};
        _snapshot = std::move(snapshot);
    }

    std::shared_ptr<const PolicySnapshot> EnforcementEngine::snapshot() const {
        std::shared_lock guard{_mutex};
        return _snapshot;
    }

    bool EnforcementEngine::addAssignment(const policy::Assignment &assignment) {
        std::unique_lock guard{_mutex};
        return _assignments.insert(assignment).second;
    }

    bool EnforcementEngine::removeAssignment(const policy::Assignment &assignment) {
        std::unique_lock guard{_mutex};
        return _assignments.erase(assignment) > 0;
    }

    void EnforcementEngine::replaceAssignments(policy::AssignmentSet assignments) {
        std::unique_lock guard{_mutex};
        _assignments = std::move(assignments);
    }

    policy::AssignmentSet EnforcementEngine::assignments() const {
        std::shared_lock guard{_mutex};
        return _assignments;
    }

    bool EnforcementEngine::hasAssignment(const policy::Assignment &assignment) const {
        std::shared_lock guard{_mutex};
        return _assignments.find(assignment) != _assignments.end();
    }

    std::set<std::string> EnforcementEngine::rolesFor(
        const std::string &user, const std::string &tenant) const {
        std::shared_lock guard{_mutex};
        std::set<std::string> roles;
        // Assignments are ordered by (user, role, tenant)
        for(auto it = _assignments.lower_bound(policy::Assignment{user, {}, {}});
            it != _assignments.end() && it->user == user;
            ++it) {
            if(it->tenant == tenant) {
                roles.insert(it->role);
            }
        }
        return roles;
    }

    std::set<std::string> EnforcementEngine::tenantsFor(
        const std::string &user, const std::string &role) const {
        std::shared_lock guard{_mutex};
        std::set<std::string> tenants;
        for(auto it = _assignments.lower_bound(policy::Assignment{user, role, {}});
            it != _assignments.end() && it->user == user && it->role == role;
            ++it) {
            tenants.insert(it->tenant);
        }
        return tenants;
    }

    Decision EnforcementEngine::evaluate(const EnforcementQuery &query) const {
        if(query.user.empty() || query.resource.empty() || query.action.empty()
           || query.tenant.empty()) {
            return Decision::failure(errors::InvalidArgument(
                "Authorization parameters cannot be empty: user=" + query.user
                + ", resource=" + query.resource + ", action=" + query.action
                + ", tenant=" + query.tenant));
        }

        std::shared_lock guard{_mutex};
        if(!_snapshot) {
            throw errors::EnforcementError("No policy loaded into the engine");
        }
        for(auto it = _assignments.lower_bound(policy::Assignment{query.user, {}, {}});
            it != _assignments.end() && it->user == query.user;
            ++it) {
            if(it->tenant != query.tenant) {
                continue;
            }
            const auto *permissions = _snapshot->permissionsFor(query.tenant, it->role);
            if(permissions == nullptr) {
                continue;
            }
            for(const auto &permission : *permissions) {
                if(permission.resource.empty() || permission.action.empty()) {
                    throw errors::EnforcementError(
                        "Corrupted policy fact for role " + it->role + " in tenant "
                        + query.tenant);
                }
                if(policy::matches(permission, query.resource, query.action)) {
                    return Decision::allow(it->role);
                }
            }
        }
        return Decision::deny();
    }

    Decision EnforcementEngine::enforce(const EnforcementQuery &query) const noexcept {
        try {
            return evaluate(query);
        } catch(const std::exception &e) {
            try {
                LOG.atError("enforce-error")
                    .kv("user", query.user)
                    .kv("resource", query.resource)
                    .kv("action", query.action)
                    .kv("tenant", query.tenant)
                    .cause(e)
                    .log("Failed to evaluate authorization, denying");
                return Decision::failure(errors::EnforcementError(
                    "Failed to enforce authorization for user " + query.user + ": " + e.what()));
            } catch(const std::exception &) {
                return Decision::failedClosed();
            }
        }
    }

} // namespace authz::enforcement
