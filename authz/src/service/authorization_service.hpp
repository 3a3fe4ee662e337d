#pragma once

#include "enforcement/enforcement_engine.hpp"
#include "policy/policy_model.hpp"
#include "service/authorizer.hpp"
#include "storage/assignment_store.hpp"

#include <memory>
#include <mutex>
#include <ostream>
#include <set>
#include <shared_mutex>
#include <string>
#include <vector>

namespace authz::config {
    struct ServiceConfig;
}

namespace authz::service {

    /**
     * Facade over the catalog, the enforcement engine and the assignment store.
     *
     * Every operation validates its arguments before touching the engine or the store.
     * Administrative mutations are serialized; an assignment is persisted before it becomes
     * visible to the engine, so a storage failure leaves both sides unchanged.
     */
    class AuthorizationService : public Authorizer {
        mutable std::shared_mutex _catalogMutex;
        std::mutex _writeMutex;
        std::shared_ptr<const policy::Catalog> _catalog;
        enforcement::EnforcementEngine _engine;
        std::shared_ptr<storage::AssignmentStore> _store;

        std::shared_ptr<const policy::Catalog> catalog() const;
        void install(std::shared_ptr<const policy::Catalog> catalog,
                     const std::vector<std::string> &tenants);

    public:
        /**
         * Compile the catalog for the tenants and load persisted assignments from the store.
         */
        AuthorizationService(
            policy::Catalog catalog,
            const std::vector<std::string> &tenants,
            std::shared_ptr<storage::AssignmentStore> store);

        /**
         * Load the policy file named by the configuration and open its SQLite store.
         */
        static std::unique_ptr<AuthorizationService> fromConfig(
            const config::ServiceConfig &config);

        /**
         * Throwing form of evaluate(). A failed decision is raised as EnforcementError.
         */
        [[nodiscard]] bool canDo(
            const std::string &user,
            const std::string &resource,
            const std::string &action,
            const std::string &tenant) const;

        [[nodiscard]] enforcement::Decision evaluate(
            const enforcement::EnforcementQuery &query) const override;

        bool assignRole(const std::string &user, const std::string &role, const std::string &tenant);
        bool removeRole(const std::string &user, const std::string &role, const std::string &tenant);

        [[nodiscard]] std::set<std::string> getUserRoles(
            const std::string &user, const std::string &tenant) const;

        /**
         * Tenants in which the user holds the role. Not scoped to a tenant: this is an
         * administrative lookup across every tenant.
         */
        [[nodiscard]] std::set<std::string> getUserTenantsForRole(
            const std::string &user, const std::string &role) const;

        [[nodiscard]] bool hasRole(
            const std::string &user, const std::string &role, const std::string &tenant) const;

        [[nodiscard]] std::vector<std::string> getAvailableRoles() const;
        [[nodiscard]] std::vector<std::string> getTenants() const;

        /**
         * Recompile the current catalog for a new tenant list. On failure the previous fact
         * set stays in effect. Assignments are never touched.
         */
        void reloadPolicies(const std::vector<std::string> &tenants);

        /**
         * Replace the catalog and recompile. Roles dropped from the catalog keep their
         * assignments but no longer grant anything.
         */
        void reloadPolicies(policy::Catalog catalog, const std::vector<std::string> &tenants);

        void saveAssignments();

        void dumpState(std::ostream &out) const;
    };

} // namespace authz::service
