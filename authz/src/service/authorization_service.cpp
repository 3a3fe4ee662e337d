#include "service/authorization_service.hpp"

#include "config/service_config.hpp"
#include "enforcement/policy_snapshot.hpp"
#include "errors/errors.hpp"
#include "logging/logger.hpp"
#include "policy/policy_compiler.hpp"
#include "policy/policy_source.hpp"
#include "storage/sqlite_assignment_store.hpp"

#include <initializer_list>
#include <string_view>
#include <utility>

static const auto LOG = // NOLINT(cert-err58-cpp)
    authz::logging::Logger::of("authz.service.AuthorizationService");

namespace authz::service {

    static void requireNonEmpty(
        std::initializer_list<std::pair<std::string_view, const std::string *>> args) {
        for(const auto &[name, value] : args) {
            if(value->empty()) {
                throw errors::InvalidArgument(std::string(name) + " cannot be empty");
            }
        }
    }

    static std::string joined(const std::vector<std::string> &values) {
        std::string out;
        for(const auto &value : values) {
            if(!out.empty()) {
                out += ", ";
            }
            out += value;
        }
        return out;
    }

    AuthorizationService::AuthorizationService(
        policy::Catalog catalog,
        const std::vector<std::string> &tenants,
        std::shared_ptr<storage::AssignmentStore> store)
        : _store(std::move(store)) {
        if(!_store) {
            throw errors::InvalidArgument("An assignment store is required");
        }
        policy::PolicySource::validate(catalog);
        install(std::make_shared<const policy::Catalog>(std::move(catalog)), tenants);
        _engine.replaceAssignments(_store->load());
        LOG.atInfo("service-started")
            .kv("tenants", joined(getTenants()))
            .kv("assignments", _engine.assignments().size())
            .log("Authorization service initialized");
    }

    std::unique_ptr<AuthorizationService> AuthorizationService::fromConfig(
        const config::ServiceConfig &config) {
        config.validate();
        auto catalog = policy::PolicySource::loadFile(config.policiesPath);
        auto store = std::make_shared<storage::SqliteAssignmentStore>(
            config.databasePath, config.storageTimeout);
        return std::make_unique<AuthorizationService>(
            std::move(catalog), config.tenants, std::move(store));
    }

    std::shared_ptr<const policy::Catalog> AuthorizationService::catalog() const {
        std::shared_lock guard{_catalogMutex};
        return _catalog;
    }

    void AuthorizationService::install(
        std::shared_ptr<const policy::Catalog> catalog, const std::vector<std::string> &tenants) {
        auto distinct = policy::PolicyCompiler::checkTenants(tenants);
        auto facts = policy::PolicyCompiler::compile(*catalog, distinct);
        auto snapshot = enforcement::PolicySnapshot::build(std::move(distinct), facts);

        std::unique_lock guard{_catalogMutex};
        _engine.replaceFacts(snapshot);
        _catalog = std::move(catalog);
        LOG.atInfo("policies-loaded")
            .kv("roles", _catalog->roles.size())
            .kv("tenants", joined(snapshot->tenants()))
            .kv("facts", snapshot->facts().size())
            .log("Policies compiled into engine");
    }

    bool AuthorizationService::canDo(
        const std::string &user,
        const std::string &resource,
        const std::string &action,
        const std::string &tenant) const {
        requireNonEmpty(
            {{"user", &user}, {"resource", &resource}, {"action", &action}, {"tenant", &tenant}});
        auto decision = evaluate(enforcement::EnforcementQuery{user, resource, action, tenant});
        if(decision.failed()) {
            LOG.atError("authorization-check-failed")
                .kv("user", user)
                .kv("tenant", tenant)
                .kv("kind", decision.error->kind())
                .log(decision.error->what());
            throw errors::EnforcementError(decision.error->what());
        }
        return decision.allowed;
    }

    enforcement::Decision AuthorizationService::evaluate(
        const enforcement::EnforcementQuery &query) const {
        auto decision = _engine.enforce(query);
        LOG.atDebug("authorization-check")
            .kv("user", query.user)
            .kv("resource", query.resource)
            .kv("action", query.action)
            .kv("tenant", query.tenant)
            .kv("allowed", decision.allowed)
            .kv("role", decision.matchedRole)
            .log();
        return decision;
    }

    bool AuthorizationService::assignRole(
        const std::string &user, const std::string &role, const std::string &tenant) {
        requireNonEmpty({{"user", &user}, {"role", &role}, {"tenant", &tenant}});

        // Reloads swap the catalog under the same lock
        std::unique_lock guard{_writeMutex};
        auto current = catalog();
        if(current->roles.find(role) == current->roles.end()) {
            LOG.atWarn("assign-unknown-role").kv("role", role).kv("user", user).log();
            throw errors::InvalidArgument("Role " + role + " does not exist");
        }

        policy::Assignment assignment{user, role, tenant};
        auto stored = _store->add(assignment);
        bool added = _engine.addAssignment(assignment);
        if(added) {
            LOG.atInfo("role-assigned")
                .kv("user", user)
                .kv("role", role)
                .kv("tenant", tenant)
                .log("Role assigned");
        } else {
            LOG.atDebug("role-already-assigned")
                .kv("user", user)
                .kv("role", role)
                .kv("tenant", tenant)
                .kv("stored", stored == storage::AddResult::ADDED)
                .log();
        }
        return added;
    }

    bool AuthorizationService::removeRole(
        const std::string &user, const std::string &role, const std::string &tenant) {
        requireNonEmpty({{"user", &user}, {"role", &role}, {"tenant", &tenant}});

        policy::Assignment assignment{user, role, tenant};
        std::unique_lock guard{_writeMutex};
        auto stored = _store->remove(assignment);
        bool removed = _engine.removeAssignment(assignment);
        if(removed) {
            LOG.atInfo("role-removed")
                .kv("user", user)
                .kv("role", role)
                .kv("tenant", tenant)
                .log("Role removed");
        } else {
            LOG.atDebug("role-not-assigned")
                .kv("user", user)
                .kv("role", role)
                .kv("tenant", tenant)
                .kv("stored", stored == storage::RemoveResult::REMOVED)
                .log();
        }
        return removed;
    }

    std::set<std::string> AuthorizationService::getUserRoles(
        const std::string &user, const std::string &tenant) const {
        requireNonEmpty({{"user", &user}, {"tenant", &tenant}});
        return _engine.rolesFor(user, tenant);
    }

    std::set<std::string> AuthorizationService::getUserTenantsForRole(
        const std::string &user, const std::string &role) const {
        requireNonEmpty({{"user", &user}, {"role", &role}});
        return _engine.tenantsFor(user, role);
    }

    bool AuthorizationService::hasRole(
        const std::string &user, const std::string &role, const std::string &tenant) const {
        requireNonEmpty({{"user", &user}, {"role", &role}, {"tenant", &tenant}});
        return _engine.hasAssignment(policy::Assignment{user, role, tenant});
    }

    std::vector<std::string> AuthorizationService::getAvailableRoles() const {
        return policy::PolicySource::roles(*catalog());
    }

    std::vector<std::string> AuthorizationService::getTenants() const {
        auto snapshot = _engine.snapshot();
        if(!snapshot) {
            return {};
        }
        return snapshot->tenants();
    }

    void AuthorizationService::reloadPolicies(const std::vector<std::string> &tenants) {
        std::unique_lock guard{_writeMutex};
        try {
            install(catalog(), tenants);
        } catch(const errors::Error &e) {
            LOG.atError("policy-reload-failed")
                .kv("tenants", joined(tenants))
                .cause(e)
                .log("Keeping previous policies");
            throw;
        }
    }

    void AuthorizationService::reloadPolicies(
        policy::Catalog catalog, const std::vector<std::string> &tenants) {
        std::unique_lock guard{_writeMutex};
        try {
            policy::PolicySource::validate(catalog);
            install(std::make_shared<const policy::Catalog>(std::move(catalog)), tenants);
        } catch(const errors::Error &e) {
            LOG.atError("policy-reload-failed")
                .kv("tenants", joined(tenants))
                .cause(e)
                .log("Keeping previous policies");
            throw;
        }
    }

    void AuthorizationService::saveAssignments() {
        std::unique_lock guard{_writeMutex};
        auto assignments = _engine.assignments();
        _store->save(assignments);
        LOG.atInfo("assignments-saved").kv("count", assignments.size()).log();
    }

    void AuthorizationService::dumpState(std::ostream &out) const {
        auto snapshot = _engine.snapshot();
        auto assignments = _engine.assignments();

        out << "tenants: " << joined(getTenants()) << "\n";
        out << "roles: " << joined(getAvailableRoles()) << "\n";
        if(snapshot) {
            out << "facts: " << snapshot->facts().size() << "\n";
            for(const auto &fact : snapshot->facts()) {
                out << "  " << fact.tenant << " " << fact.role << " " << fact.resource << " "
                    << fact.action << "\n";
            }
        }
        out << "assignments: " << assignments.size() << "\n";
        for(const auto &assignment : assignments) {
            out << "  " << assignment.tenant << " " << assignment.user << " "
                << assignment.role << "\n";
        }
    }

} // namespace authz::service
