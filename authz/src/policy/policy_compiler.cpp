#include "policy/policy_compiler.hpp"

#include "errors/errors.hpp"
#include "logging/logger.hpp"

#include <algorithm>

static const auto LOG = // NOLINT(cert-err58-cpp)
    authz::logging::Logger::of("authz.policy.PolicyCompiler");

namespace authz::policy {

    std::vector<std::string> PolicyCompiler::checkTenants(const std::vector<std::string> &tenants) {
        if(tenants.empty()) {
            throw errors::InvalidArgument("Tenant list cannot be empty");
        }
        std::vector<std::string> distinct;
        distinct.reserve(tenants.size());
        for(const auto &tenant : tenants) {
            if(tenant.empty()) {
                throw errors::InvalidArgument("Tenant id cannot be empty");
            }
            if(std::find(distinct.begin(), distinct.end(), tenant) == distinct.end()) {
                distinct.push_back(tenant);
            }
        }
        return distinct;
    }

    PolicyFactSet PolicyCompiler::compile(
        const Catalog &catalog, const std::vector<std::string> &tenants) {
        auto distinctTenants = checkTenants(tenants);

        PolicyFactSet facts;
        for(const auto &[roleName, role] : catalog.roles) {
            auto permissions = role.expand();
            for(const auto &tenant : distinctTenants) {
                for(const auto &permission : permissions) {
                    facts.insert(PolicyFact{roleName, permission.resource, permission.action, tenant});
                }
            }
        }
        LOG.atDebug("policy-compiled")
            .kv("roles", catalog.roles.size())
            .kv("tenants", distinctTenants.size())
            .kv("facts", facts.size())
            .log("Compiled policy facts");
        return facts;
    }

} // namespace authz::policy
