#include "enforcement/policy_snapshot.hpp"

namespace authz::enforcement {

    std::shared_ptr<const PolicySnapshot> PolicySnapshot::build(
        std::vector<std::string> tenants, const policy::PolicyFactSet &facts) {
        auto snapshot = std::make_shared<PolicySnapshot>(Token{});
        snapshot->_tenants = std::move(tenants);
        for(const auto &tenant : snapshot->_tenants) {
            snapshot->_index[tenant];
        }
        for(const auto &fact : facts) {
            auto tenantIt = snapshot->_index.find(fact.tenant);
            if(tenantIt == snapshot->_index.end()) {
                continue;
            }
            tenantIt->second[fact.role].push_back(policy::Permission{fact.resource, fact.action});
            snapshot->_facts.insert(fact);
        }
        return snapshot;
    }

    bool PolicySnapshot::hasTenant(const std::string &tenant) const {
        return _index.find(tenant) != _index.end();
    }

    const std::vector<policy::Permission> *PolicySnapshot::permissionsFor(
        const std::string &tenant, const std::string &role) const {
        if(auto tenantIt = _index.find(tenant); tenantIt != _index.end()) {
            if(auto roleIt = tenantIt->second.find(role); roleIt != tenantIt->second.end()) {
                return &roleIt->second;
            }
        }
        return nullptr;
    }

} // namespace authz::enforcement
