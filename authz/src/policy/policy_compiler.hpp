#pragma once

#include "policy/policy_model.hpp"

#include <string>
#include <vector>

namespace authz::policy {

    /**
     * Expands a catalog into concrete per-tenant PolicyFacts: one fact per
     * role x permission x tenant. Pure; the result is handed to the engine as a whole.
     */
    class PolicyCompiler {
    public:
        /**
         * Compile the catalog for the supplied tenants. Duplicate tenants collapse.
         * Throws errors::InvalidArgument if the tenant list is empty or holds an empty id.
         */
        [[nodiscard]] static PolicyFactSet compile(
            const Catalog &catalog, const std::vector<std::string> &tenants);

        /**
         * Distinct tenants in input order. Throws errors::InvalidArgument on an empty list or
         * an empty tenant id.
         */
        [[nodiscard]] static std::vector<std::string> checkTenants(
            const std::vector<std::string> &tenants);
    };

} // namespace authz::policy
