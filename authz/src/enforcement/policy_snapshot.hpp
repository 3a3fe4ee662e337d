#pragma once

#include "policy/policy_model.hpp"

#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace authz::enforcement {

    /**
     * Immutable compiled policy: the full PolicyFact set plus a tenant -> role -> permissions
     * index used on the hot path. Built off-lock and swapped into the engine as a whole, so
     * readers never observe a half-rebuilt fact set.
     */
    class PolicySnapshot {
        std::vector<std::string> _tenants;
        policy::PolicyFactSet _facts;
        std::unordered_map<
            std::string,
            std::unordered_map<std::string, std::vector<policy::Permission>>>
            _index;

        struct Token {
            explicit Token() = default;
        };

    public:
        explicit PolicySnapshot(Token) {
        }

        /**
         * Build from compiled facts. Facts for tenants outside the list are dropped.
         */
        static std::shared_ptr<const PolicySnapshot> build(
            std::vector<std::string> tenants, const policy::PolicyFactSet &facts);

        [[nodiscard]] const std::vector<std::string> &tenants() const noexcept {
            return _tenants;
        }

        [[nodiscard]] const policy::PolicyFactSet &facts() const noexcept {
            return _facts;
        }

        [[nodiscard]] bool hasTenant(const std::string &tenant) const;

        /**
         * Permissions granted to a role within a tenant, or nullptr if none.
         */
        [[nodiscard]] const std::vector<policy::Permission> *permissionsFor(
            const std::string &tenant, const std::string &role) const;
    };

} // namespace authz::enforcement
