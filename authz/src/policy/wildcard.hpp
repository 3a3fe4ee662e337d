#pragma once

#include "policy/policy_model.hpp"

#include <string_view>

namespace authz::policy {

    /**
     * Single position match: a WILDCARD pattern matches any non-empty value, anything else
     * must be equal. Applied independently to the resource and the action; tenants are never
     * matched this way.
     */
    inline bool matches(std::string_view pattern, std::string_view value) noexcept {
        if(value.empty()) {
            return false;
        }
        return pattern == WILDCARD || pattern == value;
    }

    inline bool matches(const Permission &permission, std::string_view resource,
                        std::string_view action) noexcept {
        return matches(permission.resource, resource) && matches(permission.action, action);
    }

    /**
     * Maps the document "all" token to WILDCARD; other tokens pass through.
     */
    inline std::string normalizeToken(const std::string &token) {
        return token == ALL_TOKEN ? std::string(WILDCARD) : token;
    }

} // namespace authz::policy
