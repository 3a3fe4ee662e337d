#pragma once

#include "enforcement/enforcement_engine.hpp"

namespace authz::service {

    /**
     * Decision point consumed at the request boundary.
     */
    class Authorizer {
    public:
        Authorizer() = default;
        Authorizer(const Authorizer &) = delete;
        Authorizer(Authorizer &&) = delete;
        Authorizer &operator=(const Authorizer &) = delete;
        Authorizer &operator=(Authorizer &&) = delete;
        virtual ~Authorizer() = default;

        /**
         * Never throws. A decision carrying an error is a deny.
         */
        [[nodiscard]] virtual enforcement::Decision evaluate(
            const enforcement::EnforcementQuery &query) const = 0;
    };

} // namespace authz::service
