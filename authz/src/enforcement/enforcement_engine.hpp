#pragma once

#include "enforcement/policy_snapshot.hpp"
#include "errors/errors.hpp"
#include "policy/policy_model.hpp"

#include <memory>
#include <set>
#include <shared_mutex>
#include <string>
#include <type_traits>

namespace authz::enforcement {

    struct EnforcementQuery {
        std::string user;
        std::string resource;
        std::string action;
        std::string tenant;
    };

    /**
     * Outcome of an enforcement. A decision carrying an error is always a deny; callers check
     * the error first, then the boolean.
     */
    struct Decision {
        bool allowed{false};
        std::string matchedRole;
        std::shared_ptr<const errors::Error> error;

        [[nodiscard]] bool failed() const noexcept {
            return error != nullptr;
        }

        static Decision allow(std::string role) {
            return Decision{true, std::move(role), nullptr};
        }
        static Decision deny() {
            return Decision{};
        }
        template<typename E>
        static Decision failure(const E &error) {
            static_assert(std::is_base_of_v<errors::Error, E>);
            return Decision{false, {}, std::make_shared<const E>(error)};
        }

        /**
         * Deny carrying a preallocated EnforcementError. Used when building a detailed
         * failure is itself failing.
         */
        static Decision failedClosed() noexcept;
    };

    /**
     * In-memory evaluator. Holds the current PolicySnapshot and the live assignment table.
     * Concurrent readers share the lock; replacing facts or mutating assignments is
     * exclusive. Assignment state and fact state are independent: replacing facts never
     * touches assignments and vice versa.
     */
    class EnforcementEngine {
        mutable std::shared_mutex _mutex;
        std::shared_ptr<const PolicySnapshot> _snapshot;
        policy::AssignmentSet _assignments;

        Decision evaluate(const EnforcementQuery &query) const;

    public:
        EnforcementEngine() = default;
        EnforcementEngine(const EnforcementEngine &) = delete;
        EnforcementEngine(EnforcementEngine &&) = delete;
        EnforcementEngine &operator=(const EnforcementEngine &) = delete;
        EnforcementEngine &operator=(EnforcementEngine &&) = delete;
        ~EnforcementEngine() = default;

        /**
         * Atomically replace the entire fact set. Assignments are left untouched.
         */
        void replaceFacts(std::shared_ptr<const PolicySnapshot> snapshot);

        [[nodiscard]] std::shared_ptr<const PolicySnapshot> snapshot() const;

        /**
         * Returns true if the assignment was not present before.
         */
        bool addAssignment(const policy::Assignment &assignment);

        /**
         * Returns true if the assignment was present.
         */
        bool removeAssignment(const policy::Assignment &assignment);

        void replaceAssignments(policy::AssignmentSet assignments);

        [[nodiscard]] policy::AssignmentSet assignments() const;
        [[nodiscard]] bool hasAssignment(const policy::Assignment &assignment) const;
        [[nodiscard]] std::set<std::string> rolesFor(
            const std::string &user, const std::string &tenant) const;
        [[nodiscard]] std::set<std::string> tenantsFor(
            const std::string &user, const std::string &role) const;

        /**
         * Allow iff the user holds, in the query tenant, a role with a fact in that same
         * tenant whose resource and action match (literally or via WILDCARD). Never throws:
         * an internal failure yields a deny carrying an EnforcementError.
         */
        [[nodiscard]] Decision enforce(const EnforcementQuery &query) const noexcept;
    };

} // namespace authz::enforcement
