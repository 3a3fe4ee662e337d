#pragma once

#include "interceptor/endpoint_table.hpp"
#include "service/authorizer.hpp"

#include <initializer_list>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace authz::interceptor {

    static constexpr auto USER_ID_KEY = "x-user-id";
    static constexpr auto TENANT_ID_KEY = "x-tenant-id";

    enum class Status { OK, UNAUTHENTICATED, PERMISSION_DENIED, INTERNAL };

    std::string_view statusName(Status status);

    /**
     * Request metadata with case-insensitive keys. Multiple values per key are kept in
     * arrival order; lookups return the first.
     */
    class RequestMetadata {
        std::multimap<std::string, std::string> _values;

        static std::string foldKey(std::string_view key);

    public:
        RequestMetadata() = default;
        RequestMetadata(std::initializer_list<std::pair<const std::string, std::string>> values);

        RequestMetadata &add(std::string_view key, std::string value);
        [[nodiscard]] std::optional<std::string> first(std::string_view key) const;
    };

    /**
     * Identity and permission of an admitted call, handed to the handler.
     */
    struct AuthContext {
        std::string user;
        std::string tenant;
        std::string resource;
        std::string action;
    };

    struct InterceptOutcome {
        Status status{Status::INTERNAL};
        std::string message;
        std::optional<AuthContext> context;

        [[nodiscard]] bool admitted() const noexcept {
            return status == Status::OK;
        }
    };

    /**
     * Request boundary guard. Order of checks:
     *
     * 1. Public endpoints are admitted without identity.
     * 2. Missing or empty x-user-id / x-tenant-id is UNAUTHENTICATED.
     * 3. An endpoint with no mapping is INTERNAL.
     * 4. An authorizer failure is INTERNAL; details are logged, never returned.
     * 5. A deny is PERMISSION_DENIED.
     */
    class RequestInterceptor {
        const service::Authorizer &_authorizer;
        EndpointTable _endpoints;

    public:
        RequestInterceptor(const service::Authorizer &authorizer, EndpointTable endpoints)
            : _authorizer(authorizer), _endpoints(std::move(endpoints)) {
        }

        [[nodiscard]] InterceptOutcome intercept(
            std::string_view method, const RequestMetadata &metadata) const;

        [[nodiscard]] const EndpointTable &endpoints() const noexcept {
            return _endpoints;
        }
    };

} // namespace authz::interceptor
