#include "interceptor/request_interceptor.hpp"

#include "logging/logger.hpp"

#include <cctype>

static const auto LOG = // NOLINT(cert-err58-cpp)
    authz::logging::Logger::of("authz.interceptor.RequestInterceptor");

namespace authz::interceptor {

    std::string_view statusName(Status status) {
        switch(status) {
            case Status::OK:
                return "OK";
            case Status::UNAUTHENTICATED:
                return "UNAUTHENTICATED";
            case Status::PERMISSION_DENIED:
                return "PERMISSION_DENIED";
            case Status::INTERNAL:
                return "INTERNAL";
        }
        return "UNKNOWN";
    }

    std::string RequestMetadata::foldKey(std::string_view key) {
        std::string folded;
        folded.reserve(key.size());
        for(auto c : key) {
            folded.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
        }
        return folded;
    }

    RequestMetadata::RequestMetadata(
        std::initializer_list<std::pair<const std::string, std::string>> values) {
        for(const auto &[key, value] : values) {
            add(key, value);
        }
    }

    RequestMetadata &RequestMetadata::add(std::string_view key, std::string value) {
        _values.emplace(foldKey(key), std::move(value));
        return *this;
    }

    std::optional<std::string> RequestMetadata::first(std::string_view key) const {
        auto it = _values.find(foldKey(key));
        if(it == _values.end()) {
            return {};
        }
        return it->second;
    }

    InterceptOutcome RequestInterceptor::intercept(
        std::string_view method, const RequestMetadata &metadata) const {
        if(_endpoints.isPublic(method)) {
            LOG.atDebug("public-endpoint").kv("method", method).log();
            return InterceptOutcome{Status::OK, {}, std::nullopt};
        }

        auto user = metadata.first(USER_ID_KEY);
        auto tenant = metadata.first(TENANT_ID_KEY);
        if(!user.has_value() || user->empty() || !tenant.has_value() || tenant->empty()) {
            LOG.atWarn("identity-missing")
                .kv("method", method)
                .kv("hasUser", user.has_value() && !user->empty())
                .kv("hasTenant", tenant.has_value() && !tenant->empty())
                .log();
            return InterceptOutcome{Status::UNAUTHENTICATED, "authentication required", std::nullopt};
        }

        auto mapping = _endpoints.lookup(method);
        if(!mapping.has_value()) {
            LOG.atError("endpoint-unmapped").kv("method", method).log();
            return InterceptOutcome{
                Status::INTERNAL, "authorization mapping not configured", std::nullopt};
        }

        auto decision = _authorizer.evaluate(
            enforcement::EnforcementQuery{*user, mapping->resource, mapping->action, *tenant});
        if(decision.failed()) {
            LOG.atError("authorization-error")
                .kv("method", method)
                .kv("user", *user)
                .kv("tenant", *tenant)
                .kv("kind", decision.error->kind())
                .log(decision.error->what());
            return InterceptOutcome{Status::INTERNAL, "authorization error", std::nullopt};
        }
        if(!decision.allowed) {
            LOG.atInfo("access-denied")
                .kv("user", *user)
                .kv("resource", mapping->resource)
                .kv("action", mapping->action)
                .kv("tenant", *tenant)
                .log();
            return InterceptOutcome{
                Status::PERMISSION_DENIED,
                "insufficient permissions for " + mapping->resource + "." + mapping->action,
                std::nullopt};
        }

        LOG.atDebug("access-granted")
            .kv("user", *user)
            .kv("resource", mapping->resource)
            .kv("action", mapping->action)
            .kv("tenant", *tenant)
            .kv("role", decision.matchedRole)
            .log();
        return InterceptOutcome{
            Status::OK,
            {},
            AuthContext{*user, *tenant, mapping->resource, mapping->action}};
    }

} // namespace authz::interceptor
