#pragma once

#include <functional>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>

namespace authz::interceptor {

    struct ResourceAction {
        std::string resource;
        std::string action;
    };

    /**
     * Static mapping from fully qualified method names ("/pkg.Service/Method") to the
     * resource and action they require, plus the allow-list of public methods.
     */
    class EndpointTable {
        std::map<std::string, ResourceAction, std::less<>> _mappings;
        std::set<std::string, std::less<>> _public;

    public:
        static std::string methodName(std::string_view service, std::string_view method);

        EndpointTable &addMapping(
            const std::string &method, const std::string &resource, const std::string &action);
        EndpointTable &addPublicEndpoint(const std::string &method);

        [[nodiscard]] bool isPublic(std::string_view method) const;
        [[nodiscard]] std::optional<ResourceAction> lookup(std::string_view method) const;

        [[nodiscard]] size_t size() const noexcept {
            return _mappings.size();
        }
    };

} // namespace authz::interceptor
