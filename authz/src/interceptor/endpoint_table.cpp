#include "interceptor/endpoint_table.hpp"

#include "errors/errors.hpp"

namespace authz::interceptor {

    std::string EndpointTable::methodName(std::string_view service, std::string_view method) {
        std::string name;
        name.reserve(service.size() + method.size() + 2);
        name.append("/").append(service).append("/").append(method);
        return name;
    }

    EndpointTable &EndpointTable::addMapping(
        const std::string &method, const std::string &resource, const std::string &action) {
        if(method.empty() || resource.empty() || action.empty()) {
            throw errors::InvalidArgument(
                "Endpoint mapping requires a method, resource and action");
        }
        _mappings.insert_or_assign(method, ResourceAction{resource, action});
        return *this;
    }

    EndpointTable &EndpointTable::addPublicEndpoint(const std::string &method) {
        if(method.empty()) {
            throw errors::InvalidArgument("Public endpoint method cannot be empty");
        }
        _public.insert(method);
        return *this;
    }

    bool EndpointTable::isPublic(std::string_view method) const {
        return _public.find(method) != _public.end();
    }

    std::optional<ResourceAction> EndpointTable::lookup(std::string_view method) const {
        auto it = _mappings.find(method);
        if(it == _mappings.end()) {
            return {};
        }
        return it->second;
    }

} // namespace authz::interceptor
