#include "config/sys_properties.hpp"

#include <cstdlib>

namespace authz::config {

    std::optional<std::string> SysProperties::get(const std::string &name) const {
        if(auto it = _overrides.find(name); it != _overrides.end()) {
            return it->second;
        }
        if(!_useProcessEnv) {
            return {};
        }
        const char *value = std::getenv(name.c_str());
        if(value == nullptr) {
            return {};
        }
        return std::string(value);
    }

} // namespace authz::config
