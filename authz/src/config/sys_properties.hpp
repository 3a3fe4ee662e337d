#pragma once

#include <map>
#include <optional>
#include <string>

namespace authz::config {

    /**
     * Environment variable lookup with local overrides. Overrides win; when backed by the
     * process environment, unknown names fall through to getenv().
     */
    class SysProperties {
        std::map<std::string, std::string> _overrides;
        bool _useProcessEnv{true};

        explicit SysProperties(bool useProcessEnv) : _useProcessEnv(useProcessEnv) {
        }

    public:
        static SysProperties fromProcess() {
            return SysProperties{true};
        }

        static SysProperties isolated() {
            return SysProperties{false};
        }

        [[nodiscard]] std::optional<std::string> get(const std::string &name) const;

        SysProperties &put(const std::string &name, const std::string &value) {
            _overrides[name] = value;
            return *this;
        }
    };

} // namespace authz::config
