#pragma once

#include "policy/policy_model.hpp"

#include <filesystem>
#include <istream>
#include <string>
#include <string_view>
#include <vector>

namespace YAML {
    class Node;
}

namespace authz::policy {

    /**
     * Reads the declarative permission catalog. The document has the shape
     *
     *     roles:
     *       instructor:
     *         permissions:
     *           assignment: [create, view]
     *           all: [view]
     *
     * Loading is a pipeline of pure stages: parse -> normalize -> validate. Each stage is
     * exposed separately so that it can be exercised on its own. All failures are reported
     * as errors::ConfigError.
     */
    class PolicySource {
    public:
        static constexpr auto ROLES_KEY = "roles";
        static constexpr auto PERMISSIONS_KEY = "permissions";

        [[nodiscard]] static Catalog parse(std::string_view document);
        [[nodiscard]] static Catalog parse(std::istream &stream);
        [[nodiscard]] static Catalog parseFile(const std::filesystem::path &path);

        /**
         * Replace every "all" token with WILDCARD, independently for resources and actions.
         */
        [[nodiscard]] static Catalog normalize(Catalog catalog);

        /**
         * Reject catalogs with no roles, roles with no resources, or resources with no
         * actions.
         */
        static void validate(const Catalog &catalog);

        /**
         * Role names of the catalog, sorted.
         */
        [[nodiscard]] static std::vector<std::string> roles(const Catalog &catalog);

        [[nodiscard]] static Catalog load(std::string_view document);
        [[nodiscard]] static Catalog loadFile(const std::filesystem::path &path);

    private:
        static Catalog fromNode(const YAML::Node &root);
        static RoleDefinition parseRole(const std::string &roleName, const YAML::Node &node);
        static std::string parseToken(const YAML::Node &node, const std::string &where);
    };

} // namespace authz::policy
