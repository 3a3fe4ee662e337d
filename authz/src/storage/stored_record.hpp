#pragma once

#include "policy/policy_model.hpp"

#include <array>
#include <optional>
#include <string>
#include <string_view>

namespace authz::storage {

    /**
     * Discriminant of a row at the storage boundary. Only ASSIGNMENT rows are ever written
     * by this core; anything else found in the table is skipped on load.
     */
    enum class RecordType { ASSIGNMENT, POLICY, UNKNOWN };

    static constexpr std::string_view ASSIGNMENT_RECORD_TYPE = "assignment";
    static constexpr std::string_view POLICY_RECORD_TYPE = "policy";

    RecordType recordTypeFromString(std::string_view name) noexcept;
    std::string_view recordTypeName(RecordType type) noexcept;

    /**
     * Tagged row as laid out in the persisted table: a record type plus positional values.
     * For assignments v0 is the subject (user), v1 the role and v2 the tenant; v3..v5 are
     * reserved and always empty.
     */
    struct StoredRecord {
        static constexpr std::size_t VALUE_COUNT = 6;

        RecordType type{RecordType::UNKNOWN};
        std::string typeName;
        std::array<std::string, VALUE_COUNT> values{};

        static StoredRecord of(const policy::Assignment &assignment);
        static StoredRecord of(const policy::PolicyFact &fact);

        /**
         * The assignment carried by this row, or empty if the row is of another type or has
         * an empty subject, role or tenant.
         */
        [[nodiscard]] std::optional<policy::Assignment> asAssignment() const;
    };

} // namespace authz::storage
