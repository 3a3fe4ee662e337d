#include "storage/stored_record.hpp"

namespace authz::storage {

    RecordType recordTypeFromString(std::string_view name) noexcept {
        if(name == ASSIGNMENT_RECORD_TYPE) {
            return RecordType::ASSIGNMENT;
        }
        if(name == POLICY_RECORD_TYPE) {
            return RecordType::POLICY;
        }
        return RecordType::UNKNOWN;
    }

    std::string_view recordTypeName(RecordType type) noexcept {
        switch(type) {
            case RecordType::ASSIGNMENT:
                return ASSIGNMENT_RECORD_TYPE;
            case RecordType::POLICY:
                return POLICY_RECORD_TYPE;
            case RecordType::UNKNOWN:
                break;
        }
        return "unknown";
    }

    StoredRecord StoredRecord::of(const policy::Assignment &assignment) {
        StoredRecord record;
        record.type = RecordType::ASSIGNMENT;
        record.typeName = ASSIGNMENT_RECORD_TYPE;
        record.values[0] = assignment.user;
        record.values[1] = assignment.role;
        record.values[2] = assignment.tenant;
        return record;
    }

    StoredRecord StoredRecord::of(const policy::PolicyFact &fact) {
        StoredRecord record;
        record.type = RecordType::POLICY;
        record.typeName = POLICY_RECORD_TYPE;
        record.values[0] = fact.role;
        record.values[1] = fact.resource;
        record.values[2] = fact.action;
        record.values[3] = fact.tenant;
        return record;
    }

    std::optional<policy::Assignment> StoredRecord::asAssignment() const {
        if(type != RecordType::ASSIGNMENT) {
            return {};
        }
        if(values[0].empty() || values[1].empty() || values[2].empty()) {
            return {};
        }
        return policy::Assignment{values[0], values[1], values[2]};
    }

} // namespace authz::storage
