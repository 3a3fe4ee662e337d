#include "storage/assignment_store.hpp"

#include "errors/errors.hpp"
#include "logging/logger.hpp"

static const auto LOG = // NOLINT(cert-err58-cpp)
    authz::logging::Logger::of("authz.storage.AssignmentStore");

namespace authz::storage {

    AddResult AssignmentStore::add(const StoredRecord &record) {
        switch(record.type) {
            case RecordType::ASSIGNMENT: {
                auto assignment = record.asAssignment();
                if(!assignment.has_value()) {
                    throw errors::InvalidArgument(
                        "Assignment record requires a subject, role and tenant");
                }
                return add(assignment.value());
            }
            case RecordType::POLICY:
            case RecordType::UNKNOWN:
                break;
        }
        // Only assignments are durable; policy facts are rebuilt from the catalog.
        LOG.atDebug("store-add-ignored")
            .kv("recordType", record.typeName)
            .log("Non-assignment record not persisted");
        return AddResult::IGNORED;
    }

    RemoveResult AssignmentStore::remove(const StoredRecord &record) {
        switch(record.type) {
            case RecordType::ASSIGNMENT: {
                auto assignment = record.asAssignment();
                if(!assignment.has_value()) {
                    throw errors::InvalidArgument(
                        "Assignment record requires a subject, role and tenant");
                }
                return remove(assignment.value());
            }
            case RecordType::POLICY:
            case RecordType::UNKNOWN:
                break;
        }
        LOG.atDebug("store-remove-ignored")
            .kv("recordType", record.typeName)
            .log("Non-assignment record not persisted");
        return RemoveResult::IGNORED;
    }

} // namespace authz::storage
