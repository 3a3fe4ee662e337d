#pragma once

#include "policy/policy_model.hpp"
#include "storage/stored_record.hpp"

namespace authz::storage {

    enum class AddResult { ADDED, ALREADY_EXISTED, IGNORED };
    enum class RemoveResult { REMOVED, NOT_FOUND, IGNORED };

    /**
     * Selective persistence adapter. The only component that touches durable storage, and it
     * only ever writes Assignment rows.
     *
     * - load() skips rows that are not assignments.
     * - save() replaces every assignment row in one transaction; if it fails the prior
     *   durable state is retained.
     * - add()/remove() are idempotent and report what happened instead of raising constraint
     *   errors.
     * - add()/remove() of a StoredRecord that is not an assignment is a deliberate no-op and
     *   reports IGNORED. Compiled policy facts travel through this path and are dropped here.
     *
     * Infrastructure failures are raised as errors::StorageError.
     */
    class AssignmentStore {
    public:
        AssignmentStore() = default;
        AssignmentStore(const AssignmentStore &) = delete;
        AssignmentStore(AssignmentStore &&) = delete;
        AssignmentStore &operator=(const AssignmentStore &) = delete;
        AssignmentStore &operator=(AssignmentStore &&) = delete;
        virtual ~AssignmentStore() = default;

        [[nodiscard]] virtual policy::AssignmentSet load() = 0;
        virtual void save(const policy::AssignmentSet &assignments) = 0;
        virtual AddResult add(const policy::Assignment &assignment) = 0;
        virtual RemoveResult remove(const policy::Assignment &assignment) = 0;

        AddResult add(const StoredRecord &record);
        RemoveResult remove(const StoredRecord &record);
    };

} // namespace authz::storage
