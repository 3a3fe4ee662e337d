#pragma once

#include "storage/assignment_store.hpp"

#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

struct sqlite3;
struct sqlite3_stmt;

namespace authz::storage {

    /**
     * AssignmentStore backed by a single SQLite table:
     *
     *     authz_rule(id, record_type, v0, v1, v2, v3, v4, v5)
     *     UNIQUE(record_type, v0, v1, v2, v3)
     *
     * The table is created on open if missing. Every call holds the connection mutex and is
     * bounded by the busy timeout; a busy or locked database surfaces as a retryable
     * errors::StorageError.
     */
    class SqliteAssignmentStore : public AssignmentStore {
    public:
        static constexpr auto TABLE_NAME = "authz_rule";
        static constexpr auto IN_MEMORY = ":memory:";
        static constexpr std::chrono::milliseconds DEFAULT_TIMEOUT{5000};

        explicit SqliteAssignmentStore(
            std::string path, std::chrono::milliseconds timeout = DEFAULT_TIMEOUT);
        SqliteAssignmentStore(const SqliteAssignmentStore &) = delete;
        SqliteAssignmentStore(SqliteAssignmentStore &&) = delete;
        SqliteAssignmentStore &operator=(const SqliteAssignmentStore &) = delete;
        SqliteAssignmentStore &operator=(SqliteAssignmentStore &&) = delete;
        ~SqliteAssignmentStore() override;

        using AssignmentStore::add;
        using AssignmentStore::remove;

        [[nodiscard]] policy::AssignmentSet load() override;
        void save(const policy::AssignmentSet &assignments) override;
        AddResult add(const policy::Assignment &assignment) override;
        RemoveResult remove(const policy::Assignment &assignment) override;

        /**
         * Every row in the table regardless of type, in insertion order. Diagnostics only.
         */
        [[nodiscard]] std::vector<StoredRecord> records();

        [[nodiscard]] const std::string &path() const noexcept {
            return _path;
        }

    private:
        struct ConnectionCloser {
            void operator()(sqlite3 *db) const noexcept;
        };

        class Statement;

        std::string _path;
        std::chrono::milliseconds _timeout;
        std::mutex _mutex;
        std::unique_ptr<sqlite3, ConnectionCloser> _db;

        void open();
        void ensureSchema();
        void exec(std::string_view sql, std::string_view what);
        void rollback() noexcept;
        void insert(const policy::Assignment &assignment, Statement &statement);
        [[noreturn]] void fail(int rc, std::string_view what) const;
    };

} // namespace authz::storage
