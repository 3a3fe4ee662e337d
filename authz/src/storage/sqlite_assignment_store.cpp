#include "storage/sqlite_assignment_store.hpp"

#include "errors/errors.hpp"
#include "logging/logger.hpp"

#include <sqlite3.h>

static const auto LOG = // NOLINT(cert-err58-cpp)
    authz::logging::Logger::of("authz.storage.SqliteAssignmentStore");

namespace authz::storage {

    static constexpr auto CREATE_SCHEMA_SQL =
        "CREATE TABLE IF NOT EXISTS authz_rule ("
        " id INTEGER PRIMARY KEY AUTOINCREMENT,"
        " record_type TEXT NOT NULL,"
        " v0 TEXT NOT NULL DEFAULT '',"
        " v1 TEXT NOT NULL DEFAULT '',"
        " v2 TEXT NOT NULL DEFAULT '',"
        " v3 TEXT NOT NULL DEFAULT '',"
        " v4 TEXT NOT NULL DEFAULT '',"
        " v5 TEXT NOT NULL DEFAULT '',"
        " CONSTRAINT authz_rule_unique UNIQUE (record_type, v0, v1, v2, v3));"
        "CREATE INDEX IF NOT EXISTS idx_authz_rule_record_type ON authz_rule (record_type);"
        "CREATE INDEX IF NOT EXISTS idx_authz_rule_v0_v1_v2 ON authz_rule (v0, v1, v2);";

    static constexpr auto SELECT_ALL_SQL =
        "SELECT record_type, v0, v1, v2, v3, v4, v5 FROM authz_rule ORDER BY id";

    static constexpr auto INSERT_SQL =
        "INSERT INTO authz_rule (record_type, v0, v1, v2) VALUES (?1, ?2, ?3, ?4)";

    static constexpr auto INSERT_IF_ABSENT_SQL =
        "INSERT INTO authz_rule (record_type, v0, v1, v2) VALUES (?1, ?2, ?3, ?4)"
        " ON CONFLICT (record_type, v0, v1, v2, v3) DO NOTHING";

    static constexpr auto DELETE_ONE_SQL =
        "DELETE FROM authz_rule WHERE record_type = ?1 AND v0 = ?2 AND v1 = ?3 AND v2 = ?4";

    static constexpr auto DELETE_ASSIGNMENTS_SQL =
        "DELETE FROM authz_rule WHERE record_type = 'assignment'";

    static void checkAssignment(const policy::Assignment &assignment) {
        if(assignment.user.empty() || assignment.role.empty() || assignment.tenant.empty()) {
            throw errors::InvalidArgument(
                "Assignment parameters cannot be empty: user=" + assignment.user
                + ", role=" + assignment.role + ", tenant=" + assignment.tenant);
        }
    }

    /**
     * RAII prepared statement bound to the owning store's connection.
     */
    class SqliteAssignmentStore::Statement {
        const SqliteAssignmentStore &_owner;
        sqlite3_stmt *_stmt{nullptr};

    public:
        Statement(const SqliteAssignmentStore &owner, std::string_view sql) : _owner(owner) {
            int rc = sqlite3_prepare_v2(
                _owner._db.get(), sql.data(), static_cast<int>(sql.size()), &_stmt, nullptr);
            if(rc != SQLITE_OK) {
                _owner.fail(rc, "prepare statement");
            }
        }
        Statement(const Statement &) = delete;
        Statement(Statement &&) = delete;
        Statement &operator=(const Statement &) = delete;
        Statement &operator=(Statement &&) = delete;
        ~Statement() {
            sqlite3_finalize(_stmt);
        }

        void bind(int index, std::string_view value) {
            int rc = sqlite3_bind_text(
                _stmt, index, value.data(), static_cast<int>(value.size()), SQLITE_TRANSIENT);
            if(rc != SQLITE_OK) {
                _owner.fail(rc, "bind parameter");
            }
        }

        void bindAssignment(const policy::Assignment &assignment) {
            bind(1, ASSIGNMENT_RECORD_TYPE);
            bind(2, assignment.user);
            bind(3, assignment.role);
            bind(4, assignment.tenant);
        }

        /**
         * Returns true while rows are available, false when done.
         */
        bool step(std::string_view what) {
            int rc = sqlite3_step(_stmt);
            if(rc == SQLITE_ROW) {
                return true;
            }
            if(rc == SQLITE_DONE) {
                return false;
            }
            _owner.fail(rc, what);
        }

        void reset() {
            sqlite3_reset(_stmt);
            sqlite3_clear_bindings(_stmt);
        }

        [[nodiscard]] std::string column(int index) const {
            const auto *text = sqlite3_column_text(_stmt, index);
            if(text == nullptr) {
                return {};
            }
            return {reinterpret_cast<const char *>(text),
                    static_cast<std::size_t>(sqlite3_column_bytes(_stmt, index))};
        }

        /**
         * Current row of a SELECT_ALL_SQL result as a tagged record.
         */
        [[nodiscard]] StoredRecord record() const {
            StoredRecord out;
            out.typeName = column(0);
            out.type = recordTypeFromString(out.typeName);
            for(std::size_t i = 0; i < StoredRecord::VALUE_COUNT; ++i) {
                out.values[i] = column(static_cast<int>(i + 1));
            }
            return out;
        }
    };

    void SqliteAssignmentStore::ConnectionCloser::operator()(sqlite3 *db) const noexcept {
        int rc = sqlite3_close_v2(db);
        if(rc != SQLITE_OK) {
            LOG.atWarn("store-close-error").kv("rc", rc).log(sqlite3_errstr(rc));
        }
    }

    SqliteAssignmentStore::SqliteAssignmentStore(std::string path, std::chrono::milliseconds timeout)
        : _path(std::move(path)), _timeout(timeout) {
        if(_path.empty()) {
            throw errors::InvalidArgument("Database path cannot be empty");
        }
        if(_timeout <= std::chrono::milliseconds::zero()) {
            throw errors::InvalidArgument("Storage timeout must be positive");
        }
        open();
        ensureSchema();
        LOG.atInfo("store-open")
            .kv("path", _path)
            .kv("timeoutMs", _timeout.count())
            .log("Assignment store opened");
    }

    SqliteAssignmentStore::~SqliteAssignmentStore() = default;

    void SqliteAssignmentStore::open() {
        sqlite3 *raw = nullptr;
        int rc = sqlite3_open_v2(
            _path.c_str(),
            &raw,
            SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX,
            nullptr);
        // A handle is returned even on failure and must still be closed
        _db.reset(raw);
        if(rc != SQLITE_OK) {
            fail(rc, "open database");
        }
        sqlite3_extended_result_codes(_db.get(), 1);
        rc = sqlite3_busy_timeout(_db.get(), static_cast<int>(_timeout.count()));
        if(rc != SQLITE_OK) {
            fail(rc, "set busy timeout");
        }
    }

    void SqliteAssignmentStore::ensureSchema() {
        std::unique_lock guard{_mutex};
        exec(CREATE_SCHEMA_SQL, "create schema");
    }

    void SqliteAssignmentStore::exec(std::string_view sql, std::string_view what) {
        std::string statement{sql};
        int rc = sqlite3_exec(_db.get(), statement.c_str(), nullptr, nullptr, nullptr);
        if(rc != SQLITE_OK) {
            fail(rc, what);
        }
    }

    void SqliteAssignmentStore::rollback() noexcept {
        if(sqlite3_get_autocommit(_db.get()) != 0) {
            // Nothing open, SQLite already rolled the transaction back
            return;
        }
        int rc = sqlite3_exec(_db.get(), "ROLLBACK", nullptr, nullptr, nullptr);
        if(rc != SQLITE_OK) {
            LOG.atError("store-rollback-error")
                .kv("path", _path)
                .kv("rc", rc)
                .log(sqlite3_errmsg(_db.get()));
        }
    }

    void SqliteAssignmentStore::fail(int rc, std::string_view what) const {
        int primary = rc & 0xff;
        bool retryable = primary == SQLITE_BUSY || primary == SQLITE_LOCKED;
        std::string detail = _db ? sqlite3_errmsg(_db.get()) : sqlite3_errstr(rc);
        LOG.atError("store-error")
            .kv("path", _path)
            .kv("operation", what)
            .kv("rc", rc)
            .kv("retryable", retryable)
            .log(detail);
        if(retryable) {
            throw errors::StorageError(
                "Assignment store timed out during " + std::string(what) + ": " + detail, true);
        }
        throw errors::StorageError(
            "Assignment store failed during " + std::string(what) + ": " + detail);
    }

    policy::AssignmentSet SqliteAssignmentStore::load() {
        std::unique_lock guard{_mutex};
        policy::AssignmentSet assignments;
        std::size_t skipped = 0;
        Statement select{*this, SELECT_ALL_SQL};
        while(select.step("load assignments")) {
            auto record = select.record();
            if(record.type != RecordType::ASSIGNMENT) {
                ++skipped;
                continue;
            }
            auto assignment = record.asAssignment();
            if(!assignment.has_value()) {
                LOG.atWarn("store-load-malformed")
                    .kv("subject", record.values[0])
                    .kv("role", record.values[1])
                    .kv("tenant", record.values[2])
                    .log("Skipping incomplete assignment row");
                continue;
            }
            assignments.insert(std::move(assignment.value()));
        }
        LOG.atDebug("store-load")
            .kv("assignments", assignments.size())
            .kv("skipped", skipped)
            .log("Loaded assignments");
        return assignments;
    }

    void SqliteAssignmentStore::insert(const policy::Assignment &assignment, Statement &statement) {
        statement.bindAssignment(assignment);
        statement.step("insert assignment");
        statement.reset();
    }

    void SqliteAssignmentStore::save(const policy::AssignmentSet &assignments) {
        for(const auto &assignment : assignments) {
            checkAssignment(assignment);
        }
        std::unique_lock guard{_mutex};
        exec("BEGIN IMMEDIATE", "begin save");
        try {
            exec(DELETE_ASSIGNMENTS_SQL, "clear assignments");
            Statement statement{*this, INSERT_SQL};
            for(const auto &assignment : assignments) {
                insert(assignment, statement);
            }
            exec("COMMIT", "commit save");
        } catch(...) {
            rollback();
            throw;
        }
        LOG.atDebug("store-save").kv("assignments", assignments.size()).log("Saved assignments");
    }

    AddResult SqliteAssignmentStore::add(const policy::Assignment &assignment) {
        checkAssignment(assignment);
        std::unique_lock guard{_mutex};
        Statement statement{*this, INSERT_IF_ABSENT_SQL};
        statement.bindAssignment(assignment);
        statement.step("add assignment");
        return sqlite3_changes(_db.get()) > 0 ? AddResult::ADDED : AddResult::ALREADY_EXISTED;
    }

    RemoveResult SqliteAssignmentStore::remove(const policy::Assignment &assignment) {
        checkAssignment(assignment);
        std::unique_lock guard{_mutex};
        Statement statement{*this, DELETE_ONE_SQL};
        statement.bindAssignment(assignment);
        statement.step("remove assignment");
        return sqlite3_changes(_db.get()) > 0 ? RemoveResult::REMOVED : RemoveResult::NOT_FOUND;
    }

    std::vector<StoredRecord> SqliteAssignmentStore::records() {
        std::unique_lock guard{_mutex};
        std::vector<StoredRecord> out;
        Statement select{*this, SELECT_ALL_SQL};
        while(select.step("read records")) {
            out.push_back(select.record());
        }
        return out;
    }

} // namespace authz::storage
