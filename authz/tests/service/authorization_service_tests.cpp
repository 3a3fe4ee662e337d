#include "config/service_config.hpp"
#include "errors/errors.hpp"
#include "policy/policy_source.hpp"
#include "service/authorization_service.hpp"
#include "storage/sqlite_assignment_store.hpp"
#include "test_util.hpp"
#include <catch2/catch_all.hpp>
#include <sqlite3.h>

#include <sstream>
#include <thread>

// NOLINTBEGIN

using authz::policy::PolicySource;
using authz::service::AuthorizationService;
using authz::storage::SqliteAssignmentStore;

namespace {
    struct Fixture {
        std::shared_ptr<SqliteAssignmentStore> store =
            std::make_shared<SqliteAssignmentStore>(SqliteAssignmentStore::IN_MEMORY);
        AuthorizationService service{
            PolicySource::load(authz::test::SAMPLE_POLICY), {"acme", "other"}, store};
    };

    /**
     * Service whose decision point always reports an internal failure.
     */
    class BrokenEvaluationService : public AuthorizationService {
    public:
        using AuthorizationService::AuthorizationService;

        authz::enforcement::Decision evaluate(
            const authz::enforcement::EnforcementQuery &) const override {
            return authz::enforcement::Decision::failure(
                authz::errors::EnforcementError("Policy snapshot unavailable"));
        }
    };

    void rejectInsertsFor(const std::string &path, const std::string &user) {
        sqlite3 *db = nullptr;
        REQUIRE(sqlite3_open(path.c_str(), &db) == SQLITE_OK);
        auto sql = "CREATE TRIGGER reject_user BEFORE INSERT ON authz_rule WHEN NEW.v0 = '" + user
                   + "' BEGIN SELECT RAISE(ABORT, 'rejected'); END;";
        int rc = sqlite3_exec(db, sql.c_str(), nullptr, nullptr, nullptr);
        sqlite3_close(db);
        REQUIRE(rc == SQLITE_OK);
    }
} // namespace

SCENARIO("Instructors can act on assignments in their tenant", "[service]") {
    GIVEN("An instructor assigned in acme") {
        Fixture f;
        REQUIRE(f.service.assignRole("u1", "instructor", "acme"));
        THEN("Granted actions are allowed") {
            REQUIRE(f.service.canDo("u1", "assignment", "create", "acme"));
            REQUIRE(f.service.canDo("u1", "assignment", "view", "acme"));
        }
        THEN("Other actions and resources are denied") {
            REQUIRE_FALSE(f.service.canDo("u1", "assignment", "delete", "acme"));
            REQUIRE_FALSE(f.service.canDo("u1", "course", "view", "acme"));
        }
        THEN("Nothing leaks into another tenant") {
            REQUIRE_FALSE(f.service.canDo("u1", "assignment", "create", "other"));
            REQUIRE(f.service.getUserRoles("u1", "other").empty());
        }
        THEN("The assignment is persisted") {
            REQUIRE(f.store->load().size() == 1);
        }
    }
}

SCENARIO("Unknown roles cannot be assigned", "[service]") {
    GIVEN("A service") {
        Fixture f;
        WHEN("A role outside the catalog is assigned") {
            THEN("It fails and nothing is persisted") {
                REQUIRE_THROWS_AS(
                    f.service.assignRole("u1", "ghost-role", "acme"),
                    authz::errors::InvalidArgument);
                REQUIRE(f.store->records().empty());
                REQUIRE_FALSE(f.service.hasRole("u1", "ghost-role", "acme"));
            }
        }
    }
}

SCENARIO("Admins may do anything in their own tenant", "[service]") {
    GIVEN("An admin assigned in acme") {
        Fixture f;
        f.service.assignRole("root", "admin", "acme");
        THEN("Any resource and action is allowed in acme") {
            REQUIRE(f.service.canDo("root", "billing", "delete", "acme"));
            REQUIRE(f.service.canDo("root", "assignment", "grade", "acme"));
        }
        THEN("Nothing is allowed in another tenant") {
            REQUIRE_FALSE(f.service.canDo("root", "billing", "delete", "other"));
        }
    }
}

SCENARIO("A role with any action on one resource stays on that resource", "[service]") {
    GIVEN("A grader assigned in acme") {
        Fixture f;
        f.service.assignRole("g1", "grader", "acme");
        THEN("Any action on the granted resource is allowed") {
            REQUIRE(f.service.canDo("g1", "submission", "grade", "acme"));
            REQUIRE(f.service.canDo("g1", "submission", "anything", "acme"));
        }
        THEN("Other resources are denied") {
            REQUIRE_FALSE(f.service.canDo("g1", "assignment", "view", "acme"));
            REQUIRE_FALSE(f.service.canDo("g1", "submissions", "grade", "acme"));
        }
        THEN("Nothing is allowed in another tenant") {
            REQUIRE_FALSE(f.service.canDo("g1", "submission", "grade", "other"));
        }
    }
}

SCENARIO("Evaluation failures are raised by canDo", "[service]") {
    GIVEN("A service whose evaluation fails") {
        BrokenEvaluationService service{
            PolicySource::load(authz::test::SAMPLE_POLICY),
            {"acme"},
            std::make_shared<SqliteAssignmentStore>(SqliteAssignmentStore::IN_MEMORY)};
        service.assignRole("u1", "admin", "acme");
        THEN("canDo throws an enforcement error instead of answering") {
            REQUIRE_THROWS_AS(
                service.canDo("u1", "assignment", "create", "acme"),
                authz::errors::EnforcementError);
            REQUIRE_THROWS_WITH(
                service.canDo("u1", "assignment", "create", "acme"),
                "Policy snapshot unavailable");
        }
        THEN("Argument validation still comes first") {
            REQUIRE_THROWS_AS(
                service.canDo("", "assignment", "create", "acme"), authz::errors::InvalidArgument);
        }
    }
}

SCENARIO("A storage failure leaves the engine unchanged", "[service]") {
    GIVEN("A service over a database that rejects one user") {
        authz::test::TempDir dir;
        auto path = dir.file("authz.db").string();
        auto store = std::make_shared<SqliteAssignmentStore>(path);
        rejectInsertsFor(path, "blocked");
        AuthorizationService service{
            PolicySource::load(authz::test::SAMPLE_POLICY), {"acme"}, store};
        WHEN("Assigning a role fails in the store") {
            REQUIRE_THROWS_AS(
                service.assignRole("blocked", "admin", "acme"), authz::errors::StorageError);
            THEN("The engine did not gain the assignment") {
                REQUIRE_FALSE(service.hasRole("blocked", "admin", "acme"));
                REQUIRE_FALSE(service.canDo("blocked", "course", "view", "acme"));
                REQUIRE(service.getUserRoles("blocked", "acme").empty());
                REQUIRE(store->load().empty());
            }
            THEN("Other users can still be assigned") {
                REQUIRE(service.assignRole("u1", "viewer", "acme"));
                REQUIRE(service.canDo("u1", "course", "view", "acme"));
            }
        }
    }
}

SCENARIO("Concurrent assignments are all observable", "[service]") {
    GIVEN("A service") {
        Fixture f;
        WHEN("Two assignments are made concurrently") {
            std::thread a([&f] { f.service.assignRole("u1", "viewer", "acme"); });
            std::thread b([&f] { f.service.assignRole("u2", "instructor", "other"); });
            a.join();
            b.join();
            THEN("Both are visible and persisted") {
                REQUIRE(f.service.hasRole("u1", "viewer", "acme"));
                REQUIRE(f.service.hasRole("u2", "instructor", "other"));
                REQUIRE(f.store->load().size() == 2);
            }
        }
    }
}

SCENARIO("Role assignment is idempotent", "[service]") {
    GIVEN("A service") {
        Fixture f;
        WHEN("The same role is assigned twice") {
            bool first = f.service.assignRole("u1", "viewer", "acme");
            bool second = f.service.assignRole("u1", "viewer", "acme");
            THEN("Only the first reports a change and one row is stored") {
                REQUIRE(first);
                REQUIRE_FALSE(second);
                REQUIRE(f.store->records().size() == 1);
            }
        }
        WHEN("A role that was never assigned is removed") {
            bool removed = f.service.removeRole("u1", "viewer", "acme");
            THEN("It is a no-op") {
                REQUIRE_FALSE(removed);
                REQUIRE(f.store->records().empty());
            }
        }
        WHEN("An assigned role is removed") {
            f.service.assignRole("u1", "viewer", "acme");
            bool removed = f.service.removeRole("u1", "viewer", "acme");
            THEN("It is gone from the engine and the store") {
                REQUIRE(removed);
                REQUIRE_FALSE(f.service.canDo("u1", "course", "view", "acme"));
                REQUIRE(f.store->load().empty());
            }
        }
    }
}

SCENARIO("Arguments are validated first", "[service]") {
    GIVEN("A service") {
        Fixture f;
        THEN("Empty identifiers are rejected") {
            REQUIRE_THROWS_AS(f.service.canDo("", "a", "b", "acme"), authz::errors::InvalidArgument);
            REQUIRE_THROWS_AS(f.service.canDo("u", "a", "b", ""), authz::errors::InvalidArgument);
            REQUIRE_THROWS_AS(f.service.assignRole("u", "", "acme"), authz::errors::InvalidArgument);
            REQUIRE_THROWS_AS(f.service.removeRole("u", "admin", ""), authz::errors::InvalidArgument);
            REQUIRE_THROWS_AS(f.service.getUserRoles("", "acme"), authz::errors::InvalidArgument);
            REQUIRE_THROWS_AS(
                f.service.getUserTenantsForRole("u", ""), authz::errors::InvalidArgument);
            REQUIRE_THROWS_AS(f.service.hasRole("u", "admin", ""), authz::errors::InvalidArgument);
            REQUIRE(f.store->records().empty());
        }
        THEN("The evaluate path reports the failure instead of throwing") {
            auto decision = f.service.evaluate({"", "a", "b", "acme"});
            REQUIRE(decision.failed());
            REQUIRE_FALSE(decision.allowed);
        }
    }
}

SCENARIO("A service cannot start with empty permission tokens", "[service]") {
    GIVEN("A catalog built in code with an empty action") {
        authz::policy::Catalog catalog;
        catalog.roles["instructor"].permissions["assignment"] = {"create", ""};
        THEN("Construction fails with a configuration error") {
            REQUIRE_THROWS_AS(
                AuthorizationService(
                    catalog,
                    {"acme"},
                    std::make_shared<SqliteAssignmentStore>(SqliteAssignmentStore::IN_MEMORY)),
                authz::errors::ConfigError);
        }
    }
}

SCENARIO("Role lookups", "[service]") {
    GIVEN("A user holding roles in two tenants") {
        Fixture f;
        f.service.assignRole("u1", "admin", "acme");
        f.service.assignRole("u1", "admin", "other");
        f.service.assignRole("u1", "viewer", "acme");
        THEN("Roles are listed per tenant") {
            REQUIRE(f.service.getUserRoles("u1", "acme") == std::set<std::string>{"admin", "viewer"});
            REQUIRE(f.service.getUserRoles("u1", "other") == std::set<std::string>{"admin"});
        }
        THEN("Tenants for a role are listed across tenants") {
            REQUIRE(
                f.service.getUserTenantsForRole("u1", "admin")
                == std::set<std::string>{"acme", "other"});
        }
        THEN("Available roles come from the catalog") {
            REQUIRE(
                f.service.getAvailableRoles()
                == std::vector<std::string>{"admin", "grader", "instructor", "viewer"});
        }
        THEN("The evaluate path names the granting role") {
            auto decision = f.service.evaluate({"u1", "course", "delete", "acme"});
            REQUIRE(decision.allowed);
            REQUIRE(decision.matchedRole == "admin");
        }
    }
}

SCENARIO("Policies can be reloaded", "[service]") {
    GIVEN("A service with an instructor in acme") {
        Fixture f;
        f.service.assignRole("u1", "instructor", "acme");
        WHEN("Reloading with no tenants") {
            THEN("It fails and the previous facts stay in effect") {
                REQUIRE_THROWS_AS(f.service.reloadPolicies({}), authz::errors::InvalidArgument);
                REQUIRE(f.service.canDo("u1", "assignment", "create", "acme"));
                REQUIRE(f.service.getTenants() == std::vector<std::string>{"acme", "other"});
            }
        }
        WHEN("Reloading with a new tenant list") {
            f.service.reloadPolicies({"beta", "gamma"});
            THEN("Retired tenants grant nothing but assignments are kept") {
                REQUIRE(f.service.getTenants() == std::vector<std::string>{"beta", "gamma"});
                REQUIRE_FALSE(f.service.canDo("u1", "assignment", "create", "acme"));
                REQUIRE(f.service.hasRole("u1", "instructor", "acme"));
            }
            THEN("New tenants are usable") {
                f.service.assignRole("u2", "viewer", "beta");
                REQUIRE(f.service.canDo("u2", "course", "view", "beta"));
            }
        }
        WHEN("Reloading with a catalog that drops the role") {
            auto catalog = PolicySource::load("roles:\n  viewer:\n    permissions:\n      all: [view]\n");
            f.service.reloadPolicies(catalog, {"acme"});
            THEN("The assignment is kept but grants nothing") {
                REQUIRE(f.service.hasRole("u1", "instructor", "acme"));
                REQUIRE_FALSE(f.service.canDo("u1", "assignment", "create", "acme"));
                REQUIRE(f.service.getAvailableRoles() == std::vector<std::string>{"viewer"});
            }
            THEN("The dropped role can no longer be assigned") {
                REQUIRE_THROWS_AS(
                    f.service.assignRole("u2", "instructor", "acme"),
                    authz::errors::InvalidArgument);
            }
        }
        WHEN("Reloading with an invalid catalog") {
            authz::policy::Catalog empty;
            THEN("It fails and the previous catalog stays in effect") {
                REQUIRE_THROWS_AS(
                    f.service.reloadPolicies(empty, {"acme"}), authz::errors::ConfigError);
                REQUIRE(f.service.canDo("u1", "assignment", "create", "acme"));
                REQUIRE(f.service.getAvailableRoles().size() == 4);
            }
        }
        WHEN("Reloading with a catalog holding an empty action") {
            authz::policy::Catalog catalog;
            catalog.roles["instructor"].permissions["assignment"] = {"create", ""};
            THEN("It fails and the previous catalog stays in effect") {
                REQUIRE_THROWS_AS(
                    f.service.reloadPolicies(catalog, {"acme"}), authz::errors::ConfigError);
                REQUIRE(f.service.canDo("u1", "assignment", "create", "acme"));
                REQUIRE(f.service.getAvailableRoles().size() == 4);
            }
        }
        WHEN("Reloading with a catalog holding an empty resource") {
            authz::policy::Catalog catalog;
            catalog.roles["r"].permissions[""] = {"view"};
            THEN("It fails and the previous catalog stays in effect") {
                REQUIRE_THROWS_AS(
                    f.service.reloadPolicies(catalog, {"acme"}), authz::errors::ConfigError);
                REQUIRE(f.service.getTenants() == std::vector<std::string>{"acme", "other"});
                REQUIRE(f.service.canDo("u1", "assignment", "view", "acme"));
            }
        }
    }
}

SCENARIO("Assignments persist across service restarts", "[service]") {
    GIVEN("A service backed by a database file") {
        authz::test::TempDir dir;
        auto path = dir.file("authz.db").string();
        {
            AuthorizationService service{
                PolicySource::load(authz::test::SAMPLE_POLICY),
                {"acme"},
                std::make_shared<SqliteAssignmentStore>(path)};
            service.assignRole("u1", "instructor", "acme");
            service.saveAssignments();
        }
        WHEN("A new service opens the same database") {
            AuthorizationService restarted{
                PolicySource::load(authz::test::SAMPLE_POLICY),
                {"acme"},
                std::make_shared<SqliteAssignmentStore>(path)};
            THEN("The assignment is loaded") {
                REQUIRE(restarted.hasRole("u1", "instructor", "acme"));
                REQUIRE(restarted.canDo("u1", "assignment", "view", "acme"));
            }
        }
    }
    GIVEN("A configuration naming a policy file and a database") {
        authz::test::TempDir dir;
        authz::config::ServiceConfig config;
        config.policiesPath = dir.write("policies.yaml", authz::test::SAMPLE_POLICY);
        config.databasePath = dir.file("authz.db").string();
        config.tenants = {"acme"};
        WHEN("A service is created from it") {
            auto service = AuthorizationService::fromConfig(config);
            THEN("It is ready for use") {
                REQUIRE(service->getTenants() == std::vector<std::string>{"acme"});
                REQUIRE(service->assignRole("u1", "admin", "acme"));
                REQUIRE(service->canDo("u1", "x", "y", "acme"));
            }
        }
    }
}

SCENARIO("Service state can be dumped", "[service]") {
    GIVEN("A service with an assignment") {
        Fixture f;
        f.service.assignRole("u1", "instructor", "acme");
        WHEN("The state is dumped") {
            std::ostringstream out;
            f.service.dumpState(out);
            auto text = out.str();
            THEN("Tenants, facts and assignments are listed") {
                REQUIRE_THAT(text, Catch::Matchers::ContainsSubstring("tenants: acme, other"));
                REQUIRE_THAT(text, Catch::Matchers::ContainsSubstring("acme instructor assignment create"));
                REQUIRE_THAT(text, Catch::Matchers::ContainsSubstring("assignments: 1"));
                REQUIRE_THAT(text, Catch::Matchers::ContainsSubstring("acme u1 instructor"));
            }
        }
    }
}

// NOLINTEND
