#include <gtest/gtest.h>

#include <algorithm>
#include <memory>

#include "../../src/common/errors.h"
#include "../../src/store/row_fetcher.h"
#include "../../src/store/sqlite_connector.h"
#include "../test_utils.h"

using namespace Authmap;
using testing_util::ScopedTempDir;
using testing_util::SqliteStore;

class RowFetcherTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(dir_.valid());
        db_path_ = dir_.File("identity.db");
        store_ = std::make_unique<SqliteStore>(db_path_);
        store_->CreateSchema();
        store_->Exec("INSERT INTO contact VALUES (4, 'alice', 'Alice', NULL, '/O=Org/CN=Alice', 'hash')");
        store_->Exec("INSERT INTO contact VALUES (1, NULL, NULL, NULL, NULL, NULL)");
        store_->Exec("INSERT INTO role VALUES (1, 'Data Manager')");
        store_->Exec("INSERT INTO site VALUES (1, 'T1_US_FNAL')");
        store_->Exec("INSERT INTO user_group VALUES (1, 'Global Team')");
        store_->Exec("INSERT INTO site_responsibility VALUES (4, 1, 1)");
        store_->Exec("INSERT INTO group_responsibility VALUES (4, 1, 1)");

        connector_ = std::make_unique<SqliteConnector>(db_path_);
        connector_->Connect();
    }

    ScopedTempDir dir_;
    std::string db_path_;
    std::unique_ptr<SqliteStore> store_;
    std::unique_ptr<SqliteConnector> connector_;
};

TEST_F(RowFetcherTest, MapsIdentityRows) {
    RowFetcher fetcher(*connector_, DefaultQuerySet());

    std::vector<RawIdentityRow> rows = fetcher.FetchIdentities();
    ASSERT_EQ(rows.size(), 2u);
    std::sort(rows.begin(), rows.end(),
              [](const RawIdentityRow& a, const RawIdentityRow& b) { return a.id < b.id; });

    EXPECT_EQ(rows[0].id, 1);
    EXPECT_FALSE(rows[0].login.has_value());
    EXPECT_FALSE(rows[0].credential.has_value());

    EXPECT_EQ(rows[1].id, 4);
    EXPECT_EQ(rows[1].login, std::optional<std::string>("alice"));
    EXPECT_EQ(rows[1].forename, std::optional<std::string>("Alice"));
    EXPECT_FALSE(rows[1].surname.has_value());
    EXPECT_EQ(rows[1].dn, std::optional<std::string>("/O=Org/CN=Alice"));
    EXPECT_EQ(rows[1].credential, std::optional<std::string>("hash"));
}

TEST_F(RowFetcherTest, MapsSiteThenGroupGrants) {
    RowFetcher fetcher(*connector_, DefaultQuerySet());

    std::vector<RoleGrantRow> grants = fetcher.FetchRoleGrants();
    ASSERT_EQ(grants.size(), 2u);

    EXPECT_EQ(grants[0].kind, "site");
    EXPECT_EQ(grants[0].identity_id, std::optional<IdentityId>(4));
    EXPECT_EQ(grants[0].role_title, "Data Manager");
    EXPECT_EQ(grants[0].entity_name, "T1_US_FNAL");

    EXPECT_EQ(grants[1].kind, "group");
    EXPECT_EQ(grants[1].entity_name, "Global Team");
}

TEST_F(RowFetcherTest, NullGrantFieldsAreTolerated) {
    QuerySet queries = DefaultQuerySet();
    queries.site_roles = "SELECT NULL, NULL, 'Admin', NULL";
    queries.group_roles = "SELECT 'group', 4, NULL, 'Team'";
    RowFetcher fetcher(*connector_, queries);

    std::vector<RoleGrantRow> grants = fetcher.FetchRoleGrants();
    ASSERT_EQ(grants.size(), 2u);
    EXPECT_EQ(grants[0].kind, "site");
    EXPECT_FALSE(grants[0].identity_id.has_value());
    EXPECT_EQ(grants[0].entity_name, "");
    EXPECT_EQ(grants[1].role_title, "");
}

TEST_F(RowFetcherTest, NonIntegerIdIsQueryError) {
    QuerySet queries = DefaultQuerySet();
    queries.identities = "SELECT 'abc', 'x', NULL, NULL, NULL, NULL";
    RowFetcher fetcher(*connector_, queries);

    EXPECT_THROW(fetcher.FetchIdentities(), QueryError);
}

TEST_F(RowFetcherTest, NullIdIsQueryError) {
    QuerySet queries = DefaultQuerySet();
    queries.identities = "SELECT NULL, 'x', NULL, NULL, NULL, NULL";
    RowFetcher fetcher(*connector_, queries);

    EXPECT_THROW(fetcher.FetchIdentities(), QueryError);
}

TEST_F(RowFetcherTest, NonIntegerGrantIdIsQueryError) {
    QuerySet queries = DefaultQuerySet();
    queries.site_roles = "SELECT 'site', 'four', 'Admin', 'T1'";
    RowFetcher fetcher(*connector_, queries);

    EXPECT_THROW(fetcher.FetchRoleGrants(), QueryError);
}

TEST_F(RowFetcherTest, WrongColumnCountIsQueryError) {
    QuerySet queries = DefaultQuerySet();
    queries.identities = "SELECT id, username FROM contact";
    RowFetcher fetcher(*connector_, queries);

    EXPECT_THROW(fetcher.FetchIdentities(), QueryError);
}

TEST_F(RowFetcherTest, BadSqlIsQueryError) {
    QuerySet queries = DefaultQuerySet();
    queries.identities = "SELECT * FROM no_such_table";
    RowFetcher fetcher(*connector_, queries);

    EXPECT_THROW(fetcher.FetchIdentities(), QueryError);
}

TEST(SqliteConnectorTest, MissingFileIsConnectionError) {
    ScopedTempDir dir;
    SqliteConnector connector(dir.File("absent.db"));
    EXPECT_THROW(connector.Connect(), DatabaseConnectionError);
}

TEST(SqliteConnectorTest, QueryBeforeConnectIsQueryError) {
    SqliteConnector connector("unused.db");
    EXPECT_THROW(connector.Query("SELECT 1", 1, [](const Row&) {}), QueryError);
}

TEST(SqliteConnectorTest, OpensReadOnly) {
    ScopedTempDir dir;
    SqliteStore store(dir.File("ro.db"));
    store.Exec("CREATE TABLE t (x INTEGER)");

    SqliteConnector connector(store.path());
    connector.Connect();
    EXPECT_THROW(connector.Query("INSERT INTO t VALUES (1)", 0, [](const Row&) {}), QueryError);
}

TEST(MakeConnectorTest, SelectsBackend) {
    DatabaseProfile profile;
    profile.name = "local";
    profile.backend = Backend::kSQLite;
    profile.connection.set("/nonexistent/identity.db");

    std::unique_ptr<Connector> connector = MakeConnector(profile);
    ASSERT_NE(dynamic_cast<SqliteConnector*>(connector.get()), nullptr);
    EXPECT_THROW(connector->Connect(), DatabaseConnectionError);
}
