#include <chrono>
#include "backend/sql.hpp"
#include "gtest/gtest.h"

using namespace std;
using namespace sandbox;

class SqlBackendTest : public ::testing::Test {
protected:
    SqlBackendTest() : backend(1000ms) {}

    execution_result execute(const string &source) {
        execution_request request;
        request.language = "sql";
        request.source = source;
        return backend.execute(request);
    }

    sql_backend backend;
};

TEST(SqlStatementTest, SplitsStatements) {
    EXPECT_EQ(split_sql_statements("SELECT 1; SELECT 2;"), (vector<string>{"SELECT 1", "SELECT 2"}));
    EXPECT_EQ(split_sql_statements("SELECT 'a;b';\n\nSELECT 2"), (vector<string>{"SELECT 'a;b'", "SELECT 2"}));
    EXPECT_EQ(split_sql_statements("  ;; \n"), vector<string>{});
    EXPECT_EQ(split_sql_statements(R"(CREATE TRIGGER t AFTER INSERT ON a BEGIN
  INSERT INTO b VALUES (1);
END;
SELECT 1;)"),
              (vector<string>{"CREATE TRIGGER t AFTER INSERT ON a BEGIN\n  INSERT INTO b VALUES (1);\nEND", "SELECT 1"}));
}

TEST(SqlStatementTest, TranslatesMysqlAliases) {
    EXPECT_TRUE(translate_mysql_alias("show tables"));
    EXPECT_TRUE(translate_mysql_alias("SHOW DATABASES"));
    EXPECT_EQ(translate_mysql_alias("SHOW COLUMNS FROM users"), "PRAGMA table_info(users)");
    EXPECT_EQ(translate_mysql_alias("describe users"), "PRAGMA table_info(users)");
    EXPECT_FALSE(translate_mysql_alias("SELECT * FROM users"));
    EXPECT_FALSE(translate_mysql_alias("DESCRIBE users; DROP TABLE users"));
}

TEST_F(SqlBackendTest, ShowTables) {
    execution_result result = execute("CREATE TABLE t(id INT); SHOW TABLES;");
    EXPECT_EQ(result.status, status::ACCEPTED);
    EXPECT_EQ(result.stdout_text, "OK: CREATE (changes: 0)\ntable_name\n----------\nt");
}

TEST_F(SqlBackendTest, SelectRows) {
    execution_result result = execute(R"(
CREATE TABLE users(id INTEGER PRIMARY KEY, name TEXT, email TEXT);
INSERT INTO users(name, email) VALUES ('Ada', 'ada@example.com'), ('Linus', NULL);
SELECT id, name, email FROM users ORDER BY id;
)");
    EXPECT_EQ(result.status, status::ACCEPTED);
    EXPECT_EQ(result.stdout_text,
              "OK: CREATE (changes: 0)\n"
              "OK: INSERT (changes: 2)\n"
              "id | name | email\n"
              "-----------------\n"
              "1 | Ada | ada@example.com\n"
              "2 | Linus | ");
}

TEST_F(SqlBackendTest, LimitsRows) {
    execution_result result = execute("WITH RECURSIVE n(x) AS (SELECT 1 UNION ALL SELECT x + 1 FROM n WHERE x < 250) SELECT x FROM n;");
    EXPECT_EQ(result.status, status::ACCEPTED);
    EXPECT_NE(result.stdout_text.find("\n200\n... (50 more rows)"), string::npos);
    EXPECT_EQ(result.stdout_text.find("\n201\n"), string::npos);
}

TEST_F(SqlBackendTest, ErrorKeepsPartialOutput) {
    execution_result result = execute("SELECT 1 AS one; SELECT * FROM missing_table;");
    EXPECT_EQ(result.status, status::RUNTIME_ERROR);
    EXPECT_EQ(result.stdout_text, "one\n---\n1");
    EXPECT_EQ(result.stderr_text, "SQLite Error: no such table: missing_table");
}

TEST_F(SqlBackendTest, UnsupportedShowGivesTip) {
    execution_result result = execute("SHOW CREATE TABLE t;");
    EXPECT_EQ(result.status, status::RUNTIME_ERROR);
    EXPECT_NE(result.stderr_text.find("Tip: Use SQLite syntax"), string::npos);
}

TEST_F(SqlBackendTest, AttachIsBlocked) {
    execution_result result = execute("ATTACH DATABASE ':memory:' AS other;");
    EXPECT_EQ(result.status, status::RUNTIME_ERROR);
    EXPECT_EQ(result.stderr_text.rfind("SQLite Error:", 0), 0u);
}

TEST_F(SqlBackendTest, LongQueryTimesOut) {
    execution_result result = execute("WITH RECURSIVE n(x) AS (SELECT 1 UNION ALL SELECT x + 1 FROM n) SELECT count(*) FROM n;");
    EXPECT_EQ(result.status, status::TIME_LIMIT_EXCEEDED);
    EXPECT_EQ(result.stderr_text, "Execution timed out.");
    EXPECT_LT(result.duration_ms, 5000);
}

TEST_F(SqlBackendTest, DatabasesAreIndependent) {
    EXPECT_EQ(execute("CREATE TABLE kept(id INT);").status, status::ACCEPTED);
    execution_result result = execute("SELECT * FROM kept;");
    EXPECT_EQ(result.status, status::RUNTIME_ERROR);
    EXPECT_EQ(result.stderr_text, "SQLite Error: no such table: kept");
}
