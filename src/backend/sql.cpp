#include "backend/sql.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <sqlite3.h>
#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/join.hpp>
#include <boost/algorithm/string/predicate.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <boost/regex.hpp>
#include <memory>
#include <stdexcept>
#include "common/exceptions.hpp"

namespace sandbox {
using namespace std;

/**
 * @brief SQLite 返回的错误
 */
struct sqlite_error : public runtime_error {
    explicit sqlite_error(sqlite3 *db)
        : runtime_error(sqlite3_errmsg(db)), code(sqlite3_errcode(db)) {}

    const int code;
};

vector<string> split_sql_statements(const string &script) {
    vector<string> statements;
    auto flush = [&statements](string statement) {
        boost::algorithm::trim(statement);
        if (!statement.empty() && statement.back() == ';') {
            statement.pop_back();
            boost::algorithm::trim(statement);
        }
        if (!statement.empty()) statements.push_back(statement);
    };

    string buffer;
    for (char ch : script) {
        buffer += ch;
        // sqlite3_complete 只在语句以分号结尾时才可能返回 true
        if (ch != ';' || !sqlite3_complete(buffer.c_str())) continue;
        flush(buffer);
        buffer.clear();
    }
    flush(buffer);
    return statements;
}

static const boost::regex show_columns_regex(R"(^SHOW\s+COLUMNS\s+(?:FROM|IN)\s+([A-Za-z_][A-Za-z0-9_]*)$)", boost::regex::perl | boost::regex::icase);
static const boost::regex describe_regex(R"(^DESCRIBE\s+([A-Za-z_][A-Za-z0-9_]*)$)", boost::regex::perl | boost::regex::icase);

optional<string> translate_mysql_alias(const string &statement) {
    string trimmed = boost::algorithm::trim_copy(statement);
    string upper = boost::algorithm::to_upper_copy(trimmed);
    if (upper == "SHOW TABLES")
        return "SELECT name AS table_name FROM sqlite_master WHERE type='table' AND name NOT LIKE 'sqlite_%' ORDER BY name";
    if (upper == "SHOW DATABASES")
        return "SELECT 'main' AS database_name";

    boost::smatch match;
    if (boost::regex_match(trimmed, match, show_columns_regex) || boost::regex_match(trimmed, match, describe_regex))
        return fmt::format("PRAGMA table_info({})", match[1].str());
    return nullopt;
}

static string column_value(sqlite3_stmt *stmt, int column) {
    if (sqlite3_column_type(stmt, column) == SQLITE_NULL) return "";
    const unsigned char *text = sqlite3_column_text(stmt, column);
    int bytes = sqlite3_column_bytes(stmt, column);
    return string(reinterpret_cast<const char *>(text), bytes);
}

static string statement_keyword(const string &statement) {
    size_t end = statement.find_first_of(" \t\r\n\f\v");
    string keyword = boost::algorithm::to_upper_copy(statement.substr(0, end));
    return keyword.empty() ? "STATEMENT" : keyword;
}

static void execute_statement(sqlite3 *db, const string &statement, vector<string> &outputs) {
    auto alias = translate_mysql_alias(statement);
    const string &sql = alias ? *alias : statement;

    sqlite3_stmt *raw_stmt = nullptr;
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &raw_stmt, nullptr) != SQLITE_OK)
        throw sqlite_error(db);
    unique_ptr<sqlite3_stmt, decltype(&sqlite3_finalize)> stmt(raw_stmt, sqlite3_finalize);
    if (!stmt) return;  // 只有注释

    int column_count = sqlite3_column_count(stmt.get());
    vector<string> rows;
    size_t row_count = 0;
    int rc;
    while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
        if (row_count++ >= SQL_MAX_ROWS) continue;
        vector<string> values;
        for (int i = 0; i < column_count; ++i)
            values.push_back(column_value(stmt.get(), i));
        rows.push_back(boost::algorithm::join(values, " | "));
    }
    if (rc != SQLITE_DONE) throw sqlite_error(db);

    if (column_count > 0) {
        vector<string> names;
        for (int i = 0; i < column_count; ++i)
            names.push_back(sqlite3_column_name(stmt.get(), i));
        string header = boost::algorithm::join(names, " | ");
        outputs.push_back(header);
        outputs.push_back(string(max<size_t>(3, header.size()), '-'));
        outputs.insert(outputs.end(), rows.begin(), rows.end());
        if (row_count > SQL_MAX_ROWS)
            outputs.push_back(fmt::format("... ({} more rows)", row_count - SQL_MAX_ROWS));
    } else {
        outputs.push_back(fmt::format("OK: {} (changes: {})", statement_keyword(statement), sqlite3_total_changes(db)));
    }
}

static int check_deadline(void *data) {
    auto *deadline = static_cast<chrono::steady_clock::time_point *>(data);
    return chrono::steady_clock::now() > *deadline ? 1 : 0;
}

sql_backend::sql_backend(chrono::milliseconds timeout)
    : timeout(timeout) {}

string sql_backend::language() const {
    return "sql";
}

string sql_backend::label() const {
    return "SQL";
}

void sql_backend::prepare(execution_context &) const {
    // 使用内存数据库，不需要 workspace
}

void sql_backend::run(execution_context &ctx) const {
    sqlite3 *raw_db = nullptr;
    int rc = sqlite3_open_v2(":memory:", &raw_db, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE, nullptr);
    unique_ptr<sqlite3, decltype(&sqlite3_close)> db(raw_db, sqlite3_close);
    if (rc != SQLITE_OK)
        throw internal_error(string("Unable to open in-memory database: ") + (raw_db ? sqlite3_errmsg(raw_db) : sqlite3_errstr(rc)));

    sqlite3_db_config(db.get(), SQLITE_DBCONFIG_ENABLE_LOAD_EXTENSION, 0, nullptr);
    sqlite3_limit(db.get(), SQLITE_LIMIT_ATTACHED, 0);

    auto deadline = chrono::steady_clock::now() + timeout;
    sqlite3_progress_handler(db.get(), 1000, check_deadline, &deadline);

    vector<string> outputs;
    try {
        for (auto &statement : split_sql_statements(ctx.request.source))
            execute_statement(db.get(), statement, outputs);
        ctx.result.status = status::ACCEPTED;
    } catch (sqlite_error &ex) {
        if (ex.code == SQLITE_INTERRUPT && chrono::steady_clock::now() > deadline) {
            ctx.result.status = status::TIME_LIMIT_EXCEEDED;
            ctx.result.stderr_text = "Execution timed out.";
        } else {
            ctx.result.status = status::RUNTIME_ERROR;
            ctx.result.stderr_text = fmt::format("SQLite Error: {}", ex.what());
            if (boost::algorithm::icontains(ex.what(), "near \"show\""))
                ctx.result.stderr_text += "\nTip: Use SQLite syntax, or supported aliases: SHOW TABLES, SHOW DATABASES, SHOW COLUMNS FROM <table>, DESCRIBE <table>.";
        }
    }
    // 出错之前已经执行的语句的输出仍然保留
    ctx.result.stdout_text = boost::algorithm::join(outputs, "\n");
}

}  // namespace sandbox
