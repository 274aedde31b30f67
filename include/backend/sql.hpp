#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>
#include "backend/backend.hpp"

namespace sandbox {

/**
 * @brief 查询结果最多输出的行数，超出的部分只输出剩余行数
 */
const std::size_t SQL_MAX_ROWS = 200;

/**
 * @brief 按照 SQLite 的语法将脚本切分为单条语句
 * 字符串、注释和触发器中的分号不会切分语句。末尾的分号会被去掉，空语句会被忽略。
 */
std::vector<std::string> split_sql_statements(const std::string &script);

/**
 * @brief 将 MySQL 风格的查看数据库结构的语句翻译为 SQLite 的查询
 * 支持 SHOW TABLES、SHOW DATABASES、SHOW COLUMNS FROM|IN <table>、DESCRIBE <table>
 * @return 若不是支持的语句，返回 nullopt
 */
std::optional<std::string> translate_mysql_alias(const std::string &statement);

/**
 * @brief 使用嵌入式 SQLite 执行 SQL 脚本
 * 每次执行使用独立的内存数据库，执行结束后丢弃
 */
struct sql_backend : execution_backend {
    explicit sql_backend(std::chrono::milliseconds timeout);

    std::string language() const override;
    std::string label() const override;
    void prepare(execution_context &ctx) const override;
    void run(execution_context &ctx) const override;

private:
    std::chrono::milliseconds timeout;
};

}  // namespace sandbox
