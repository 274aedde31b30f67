#pragma once

#include <filesystem>
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>
#include "grading/normalize.hpp"

/**
 * 这个头文件包含题库
 * 包含：
 * 1. challenge 类（表示一道通过调用函数来评测的题目）
 * 2. challenge_catalog 类（表示题库，启动时从 JSON 文件加载，之后只读）
 */
namespace sandbox {

struct challenge_example {
    std::string input;
    std::string output;
};

/**
 * @brief 一个测试点：调用用户函数的参数列表和期望的返回值
 */
struct test_case {
    nlohmann::json args;
    nlohmann::json expected;
};

/**
 * @brief 表示一道题目
 */
struct challenge {
    std::string id;
    std::string title;

    /**
     * @brief 难度，比如 Easy、Medium、Hard
     */
    std::string difficulty;

    std::string category;

    /**
     * @brief 是否为常见的面试题
     */
    bool interview = false;

    std::vector<std::string> tags;

    std::string statement;
    std::vector<std::string> constraints;
    std::vector<challenge_example> examples;

    /**
     * @brief 用户需要实现的函数名
     * 找不到这个函数时，评测代码依次尝试 solve 和 solution
     */
    std::string function_name;

    /**
     * @brief 隐藏的测试点，不会出现在返回给用户的题目信息中
     */
    std::vector<test_case> tests;

    normalize_mode normalize = normalize_mode::NONE;

    /**
     * @brief 各语言的初始代码，语言 -> 代码
     */
    std::map<std::string, std::string> starter_code;
};

void from_json(const nlohmann::json &j, challenge_example &example);
void from_json(const nlohmann::json &j, test_case &test);
void from_json(const nlohmann::json &j, challenge &ch);

/**
 * @brief 题目列表的筛选条件，为空的条件不参与筛选
 */
struct challenge_filter {
    /**
     * @brief 难度，不区分大小写
     */
    std::optional<std::string> difficulty;

    /**
     * @brief 分类，不区分大小写
     */
    std::optional<std::string> category;

    /**
     * @brief 在标题、分类和标签中搜索，不区分大小写
     */
    std::optional<std::string> search;

    std::optional<bool> interview;
};

/**
 * @brief 题库
 * 构造后只读，可以在多个线程之间共享
 */
class challenge_catalog {
public:
    explicit challenge_catalog(std::vector<challenge> challenges);

    /**
     * @brief 从 JSON 文件加载题库
     * 文件格式为 {"challenges": [...]}
     * @throw std::system_error 无法读取文件
     * @throw nlohmann::json::parse_error 文件不是合法的 JSON
     * @throw std::invalid_argument 缺少字段、字段类型不正确或者题目 id 重复
     */
    static challenge_catalog load(const std::filesystem::path &path);

    /**
     * @brief 根据 id 查找题目，id 两端的空白字符会被忽略
     * @return 不存在时返回 nullptr
     */
    const challenge *find(const std::string &id) const;

    /**
     * @brief 根据 id 查找题目
     * @throw challenge_not_found 题目不存在
     */
    const challenge &at(const std::string &id) const;

    /**
     * @brief 题目列表，每道题只包含 id、title、difficulty、category、interview 和 tags
     */
    nlohmann::json summaries(const challenge_filter &filter = {}) const;

    /**
     * @brief 题目详情，不包含测试点，只包含测试点的数量 testCount
     * @throw challenge_not_found 题目不存在
     */
    nlohmann::json detail(const std::string &id) const;

    std::size_t size() const;

private:
    std::vector<challenge> challenges;
};

}  // namespace sandbox
