#pragma once

#include <nlohmann/json.hpp>
#include <string>

namespace sandbox {

/**
 * @brief 比较答案之前对答案的规范化方式
 */
enum class normalize_mode {
    /**
     * @brief 不做处理，要求答案完全一致
     */
    NONE,

    /**
     * @brief 答案为列表时排序，用于不要求顺序的题目
     */
    SORT,

    /**
     * @brief 答案为列表的列表时，先对每个内层列表排序，再对外层列表排序
     * 用于分组类的题目，组内和组间都不要求顺序
     */
    SORT_NESTED
};

/**
 * @brief 解析题目配置中的 normalize 字段
 * 空字符串和 "none" 为 NONE，不认识的值也按 NONE 处理
 */
normalize_mode parse_normalize_mode(const std::string &mode);

/**
 * @brief 转换为评测代码中使用的字符串："none"、"sort"、"sort-nested"
 */
std::string normalize_mode_name(normalize_mode mode);

/**
 * @brief 规范化 JSON 值：整数值的浮点数转换为整数，保证相等的值有相同的序列化结果
 */
nlohmann::json canonicalize(const nlohmann::json &value);

/**
 * @brief 规范化后的紧凑序列化结果
 * 对象的键按字典序排列，分隔符没有空格
 */
std::string canonical_dump(const nlohmann::json &value);

/**
 * @brief 列表排序使用的比较函数
 * 数字排在最前面并按数值比较，其次为字符串，按字典序比较，其他值按照 canonical_dump 的结果比较
 */
bool canonical_less(const nlohmann::json &a, const nlohmann::json &b);

/**
 * @brief 按照 mode 规范化答案
 * 对于任意的 mode，normalize(normalize(x, mode), mode) == normalize(x, mode)
 * 不是列表的值在任何 mode 下都只做 canonicalize
 */
nlohmann::json normalize(const nlohmann::json &value, normalize_mode mode);

}  // namespace sandbox
