#pragma once

#include <string>
#include <vector>
#include "grading/challenge.hpp"

namespace sandbox {

/**
 * @brief 评测代码输出评测结果时使用的行前缀
 * 评测结果行的格式为 __PRACTICE_RESULT__:<json>
 */
extern const char *const RESULT_MARKER;

/**
 * @brief 评测代码查找用户函数时依次尝试的函数名
 * 为 [function_name, "solve", "solution"]，去掉重复的名字，保持顺序
 */
std::vector<std::string> entry_point_candidates(const challenge &ch);

/**
 * @brief 判断该语言是否有评测代码模板
 */
bool has_harness(const std::string &language);

/**
 * @brief 生成评测代码：评测函数和测试数据、原样嵌入的用户代码、调用评测函数的语句
 *
 * 评测函数在用户代码之前定义，测试数据的解析和用到的内置函数都在用户代码运行前绑定，
 * 用户代码修改全局变量、内置对象或者模块不会影响比较和输出的结果。
 *
 * 评测代码按题库中的顺序执行测试点，在第一个不通过的测试点停止，最后输出恰好一行评测结果：
 * 1. 找不到用户函数：{passed: false, passedCount: 0, total, error}
 * 2. 调用用户函数抛出异常：{passed: false, passedCount, total, failedAt, error}
 * 3. 答案错误：{passed: false, passedCount, total, failedAt, expected, actual}
 * 4. 全部通过：{passed: true, passedCount, total}
 * 每一种结果都带有 nonce 字段，用来区分用户代码自己输出的评测结果行。
 *
 * @param language python 或者 javascript
 * @param nonce 本次评测的随机串，用户代码无法得知
 * @throw unsupported_language 该语言没有评测代码模板
 */
std::string build_harness(const std::string &language, const challenge &ch, const std::string &user_source, const std::string &nonce);

}  // namespace sandbox
