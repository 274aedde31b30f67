#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include "backend/backend.hpp"
#include "common/status.hpp"
#include "grading/challenge.hpp"

namespace sandbox {

/**
 * @brief 一次评测的结论
 * 评测在第一个不通过的测试点停止，因此 passed_count == failed_at - 1
 */
struct verdict {
    bool passed = false;
    int passed_count = 0;
    int total = 0;

    /**
     * @brief 第一个不通过的测试点，从 1 开始编号
     */
    std::optional<int> failed_at;

    /**
     * @brief 答案错误时，规范化后的期望值和用户函数的返回值
     */
    std::optional<nlohmann::json> expected;
    std::optional<nlohmann::json> actual;

    /**
     * @brief 找不到用户函数、用户函数抛出异常或者评测超时时的错误信息
     */
    std::optional<std::string> error;

    sandbox::status status = sandbox::status::WRONG_ANSWER;
};

/**
 * @brief 解析评测代码的输出
 * 从后往前找到第一个以 RESULT_MARKER 开头的行，解析其中的 JSON
 * @param stdout_text 评测代码的标准输出
 * @param stderr_text 评测代码的标准错误输出，找不到评测结果行时作为错误信息
 * @param nonce 不为空时，只接受 nonce 字段与之相同的评测结果行，其它的评测结果行是用户代码伪造的
 * @throw evaluator_protocol_error 找不到评测结果行，或者评测结果不是合法的 JSON 对象
 */
verdict parse_verdict(const std::string &stdout_text, const std::string &stderr_text, const std::string &nonce = "");

/**
 * @brief 使用评测代码包装用户代码，交给该语言的执行后端运行，并解析评测结论
 * 运行超时、找不到解释器和内部错误时直接返回对应状态的 verdict
 * @throw unsupported_language 该语言没有评测代码模板或者没有注册执行后端
 * @throw evaluator_protocol_error 评测代码没有输出合法的评测结果
 */
verdict evaluate(const backend_registry &registry, const std::string &language, const std::string &source, const challenge &ch);

}  // namespace sandbox
