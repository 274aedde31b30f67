#pragma once

#include <functional>
#include <mutex>
#include <nlohmann/json.hpp>
#include <set>
#include <string>
#include <utility>
#include <vector>
#include "backend/backend.hpp"
#include "grading/challenge.hpp"
#include "grading/evaluator.hpp"
#include "security/security_gate.hpp"

/**
 * 这个头文件包含沙箱对外的接口
 * 调用方（比如 HTTP 服务或者命令行）只需要通过 sandbox_service 提交执行请求和评测请求。
 */
namespace sandbox {

/**
 * @brief 一次评测的结果，包含题目信息
 */
struct grading_result {
    std::string challenge_id;
    std::string title;
    sandbox::verdict verdict;

    /**
     * @brief 是否是该用户第一次通过这道题
     */
    bool first_solve = false;
};

/**
 * @brief 用户第一次通过某道题时发出的事件，由积分系统等外部模块处理
 */
struct first_solve_event {
    std::string identity;
    std::string challenge_id;
    std::string language;
};

class sandbox_service {
public:
    /**
     * @param gate 安全检查规则
     * @param registry 各语言的执行后端
     * @param catalog 题库
     * 三者的生命周期必须长于 sandbox_service
     */
    sandbox_service(const security_gate &gate, const backend_registry &registry, const challenge_catalog &catalog);

    std::vector<language_info> languages() const;

    /**
     * @brief 执行用户代码
     * 不支持的语言返回 UNSUPPORTED_LANGUAGE，没有通过安全检查返回 SECURITY_REJECTED，
     * 这两种情况都不会创建 workspace。
     * 不会抛出异常。
     */
    execution_result run(const execution_request &request) const;

    /**
     * @brief 评测用户代码
     * 所有的错误都会转换为对应状态的 verdict，不会抛出异常。
     * 用户第一次通过该题时触发 on_first_solve 注册的回调函数。
     * @param identity 用户标识，由调用方保证已经验证过
     */
    grading_result grade(const std::string &identity, const std::string &language, const std::string &source, const std::string &challenge_id);

    /**
     * @brief 注册用户第一次通过某道题的事件回调函数
     */
    void on_first_solve(std::function<void(const first_solve_event &)> callback);

    /**
     * @brief 记录用户已经通过的题目，之后该用户再通过这道题不会触发 on_first_solve
     * 调用方可以用持久化的通过记录初始化
     */
    void mark_solved(const std::string &identity, const std::string &challenge_id);

    const challenge_catalog &catalog() const;

private:
    void fire_first_solve(const first_solve_event &event);

    /**
     * @return true 若这是该用户第一次通过该题
     */
    bool record_solve(const std::string &identity, const std::string &challenge_id);

    const security_gate &gate;
    const backend_registry &registry;
    const challenge_catalog &challenges;

    std::vector<std::function<void(const first_solve_event &)>> first_solve_callbacks;

    std::mutex solved_mutex;
    std::set<std::pair<std::string, std::string>> solved;
};

/**
 * @brief 执行结果的 JSON 表示：{stdout, stderr, durationMs, status[, plotImage]}
 * status 为 get_display_message 的结果
 */
void to_json(nlohmann::json &j, const execution_result &result);

/**
 * @brief 评测结果的 JSON 表示
 * {challengeId, title, passed, passedCount, total, failedAt, expected, actual, error, status, firstSolve}
 * 没有的字段为 null，error 为空字符串
 */
void to_json(nlohmann::json &j, const grading_result &result);

void to_json(nlohmann::json &j, const language_info &info);

}  // namespace sandbox
