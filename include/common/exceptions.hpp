#pragma once

#include <boost/stacktrace.hpp>
#include <memory>
#include <ostream>
#include <string>
#include <stdexcept>

namespace sandbox {

struct sandbox_exception : std::exception {
    explicit sandbox_exception(const std::string &message);

    /**
     * @brief 输出异常信息以及抛出异常时的调用栈
     */
    friend std::ostream &operator<<(std::ostream &os, const sandbox_exception &ex);

    const char *what() const noexcept override;

private:
    std::string message;
    std::shared_ptr<boost::stacktrace::stacktrace> stacktrace;
};

/**
 * @brief 表示沙箱的内部错误
 * 一般是创建 workspace、写入源代码、初始化嵌入式解释器失败等问题，与用户代码无关
 */
struct internal_error : public sandbox_exception {
    explicit internal_error(const std::string &message);
};

/**
 * @brief 表示请求评测的语言没有对应的评测代码模板
 * 目前只有 python 和 javascript 支持评测
 */
struct unsupported_language : public sandbox_exception {
    explicit unsupported_language(const std::string &language);

    const std::string language;
};

/**
 * @brief 表示评测代码没有输出可以解析的评测结果行
 * 这种情况绝不能被当作通过处理
 */
struct evaluator_protocol_error : public sandbox_exception {
    explicit evaluator_protocol_error(const std::string &message);
};

/**
 * @brief 表示题库中不存在请求的题目
 */
struct challenge_not_found : public sandbox_exception {
    explicit challenge_not_found(const std::string &id);

    const std::string id;
};

}  // namespace sandbox
