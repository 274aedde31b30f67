#pragma once

#include <chrono>
#include <map>
#include <string>
#include <vector>
#include "backend/backend.hpp"

namespace sandbox {

/**
 * @brief 标记捕获的图像路径的输出行前缀
 * 这一行会从 stdout 中移除
 */
extern const char *const PLOT_SENTINEL;

/**
 * @brief 判断 python 代码是否使用了 matplotlib 绘图
 */
bool uses_plotting(const std::string &source);

/**
 * @brief 一条外部命令
 * 参数可以使用 {workspace}、{source} 等变量，见 expand_arguments
 */
struct command_line {
    std::string command;
    std::vector<std::string> arguments;
};

/**
 * @brief 通过解释器直接运行的语言的配置
 */
struct interpreted_language {
    std::string language;
    std::string label;

    /**
     * @brief 源代码保存在 workspace 中的文件名，比如 main.rb
     */
    std::string source_file;

    command_line interpreter;

    std::chrono::milliseconds timeout;
};

/**
 * @brief 将源代码写入 workspace，再调用一次解释器运行
 */
struct interpreter_backend : execution_backend {
    explicit interpreter_backend(interpreted_language config);

    std::string language() const override;
    std::string label() const override;
    void prepare(execution_context &ctx) const override;
    void run(execution_context &ctx) const override;

protected:
    /**
     * @brief 生成实际写入文件的代码，默认为用户代码本身
     */
    virtual std::string wrap_source(const execution_context &ctx) const;

    /**
     * @brief 需要额外设置的环境变量
     */
    virtual std::map<std::string, std::string> environment(const execution_context &ctx) const;

    /**
     * @brief 将解释器的运行结果写入 ctx.result
     */
    virtual void collect(execution_context &ctx, const process_outcome &outcome) const;

    const interpreted_language config;
};

/**
 * @brief 使用 python3 -I 运行的 python 后端
 * 代码使用了 matplotlib 时，会在代码末尾追加保存图像的代码，并将图像以 data URI 的形式返回
 */
struct python_interpreter_backend : interpreter_backend {
    explicit python_interpreter_backend(std::chrono::milliseconds timeout);

protected:
    std::string wrap_source(const execution_context &ctx) const override;
    std::map<std::string, std::string> environment(const execution_context &ctx) const override;
    void collect(execution_context &ctx, const process_outcome &outcome) const override;
};

/**
 * @brief 使用 node 运行的 javascript 后端
 * 在用户代码之前插入 input() 和 prompt()，按行读取标准输入
 */
struct javascript_backend : interpreter_backend {
    explicit javascript_backend(std::chrono::milliseconds timeout);

protected:
    std::string wrap_source(const execution_context &ctx) const override;
};

}  // namespace sandbox
