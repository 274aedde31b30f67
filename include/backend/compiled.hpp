#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>
#include "backend/interpreter.hpp"

namespace sandbox {

/**
 * @brief 先编译后运行的语言的配置
 */
struct compiled_language {
    std::string language;
    std::string label;

    /**
     * @brief 源代码保存在 workspace 中的文件名，比如 main.cpp
     */
    std::string source_file;

    /**
     * @brief 编译产物在 workspace 中的文件名，比如 app.out
     * 在命令行模板中为 {output}
     */
    std::string output_file;

    /**
     * @brief 按顺序尝试的编译器
     * 前一个编译器失败后尝试下一个，比如 C# 先尝试 mcs 再尝试 csc
     */
    std::vector<command_line> compilers;

    std::chrono::milliseconds compile_timeout;

    command_line runner;

    std::chrono::milliseconds run_timeout;
};

/**
 * @brief 先编译源代码，编译成功后再运行编译产物
 * 编译失败时不会进入运行阶段，stderr 为编译器的输出
 */
struct compiled_backend : execution_backend {
    explicit compiled_backend(compiled_language config);

    std::string language() const override;
    std::string label() const override;

    /**
     * @brief 创建 workspace，写入源代码并编译
     */
    void prepare(execution_context &ctx) const override;
    void run(execution_context &ctx) const override;

protected:
    /**
     * @brief 源代码在 workspace 中的文件名
     */
    virtual std::string source_filename(execution_context &ctx) const;

    /**
     * @brief 依次尝试所有编译器，返回第一个成功的编译结果
     * 全部失败时返回最有意义的失败结果：后备编译器不存在时保留前一个编译器的诊断信息
     * 实际使用的编译器名保存在 ctx.variables["compiler"]
     */
    virtual process_outcome compile(execution_context &ctx) const;

    const compiled_language config;
};

/**
 * @brief 从 Java 源代码中推断主类名
 * 优先匹配 public class，其次匹配任意 class，都没有时为 Main
 */
std::string resolve_java_class_name(const std::string &source);

/**
 * @brief 从 javac 的错误信息中找到编译器期望的类名
 * 比如 "class Solution is public, should be declared in a file named Solution.java"
 */
std::optional<std::string> java_class_name_hint(const std::string &diagnostics);

/**
 * @brief Java 后端
 * 源文件以推断的主类名命名。若 javac 报告文件名与类名不符，按照编译器给出的类名重命名后重新编译一次。
 */
struct java_backend : compiled_backend {
    java_backend(std::chrono::milliseconds compile_timeout, std::chrono::milliseconds run_timeout);

protected:
    std::string source_filename(execution_context &ctx) const override;
    process_outcome compile(execution_context &ctx) const override;
};

}  // namespace sandbox
