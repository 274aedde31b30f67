#pragma once

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "common/status.hpp"
#include "process/process.hpp"
#include "process/workspace.hpp"

/**
 * 这个头文件包含执行用户代码的后端的公共接口
 * 包含：
 * 1. execution_request 类（表示一次执行请求）
 * 2. execution_result 类（表示一次执行的结果）
 * 3. execution_backend 类（表示一种执行方式，比如嵌入式解释器、外部解释器、先编译后运行）
 * 4. backend_registry 类（语言到执行后端的映射）
 */
namespace sandbox {

/**
 * @brief 一次执行请求，构造后不再修改
 */
struct execution_request {
    /**
     * @brief 语言名，比如 python、javascript、cpp
     */
    std::string language;

    /**
     * @brief 用户源代码
     */
    std::string source;

    /**
     * @brief 喂给程序的标准输入，会被完整写入后关闭
     */
    std::string stdin_text;

    /**
     * @brief 是否为评测代码，评测代码由评测器生成，而不是用户直接提交的程序
     */
    bool grading = false;
};

struct execution_result {
    std::string stdout_text;
    std::string stderr_text;

    /**
     * @brief 从开始准备到清理完成所经过的时钟时间
     */
    long duration_ms = 0;

    sandbox::status status = sandbox::status::ACCEPTED;

    /**
     * @brief 捕获的 matplotlib 图像，格式为 data:image/png;base64,...
     * 只有 python 的绘图变体会设置这个字段
     */
    std::optional<std::string> plot_image;
};

/**
 * @brief 一次执行过程中各阶段共享的状态
 */
struct execution_context {
    explicit execution_context(const execution_request &request);

    const execution_request &request;

    /**
     * @brief 本次执行独占的工作目录，由 prepare 创建，cleanup 时删除
     * 嵌入式后端不需要工作目录
     */
    std::unique_ptr<workspace> ws;

    /**
     * @brief 展开命令行模板时可以使用的变量，比如 {source}、{workspace}
     */
    std::map<std::string, std::string> variables;

    execution_result result;

    /**
     * @brief 为 true 时表示 prepare 阶段已经得到了最终结果（比如编译失败），不再执行 run
     */
    bool finished = false;
};

/**
 * @brief 表示一种执行用户代码的方式
 * 后端在构造后不再修改，可以被多个线程同时调用 execute。
 * 一次执行的状态全部保存在 execution_context 中。
 */
struct execution_backend {
    virtual ~execution_backend();

    /**
     * @brief 该后端负责执行的语言
     */
    virtual std::string language() const = 0;

    /**
     * @brief 该语言展示给用户的名字，比如 C++
     */
    virtual std::string label() const = 0;

    /**
     * @brief 检查后端能否执行这个请求
     * 同一个语言可以注册多个后端，registry 选择第一个接受请求的后端
     */
    virtual bool accepts(const execution_request &request) const;

    /**
     * @brief 准备执行环境，比如创建 workspace、写入源代码、编译
     * 若已经能够确定结果，设置 ctx.finished
     */
    virtual void prepare(execution_context &ctx) const = 0;

    /**
     * @brief 运行程序，将输出写入 ctx.result
     */
    virtual void run(execution_context &ctx) const = 0;

    /**
     * @brief 清理执行环境，无论之前的阶段是否抛出异常都会调用
     * 不能抛出异常
     */
    virtual void cleanup(execution_context &ctx) const;

    /**
     * @brief 按 prepare、run、cleanup 的顺序执行请求
     * 各阶段抛出的异常会被转换为 SYSTEM_ERROR 结果，输出会按照 OUTPUT_LIMIT 截断
     */
    execution_result execute(const execution_request &request) const;
};

typedef std::unique_ptr<execution_backend> execution_backend_uptr;

/**
 * @brief 将进程的运行结果写入 result
 * 超时为 TIME_LIMIT_EXCEEDED，无法启动为 BINARY_UNAVAILABLE，返回值非零为 RUNTIME_ERROR
 */
void apply_outcome(execution_result &result, const process_outcome &outcome);

/**
 * @brief 使用 ctx.variables 展开命令行模板
 * 比如 "{workspace}/app.out" 展开为 workspace 中的可执行文件路径
 */
std::string expand_template(const std::string &tmpl, const execution_context &ctx);

std::vector<std::string> expand_arguments(const std::vector<std::string> &templates, const execution_context &ctx);

struct language_info {
    std::string id;
    std::string label;
};

/**
 * @brief 语言到执行后端列表的映射
 * 构造完成后只读，可以在多个线程之间共享
 */
class backend_registry {
public:
    /**
     * @brief 注册一个后端，追加到该语言的后端列表末尾
     */
    backend_registry &add(execution_backend_uptr backend);

    bool supports(const std::string &language) const;

    /**
     * @brief 找到第一个接受请求的后端
     * @return 没有后端接受请求时返回 nullptr
     */
    const execution_backend *select(const execution_request &request) const;

    /**
     * @brief 按照注册顺序列出所有支持的语言
     */
    std::vector<language_info> languages() const;

private:
    std::vector<std::string> order;
    std::map<std::string, std::vector<execution_backend_uptr>> backends;
};

}  // namespace sandbox
