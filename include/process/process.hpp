#pragma once

#include <chrono>
#include <filesystem>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

/**
 * 这个头文件包含运行外部程序的函数
 * 所有需要子进程的后端（解释器、编译器、编译产物）都通过 run_process 来运行，
 * run_process 负责输入输出的转发、超时强制结束子进程以及输出长度的限制。
 */
namespace sandbox {

struct process_options {
    /**
     * @brief 子进程的工作目录，为空时继承当前进程的工作目录
     */
    std::filesystem::path work_dir;

    /**
     * @brief 写入子进程标准输入的内容，写完后关闭标准输入
     */
    std::string stdin_text;

    /**
     * @brief 时钟时间限制，超时后整个进程组会被 SIGKILL
     */
    std::chrono::milliseconds timeout{3000};

    /**
     * @brief 额外的环境变量，会覆盖当前进程中的同名变量
     */
    std::map<std::string, std::string> env;
};

struct process_outcome {
    /**
     * @brief 子进程的返回值
     * 子进程因为信号结束时为 128 + 信号值；超时或者无法启动时为空
     */
    std::optional<int> exit_code;

    std::string stdout_text;
    std::string stderr_text;

    /**
     * @brief 子进程是否因为超时被强制结束
     * exit_code 为空且 timed_out 为假，表示程序无法启动（比如没有安装）
     */
    bool timed_out = false;

    bool launch_failed() const;
};

/**
 * @brief 运行外部程序并等待其结束
 * @param command 程序名，会在 PATH 中查找
 * @param args 程序参数（不包含 argv[0]）
 * @param options 工作目录、标准输入、时间限制和环境变量
 * @return 子进程的结果，stdout_text 和 stderr_text 已经按 OUTPUT_LIMIT 截断
 * @throw std::system_error 创建管道或者 fork 失败
 */
process_outcome run_process(const std::string &command, const std::vector<std::string> &args, const process_options &options);

/**
 * @brief fork 前后的回调，用于维护进程内的状态（比如嵌入式解释器的锁）
 * 为空的回调不会被调用
 */
struct fork_hooks {
    /**
     * @brief fork 之前在父进程中调用
     */
    std::function<void()> prepare;

    /**
     * @brief fork 之后（包括 fork 失败时）在父进程中调用
     */
    std::function<void()> parent;

    /**
     * @brief fork 之后在子进程中调用，早于 child_main
     */
    std::function<void()> child;
};

/**
 * @brief 在 fork 出的子进程中直接调用 child_main，不执行 exec，然后像 run_process 一样等待子进程结束
 * 子进程的标准输入输出与 run_process 相同，child_main 直接写 STDOUT_FILENO 和 STDERR_FILENO 即可。
 * 子进程中会设置 CPU 时间和写文件大小的资源限制，超时后整个进程组会被 SIGKILL，
 * 因此子进程无论在做什么（包括捕获异常、长时间的 C 函数调用）都一定会被结束。
 * @param name 子进程的名字，仅用于日志
 * @param child_main 子进程的入口，返回值作为子进程的返回值
 * @return 子进程的结果，exit_code 总是有值，除非超时
 * @throw std::system_error 创建管道或者 fork 失败
 */
process_outcome run_forked(const std::string &name, const std::function<int()> &child_main, const process_options &options, const fork_hooks &hooks = {});

}  // namespace sandbox
