#pragma once

#include <chrono>
#include <string>
#include "backend/backend.hpp"

namespace sandbox {

/**
 * @brief 在嵌入式 CPython 解释器中直接执行 python 代码
 *
 * 每次执行都在 fork 出的子进程中进行，使用新的全局变量字典，其中 __builtins__ 只包含白名单中的内置函数，
 * eval、exec、compile、open 等函数不可用；import 只能导入少数几个纯计算的标准库模块，
 * 得到的是只包含公开属性的模块代理。input() 按行读取请求中的标准输入。
 *
 * 子进程超时后会被 SIGKILL，用户代码对模块的修改也随子进程一起消失，不会影响之后的请求。
 *
 * 这个后端只接受评测代码（execution_request::grading），自由运行的 python 代码由 python_interpreter_backend 执行。
 *
 * 调用前必须已经构造了 python_runtime。
 */
struct embedded_python_backend : execution_backend {
    explicit embedded_python_backend(std::chrono::milliseconds timeout);

    std::string language() const override;
    std::string label() const override;
    bool accepts(const execution_request &request) const override;
    void prepare(execution_context &ctx) const override;
    void run(execution_context &ctx) const override;

private:
    std::chrono::milliseconds timeout;
};

}  // namespace sandbox
