#pragma once

namespace sandbox {

/**
 * @brief 表示一次执行或者一次评测的结果分类
 * 所有的错误最终都会转换成这里的某个值返回给调用方，不会以异常的形式逃逸出沙箱。
 */
enum class status {
    /**
     * @brief 程序正常运行结束（退出码为 0），或者评测通过
     */
    ACCEPTED = 0,

    /**
     * @brief 评测未通过，某个测试点的输出和期望值不一致
     */
    WRONG_ANSWER = 1,

    /**
     * @brief 用户代码匹配了安全检查的黑名单，代码没有被执行
     */
    SECURITY_REJECTED = 2,

    /**
     * @brief 服务器上没有安装需要的编译器或解释器
     */
    BINARY_UNAVAILABLE = 3,

    /**
     * @brief 编译器返回了非零值，stderr 中保存编译器的输出
     */
    COMPILATION_ERROR = 4,

    /**
     * @brief 程序返回了非零值，或者抛出了未捕获的异常
     * 对于评测，表示某个测试点调用用户函数时抛出了异常
     */
    RUNTIME_ERROR = 5,

    /**
     * @brief 程序运行超出了时钟时间限制，已被强制结束
     */
    TIME_LIMIT_EXCEEDED = 6,

    /**
     * @brief 评测代码没有输出可以解析的评测结果
     */
    EVALUATOR_PROTOCOL_ERROR = 7,

    /**
     * @brief 请求的语言不受支持（执行或评测）
     */
    UNSUPPORTED_LANGUAGE = 8,

    /**
     * @brief 请求评测的题目不存在
     */
    CHALLENGE_NOT_FOUND = 9,

    /**
     * @brief 内部错误，沙箱本身出错
     * 比如无法创建 workspace，或者嵌入式解释器出错
     */
    SYSTEM_ERROR = 10
};

const char *get_display_message(status);

}  // namespace sandbox
