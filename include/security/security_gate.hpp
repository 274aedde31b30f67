#pragma once

#include <boost/regex.hpp>
#include <map>
#include <string>
#include <vector>

namespace sandbox {

/**
 * @brief 拒绝执行时返回给用户的原因
 * 具体命中的规则只写入日志，不返回给用户
 */
extern const char *const SECURITY_REJECTION_REASON;

/**
 * @brief 源代码超过 SOURCE_LIMIT 时返回给用户的原因
 */
extern const char *const SOURCE_TOO_LARGE_REASON;

/**
 * @brief 一条黑名单规则
 */
struct security_rule {
    /**
     * @brief 规则名，仅用于日志
     */
    std::string label;

    /**
     * @brief Perl 语法的正则表达式
     * boost::regex 的匹配不使用递归，匹配过于复杂时抛出异常而不是栈溢出
     */
    boost::regex pattern;
};

/**
 * @brief 语言 -> 按顺序匹配的规则列表
 */
typedef std::map<std::string, std::vector<security_rule>> security_rules;

struct validation_result {
    bool valid;

    /**
     * @brief valid 为 false 时，拒绝的原因
     */
    std::string reason;
};

/**
 * @brief 在执行用户代码之前，按语言对源代码做黑名单扫描
 * 这不是隔离机制，只能挡住最常见的危险调用（创建进程、修改文件、动态生成代码、网络访问等）。
 * 规则表在构造后不再修改，可以在多个线程之间共享。
 */
class security_gate {
public:
    explicit security_gate(security_rules rules);

    /**
     * @brief 检查源代码是否命中了该语言的任一规则
     * 超过 SOURCE_LIMIT 的源代码总是被拒绝，匹配过于复杂的源代码也会被拒绝；
     * 没有规则表的语言总是通过检查
     * @param language 语言名，比如 python
     * @param source 用户源代码
     */
    validation_result validate(const std::string &language, const std::string &source) const;

private:
    const security_rules rules;
};

/**
 * @brief 内置的规则表，覆盖所有支持的语言
 */
security_rules default_security_rules();

}  // namespace sandbox
