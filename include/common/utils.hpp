#pragma once

#include <chrono>
#include <string>
#include <vector>

namespace sandbox {

/**
 * @brief 截断过长的输出
 * 长度不超过 limit 时原样返回，否则保留前 limit 个字节（不会截断在 UTF-8 多字节字符的中间），
 * 并追加 OUTPUT_TRUNCATED_SUFFIX。
 * @param text 要截断的输出
 * @param limit 最多保留的长度，默认为 OUTPUT_LIMIT
 */
std::string clip_output(const std::string &text);
std::string clip_output(const std::string &text, std::size_t limit);

/**
 * @brief 按行切分文本，支持 \n 和 \r\n 换行
 * 与 JavaScript 的 split(/\r?\n/) 行为一致：末尾换行会产生一个空行。
 */
std::vector<std::string> split_lines(const std::string &text);

struct elapsed_time {

    elapsed_time();

    template <typename DurationT>
    DurationT duration() const {
        return std::chrono::duration_cast<DurationT>(std::chrono::steady_clock::now() - start);
    }

private:
    std::chrono::steady_clock::time_point start;
};

}  // namespace sandbox
