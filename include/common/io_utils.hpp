#pragma once

#include <filesystem>
#include <string>

namespace sandbox {

/**
 * @brief 读取文件的全部内容
 * @param path 文件路径
 * @return 文件的内容(没有指定编码)
 */
std::string read_file_content(const std::filesystem::path &path);

/**
 * @brief 读取文件的全部内容
 * @param path 文件路径
 * @param def 若文件不存在，返回 def
 * @return 文件的内容(没有指定编码)
 */
std::string read_file_content(std::filesystem::path const &path, const std::string &def);

/**
 * @brief 将 content 写入文件，文件已存在时覆盖
 * @throw std::system_error 文件无法打开或写入失败
 */
void write_file_content(const std::filesystem::path &path, const std::string &content);

/**
 * @brief 断言 filename 是 workspace 内的普通文件名
 * 文件名可能来自用户代码（比如 Java 的 public class 名），不能包含目录分隔符，
 * 否则可能写到 workspace 之外。
 * @param filename 被检查的文件名
 * @return filename 本身
 */
std::string assert_safe_path(const std::string &filename);

/**
 * @brief 使用标准 base64 字母表编码二进制数据（带 = 填充）
 */
std::string encode_base64(const std::string &data);

}  // namespace sandbox
