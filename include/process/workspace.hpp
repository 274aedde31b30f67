#pragma once

#include <filesystem>
#include <string>

namespace sandbox {

/**
 * @brief 一次执行独占的临时工作目录
 * 构造时在 RUN_DIR 下创建 `<prefix>-<uuid>` 文件夹，析构时递归删除。
 * 删除失败只记录日志，不会抛出异常。
 */
struct workspace {
    /**
     * @param prefix 文件夹名前缀，一般为语言名
     * @param root workspace 的父目录，默认为 RUN_DIR
     * @throw internal_error 无法创建文件夹
     */
    explicit workspace(const std::string &prefix);
    workspace(const std::string &prefix, const std::filesystem::path &root);
    ~workspace();

    workspace(const workspace &) = delete;
    workspace &operator=(const workspace &) = delete;

    const std::filesystem::path &path() const;

    /**
     * @brief 计算 workspace 中文件的路径
     * @param filename 文件名，不能包含目录分隔符
     */
    std::filesystem::path file(const std::string &filename) const;

private:
    std::filesystem::path dir;
};

}  // namespace sandbox
