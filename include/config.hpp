#pragma once

#include <cstddef>
#include <filesystem>

namespace sandbox {

/**
 * @brief 每次执行的临时工作目录（workspace）的根目录
 * 每次执行都会在这里创建一个随机命名的子文件夹，执行结束后无论成功、失败还是超时都会删除。
 * @defaultValue 系统临时目录（std::filesystem::temp_directory_path()）
 *
 * RUN_DIR
 * ├── cpp-0f8fad5b-d9cb-469f-a165-70867728950e // 一次执行的 workspace
 * │   ├── main.cpp // 用户代码
 * │   └── app.out // 编译产物
 * ├── python-7c9e6679-7425-40de-944b-e07fc1f90ae7
 * │   ├── script.py
 * │   └── plot.png // 捕获的 matplotlib 图像
 * └── ...
 */
extern std::filesystem::path RUN_DIR;

/**
 * @brief stdout、stderr 最多保留的字符数
 * 超出部分会被截断，并追加 OUTPUT_TRUNCATED_SUFFIX
 */
extern std::size_t OUTPUT_LIMIT;

/**
 * @brief 用户源代码最多允许的字节数
 * 在安全检查之前判断，超出时直接拒绝执行
 * @defaultValue 20000
 */
extern std::size_t SOURCE_LIMIT;

/**
 * @brief 截断输出时追加的提示
 */
extern const char *const OUTPUT_TRUNCATED_SUFFIX;

/**
 * @brief 是否开启 DEBUG 模式
 * 开启后会在日志中输出调用的外部命令行以及生成的评测代码。
 */
extern bool DEBUG;

}  // namespace sandbox
