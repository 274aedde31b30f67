#pragma once

#include "backend/backend.hpp"

namespace sandbox {

/**
 * @brief 注册所有内置的语言及其执行后端
 *
 * | 语言       | 后端                                   | 时间限制                  |
 * |------------|----------------------------------------|---------------------------|
 * | python     | 嵌入式解释器，使用 matplotlib 时为 python3 -I | 2000ms / 3000ms      |
 * | javascript | node                                   | 3000ms                    |
 * | c, cpp     | gcc, g++                               | 编译 5000ms，运行 2500ms  |
 * | java       | javac, java                            | 编译 6000ms，运行 3000ms  |
 * | csharp     | mcs 或 csc, mono                       | 编译 6000ms，运行 4000ms  |
 * | go         | go run                                 | 5000ms                    |
 * | ruby, php  | ruby, php                              | 4000ms                    |
 * | sql        | 嵌入式 SQLite                          | 4500ms                    |
 */
void register_default_backends(backend_registry &registry);

}  // namespace sandbox
