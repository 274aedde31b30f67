#pragma once

#include <cstdlib>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>
#include "common/io_utils.hpp"
#include "common/utils.hpp"
#include "gtest/gtest.h"
#include "process/workspace.hpp"

namespace sandbox::test {

/**
 * @brief 在 PATH 最前面放置假的命令行工具（shell 脚本）的测试
 * 每个测试使用独立的临时文件夹，结束后恢复 PATH 并删除文件夹
 */
class fake_tools_test : public ::testing::Test {
protected:
    void SetUp() override {
        bin = std::make_unique<workspace>("fake-tools", std::filesystem::temp_directory_path());
        const char *path = getenv("PATH");
        saved_path = path ? path : "";
        setenv("PATH", (bin->path().string() + ":" + saved_path).c_str(), 1);
    }

    void TearDown() override {
        setenv("PATH", saved_path.c_str(), 1);
        bin.reset();
    }

    /**
     * @brief 安装一个假的工具
     * @param body 脚本内容，不需要 #!/bin/sh
     */
    void install(const std::string &name, const std::string &body) {
        std::filesystem::path file = bin->file(name);
        write_file_content(file, "#!/bin/sh\n" + body);
        std::filesystem::permissions(file, std::filesystem::perms::owner_all, std::filesystem::perm_options::add);
    }

    /**
     * @brief 假工具记录调用的文件，脚本中用 echo ... >> 追加
     */
    std::string call_log() const {
        return bin->file("calls.log").string();
    }

    std::vector<std::string> calls() const {
        std::vector<std::string> lines = split_lines(read_file_content(call_log(), ""));
        if (!lines.empty() && lines.back().empty()) lines.pop_back();
        return lines;
    }

    std::unique_ptr<workspace> bin;
    std::string saved_path;
};

}  // namespace sandbox::test
