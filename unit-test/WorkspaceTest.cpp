#include <filesystem>
#include <stdexcept>
#include "common/io_utils.hpp"
#include "gtest/gtest.h"
#include "process/workspace.hpp"

using namespace std;
using namespace sandbox;
namespace fs = std::filesystem;

TEST(WorkspaceTest, CreatesAndRemovesDirectory) {
    fs::path dir;
    {
        workspace ws("cpp", fs::temp_directory_path());
        dir = ws.path();
        EXPECT_TRUE(fs::is_directory(dir));
        EXPECT_EQ(dir.parent_path(), fs::temp_directory_path());
        EXPECT_EQ(dir.filename().string().rfind("cpp-", 0), 0u);

        write_file_content(ws.file("main.cpp"), "int main() {}");
        fs::create_directories(dir / "nested" / "deeper");
        write_file_content(dir / "nested" / "deeper" / "a.txt", "a");
    }
    EXPECT_FALSE(fs::exists(dir));
}

TEST(WorkspaceTest, NamesAreUnique) {
    workspace a("python");
    workspace b("python");
    EXPECT_NE(a.path(), b.path());
}

TEST(WorkspaceTest, RejectsUnsafeFileNames) {
    workspace ws("java");
    EXPECT_EQ(ws.file("Main.java"), ws.path() / "Main.java");
    EXPECT_THROW(ws.file("../Main.java"), runtime_error);
    EXPECT_THROW(ws.file(".."), runtime_error);
    EXPECT_THROW(ws.file(""), runtime_error);
}

TEST(WorkspaceTest, RemovedWhenExceptionThrown) {
    fs::path dir;
    try {
        workspace ws("go");
        dir = ws.path();
        throw runtime_error("compile failed");
    } catch (runtime_error &) {
    }
    EXPECT_FALSE(dir.empty());
    EXPECT_FALSE(fs::exists(dir));
}
