#include <chrono>
#include <filesystem>
#include "backend/compiled.hpp"
#include "backend/languages.hpp"
#include "config.hpp"
#include "gtest/gtest.h"

using namespace std;
using namespace sandbox;
namespace fs = std::filesystem;

class CompiledBackendTest : public ::testing::Test {
protected:
    static void SetUpTestCase() {
        register_default_backends(registry);
    }

    execution_result execute(const string &language, const string &source, const string &stdin_text = "") {
        execution_request request;
        request.language = language;
        request.source = source;
        request.stdin_text = stdin_text;
        const execution_backend *backend = registry.select(request);
        EXPECT_NE(backend, nullptr);
        return backend->execute(request);
    }

    static backend_registry registry;
};

backend_registry CompiledBackendTest::registry;

static size_t count_workspaces(const string &prefix) {
    size_t count = 0;
    for (auto &entry : fs::directory_iterator(RUN_DIR))
        if (entry.path().filename().string().rfind(prefix + "-", 0) == 0) ++count;
    return count;
}

TEST_F(CompiledBackendTest, CompilesAndRunsC) {
    execution_result result = execute("c", R"(#include <stdio.h>
int main(void) {
    int a, b;
    if (scanf("%d %d", &a, &b) != 2) return 1;
    printf("%d\n", a + b);
    return 0;
}
)", "19 23");
    EXPECT_EQ(result.status, status::ACCEPTED);
    EXPECT_EQ(result.stdout_text, "42\n");
}

TEST_F(CompiledBackendTest, CompilesAndRunsCpp) {
    execution_result result = execute("cpp", R"(#include <iostream>
#include <vector>
#include <algorithm>
int main() {
    std::vector<int> v{3, 1, 2};
    std::sort(v.begin(), v.end());
    for (auto x : v) std::cout << x << ' ';
    std::cout << std::endl;
}
)");
    EXPECT_EQ(result.status, status::ACCEPTED);
    EXPECT_EQ(result.stdout_text, "1 2 3 \n");
}

TEST_F(CompiledBackendTest, CompilationErrorSkipsRun) {
    execution_result result = execute("cpp", "int main() { return undefined_symbol; }");
    EXPECT_EQ(result.status, status::COMPILATION_ERROR);
    EXPECT_NE(result.stderr_text.find("undefined_symbol"), string::npos);
    EXPECT_EQ(result.stdout_text, "");

    result = execute("c", "int main( { }");
    EXPECT_EQ(result.status, status::COMPILATION_ERROR);
    EXPECT_FALSE(result.stderr_text.empty());
}

TEST_F(CompiledBackendTest, RuntimeErrorExitCode) {
    execution_result result = execute("cpp", "#include <cstdlib>\nint main() { std::exit(7); }");
    EXPECT_EQ(result.status, status::RUNTIME_ERROR);
}

TEST_F(CompiledBackendTest, RunTimesOut) {
    execution_result result = execute("c", "int main(void) { for (;;) {} }");
    EXPECT_EQ(result.status, status::TIME_LIMIT_EXCEEDED);
    EXPECT_NE(result.stderr_text.find("Execution timed out."), string::npos);
}

TEST(CompiledBackendFallbackTest, FallsBackToSecondCompiler) {
    compiled_language config{"shell", "Shell", "main.sh", "main.sh",
                             {{"sandbox-missing-compiler", {"{source}"}}, {"true", {}}},
                             2000ms,
                             {"sh", {"{output}"}},
                             2000ms};
    compiled_backend backend(config);
    execution_request request{"shell", "echo compiled by fallback", ""};
    execution_result result = backend.execute(request);
    EXPECT_EQ(result.status, status::ACCEPTED);
    EXPECT_EQ(result.stdout_text, "compiled by fallback\n");
}

TEST(CompiledBackendFallbackTest, KeepsDiagnosticsOfFirstCompiler) {
    compiled_language config{"shell", "Shell", "main.sh", "main.sh",
                             {{"sh", {"-c", "echo first compiler failed >&2; exit 1"}}, {"sandbox-missing-compiler", {}}},
                             2000ms,
                             {"sh", {"{output}"}},
                             2000ms};
    compiled_backend backend(config);
    execution_request request{"shell", "echo never", ""};
    execution_result result = backend.execute(request);
    EXPECT_EQ(result.status, status::COMPILATION_ERROR);
    EXPECT_EQ(result.stderr_text, "first compiler failed\n");
}

TEST(CompiledBackendFallbackTest, AllCompilersMissing) {
    size_t before = count_workspaces("shell");
    compiled_language config{"shell", "Shell", "main.sh", "main.sh",
                             {{"sandbox-missing-compiler", {}}},
                             2000ms,
                             {"sh", {"{output}"}},
                             2000ms};
    compiled_backend backend(config);
    execution_request request{"shell", "echo never", ""};
    execution_result result = backend.execute(request);
    EXPECT_EQ(result.status, status::BINARY_UNAVAILABLE);
    EXPECT_EQ(result.stderr_text, "sandbox-missing-compiler is not installed or not available in PATH on this server.");
    EXPECT_EQ(count_workspaces("shell"), before);
}
