#include "config.hpp"
#include "gtest/gtest.h"
#include "security/security_gate.hpp"

using namespace std;
using namespace sandbox;

class SecurityGateTest : public ::testing::Test {
protected:
    SecurityGateTest() : gate(default_security_rules()) {}

    bool rejected(const string &language, const string &source) {
        validation_result result = gate.validate(language, source);
        if (!result.valid) EXPECT_EQ(result.reason, SECURITY_REJECTION_REASON);
        return !result.valid;
    }

    security_gate gate;
};

TEST_F(SecurityGateTest, PythonRules) {
    EXPECT_TRUE(rejected("python", "import os\nprint(os.getcwd())"));
    EXPECT_TRUE(rejected("python", "import subprocess"));
    EXPECT_TRUE(rejected("python", "from os import system"));
    EXPECT_TRUE(rejected("python", "open('/etc/passwd').read()"));
    EXPECT_TRUE(rejected("python", "eval('1+1')"));
    EXPECT_TRUE(rejected("python", "__import__('os')"));
    EXPECT_TRUE(rejected("python", "().__class__.__base__.__subclasses__()"));

    EXPECT_FALSE(rejected("python", "import math\nprint(math.sqrt(16))"));
    EXPECT_FALSE(rejected("python", "import osmosis_helper"));
    EXPECT_FALSE(rejected("python", "def reopen(x):\n    return x"));
}

TEST_F(SecurityGateTest, PythonInternalsRules) {
    EXPECT_TRUE(rejected("python", "import collections\ncollections._sys.modules"));
    EXPECT_TRUE(rejected("python", "json.codecs.sys.modules['os'].system('id')"));
    EXPECT_TRUE(rejected("python", "json . decoder . scanstring"));
    EXPECT_TRUE(rejected("python", "import functools\nfunctools.abc"));
    EXPECT_TRUE(rejected("python", "x = (1).__class__"));
    EXPECT_TRUE(rejected("python", "g = (i for i in [])\nprint(g.gi_frame.f_back.f_globals)"));
    EXPECT_TRUE(rejected("python", "__sandbox_run = None"));
    EXPECT_TRUE(rejected("python", "try:\n    1 / 0\nexcept Exception as e:\n    e.__traceback__.tb_frame"));

    EXPECT_FALSE(rejected("python", "class A(B):\n    def __init__(self):\n        super().__init__()\n        self.items = []"));
    EXPECT_FALSE(rejected("python", "print(json.loads('[1]'), math.pi)"));
    EXPECT_FALSE(rejected("python", "import re\nprint(re.sub('a', 'b', 'aa'))"));
    EXPECT_FALSE(rejected("python", "my_json.decoder = 1"));
}

TEST_F(SecurityGateTest, JavaScriptRules) {
    EXPECT_TRUE(rejected("javascript", "const fs = require('fs');"));
    EXPECT_TRUE(rejected("javascript", "process.exit(1)"));
    EXPECT_TRUE(rejected("javascript", "new Function('return 1')()"));
    EXPECT_TRUE(rejected("javascript", "import('fs')"));
    EXPECT_TRUE(rejected("javascript", "fetch('http://example.com')"));

    EXPECT_FALSE(rejected("javascript", "function solve(nums) { return nums.length; }"));
    EXPECT_FALSE(rejected("javascript", "const processed = [1, 2, 3];"));
}

TEST_F(SecurityGateTest, JavaScriptInternalsRules) {
    EXPECT_TRUE(rejected("javascript", "global.console"));
    EXPECT_TRUE(rejected("javascript", "module.constructor._load('fs')"));
    EXPECT_TRUE(rejected("javascript", "function f() { return arguments.callee; }"));
    EXPECT_TRUE(rejected("javascript", "function f() { return f.caller; }"));
    EXPECT_TRUE(rejected("javascript", "(() => 0).constructor('return this')()"));
    EXPECT_TRUE(rejected("javascript", "console._stdout.write('x')"));
    EXPECT_TRUE(rejected("javascript", "console['log'] = () => {}"));
    EXPECT_TRUE(rejected("javascript", "Object.getOwnPropertySymbols(console)"));
    EXPECT_TRUE(rejected("javascript", "__sandboxRun([])"));

    EXPECT_FALSE(rejected("javascript", "class Stack {\n  constructor() { this.items = []; }\n}"));
    EXPECT_FALSE(rejected("javascript", "const globals = 1; console.log(globals);"));
}

TEST_F(SecurityGateTest, CompiledLanguageRules) {
    EXPECT_TRUE(rejected("c", "#include <stdlib.h>\nint main() { system(\"ls\"); }"));
    EXPECT_TRUE(rejected("cpp", "int main() { fork(); }"));
    EXPECT_TRUE(rejected("cpp", "int main() { execvp(\"ls\", 0); }"));
    EXPECT_FALSE(rejected("cpp", "#include <iostream>\nint main() { std::cout << 1; }"));

    EXPECT_TRUE(rejected("java", "ProcessBuilder pb = new ProcessBuilder(\"ls\");"));
    EXPECT_TRUE(rejected("java", "Runtime.getRuntime().exec(\"ls\");"));
    EXPECT_FALSE(rejected("java", "public class Main { public static void main(String[] a) {} }"));

    EXPECT_TRUE(rejected("go", "import \"os/exec\""));
    EXPECT_TRUE(rejected("csharp", "System.Diagnostics.Process.Start(\"ls\");"));
}

TEST_F(SecurityGateTest, ScriptLanguageRules) {
    EXPECT_TRUE(rejected("ruby", "puts `ls`"));
    EXPECT_TRUE(rejected("ruby", "require 'socket'"));
    EXPECT_FALSE(rejected("ruby", "puts [1, 2, 3].sum"));

    EXPECT_TRUE(rejected("php", "<?php shell_exec('ls'); ?>"));
    EXPECT_FALSE(rejected("php", "<?php echo 1 + 2; ?>"));
}

TEST_F(SecurityGateTest, SqlRulesIgnoreCase) {
    EXPECT_TRUE(rejected("sql", "ATTACH DATABASE 'x.db' AS x;"));
    EXPECT_TRUE(rejected("sql", "attach database 'x.db' as x;"));
    EXPECT_TRUE(rejected("sql", "SELECT load_extension('evil');"));
    EXPECT_FALSE(rejected("sql", "SELECT 1;"));
}

TEST_F(SecurityGateTest, UnknownLanguagePasses) {
    EXPECT_FALSE(rejected("brainfuck", "import os"));
}

TEST_F(SecurityGateTest, RejectsOversizedSource) {
    for (string language : {"python", "sql", "brainfuck"}) {
        validation_result result = gate.validate(language, string(SOURCE_LIMIT + 1, 'a'));
        EXPECT_FALSE(result.valid) << language;
        EXPECT_EQ(result.reason, SOURCE_TOO_LARGE_REASON) << language;
    }
    EXPECT_TRUE(gate.validate("python", string(SOURCE_LIMIT, '#')).valid);
}

TEST_F(SecurityGateTest, LargeSourcesDoNotCrash) {
    size_t limit = SOURCE_LIMIT;
    SOURCE_LIMIT = 4 << 20;
    string filler(1 << 20, 'a');

    EXPECT_FALSE(rejected("ruby", "puts '" + filler + "'"));
    EXPECT_FALSE(rejected("ruby", "`" + filler));
    EXPECT_TRUE(rejected("ruby", "`" + filler + "`"));
    EXPECT_FALSE(rejected("sql", "SELECT '" + filler + "';"));
    EXPECT_TRUE(rejected("sql", "PRAGMA " + filler + " journal_mode = OFF;"));
    EXPECT_FALSE(rejected("python", "# " + filler + "\nprint(1)"));
    EXPECT_FALSE(rejected("javascript", "const s = '" + filler + "';"));

    string pragmas;
    while (pragmas.size() < (1u << 20)) pragmas += "PRAGMA x ";
    // 匹配可能超出复杂度限制，此时按不安全处理
    EXPECT_NO_THROW(rejected("sql", pragmas));

    SOURCE_LIMIT = limit;
}

TEST(SecurityGateCustomRulesTest, FirstMatchingRuleRejects) {
    security_rules rules;
    rules["python"] = {{"while True", boost::regex(R"(\bwhile\s+True\b)")}};
    security_gate gate(rules);
    EXPECT_FALSE(gate.validate("python", "while True:\n    pass").valid);
    EXPECT_TRUE(gate.validate("python", "import os").valid);
    EXPECT_TRUE(gate.validate("python", "").valid);
}
