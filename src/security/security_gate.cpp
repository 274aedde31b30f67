#include "security/security_gate.hpp"
#include <glog/logging.h>
#include <boost/exception/diagnostic_information.hpp>
#include <stdexcept>
#include "config.hpp"

namespace sandbox {
using namespace std;

const char *const SECURITY_REJECTION_REASON = "Code contains restricted operations for safety.";

const char *const SOURCE_TOO_LARGE_REASON = "Code length exceeds allowed limit.";

security_gate::security_gate(security_rules rules)
    : rules(move(rules)) {}

validation_result security_gate::validate(const string &language, const string &source) const {
    if (source.size() > SOURCE_LIMIT) {
        LOG(INFO) << "Rejected " << language << " code: " << source.size() << " bytes exceeds " << SOURCE_LIMIT;
        return {false, SOURCE_TOO_LARGE_REASON};
    }

    auto it = rules.find(language);
    if (it == rules.end()) return {true, ""};

    for (auto &rule : it->second) {
        try {
            if (boost::regex_search(source, rule.pattern)) {
                LOG(INFO) << "Rejected " << language << " code: matched rule [" << rule.label << "]";
                return {false, SECURITY_REJECTION_REASON};
            }
        } catch (runtime_error &ex) {
            // 匹配超出了 boost::regex 的复杂度限制，无法判断是否安全
            LOG(WARNING) << "Rejected " << language << " code: rule [" << rule.label << "] failed, "
                         << boost::diagnostic_information(ex);
            return {false, SECURITY_REJECTION_REASON};
        }
    }
    return {true, ""};
}

static security_rule rule(const string &label, const string &pattern, boost::regex::flag_type flags = boost::regex::perl) {
    return {label, boost::regex(pattern, flags)};
}

security_rules default_security_rules() {
    const boost::regex::flag_type icase = boost::regex::perl | boost::regex::icase;
    vector<security_rule> c_family = {
        rule("system()", R"(\bsystem\s*\()"),
        rule("fork()", R"(\bfork\s*\()"),
        rule("exec*()", R"(\bexec[a-z]*\s*\()"),
        rule("popen()", R"(\bpopen\s*\()"),
        rule("remove()", R"(\bremove\s*\()")};

    security_rules rules;
    rules["javascript"] = {
        rule("require()", R"(\brequire\s*\()"),
        rule("process", R"(\bprocess\b)"),
        rule("Function()", R"(\bFunction\s*\()"),
        rule("eval()", R"(\beval\s*\()"),
        rule("dynamic import()", R"(\bimport\s*\()"),
        rule("globalThis", R"(\bglobalThis\b)"),
        rule("XMLHttpRequest", R"(\bXMLHttpRequest\b)"),
        rule("fetch()", R"(\bfetch\s*\()"),
        rule("global", R"(\bglobal\b)"),
        rule("module", R"(\bmodule\b)"),
        rule("arguments", R"(\barguments\b)"),
        rule("caller/callee", R"(\.\s*caller\b|\bcallee\b)"),
        rule(".constructor", R"(\.\s*constructor\b)"),
        rule("console internals", R"(\bconsole\s*(?:\.\s*_|\[))"),
        rule("getOwnPropertySymbols", R"(\bgetOwnPropertySymbols\b)"),
        rule("sandbox internals", R"(__sandbox)")};
    rules["python"] = {
        rule("import os", R"(\bimport\s+os\b)"),
        rule("import sys", R"(\bimport\s+sys\b)"),
        rule("import subprocess", R"(\bimport\s+subprocess\b)"),
        rule("import socket", R"(\bimport\s+socket\b)"),
        rule("from os import", R"(\bfrom\s+os\s+import\b)"),
        rule("from subprocess import", R"(\bfrom\s+subprocess\s+import\b)"),
        rule("open()", R"(\bopen\s*\()"),
        rule("exec()", R"(\bexec\s*\()"),
        rule("eval()", R"(\beval\s*\()"),
        rule("__import__()", R"(\b__import__\s*\()"),
        // 受限的内置函数表可以通过这些属性绕过
        rule("__subclasses__", R"(__subclasses__)"),
        rule("__globals__", R"(__globals__)"),
        rule("__builtins__", R"(__builtins__)"),
        // 除了 super().__init__(...) 以外不允许访问下划线开头的属性
        rule("private attribute", R"(\.\s*_(?!_init__\s*\())"),
        rule("module internals",
             R"(\b(?:json|collections|functools|itertools|heapq|bisect|string|re|math)\s*\.\s*)"
             R"((?:codecs|decoder|encoder|scanner|abc|sys|os|enum|functools|copyreg|types|re|warnings)\b)"),
        rule("frame introspection",
             R"(\b(?:gi_frame|gi_code|gi_yieldfrom|cr_frame|cr_code|cr_await|ag_frame|ag_code|tb_frame|tb_next|)"
             R"(f_back|f_globals|f_locals|f_builtins|f_code)\b)"),
        rule("sandbox internals", R"(__sandbox)")};
    rules["c"] = c_family;
    rules["cpp"] = c_family;
    rules["java"] = {
        rule("Runtime.exec", R"(\bRuntime\.getRuntime\(\)\.exec\b)"),
        rule("ProcessBuilder", R"(\bProcessBuilder\b)"),
        rule("java.io.File", R"(\bjava\.io\.File\b)"),
        rule("java.nio.file", R"(\bjava\.nio\.file\b)"),
        rule("System.setProperty", R"(\bSystem\.setProperty\b)")};
    rules["go"] = {
        rule("os/exec", R"(\bos/exec\b)"),
        rule("exec.Command", R"(\bexec\.Command\b)"),
        rule("os.Remove", R"(\bos\.Remove\b)"),
        rule("os.RemoveAll", R"(\bos\.RemoveAll\b)"),
        rule("os.OpenFile", R"(\bos\.OpenFile\b)")};
    rules["ruby"] = {
        rule("require socket", R"(\brequire\s+['"]socket['"])"),
        rule("require open3", R"(\brequire\s+['"]open3['"])"),
        rule("backticks", R"(`[^`]*`)"),
        rule("system()", R"(\bsystem\s*\()"),
        rule("exec()", R"(\bexec\s*\()"),
        rule("IO.popen", R"(\bIO\.popen\b)"),
        rule("File mutation", R"(\bFile\.(?:delete|unlink|open)\b)")};
    rules["php"] = {
        rule("process execution", R"(\b(shell_exec|exec|system|passthru|proc_open|popen)\s*\()"),
        rule("curl_init()", R"(\bcurl_init\s*\()"),
        rule("fsockopen()", R"(\bfsockopen\s*\()"),
        rule("fopen()", R"(\bfopen\s*\()"),
        rule("unlink()", R"(\bunlink\s*\()")};
    rules["csharp"] = {
        rule("System.Diagnostics.Process", R"(\bSystem\.Diagnostics\.Process\b)"),
        rule("Process.Start", R"(\bProcess\.Start\b)"),
        rule("System.IO.File", R"(\bSystem\.IO\.File\b)"),
        rule("System.IO.Directory", R"(\bSystem\.IO\.Directory\b)"),
        rule("System.Net", R"(\bSystem\.Net\b)"),
        rule("DllImport", R"(\bDllImport\b)")};
    rules["sql"] = {
        rule("ATTACH DATABASE", R"(\bATTACH\s+DATABASE\b)", icase),
        rule("DETACH DATABASE", R"(\bDETACH\s+DATABASE\b)", icase),
        rule("LOAD_EXTENSION", R"(\bLOAD_EXTENSION\b)", icase),
        rule("PRAGMA journal_mode", R"(\bPRAGMA\s+.*\bjournal_mode\b)", icase)};
    return rules;
}

}  // namespace sandbox
