#include "backend/compiled.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <boost/regex.hpp>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"

namespace sandbox {
using namespace std;

compiled_backend::compiled_backend(compiled_language config)
    : config(move(config)) {}

string compiled_backend::language() const {
    return config.language;
}

string compiled_backend::label() const {
    return config.label;
}

string compiled_backend::source_filename(execution_context &) const {
    return config.source_file;
}

void compiled_backend::prepare(execution_context &ctx) const {
    ctx.ws = make_unique<workspace>(config.language);
    ctx.variables["workspace"] = ctx.ws->path().string();
    if (!config.output_file.empty())
        ctx.variables["output"] = ctx.ws->file(config.output_file).string();

    filesystem::path source_path = ctx.ws->file(source_filename(ctx));
    ctx.variables["source"] = source_path.string();
    write_file_content(source_path, ctx.request.source);

    process_outcome outcome = compile(ctx);
    if (outcome.exit_code == 0) return;

    ctx.finished = true;
    ctx.result.stdout_text = outcome.stdout_text;
    ctx.result.stderr_text = outcome.stderr_text;
    if (outcome.stderr_text.empty())
        ctx.result.stderr_text = fmt::format("{} is unavailable or compilation failed.", ctx.variables["compiler"]);

    if (outcome.timed_out)
        ctx.result.status = status::TIME_LIMIT_EXCEEDED;
    else if (outcome.launch_failed())
        ctx.result.status = status::BINARY_UNAVAILABLE;
    else
        ctx.result.status = status::COMPILATION_ERROR;
}

process_outcome compiled_backend::compile(execution_context &ctx) const {
    optional<process_outcome> failure;
    for (auto &compiler : config.compilers) {
        process_outcome outcome = run_process(compiler.command,
                                              expand_arguments(compiler.arguments, ctx),
                                              {ctx.ws->path(), "", config.compile_timeout, {}});
        if (outcome.exit_code == 0) {
            ctx.variables["compiler"] = compiler.command;
            return outcome;
        }

        if (failure && !failure->launch_failed() && outcome.launch_failed()) continue;
        failure = move(outcome);
        ctx.variables["compiler"] = compiler.command;
    }
    if (!failure) throw internal_error("No compiler configured for " + config.language);
    return *failure;
}

void compiled_backend::run(execution_context &ctx) const {
    process_outcome outcome = run_process(
        expand_template(config.runner.command, ctx),
        expand_arguments(config.runner.arguments, ctx),
        {ctx.ws->path(), ctx.request.stdin_text, config.run_timeout, {}});
    apply_outcome(ctx.result, outcome);
}

static const boost::regex public_class_regex(R"(\bpublic\s+(?:final\s+|abstract\s+)?class\s+([A-Za-z_][A-Za-z0-9_]*)\b)");
static const boost::regex any_class_regex(R"(\bclass\s+([A-Za-z_][A-Za-z0-9_]*)\b)");

string resolve_java_class_name(const string &source) {
    boost::smatch match;
    if (boost::regex_search(source, match, public_class_regex)) return match[1].str();
    if (boost::regex_search(source, match, any_class_regex)) return match[1].str();
    return "Main";
}

// clang-format off
static const vector<boost::regex> class_name_hints = {
    boost::regex(R"(should be declared in a file named\s+([A-Za-z_][A-Za-z0-9_]*)\.java)", boost::regex::perl | boost::regex::icase),
    boost::regex(R"(file named\s+([A-Za-z_][A-Za-z0-9_]*)\.java)", boost::regex::perl | boost::regex::icase),
    boost::regex(R"(class\s+([A-Za-z_][A-Za-z0-9_]*)\s+is public)", boost::regex::perl | boost::regex::icase)
};
// clang-format on

optional<string> java_class_name_hint(const string &diagnostics) {
    boost::smatch match;
    for (auto &hint : class_name_hints)
        if (boost::regex_search(diagnostics, match, hint))
            return match[1].str();
    return nullopt;
}

java_backend::java_backend(chrono::milliseconds compile_timeout, chrono::milliseconds run_timeout)
    : compiled_backend({"java", "Java", "Main.java", "", {{"javac", {"{source}"}}}, compile_timeout, {"java", {"-cp", "{workspace}", "{class}"}}, run_timeout}) {}

string java_backend::source_filename(execution_context &ctx) const {
    string class_name = resolve_java_class_name(ctx.request.source);
    ctx.variables["class"] = class_name;
    return class_name + ".java";
}

process_outcome java_backend::compile(execution_context &ctx) const {
    process_outcome outcome = compiled_backend::compile(ctx);
    if (outcome.exit_code == 0 || outcome.launch_failed() || outcome.timed_out) return outcome;

    auto hint = java_class_name_hint(outcome.stderr_text);
    if (!hint || *hint == ctx.variables["class"]) return outcome;

    LOG(INFO) << "javac expects class " << *hint << " instead of " << ctx.variables["class"] << ", retrying";
    filesystem::path source_path = ctx.ws->file(*hint + ".java");
    ctx.variables["class"] = *hint;
    ctx.variables["source"] = source_path.string();
    write_file_content(source_path, ctx.request.source);
    return compiled_backend::compile(ctx);
}

}  // namespace sandbox
