#include "backend/interpreter.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <boost/algorithm/string/join.hpp>
#include <boost/algorithm/string/predicate.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <boost/regex.hpp>
#include <nlohmann/json.hpp>
#include <cstring>
#include "common/io_utils.hpp"
#include "common/utils.hpp"

namespace sandbox {
using namespace std;
using namespace nlohmann;

const char *const PLOT_SENTINEL = "__SANDBOX_PLOT__:";

static const boost::regex plotting_regex(R"(\bmatplotlib\b|\bpyplot\b|\bplt\.)");

bool uses_plotting(const string &source) {
    return boost::regex_search(source, plotting_regex);
}

interpreter_backend::interpreter_backend(interpreted_language config)
    : config(move(config)) {}

string interpreter_backend::language() const {
    return config.language;
}

string interpreter_backend::label() const {
    return config.label;
}

void interpreter_backend::prepare(execution_context &ctx) const {
    ctx.ws = make_unique<workspace>(config.language);
    filesystem::path source_path = ctx.ws->file(config.source_file);
    ctx.variables["workspace"] = ctx.ws->path().string();
    ctx.variables["source"] = source_path.string();
    write_file_content(source_path, wrap_source(ctx));
}

void interpreter_backend::run(execution_context &ctx) const {
    process_outcome outcome = run_process(
        config.interpreter.command,
        expand_arguments(config.interpreter.arguments, ctx),
        {ctx.ws->path(), ctx.request.stdin_text, config.timeout, environment(ctx)});
    collect(ctx, outcome);
}

string interpreter_backend::wrap_source(const execution_context &ctx) const {
    return ctx.request.source;
}

map<string, string> interpreter_backend::environment(const execution_context &) const {
    return {};
}

void interpreter_backend::collect(execution_context &ctx, const process_outcome &outcome) const {
    apply_outcome(ctx.result, outcome);
}

python_interpreter_backend::python_interpreter_backend(chrono::milliseconds timeout)
    : interpreter_backend({"python", "Python", "script.py", {"python3", {"-I", "{source}"}}, timeout}) {}

string python_interpreter_backend::wrap_source(const execution_context &ctx) const {
    if (!uses_plotting(ctx.request.source)) return ctx.request.source;

    // 路径用 JSON 字符串转义，JSON 字符串同时也是合法的 python 字符串字面量
    string plot_path = json(ctx.ws->file("plot.png").string()).dump();
    return fmt::format(R"({source}

# Capture the current matplotlib figure
try:
    import matplotlib.pyplot as __sandbox_plt
    if __sandbox_plt.get_fignums():
        __sandbox_plt.savefig({path}, dpi=140, bbox_inches='tight')
        print({sentinel} + {path})
except Exception:
    pass
)",
                       fmt::arg("source", ctx.request.source),
                       fmt::arg("path", plot_path),
                       fmt::arg("sentinel", json(PLOT_SENTINEL).dump()));
}

map<string, string> python_interpreter_backend::environment(const execution_context &ctx) const {
    if (!uses_plotting(ctx.request.source)) return {};
    return {{"MPLBACKEND", "Agg"}};
}

void python_interpreter_backend::collect(execution_context &ctx, const process_outcome &outcome) const {
    apply_outcome(ctx.result, outcome);
    if (!uses_plotting(ctx.request.source)) return;

    // 用户代码也可以打印标记行，只接受指向本次 workspace 中 plot.png 的标记
    string expected_path = ctx.ws->file("plot.png").string();
    vector<string> visible_lines;
    string plot_path;
    for (auto &line : split_lines(ctx.result.stdout_text)) {
        if (!boost::algorithm::starts_with(line, PLOT_SENTINEL)) {
            visible_lines.push_back(line);
            continue;
        }
        string path = boost::algorithm::trim_copy(line.substr(strlen(PLOT_SENTINEL)));
        if (path == expected_path)
            plot_path = path;
        else
            LOG(WARNING) << "Ignoring plot sentinel outside of the workspace: " << path;
    }
    string stdout_text = boost::algorithm::join(visible_lines, "\n");
    boost::algorithm::trim_right_if(stdout_text, boost::algorithm::is_any_of("\n"));
    ctx.result.stdout_text = stdout_text;

    if (plot_path.empty() || !filesystem::is_regular_file(plot_path)) return;
    try {
        ctx.result.plot_image = "data:image/png;base64," + encode_base64(read_file_content(plot_path));
    } catch (system_error &ex) {
        LOG(WARNING) << "Unable to read captured plot " << plot_path << ": " << ex.what();
    }
}

static const char *JAVASCRIPT_PRELUDE = R"(globalThis.input = globalThis.prompt = (() => {
  let lines = [''];
  try { lines = require('fs').readFileSync(0, 'utf8').split(/\r?\n/); } catch (e) {}
  let index = 0;
  return () => (index < lines.length ? lines[index++] : '');
})();
)";

javascript_backend::javascript_backend(chrono::milliseconds timeout)
    : interpreter_backend({"javascript", "JavaScript", "main.js", {"node", {"--disallow-code-generation-from-strings", "{source}"}}, timeout}) {}

string javascript_backend::wrap_source(const execution_context &ctx) const {
    return JAVASCRIPT_PRELUDE + ctx.request.source;
}

}  // namespace sandbox
