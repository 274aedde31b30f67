#include "backend/backend.hpp"
#include <fmt/args.h>
#include <fmt/core.h>
#include <glog/logging.h>
#include <boost/exception/diagnostic_information.hpp>
#include "common/defer.hpp"
#include "common/exceptions.hpp"
#include "common/utils.hpp"

namespace sandbox {
using namespace std;

execution_context::execution_context(const execution_request &request)
    : request(request) {}

execution_backend::~execution_backend() = default;

bool execution_backend::accepts(const execution_request &) const {
    return true;
}

void execution_backend::cleanup(execution_context &ctx) const {
    ctx.ws.reset();
}

execution_result execution_backend::execute(const execution_request &request) const {
    elapsed_time timer;
    execution_context ctx(request);
    try {
        defer { cleanup(ctx); };
        prepare(ctx);
        if (!ctx.finished) run(ctx);
    } catch (sandbox_exception &ex) {
        LOG(ERROR) << "Backend " << language() << " failed: " << ex;
        ctx.result.status = status::SYSTEM_ERROR;
        ctx.result.stderr_text = ex.what();
    } catch (exception &ex) {
        LOG(ERROR) << "Backend " << language() << " failed: " << boost::diagnostic_information(ex);
        ctx.result.status = status::SYSTEM_ERROR;
        ctx.result.stderr_text = ex.what();
    }
    ctx.result.duration_ms = timer.duration<chrono::milliseconds>().count();
    ctx.result.stdout_text = clip_output(ctx.result.stdout_text);
    ctx.result.stderr_text = clip_output(ctx.result.stderr_text);
    return move(ctx.result);
}

void apply_outcome(execution_result &result, const process_outcome &outcome) {
    result.stdout_text = outcome.stdout_text;
    result.stderr_text = outcome.stderr_text;
    if (outcome.timed_out)
        result.status = status::TIME_LIMIT_EXCEEDED;
    else if (!outcome.exit_code)
        result.status = status::BINARY_UNAVAILABLE;
    else if (*outcome.exit_code != 0)
        result.status = status::RUNTIME_ERROR;
    else
        result.status = status::ACCEPTED;
}

string expand_template(const string &tmpl, const execution_context &ctx) {
    fmt::dynamic_format_arg_store<fmt::format_context> store;
    for (auto &[name, value] : ctx.variables)
        store.push_back(fmt::arg(name.c_str(), value));
    return fmt::vformat(tmpl, store);
}

vector<string> expand_arguments(const vector<string> &templates, const execution_context &ctx) {
    vector<string> args;
    for (auto &tmpl : templates)
        args.push_back(expand_template(tmpl, ctx));
    return args;
}

backend_registry &backend_registry::add(execution_backend_uptr backend) {
    string language = backend->language();
    auto &list = backends[language];
    if (list.empty()) order.push_back(language);
    list.push_back(move(backend));
    return *this;
}

bool backend_registry::supports(const string &language) const {
    return backends.count(language) > 0;
}

const execution_backend *backend_registry::select(const execution_request &request) const {
    auto it = backends.find(request.language);
    if (it == backends.end()) return nullptr;
    for (auto &backend : it->second)
        if (backend->accepts(request))
            return backend.get();
    return nullptr;
}

vector<language_info> backend_registry::languages() const {
    vector<language_info> result;
    for (auto &language : order)
        result.push_back({language, backends.at(language).front()->label()});
    return result;
}

}  // namespace sandbox
