#include "grading/evaluator.hpp"
#include <glog/logging.h>
#include <boost/algorithm/string/predicate.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <algorithm>
#include <cstring>
#include "common/exceptions.hpp"
#include "common/json_utils.hpp"
#include "common/utils.hpp"
#include "config.hpp"
#include "grading/harness.hpp"

namespace sandbox {
using namespace std;
using namespace nlohmann;

static const char *const INVALID_OUTPUT = "Invalid evaluator output.";
static const char *const UNPARSABLE_RESULT = "Could not parse evaluator result.";

static verdict parse_payload(const json &j) {
    if (!j.is_object()) throw invalid_argument("Evaluator result is not an object");

    verdict v;
    v.passed = get_value<bool>(j, "passed");
    v.passed_count = get_value_def<int>(j, 0, "passedCount");
    v.total = get_value_def<int>(j, 0, "total");
    if (exists(j, "failedAt")) v.failed_at = get_value<int>(j, "failedAt");
    if (exists(j, "error")) {
        const json &error = access(j, "error");
        v.error = error.is_string() ? error.get<string>() : error.dump();
    }

    if (v.passed) {
        v.status = sandbox::status::ACCEPTED;
    } else if (v.error) {
        v.status = sandbox::status::RUNTIME_ERROR;
    } else {
        v.status = sandbox::status::WRONG_ANSWER;
        // JavaScript 的 JSON.stringify 会省略值为 undefined 的字段
        v.expected = access_optional(j, "expected");
        v.actual = access_optional(j, "actual");
    }
    return v;
}

/**
 * @brief 判断评测结果是否带有本次评测的 nonce
 */
static bool carries_nonce(const json &payload, const string &nonce) {
    return payload.is_object() && payload.contains("nonce") && payload["nonce"] == nonce;
}

verdict parse_verdict(const string &stdout_text, const string &stderr_text, const string &nonce) {
    vector<string> lines = split_lines(stdout_text);
    json payload;
    bool found = false;
    for (auto line = lines.rbegin(); line != lines.rend() && !found; ++line) {
        if (!boost::algorithm::starts_with(*line, RESULT_MARKER)) continue;
        payload = json::parse(line->substr(strlen(RESULT_MARKER)), nullptr, false);
        if (nonce.empty()) {
            if (payload.is_discarded()) throw evaluator_protocol_error(UNPARSABLE_RESULT);
            found = true;
        } else if (!payload.is_discarded() && carries_nonce(payload, nonce)) {
            found = true;
        } else {
            LOG(WARNING) << "Ignoring result line without the evaluation nonce";
        }
    }
    if (!found)
        throw evaluator_protocol_error(stderr_text.empty() ? INVALID_OUTPUT : stderr_text);

    try {
        return parse_payload(payload);
    } catch (invalid_argument &ex) {
        LOG(WARNING) << "Malformed evaluator result " << payload.dump() << ": " << ex.what();
        throw evaluator_protocol_error(UNPARSABLE_RESULT);
    }
}

verdict evaluate(const backend_registry &registry, const string &language, const string &source, const challenge &ch) {
    if (!has_harness(language)) throw unsupported_language(language);

    string nonce = boost::uuids::to_string(boost::uuids::random_generator()());

    execution_request request;
    request.language = language;
    request.source = build_harness(language, ch, source, nonce);
    request.grading = true;

    const execution_backend *backend = registry.select(request);
    if (!backend) throw unsupported_language(language);

    execution_result result = backend->execute(request);
    if (DEBUG) LOG(INFO) << "Evaluator output of " << ch.id << ":" << endl << result.stdout_text;

    switch (result.status) {
        case sandbox::status::TIME_LIMIT_EXCEEDED:
        case sandbox::status::BINARY_UNAVAILABLE:
        case sandbox::status::SYSTEM_ERROR: {
            verdict v;
            v.total = (int)ch.tests.size();
            v.error = result.stderr_text;
            v.status = result.status;
            return v;
        }
        default:
            return parse_verdict(result.stdout_text, result.stderr_text, nonce);
    }
}

}  // namespace sandbox
