#include "service.hpp"
#include <glog/logging.h>
#include <boost/exception/diagnostic_information.hpp>
#include "common/exceptions.hpp"
#include "grading/harness.hpp"
#include "grading/normalize.hpp"

namespace sandbox {
using namespace std;
using namespace nlohmann;

static const char *const UNSUPPORTED_LANGUAGE_MESSAGE = "Unsupported language.";
static const char *const GRADING_LANGUAGES_MESSAGE = "Grading supports JavaScript and Python only.";
static const char *const CHALLENGE_NOT_FOUND_MESSAGE = "Challenge not found.";

sandbox_service::sandbox_service(const security_gate &gate, const backend_registry &registry, const challenge_catalog &catalog)
    : gate(gate), registry(registry), challenges(catalog) {}

vector<language_info> sandbox_service::languages() const {
    return registry.languages();
}

execution_result sandbox_service::run(const execution_request &request) const {
    execution_result result;
    if (!registry.supports(request.language)) {
        result.status = status::UNSUPPORTED_LANGUAGE;
        result.stderr_text = UNSUPPORTED_LANGUAGE_MESSAGE;
        return result;
    }

    validation_result validation = gate.validate(request.language, request.source);
    if (!validation.valid) {
        result.status = status::SECURITY_REJECTED;
        result.stderr_text = validation.reason;
        return result;
    }

    const execution_backend *backend = registry.select(request);
    if (!backend) {
        result.status = status::UNSUPPORTED_LANGUAGE;
        result.stderr_text = UNSUPPORTED_LANGUAGE_MESSAGE;
        return result;
    }
    return backend->execute(request);
}

static verdict failed_verdict(status s, const string &error, int total) {
    verdict v;
    v.total = total;
    v.error = error;
    v.status = s;
    return v;
}

grading_result sandbox_service::grade(const string &identity, const string &language, const string &source, const string &challenge_id) {
    grading_result result;
    result.challenge_id = challenge_id;

    const challenge *ch = challenges.find(challenge_id);
    if (!ch) {
        result.verdict = failed_verdict(status::CHALLENGE_NOT_FOUND, CHALLENGE_NOT_FOUND_MESSAGE, 0);
        return result;
    }
    result.challenge_id = ch->id;
    result.title = ch->title;
    int total = (int)ch->tests.size();

    if (!has_harness(language)) {
        result.verdict = failed_verdict(status::UNSUPPORTED_LANGUAGE, GRADING_LANGUAGES_MESSAGE, total);
        return result;
    }

    validation_result validation = gate.validate(language, source);
    if (!validation.valid) {
        result.verdict = failed_verdict(status::SECURITY_REJECTED, validation.reason, total);
        return result;
    }

    try {
        result.verdict = evaluate(registry, language, source, *ch);
    } catch (unsupported_language &) {
        result.verdict = failed_verdict(status::UNSUPPORTED_LANGUAGE, GRADING_LANGUAGES_MESSAGE, total);
    } catch (evaluator_protocol_error &ex) {
        LOG(WARNING) << "Evaluator protocol error on " << ch->id << " (" << language << "): " << ex.what();
        result.verdict = failed_verdict(status::EVALUATOR_PROTOCOL_ERROR, ex.what(), total);
    } catch (exception &ex) {
        LOG(ERROR) << "Failed to grade " << ch->id << " (" << language << "): " << boost::diagnostic_information(ex);
        result.verdict = failed_verdict(status::SYSTEM_ERROR, ex.what(), total);
    }

    if (result.verdict.expected) result.verdict.expected = normalize(*result.verdict.expected, ch->normalize);
    if (result.verdict.actual) result.verdict.actual = normalize(*result.verdict.actual, ch->normalize);

    if (result.verdict.passed && record_solve(identity, ch->id)) {
        result.first_solve = true;
        fire_first_solve({identity, ch->id, language});
    }
    return result;
}

void sandbox_service::on_first_solve(function<void(const first_solve_event &)> callback) {
    first_solve_callbacks.push_back(callback);
}

void sandbox_service::fire_first_solve(const first_solve_event &event) {
    for (auto &callback : first_solve_callbacks) {
        try {
            callback(event);
        } catch (exception &ex) {
            LOG(ERROR) << "First solve callback failed for " << event.identity << " on " << event.challenge_id
                       << ": " << boost::diagnostic_information(ex);
        }
    }
}

void sandbox_service::mark_solved(const string &identity, const string &challenge_id) {
    record_solve(identity, challenge_id);
}

bool sandbox_service::record_solve(const string &identity, const string &challenge_id) {
    lock_guard<mutex> guard(solved_mutex);
    return solved.emplace(identity, challenge_id).second;
}

const challenge_catalog &sandbox_service::catalog() const {
    return challenges;
}

void to_json(json &j, const execution_result &result) {
    j = {{"stdout", result.stdout_text},
         {"stderr", result.stderr_text},
         {"durationMs", result.duration_ms},
         {"status", get_display_message(result.status)}};
    if (result.plot_image) j["plotImage"] = *result.plot_image;
}

void to_json(json &j, const grading_result &result) {
    const verdict &v = result.verdict;
    j = {{"challengeId", result.challenge_id},
         {"title", result.title},
         {"passed", v.passed},
         {"passedCount", v.passed_count},
         {"total", v.total},
         {"failedAt", v.failed_at ? json(*v.failed_at) : json()},
         {"expected", v.expected.value_or(json())},
         {"actual", v.actual.value_or(json())},
         {"error", v.error.value_or("")},
         {"status", get_display_message(v.status)},
         {"firstSolve", result.first_solve}};
}

void to_json(json &j, const language_info &info) {
    j = {{"id", info.id}, {"label", info.label}};
}

}  // namespace sandbox
