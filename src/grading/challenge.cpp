#include "grading/challenge.hpp"
#include <glog/logging.h>
#include <boost/algorithm/string/predicate.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <set>
#include <stdexcept>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/json_utils.hpp"

namespace sandbox {
using namespace std;
using namespace nlohmann;

void from_json(const json &j, challenge_example &example) {
    example.input = get_value<string>(j, "input");
    example.output = get_value<string>(j, "output");
}

void from_json(const json &j, test_case &test) {
    test.args = get_value_def<json>(j, json::array(), "args");
    if (!test.args.is_array()) throw build_invalid_argument(j, "args");
    test.expected = access_optional(j, "expected");
}

void from_json(const json &j, challenge &ch) {
    ch.id = get_value<string>(j, "id");
    ch.title = get_value<string>(j, "title");
    ch.difficulty = get_value<string>(j, "difficulty");
    ch.category = get_value<string>(j, "category");
    ch.interview = get_value_def<bool>(j, false, "interview");
    ch.tags = get_value_def<vector<string>>(j, {}, "tags");
    ch.statement = get_value<string>(j, "statement");
    ch.constraints = get_value_def<vector<string>>(j, {}, "constraints");
    ch.examples = get_value_def<vector<challenge_example>>(j, {}, "examples");
    ch.function_name = get_value_def<string>(j, "solve", "functionName");
    ch.tests = get_value<vector<test_case>>(j, "tests");
    ch.normalize = parse_normalize_mode(get_value_def<string>(j, "none", "normalize"));
    ch.starter_code = get_value_def<map<string, string>>(j, {}, "starterCode");
}

challenge_catalog::challenge_catalog(vector<challenge> challenges)
    : challenges(move(challenges)) {
    set<string> ids;
    for (auto &ch : this->challenges)
        if (!ids.insert(ch.id).second)
            throw invalid_argument("Duplicate challenge id: " + ch.id);
}

challenge_catalog challenge_catalog::load(const filesystem::path &path) {
    json j = json::parse(read_file_content(path));
    auto catalog = challenge_catalog(get_value<vector<challenge>>(j, "challenges"));
    LOG(INFO) << "Loaded " << catalog.size() << " challenges from " << path;
    return catalog;
}

const challenge *challenge_catalog::find(const string &id) const {
    string key = boost::algorithm::trim_copy(id);
    for (auto &ch : challenges)
        if (ch.id == key) return &ch;
    return nullptr;
}

const challenge &challenge_catalog::at(const string &id) const {
    const challenge *ch = find(id);
    if (!ch) throw challenge_not_found(id);
    return *ch;
}

static bool matches(const challenge &ch, const challenge_filter &filter) {
    using boost::algorithm::iequals;
    using boost::algorithm::icontains;

    if (filter.difficulty && !iequals(ch.difficulty, *filter.difficulty)) return false;
    if (filter.category && !iequals(ch.category, *filter.category)) return false;
    if (filter.interview && ch.interview != *filter.interview) return false;
    if (filter.search) {
        string keyword = boost::algorithm::trim_copy(*filter.search);
        bool found = icontains(ch.title, keyword) || icontains(ch.category, keyword);
        for (auto &tag : ch.tags)
            found = found || icontains(tag, keyword);
        if (!found) return false;
    }
    return true;
}

static json summary_of(const challenge &ch) {
    return {{"id", ch.id},
            {"title", ch.title},
            {"difficulty", ch.difficulty},
            {"category", ch.category},
            {"interview", ch.interview},
            {"tags", ch.tags}};
}

json challenge_catalog::summaries(const challenge_filter &filter) const {
    json result = json::array();
    for (auto &ch : challenges)
        if (matches(ch, filter))
            result.push_back(summary_of(ch));
    return result;
}

json challenge_catalog::detail(const string &id) const {
    const challenge &ch = at(id);
    json result = summary_of(ch);
    result["statement"] = ch.statement;
    result["constraints"] = ch.constraints;
    result["examples"] = json::array();
    for (auto &example : ch.examples)
        result["examples"].push_back({{"input", example.input}, {"output", example.output}});
    result["starterCode"] = ch.starter_code;
    result["testCount"] = ch.tests.size();
    return result;
}

size_t challenge_catalog::size() const {
    return challenges.size();
}

}  // namespace sandbox
