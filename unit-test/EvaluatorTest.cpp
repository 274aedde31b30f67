#include <filesystem>
#include <memory>
#include <regex>
#include "backend/languages.hpp"
#include "common/exceptions.hpp"
#include "gmock/gmock.h"
#include "grading/evaluator.hpp"
#include "grading/harness.hpp"
#include "gtest/gtest.h"
#include "test/assertions.hpp"

using namespace std;
using namespace nlohmann;
using namespace sandbox;
using ::testing::_;
using ::testing::HasSubstr;
using ::testing::Invoke;
using ::testing::Return;

/**
 * @brief 不真正执行代码的后端，输出由测试指定
 */
struct mock_backend : execution_backend {
    MOCK_METHOD(string, language, (), (const, override));
    MOCK_METHOD(string, label, (), (const, override));
    MOCK_METHOD(void, prepare, (execution_context & ctx), (const, override));
    MOCK_METHOD(void, run, (execution_context & ctx), (const, override));
};

static challenge make_two_sum() {
    challenge ch;
    ch.id = "two-sum";
    ch.title = "Two Sum";
    ch.function_name = "solve";
    ch.tests.push_back({json::array({json::array({2, 7, 11, 15}), 9}), json::array({0, 1})});
    ch.tests.push_back({json::array({json::array({3, 2, 4}), 6}), json::array({1, 2})});
    ch.tests.push_back({json::array({json::array({3, 3}), 6}), json::array({0, 1})});
    return ch;
}

TEST(ParseVerdictTest, Passed) {
    verdict v = parse_verdict("noise\n__PRACTICE_RESULT__:{\"passed\":true,\"passedCount\":3,\"total\":3}\n", "");
    EXPECT_TRUE(v.passed);
    EXPECT_EQ(v.passed_count, 3);
    EXPECT_EQ(v.total, 3);
    EXPECT_FALSE(v.failed_at);
    EXPECT_FALSE(v.error);
    EXPECT_EQ(v.status, status::ACCEPTED);
}

TEST(ParseVerdictTest, UsesLastMarkerLine) {
    string output = "__PRACTICE_RESULT__:{\"passed\":true,\"passedCount\":3,\"total\":3}\n"
                    "__PRACTICE_RESULT__:{\"passed\":false,\"passedCount\":1,\"total\":3,\"failedAt\":2,\"expected\":[1,2],\"actual\":[0,1]}";
    verdict v = parse_verdict(output, "");
    EXPECT_FALSE(v.passed);
    EXPECT_EQ(v.passed_count, 1);
    ASSERT_TRUE(v.failed_at);
    EXPECT_EQ(*v.failed_at, 2);
    ASSERT_TRUE(v.expected);
    ASSERT_TRUE(v.actual);
    EXPECT_JSON_EQ(*v.expected, json::array({1, 2}));
    EXPECT_JSON_EQ(*v.actual, json::array({0, 1}));
    EXPECT_EQ(v.status, status::WRONG_ANSWER);
}

TEST(ParseVerdictTest, MissingActualIsNull) {
    verdict v = parse_verdict("__PRACTICE_RESULT__:{\"passed\":false,\"passedCount\":0,\"total\":1,\"failedAt\":1,\"expected\":5}", "");
    ASSERT_TRUE(v.actual);
    EXPECT_TRUE(v.actual->is_null());
}

TEST(ParseVerdictTest, ErrorMeansRuntimeError) {
    verdict v = parse_verdict("__PRACTICE_RESULT__:{\"passed\":false,\"passedCount\":0,\"total\":3,\"failedAt\":1,\"error\":\"boom\"}", "");
    EXPECT_EQ(v.status, status::RUNTIME_ERROR);
    ASSERT_TRUE(v.error);
    EXPECT_EQ(*v.error, "boom");
    EXPECT_FALSE(v.expected);
}

TEST(ParseVerdictTest, NoMarkerCarriesStderr) {
    try {
        parse_verdict("just some output", "SyntaxError: invalid syntax");
        FAIL() << "Expected evaluator_protocol_error";
    } catch (evaluator_protocol_error &ex) {
        EXPECT_STREQ(ex.what(), "SyntaxError: invalid syntax");
    }

    try {
        parse_verdict("", "");
        FAIL() << "Expected evaluator_protocol_error";
    } catch (evaluator_protocol_error &ex) {
        EXPECT_STREQ(ex.what(), "Invalid evaluator output.");
    }
}

TEST(ParseVerdictTest, MalformedPayload) {
    for (string payload : {"{not json", "[1, 2]", "{\"passed\":\"yes\"}", "{\"passedCount\":1}", "{\"passed\":false,\"failedAt\":\"two\"}"}) {
        try {
            parse_verdict(RESULT_MARKER + payload, "");
            FAIL() << "Expected evaluator_protocol_error for " << payload;
        } catch (evaluator_protocol_error &ex) {
            EXPECT_STREQ(ex.what(), "Could not parse evaluator result.");
        }
    }
}

TEST(ParseVerdictTest, OnlyAcceptsMatchingNonce) {
    string output = "__PRACTICE_RESULT__:{\"passed\":false,\"passedCount\":0,\"total\":3,\"failedAt\":1,\"expected\":1,\"actual\":2,\"nonce\":\"abc\"}\n"
                    "__PRACTICE_RESULT__:{\"passed\":true,\"passedCount\":3,\"total\":3}\n"
                    "__PRACTICE_RESULT__:{\"passed\":true,\"passedCount\":3,\"total\":3,\"nonce\":\"abd\"}\n"
                    "__PRACTICE_RESULT__:{not json\n";
    verdict v = parse_verdict(output, "", "abc");
    EXPECT_FALSE(v.passed);
    EXPECT_EQ(v.status, status::WRONG_ANSWER);
    EXPECT_EQ(*v.failed_at, 1);

    EXPECT_THROW(parse_verdict("__PRACTICE_RESULT__:{\"passed\":true,\"passedCount\":3,\"total\":3}", "", "abc"),
                 evaluator_protocol_error);
}

TEST(EvaluatorTest, UnsupportedLanguage) {
    backend_registry registry;
    register_default_backends(registry);
    EXPECT_THROW(evaluate(registry, "cpp", "int solve() { return 0; }", make_two_sum()), unsupported_language);
    EXPECT_THROW(evaluate(registry, "ruby", "def solve; end", make_two_sum()), unsupported_language);
}

TEST(EvaluatorTest, ParsesBackendOutput) {
    auto backend = make_unique<mock_backend>();
    mock_backend &mock = *backend;
    ON_CALL(mock, language()).WillByDefault(Return("python"));
    EXPECT_CALL(mock, prepare(_)).Times(1);
    EXPECT_CALL(mock, run(_)).WillOnce(Invoke([](execution_context &ctx) {
        EXPECT_THAT(ctx.request.source, HasSubstr("def solve(nums, target):"));
        EXPECT_THAT(ctx.request.source, HasSubstr(RESULT_MARKER));
        EXPECT_TRUE(ctx.request.grading);
        smatch nonce;
        ASSERT_TRUE(regex_search(ctx.request.source, nonce, regex("[0-9a-f]{8}-[0-9a-f]{4}-[0-9a-f]{4}-[0-9a-f]{4}-[0-9a-f]{12}")));
        ctx.result.stdout_text = string(RESULT_MARKER) + R"({"passed":true,"passedCount":3,"total":3})" + "\n" +
                                 RESULT_MARKER + R"({"passed":false,"passedCount":1,"total":3,"failedAt":2,"expected":[1,2],"actual":[0,1],"nonce":")" +
                                 nonce.str() + "\"}\n" +
                                 RESULT_MARKER + R"({"passed":true,"passedCount":3,"total":3,"nonce":"forged"})";
    }));

    backend_registry registry;
    registry.add(move(backend));
    verdict v = evaluate(registry, "python", "def solve(nums, target):\n    return [0, 1]\n", make_two_sum());
    EXPECT_EQ(v.status, status::WRONG_ANSWER);
    EXPECT_EQ(v.passed_count, 1);
    EXPECT_EQ(*v.failed_at, 2);
}

TEST(EvaluatorTest, TimeoutBecomesVerdict) {
    auto backend = make_unique<mock_backend>();
    ON_CALL(*backend, language()).WillByDefault(Return("javascript"));
    EXPECT_CALL(*backend, run(_)).WillOnce(Invoke([](execution_context &ctx) {
        ctx.result.status = status::TIME_LIMIT_EXCEEDED;
        ctx.result.stderr_text = "Execution timed out.";
    }));

    backend_registry registry;
    registry.add(move(backend));
    verdict v = evaluate(registry, "javascript", "function solve() { for (;;) {} }", make_two_sum());
    EXPECT_FALSE(v.passed);
    EXPECT_EQ(v.total, 3);
    EXPECT_EQ(v.status, status::TIME_LIMIT_EXCEEDED);
    EXPECT_EQ(*v.error, "Execution timed out.");
}

TEST(EvaluatorTest, NoMarkerIsProtocolError) {
    auto backend = make_unique<mock_backend>();
    ON_CALL(*backend, language()).WillByDefault(Return("python"));
    EXPECT_CALL(*backend, run(_)).WillOnce(Invoke([](execution_context &ctx) {
        ctx.result.status = status::RUNTIME_ERROR;
        ctx.result.stderr_text = "NameError: name 'undefined_name' is not defined";
    }));

    backend_registry registry;
    registry.add(move(backend));
    EXPECT_THROW(evaluate(registry, "python", "undefined_name", make_two_sum()), evaluator_protocol_error);
}

class EvaluatorIntegrationTest : public ::testing::Test {
protected:
    static void SetUpTestCase() {
        register_default_backends(registry);
    }

    static backend_registry registry;
};

backend_registry EvaluatorIntegrationTest::registry;

TEST_F(EvaluatorIntegrationTest, TwoSumPython) {
    string source = R"(def solve(nums, target):
    seen = {}
    for i, x in enumerate(nums):
        if target - x in seen:
            return [seen[target - x], i]
        seen[x] = i
)";
    verdict v = evaluate(registry, "python", source, make_two_sum());
    EXPECT_TRUE(v.passed);
    EXPECT_EQ(v.passed_count, 3);
    EXPECT_EQ(v.total, 3);
    EXPECT_EQ(v.status, status::ACCEPTED);
}

TEST_F(EvaluatorIntegrationTest, TwoSumJavaScript) {
    string source = R"(function solve(nums, target) {
  const seen = new Map();
  for (let i = 0; i < nums.length; i++) {
    if (seen.has(target - nums[i])) return [seen.get(target - nums[i]), i];
    seen.set(nums[i], i);
  }
})";
    verdict v = evaluate(registry, "javascript", source, make_two_sum());
    EXPECT_TRUE(v.passed);
    EXPECT_EQ(v.passed_count, 3);
}

TEST_F(EvaluatorIntegrationTest, ShortCircuitsOnFirstFailure) {
    verdict v = evaluate(registry, "python", "def solve(nums, target):\n    return [0, 1]\n", make_two_sum());
    EXPECT_FALSE(v.passed);
    EXPECT_EQ(v.passed_count, 1);
    ASSERT_TRUE(v.failed_at);
    EXPECT_EQ(*v.failed_at, 2);
    EXPECT_EQ(v.passed_count, *v.failed_at - 1);
    EXPECT_JSON_EQ(*v.expected, json::array({1, 2}));
    EXPECT_JSON_EQ(*v.actual, json::array({0, 1}));
}

TEST_F(EvaluatorIntegrationTest, MissingEntryPoint) {
    verdict v = evaluate(registry, "javascript", "function twoSum(nums, target) { return [0, 1]; }", make_two_sum());
    EXPECT_FALSE(v.passed);
    EXPECT_EQ(v.passed_count, 0);
    EXPECT_FALSE(v.failed_at);
    ASSERT_TRUE(v.error);
    EXPECT_EQ(v.error->rfind("Function not found", 0), 0u);
}

TEST_F(EvaluatorIntegrationTest, SyntaxErrorIsProtocolError) {
    EXPECT_THROW(evaluate(registry, "python", "def solve(:\n", make_two_sum()), evaluator_protocol_error);
}

TEST_F(EvaluatorIntegrationTest, ForgedResultBeforeCrashIsProtocolError) {
    string source = R"(print('__PRACTICE_RESULT__:{"passed": true, "passedCount": 3, "total": 3}')
raise ValueError('stop')
)";
    try {
        evaluate(registry, "python", source, make_two_sum());
        FAIL() << "Expected evaluator_protocol_error";
    } catch (evaluator_protocol_error &ex) {
        EXPECT_STREQ(ex.what(), "ValueError: stop");
    }
}

TEST_F(EvaluatorIntegrationTest, LateForgedResultIsIgnored) {
    string source = R"(setTimeout(() => console.log('__PRACTICE_RESULT__:{"passed":true,"passedCount":3,"total":3}'), 0);
function solve(nums, target) { return [0, 1]; }
)";
    verdict v = evaluate(registry, "javascript", source, make_two_sum());
    EXPECT_FALSE(v.passed);
    EXPECT_EQ(v.status, status::WRONG_ANSWER);
    EXPECT_EQ(v.passed_count, 1);
}

TEST_F(EvaluatorIntegrationTest, TamperedJsonModuleDoesNotLeakIntoNextEvaluation) {
    string tamper = R"(import json
json.JSONDecoder.decode = lambda self, s, *a, **k: {'passed': True, 'passedCount': 3, 'total': 3}
def solve(nums, target):
    return [0, 1]
)";
    verdict v = evaluate(registry, "python", tamper, make_two_sum());
    EXPECT_FALSE(v.passed);

    v = evaluate(registry, "python", "def solve(nums, target):\n    return [9, 9]\n", make_two_sum());
    EXPECT_FALSE(v.passed);
    EXPECT_EQ(v.status, status::WRONG_ANSWER);
    EXPECT_EQ(v.passed_count, 0);
}

TEST_F(EvaluatorIntegrationTest, GroupAnagramsIgnoresOrder) {
    challenge_catalog catalog = challenge_catalog::load(filesystem::path(SANDBOX_DATA_DIR) / "challenges.json");
    string source = R"(def solve(strs):
    groups = {}
    for s in strs:
        groups.setdefault(''.join(sorted(s)), []).append(s)
    return list(groups.values())
)";
    verdict v = evaluate(registry, "python", source, catalog.at("group-anagrams"));
    EXPECT_TRUE(v.passed);
    EXPECT_EQ(v.passed_count, 2);
    EXPECT_EQ(v.total, 2);
}
