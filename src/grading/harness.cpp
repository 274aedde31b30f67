#include "grading/harness.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <boost/algorithm/string/join.hpp>
#include <algorithm>
#include <functional>
#include <map>
#include <regex>
#include "common/exceptions.hpp"
#include "config.hpp"

namespace sandbox {
using namespace std;
using namespace nlohmann;

const char *const RESULT_MARKER = "__PRACTICE_RESULT__:";

const char *const FUNCTION_NOT_FOUND = "Function not found. Define solve(...) function.";

// 评测代码在用户代码之前定义，用到的内置函数和测试数据都在用户代码运行之前绑定，
// 用户代码修改全局变量、内置函数或者模块都不会影响评测
static const char *PYTHON_HARNESS = R"(def __sandbox_prepare(tests, mode, nonce, marker, not_found,
                      print=print, len=len, isinstance=isinstance, callable=callable, sorted=sorted,
                      enumerate=enumerate, repr=repr, ord=ord, abs=abs, type=type, str=str, int=int,
                      float=float, bool=bool, list=list, tuple=tuple, dict=dict,
                      Exception=Exception, NameError=NameError, TypeError=TypeError):
    import json
    tests = json.loads(tests)
    infinity = float("inf")

    def canonicalize(value):
        if value is None or isinstance(value, bool):
            return value
        if isinstance(value, int):
            return int(value)
        if isinstance(value, float):
            value = float(value)
            if value.is_integer() and abs(value) < 9.2e18:
                return int(value)
            return value
        if isinstance(value, str):
            return str(value)
        if isinstance(value, (list, tuple)):
            return [canonicalize(item) for item in value]
        if isinstance(value, dict):
            return {{str(key): canonicalize(item) for key, item in value.items()}}
        raise TypeError("Object of type " + type(value).__name__ + " is not JSON serializable")

    def encode_string(value):
        out = ['"']
        for ch in value:
            code = ord(ch)
            if ch == '"' or ch == '\\':
                out.append('\\' + ch)
            elif code < 0x20 or 0xD800 <= code <= 0xDFFF:
                out.append('\\u%04x' % code)
            else:
                out.append(ch)
        out.append('"')
        return ''.join(out)

    def encode(value):
        if value is None:
            return 'null'
        if value is True:
            return 'true'
        if value is False:
            return 'false'
        if isinstance(value, int):
            return repr(value)
        if isinstance(value, float):
            if value != value or abs(value) == infinity:
                return 'null'
            return repr(value)
        if isinstance(value, str):
            return encode_string(value)
        if isinstance(value, list):
            return '[' + ','.join([encode(item) for item in value]) + ']'
        return '{{' + ','.join([encode_string(key) + ':' + encode(value[key]) for key in sorted(value)]) + '}}'

    def sort_key(value):
        if isinstance(value, (int, float)) and not isinstance(value, bool):
            return (0, value, '')
        if isinstance(value, str):
            return (1, 0, value)
        return (2, 0, encode(value))

    def normalize(value):
        value = canonicalize(value)
        if mode == 'sort' and isinstance(value, list):
            return sorted(value, key=sort_key)
        if mode == 'sort-nested' and isinstance(value, list):
            groups = [sorted(item, key=sort_key) if isinstance(item, list) else item for item in value]
            return sorted(groups, key=encode)
        return value

    def emit(result):
        result['nonce'] = nonce
        print(marker + encode(result))

    def describe(error):
        try:
            message = str(error)
        except Exception:
            message = ''
        return message or type(error).__name__

    def run(candidates):
        total = len(tests)
        fn = None
        for candidate in candidates:
            try:
                found = candidate()
            except NameError:
                continue
            if callable(found):
                fn = found
                break
        if fn is None:
            emit({{'passed': False, 'passedCount': 0, 'total': total, 'error': not_found}})
            return
        passed_count = 0
        for index, test in enumerate(tests):
            try:
                actual = normalize(fn(*test['args']))
                expected = normalize(test['expected'])
                same = encode(actual) == encode(expected)
            except Exception as e:
                emit({{'passed': False, 'passedCount': passed_count, 'total': total, 'failedAt': index + 1, 'error': describe(e)}})
                return
            if not same:
                emit({{'passed': False, 'passedCount': passed_count, 'total': total, 'failedAt': index + 1, 'expected': expected, 'actual': actual}})
                return
            passed_count += 1
        emit({{'passed': True, 'passedCount': passed_count, 'total': total}})

    return run


__sandbox_run = __sandbox_prepare({tests}, {mode}, {nonce}, {marker}, {not_found})
del __sandbox_prepare


{source}


__sandbox_run([{candidates}])
)";

static const char *JAVASCRIPT_HARNESS = R"(const __sandboxRun = (function (tests, mode, nonce, marker, notFound) {{
  'use strict';
  const log = console.log.bind(console);
  const stringify = JSON.stringify;
  const isArray = Array.isArray;
  const objectKeys = Object.keys;
  const defineProperty = Object.defineProperty;
  const apply = Reflect.apply;
  const sortArray = Function.prototype.call.bind(Array.prototype.sort);
  const toString = String;
  tests = JSON.parse(tests);

  function put(target, key, value) {{
    defineProperty(target, key, {{ __proto__: null, value, writable: true, enumerable: true, configurable: true }});
  }}
  function compareStrings(a, b) {{
    return a < b ? -1 : (a > b ? 1 : 0);
  }}
  function canonicalize(value) {{
    if (isArray(value)) {{
      const result = [];
      for (let i = 0; i < value.length; i += 1) put(result, i, canonicalize(value[i]));
      return result;
    }}
    if (value !== null && typeof value === 'object') {{
      const result = {{ __proto__: null }};
      const keys = sortArray(objectKeys(value), compareStrings);
      for (let i = 0; i < keys.length; i += 1) put(result, keys[i], canonicalize(value[keys[i]]));
      return result;
    }}
    return value;
  }}
  function encode(value) {{
    if (value === null) return 'null';
    const type = typeof value;
    if (type === 'string' || type === 'number') return stringify(value);
    if (type === 'boolean') return value ? 'true' : 'false';
    if (type === 'bigint') throw new TypeError('Do not know how to serialize a BigInt');
    if (type !== 'object') return undefined;
    if (isArray(value)) {{
      let out = '[';
      for (let i = 0; i < value.length; i += 1) {{
        const item = encode(value[i]);
        out += (i ? ',' : '') + (item === undefined ? 'null' : item);
      }}
      return out + ']';
    }}
    const keys = sortArray(objectKeys(value), compareStrings);
    let out = '{{', first = true;
    for (let i = 0; i < keys.length; i += 1) {{
      const item = encode(value[keys[i]]);
      if (item === undefined) continue;
      out += (first ? '' : ',') + stringify(keys[i]) + ':' + item;
      first = false;
    }}
    return out + '}}';
  }}
  function rank(value) {{
    if (typeof value === 'number') return 0;
    if (typeof value === 'string') return 1;
    return 2;
  }}
  function compareValues(a, b) {{
    const ra = rank(a), rb = rank(b);
    if (ra !== rb) return ra - rb;
    if (ra === 0) return a - b;
    if (ra === 1) return compareStrings(a, b);
    return compareStrings(encode(a), encode(b));
  }}
  function normalize(value) {{
    value = canonicalize(value);
    if (mode === 'sort' && isArray(value)) return sortArray(value, compareValues);
    if (mode === 'sort-nested' && isArray(value)) {{
      for (let i = 0; i < value.length; i += 1)
        if (isArray(value[i])) sortArray(value[i], compareValues);
      return sortArray(value, (a, b) => compareStrings(encode(a), encode(b)));
    }}
    return value;
  }}
  function emit(result) {{
    result.nonce = nonce;
    log(marker + encode(result));
  }}

  return function (candidates) {{
    const total = tests.length;
    let fn = null;
    for (let i = 0; i < candidates.length && !fn; i += 1) {{
      const found = candidates[i]();
      if (typeof found === 'function') fn = found;
    }}
    if (!fn) {{
      emit({{ passed: false, passedCount: 0, total, error: notFound }});
      return;
    }}
    let passedCount = 0;
    for (let i = 0; i < total; i += 1) {{
      let actual, expected, same;
      try {{
        actual = normalize(apply(fn, undefined, tests[i].args));
        expected = normalize(tests[i].expected);
        same = encode(actual) === encode(expected);
      }} catch (e) {{
        emit({{ passed: false, passedCount, total, failedAt: i + 1, error: toString(e && e.message ? e.message : e) }});
        return;
      }}
      if (!same) {{
        emit({{ passed: false, passedCount, total, failedAt: i + 1, expected, actual }});
        return;
      }}
      passedCount += 1;
    }}
    emit({{ passed: true, passedCount, total }});
  }};
}})({tests}, {mode}, {nonce}, {marker}, {not_found});

{source}

__sandboxRun([{candidates}]);
)";

/**
 * @brief 一种语言的评测代码模板
 */
struct harness_template {
    const char *code;

    /**
     * @brief 合法的函数名，不合法的候选函数名会被跳过，避免注入代码
     */
    regex identifier;

    /**
     * @brief 生成查找某个函数的代码片段，返回函数或者空值
     */
    function<string(const string &)> candidate;
};

static const map<string, harness_template> &harness_templates() {
    static const map<string, harness_template> templates = {
        {"python", {PYTHON_HARNESS, regex("^[A-Za-z_][A-Za-z0-9_]*$"), [](const string &name) {
                        return fmt::format("lambda: {}", name);
                    }}},
        {"javascript", {JAVASCRIPT_HARNESS, regex(R"(^[A-Za-z_$][A-Za-z0-9_$]*$)"), [](const string &name) {
                            return fmt::format("() => (typeof {0} === 'function' ? {0} : null)", name);
                        }}}};
    return templates;
}

vector<string> entry_point_candidates(const challenge &ch) {
    vector<string> candidates;
    for (const string &name : {ch.function_name, string("solve"), string("solution")})
        if (!name.empty() && find(candidates.begin(), candidates.end(), name) == candidates.end())
            candidates.push_back(name);
    return candidates;
}

bool has_harness(const string &language) {
    return harness_templates().count(language) > 0;
}

string build_harness(const string &language, const challenge &ch, const string &user_source, const string &nonce) {
    auto it = harness_templates().find(language);
    if (it == harness_templates().end()) throw unsupported_language(language);
    const harness_template &tmpl = it->second;

    vector<string> candidates;
    for (auto &name : entry_point_candidates(ch)) {
        if (regex_match(name, tmpl.identifier))
            candidates.push_back(tmpl.candidate(name));
        else
            LOG(WARNING) << "Challenge " << ch.id << ": skipping invalid function name " << name;
    }

    json tests = json::array();
    for (auto &test : ch.tests)
        tests.push_back({{"args", test.args}, {"expected", test.expected}});

    // 测试数据以 JSON 字符串字面量嵌入，运行时再解析
    string harness = fmt::format(fmt::runtime(tmpl.code),
                                 fmt::arg("source", user_source),
                                 fmt::arg("marker", json(RESULT_MARKER).dump()),
                                 fmt::arg("tests", json(tests.dump()).dump()),
                                 fmt::arg("mode", json(normalize_mode_name(ch.normalize)).dump()),
                                 fmt::arg("nonce", json(nonce).dump()),
                                 fmt::arg("candidates", boost::algorithm::join(candidates, ", ")),
                                 fmt::arg("not_found", json(FUNCTION_NOT_FOUND).dump()));
    if (DEBUG) LOG(INFO) << "Harness for " << ch.id << " (" << language << "):" << endl << harness;
    return harness;
}

}  // namespace sandbox
