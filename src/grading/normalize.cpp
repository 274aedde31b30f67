#include "grading/normalize.hpp"
#include <algorithm>
#include <cmath>
#include <cstdint>

namespace sandbox {
using namespace std;
using namespace nlohmann;

normalize_mode parse_normalize_mode(const string &mode) {
    if (mode == "sort") return normalize_mode::SORT;
    if (mode == "sort-nested") return normalize_mode::SORT_NESTED;
    return normalize_mode::NONE;
}

string normalize_mode_name(normalize_mode mode) {
    switch (mode) {
        case normalize_mode::SORT:
            return "sort";
        case normalize_mode::SORT_NESTED:
            return "sort-nested";
        default:
            return "none";
    }
}

json canonicalize(const json &value) {
    if (value.is_number_float()) {
        double number = value.get<double>();
        // 9.2e18 以内的整数值才能精确转换为 int64
        if (std::isfinite(number) && std::trunc(number) == number && std::fabs(number) < 9.2e18)
            return static_cast<int64_t>(number);
        return value;
    }
    if (value.is_array()) {
        json result = json::array();
        for (auto &item : value)
            result.push_back(canonicalize(item));
        return result;
    }
    if (value.is_object()) {
        json result = json::object();
        for (auto &[key, item] : value.items())
            result[key] = canonicalize(item);
        return result;
    }
    return value;
}

string canonical_dump(const json &value) {
    return canonicalize(value).dump();
}

static int rank(const json &value) {
    if (value.is_number()) return 0;
    if (value.is_string()) return 1;
    return 2;
}

bool canonical_less(const json &a, const json &b) {
    int ra = rank(a), rb = rank(b);
    if (ra != rb) return ra < rb;
    switch (ra) {
        case 0:
            return a < b;
        case 1:
            return a.get_ref<const string &>() < b.get_ref<const string &>();
        default:
            return canonical_dump(a) < canonical_dump(b);
    }
}

static json sorted(json list) {
    auto &items = list.get_ref<json::array_t &>();
    stable_sort(items.begin(), items.end(), canonical_less);
    return list;
}

json normalize(const json &value, normalize_mode mode) {
    json result = canonicalize(value);
    if (!result.is_array() || mode == normalize_mode::NONE) return result;

    if (mode == normalize_mode::SORT) return sorted(move(result));

    for (auto &item : result)
        if (item.is_array()) item = sorted(move(item));
    auto &groups = result.get_ref<json::array_t &>();
    stable_sort(groups.begin(), groups.end(), [](const json &a, const json &b) {
        return canonical_dump(a) < canonical_dump(b);
    });
    return result;
}

}  // namespace sandbox
