#include "common/utils.hpp"
#include "config.hpp"

namespace sandbox {
using namespace std;

string clip_output(const string &text) {
    return clip_output(text, OUTPUT_LIMIT);
}

string clip_output(const string &text, size_t limit) {
    if (text.size() <= limit) return text;
    size_t end = limit;
    // 退回到 UTF-8 字符的起始字节
    while (end > 0 && (static_cast<unsigned char>(text[end]) & 0xC0) == 0x80)
        --end;
    return text.substr(0, end) + OUTPUT_TRUNCATED_SUFFIX;
}

vector<string> split_lines(const string &text) {
    vector<string> lines;
    size_t begin = 0;
    while (true) {
        size_t pos = text.find('\n', begin);
        string line = text.substr(begin, pos == string::npos ? string::npos : pos - begin);
        if (!line.empty() && line.back() == '\r') line.pop_back();
        lines.push_back(move(line));
        if (pos == string::npos) break;
        begin = pos + 1;
    }
    return lines;
}

elapsed_time::elapsed_time() {
    start = chrono::steady_clock::now();
}

}  // namespace sandbox
