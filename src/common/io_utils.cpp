#include "common/io_utils.hpp"
#include <boost/archive/iterators/base64_from_binary.hpp>
#include <boost/archive/iterators/transform_width.hpp>
#include <cerrno>
#include <fstream>
#include <system_error>

namespace sandbox {
using namespace std;
namespace fs = std::filesystem;

string read_file_content(fs::path const &path) {
    ifstream fin(path.string(), ios::binary);
    if (!fin)
        throw system_error(errno, system_category(), "unable to open file " + path.string());
    string str((istreambuf_iterator<char>(fin)),
               (istreambuf_iterator<char>()));
    return str;
}

string read_file_content(fs::path const &path, const string &def) {
    if (!fs::exists(path)) {
        return def;
    } else {
        return read_file_content(path);
    }
}

void write_file_content(const fs::path &path, const string &content) {
    ofstream fout(path.string(), ios::binary | ios::trunc);
    if (!fout)
        throw system_error(errno, system_category(), "unable to create file " + path.string());
    fout << content;
    if (!fout.flush())
        throw system_error(errno, system_category(), "unable to write file " + path.string());
}

string assert_safe_path(const string &filename) {
    if (filename.empty() || filename == "." || filename == ".." ||
        filename.find('/') != string::npos || filename.find('\0') != string::npos)
        throw runtime_error("filename is not safe " + filename);
    return filename;
}

string encode_base64(const string &data) {
    using namespace boost::archive::iterators;
    using base64_iterator = base64_from_binary<transform_width<string::const_iterator, 6, 8>>;

    string encoded(base64_iterator(data.begin()), base64_iterator(data.end()));
    // transform_width 不会补齐最后一组，需要手动追加 '='
    encoded.append((3 - data.size() % 3) % 3, '=');
    return encoded;
}

}  // namespace sandbox
