#include "process/workspace.hpp"
#include <glog/logging.h>
#include <boost/lexical_cast.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "config.hpp"

namespace sandbox {
using namespace std;
namespace fs = std::filesystem;

workspace::workspace(const string &prefix)
    : workspace(prefix, RUN_DIR) {}

workspace::workspace(const string &prefix, const fs::path &root) {
    string uuid = boost::lexical_cast<string>(boost::uuids::random_generator()());
    dir = root / (assert_safe_path(prefix) + "-" + uuid);

    error_code ec;
    // uuid 保证了文件夹名唯一，已存在说明出现了问题
    if (!fs::create_directories(dir, ec) || ec)
        throw internal_error("Unable to create workspace " + dir.string() + ": " + ec.message());
    fs::permissions(dir, fs::perms::owner_all, fs::perm_options::replace, ec);
    if (ec)
        LOG(WARNING) << "Unable to restrict permissions of workspace " << dir << ": " << ec.message();
}

workspace::~workspace() {
    error_code ec;
    fs::remove_all(dir, ec);
    if (ec)
        LOG(WARNING) << "Unable to remove workspace " << dir << ": " << ec.message();
}

const fs::path &workspace::path() const {
    return dir;
}

fs::path workspace::file(const string &filename) const {
    return dir / assert_safe_path(filename);
}

}  // namespace sandbox
