#include "config.hpp"

namespace sandbox {
using namespace std;

filesystem::path RUN_DIR = filesystem::temp_directory_path();
size_t OUTPUT_LIMIT = 8000;
size_t SOURCE_LIMIT = 20000;
const char *const OUTPUT_TRUNCATED_SUFFIX = "\n...output truncated...";
bool DEBUG = false;

}  // namespace sandbox
