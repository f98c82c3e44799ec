#include "common/utils.hpp"
#include <unistd.h>
#include <boost/algorithm/string.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <cstdlib>
#include <filesystem>
#include <mutex>
#include <vector>

namespace runbox {
using namespace std;

string get_env(const string &key, const string &def_value) {
    char *result = getenv(key.c_str());
    return !result ? def_value : string(result);
}

void set_env(const string &key, const string &value, bool replace) {
    setenv(key.c_str(), value.c_str(), replace);
}

static bool is_executable(const filesystem::path &path) {
    error_code ec;
    return filesystem::is_regular_file(path, ec) && access(path.c_str(), X_OK) == 0;
}

string which(const string &cmd) {
    if (cmd.empty()) return "";
    if (cmd.find('/') != string::npos)
        return is_executable(cmd) ? cmd : "";

    vector<string> dirs;
    boost::split(dirs, get_env("PATH", ""), boost::is_any_of(":"));
    for (auto &dir : dirs) {
        if (dir.empty()) continue;
        filesystem::path fullpath = filesystem::path(dir) / cmd;
        if (is_executable(fullpath)) return fullpath.string();
    }
    return "";
}

string generate_execution_id() {
    // random_generator 不是线程安全的
    static mutex generator_mutex;
    static boost::uuids::random_generator generator;
    scoped_lock guard(generator_mutex);
    return boost::lexical_cast<string>(generator());
}

elapsed_time::elapsed_time() {
    start = chrono::steady_clock::now();
}

long long elapsed_time::milliseconds() const {
    return duration<chrono::milliseconds>().count();
}

}  // namespace runbox
