#include "test/environment.hpp"
#include <fmt/core.h>
#include <unistd.h>
#include <atomic>
#include "common/utils.hpp"

namespace runbox {
using namespace std;
namespace fs = std::filesystem;

fs::path make_test_directory(const string &name) {
    static atomic<int> counter{0};
    fs::path dir = fs::temp_directory_path() / fmt::format("runbox-test-{}-{}-{}", name, getpid(), counter++);
    fs::remove_all(dir);
    fs::create_directories(dir);
    return dir;
}

engine_config make_test_config(const string &name) {
    engine_config config;
    config.workspace_root = make_test_directory(name);
    config.cleanup_delay = chrono::milliseconds(0);
    config.max_concurrency = 4;
    config.max_queue_depth = 16;
    config.kill_delay = chrono::milliseconds(50);
    return config;
}

bool has_command(const string &command) {
    return !which(command).empty();
}

size_t count_processes_in(const fs::path &directory) {
    size_t count = 0;
    string prefix = directory.string();
    error_code ec;
    for (auto &entry : fs::directory_iterator("/proc", ec)) {
        string pid = entry.path().filename().string();
        if (pid.find_first_not_of("0123456789") != string::npos) continue;
        error_code link_ec;
        fs::path cwd = fs::read_symlink(entry.path() / "cwd", link_ec);
        if (link_ec) continue;
        if (cwd.string().rfind(prefix, 0) == 0) ++count;
    }
    return count;
}

size_t count_entries(const fs::path &directory) {
    error_code ec;
    if (!fs::is_directory(directory, ec)) return 0;
    size_t count = 0;
    for (auto it = fs::directory_iterator(directory, ec); !ec && it != fs::directory_iterator(); it.increment(ec))
        ++count;
    return count;
}

language_profile make_script_profile(const string &id) {
    language_profile profile;
    profile.id = id;
    profile.display_name = "Script";
    profile.file_extension = ".sh";
    profile.default_filename = "main.sh";
    profile.compile_command = {"sh", "{file}", "compile"};
    profile.run_command = {"sh", "{file}", "run"};
    profile.default_timeout = chrono::milliseconds(5000);
    profile.compile_timeout = chrono::milliseconds(5000);
    return profile;
}

}  // namespace runbox
