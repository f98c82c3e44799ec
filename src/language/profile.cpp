#include "language/profile.hpp"
#include <boost/algorithm/string/replace.hpp>
#include <filesystem>
#include "common/utils.hpp"

namespace runbox {
using namespace std;
using namespace nlohmann;

bool language_profile::has_compile_step() const {
    return !sandboxed && !compile_command.empty();
}

bool language_profile::has_check_step() const {
    return !sandboxed && !check_command.empty();
}

static bool tool_installed(const vector<string> &command) {
    if (command.empty()) return true;
    const string &tool = command.front();
    return tool.find('/') != string::npos || !which(tool).empty();
}

bool language_profile::installed() const {
    if (sandboxed) return true;
    return tool_installed(compile_command) && tool_installed(run_command);
}

static vector<string> expand_command(const vector<string> &command, const string &filename) {
    string stem = filesystem::path(filename).stem().string();
    vector<string> argv;
    argv.reserve(command.size());
    for (auto &arg : command) {
        string expanded = boost::algorithm::replace_all_copy(arg, "{file}", filename);
        boost::algorithm::replace_all(expanded, "{stem}", stem);
        argv.push_back(move(expanded));
    }
    return argv;
}

vector<string> language_profile::expand_compile_command(const string &filename) const {
    return expand_command(compile_command, filename);
}

vector<string> language_profile::expand_run_command(const string &filename) const {
    return expand_command(run_command, filename);
}

vector<string> language_profile::expand_check_command(const string &filename) const {
    return expand_command(check_command, filename);
}

void from_json(const json &j, language_profile &profile) {
    j.at("id").get_to(profile.id);
    if (j.count("name"))
        j.at("name").get_to(profile.display_name);
    else
        profile.display_name = profile.id;
    j.at("extension").get_to(profile.file_extension);
    if (j.count("defaultFilename"))
        j.at("defaultFilename").get_to(profile.default_filename);
    else
        profile.default_filename = "main" + profile.file_extension;
    if (j.count("sandboxed"))
        j.at("sandboxed").get_to(profile.sandboxed);
    if (j.count("compile"))
        j.at("compile").get_to(profile.compile_command);
    if (j.count("run"))
        j.at("run").get_to(profile.run_command);
    if (j.count("check"))
        j.at("check").get_to(profile.check_command);
    if (j.count("env"))
        j.at("env").get_to(profile.environment);
    if (j.count("memoryLimitBytes"))
        j.at("memoryLimitBytes").get_to(profile.memory_limit_bytes);
    if (j.count("timeoutMs"))
        profile.default_timeout = chrono::milliseconds(j.at("timeoutMs").get<long long>());
    if (j.count("compileTimeoutMs"))
        profile.compile_timeout = chrono::milliseconds(j.at("compileTimeoutMs").get<long long>());
}

void to_json(json &j, const language_profile &profile) {
    j = {{"id", profile.id},
         {"name", profile.display_name},
         {"extension", profile.file_extension},
         {"defaultFilename", profile.default_filename},
         {"sandboxed", profile.sandboxed},
         {"hasCompilation", profile.has_compile_step()},
         {"compile", profile.compile_command},
         {"run", profile.run_command},
         {"check", profile.check_command},
         {"env", profile.environment},
         {"memoryLimitBytes", profile.memory_limit_bytes},
         {"timeoutMs", profile.default_timeout.count()},
         {"compileTimeoutMs", profile.compile_timeout.count()}};
}

}  // namespace runbox
