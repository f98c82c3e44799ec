#include "language/registry.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <stdexcept>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"

namespace runbox {
using namespace std;

static constexpr size_t MB = 1 << 20;

static void verify_profile(const language_profile &profile) {
    if (!is_safe_identifier(profile.id))
        throw invalid_argument(fmt::format("language id '{}' is malformed", profile.id));
    if (profile.file_extension.empty() || profile.file_extension.front() != '.')
        throw invalid_argument(fmt::format("language {}: extension must start with '.'", profile.id));
    try {
        assert_safe_path(profile.default_filename);
    } catch (validation_error &e) {
        throw invalid_argument(fmt::format("language {}: {}", profile.id, e.what()));
    }
    if (!profile.sandboxed && profile.run_command.empty())
        throw invalid_argument(fmt::format("language {}: run command is required", profile.id));
    if (profile.default_timeout.count() <= 0 || profile.compile_timeout.count() <= 0)
        throw invalid_argument(fmt::format("language {}: timeouts must be positive", profile.id));
    for (auto &env : profile.environment)
        if (env.find('=') == string::npos || env.front() == '=')
            throw invalid_argument(fmt::format("language {}: environment '{}' should be KEY=VALUE", profile.id, env));
}

language_registry::language_registry(vector<language_profile> list) {
    for (auto &profile : list) {
        verify_profile(profile);
        string id = profile.id;
        if (!profiles.emplace(id, move(profile)).second)
            throw invalid_argument("duplicated language " + id);
    }
    if (profiles.empty())
        throw invalid_argument("language table is empty");
}

static language_profile make_profile(const string &id, const string &name, const string &extension,
                                     vector<string> compile, vector<string> run,
                                     size_t memory_limit, long long timeout_ms) {
    language_profile profile;
    profile.id = id;
    profile.display_name = name;
    profile.file_extension = extension;
    profile.default_filename = "main" + extension;
    profile.compile_command = move(compile);
    profile.run_command = move(run);
    profile.memory_limit_bytes = memory_limit;
    profile.default_timeout = chrono::milliseconds(timeout_ms);
    return profile;
}

language_registry language_registry::builtin() {
    vector<language_profile> list;

    // clang-format off
    list.push_back(make_profile("javascript", "JavaScript", ".js", {}, {"node", "{file}"}, 0, 10000));
    list.push_back(make_profile("typescript", "TypeScript", ".ts", {}, {"ts-node", "{file}"}, 0, 15000));
    list.push_back(make_profile("c", "C", ".c", {"gcc", "-std=c11", "-o", "program", "{file}", "-lm"}, {"./program"}, 512 * MB, 10000));
    list.push_back(make_profile("cpp", "C++", ".cpp", {"g++", "-std=c++17", "-o", "program", "{file}"}, {"./program"}, 512 * MB, 10000));
    list.push_back(make_profile("go", "Go", ".go", {}, {"go", "run", "{file}"}, 0, 20000));
    list.push_back(make_profile("rust", "Rust", ".rs", {"rustc", "-o", "program", "{file}"}, {"./program"}, 512 * MB, 10000));
    list.push_back(make_profile("php", "PHP", ".php", {}, {"php", "{file}"}, 512 * MB, 10000));
    list.push_back(make_profile("ruby", "Ruby", ".rb", {}, {"ruby", "{file}"}, 512 * MB, 10000));
    list.push_back(make_profile("shell", "Shell", ".sh", {}, {"bash", "{file}"}, 512 * MB, 10000));
    // clang-format on

    // 脚本语言的语法检查命令
    for (auto &profile : list) {
        if (profile.id == "javascript") profile.check_command = {"node", "--check", "{file}"};
        else if (profile.id == "php") profile.check_command = {"php", "-l", "{file}"};
        else if (profile.id == "ruby") profile.check_command = {"ruby", "-c", "{file}"};
        else if (profile.id == "shell") profile.check_command = {"bash", "-n", "{file}"};
        else if (profile.id == "go") profile.check_command = {"gofmt", "-l", "-e", "{file}"};
    }

    {
        auto java = make_profile("java", "Java", ".java", {"javac", "-encoding", "UTF-8", "{file}"}, {"java", "-cp", ".", "{stem}"}, 0, 15000);
        java.default_filename = "Main.java";
        list.push_back(move(java));
    }

    {
        // Python 在引擎内嵌的解释器中执行，不创建子进程
        auto python = make_profile("python", "Python", ".py", {}, {}, 0, 10000);
        python.sandboxed = true;
        list.push_back(move(python));
    }

    return language_registry(move(list));
}

language_registry language_registry::from_json(const nlohmann::json &j) {
    if (!j.is_array())
        throw invalid_argument("language table should be a JSON array");
    return language_registry(j.get<vector<language_profile>>());
}

language_registry language_registry::load(const filesystem::path &path) {
    if (!filesystem::is_regular_file(path))
        throw invalid_argument("language table " + path.string() + " does not exist");
    nlohmann::json j = nlohmann::json::parse(read_file_content(path));
    auto registry = from_json(j);
    LOG(INFO) << "Loaded " << registry.size() << " languages from " << path;
    return registry;
}

const language_profile &language_registry::resolve(const string &language_id) const {
    auto it = profiles.find(language_id);
    if (it == profiles.end())
        throw unsupported_language(language_id);
    return it->second;
}

bool language_registry::supports(const string &language_id) const {
    return profiles.count(language_id) > 0;
}

vector<const language_profile *> language_registry::list() const {
    vector<const language_profile *> result;
    for (auto &[id, profile] : profiles)
        result.push_back(&profile);
    return result;
}

size_t language_registry::size() const {
    return profiles.size();
}

}  // namespace runbox
