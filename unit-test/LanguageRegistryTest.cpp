#include <algorithm>
#include "common/exceptions.hpp"
#include "gtest/gtest.h"
#include "language/registry.hpp"

using namespace std;
using namespace runbox;

class LanguageRegistryTest : public ::testing::Test {
protected:
    static nlohmann::json script_language() {
        return {{"id", "script"},
                {"extension", ".sh"},
                {"run", {"sh", "{file}"}}};
    }

    static nlohmann::json table_of(std::initializer_list<nlohmann::json> profiles) {
        nlohmann::json table = nlohmann::json::array();
        for (auto &profile : profiles)
            table.push_back(profile);
        return table;
    }
};

TEST_F(LanguageRegistryTest, BuiltinTableContainsAllLanguages) {
    auto registry = language_registry::builtin();
    EXPECT_EQ(registry.size(), 11);
    for (const char *id : {"javascript", "typescript", "python", "java", "c", "cpp", "go", "rust", "php", "ruby", "shell"})
        EXPECT_TRUE(registry.supports(id)) << id;
}

TEST_F(LanguageRegistryTest, ResolveUnknownLanguage) {
    auto registry = language_registry::builtin();
    EXPECT_THROW(registry.resolve("cobol"), unsupported_language);
    EXPECT_THROW(registry.resolve(""), unsupported_language);
    EXPECT_FALSE(registry.supports("Python"));
}

TEST_F(LanguageRegistryTest, ListIsSortedById) {
    auto registry = language_registry::builtin();
    auto list = registry.list();
    ASSERT_EQ(list.size(), registry.size());
    EXPECT_TRUE(is_sorted(list.begin(), list.end(), [](auto a, auto b) { return a->id < b->id; }));
}

TEST_F(LanguageRegistryTest, PythonRunsInSandbox) {
    auto registry = language_registry::builtin();
    auto &python = registry.resolve("python");
    EXPECT_TRUE(python.sandboxed);
    EXPECT_FALSE(python.has_compile_step());
    EXPECT_FALSE(registry.resolve("javascript").sandboxed);
}

TEST_F(LanguageRegistryTest, CompiledLanguagesHaveCompileStep) {
    auto registry = language_registry::builtin();
    EXPECT_TRUE(registry.resolve("cpp").has_compile_step());
    EXPECT_TRUE(registry.resolve("c").has_compile_step());
    EXPECT_TRUE(registry.resolve("java").has_compile_step());
    EXPECT_FALSE(registry.resolve("ruby").has_compile_step());
}

TEST_F(LanguageRegistryTest, JavaCommandsUseClassName) {
    auto registry = language_registry::builtin();
    auto &java = registry.resolve("java");
    EXPECT_EQ(java.default_filename, "Main.java");
    EXPECT_EQ(java.expand_compile_command("Main.java"), (vector<string>{"javac", "-encoding", "UTF-8", "Main.java"}));
    EXPECT_EQ(java.expand_run_command("Main.java"), (vector<string>{"java", "-cp", ".", "Main"}));
}

TEST_F(LanguageRegistryTest, LoadFromJson) {
    nlohmann::json table = nlohmann::json::array();
    table.push_back(script_language());
    table.push_back({{"id", "awk"},
                     {"name", "AWK"},
                     {"extension", ".awk"},
                     {"run", {"awk", "-f", "{file}"}},
                     {"env", {"LC_ALL=C"}},
                     {"timeoutMs", 2500}});

    auto registry = language_registry::from_json(table);
    EXPECT_EQ(registry.size(), 2);

    auto &script = registry.resolve("script");
    EXPECT_EQ(script.display_name, "script");
    EXPECT_EQ(script.default_filename, "main.sh");
    EXPECT_FALSE(script.has_compile_step());

    auto &awk = registry.resolve("awk");
    EXPECT_EQ(awk.display_name, "AWK");
    EXPECT_EQ(awk.default_timeout, chrono::milliseconds(2500));
    EXPECT_EQ(awk.environment, vector<string>{"LC_ALL=C"});
    EXPECT_EQ(awk.expand_run_command("prog.awk"), (vector<string>{"awk", "-f", "prog.awk"}));
}

TEST_F(LanguageRegistryTest, RejectsMalformedTables) {
    EXPECT_THROW(language_registry::from_json(script_language()), invalid_argument);
    EXPECT_THROW(language_registry::from_json(nlohmann::json::array()), invalid_argument);

    EXPECT_THROW(language_registry::from_json(table_of({script_language(), script_language()})), invalid_argument);

    auto no_run = script_language();
    no_run.erase("run");
    EXPECT_THROW(language_registry::from_json(table_of({no_run})), invalid_argument);

    auto bad_extension = script_language();
    bad_extension["extension"] = "sh";
    EXPECT_THROW(language_registry::from_json(table_of({bad_extension})), invalid_argument);

    auto bad_filename = script_language();
    bad_filename["defaultFilename"] = "../main.sh";
    EXPECT_THROW(language_registry::from_json(table_of({bad_filename})), invalid_argument);

    auto bad_env = script_language();
    bad_env["env"] = {"NOVALUE"};
    EXPECT_THROW(language_registry::from_json(table_of({bad_env})), invalid_argument);
}

TEST_F(LanguageRegistryTest, SandboxedLanguageNeedsNoCommand) {
    nlohmann::json python = {{"id", "py"}, {"extension", ".py"}, {"sandboxed", true}};
    auto registry = language_registry::from_json(table_of({python}));
    EXPECT_TRUE(registry.resolve("py").sandboxed);
}

TEST_F(LanguageRegistryTest, ScriptLanguagesHaveCheckCommand) {
    auto builtin = language_registry::builtin();
    EXPECT_EQ(builtin.resolve("javascript").expand_check_command("main.js"), (vector<string>{"node", "--check", "main.js"}));
    EXPECT_EQ(builtin.resolve("shell").expand_check_command("main.sh"), (vector<string>{"bash", "-n", "main.sh"}));
    EXPECT_TRUE(builtin.resolve("php").has_check_step());
    EXPECT_FALSE(builtin.resolve("typescript").has_check_step());
    EXPECT_FALSE(builtin.resolve("python").has_check_step());

    auto j = script_language();
    j["check"] = {"sh", "-n", "{file}"};
    auto registry = language_registry::from_json(table_of({j}));
    EXPECT_EQ(registry.resolve("script").check_command, (vector<string>{"sh", "-n", "{file}"}));
}

TEST_F(LanguageRegistryTest, InstalledChecksToolchain) {
    EXPECT_TRUE(language_registry::builtin().resolve("python").installed());

    auto j = script_language();
    auto registry = language_registry::from_json(table_of({j}));
    EXPECT_TRUE(registry.resolve("script").installed());

    j["run"] = {"runbox-tool-that-does-not-exist", "{file}"};
    registry = language_registry::from_json(table_of({j}));
    EXPECT_FALSE(registry.resolve("script").installed());

    // 编译产物在编译之前不存在，不检查
    j["compile"] = {"sh", "-c", "true"};
    j["run"] = {"./program"};
    registry = language_registry::from_json(table_of({j}));
    EXPECT_TRUE(registry.resolve("script").installed());
}
