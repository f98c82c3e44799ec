#include <filesystem>
#include "common/utils.hpp"
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "orchestrator.hpp"
#include "test/environment.hpp"
#include "test/request_builder.hpp"

using namespace std;
using namespace runbox;
using ::testing::HasSubstr;

class MultiLanguageTest : public ::testing::Test {
protected:
    static unique_ptr<execution_orchestrator> orchestrator;

    static void SetUpTestCase() {
        engine_config config = make_test_config("languages");
        config.max_timeout = chrono::milliseconds(60000);
        orchestrator = make_unique<execution_orchestrator>(config, make_shared<language_registry>(language_registry::builtin()));
    }

    static void TearDownTestCase() {
        auto root = orchestrator->config().workspace_root;
        orchestrator.reset();
        error_code ec;
        filesystem::remove_all(root, ec);
    }

    /**
     * @brief 语言配置中的工具链是否安装在当前机器上
     */
    static bool available(const string &lang) {
        auto &profile = orchestrator->languages().resolve(lang);
        if (profile.sandboxed) return true;
        if (profile.has_compile_step() && !has_command(profile.compile_command.front())) return false;
        const string &runner = profile.run_command.front();
        return runner.rfind("./", 0) == 0 || has_command(runner);
    }

    execution_result run(const string &lang, const string &source, const string &input = "") {
        return orchestrator->submit(request_builder(lang, source).input(input));
    }

    void test(const string &lang, const string &source, const string &expected = "hello world\n") {
        auto result = run(lang, source);
        EXPECT_EQ(result.status, status::SUCCEEDED) << result.stderr_data << result.message;
        EXPECT_EQ(result.stdout_data, expected);
        EXPECT_EQ(result.exit_code, 0);
    }
};

unique_ptr<execution_orchestrator> MultiLanguageTest::orchestrator;

#define REQUIRE_LANGUAGE(lang) \
    if (!available(lang)) GTEST_SKIP() << "toolchain of " << lang << " is not installed"

TEST_F(MultiLanguageTest, CTest) {
    REQUIRE_LANGUAGE("c");
    test("c", R"(
#include <stdio.h>
int main() { puts("hello world"); return 0; })");
}

TEST_F(MultiLanguageTest, CppTest) {
    REQUIRE_LANGUAGE("cpp");
    test("cpp", R"(
#include <iostream>
int main() { std::cout << "hello world" << std::endl; })");
}

TEST_F(MultiLanguageTest, CppReadsInput) {
    REQUIRE_LANGUAGE("cpp");
    auto result = run("cpp", R"(
#include <iostream>
int main() { int a, b; std::cin >> a >> b; std::cout << a + b << std::endl; })", "3 4\n");
    EXPECT_EQ(result.status, status::SUCCEEDED);
    EXPECT_EQ(result.stdout_data, "7\n");
    EXPECT_GE(result.compile_time_ms, 0);
}

TEST_F(MultiLanguageTest, CppCompileError) {
    REQUIRE_LANGUAGE("cpp");
    auto result = run("cpp", "int main() { return undefined_name; }");
    EXPECT_EQ(result.status, status::COMPILE_ERROR);
    EXPECT_EQ(result.stage, stage::COMPILE);
    EXPECT_THAT(result.stderr_data, HasSubstr("undefined_name"));
    EXPECT_EQ(result.execution_time_ms, 0);
}

TEST_F(MultiLanguageTest, CppDivisionByZero) {
    REQUIRE_LANGUAGE("cpp");
    auto result = run("cpp", R"(
#include <cstdlib>
int main() { volatile int zero = std::atoi("0"); return 1 / zero; })");
    EXPECT_EQ(result.status, status::RUNTIME_ERROR);
    EXPECT_EQ(result.stage, stage::EXECUTION);
    EXPECT_FALSE(result.success());
    ASSERT_TRUE(result.exit_code.has_value());
    EXPECT_NE(*result.exit_code, 0);
    EXPECT_FALSE(result.stderr_data.empty());
}

TEST_F(MultiLanguageTest, JavaTest) {
    REQUIRE_LANGUAGE("java");
    test("java", R"(
public class Main {
    public static void main(String[] args) {
        System.out.println("hello world");
    }
})");
}

TEST_F(MultiLanguageTest, GoTest) {
    REQUIRE_LANGUAGE("go");
    test("go", R"(package main
import "fmt"
func main() {
    fmt.Println("hello world")
})");
}

TEST_F(MultiLanguageTest, RustTest) {
    REQUIRE_LANGUAGE("rust");
    test("rust", R"(fn main() { println!("hello world"); })");
}

TEST_F(MultiLanguageTest, JavaScriptTest) {
    REQUIRE_LANGUAGE("javascript");
    test("javascript", R"(console.log("hello world"))");
    test("javascript", "console.log(2 + 2)", "4\n");
}

TEST_F(MultiLanguageTest, JavaScriptInfiniteLoopTimesOut) {
    REQUIRE_LANGUAGE("javascript");
    elapsed_time timer;
    auto result = orchestrator->submit(request_builder("javascript", "while (true) {}").timeout(2000));
    EXPECT_EQ(result.status, status::TIMED_OUT);
    EXPECT_GE(timer.milliseconds(), 2000);
    EXPECT_LT(timer.milliseconds(), 5000);

    orchestrator->flush_cleanup();
    EXPECT_EQ(count_processes_in(orchestrator->config().workspace_root), 0);
}

TEST_F(MultiLanguageTest, TypeScriptTest) {
    REQUIRE_LANGUAGE("typescript");
    test("typescript", R"(const greeting: string = "hello world"; console.log(greeting);)");
}

TEST_F(MultiLanguageTest, PythonTest) {
    REQUIRE_LANGUAGE("python");
    test("python", R"(print("hello world"))");
    test("python", "print('hi')", "hi\n");
}

TEST_F(MultiLanguageTest, PhpTest) {
    REQUIRE_LANGUAGE("php");
    test("php", R"(<?php echo "hello world\n";)");
}

TEST_F(MultiLanguageTest, RubyTest) {
    REQUIRE_LANGUAGE("ruby");
    test("ruby", R"(puts 'hello world')");
}

TEST_F(MultiLanguageTest, ShellTest) {
    REQUIRE_LANGUAGE("shell");
    test("shell", R"(echo "hello world")");
}
