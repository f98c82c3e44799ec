#include <filesystem>
#include <sstream>
#include <thread>
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "server/request_server.hpp"
#include "test/environment.hpp"

using namespace std;
using namespace runbox;
using ::testing::HasSubstr;
namespace fs = std::filesystem;

class RequestServerTest : public ::testing::Test {
protected:
    engine_config config;
    shared_ptr<const language_registry> registry;
    unique_ptr<execution_orchestrator> orchestrator;
    ostringstream out;
    mutex out_mutex;

    void SetUp() override {
        config = make_test_config("server");
        auto interpreted = make_script_profile("sh");
        interpreted.compile_command.clear();
        registry = make_shared<language_registry>(vector<language_profile>{make_script_profile(), interpreted});
        orchestrator = make_unique<execution_orchestrator>(config, registry);
    }

    void TearDown() override {
        orchestrator.reset();
        error_code ec;
        fs::remove_all(config.workspace_root, ec);
    }

    vector<nlohmann::json> lines() {
        scoped_lock guard(out_mutex);
        vector<nlohmann::json> result;
        istringstream in(out.str());
        string line;
        while (getline(in, line))
            result.push_back(nlohmann::json::parse(line));
        return result;
    }
};

TEST_F(RequestServerTest, ResultsAreWritten) {
    {
        request_server server(*orchestrator, out, out_mutex);
        istringstream in(
            R"({"id": "a", "language": "sh", "code": "echo one"})"
            "\n\n"
            R"({"id": "b", "language": "sh", "code": "echo two"})"
            "\n");
        server.serve(in);
    }

    auto results = lines();
    ASSERT_EQ(results.size(), 2);
    map<string, string> stdout_by_id;
    for (auto &j : results)
        stdout_by_id[j.at("executionId").get<string>()] = j.at("stdout").get<string>();
    EXPECT_EQ(stdout_by_id["a"], "one\n");
    EXPECT_EQ(stdout_by_id["b"], "two\n");
}

TEST_F(RequestServerTest, FinishedThreadsAreReaped) {
    request_server server(*orchestrator, out, out_mutex);
    for (int i = 0; i < 3; ++i)
        server.handle(R"({"language": "sh", "code": "true"})");

    auto deadline = chrono::steady_clock::now() + chrono::seconds(10);
    while (server.running() > 0 && chrono::steady_clock::now() < deadline)
        this_thread::sleep_for(chrono::milliseconds(10));
    EXPECT_EQ(server.running(), 0);
    EXPECT_EQ(lines().size(), 3);
}

TEST_F(RequestServerTest, MalformedLine) {
    request_server server(*orchestrator, out, out_mutex);
    server.handle("{not json");
    server.handle(R"({"id": "x", "language": "sh"})");

    auto results = lines();
    ASSERT_EQ(results.size(), 2);
    EXPECT_EQ(results[0].at("status"), "ValidationFailed");
    EXPECT_THAT(results[0].at("message").get<string>(), HasSubstr("malformed request"));
    EXPECT_EQ(results[1].at("executionId"), "x");
    EXPECT_EQ(results[1].at("status"), "ValidationFailed");
}

TEST_F(RequestServerTest, CancelUnknownExecution) {
    request_server server(*orchestrator, out, out_mutex);
    server.handle(R"({"cancel": "nobody"})");

    auto results = lines();
    ASSERT_EQ(results.size(), 1);
    EXPECT_EQ(results[0].at("event"), "cancel");
    EXPECT_EQ(results[0].at("cancelled"), false);
}

TEST_F(RequestServerTest, ValidateDoesNotRun) {
    {
        request_server server(*orchestrator, out, out_mutex);
        server.handle(R"({"validate": {"id": "v", "language": "script", "code": "if [ \"$1\" = compile ]; then echo bad >&2; exit 1; fi\necho ran\n"}})");
        server.wait();
    }

    auto results = lines();
    ASSERT_EQ(results.size(), 1);
    EXPECT_EQ(results[0].at("event"), "validate");
    EXPECT_EQ(results[0].at("executionId"), "v");
    EXPECT_EQ(results[0].at("valid"), false);
    EXPECT_EQ(results[0].at("checked"), true);
    EXPECT_THAT(results[0].at("compileOutput").get<string>(), HasSubstr("bad"));
    EXPECT_EQ(results[0].at("issues").at(0).at("type"), "syntax");
}

TEST_F(RequestServerTest, SystemStatus) {
    request_server server(*orchestrator, out, out_mutex);
    server.handle(R"({"system": true})");

    auto results = lines();
    ASSERT_EQ(results.size(), 1);
    auto &system = results[0].at("system");
    EXPECT_EQ(system.at("version"), ENGINE_VERSION);
    EXPECT_EQ(system.at("concurrency"), config.max_concurrency);
    EXPECT_EQ(system.at("active"), 0);
    EXPECT_EQ(system.at("queued"), 0);
    EXPECT_EQ(system.at("languages").size(), 2);
}
