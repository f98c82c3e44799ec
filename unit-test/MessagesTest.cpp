#include "common/messages.hpp"
#include "gtest/gtest.h"

using namespace std;
using namespace runbox;

TEST(MessagesTest, ParseRequest) {
    auto j = nlohmann::json::parse(R"({
        "id": "abc-1",
        "language": "cpp",
        "code": "int main() {}",
        "stdin": "1 2\n",
        "filename": "solution.cpp",
        "timeoutMs": 1500,
        "maxOutputBytes": 4096
    })");
    auto request = j.get<execution_request>();
    EXPECT_EQ(request.id, "abc-1");
    EXPECT_EQ(request.language, "cpp");
    EXPECT_EQ(request.source_code, "int main() {}");
    EXPECT_EQ(request.input, "1 2\n");
    EXPECT_EQ(request.filename, "solution.cpp");
    EXPECT_EQ(request.timeout, chrono::milliseconds(1500));
    EXPECT_EQ(request.max_output_bytes, 4096);
}

TEST(MessagesTest, OptionalRequestFieldsDefaultToEmpty) {
    auto request = nlohmann::json({{"language", "python"}, {"code", "print(1)"}, {"stdin", nullptr}}).get<execution_request>();
    EXPECT_TRUE(request.id.empty());
    EXPECT_TRUE(request.input.empty());
    EXPECT_TRUE(request.filename.empty());
    EXPECT_EQ(request.timeout.count(), 0);
    EXPECT_EQ(request.max_output_bytes, 0);
}

TEST(MessagesTest, RejectMalformedRequest) {
    EXPECT_THROW(nlohmann::json({{"language", "python"}}).get<execution_request>(), nlohmann::json::exception);
    EXPECT_THROW(nlohmann::json({{"language", "python"}, {"code", 42}}).get<execution_request>(), nlohmann::json::exception);
    EXPECT_THROW(nlohmann::json({{"language", "python"}, {"code", "x"}, {"timeoutMs", -1}}).get<execution_request>(), invalid_argument);
}

TEST(MessagesTest, SerializeResult) {
    execution_result result;
    result.execution_id = "abc";
    result.status = status::COMPILE_ERROR;
    result.stage = stage::COMPILE;
    result.stderr_data = "error: expected ';'";
    result.duration_ms = 120;
    result.compile_time_ms = 118;
    result.message = "compilation failed";

    nlohmann::json j = result;
    EXPECT_EQ(j["executionId"], "abc");
    EXPECT_EQ(j["success"], false);
    EXPECT_EQ(j["status"], "CompileError");
    EXPECT_EQ(j["stage"], "compile");
    EXPECT_EQ(j["stdout"], "");
    EXPECT_EQ(j["stderr"], "error: expected ';'");
    EXPECT_TRUE(j["exitCode"].is_null());
    EXPECT_EQ(j["compileTimeMs"], 118);
    EXPECT_EQ(j["executionTimeMs"], 0);
    EXPECT_EQ(j["truncated"]["stdout"], false);
    EXPECT_EQ(j["message"], "compilation failed");

    auto parsed = j.get<execution_result>();
    EXPECT_EQ(parsed.status, status::COMPILE_ERROR);
    EXPECT_EQ(parsed.stage, stage::COMPILE);
    EXPECT_FALSE(parsed.exit_code.has_value());
}

TEST(MessagesTest, SuccessOnlyForSucceededStatus) {
    execution_result result;
    result.status = status::SUCCEEDED;
    result.exit_code = 0;
    EXPECT_TRUE(result.success());
    EXPECT_EQ(nlohmann::json(result)["exitCode"], 0);

    result.status = status::RUNTIME_ERROR;
    EXPECT_FALSE(result.success());
}

TEST(MessagesTest, InvalidUtf8OutputIsReplaced) {
    execution_result result;
    result.status = status::SUCCEEDED;
    result.stdout_data = "ok\xff\xfe";
    nlohmann::json j = result;
    string line;
    ASSERT_NO_THROW(line = j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));
    EXPECT_NE(line.find("ok\xEF\xBF\xBD"), string::npos);
}

TEST(MessagesTest, SerializeEvents) {
    execution_event started{execution_event::type::STARTED, "abc", "python"};
    nlohmann::json j = started;
    EXPECT_EQ(j["event"], "started");
    EXPECT_EQ(j["executionId"], "abc");
    EXPECT_EQ(j["language"], "python");
    EXPECT_EQ(j.count("status"), 0);

    execution_event completed{execution_event::type::COMPLETED, "abc", "python", status::TIMED_OUT};
    j = completed;
    EXPECT_EQ(j["event"], "completed");
    EXPECT_EQ(j["status"], "TimedOut");
    EXPECT_EQ(j["success"], false);
}

TEST(MessagesTest, StatusNames) {
    EXPECT_EQ(status_from_string("QueueFull"), status::QUEUE_FULL);
    EXPECT_THROW(status_from_string("Accepted"), invalid_argument);
    EXPECT_STREQ(get_display_message(status::CAPABILITY_DENIED), "Capability Denied");
    EXPECT_FALSE(is_terminal(status::RUNNING));
    EXPECT_TRUE(is_terminal(status::CANCELLED));
}

TEST(MessagesTest, SerializeValidationReport) {
    validation_report report;
    report.execution_id = "v-1";
    report.valid = false;
    report.status = status::SUCCEEDED;
    report.checked = true;
    report.issues.push_back({validation_issue::type::SYNTAX, "invalid syntax", 3});
    report.issues.push_back({validation_issue::type::SECURITY, "use of eval()", nullopt});
    report.compile_output = "main.py:3: invalid syntax\n";

    nlohmann::json j = report;
    EXPECT_EQ(j["executionId"], "v-1");
    EXPECT_EQ(j["valid"], false);
    EXPECT_EQ(j["status"], "Succeeded");
    EXPECT_EQ(j["checked"], true);
    ASSERT_EQ(j["issues"].size(), 2);
    EXPECT_EQ(j["issues"][0]["type"], "syntax");
    EXPECT_EQ(j["issues"][0]["line"], 3);
    EXPECT_EQ(j["issues"][1]["type"], "security");
    EXPECT_TRUE(j["issues"][1]["line"].is_null());
    EXPECT_EQ(j["compileOutput"], "main.py:3: invalid syntax\n");
    EXPECT_EQ(j.count("message"), 0);
}

TEST(MessagesTest, SerializeEngineStatus) {
    engine_status s;
    s.version = "1.0";
    s.platform = "Linux";
    s.architecture = "x86_64";
    s.max_concurrency = 4;
    s.max_queue_depth = 64;
    s.active = 1;
    s.queued = 2;
    s.languages.push_back({"python", "Python", true, true});

    nlohmann::json j = s;
    EXPECT_EQ(j["platform"], "Linux");
    EXPECT_EQ(j["concurrency"], 4);
    EXPECT_EQ(j["queueDepth"], 64);
    EXPECT_EQ(j["active"], 1);
    EXPECT_EQ(j["queued"], 2);
    EXPECT_EQ(j["languages"][0]["id"], "python");
    EXPECT_EQ(j["languages"][0]["sandboxed"], true);
    EXPECT_EQ(j["languages"][0]["available"], true);
}
