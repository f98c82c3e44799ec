#include "common/messages.hpp"

namespace runbox {
using namespace std;
using namespace nlohmann;

bool execution_result::success() const {
    return status == runbox::status::SUCCEEDED;
}

void from_json(const json &j, execution_request &request) {
    if (j.count("id") && !j.at("id").is_null())
        j.at("id").get_to(request.id);
    j.at("language").get_to(request.language);
    j.at("code").get_to(request.source_code);
    if (j.count("stdin") && !j.at("stdin").is_null())
        j.at("stdin").get_to(request.input);
    if (j.count("filename") && !j.at("filename").is_null())
        j.at("filename").get_to(request.filename);
    if (j.count("timeoutMs") && !j.at("timeoutMs").is_null()) {
        long long timeout = j.at("timeoutMs").get<long long>();
        if (timeout < 0) throw invalid_argument("timeoutMs must not be negative");
        request.timeout = chrono::milliseconds(timeout);
    }
    if (j.count("maxOutputBytes") && !j.at("maxOutputBytes").is_null())
        j.at("maxOutputBytes").get_to(request.max_output_bytes);
}

void to_json(json &j, const execution_request &request) {
    j = {{"id", request.id},
         {"language", request.language},
         {"code", request.source_code},
         {"stdin", request.input},
         {"timeoutMs", request.timeout.count()},
         {"maxOutputBytes", request.max_output_bytes}};
    if (!request.filename.empty())
        j["filename"] = request.filename;
}

void from_json(const json &j, execution_result &result) {
    j.at("executionId").get_to(result.execution_id);
    result.status = status_from_string(j.at("status").get<string>());
    result.stage = stage_from_string(j.at("stage").get<string>());
    j.at("stdout").get_to(result.stdout_data);
    j.at("stderr").get_to(result.stderr_data);
    if (j.count("exitCode") && !j.at("exitCode").is_null())
        result.exit_code = j.at("exitCode").get<int>();
    else
        result.exit_code.reset();
    j.at("durationMs").get_to(result.duration_ms);
    j.at("compileTimeMs").get_to(result.compile_time_ms);
    j.at("executionTimeMs").get_to(result.execution_time_ms);
    if (j.count("message"))
        j.at("message").get_to(result.message);
    if (j.count("truncated")) {
        auto &truncated = j.at("truncated");
        truncated.at("stdout").get_to(result.stdout_truncated);
        truncated.at("stderr").get_to(result.stderr_truncated);
    }
}

void to_json(json &j, const execution_result &result) {
    j = {{"executionId", result.execution_id},
         {"success", result.success()},
         {"status", to_string(result.status)},
         {"stage", to_string(result.stage)},
         {"stdout", result.stdout_data},
         {"stderr", result.stderr_data},
         {"durationMs", result.duration_ms},
         {"compileTimeMs", result.compile_time_ms},
         {"executionTimeMs", result.execution_time_ms},
         {"truncated", {{"stdout", result.stdout_truncated}, {"stderr", result.stderr_truncated}}}};
    if (result.exit_code)
        j["exitCode"] = *result.exit_code;
    else
        j["exitCode"] = nullptr;
    if (!result.message.empty())
        j["message"] = result.message;
}

void to_json(json &j, const execution_event &event) {
    j = {{"event", event.kind == execution_event::type::STARTED ? "started" : "completed"},
         {"executionId", event.execution_id}};
    if (!event.language.empty())
        j["language"] = event.language;
    if (event.kind == execution_event::type::COMPLETED) {
        j["status"] = to_string(event.status);
        j["success"] = event.status == status::SUCCEEDED;
    }
}

void to_json(json &j, const validation_issue &issue) {
    j = {{"type", issue.kind == validation_issue::type::SYNTAX ? "syntax" : "security"},
         {"message", issue.message}};
    if (issue.line)
        j["line"] = *issue.line;
    else
        j["line"] = nullptr;
}

void to_json(json &j, const validation_report &report) {
    j = {{"executionId", report.execution_id},
         {"valid", report.valid},
         {"status", to_string(report.status)},
         {"checked", report.checked},
         {"issues", report.issues},
         {"compileOutput", report.compile_output},
         {"durationMs", report.duration_ms}};
    if (!report.message.empty())
        j["message"] = report.message;
}

void to_json(json &j, const language_status &language) {
    j = {{"id", language.id},
         {"name", language.name},
         {"sandboxed", language.sandboxed},
         {"available", language.available}};
}

void to_json(json &j, const engine_status &status) {
    j = {{"version", status.version},
         {"platform", status.platform},
         {"architecture", status.architecture},
         {"uptimeMs", status.uptime_ms},
         {"concurrency", status.max_concurrency},
         {"queueDepth", status.max_queue_depth},
         {"active", status.active},
         {"queued", status.queued},
         {"languages", status.languages}};
}

}  // namespace runbox
