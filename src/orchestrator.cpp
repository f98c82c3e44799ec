#include "orchestrator.hpp"
#include <boost/exception/diagnostic_information.hpp>
#include <fmt/core.h>
#include <glog/logging.h>
#include <sys/utsname.h>
#include <cstring>
#include <algorithm>
#include <regex>
#include <sstream>
#include "common/defer.hpp"
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/python.hpp"
#include "common/utils.hpp"

namespace runbox {
using namespace std;

static execution_result failure(const string &execution_id, status s, const string &message) {
    execution_result result;
    result.execution_id = execution_id;
    result.status = s;
    result.message = message;
    return result;
}

/**
 * @brief 在 stderr 末尾追加一行退出状态的说明
 */
static void append_diagnostic(string &stderr_data, const string &line) {
    if (!stderr_data.empty() && stderr_data.back() != '\n') stderr_data += '\n';
    stderr_data += line;
    stderr_data += '\n';
}

execution_orchestrator::execution_orchestrator(engine_config config, shared_ptr<const language_registry> registry)
    : conf(move(config)),
      registry(move(registry)),
      workspaces(conf.workspace_root),
      limiter(conf.max_concurrency, conf.max_queue_depth) {
    conf.validate();
    if (!this->registry)
        throw invalid_argument("language registry is required");

    auto profiles = this->registry->list();
    bool needs_sandbox = any_of(profiles.begin(), profiles.end(), [](const language_profile *p) { return p->sandboxed; });
    if (needs_sandbox) {
        python_interpreter::initialize();
        sandbox = make_unique<python_sandbox>();
    }

    LOG(INFO) << fmt::format("Execution engine started [languages: {}, concurrency: {}, queue depth: {}, workspace: {}]",
                             this->registry->size(), conf.max_concurrency, conf.max_queue_depth, conf.workspace_root.string());
}

void execution_orchestrator::register_monitor(unique_ptr<monitor> &&m) {
    monitors.push_back(move(m));
}

void execution_orchestrator::call_monitor(const string &execution_id, const function<void(monitor &)> &callback) {
    for (auto &m : monitors) {
        try {
            callback(*m);
        } catch (std::exception &ex) {
            LOG(ERROR) << "Monitor failed when reporting execution " << execution_id << ", " << ex.what();
        }
    }
}

shared_ptr<atomic<bool>> execution_orchestrator::track(const string &execution_id) {
    scoped_lock guard(running_mutex);
    if (running.count(execution_id))
        throw validation_error(fmt::format("execution id {} is already in use", execution_id));
    auto flag = make_shared<atomic<bool>>(false);
    running[execution_id] = flag;
    return flag;
}

void execution_orchestrator::untrack(const string &execution_id) {
    scoped_lock guard(running_mutex);
    running.erase(execution_id);
}

bool execution_orchestrator::cancel(const string &execution_id) {
    scoped_lock guard(running_mutex);
    auto it = running.find(execution_id);
    if (it == running.end()) return false;
    LOG(INFO) << "Execution " << execution_id << " cancellation requested";
    *it->second = true;
    return true;
}

chrono::milliseconds execution_orchestrator::effective_timeout(const execution_request &request, const language_profile &profile) const {
    auto timeout = request.timeout.count() > 0 ? request.timeout : profile.default_timeout;
    return min(timeout, conf.max_timeout);
}

size_t execution_orchestrator::effective_output_limit(const execution_request &request) const {
    if (request.max_output_bytes == 0) return conf.default_max_output_bytes;
    return min(request.max_output_bytes, conf.max_output_bytes);
}

void execution_orchestrator::verify_request(const execution_request &request) const {
    if (request.source_code.empty())
        throw validation_error("source code is empty");
    if (request.source_code.size() > conf.max_source_bytes)
        throw validation_error(fmt::format("source code exceeds {} bytes", conf.max_source_bytes));
    if (!is_safe_identifier(request.id))
        throw validation_error(fmt::format("malformed execution id: {}", request.id));
    if (!request.filename.empty())
        assert_safe_path(request.filename);
    if (request.timeout.count() < 0)
        throw validation_error("timeout must not be negative");
}

execution_result execution_orchestrator::submit(execution_request request) {
    elapsed_time timer;
    if (request.id.empty()) request.id = generate_execution_id();

    execution_result result;
    bool started = false;
    try {
        verify_request(request);
        const language_profile &profile = registry->resolve(request.language);

        auto cancelled = track(request.id);
        defer { untrack(request.id); };

        LOG(INFO) << "Execution " << request.id << " queued [language: " << request.language << "]";
        concurrency_slot slot = limiter.acquire();

        if (*cancelled) {
            result = failure(request.id, status::CANCELLED, "cancelled before start");
        } else {
            started = true;
            call_monitor(request.id, [&](monitor &m) { m.start_execution(request); });
            result = execute(request, profile, *cancelled);
        }
    } catch (validation_error &ex) {
        result = failure(request.id, status::VALIDATION_FAILED, ex.what());
    } catch (unsupported_language &ex) {
        result = failure(request.id, status::UNSUPPORTED_LANGUAGE, ex.what());
    } catch (queue_full &ex) {
        result = failure(request.id, status::QUEUE_FULL, ex.what());
    } catch (spawn_error &ex) {
        result = failure(request.id, status::SPAWN_ERROR, ex.what());
    } catch (std::exception &ex) {
        LOG(ERROR) << "Execution " << request.id << " failed with internal error: " << boost::diagnostic_information(ex);
        result = failure(request.id, status::INTERNAL_ERROR, ex.what());
    }

    result.duration_ms = timer.milliseconds();
    if (started)
        call_monitor(request.id, [&](monitor &m) { m.end_execution(request, result); });
    LOG(INFO) << fmt::format("Execution {} finished: {} ({} ms)", request.id, to_string(result.status), result.duration_ms);
    return result;
}

void execution_orchestrator::schedule_cleanup(const workspace &ws) {
    if (conf.debug) {
        LOG(INFO) << "Debug mode enabled, keeping workspace " << ws.path;
        return;
    }
    try {
        cleaner.schedule("workspace " + ws.execution_id, conf.cleanup_delay, [this, ws] { workspaces.destroy(ws); });
    } catch (std::exception &ex) {
        LOG(ERROR) << "Unable to schedule deletion of workspace " << ws.path << ", deleting now: " << ex.what();
        workspaces.destroy(ws);
    }
}

execution_result execution_orchestrator::execute(const execution_request &request, const language_profile &profile, const atomic<bool> &cancelled) {
    workspace ws = workspaces.allocate(request.id);
    defer { schedule_cleanup(ws); };

    string filename = request.filename.empty() ? profile.default_filename : request.filename;
    workspaces.write(ws, filename, request.source_code);

    if (profile.sandboxed) {
        if (!sandbox) throw internal_error("sandbox is not available");
        return run_sandboxed(request, filename, cancelled);
    } else {
        return run_process(request, profile, ws, filename, cancelled);
    }
}

execution_result execution_orchestrator::run_process(const execution_request &request, const language_profile &profile,
                                                     const workspace &ws, const string &filename, const atomic<bool> &cancelled) {
    execution_result result;
    result.execution_id = request.id;
    size_t output_limit = effective_output_limit(request);

    if (profile.has_compile_step()) {
        LOG(INFO) << "Execution " << request.id << " compiling";
        process_options compile;
        compile.command = profile.expand_compile_command(filename);
        compile.work_dir = ws.path;
        compile.env = profile.environment;
        compile.timeout = profile.compile_timeout;
        compile.kill_delay = conf.kill_delay;
        compile.max_output_bytes = output_limit;
        compile.file_size_limit = conf.file_size_limit;

        process_result compiled = runner.run(compile, &cancelled);
        result.compile_time_ms = compiled.duration_ms;

        if (!compiled.succeeded()) {
            result.stage = stage::COMPILE;
            result.stdout_data = move(compiled.stdout_data);
            result.stderr_data = move(compiled.stderr_data);
            result.stdout_truncated = compiled.stdout_truncated;
            result.stderr_truncated = compiled.stderr_truncated;
            switch (compiled.kind) {
                case process_result::outcome::SPAWN_FAILED:
                    result.status = status::SPAWN_ERROR;
                    result.message = compiled.error;
                    break;
                case process_result::outcome::TIMED_OUT:
                    result.status = status::TIMED_OUT;
                    result.message = fmt::format("compilation exceeded {} ms", profile.compile_timeout.count());
                    break;
                case process_result::outcome::CANCELLED:
                    result.status = status::CANCELLED;
                    result.message = "cancelled during compilation";
                    break;
                default:
                    result.status = status::COMPILE_ERROR;
                    result.exit_code = compiled.exit_code;
                    result.message = "compilation failed: " + compiled.describe();
                    break;
            }
            return result;
        }
    }

    LOG(INFO) << "Execution " << request.id << " running";
    process_options run;
    run.command = profile.expand_run_command(filename);
    run.work_dir = ws.path;
    run.env = profile.environment;
    run.input = request.input;
    run.timeout = effective_timeout(request, profile);
    run.kill_delay = conf.kill_delay;
    run.max_output_bytes = output_limit;
    run.memory_limit = profile.memory_limit_bytes;
    run.file_size_limit = conf.file_size_limit;

    process_result ran = runner.run(run, &cancelled);
    result.stage = stage::EXECUTION;
    result.execution_time_ms = ran.duration_ms;
    result.stdout_data = move(ran.stdout_data);
    result.stderr_data = move(ran.stderr_data);
    result.stdout_truncated = ran.stdout_truncated;
    result.stderr_truncated = ran.stderr_truncated;

    switch (ran.kind) {
        case process_result::outcome::EXITED:
            result.exit_code = ran.exit_code;
            if (ran.exit_code == 0) {
                result.status = status::SUCCEEDED;
            } else {
                result.status = status::RUNTIME_ERROR;
                result.message = ran.describe();
                append_diagnostic(result.stderr_data, ran.describe());
            }
            break;
        case process_result::outcome::SIGNALED:
            result.exit_code = ran.exit_code;
            result.status = status::RUNTIME_ERROR;
            result.message = ran.describe();
            append_diagnostic(result.stderr_data, ran.describe());
            break;
        case process_result::outcome::TIMED_OUT:
            result.status = status::TIMED_OUT;
            result.message = fmt::format("time limit of {} ms exceeded", run.timeout.count());
            break;
        case process_result::outcome::CANCELLED:
            result.status = status::CANCELLED;
            result.message = "cancelled";
            break;
        case process_result::outcome::SPAWN_FAILED:
            result.status = status::SPAWN_ERROR;
            result.message = ran.error;
            break;
    }
    return result;
}

execution_result execution_orchestrator::run_sandboxed(const execution_request &request, const string &filename, const atomic<bool> &cancelled) {
    const language_profile &profile = registry->resolve(request.language);

    sandbox_options options;
    options.source = request.source_code;
    options.filename = filename;
    options.input = request.input;
    options.timeout = effective_timeout(request, profile);
    options.max_output_bytes = effective_output_limit(request);

    LOG(INFO) << "Execution " << request.id << " running in sandbox";
    sandbox_result ran = sandbox->run(options, &cancelled);

    execution_result result;
    result.execution_id = request.id;
    result.stage = stage::EXECUTION;
    result.execution_time_ms = ran.duration_ms;
    result.exit_code = ran.exit_code;
    result.stdout_data = move(ran.stdout_data);
    result.stderr_data = move(ran.stderr_data);
    result.stdout_truncated = ran.stdout_truncated;
    result.stderr_truncated = ran.stderr_truncated;
    result.message = ran.message;

    switch (ran.kind) {
        case sandbox_result::outcome::COMPLETED:
            result.status = status::SUCCEEDED;
            result.message.clear();
            break;
        case sandbox_result::outcome::COMPILE_ERROR:
            // 语法检查相当于编译步骤，运行步骤没有开始
            result.status = status::COMPILE_ERROR;
            result.stage = stage::COMPILE;
            result.compile_time_ms = ran.duration_ms;
            result.execution_time_ms = 0;
            break;
        case sandbox_result::outcome::RUNTIME_ERROR:
            result.status = status::RUNTIME_ERROR;
            break;
        case sandbox_result::outcome::CAPABILITY_DENIED:
            result.status = status::CAPABILITY_DENIED;
            break;
        case sandbox_result::outcome::TIMED_OUT:
            result.status = status::TIMED_OUT;
            result.message = fmt::format("time limit of {} ms exceeded", options.timeout.count());
            break;
        case sandbox_result::outcome::CANCELLED:
            result.status = status::CANCELLED;
            break;
        case sandbox_result::outcome::INTERNAL_ERROR:
            result.status = status::INTERNAL_ERROR;
            break;
    }
    return result;
}

struct security_pattern {
    regex pattern;
    const char *message;
};

// 只是提示：这些调用本身在对应的语言中是合法的
static const security_pattern SECURITY_PATTERNS[] = {
    {regex(R"(\beval\s*\()"), "use of eval() may execute arbitrary code"},
    {regex(R"(\bFunction\s*\()"), "use of Function() constructor may execute arbitrary code"},
    {regex(R"(document\.write)"), "use of document.write can lead to XSS vulnerabilities"}};

static void scan_security(const string &source, vector<validation_issue> &issues) {
    istringstream in(source);
    string text;
    for (int line = 1; getline(in, text); ++line) {
        for (auto &p : SECURITY_PATTERNS) {
            if (regex_search(text, p.pattern))
                issues.push_back({validation_issue::type::SECURITY, p.message, line});
        }
    }
}

/**
 * @brief 从编译器或者语法检查工具的输出中找出第一个行号
 * 支持 main.c:3:5、main.rb:2: 以及 "on line 2"、"line 2:" 这几种格式
 */
static optional<int> find_error_line(const string &output, const string &filename) {
    smatch match;
    regex located(regex_replace(filename, regex(R"([.^$|()\[\]{}*+?\\])"), R"(\$&)") + R"(:(\d+))");
    if (regex_search(output, match, located))
        return stoi(match[1].str());
    static const regex line_word(R"(\bline (\d+))");
    if (regex_search(output, match, line_word))
        return stoi(match[1].str());
    return nullopt;
}

static void add_syntax_issue(validation_report &report, const string &message, optional<int> line) {
    report.valid = false;
    report.issues.push_back({validation_issue::type::SYNTAX, message, line});
}

void execution_orchestrator::check_sandboxed(const execution_request &request, const language_profile &profile,
                                             const atomic<bool> &cancelled, validation_report &report) {
    if (!sandbox) throw internal_error("sandbox is not available");

    sandbox_options options;
    options.source = request.source_code;
    options.filename = request.filename.empty() ? profile.default_filename : request.filename;
    options.timeout = effective_timeout(request, profile);
    options.max_output_bytes = effective_output_limit(request);
    options.check_only = true;

    sandbox_result checked = sandbox->run(options, &cancelled);
    report.checked = true;
    report.compile_output = move(checked.stderr_data);

    switch (checked.kind) {
        case sandbox_result::outcome::COMPLETED:
            break;
        case sandbox_result::outcome::COMPILE_ERROR:
            add_syntax_issue(report, checked.message, checked.line);
            break;
        case sandbox_result::outcome::CAPABILITY_DENIED:
            // 静态检查拒绝的代码无法执行
            report.valid = false;
            report.issues.push_back({validation_issue::type::SECURITY, checked.message, checked.line});
            break;
        case sandbox_result::outcome::TIMED_OUT:
            report.valid = false;
            report.status = status::TIMED_OUT;
            report.message = checked.message;
            break;
        case sandbox_result::outcome::CANCELLED:
            report.valid = false;
            report.status = status::CANCELLED;
            report.message = checked.message;
            break;
        case sandbox_result::outcome::RUNTIME_ERROR:
        case sandbox_result::outcome::INTERNAL_ERROR:
            report.valid = false;
            report.status = status::INTERNAL_ERROR;
            report.message = checked.message;
            break;
    }
}

void execution_orchestrator::check_process(const execution_request &request, const language_profile &profile,
                                           const atomic<bool> &cancelled, validation_report &report) {
    if (!profile.has_compile_step() && !profile.has_check_step()) {
        report.checked = false;
        report.message = fmt::format("no syntax checker is configured for {}", profile.id);
        return;
    }

    workspace ws = workspaces.allocate(request.id);
    defer { schedule_cleanup(ws); };

    string filename = request.filename.empty() ? profile.default_filename : request.filename;
    workspaces.write(ws, filename, request.source_code);

    process_options check;
    check.command = profile.has_compile_step() ? profile.expand_compile_command(filename) : profile.expand_check_command(filename);
    check.work_dir = ws.path;
    check.env = profile.environment;
    check.timeout = profile.compile_timeout;
    check.kill_delay = conf.kill_delay;
    check.max_output_bytes = effective_output_limit(request);
    check.file_size_limit = conf.file_size_limit;

    LOG(INFO) << "Execution " << request.id << " checking syntax";
    process_result checked = runner.run(check, &cancelled);
    report.compile_output = checked.stdout_data + checked.stderr_data;

    switch (checked.kind) {
        case process_result::outcome::EXITED:
        case process_result::outcome::SIGNALED:
            report.checked = true;
            if (!checked.succeeded())
                add_syntax_issue(report, report.compile_output.empty() ? checked.describe() : report.compile_output,
                                 find_error_line(report.compile_output, filename));
            break;
        case process_result::outcome::TIMED_OUT:
            report.valid = false;
            report.status = status::TIMED_OUT;
            report.message = fmt::format("syntax check exceeded {} ms", profile.compile_timeout.count());
            break;
        case process_result::outcome::CANCELLED:
            report.valid = false;
            report.status = status::CANCELLED;
            report.message = "cancelled";
            break;
        case process_result::outcome::SPAWN_FAILED:
            report.valid = false;
            report.status = status::SPAWN_ERROR;
            report.message = checked.error;
            break;
    }
}

validation_report execution_orchestrator::validate(execution_request request) {
    elapsed_time timer;
    if (request.id.empty()) request.id = generate_execution_id();

    validation_report report;
    report.execution_id = request.id;
    try {
        verify_request(request);
        const language_profile &profile = registry->resolve(request.language);

        auto cancelled = track(request.id);
        defer { untrack(request.id); };

        concurrency_slot slot = limiter.acquire();
        if (*cancelled) {
            report.status = status::CANCELLED;
            report.message = "cancelled before start";
        } else {
            report.status = status::SUCCEEDED;
            report.valid = true;
            if (profile.sandboxed)
                check_sandboxed(request, profile, *cancelled, report);
            else
                check_process(request, profile, *cancelled, report);
            scan_security(request.source_code, report.issues);
        }
    } catch (validation_error &ex) {
        report.status = status::VALIDATION_FAILED;
        report.message = ex.what();
    } catch (unsupported_language &ex) {
        report.status = status::UNSUPPORTED_LANGUAGE;
        report.message = ex.what();
    } catch (queue_full &ex) {
        report.status = status::QUEUE_FULL;
        report.message = ex.what();
    } catch (spawn_error &ex) {
        report.status = status::SPAWN_ERROR;
        report.message = ex.what();
    } catch (std::exception &ex) {
        LOG(ERROR) << "Validation " << request.id << " failed with internal error: " << boost::diagnostic_information(ex);
        report.status = status::INTERNAL_ERROR;
        report.message = ex.what();
    }
    if (report.status != status::SUCCEEDED) report.valid = false;

    report.duration_ms = timer.milliseconds();
    LOG(INFO) << fmt::format("Validation {} finished: {} [valid: {}, issues: {}] ({} ms)", request.id, to_string(report.status),
                             report.valid, report.issues.size(), report.duration_ms);
    return report;
}

engine_status execution_orchestrator::snapshot() const {
    engine_status s;
    s.version = ENGINE_VERSION;
    struct utsname name;
    if (uname(&name) == 0) {
        s.platform = name.sysname;
        s.architecture = name.machine;
    } else {
        LOG(WARNING) << "uname failed: " << strerror(errno);
        s.platform = s.architecture = "unknown";
    }
    s.uptime_ms = uptime.milliseconds();
    s.max_concurrency = conf.max_concurrency;
    s.max_queue_depth = conf.max_queue_depth;
    s.active = limiter.active();
    s.queued = limiter.queued();
    for (auto profile : registry->list())
        s.languages.push_back({profile->id, profile->display_name, profile->sandboxed, profile->installed()});
    return s;
}

const language_registry &execution_orchestrator::languages() const {
    return *registry;
}

const engine_config &execution_orchestrator::config() const {
    return conf;
}

size_t execution_orchestrator::active() const {
    return limiter.active();
}

size_t execution_orchestrator::queued() const {
    return limiter.queued();
}

void execution_orchestrator::flush_cleanup() {
    cleaner.flush();
}

}  // namespace runbox
