#include "server/request_server.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include "common/utils.hpp"

namespace runbox {
using namespace std;
using namespace nlohmann;

request_server::request_server(execution_orchestrator &orchestrator, ostream &out, mutex &out_mutex)
    : orchestrator(orchestrator), out(out), out_mutex(out_mutex) {}

request_server::~request_server() {
    wait();
}

void request_server::write_line(const json &j) {
    string line = j.dump(-1, ' ', false, json::error_handler_t::replace);
    scoped_lock guard(out_mutex);
    out << line << endl;
}

static json malformed(const json &j, const string &what) {
    execution_result result;
    if (j.is_object() && j.count("id") && j["id"].is_string())
        result.execution_id = j["id"].get<string>();
    result.status = status::VALIDATION_FAILED;
    result.message = fmt::format("malformed request: {}", what);
    return result;
}

void request_server::reap() {
    scoped_lock guard(workers_mutex);
    for (auto it = workers.begin(); it != workers.end();) {
        if (it->done->load()) {
            it->thread.join();
            it = workers.erase(it);
        } else {
            ++it;
        }
    }
}

void request_server::dispatch(const function<json()> &task) {
    reap();
    auto done = make_shared<atomic<bool>>(false);
    scoped_lock guard(workers_mutex);
    workers.push_back({thread([this, task, done] {
                           write_line(task());
                           *done = true;
                       }),
                       done});
}

void request_server::handle(const string &line) {
    if (line.find_first_not_of(" \t\r") == string::npos) return;

    json j;
    try {
        j = json::parse(line);
    } catch (json::exception &e) {
        write_line(malformed(j, e.what()));
        return;
    }

    if (j.is_object() && j.count("cancel")) {
        string id = j.at("cancel").is_string() ? j.at("cancel").get<string>() : "";
        bool cancelled = orchestrator.cancel(id);
        write_line({{"event", "cancel"}, {"executionId", id}, {"cancelled", cancelled}});
        return;
    }

    if (j.is_object() && j.count("system")) {
        write_line({{"event", "system"}, {"system", orchestrator.snapshot()}});
        return;
    }

    bool validating = j.is_object() && j.count("validate");
    const json &body = validating ? j.at("validate") : j;

    execution_request request;
    try {
        request = body.get<execution_request>();
    } catch (std::exception &e) {
        write_line(malformed(body, e.what()));
        return;
    }

    // id 在提交前确定，调用方才能用它取消执行
    if (request.id.empty()) request.id = generate_execution_id();
    if (validating) {
        dispatch([this, request]() -> json {
            json report = orchestrator.validate(request);
            report["event"] = "validate";
            return report;
        });
    } else {
        dispatch([this, request]() -> json { return orchestrator.submit(request); });
    }
}

void request_server::serve(istream &in) {
    string line;
    while (getline(in, line))
        handle(line);
    wait();
    LOG(INFO) << "Input closed, all executions finished";
}

void request_server::wait() {
    list<worker> pending;
    {
        scoped_lock guard(workers_mutex);
        pending.swap(workers);
    }
    for (auto &w : pending)
        w.thread.join();
}

size_t request_server::running() {
    reap();
    scoped_lock guard(workers_mutex);
    return workers.size();
}

}  // namespace runbox
