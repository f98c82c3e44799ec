#include "monitor/event_monitor.hpp"
#include <nlohmann/json.hpp>

namespace runbox {
using namespace std;

event_monitor::event_monitor(ostream &out, mutex &out_mutex) : out(out), out_mutex(out_mutex) {}

void event_monitor::start_execution(const execution_request &request) {
    execution_event event;
    event.kind = execution_event::type::STARTED;
    event.execution_id = request.id;
    event.language = request.language;
    event.status = status::QUEUED;
    emit(event);
}

void event_monitor::end_execution(const execution_request &request, const execution_result &result) {
    execution_event event;
    event.kind = execution_event::type::COMPLETED;
    event.execution_id = result.execution_id;
    event.language = request.language;
    event.status = result.status;
    emit(event);
}

void event_monitor::emit(const execution_event &event) {
    nlohmann::json j = event;
    string line = j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    scoped_lock guard(out_mutex);
    out << line << '\n';
    out.flush();
}

}  // namespace runbox
