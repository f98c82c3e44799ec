#include "common/status.hpp"
#include <boost/assign.hpp>
#include <stdexcept>
#include <unordered_map>

namespace runbox {
using namespace std;

// clang-format off
static const unordered_map<status, const char *> status_display = boost::assign::map_list_of
    (status::QUEUED, "Queued")
    (status::COMPILING, "Compiling")
    (status::RUNNING, "Running")
    (status::SUCCEEDED, "Succeeded")
    (status::VALIDATION_FAILED, "Validation Failed")
    (status::UNSUPPORTED_LANGUAGE, "Unsupported Language")
    (status::QUEUE_FULL, "Queue Full")
    (status::COMPILE_ERROR, "Compile Error")
    (status::RUNTIME_ERROR, "Runtime Error")
    (status::TIMED_OUT, "Timed Out")
    (status::SPAWN_ERROR, "Spawn Error")
    (status::CAPABILITY_DENIED, "Capability Denied")
    (status::CANCELLED, "Cancelled")
    (status::INTERNAL_ERROR, "Internal Error");

static const unordered_map<status, const char *> status_names = boost::assign::map_list_of
    (status::QUEUED, "Queued")
    (status::COMPILING, "Compiling")
    (status::RUNNING, "Running")
    (status::SUCCEEDED, "Succeeded")
    (status::VALIDATION_FAILED, "ValidationFailed")
    (status::UNSUPPORTED_LANGUAGE, "UnsupportedLanguage")
    (status::QUEUE_FULL, "QueueFull")
    (status::COMPILE_ERROR, "CompileError")
    (status::RUNTIME_ERROR, "RuntimeError")
    (status::TIMED_OUT, "TimedOut")
    (status::SPAWN_ERROR, "SpawnError")
    (status::CAPABILITY_DENIED, "CapabilityDenied")
    (status::CANCELLED, "Cancelled")
    (status::INTERNAL_ERROR, "InternalError");
// clang-format on

const char *get_display_message(status stat) {
    return status_display.at(stat);
}

const char *to_string(status stat) {
    return status_names.at(stat);
}

status status_from_string(const string &name) {
    for (auto &[stat, str] : status_names)
        if (name == str) return stat;
    throw invalid_argument("Unrecognized status " + name);
}

const char *to_string(stage s) {
    return s == stage::COMPILE ? "compile" : "execution";
}

stage stage_from_string(const string &name) {
    if (name == "compile") return stage::COMPILE;
    if (name == "execution") return stage::EXECUTION;
    throw invalid_argument("Unrecognized stage " + name);
}

bool is_terminal(status stat) {
    switch (stat) {
        case status::QUEUED:
        case status::COMPILING:
        case status::RUNNING:
            return false;
        default:
            return true;
    }
}

}  // namespace runbox
