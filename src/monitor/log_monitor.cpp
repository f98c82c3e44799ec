#include "monitor/log_monitor.hpp"
#include <fmt/core.h>
#include <glog/logging.h>

namespace runbox {
using namespace std;

void log_monitor::start_execution(const execution_request &request) {
    LOG(INFO) << fmt::format("Execution {} started [language: {}, source: {} bytes]",
                             request.id, request.language, request.source_code.size());
}

void log_monitor::end_execution(const execution_request &request, const execution_result &result) {
    string summary = fmt::format("Execution {} completed [language: {}, status: {}, stage: {}, duration: {} ms]",
                                 result.execution_id, request.language, get_display_message(result.status),
                                 to_string(result.stage), result.duration_ms);
    if (result.success())
        LOG(INFO) << summary;
    else
        LOG(WARNING) << summary << ": " << result.message;
}

}  // namespace runbox
