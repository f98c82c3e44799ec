#include "monitor/monitor.hpp"

namespace runbox {

monitor::~monitor() = default;

void monitor::start_execution(const execution_request &) {}

void monitor::end_execution(const execution_request &, const execution_result &) {}

}  // namespace runbox
