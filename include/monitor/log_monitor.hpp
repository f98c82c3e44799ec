#pragma once

#include "monitor/monitor.hpp"

namespace runbox {

/**
 * @brief 将执行的开始和结束记录到日志
 */
struct log_monitor : public monitor {
    void start_execution(const execution_request &request) override;
    void end_execution(const execution_request &request, const execution_result &result) override;
};

}  // namespace runbox
