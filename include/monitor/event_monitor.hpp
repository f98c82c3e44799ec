#pragma once

#include <mutex>
#include <ostream>
#include "monitor/monitor.hpp"

namespace runbox {

/**
 * @brief 将执行生命周期事件以 JSON Lines 的格式写入输出流
 * 每个事件占一行，见 execution_event 的 JSON 格式。
 * 输出流可能与其他写入者共享，因此需要传入同一个互斥锁。
 */
class event_monitor : public monitor {
public:
    event_monitor(std::ostream &out, std::mutex &out_mutex);

    void start_execution(const execution_request &request) override;
    void end_execution(const execution_request &request, const execution_result &result) override;

private:
    void emit(const execution_event &event);

    std::ostream &out;
    std::mutex &out_mutex;
};

}  // namespace runbox
