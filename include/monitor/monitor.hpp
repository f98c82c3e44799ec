#pragma once

#include "common/messages.hpp"

namespace runbox {

/**
 * @brief 执行监控行为
 * 外部的实时通知、统计等组件通过实现该接口接入执行引擎。
 * 回调可能在多个执行线程上并发调用，实现需要自己保证线程安全。
 * 回调抛出的异常只会被记录到日志，不影响执行结果。
 */
struct monitor {
    virtual ~monitor();

    /**
     * @brief 监控上报某个执行请求已经被接受
     * @param request 执行请求，此时已经分配了执行 id
     */
    virtual void start_execution(const execution_request &request);

    /**
     * @brief 监控上报某个执行请求已经产生最终结果
     * @param request 执行请求
     * @param result 执行结果
     */
    virtual void end_execution(const execution_request &request, const execution_result &result);
};

}  // namespace runbox
