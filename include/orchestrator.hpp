#pragma once

#include <atomic>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "common/messages.hpp"
#include "common/utils.hpp"
#include "config.hpp"
#include "language/registry.hpp"
#include "limiter/concurrency_limiter.hpp"
#include "monitor/monitor.hpp"
#include "runner/process_runner.hpp"
#include "sandbox/python_sandbox.hpp"
#include "workspace/cleanup_scheduler.hpp"
#include "workspace/workspace.hpp"

namespace runbox {

/**
 * @brief 执行调度器，执行引擎的入口
 *
 * 一次执行的生命周期：
 * 1. 校验请求（源代码、执行 id、文件名、语言）；
 * 2. 获取并发槽位，可能需要排队；
 * 3. 分配工作区并写入源代码；
 * 4. 根据语言配置选择进程内沙箱或者外部进程，有编译步骤时先编译；
 * 5. 生成结果，安排工作区的延迟删除，归还槽位。
 *
 * 第 5 步在任何退出路径上都会执行，包括超时和抛出异常。
 * submit 可以在任意线程并发调用。
 */
class execution_orchestrator {
public:
    execution_orchestrator(engine_config config, std::shared_ptr<const language_registry> registry);

    execution_orchestrator(const execution_orchestrator &) = delete;
    execution_orchestrator &operator=(const execution_orchestrator &) = delete;

    /**
     * @brief 执行一个请求并阻塞等待结果
     * 不会抛出异常，所有错误都转换为失败的执行结果。
     * @param request 执行请求，id 为空时由服务端生成
     */
    execution_result submit(execution_request request);

    /**
     * @brief 只检查语法、不运行用户程序
     * 与 submit 一样校验请求并占用并发槽位。沙箱语言只做解析和静态检查；
     * 有编译步骤的语言在工作区中执行编译命令；脚本语言执行语法检查命令。
     * 另外会标出 eval(、Function(、document.write 这类可疑的调用，这些只是提示，不影响 valid。
     * 不会抛出异常。
     */
    validation_report validate(execution_request request);

    /**
     * @brief 当前的状态快照：版本、平台、并发配置、正在执行和排队的请求数、各语言是否可用
     */
    engine_status snapshot() const;

    /**
     * @brief 取消一个排队中或者正在执行的请求
     * 正在执行的进程组被杀死，沙箱实例被放弃，结果为 CANCELLED。
     * @return 若找到该执行返回 true，不存在或已经结束返回 false
     */
    bool cancel(const std::string &execution_id);

    /**
     * @brief 注册一个监控，必须在第一次 submit 之前调用
     */
    void register_monitor(std::unique_ptr<monitor> &&m);

    const language_registry &languages() const;

    const engine_config &config() const;

    /**
     * @brief 正在执行的请求数
     */
    std::size_t active() const;

    /**
     * @brief 正在排队的请求数
     */
    std::size_t queued() const;

    /**
     * @brief 立刻删除所有等待删除的工作区
     */
    void flush_cleanup();

private:
    void verify_request(const execution_request &request) const;
    void check_sandboxed(const execution_request &request, const language_profile &profile,
                         const std::atomic<bool> &cancelled, validation_report &report);
    void check_process(const execution_request &request, const language_profile &profile,
                       const std::atomic<bool> &cancelled, validation_report &report);

    execution_result execute(const execution_request &request, const language_profile &profile, const std::atomic<bool> &cancelled);
    execution_result run_process(const execution_request &request, const language_profile &profile,
                                 const workspace &ws, const std::string &filename, const std::atomic<bool> &cancelled);
    execution_result run_sandboxed(const execution_request &request, const std::string &filename,
                                   const std::atomic<bool> &cancelled);
    void schedule_cleanup(const workspace &ws);

    std::chrono::milliseconds effective_timeout(const execution_request &request, const language_profile &profile) const;
    std::size_t effective_output_limit(const execution_request &request) const;

    std::shared_ptr<std::atomic<bool>> track(const std::string &execution_id);
    void untrack(const std::string &execution_id);

    void call_monitor(const std::string &execution_id, const std::function<void(monitor &)> &callback);

    const engine_config conf;
    const elapsed_time uptime;
    std::shared_ptr<const language_registry> registry;

    workspace_manager workspaces;
    // 析构时会执行所有未完成的删除，必须在 workspaces 之后声明
    cleanup_scheduler cleaner;
    concurrency_limiter limiter;
    process_runner runner;
    std::unique_ptr<python_sandbox> sandbox;

    std::mutex running_mutex;
    std::map<std::string, std::shared_ptr<std::atomic<bool>>> running;

    std::vector<std::unique_ptr<monitor>> monitors;
};

}  // namespace runbox
