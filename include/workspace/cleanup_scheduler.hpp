#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <thread>

namespace runbox {

/**
 * @brief 延迟清理任务的调度器
 * 执行结束后工作区不会立刻删除，而是在宽限时间之后由后台线程删除，
 * 以容忍刚被杀死的进程的残余写入。
 *
 * 每个任务都有一个 token，可以在到期前通过 cancel 取消。
 * 析构时会立刻执行所有尚未执行的任务，保证不会遗留工作区。
 * 任务回调不应当抛出异常，抛出的 std::exception 会被记录到日志。
 */
class cleanup_scheduler {
public:
    using token = std::uint64_t;
    using clock = std::chrono::steady_clock;

    cleanup_scheduler();
    ~cleanup_scheduler();

    cleanup_scheduler(const cleanup_scheduler &) = delete;
    cleanup_scheduler &operator=(const cleanup_scheduler &) = delete;

    /**
     * @brief 安排一个延迟任务
     * @param name 任务名，用于日志
     * @param delay 延迟时间
     * @param action 到期后执行的回调
     * @return 可以用于取消该任务的 token
     */
    token schedule(const std::string &name, std::chrono::milliseconds delay, std::function<void()> action);

    /**
     * @brief 取消尚未执行的任务
     * @return 若任务尚未执行且被成功取消，返回 true
     */
    bool cancel(token id);

    /**
     * @brief 立刻执行所有尚未执行的任务，并等待正在执行的任务完成
     */
    void flush();

    /**
     * @brief 尚未执行的任务数量
     */
    std::size_t pending() const;

private:
    struct task {
        token id;
        std::string name;
        std::function<void()> action;
    };

    void loop();
    static void run(task &t);

    mutable std::mutex mut;
    std::condition_variable cond;
    std::condition_variable idle_cond;
    std::multimap<clock::time_point, task> tasks;
    token next_token = 1;
    std::size_t running = 0;
    bool stopping = false;
    std::thread worker;
};

}  // namespace runbox
