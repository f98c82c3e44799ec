#pragma once

#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>

namespace runbox {

class concurrency_limiter;

/**
 * @brief 并发槽位，表示一个执行许可
 * 只能移动不能复制，析构时自动归还，且只会归还一次。
 */
class concurrency_slot {
public:
    concurrency_slot();
    concurrency_slot(concurrency_slot &&other) noexcept;
    concurrency_slot &operator=(concurrency_slot &&other) noexcept;
    ~concurrency_slot();

    concurrency_slot(const concurrency_slot &) = delete;
    concurrency_slot &operator=(const concurrency_slot &) = delete;

    /**
     * @brief 归还槽位，重复调用无副作用
     */
    void release() noexcept;

    bool valid() const;

private:
    friend class concurrency_limiter;
    explicit concurrency_slot(concurrency_limiter *owner);

    concurrency_limiter *owner;
};

/**
 * @brief 并发限制器与等待队列
 * 同时持有的槽位数不超过 max_concurrency。没有空闲槽位时请求进入先进先出的
 * 等待队列（没有优先级），先提交的请求在有槽位空出时先被放行。
 * 等待队列长度达到 max_queue_depth 后，新的请求直接失败（queue_full），
 * 不会无限排队。
 */
class concurrency_limiter {
public:
    concurrency_limiter(std::size_t max_concurrency, std::size_t max_queue_depth);

    concurrency_limiter(const concurrency_limiter &) = delete;
    concurrency_limiter &operator=(const concurrency_limiter &) = delete;

    /**
     * @brief 获取一个槽位，没有空闲槽位时阻塞等待
     * @throw queue_full 若等待队列已满
     */
    concurrency_slot acquire();

    /**
     * @brief 正在使用的槽位数
     */
    std::size_t active() const;

    /**
     * @brief 正在排队的请求数
     */
    std::size_t queued() const;

    std::size_t capacity() const;

private:
    friend class concurrency_slot;
    void release() noexcept;

    const std::size_t max_concurrency;
    const std::size_t max_queue_depth;

    mutable std::mutex mut;
    std::condition_variable cond;
    std::deque<std::uint64_t> waiters;
    std::uint64_t next_ticket = 0;
    std::size_t active_count = 0;
};

}  // namespace runbox
