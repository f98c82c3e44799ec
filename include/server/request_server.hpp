#pragma once

#include <atomic>
#include <functional>
#include <istream>
#include <list>
#include <memory>
#include <mutex>
#include <ostream>
#include <string>
#include <thread>
#include <nlohmann/json.hpp>
#include "orchestrator.hpp"

namespace runbox {

/**
 * @brief 按行读取 JSON 请求并交给执行调度器并发执行，结果逐行写入输出流
 *
 * 每行是以下之一：
 * 1. 执行请求，格式见 from_json(json, execution_request)，结果为 execution_result；
 * 2. {"cancel": "<executionId>"}，取消正在执行的请求；
 * 3. {"validate": <执行请求>}，只检查不运行，结果为 validation_report；
 * 4. {"system": true}，输出 engine_status。
 *
 * 执行请求和检查请求各自在一个线程中执行，已经结束的线程在处理下一行之前回收，
 * 因此线程数只取决于同时在执行的请求数。
 * 输出流可能与 event_monitor 共享，因此需要传入同一个互斥锁。
 */
class request_server {
public:
    request_server(execution_orchestrator &orchestrator, std::ostream &out, std::mutex &out_mutex);

    request_server(const request_server &) = delete;
    request_server &operator=(const request_server &) = delete;

    /**
     * @brief 等待所有执行结束
     */
    ~request_server();

    /**
     * @brief 处理一行输入
     */
    void handle(const std::string &line);

    /**
     * @brief 处理输入流中的每一行直到输入结束，然后等待所有执行结束
     */
    void serve(std::istream &in);

    /**
     * @brief 等待所有执行结束
     */
    void wait();

    /**
     * @brief 回收已经结束的线程，返回仍在执行的线程数
     */
    std::size_t running();

private:
    struct worker {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };

    void write_line(const nlohmann::json &j);
    void dispatch(const std::function<nlohmann::json()> &task);
    void reap();

    execution_orchestrator &orchestrator;
    std::ostream &out;
    std::mutex &out_mutex;

    std::mutex workers_mutex;
    std::list<worker> workers;
};

}  // namespace runbox
