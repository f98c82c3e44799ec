#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>

#define ENGINE_VERSION "1.0"

namespace runbox {

/**
 * @brief 执行引擎的全局配置
 * 在进程启动时构造一次，之后以只读方式注入 execution_orchestrator。
 */
struct engine_config {
    /**
     * @brief 同时执行的请求数上限 N
     */
    std::size_t max_concurrency = 4;

    /**
     * @brief 等待队列的最大长度，超过该长度的请求直接返回 QueueFull
     */
    std::size_t max_queue_depth = 64;

    /**
     * @brief 工作区根目录
     * 每个执行请求会在这个目录下创建一个独占的子目录：
     *
     * WORKSPACE_DIR
     * ├── 4d0c...-a1b2c3 // <执行 id>-<随机后缀>
     * │   ├── main.cpp // 用户的源代码（文件名由请求或语言配置决定）
     * │   └── program // 编译产物
     * └── ...
     *
     * 执行结束后工作区会在 cleanup_delay 之后被删除。
     */
    std::filesystem::path workspace_root = std::filesystem::temp_directory_path() / "runbox";

    /**
     * @brief 执行结束到删除工作区之间的宽限时间
     * 避免刚被杀死的进程仍在写入文件时删除目录
     */
    std::chrono::milliseconds cleanup_delay{5000};

    /**
     * @brief 请求允许设置的最长运行时间，超过时会被截断到该值
     */
    std::chrono::milliseconds max_timeout{30000};

    /**
     * @brief 请求没有设置 maxOutputBytes 时 stdout、stderr 各自的捕获上限
     */
    std::size_t default_max_output_bytes = 1 << 20;  // 1M

    /**
     * @brief 请求允许设置的最大输出捕获上限
     */
    std::size_t max_output_bytes = 16 << 20;  // 16M

    /**
     * @brief 源代码长度上限
     */
    std::size_t max_source_bytes = 1 << 20;  // 1M

    /**
     * @brief 超时后先发送 SIGTERM，等待 kill_delay 后再发送 SIGKILL
     */
    std::chrono::milliseconds kill_delay{100};

    /**
     * @brief 用户程序可写文件的大小上限
     */
    std::size_t file_size_limit = 64 << 20;  // 64M

    /**
     * @brief 是否开启 DEBUG 模式
     * 如果开启 DEBUG 模式，执行结束后不会删除工作区，以便手动检查生成的文件。
     */
    bool debug = false;

    /**
     * @brief 检查配置是否合法
     * @throw std::invalid_argument 若存在非法的配置项
     */
    void validate() const;
};

}  // namespace runbox
