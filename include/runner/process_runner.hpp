#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace runbox {

/**
 * @brief 启动一个外部进程所需的全部参数
 */
struct process_options {
    /**
     * @brief 命令行参数，command[0] 为可执行文件
     * 不经过 shell 解析，直接传给 execve
     */
    std::vector<std::string> command;

    /**
     * @brief 子进程的工作目录
     * command[0] 为相对路径（如 ./program）时也相对于该目录解析
     */
    std::filesystem::path work_dir;

    /**
     * @brief 子进程额外的环境变量，格式为 KEY=VALUE
     * 子进程不继承父进程的环境，只保留 PATH、HOME、LANG
     */
    std::vector<std::string> env;

    /**
     * @brief 写入子进程标准输入的数据，写完后关闭标准输入
     */
    std::string input;

    /**
     * @brief 墙上时间限制
     */
    std::chrono::milliseconds timeout{10000};

    /**
     * @brief 超时后发送 SIGTERM 和 SIGKILL 之间的间隔
     */
    std::chrono::milliseconds kill_delay{100};

    /**
     * @brief stdout 和 stderr 各自的捕获上限
     */
    std::size_t max_output_bytes = 1 << 20;

    /**
     * @brief 地址空间大小限制（RLIMIT_AS），0 表示不限制
     */
    std::size_t memory_limit = 0;

    /**
     * @brief 可写文件大小限制（RLIMIT_FSIZE），0 表示不限制
     */
    std::size_t file_size_limit = 0;
};

/**
 * @brief 外部进程的运行结果
 */
struct process_result {
    enum class outcome {
        EXITED,        // 进程正常退出（退出码可能非 0）
        SIGNALED,      // 进程被信号终止
        TIMED_OUT,     // 超过时间限制被杀死
        CANCELLED,     // 被调用方取消
        SPAWN_FAILED   // 可执行文件不存在或无法执行
    };

    outcome kind = outcome::SPAWN_FAILED;

    /**
     * @brief 退出码，被信号终止时为 128 + 信号编号
     */
    int exit_code = -1;

    /**
     * @brief 终止进程的信号，没有时为 0
     */
    int signal = 0;

    std::string stdout_data;
    std::string stderr_data;
    bool stdout_truncated = false;
    bool stderr_truncated = false;

    long long duration_ms = 0;

    /**
     * @brief SPAWN_FAILED 时的错误描述
     */
    std::string error;

    bool succeeded() const;

    /**
     * @brief 退出状态的可读描述，比如 "exit code 1" 或 "killed by signal 8 (Floating point exception)"
     */
    std::string describe() const;
};

/**
 * @brief 外部进程执行器
 * 子进程运行在独立的会话（进程组）中，运行结束或超时后整个进程组都会被杀死，
 * 因此用户程序 fork 出来的后代进程不会存活。
 *
 * 父进程使用 poll 同时写入标准输入和读取标准输出、标准错误，
 * 超过捕获上限的输出会被读取并丢弃，避免子进程因为管道写满而阻塞。
 */
class process_runner {
public:
    process_runner();

    /**
     * @brief 运行一个进程并等待它结束
     * @param options 运行参数
     * @param cancelled 若不为空，该标志被置位后进程会被杀死，结果为 CANCELLED
     * @return 运行结果，可执行文件不存在时 kind 为 SPAWN_FAILED
     * @throw spawn_error 若创建管道或者 fork 失败
     */
    process_result run(const process_options &options, const std::atomic<bool> *cancelled = nullptr) const;

private:
    std::string resolve_executable(const process_options &options) const;
};

}  // namespace runbox
