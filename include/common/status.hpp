#pragma once

#include <string>

namespace runbox {

/**
 * @brief 表示一次代码执行所处的状态
 * QUEUED、COMPILING、RUNNING 为中间状态，其余均为终止状态。
 * 每个执行请求只会到达一次终止状态，终止状态不会再发生变化。
 */
enum class status {
    /**
     * @brief 请求正在等待并发槽位
     */
    QUEUED = 0,

    /**
     * @brief 正在编译用户程序
     * 仅当语言配置包含编译步骤时才会进入该状态
     */
    COMPILING = 1,

    /**
     * @brief 用户程序正在运行
     */
    RUNNING = 2,

    /**
     * @brief 用户程序正常结束（退出码为 0）
     */
    SUCCEEDED = 3,

    /**
     * @brief 请求格式不正确，比如源代码为空
     */
    VALIDATION_FAILED = 4,

    /**
     * @brief 请求的语言不在白名单中
     */
    UNSUPPORTED_LANGUAGE = 5,

    /**
     * @brief 等待队列已满，请求被直接拒绝
     */
    QUEUE_FULL = 6,

    /**
     * @brief 编译失败
     * 此时 stage 为 compile，stderr 为编译器的输出，运行步骤不会执行
     */
    COMPILE_ERROR = 7,

    /**
     * @brief 用户程序以非零退出码结束，或者被信号终止
     */
    RUNTIME_ERROR = 8,

    /**
     * @brief 用户程序超过时间限制被强制终止
     * 进程执行时会杀死整个进程组；沙箱执行时会丢弃沙箱实例
     */
    TIMED_OUT = 9,

    /**
     * @brief 无法启动工具链（可执行文件不存在或者不可执行）
     * 与 RUNTIME_ERROR 不同，此时用户程序根本没有运行
     */
    SPAWN_ERROR = 10,

    /**
     * @brief 沙箱内的程序尝试访问不被允许的能力
     * 比如文件系统、进程、网络、白名单以外的模块
     */
    CAPABILITY_DENIED = 11,

    /**
     * @brief 执行被调用方主动取消
     */
    CANCELLED = 12,

    /**
     * @brief 执行引擎内部错误
     */
    INTERNAL_ERROR = 13
};

/**
 * @brief 表示执行结果产生于哪个阶段
 */
enum class stage {
    COMPILE = 0,
    EXECUTION = 1
};

/**
 * @brief 获得状态的可读名称，比如 "Compile Error"
 */
const char *get_display_message(status);

/**
 * @brief 获得状态在 JSON 接口中的名称，比如 "CompileError"
 */
const char *to_string(status);

/**
 * @brief 从 JSON 接口中的名称解析状态
 * @throw std::invalid_argument 若名称不合法
 */
status status_from_string(const std::string &name);

const char *to_string(stage);

stage stage_from_string(const std::string &name);

/**
 * @brief 判断状态是否为终止状态
 */
bool is_terminal(status);

}  // namespace runbox
