#pragma once

#include <atomic>
#include <chrono>
#include <optional>
#include <set>
#include <string>

namespace runbox {

/**
 * @brief 沙箱执行的参数
 */
struct sandbox_options {
    std::string source;

    /**
     * @brief 源文件名，只用于语法错误和 traceback 中的显示
     */
    std::string filename = "main.py";

    /**
     * @brief input() 读取的数据
     */
    std::string input;

    std::chrono::milliseconds timeout{10000};

    /**
     * @brief stdout 和 stderr 各自的捕获上限
     */
    std::size_t max_output_bytes = 1 << 20;

    /**
     * @brief 只做语法检查和静态检查，不执行代码
     */
    bool check_only = false;
};

struct sandbox_result {
    enum class outcome {
        COMPLETED,          // 正常结束（包括 SystemExit(0)）
        COMPILE_ERROR,      // 语法错误，代码没有开始执行
        RUNTIME_ERROR,      // 未捕获的异常或者非 0 的 SystemExit
        CAPABILITY_DENIED,  // 尝试使用了沙箱不提供的能力
        TIMED_OUT,
        CANCELLED,
        INTERNAL_ERROR      // 沙箱自身的错误，与用户代码无关
    };

    outcome kind = outcome::RUNTIME_ERROR;

    /**
     * @brief 与 python 解释器一致：正常结束为 0，未捕获的异常为 1，
     * SystemExit 为其退出码；超时或者取消时为空
     */
    std::optional<int> exit_code;

    std::string stdout_data;
    std::string stderr_data;
    bool stdout_truncated = false;
    bool stderr_truncated = false;

    long long duration_ms = 0;

    /**
     * @brief 语法错误或者被静态检查拒绝的行号
     */
    std::optional<int> line;

    /**
     * @brief 失败原因的简短描述
     */
    std::string message;
};

/**
 * @brief 进程内的受限 Python 执行环境
 *
 * 代码运行在引擎内嵌的 CPython 解释器中。每次执行都会构造一个全新的沙箱实例：
 * 新的 globals、新的受限 builtins、新的输出缓冲区和定时器队列，实例之间不共享任何状态，
 * 也不会被复用。
 *
 * 沙箱提供的能力：
 * 1. print 和 input，输出被捕获到有上限的缓冲区，input 读取请求的标准输入；
 * 2. 一组无副作用的内建函数和允许导入的纯计算模块（见 allowed_modules），
 *    导入得到的是只包含公开属性的模块代理，不会暴露模块引用的其他模块；
 * 3. set_timeout(fn, delay_ms) 和 clear_timeout(id)，最多 64 个待执行的定时器，
 *    在主程序结束后按到期顺序执行。
 *
 * open、exec、eval、compile、导入不在白名单中的模块、访问以下划线开头的属性等操作
 * 都会被拒绝。拒绝会记录在实例上，即使用户代码捕获了异常，结果仍然是 CAPABILITY_DENIED。
 * 沙箱线程上还安装了审计钩子：文件、进程、网络、导入等审计事件，以及对允许的模块中
 * 的类（实例之间共享）的修改，都会被拒绝。
 *
 * 执行在独立的线程上进行，调用方等待到超时为止。超时或者取消后实例被异步中断并丢弃，
 * 不会等待其结束，未执行的定时器也被丢弃。
 */
class python_sandbox {
public:
    /**
     * @throw internal_error 若内嵌解释器尚未初始化
     */
    python_sandbox();

    /**
     * @brief 在新的沙箱实例中执行代码
     * @param options 执行参数
     * @param cancelled 若不为空，该标志被置位后执行被中断，结果为 CANCELLED
     * @throw std::system_error 若无法创建执行线程
     */
    sandbox_result run(const sandbox_options &options, const std::atomic<bool> *cancelled = nullptr) const;

    /**
     * @brief 允许导入的模块（顶层包名）
     */
    static const std::set<std::string> &allowed_modules();

    /**
     * @brief 最多同时等待执行的定时器数量
     */
    static constexpr std::size_t MAX_PENDING_TIMERS = 64;
};

}  // namespace runbox
