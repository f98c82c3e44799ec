#pragma once

#include <boost/stacktrace.hpp>
#include <memory>
#include <sstream>
#include <stdexcept>

namespace runbox {

struct engine_exception : std::exception {
    engine_exception();
    explicit engine_exception(const std::string &message);

    friend std::ostream &operator<<(std::ostream &os, const engine_exception &ex);

    const char *what() const noexcept override;

private:
    std::string message;
    std::shared_ptr<boost::stacktrace::stacktrace> stacktrace;
};

/**
 * @brief 表示执行引擎的内部错误
 * 一般是系统调用失败、内嵌解释器状态异常等与用户代码无关的问题
 */
struct internal_error : public engine_exception {
    internal_error();
    explicit internal_error(const std::string &message);
};

/**
 * @brief 表示执行请求格式不正确
 * 比如源代码为空、执行 id 或文件名包含非法字符
 */
struct validation_error : public engine_exception {
    explicit validation_error(const std::string &message);
};

/**
 * @brief 表示请求的语言不在语言配置表中
 */
struct unsupported_language : public engine_exception {
    const std::string language;

    explicit unsupported_language(const std::string &language);
};

/**
 * @brief 表示等待队列已满，请求被拒绝
 */
struct queue_full : public engine_exception {
    explicit queue_full(const std::string &message);
};

/**
 * @brief 表示无法创建子进程（fork 或者管道创建失败）
 * 工具链可执行文件不存在的情况由 process_runner 通过返回值报告，不会抛出该异常
 */
struct spawn_error : public engine_exception {
    explicit spawn_error(const std::string &message);
};

}  // namespace runbox
