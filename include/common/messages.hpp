#pragma once

#include <chrono>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>
#include "common/status.hpp"

/**
 * 执行引擎与调用方（编辑器前端、命令行）之间交换的消息
 * JSON 格式见 to_json 和 from_json。
 */
namespace runbox {

/**
 * @brief 执行请求
 * 被 execution_orchestrator 接受后不再修改
 */
struct execution_request {
    /**
     * @brief 执行 id，由调用方提供或者由服务端生成，必须唯一
     * 只允许 [A-Za-z0-9_-]，长度不超过 64，因为该 id 会成为工作区目录名的一部分
     */
    std::string id;

    /**
     * @brief 语言 id，必须是语言配置表中的某一项
     */
    std::string language;

    /**
     * @brief 用户的源代码
     */
    std::string source_code;

    /**
     * @brief 用户程序的标准输入，写入后立即关闭输入流
     */
    std::string input;

    /**
     * @brief 源代码文件名，为空时使用语言配置的默认文件名
     */
    std::string filename;

    /**
     * @brief 运行时间限制，0 表示使用语言配置的默认值
     * 编译步骤有自己独立的时间限制
     */
    std::chrono::milliseconds timeout{0};

    /**
     * @brief stdout、stderr 各自的捕获上限，0 表示使用引擎默认值
     */
    std::size_t max_output_bytes = 0;
};

/**
 * @brief 执行结果
 * 每个执行请求只产生一次结果，产生后不再修改
 */
struct execution_result {
    std::string execution_id;

    runbox::status status = runbox::status::INTERNAL_ERROR;

    /**
     * @brief 结果产生于编译阶段还是运行阶段
     */
    runbox::stage stage = runbox::stage::EXECUTION;

    std::string stdout_data;
    std::string stderr_data;

    /**
     * @brief 用户程序（或者编译器）的退出码，被信号终止时为 128 + 信号编号
     * 程序没有运行时为空
     */
    std::optional<int> exit_code;

    /**
     * @brief 从开始执行到产生结果的总时间（不含排队时间）
     */
    long long duration_ms = 0;

    /**
     * @brief 编译步骤耗时，没有编译步骤时为 0
     */
    long long compile_time_ms = 0;

    /**
     * @brief 运行步骤耗时，运行步骤没有开始时为 0
     */
    long long execution_time_ms = 0;

    bool stdout_truncated = false;
    bool stderr_truncated = false;

    /**
     * @brief 失败时的可读描述
     */
    std::string message;

    bool success() const;
};

/**
 * @brief 执行生命周期事件，提供给外部的实时通知组件
 */
struct execution_event {
    enum class type {
        STARTED,
        COMPLETED
    };

    type kind;
    std::string execution_id;
    std::string language;
    runbox::status status = runbox::status::QUEUED;
};

/**
 * @brief 语法检查或者静态检查发现的问题
 */
struct validation_issue {
    enum class type {
        SYNTAX,
        SECURITY  // 只是提示，不影响 valid
    };

    type kind = type::SYNTAX;
    std::string message;

    /**
     * @brief 问题所在的行号（从 1 开始），无法确定时为空
     */
    std::optional<int> line;
};

/**
 * @brief 只检查、不运行的结果
 */
struct validation_report {
    std::string execution_id;

    /**
     * @brief 没有发现语法问题时为真；请求本身不合法时为假
     */
    bool valid = false;

    /**
     * @brief 请求本身不合法或者检查失败时的状态，检查正常完成时为 SUCCEEDED
     */
    runbox::status status = runbox::status::INTERNAL_ERROR;

    /**
     * @brief 是否真正做了语法检查
     * 语言既没有编译步骤也没有语法检查命令时只做静态检查，此时为假
     */
    bool checked = false;

    std::vector<validation_issue> issues;

    /**
     * @brief 编译器或者语法检查工具的输出
     */
    std::string compile_output;

    long long duration_ms = 0;

    std::string message;
};

/**
 * @brief 一种语言在状态报告中的摘要
 */
struct language_status {
    std::string id;
    std::string name;
    bool sandboxed = false;
    bool available = false;
};

/**
 * @brief 执行引擎的状态快照
 */
struct engine_status {
    std::string version;
    std::string platform;
    std::string architecture;
    long long uptime_ms = 0;
    std::size_t max_concurrency = 0;
    std::size_t max_queue_depth = 0;
    std::size_t active = 0;
    std::size_t queued = 0;
    std::vector<language_status> languages;
};

void from_json(const nlohmann::json &j, execution_request &request);
void to_json(nlohmann::json &j, const execution_request &request);

void from_json(const nlohmann::json &j, execution_result &result);
void to_json(nlohmann::json &j, const execution_result &result);

void to_json(nlohmann::json &j, const execution_event &event);

void to_json(nlohmann::json &j, const validation_issue &issue);
void to_json(nlohmann::json &j, const validation_report &report);

void to_json(nlohmann::json &j, const language_status &language);
void to_json(nlohmann::json &j, const engine_status &status);

}  // namespace runbox
