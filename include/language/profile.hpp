#pragma once

#include <chrono>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace runbox {

/**
 * @brief 表示一种语言的执行配置（工具链命令、文件扩展名、资源限制）
 * 语言配置在进程启动时构造，之后只读，所有执行请求共享，不需要加锁。
 *
 * 命令以参数数组的形式保存，直接交给 execvp，不经过 shell。
 * 参数中允许出现两个占位符：
 * 1. {file}: 源代码文件名，比如 main.cpp
 * 2. {stem}: 去掉扩展名的源代码文件名，比如 Main（用于 java Main）
 * 除此之外不会对参数做任何替换。
 */
struct language_profile {
    /**
     * @brief 语言 id，比如 cpp、python、javascript
     */
    std::string id;

    std::string display_name;

    /**
     * @brief 源代码文件扩展名，包含 '.'
     */
    std::string file_extension;

    /**
     * @brief 请求没有指定文件名时使用的源代码文件名
     * 对于 Java，文件名必须与 public class 名一致，因此默认为 Main.java
     */
    std::string default_filename;

    /**
     * @brief 是否在进程内的受限沙箱中执行
     * 为真时不会创建子进程，compile_command 与 run_command 被忽略
     */
    bool sandboxed = false;

    /**
     * @brief 编译命令，为空表示没有编译步骤
     */
    std::vector<std::string> compile_command;

    /**
     * @brief 运行命令
     */
    std::vector<std::string> run_command;

    /**
     * @brief 只检查语法、不运行程序的命令，为空表示没有单独的语法检查工具
     * 用于没有编译步骤的脚本语言，比如 node --check、php -l
     */
    std::vector<std::string> check_command;

    /**
     * @brief 额外传给工具链的环境变量，格式为 KEY=VALUE
     */
    std::vector<std::string> environment;

    /**
     * @brief 运行步骤的地址空间上限，0 表示不限制
     * JVM、V8、Go 运行时会预留大量虚拟地址空间，对这些语言通过 RLIMIT_AS 限制内存
     * 会导致程序无法启动，因此默认配置中不限制。
     */
    std::size_t memory_limit_bytes = 0;

    /**
     * @brief 请求没有指定时间限制时的运行时间限制
     */
    std::chrono::milliseconds default_timeout{10000};

    /**
     * @brief 编译步骤的时间限制，与运行时间限制相互独立
     */
    std::chrono::milliseconds compile_timeout{30000};

    bool has_compile_step() const;

    bool has_check_step() const;

    /**
     * @brief 工具链是否已经安装
     * 沙箱语言总是可用；其余语言要求编译命令和运行命令的可执行文件都能在 PATH 中找到，
     * 包含 '/' 的命令（比如编译产物 ./program）不检查
     */
    bool installed() const;

    /**
     * @brief 将 compile_command 中的占位符替换为实际文件名
     */
    std::vector<std::string> expand_compile_command(const std::string &filename) const;

    /**
     * @brief 将 run_command 中的占位符替换为实际文件名
     */
    std::vector<std::string> expand_run_command(const std::string &filename) const;

    std::vector<std::string> expand_check_command(const std::string &filename) const;
};

void from_json(const nlohmann::json &j, language_profile &profile);
void to_json(nlohmann::json &j, const language_profile &profile);

}  // namespace runbox
