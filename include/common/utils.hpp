#pragma once

#include <chrono>
#include <string>

namespace runbox {

/**
 * @brief 根据 key 来查找环境变量
 * @param key 环境变量的键
 * @param def_value 如果键不存在，返回该参数
 * @return 环境变量的值，或者不存在时返回 def_value
 */
std::string get_env(const std::string &key, const std::string &def_value);

/**
 * @brief 设置环境变量
 * @param key 环境变量的键
 * @param value 环境变量的值
 * @param replace 若为真，则覆盖已有的环境变量值
 */
void set_env(const std::string &key, const std::string &value, bool replace = true);

/**
 * @brief 在 PATH 中查找可执行文件
 * @param cmd 命令名，若包含 '/' 则直接检查该路径
 * @return 可执行文件的完整路径，找不到时返回空字符串
 */
std::string which(const std::string &cmd);

/**
 * @brief 生成一个新的执行 id（随机 UUID）
 */
std::string generate_execution_id();

/**
 * @brief 计时器，从构造时开始计时
 * 使用单调时钟，不受系统时间调整影响
 */
struct elapsed_time {

    elapsed_time();

    template <typename DurationT>
    DurationT duration() const {
        return std::chrono::duration_cast<DurationT>(std::chrono::steady_clock::now() - start);
    }

    long long milliseconds() const;

private:
    std::chrono::steady_clock::time_point start;
};

}  // namespace runbox
