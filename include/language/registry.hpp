#pragma once

#include <filesystem>
#include <map>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include "language/profile.hpp"

namespace runbox {

/**
 * @brief 语言配置表
 * 白名单：只有表中的语言才能被执行，执行命令完全来自配置表，
 * 不会根据请求内容拼接工具链命令。
 * 配置表构造后不可修改，可以被多个线程同时读取。
 */
class language_registry {
public:
    /**
     * @brief 根据给定的语言配置构造配置表
     * @throw std::invalid_argument 若配置不合法（id 重复、非沙箱语言没有运行命令等）
     */
    explicit language_registry(std::vector<language_profile> profiles);

    /**
     * @brief 内置的语言配置表
     * javascript, typescript, python, java, c, cpp, go, rust, php, ruby, shell
     */
    static language_registry builtin();

    /**
     * @brief 从 JSON 数组构造配置表，格式见 from_json(json, language_profile)
     */
    static language_registry from_json(const nlohmann::json &j);

    /**
     * @brief 从 JSON 文件读取配置表
     */
    static language_registry load(const std::filesystem::path &path);

    /**
     * @brief 查找语言配置
     * @param language_id 语言 id
     * @return 语言配置的只读引用，生命周期与配置表相同
     * @throw unsupported_language 若语言不在表中
     */
    const language_profile &resolve(const std::string &language_id) const;

    bool supports(const std::string &language_id) const;

    /**
     * @brief 按 id 排序返回所有语言配置
     */
    std::vector<const language_profile *> list() const;

    std::size_t size() const;

private:
    std::map<std::string, language_profile> profiles;
};

}  // namespace runbox
