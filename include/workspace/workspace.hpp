#pragma once

#include <chrono>
#include <filesystem>
#include <string>

namespace runbox {

/**
 * @brief 表示一次执行独占的临时目录
 * 每个执行请求恰好对应一个工作区，工作区不会被共享或者复用，
 * 且只会被删除一次（重复删除不会报错）。
 */
struct workspace {
    std::filesystem::path path;

    /**
     * @brief 拥有该工作区的执行 id
     */
    std::string execution_id;

    std::chrono::system_clock::time_point created_at;
};

/**
 * @brief 工作区的分配、写入与删除
 * 所有工作区都位于 root 目录下，目录名为 <执行 id>-<随机后缀>。
 */
class workspace_manager {
public:
    explicit workspace_manager(std::filesystem::path root);

    /**
     * @brief 创建一个新的空工作区
     * @param execution_id 执行 id，必须满足 is_safe_identifier
     * @throw validation_error 若 execution_id 不合法
     * @throw internal_error 若无法创建目录
     */
    workspace allocate(const std::string &execution_id);

    /**
     * @brief 向工作区写入文件
     * @param ws 目标工作区
     * @param filename 文件名，必须是单级的安全文件名（见 assert_safe_path）
     * @param content 文件内容
     * @return 写入的文件路径
     * @throw validation_error 若文件名不安全
     */
    std::filesystem::path write(const workspace &ws, const std::string &filename, const std::string &content);

    /**
     * @brief 递归删除工作区
     * 工作区已经不存在时什么也不做。删除失败只记录日志，不会抛出异常。
     * @return 是否删除了文件
     */
    bool destroy(const workspace &ws) noexcept;

    const std::filesystem::path &root() const;

private:
    std::filesystem::path root_dir;
};

}  // namespace runbox
