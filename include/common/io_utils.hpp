#pragma once

#include <filesystem>
#include <string>

namespace runbox {

/**
 * @brief 读取文本文件的全部内容
 * @param path 文本文件路径
 * @return 文本文件的内容(没有指定编码)
 */
std::string read_file_content(const std::filesystem::path &path);

/**
 * @brief 将 content 写入文件，文件已存在时覆盖
 * @throw std::system_error 若无法打开或写入文件
 */
void write_file_content(const std::filesystem::path &path, const std::string &content);

/**
 * @brief 断言 segment 是一个安全的单级文件名
 * 这里用于确保调用方传入的文件名不会导致目录遍历攻击：
 * 文件名不能为空，不能包含 '/' 和 '\0'，不能是 "." 或 ".."，也不能以 '-' 开头
 * （避免被工具链当作命令行选项）。
 * @param segment 被检查的文件名
 * @return segment 本身
 * @throw validation_error 若文件名不安全
 */
std::string assert_safe_path(const std::string &segment);

/**
 * @brief 判断 id 是否只包含字母、数字、'-' 和 '_'，且长度在 1 到 64 之间
 */
bool is_safe_identifier(const std::string &id);

}  // namespace runbox
