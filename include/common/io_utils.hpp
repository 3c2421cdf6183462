#pragma once

#include <cstddef>
#include <filesystem>
#include <string>

namespace codejudge {

/**
 * @brief 读取文本文件的全部内容
 * @param path 文本文件路径
 * @return 文本文件的内容(没有指定编码)
 */
std::string read_file_content(const std::filesystem::path &path);

/**
 * @brief 读取文本文件的全部内容
 * @param path 文本文件路径
 * @param def 若文件不存在，返回 def
 * @return 文本文件的内容(没有指定编码)
 */
std::string read_file_content(std::filesystem::path const &path, const std::string &def);

/**
 * @brief 读取文件的前 limit 个字节
 * 用户程序的输出可能很大，我们只需要用于比较和报告的部分。
 * @param path 文件路径，文件不存在时返回空字符串
 * @param limit 最多读取的字节数
 */
std::string read_file_prefix(const std::filesystem::path &path, std::size_t limit);

/**
 * @brief 将 content 写入文件，覆盖已有的内容
 * @throw std::system_error 如果文件无法写入
 */
void write_file_content(const std::filesystem::path &path, const std::string &content);

bool utf8_check_is_valid(const std::string &string);

/**
 * @brief 将非法的 UTF-8 字节替换为 '?'
 * 用户程序的输出不保证是合法的 UTF-8 编码，而 JSON 序列化要求字符串
 * 为合法的 UTF-8，因此在返回评测报告前需要清理输出。
 */
std::string utf8_sanitize(const std::string &string);

/**
 * @brief 截取字符串的前 limit 个字节，并保证截断后仍然是合法的 UTF-8
 */
std::string truncate_utf8(const std::string &string, std::size_t limit);

}  // namespace codejudge
