#pragma once

#include <filesystem>
#include <string>

namespace grader {

/**
 * @brief 读取文本文件的全部内容
 * @param path 文本文件路径
 * @return 文本文件的内容(没有指定编码)
 * @throw std::system_error 文件无法打开
 */
std::string read_file_content(const std::filesystem::path &path);

/**
 * @brief 将 content 写入文件，文件已存在时覆盖
 * @throw std::system_error 写入失败
 */
void write_file_content(const std::filesystem::path &path, const std::string &content);

/**
 * @brief 取出文本中最后一个非空行，不包含行尾的换行符
 * 用于从 Python 的 traceback 中提取异常信息，例如 "ZeroDivisionError: division by zero"
 */
std::string last_line(const std::string &text);

}  // namespace grader
