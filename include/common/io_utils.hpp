#pragma once

#include <filesystem>
#include <string>

namespace runner {

/**
 * @brief 读取文本文件的全部内容
 * @param path 文本文件路径
 * @return 文本文件的内容(没有指定编码)
 * @throw internal_error 文件无法打开
 */
std::string read_file_content(const std::filesystem::path &path);

/**
 * @brief 将内容写入文件，文件已存在时覆盖
 * @throw internal_error 文件无法写入
 */
void write_file_content(const std::filesystem::path &path, const std::string &content);

bool utf8_check_is_valid(const std::string &string);

/**
 * @brief 断言文件名不会跳出所在目录
 * 源文件名可能来自用户代码（比如 Java 的类名），如果文件名包含路径分隔符
 * 或者 ".."，写入时可能覆盖工作目录以外的文件。
 * @param filename 被检查的文件名
 * @return filename 本身
 */
std::string assert_safe_path(const std::string &filename);

}  // namespace runner
