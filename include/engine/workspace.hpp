#pragma once

#include <filesystem>
#include <string>
#include "language/language.hpp"

namespace runner {

/**
 * @brief 一次执行独占的临时工作目录
 * 目录以随机 uuid 命名，其中只有用户的源文件和编译产物。
 * 析构时删除整个目录，无论执行成功、失败还是超时被杀死。
 */
struct workspace {
    /**
     * @brief 创建工作目录并写入源文件
     * 源文件名为 main<ext>，Java 为代码中唯一的 public 类型名。
     * 找不到 public 类型时，在创建任何目录之前抛出 no_public_type_found。
     * @param root 工作目录的根目录
     * @param spec 语言配置
     * @param code 源代码
     * @throw no_public_type_found, internal_error
     */
    static workspace acquire(const std::filesystem::path &root, const language_spec &spec, const std::string &code);

    workspace(workspace &&other) noexcept;
    workspace &operator=(workspace &&other) noexcept;
    workspace(const workspace &) = delete;
    workspace &operator=(const workspace &) = delete;
    ~workspace();

    /**
     * @brief 删除工作目录，可以重复调用
     * 删除失败时只记录日志，不抛出异常
     */
    void release() noexcept;

    bool released() const;

    const std::filesystem::path &dir() const;

    std::filesystem::path source_file() const;

    const std::string &source_name() const;

    /**
     * @brief JVM 的主类名，其他语言为空
     */
    const std::string &main_class() const;

private:
    workspace(std::filesystem::path dir, std::string source_name, std::string main_class);

    std::filesystem::path root;
    std::string source;
    std::string klass;
    bool owned = false;
};

/**
 * @brief 查找 Java 源代码中声明的 public 类型名
 * @return 第一个 public class/interface/enum/record 的名称
 * @throw no_public_type_found 找不到 public 类型
 */
std::string find_public_type(const std::string &code, const std::string &language);

}  // namespace runner
