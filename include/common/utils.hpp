#pragma once

#include <chrono>
#include <string>
#include <vector>

namespace runner {

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
 * @param program 程序名，若包含 '/' 则直接检查该路径
 * @return 是否能找到可执行的程序
 */
bool command_exists(const std::string &program);

/**
 * @brief 将字符串转为小写，用于语言名的大小写无关查找
 */
std::string to_lower(std::string str);

/**
 * @brief 计时器，从构造时开始计时
 * 使用 steady_clock，不受系统时间调整的影响
 */
struct elapsed_time {
    elapsed_time();

    template <typename DurationT>
    DurationT duration() const {
        return std::chrono::duration_cast<DurationT>(std::chrono::steady_clock::now() - start);
    }

    /**
     * @brief 经过的时间，单位为秒
     */
    double seconds() const;

private:
    std::chrono::steady_clock::time_point start;
};

}  // namespace runner
