#pragma once

#include <memory>
#include <optional>
#include <string>
#include "engine/execution.hpp"
#include "engine/workspace.hpp"
#include "language/language.hpp"
#include "sandbox/run_options.hpp"

namespace runner {

/**
 * @brief 隔离后端返回的原始结果，由 classify 转换为 execution_result
 */
struct raw_outcome {
    /**
     * @brief 编译阶段的结果，解释型语言为空
     */
    std::optional<run_result> compile;

    /**
     * @brief 运行阶段的结果，编译失败或者后端出错时为空
     */
    std::optional<run_result> run;

    /**
     * @brief 后端自身的错误，与用户代码无关
     */
    std::string fault;
};

/**
 * @brief 隔离后端，负责在受限环境中编译并运行工作目录中的源代码
 * 实现必须是线程安全的，多个执行会同时调用 run
 */
struct isolation_backend {
    virtual ~isolation_backend();

    virtual std::string name() const = 0;

    /**
     * @brief 编译（如果需要）并运行程序
     * 编译失败时不会运行程序
     * @param ws 已经写入源文件的工作目录
     * @param spec 语言配置
     * @param limits 资源限制，编译和运行阶段各自拥有完整的时间预算
     * @param input 标准输入数据
     * @throw internal_error 无法启动命令
     */
    virtual raw_outcome run(const workspace &ws, const language_spec &spec, const execution_limits &limits, const std::string &input) const = 0;
};

/**
 * @brief 直接在本机上运行子进程，通过 rlimit 和进程组限制资源
 * 隔离性比容器弱，程序可以读取本机上当前用户可以读取的文件
 */
struct subprocess_backend : public isolation_backend {
    std::string name() const override;

    raw_outcome run(const workspace &ws, const language_spec &spec, const execution_limits &limits, const std::string &input) const override;

    /**
     * @brief 生成某个阶段的运行参数
     */
    static run_options make_options(const workspace &ws, const language_spec &spec, const execution_limits &limits, const std::string &command, const std::string &input);
};

/**
 * @brief 每次执行启动一个一次性的容器
 * 容器没有网络，根文件系统只读，工作目录只读挂载在 /app，
 * 编译在容器内的 tmpfs /build 中进行
 */
struct container_backend : public isolation_backend {
    /**
     * @param runtime 容器运行时的命令，比如 docker
     */
    explicit container_backend(std::string runtime = "docker");

    std::string name() const override;

    raw_outcome run(const workspace &ws, const language_spec &spec, const execution_limits &limits, const std::string &input) const override;

    /**
     * @brief 检查容器运行时是否可用
     */
    bool available() const;

    /**
     * @brief 生成 docker run 的参数
     * @param container_name 容器名，超时时用于强制删除容器
     * @param script 在容器中执行的 sh 脚本
     */
    std::vector<std::string> make_command(const workspace &ws, const language_spec &spec, const execution_limits &limits, const std::string &container_name, const std::string &script) const;

    /**
     * @brief 生成在容器中编译并运行程序的脚本
     * 每个阶段由 timeout 限制在 time_limit 秒内。
     * 脚本向 stderr 写入带有 id 的标记：脚本已经启动、某个阶段超时、编译失败，
     * 编译失败时以编译器的退出码退出
     * @param id 本次执行的唯一标识，使标记区别于程序自己的输出
     */
    static std::string make_script(const workspace &ws, const language_spec &spec, const execution_limits &limits, const std::string &id);

    /**
     * @brief 根据 docker 客户端的运行结果和脚本写入的标记生成原始结果
     * 标记会从 stderr 中删除
     */
    static raw_outcome make_outcome(run_result result, const language_spec &spec, const std::string &id);

    /**
     * @brief 标记的文本，kind 为 started、timeout 或 compile_failed
     */
    static std::string marker(const std::string &id, const std::string &kind);

private:
    std::string runtime;
};

/**
 * @brief 总是失败的后端，在强制使用容器但容器运行时不可用时使用
 */
struct unavailable_backend : public isolation_backend {
    explicit unavailable_backend(std::string reason);

    std::string name() const override;

    raw_outcome run(const workspace &ws, const language_spec &spec, const execution_limits &limits, const std::string &input) const override;

private:
    std::string reason;
};

/**
 * @brief 根据配置选择隔离后端
 * auto：容器运行时可用时使用容器，否则退回本地子进程并输出警告
 * container：只使用容器，运行时不可用时所有执行都返回错误
 * subprocess：只使用本地子进程
 * @param preference auto、container 或 subprocess
 * @throw std::invalid_argument 无法识别的配置
 */
std::unique_ptr<isolation_backend> select_backend(const std::string &preference);

}  // namespace runner
