#pragma once

#include <cstddef>
#include <filesystem>
#include <string>

namespace runner {

/**
 * @brief 每个阶段（编译、运行）的时钟时间限制，单位为秒
 * 编译阶段和运行阶段各自拥有完整的时间预算
 * 环境变量 TIMELIMIT
 */
extern double TIME_LIMIT;

/**
 * @brief 内存限制，单位为 MB
 * 对于本地子进程后端，会作为地址空间上限（RLIMIT_AS）；
 * 对于 JVM、V8、Go 这类预留大量虚拟内存的运行时，改为限制数据段（RLIMIT_DATA）并通过运行时参数限制堆大小。
 * 环境变量 MEMLIMIT
 */
extern int MEMORY_LIMIT;

/**
 * @brief 程序能写入的单个文件大小上限，单位为 KB
 * 环境变量 FILELIMIT
 */
extern int FILE_LIMIT;

/**
 * @brief 进程（线程）数上限，小于等于 0 表示不限制
 * RLIMIT_NPROC 统计的是运行用户的所有进程，以非 root 用户运行时需要留出余量
 * 环境变量 PROCLIMIT
 */
extern int PROC_LIMIT;

/**
 * @brief stdout 和 stderr 各自最多保存多少 KB 的输出
 * 超出的部分会被丢弃，但管道仍然会被读完，避免子进程阻塞
 * 环境变量 STREAMSIZE
 */
extern int STREAM_SIZE;

/**
 * @brief 单次请求能指定的时间限制上限，单位为秒，超出时按上限执行
 * 环境变量 MAXTIMELIMIT
 */
extern double MAX_TIME_LIMIT;

/**
 * @brief 单次请求能指定的内存限制上限，单位为 MB，超出时按上限执行
 * 环境变量 MAXMEMLIMIT
 */
extern int MAX_MEMORY_LIMIT;

/**
 * @brief 源代码的最大长度，单位为字节
 */
extern std::size_t MAX_SOURCE_SIZE;

/**
 * @brief 标准输入数据的最大长度，单位为字节
 */
extern std::size_t MAX_STDIN_SIZE;

/**
 * @brief 工作目录的根目录
 * 每次执行都会在其中创建一个以 uuid 命名的目录，执行结束后删除
 *
 * RUN_DIR
 * ├── 2f0c6a6e-... // 随机生成的 uuid
 * │   ├── main.py // 用户代码，Java 为 <PublicType>.java
 * │   └── program // 编译产物（如果需要编译）
 * └── ...
 *
 * 环境变量 RUNDIR
 */
extern std::filesystem::path RUN_DIR;

/**
 * @brief 隔离后端：auto、container 或 subprocess
 * 环境变量 BACKEND
 */
extern std::string BACKEND;

/**
 * @brief 批量模式下的并发执行数
 * 环境变量 WORKERS
 */
extern int WORKERS;

/**
 * @brief 是否开启 DEBUG 模式
 * 开启后输出更详细的日志，包括每次执行的命令行
 */
extern bool DEBUG;

/**
 * @brief 检查各项配置的取值范围
 * @throw std::invalid_argument 某项配置超出范围
 */
void check_config();

}  // namespace runner
