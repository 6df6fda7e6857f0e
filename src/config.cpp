#include "config.hpp"
#include <fmt/format.h>
#include <cmath>
#include <stdexcept>
#include <thread>

namespace runner {
using namespace std;

double TIME_LIMIT = 30;          // 30s
int MEMORY_LIMIT = 512;          // 512M
int FILE_LIMIT = 10240;          // 10M
int PROC_LIMIT = 64;
int STREAM_SIZE = 1024;          // 1M
double MAX_TIME_LIMIT = 300;     // 5min
int MAX_MEMORY_LIMIT = 4096;     // 4G
size_t MAX_SOURCE_SIZE = 100 * 1024;
size_t MAX_STDIN_SIZE = 10 * 1024;

filesystem::path RUN_DIR = filesystem::temp_directory_path() / "code-runner";
string BACKEND = "auto";
int WORKERS = max(1, (int)thread::hardware_concurrency());
bool DEBUG = false;

void check_config() {
    if (!(MAX_TIME_LIMIT > 0) || !isfinite(MAX_TIME_LIMIT))
        throw invalid_argument(fmt::format("maximum time limit must be a positive number of seconds, got {}", MAX_TIME_LIMIT));
    if (!(TIME_LIMIT > 0) || TIME_LIMIT > MAX_TIME_LIMIT)
        throw invalid_argument(fmt::format("time limit must be in (0, {}] seconds, got {}", MAX_TIME_LIMIT, TIME_LIMIT));
    if (MAX_MEMORY_LIMIT <= 0)
        throw invalid_argument(fmt::format("maximum memory limit must be positive, got {}", MAX_MEMORY_LIMIT));
    if (MEMORY_LIMIT <= 0 || MEMORY_LIMIT > MAX_MEMORY_LIMIT)
        throw invalid_argument(fmt::format("memory limit must be in (0, {}] MB, got {}", MAX_MEMORY_LIMIT, MEMORY_LIMIT));
    if (FILE_LIMIT <= 0)
        throw invalid_argument(fmt::format("file limit must be positive, got {}", FILE_LIMIT));
    if (STREAM_SIZE < 0)
        throw invalid_argument(fmt::format("stream size must not be negative, got {}", STREAM_SIZE));
    if (WORKERS < 1)
        throw invalid_argument(fmt::format("number of workers must be at least 1, got {}", WORKERS));
}

}  // namespace runner
