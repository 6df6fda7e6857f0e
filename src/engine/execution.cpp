#include "engine/execution.hpp"
#include <algorithm>
#include <limits>
#include "common/json_utils.hpp"
#include "config.hpp"

namespace runner {
using namespace std;

execution_limits default_limits() {
    return {TIME_LIMIT, MEMORY_LIMIT, FILE_LIMIT, PROC_LIMIT, STREAM_SIZE};
}

execution_limits execution_limits::with(const execution_request &request) const {
    execution_limits limits = *this;
    if (request.time_limit > 0) limits.time_limit = min(request.time_limit, MAX_TIME_LIMIT);
    if (request.memory_limit > 0) limits.memory_limit = min(request.memory_limit, MAX_MEMORY_LIMIT);
    return limits;
}

void to_json(nlohmann::json &j, const violation &v) {
    j = {{"token", v.token}, {"rule", v.rule}, {"line", v.line}};
}

void to_json(nlohmann::json &j, const execution_result &result) {
    j = {{"output", result.output},
         {"error", result.error},
         {"execution_time", result.execution_time},
         {"status", get_status_name(result.status)},
         {"exit_code", nullptr},
         {"memory_used", result.memory_used},
         {"cpu_time", result.cpu_time},
         {"output_truncated", result.output_truncated},
         {"error_truncated", result.error_truncated}};
    if (result.exit_code) j["exit_code"] = *result.exit_code;
    if (result.signal) j["signal"] = *result.signal;
    if (!result.violations.empty()) j["violations"] = result.violations;
}

void from_json(const nlohmann::json &j, execution_request &request) {
    request.code = nlohmann::get_value<string>(j, "code");
    request.language = nlohmann::get_value<string>(j, "language");
    request.input_data = nlohmann::get_value_def<string>(j, "", "input_data");
    request.time_limit = nlohmann::get_value_def<double>(j, -1, "time_limit");
    // 先按浮点数读取，避免超出 int 范围的数值
    double memory_limit = nlohmann::get_value_def<double>(j, -1, "memory_limit");
    request.memory_limit = memory_limit > 0 ? (int)min(memory_limit, (double)numeric_limits<int>::max()) : -1;
}

}  // namespace runner
