#include "common/status.hpp"
#include <boost/assign.hpp>
#include <unordered_map>

namespace runner {
using namespace std;

// clang-format off
static const unordered_map<status, const char *> status_name = boost::assign::map_list_of
    (status::SUCCESS, "success")
    (status::COMPILATION_ERROR, "compilation_error")
    (status::RUNTIME_ERROR, "runtime_error")
    (status::TIMEOUT, "timeout")
    (status::VALIDATION_ERROR, "validation_error")
    (status::SYSTEM_ERROR, "error");
// clang-format on

const char *get_status_name(status stat) {
    return status_name.at(stat);
}

}  // namespace runner
