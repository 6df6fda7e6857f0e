#include "common/utils.hpp"
#include <unistd.h>
#include <algorithm>
#include <boost/algorithm/string/split.hpp>
#include <boost/algorithm/string/classification.hpp>
#include <cctype>
#include <filesystem>

namespace runner {
using namespace std;

string get_env(const string &key, const string &def_value) {
    char *result = getenv(key.c_str());
    return !result ? def_value : string(result);
}

void set_env(const string &key, const string &value, bool replace) {
    setenv(key.c_str(), value.c_str(), replace);
}

bool command_exists(const string &program) {
    if (program.find('/') != string::npos)
        return access(program.c_str(), X_OK) == 0;

    vector<string> dirs;
    string path = get_env("PATH", "/usr/local/bin:/usr/bin:/bin");
    boost::split(dirs, path, boost::is_any_of(":"));
    for (auto &dir : dirs) {
        if (dir.empty()) continue;
        filesystem::path candidate = filesystem::path(dir) / program;
        if (access(candidate.c_str(), X_OK) == 0)
            return true;
    }
    return false;
}

string to_lower(string str) {
    transform(str.begin(), str.end(), str.begin(), [](unsigned char c) { return tolower(c); });
    return str;
}

elapsed_time::elapsed_time() {
    start = chrono::steady_clock::now();
}

double elapsed_time::seconds() const {
    return duration<chrono::duration<double>>().count();
}

}  // namespace runner
