#include "language/registry.hpp"
#include <glog/logging.h>
#include "common/exceptions.hpp"
#include "common/utils.hpp"

namespace runner {
using namespace std;

language_registry::language_registry(vector<language_spec> specs) {
    for (auto &spec : specs) {
        string key = to_lower(spec.name);
        CHECK(!languages.count(key)) << "duplicated language " << key;
        languages.emplace(key, move(spec));
    }
}

const language_spec &language_registry::resolve(const string &name) const {
    auto it = languages.find(to_lower(name));
    if (it == languages.end())
        throw unsupported_language(name);
    return it->second;
}

bool language_registry::contains(const string &name) const {
    return languages.count(to_lower(name)) > 0;
}

vector<string> language_registry::supported_languages() const {
    vector<string> names;
    for (auto &[name, spec] : languages)
        names.push_back(name);
    return names;
}

const language_registry &language_registry::builtin() {
    static const language_registry registry(builtin_languages());
    return registry;
}

}  // namespace runner
