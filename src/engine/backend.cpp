#include "engine/backend.hpp"
#include <glog/logging.h>
#include <stdexcept>
#include "common/exceptions.hpp"

namespace runner {
using namespace std;

isolation_backend::~isolation_backend() = default;

unavailable_backend::unavailable_backend(string reason)
    : reason(move(reason)) {}

string unavailable_backend::name() const {
    return "unavailable";
}

raw_outcome unavailable_backend::run(const workspace &, const language_spec &, const execution_limits &, const string &) const {
    throw backend_unavailable(reason);
}

unique_ptr<isolation_backend> select_backend(const string &preference) {
    if (preference == "subprocess") {
        LOG(INFO) << "Using subprocess backend";
        return make_unique<subprocess_backend>();
    }

    if (preference == "container" || preference == "auto") {
        auto container = make_unique<container_backend>();
        if (container->available()) {
            LOG(INFO) << "Using container backend";
            return container;
        }

        if (preference == "container") {
            LOG(ERROR) << "Container runtime is not available, every execution will fail";
            return make_unique<unavailable_backend>("container runtime is not available");
        }

        LOG(WARNING) << "Container runtime is not available, falling back to subprocess backend. "
                     << "Subprocess isolation is weaker, do not use it for untrusted multi-tenant workloads";
        return make_unique<subprocess_backend>();
    }

    throw invalid_argument("unknown backend " + preference + ", expected auto, container or subprocess");
}

}  // namespace runner
