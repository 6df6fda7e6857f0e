#include "engine/engine.hpp"
#include <fmt/format.h>
#include <glog/logging.h>
#include "common/defer.hpp"
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/utils.hpp"
#include "config.hpp"
#include "engine/classifier.hpp"
#include "engine/workspace.hpp"

namespace runner {
using namespace std;

execution_engine::execution_engine(const language_registry &registry, unique_ptr<isolation_backend> &&backend, filesystem::path run_dir, execution_limits defaults)
    : registry(registry), isolation(move(backend)), run_dir(move(run_dir)), defaults(defaults) {
    CHECK(isolation) << "isolation backend must not be null";
}

static execution_result rejected(const vector<violation> &violations) {
    execution_result result;
    result.status = status::VALIDATION_ERROR;
    result.violations = violations;
    validation_result vr{false, violations};
    result.error = validation_error(vr.messages()).what();
    return result;
}

static execution_result failed(status stat, const string &message) {
    execution_result result;
    result.status = stat;
    result.error = message;
    return result;
}

execution_result execution_engine::execute_checked(const execution_request &request) const {
    const language_spec &spec = registry.resolve(request.language);

    vector<violation> bounds;
    if (request.code.size() > MAX_SOURCE_SIZE)
        bounds.push_back({"code", fmt::format("source code exceeds {} bytes", MAX_SOURCE_SIZE), 0});
    if (request.input_data.size() > MAX_STDIN_SIZE)
        bounds.push_back({"input_data", fmt::format("input data exceeds {} bytes", MAX_STDIN_SIZE), 0});
    if (!utf8_check_is_valid(request.code))
        bounds.push_back({"code", "source code is not valid UTF-8", 0});
    if (!bounds.empty())
        return rejected(bounds);

    validation_result validation = runner::validate(request.code, spec);
    if (!validation.valid) {
        LOG(INFO) << "Rejected " << spec.name << " code with " << validation.violations.size() << " violation(s)";
        return rejected(validation.violations);
    }

    execution_limits limits = defaults.with(request);
    workspace ws = workspace::acquire(run_dir, spec, request.code);
    defer { ws.release(); };

    raw_outcome outcome = isolation->run(ws, spec, limits, request.input_data);
    return classify(outcome, limits);
}

execution_result execution_engine::execute(const execution_request &request) const {
    elapsed_time timer;
    execution_result result;
    try {
        result = execute_checked(request);
    } catch (unsupported_language &e) {
        result = failed(status::SYSTEM_ERROR, e.what());
    } catch (no_public_type_found &e) {
        result = failed(status::COMPILATION_ERROR, e.what());
    } catch (validation_error &e) {
        result = failed(status::VALIDATION_ERROR, e.what());
    } catch (runner_exception &e) {
        LOG(ERROR) << "Execution of " << request.language << " code failed: " << e;
        result = failed(status::SYSTEM_ERROR, e.what());
    } catch (exception &e) {
        LOG(ERROR) << "Execution of " << request.language << " code failed: " << e.what();
        result = failed(status::SYSTEM_ERROR, e.what());
    }

    LOG(INFO) << "Executed " << request.language << " code with status " << get_status_name(result.status)
              << " in " << timer.seconds() << "s";
    return result;
}

validation_result execution_engine::validate(const string &code, const string &language) const {
    return runner::validate(code, registry.resolve(language));
}

vector<string> execution_engine::supported_languages() const {
    return registry.supported_languages();
}

const isolation_backend &execution_engine::backend() const {
    return *isolation;
}

}  // namespace runner
