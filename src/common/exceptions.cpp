#include "common/exceptions.hpp"
#include <boost/algorithm/string/join.hpp>
#include <boost/exception/diagnostic_information.hpp>

namespace runner {
using namespace std;

runner_exception::runner_exception()
    : runner_exception("") {}

runner_exception::runner_exception(const string &message)
    : message(message), stacktrace(make_shared<boost::stacktrace::stacktrace>()) {}

const char *runner_exception::what() const noexcept {
    return message.c_str();
}

std::ostream &operator<<(std::ostream &os, const runner_exception &ex) {
    os << boost::diagnostic_information(ex) << endl << *ex.stacktrace;
    return os;
}

internal_error::internal_error()
    : runner_exception() {}

internal_error::internal_error(const string &message)
    : runner_exception(message) {}

unsupported_language::unsupported_language(const string &language)
    : runner_exception("Unsupported language: " + language), language(language) {}

validation_error::validation_error(const vector<string> &violations)
    : runner_exception("Code validation failed: " + boost::algorithm::join(violations, "; ")), violations(violations) {}

no_public_type_found::no_public_type_found(const string &language)
    : runner_exception("No public class found in " + language + " source, cannot determine source file name") {}

backend_unavailable::backend_unavailable(const string &message)
    : runner_exception(message) {}

}  // namespace runner
