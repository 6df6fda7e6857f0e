#include "language/language.hpp"
#include <fmt/format.h>
#include <algorithm>
#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/split.hpp>
#include "common/stl_utils.hpp"

namespace runner {
using namespace std;

denied_pattern deny(const string &pattern, const string &description) {
    return denied_pattern{pattern, description, regex(pattern, regex::ECMAScript | regex::optimize)};
}

bool language_spec::needs_compile() const {
    return visit(overloaded{
                     [](const interpreted_family &) { return false; },
                     [](const native_family &) { return true; },
                     [](const jvm_family &) { return true; }},
                 family);
}

bool language_spec::is_jvm() const {
    return holds_alternative<jvm_family>(family);
}

optional<string> language_spec::compile_command() const {
    return visit(overloaded{
                     [](const interpreted_family &) -> optional<string> { return nullopt; },
                     [](const native_family &f) -> optional<string> { return f.compile_command; },
                     [](const jvm_family &f) -> optional<string> { return f.compile_command; }},
                 family);
}

string language_spec::run_command() const {
    return visit([](auto &f) { return f.run_command; }, family);
}

static string expand_template(const string &text, const command_context &ctx) {
    return fmt::format(fmt::runtime(text),
                       fmt::arg("source", ctx.source),
                       fmt::arg("class", ctx.main_class),
                       fmt::arg("memory", ctx.memory_limit));
}

vector<string> expand_command(const string &command, const command_context &ctx) {
    string expanded = expand_template(command, ctx);
    vector<string> args;
    boost::split(args, expanded, boost::is_any_of(" \t"), boost::token_compress_on);
    args.erase(remove(args.begin(), args.end(), ""), args.end());
    return args;
}

vector<string> expand_environment(const vector<string> &environment, const command_context &ctx) {
    vector<string> result;
    append(result, environment, [&](const string &entry) { return expand_template(entry, ctx); });
    return result;
}

}  // namespace runner
