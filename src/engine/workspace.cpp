#include "engine/workspace.hpp"
#include <glog/logging.h>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <algorithm>
#include <cctype>
#include <regex>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/stl_utils.hpp"

namespace runner {
using namespace std;
namespace fs = std::filesystem;

string find_public_type(const string &code, const string &language) {
    // 在折叠空白后的文本上匹配，\s 只需匹配一个字符
    static const regex public_type_re(R"re(\bpublic\s(?:(?:final|abstract|static|sealed|strictfp)\s){0,8}(?:class|interface|enum|record)\s(?=[A-Za-z_$]))re");
    string text = collapse_whitespace(code).text;
    smatch m;
    if (!regex_search(text, m, public_type_re))
        throw no_public_type_found(language);

    auto begin = text.begin() + m.position(0) + m.length(0);
    auto end = find_if(begin, text.end(), [](char c) { return !isalnum((unsigned char)c) && c != '_' && c != '$'; });
    return string(begin, end);
}

workspace::workspace(fs::path dir, string source_name, string main_class)
    : root(move(dir)), source(move(source_name)), klass(move(main_class)), owned(true) {}

workspace workspace::acquire(const fs::path &root, const language_spec &spec, const string &code) {
    string main_class, source_name;
    if (spec.is_jvm()) {
        main_class = assert_safe_path(find_public_type(code, spec.name));
        source_name = main_class + spec.extension;
    } else {
        source_name = "main" + spec.extension;
    }

    static thread_local boost::uuids::random_generator uuid_generator;
    fs::path dir = root / boost::uuids::to_string(uuid_generator());

    error_code ec;
    fs::create_directories(dir, ec);
    if (ec) throw internal_error("unable to create workspace " + dir.string() + ": " + ec.message());

    workspace ws(dir, source_name, main_class);
    // 写入失败时 ws 析构会删除已经创建的目录
    write_file_content(ws.source_file(), code);
    DLOG(INFO) << "Workspace " << dir << " acquired for " << spec.name;
    return ws;
}

workspace::workspace(workspace &&other) noexcept
    : root(move(other.root)), source(move(other.source)), klass(move(other.klass)), owned(other.owned) {
    other.owned = false;
}

workspace &workspace::operator=(workspace &&other) noexcept {
    if (this != &other) {
        release();
        root = move(other.root);
        source = move(other.source);
        klass = move(other.klass);
        owned = other.owned;
        other.owned = false;
    }
    return *this;
}

workspace::~workspace() {
    release();
}

void workspace::release() noexcept {
    if (!owned) return;
    owned = false;

    error_code ec;
    fs::remove_all(root, ec);
    if (ec)
        LOG(ERROR) << "Unable to remove workspace " << root << ": " << ec.message();
}

bool workspace::released() const {
    return !owned;
}

const fs::path &workspace::dir() const {
    return root;
}

fs::path workspace::source_file() const {
    return root / source;
}

const string &workspace::source_name() const {
    return source;
}

const string &workspace::main_class() const {
    return klass;
}

}  // namespace runner
