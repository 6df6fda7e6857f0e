#include "validator/validator.hpp"
#include <fmt/format.h>
#include <algorithm>
#include <boost/algorithm/string/predicate.hpp>
#include <boost/algorithm/string/split.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/classification.hpp>
#include <cctype>
#include <regex>
#include "common/stl_utils.hpp"

namespace runner {
using namespace std;

string to_string(const violation &v) {
    return fmt::format("line {}: '{}' ({})", v.line, v.token, v.rule);
}

bool operator==(const violation &a, const violation &b) {
    return a.token == b.token && a.rule == b.rule && a.line == b.line;
}

vector<string> validation_result::messages() const {
    vector<string> result;
    append(result, violations, [](const violation &v) { return to_string(v); });
    return result;
}

/**
 * @brief 行号索引，按位置二分查找所在行
 */
struct line_index {
    explicit line_index(const string &text) {
        for (size_t i = 0; i < text.size(); ++i)
            if (text[i] == '\n') newlines.push_back(i);
    }

    size_t line(size_t pos) const {
        return 1 + (lower_bound(newlines.begin(), newlines.end(), pos) - newlines.begin());
    }

    vector<size_t> newlines;
};

static bool is_word_char(char c) {
    return isalnum((unsigned char)c) || c == '_';
}

static bool is_blank(char c) {
    return isspace((unsigned char)c);
}

/**
 * @brief 查找 word 作为完整单词出现的所有位置
 */
static vector<size_t> find_word(const string &text, const string &word) {
    vector<size_t> positions;
    for (size_t pos = text.find(word); pos != string::npos; pos = text.find(word, pos + 1)) {
        size_t stop = pos + word.size();
        if ((pos == 0 || !is_word_char(text[pos - 1])) && (stop == text.size() || !is_word_char(text[stop])))
            positions.push_back(pos);
    }
    return positions;
}

/**
 * @brief 跳过空白以及行注释和块注释
 */
static size_t skip_space(const string &code, size_t i) {
    while (i < code.size()) {
        if (is_blank(code[i])) {
            ++i;
        } else if (code.compare(i, 2, "//") == 0) {
            i = code.find('\n', i);
            if (i == string::npos) return code.size();
        } else if (code.compare(i, 2, "/*") == 0) {
            i = code.find("*/", i + 2);
            if (i == string::npos) return code.size();
            i += 2;
        } else {
            break;
        }
    }
    return i;
}

static size_t read_word(const string &code, size_t i, string &word) {
    size_t start = i;
    while (i < code.size() && is_word_char(code[i])) ++i;
    word = code.substr(start, i - start);
    return i;
}

/**
 * @brief 读取 code[i] 处的引号字面量
 * @param forbidden 字面量中出现这些子串时视为含有插值或转义，不能静态确定内容
 * @return 字面量结束后的位置，没有闭合引号时返回 npos
 */
static size_t read_quoted(const string &code, size_t i, string &content, bool &literal, const vector<string> &forbidden) {
    char quote = code[i];
    size_t stop = i + 1;
    while (stop < code.size() && code[stop] != quote && code[stop] != '\n') {
        if (code[stop] == '\\') ++stop;
        ++stop;
    }
    if (stop >= code.size() || code[stop] != quote) return string::npos;
    content = code.substr(i + 1, stop - i - 1);
    literal = none_of(forbidden.begin(), forbidden.end(), [&](const string &s) { return content.find(s) != string::npos; });
    return stop + 1;
}

static string statement_at(const string &code, size_t pos) {
    size_t stop = code.find_first_of(";\n", pos);
    return boost::trim_copy(code.substr(pos, stop == string::npos ? string::npos : stop - pos));
}

static bool starts_with_keyword(const string &text, const string &keyword) {
    return boost::starts_with(text, keyword) && text.size() > keyword.size() && is_blank(text[keyword.size()]);
}

static void scan_python_statement(string statement, size_t line, vector<imported_name> &imports) {
    boost::trim_left(statement);
    if (starts_with_keyword(statement, "from")) {
        string rest = boost::trim_left_copy(statement.substr(4));
        string name = rest.substr(0, rest.find_first_of(" \t\r\f\v("));
        if (!name.empty()) imports.push_back({name, line, true});
    } else if (starts_with_keyword(statement, "import")) {
        string names = statement.substr(6);
        // 去掉行尾注释
        names = names.substr(0, names.find('#'));
        vector<string> modules;
        boost::split(modules, names, boost::is_any_of(","));
        for (auto &module : modules) {
            boost::trim(module);
            // import a.b as c
            string name = module.substr(0, module.find_first_of(" \t\r\f\v"));
            if (!name.empty()) imports.push_back({name, line, true});
        }
    }
}

static void extract_python(const string &code, vector<imported_name> &imports) {
    // 反斜杠续行拼接为一个逻辑行，再按 ';' 和 ':' 拆分语句，覆盖 if x: import os 这样的复合语句
    string logical;
    size_t line = 1, start_line = 1;
    auto flush = [&]() {
        vector<string> statements;
        boost::split(statements, logical, boost::is_any_of(";:"));
        for (auto &statement : statements)
            scan_python_statement(statement, start_line, imports);
        logical.clear();
    };

    for (size_t i = 0; i < code.size(); ++i) {
        if (code[i] == '\\' && code.compare(i + 1, 1, "\n") == 0) {
            logical += ' ';
            ++i, ++line;
        } else if (code[i] == '\\' && code.compare(i + 1, 2, "\r\n") == 0) {
            logical += ' ';
            i += 2, ++line;
        } else if (code[i] == '\n') {
            flush();
            start_line = ++line;
        } else {
            logical += code[i];
        }
    }
    flush();
}

/**
 * @brief 读取一条 Go 导入说明：可选的别名加上字符串字面量
 * @return 导入说明结束后的位置，不是导入说明时返回 npos
 */
static size_t read_go_import_spec(const string &code, size_t i, const line_index &lines, vector<imported_name> &imports) {
    if (i < code.size() && (code[i] == '.' || is_word_char(code[i]))) {
        if (code[i] == '.') ++i;
        while (i < code.size() && is_word_char(code[i])) ++i;
        i = skip_space(code, i);
    }
    if (i >= code.size() || (code[i] != '"' && code[i] != '`')) return string::npos;

    size_t stop = code.find(code[i], i + 1);
    if (stop == string::npos) return string::npos;
    string path = code.substr(i + 1, stop - i - 1);
    // 解释型字符串中的转义序列可以拼出任意路径
    bool literal = code[i] == '`' || path.find('\\') == string::npos;
    imports.push_back({path, lines.line(i), literal});
    return stop + 1;
}

static void extract_go(const string &code, vector<imported_name> &imports) {
    line_index lines(code);
    size_t scanned = 0;
    for (size_t pos : find_word(code, "import")) {
        if (pos < scanned) continue;
        size_t i = skip_space(code, pos + 6);
        if (i < code.size() && code[i] == '(') {
            ++i;
            while (true) {
                i = skip_space(code, i);
                while (i < code.size() && code[i] == ';') i = skip_space(code, i + 1);
                if (i >= code.size() || code[i] == ')') break;
                size_t next = read_go_import_spec(code, i, lines, imports);
                if (next == string::npos) break;
                i = next;
            }
        } else {
            size_t next = read_go_import_spec(code, i, lines, imports);
            if (next != string::npos) i = next;
        }
        scanned = i;
    }
}

/**
 * @brief C 预处理器的前两个翻译阶段：替换三字符组，拼接续行
 * @param origin 输出每个字符在原文中的位置
 */
static string splice_lines(const string &code, vector<size_t> &origin) {
    string text;
    for (size_t i = 0; i < code.size(); ++i) {
        char c = code[i];
        size_t at = i;
        if (code.compare(i, 3, "?\?=") == 0) {
            c = '#';
            i += 2;
        } else if (code.compare(i, 3, "?\?/") == 0) {
            c = '\\';
            i += 2;
        }
        if (c == '\\' && code.compare(i + 1, 1, "\n") == 0) {
            ++i;
            continue;
        }
        if (c == '\\' && code.compare(i + 1, 2, "\r\n") == 0) {
            i += 2;
            continue;
        }
        text += c;
        origin.push_back(at);
    }
    return text;
}

static void extract_c_include(const string &code, vector<imported_name> &imports) {
    vector<size_t> origin;
    string text = splice_lines(code, origin);
    line_index lines(code);

    for (size_t pos = 0; pos < text.size(); ++pos) {
        size_t i;
        if (text[pos] == '#')
            i = pos + 1;
        else if (text.compare(pos, 2, "%:") == 0)
            i = pos + 2;
        else
            continue;

        // 指令前只能有空白，或者以 */ 结束的注释
        size_t before = pos;
        while (before > 0 && (text[before - 1] == ' ' || text[before - 1] == '\t')) --before;
        if (before > 0 && text[before - 1] != '\n' && !(before >= 2 && text.compare(before - 2, 2, "*/") == 0))
            continue;

        i = skip_space(text, i);
        string directive;
        i = read_word(text, i, directive);
        if (directive != "include" && directive != "include_next" && directive != "import") {
            pos = i - 1;
            continue;
        }

        while (i < text.size() && text[i] != '\n' && is_blank(text[i])) ++i;
        size_t eol = text.find('\n', i);
        if (eol == string::npos) eol = text.size();
        size_t line = lines.line(origin[pos]);
        size_t close = string::npos;
        if (i < eol && text[i] == '<')
            close = text.find('>', i + 1);
        else if (i < eol && text[i] == '"')
            close = text.find('"', i + 1);

        if (close != string::npos && close < eol)
            imports.push_back({boost::trim_copy(text.substr(i + 1, close - i - 1)), line, true});
        else
            imports.push_back({boost::trim_copy(text.substr(i, eol - i)), line, false});
        pos = i;
    }
}

static void extract_java(const string &code, vector<imported_name> &imports) {
    line_index lines(code);
    size_t scanned = 0;
    for (size_t pos : find_word(code, "import")) {
        if (pos < scanned) continue;
        size_t i = skip_space(code, pos + 6);
        string word;
        size_t after = read_word(code, i, word);
        if (word == "static") i = skip_space(code, after);

        string name;
        while (i < code.size() && code[i] != ';') {
            char c = code[i];
            if (is_word_char(c) || c == '.' || c == '*' || c == '$') {
                name += c;
                ++i;
            } else if (is_blank(c) || c == '/') {
                size_t next = skip_space(code, i);
                if (next == i) break;
                i = next;
            } else {
                break;
            }
        }
        scanned = i;
        if (i < code.size() && code[i] == ';' && !name.empty())
            imports.push_back({name, lines.line(pos), true});
    }
}

/**
 * @brief 解析 Rust 的 use 树，展开 {a, b::c} 分组，输出完整路径
 * @return 解析结束的位置，语法不合法时返回 npos
 */
static size_t parse_use_tree(const string &code, size_t i, const string &prefix, int depth, vector<string> &paths) {
    const int MAX_DEPTH = 16;
    if (depth > MAX_DEPTH) return string::npos;

    string path = prefix;
    i = skip_space(code, i);
    if (code.compare(i, 2, "::") == 0) i = skip_space(code, i + 2);
    while (true) {
        if (i >= code.size()) return string::npos;
        if (code[i] == '*') {
            paths.push_back(path.empty() ? "*" : path + "::*");
            return skip_space(code, i + 1);
        }
        if (code[i] == '{') {
            i = skip_space(code, i + 1);
            while (i < code.size() && code[i] != '}') {
                i = parse_use_tree(code, i, path, depth + 1, paths);
                if (i == string::npos) return i;
                if (i < code.size() && code[i] == ',') i = skip_space(code, i + 1);
                else if (i >= code.size() || code[i] != '}') return string::npos;
            }
            if (i >= code.size()) return string::npos;
            return skip_space(code, i + 1);
        }

        string segment;
        i = read_word(code, i, segment);
        if (segment.empty()) return string::npos;
        if (segment != "self") path = path.empty() ? segment : path + "::" + segment;
        i = skip_space(code, i);
        if (code.compare(i, 2, "::") != 0) break;
        i = skip_space(code, i + 2);
    }

    if (code.compare(i, 2, "as") == 0 && i + 2 < code.size() && !is_word_char(code[i + 2])) {
        string alias;
        i = read_word(code, skip_space(code, i + 2), alias);
        i = skip_space(code, i);
    }
    paths.push_back(path);
    return i;
}

static void extract_rust(const string &code, vector<imported_name> &imports) {
    line_index lines(code);
    vector<pair<size_t, imported_name>> found;
    for (size_t pos : find_word(code, "use")) {
        vector<string> paths;
        size_t i = parse_use_tree(code, pos + 3, "", 0, paths);
        if (i == string::npos || i >= code.size() || code[i] != ';') continue;
        for (auto &path : paths)
            found.emplace_back(pos, imported_name{path, lines.line(pos), true});
    }
    for (size_t pos : find_word(code, "extern")) {
        string word, name;
        size_t i = read_word(code, skip_space(code, pos + 6), word);
        if (word != "crate") continue;
        read_word(code, skip_space(code, i), name);
        if (!name.empty()) found.emplace_back(pos, imported_name{name, lines.line(pos), true});
    }
    stable_sort(found.begin(), found.end(), [](auto &a, auto &b) { return a.first < b.first; });
    for (auto &[pos, name] : found) imports.push_back(name);
}

/**
 * @brief 查找所有 keyword 调用，参数为字符串字面量时提取模块名，否则视为动态加载
 * @param interpolation 双引号字符串中表示插值的子串
 */
static void scan_requires(const string &code, const string &search, const vector<string> &keywords,
                          const string &interpolation, bool require_paren, vector<pair<size_t, imported_name>> &found) {
    line_index lines(code);
    for (auto &keyword : keywords) {
        size_t scanned = 0;
        for (size_t pos : find_word(search, keyword)) {
            if (pos < scanned) continue;
            size_t i = skip_space(code, pos + keyword.size());
            scanned = i;
            bool paren = i < code.size() && code[i] == '(';
            if (require_paren && !paren) continue;
            if (paren) i = skip_space(code, i + 1);

            string name;
            bool literal = false;
            if (i < code.size() && (code[i] == '\'' || code[i] == '"' || code[i] == '`')) {
                vector<string> forbidden{"\\"};
                if (code[i] != '\'') forbidden.push_back(interpolation);
                size_t stop = read_quoted(code, i, name, literal, forbidden);
                if (stop == string::npos) {
                    literal = false;
                } else if (paren) {
                    stop = skip_space(code, stop);
                    literal = literal && stop < code.size() && code[stop] == ')';
                }
            }
            if (literal)
                found.emplace_back(pos, imported_name{name, lines.line(pos), true});
            else
                found.emplace_back(pos, imported_name{statement_at(code, pos), lines.line(pos), false});
        }
    }
}

/**
 * @brief ES 模块的 import ... from '...' 和 export ... from '...'
 */
static void scan_module_imports(const string &code, vector<pair<size_t, imported_name>> &found) {
    line_index lines(code);
    for (auto keyword : {"import", "export"}) {
        size_t scanned = 0;
        for (size_t pos : find_word(code, keyword)) {
            if (pos < scanned) continue;
            size_t i = skip_space(code, pos + 6);
            // import 'x' 或者 import ... from 'x'
            bool bare = true, from = false;
            while (i < code.size() && code[i] != '\'' && code[i] != '"') {
                if (is_word_char(code[i]) || code[i] == '$') {
                    string word;
                    i = read_word(code, i, word);
                    if (word.empty()) ++i;
                    if (word == "from") {
                        from = true;
                        i = skip_space(code, i);
                        break;
                    }
                } else if (code[i] == '*' || code[i] == '{' || code[i] == '}' || code[i] == ',') {
                    ++i;
                } else {
                    break;
                }
                bare = false;
                i = skip_space(code, i);
            }
            scanned = i;
            if (!bare && !from) continue;
            if (i >= code.size() || (code[i] != '\'' && code[i] != '"')) continue;

            string name;
            bool literal;
            size_t stop = read_quoted(code, i, name, literal, {"\\"});
            if (stop == string::npos) continue;
            scanned = stop;
            found.emplace_back(pos, imported_name{name, lines.line(pos), literal});
        }
    }
}

static void extract_javascript(const string &code, vector<imported_name> &imports) {
    vector<pair<size_t, imported_name>> found;
    scan_requires(code, code, {"require"}, "${", true, found);
    scan_module_imports(code, found);
    stable_sort(found.begin(), found.end(), [](auto &a, auto &b) { return a.first < b.first; });
    for (auto &[pos, name] : found) imports.push_back(name);
}

static void extract_ruby(const string &code, vector<imported_name> &imports) {
    vector<pair<size_t, imported_name>> found;
    scan_requires(code, code, {"require", "require_relative"}, "#{", false, found);
    stable_sort(found.begin(), found.end(), [](auto &a, auto &b) { return a.first < b.first; });
    for (auto &[pos, name] : found) imports.push_back(name);
}

static void extract_php(const string &code, vector<imported_name> &imports) {
    // PHP 的关键字不区分大小写
    vector<pair<size_t, imported_name>> found;
    scan_requires(code, boost::to_lower_copy(code), {"require", "require_once", "include", "include_once"}, "$", false, found);
    stable_sort(found.begin(), found.end(), [](auto &a, auto &b) { return a.first < b.first; });
    for (auto &[pos, name] : found) imports.push_back(name);
}

vector<imported_name> extract_imports(const string &code, import_syntax syntax) {
    vector<imported_name> imports;
    switch (syntax) {
        case import_syntax::PYTHON: extract_python(code, imports); break;
        case import_syntax::GO: extract_go(code, imports); break;
        case import_syntax::C_INCLUDE: extract_c_include(code, imports); break;
        case import_syntax::JAVA: extract_java(code, imports); break;
        case import_syntax::RUST: extract_rust(code, imports); break;
        case import_syntax::JAVASCRIPT: extract_javascript(code, imports); break;
        case import_syntax::RUBY: extract_ruby(code, imports); break;
        case import_syntax::PHP: extract_php(code, imports); break;
    }
    return imports;
}

static bool matches_prefix(const string &name, const string &prefix, const string &separator) {
    return name == prefix || boost::starts_with(name, prefix + separator);
}

vector<violation> check_import_rule(const string &code, import_syntax syntax, const import_rule &rule) {
    vector<violation> violations;
    for (auto &import : extract_imports(code, syntax)) {
        if (!import.literal) {
            violations.push_back({import.name, "dynamic module loading is not allowed", import.line});
            continue;
        }

        visit(overloaded{
                  [&](const allowed_imports &r) {
                      // Python 比较顶层模块，Go 比较完整的导入路径
                      string module = syntax == import_syntax::PYTHON ? import.name.substr(0, import.name.find('.')) : import.name;
                      if (!r.names.count(module))
                          violations.push_back({import.name, "import not allowed", import.line});
                  },
                  [&](const allowed_headers &r) {
                      if (!r.names.count(import.name))
                          violations.push_back({import.name, "header not allowed", import.line});
                  },
                  [&](const allowed_packages &r) {
                      string separator = syntax == import_syntax::RUST ? "::" : ".";
                      bool ok = any_of(r.prefixes.begin(), r.prefixes.end(), [&](const string &prefix) {
                          return matches_prefix(import.name, prefix, separator);
                      });
                      if (!ok)
                          violations.push_back({import.name, "package not allowed", import.line});
                  },
                  [&](const allowed_requires &r) {
                      if (!r.names.count(import.name))
                          violations.push_back({import.name, "module not allowed", import.line});
                  }},
              rule);
    }
    return violations;
}

vector<violation> check_deny_rule(const string &code, const deny_rule &rule) {
    if (rule.patterns.empty()) return {};

    // 在折叠空白后的文本上匹配，单次匹配的长度不随空白的长度增长
    auto collapsed = collapse_whitespace(code);
    const string &text = collapsed.text;
    line_index lines(code);

    vector<pair<size_t, violation>> found;
    for (auto &denied : rule.patterns) {
        for (sregex_iterator it(text.begin(), text.end(), denied.regex), end; it != end; ++it) {
            size_t pos = collapsed.offsets[it->position(0)];
            found.emplace_back(pos, violation{it->str(), "denied: " + denied.description, lines.line(pos)});
        }
    }
    stable_sort(found.begin(), found.end(), [](auto &a, auto &b) { return a.first < b.first; });

    vector<violation> violations;
    append(violations, found, [](auto &p) { return p.second; });
    return violations;
}

validation_result validate(const string &code, const language_spec &spec) {
    validation_result result;
    append(result.violations, check_import_rule(code, spec.syntax, spec.policy.imports));
    append(result.violations, check_deny_rule(code, spec.policy.denied));
    result.valid = result.violations.empty();
    return result;
}

}  // namespace runner
