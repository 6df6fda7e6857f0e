#include "language/registry.hpp"

namespace runner {
using namespace std;

/**
 * 各语言的导入白名单和危险调用黑名单
 * 白名单只列出运行算法类程序需要的标准库，任何文件、网络和进程相关的模块都不在其中
 */

static language_spec python_language() {
    language_spec spec;
    spec.name = "python";
    spec.extension = ".py";
    spec.family = interpreted_family{"python3 {source}"};
    spec.syntax = import_syntax::PYTHON;
    spec.container_image = "python:3.9-slim";
    spec.policy.imports = allowed_imports{{
        "math", "cmath", "random", "string", "re", "json", "datetime", "time",
        "collections", "itertools", "functools", "operator", "heapq", "bisect",
        "array", "decimal", "fractions", "statistics", "typing", "dataclasses",
        "enum", "copy", "sys", "abc", "numbers", "textwrap", "unicodedata"}};
    spec.policy.denied.patterns = {
        deny(R"(\beval\s*\()", "eval"),
        deny(R"(\bexec\s*\()", "exec"),
        deny(R"((^|[^.\w])compile\s*\()", "compile"),
        deny(R"(__import__)", "__import__"),
        deny(R"(\bos\s*\.\s*(system|popen|exec|spawn|fork|kill|remove|unlink|rmdir))", "os call"),
        deny(R"(\bsubprocess\b)", "subprocess"),
        deny(R"(\bopen\s*\()", "open"),
        deny(R"(\b(globals|locals|vars)\s*\()", "namespace introspection"),
        deny(R"(\b(getattr|setattr|delattr)\s*\()", "dynamic attribute access"),
        deny(R"(__builtins__|__subclasses__|__globals__)", "sandbox escape"),
        deny(R"(\bmodules\b)", "sys.modules"),
        deny(R"(\b(_getframe|settrace|setprofile|meta_path|path_hooks|addaudithook)\b)", "interpreter internals"),
        deny(R"(\bbreakpoint\s*\()", "breakpoint")};
    return spec;
}

static deny_rule javascript_denied() {
    return deny_rule{{
        deny(R"(\bprocess\b(?!\s*\.\s*(stdin|stdout|stderr)\b))", "process"),
        deny(R"(\bglobalThis\b)", "globalThis"),
        deny(R"(\bglobal\s*\.)", "global"),
        deny(R"(\beval\s*\()", "eval"),
        deny(R"(\bFunction\s*\()", "Function constructor"),
        deny(R"(\bimport\s*\()", "dynamic import"),
        deny(R"(\bchild_process\b)", "child_process"),
        deny(R"(\b__dirname\b|\b__filename\b)", "module path"),
        deny(R"(\bmodule\s*\.\s*constructor\b)", "module constructor"),
        deny(R"(\bDeno\b|\bBun\b)", "runtime global"),
        deny(R"(\brequire\b(?!\s*\())", "require reference")}};
}

static const set<string> node_modules = {
    "readline", "util", "assert", "events", "string_decoder"};

static language_spec javascript_language() {
    language_spec spec;
    spec.name = "javascript";
    spec.extension = ".js";
    spec.family = interpreted_family{"node --max-old-space-size={memory} {source}"};
    spec.syntax = import_syntax::JAVASCRIPT;
    spec.container_image = "node:16-alpine";
    spec.limit_address_space = false;
    spec.runtime_memory_overhead = 256;
    spec.min_proc_limit = 32;
    spec.policy.imports = allowed_requires{node_modules};
    spec.policy.denied = javascript_denied();
    return spec;
}

static language_spec typescript_language() {
    language_spec spec;
    spec.name = "typescript";
    spec.extension = ".ts";
    spec.family = interpreted_family{"npx ts-node {source}"};
    spec.syntax = import_syntax::JAVASCRIPT;
    spec.container_image = "node:16-alpine";
    spec.limit_address_space = false;
    spec.runtime_memory_overhead = 256;
    // npx 和 ts-node 启动的每个 node 进程都会读取 NODE_OPTIONS
    spec.environment = {"NODE_OPTIONS=--max-old-space-size={memory}"};
    spec.min_proc_limit = 64;
    spec.policy.imports = allowed_requires{node_modules};
    spec.policy.denied = javascript_denied();
    return spec;
}

static language_spec ruby_language() {
    language_spec spec;
    spec.name = "ruby";
    spec.extension = ".rb";
    spec.family = interpreted_family{"ruby {source}"};
    spec.syntax = import_syntax::RUBY;
    spec.container_image = "ruby:3.0-slim";
    spec.policy.imports = allowed_requires{{"set", "json", "prime", "bigdecimal", "date", "matrix"}};
    spec.policy.denied.patterns = {
        deny(R"(\bsystem\b)", "system"),
        deny(R"(`)", "backtick"),
        deny(R"(%x[\(\[\{<|!])", "%x"),
        deny(R"(\bexec\b)", "exec"),
        deny(R"(\bspawn\b)", "spawn"),
        deny(R"(\bfork\b)", "fork"),
        deny(R"(\bIO\s*\.\s*popen\b)", "IO.popen"),
        deny(R"(\bOpen3\b)", "Open3"),
        deny(R"(\b(instance_|class_|module_)?eval\b)", "eval"),
        deny(R"(\bKernel\s*\.)", "Kernel"),
        deny(R"(\b(File|Dir|FileUtils)\s*\.)", "file system"),
        deny(R"(\bopen\s*[\('"])", "open"),
        deny(R"(\b(send|public_send)\s*\()", "dynamic dispatch")};
    return spec;
}

static language_spec php_language() {
    language_spec spec;
    spec.name = "php";
    spec.extension = ".php";
    spec.family = interpreted_family{"php {source}"};
    spec.syntax = import_syntax::PHP;
    spec.container_image = "php:8.0-cli";
    spec.policy.imports = allowed_requires{};
    spec.policy.denied.patterns = {
        deny(R"(\bshell_exec\s*\()", "shell_exec"),
        deny(R"(\bexec\s*\()", "exec"),
        deny(R"(\bsystem\s*\()", "system"),
        deny(R"(\bpassthru\s*\()", "passthru"),
        deny(R"(\bproc_open\s*\()", "proc_open"),
        deny(R"(\bpopen\s*\()", "popen"),
        deny(R"(\bpcntl_[a-z_]{1,32}\s*\()", "pcntl"),
        deny(R"(\beval\s*\()", "eval"),
        deny(R"(\bassert\s*\()", "assert"),
        deny(R"(\bcreate_function\s*\()", "create_function"),
        deny(R"(`)", "backtick"),
        deny(R"(\b(fopen|file_get_contents|file_put_contents|unlink|rmdir|mkdir)\s*\()", "file system")};
    return spec;
}

static language_spec go_language() {
    language_spec spec;
    spec.name = "go";
    spec.extension = ".go";
    spec.family = interpreted_family{"go run {source}"};
    spec.syntax = import_syntax::GO;
    spec.container_image = "golang:1.19-alpine";
    spec.limit_address_space = false;
    spec.runtime_memory_overhead = 256;
    spec.environment = {"GOMEMLIMIT={memory}MiB"};
    spec.min_proc_limit = 256;
    spec.policy.imports = allowed_imports{{
        "fmt", "bufio", "os", "math", "math/big", "math/rand", "sort", "strings",
        "strconv", "unicode", "unicode/utf8", "bytes", "errors", "time",
        "container/heap", "container/list", "container/ring", "regexp", "sync"}};
    spec.policy.denied.patterns = {
        deny(R"(\bos\s*\.\s*(StartProcess|Exit|Remove|RemoveAll|Create|OpenFile|Open|Mkdir|MkdirAll|WriteFile|ReadFile|ReadDir|Rename|Symlink|Link|Chmod|Chown|Chdir|Setenv|Getenv|Environ)\b)", "os call"),
        deny(R"(\bexec\s*\.\s*Command(Context)?\b)", "exec.Command"),
        deny(R"(\bsyscall\s*\.)", "syscall"),
        deny(R"(\bunsafe\s*\.)", "unsafe")};
    return spec;
}

static const set<string> c_headers = {
    "stdio.h", "stdlib.h", "string.h", "math.h", "ctype.h", "limits.h",
    "float.h", "stdbool.h", "stdint.h", "inttypes.h", "stddef.h", "stdarg.h",
    "assert.h", "time.h", "errno.h", "complex.h", "tgmath.h", "iso646.h"};

static deny_rule native_denied() {
    return deny_rule{{
        deny(R"(\bsystem\s*\()", "system"),
        deny(R"(\bpopen\s*\()", "popen"),
        deny(R"(\b(v?fork|clone)\s*\()", "fork"),
        deny(R"(\bexec(l|lp|le|v|vp|vpe|ve)\s*\()", "exec"),
        deny(R"(\bsyscall\s*\()", "syscall"),
        deny(R"(\b(__)?asm(__)?\b)", "inline assembly"),
        deny(R"(\b(kill|ptrace|socket|connect|dlopen)\s*\()", "system call")}};
}

static language_spec c_language() {
    language_spec spec;
    spec.name = "c";
    spec.extension = ".c";
    spec.family = native_family{"gcc -O2 -std=c11 -o program {source} -lm", "./program"};
    spec.syntax = import_syntax::C_INCLUDE;
    spec.container_image = "gcc:latest";
    spec.min_proc_limit = 16;
    spec.policy.imports = allowed_headers{c_headers};
    spec.policy.denied = native_denied();
    return spec;
}

static language_spec cpp_language() {
    language_spec spec;
    spec.name = "cpp";
    spec.extension = ".cpp";
    spec.family = native_family{"g++ -O2 -std=c++17 -o program {source}", "./program"};
    spec.syntax = import_syntax::C_INCLUDE;
    spec.container_image = "gcc:latest";
    spec.min_proc_limit = 16;
    allowed_headers headers{{
        "iostream", "iomanip", "sstream", "string", "string_view", "vector",
        "array", "deque", "list", "forward_list", "map", "unordered_map", "set",
        "unordered_set", "stack", "queue", "bitset", "algorithm", "numeric",
        "functional", "iterator", "utility", "tuple", "memory", "limits",
        "climits", "cfloat", "cmath", "cstdio", "cstdlib", "cstring", "cctype",
        "cstdint", "cinttypes", "cassert", "ctime", "chrono", "random",
        "complex", "valarray", "optional", "variant", "any", "type_traits",
        "initializer_list", "stdexcept", "exception", "numbers", "ratio",
        "bits/stdc++.h"}};
    headers.names.insert(c_headers.begin(), c_headers.end());
    spec.policy.imports = headers;
    spec.policy.denied = native_denied();
    return spec;
}

static language_spec rust_language() {
    language_spec spec;
    spec.name = "rust";
    spec.extension = ".rs";
    spec.family = native_family{"rustc -O -o program {source}", "./program"};
    spec.syntax = import_syntax::RUST;
    spec.container_image = "rust:latest";
    spec.min_proc_limit = 64;
    spec.policy.imports = allowed_packages{{
        "std::io", "std::collections", "std::cmp", "std::fmt", "std::iter",
        "std::str", "std::string", "std::vec", "std::mem", "std::ops",
        "std::num", "std::convert", "std::char", "std::f64", "std::f32",
        "std::i32", "std::i64", "std::u32", "std::u64", "std::usize",
        "std::rc", "std::cell", "std::boxed", "std::borrow", "std::hash",
        "std::time", "std::default"}};
    spec.policy.denied.patterns = {
        deny(R"(\bstd\s*::\s*process\b)", "std::process"),
        deny(R"(\bstd\s*::\s*fs\b)", "std::fs"),
        deny(R"(\bstd\s*::\s*net\b)", "std::net"),
        deny(R"(\bstd\s*::\s*env\b)", "std::env"),
        deny(R"(\bstd\s*::\s*os\b)", "std::os"),
        deny(R"(\bunsafe\b)", "unsafe"),
        deny(R"(\b(include_str|include_bytes|include)\s*!)", "include macro"),
        deny(R"(#\s*!?\s*\[\s*link\b)", "link attribute")};
    return spec;
}

static language_spec java_language() {
    language_spec spec;
    spec.name = "java";
    spec.extension = ".java";
    spec.family = jvm_family{"javac -encoding UTF-8 {source}", "java -Xmx{memory}m -cp . {class}"};
    spec.syntax = import_syntax::JAVA;
    spec.container_image = "openjdk:11-slim";
    spec.limit_address_space = false;
    spec.runtime_memory_overhead = 512;
    spec.min_proc_limit = 256;
    spec.policy.imports = allowed_packages{{
        "java.util", "java.math", "java.text", "java.time", "java.io.BufferedReader",
        "java.io.InputStreamReader", "java.io.PrintWriter", "java.io.BufferedWriter",
        "java.io.OutputStreamWriter", "java.io.IOException", "java.io.PrintStream",
        "java.io.StreamTokenizer", "java.lang.Math", "java.lang.StringBuilder"}};
    spec.policy.denied.patterns = {
        deny(R"(\bRuntime\b)", "Runtime"),
        deny(R"(\bProcessBuilder\b)", "ProcessBuilder"),
        deny(R"(\bProcessHandle\b)", "ProcessHandle"),
        deny(R"(\bjava\s*\.\s*lang\s*\.\s*reflect\b)", "reflection"),
        deny(R"(\bClass\s*\.\s*forName\b)", "reflection"),
        deny(R"(\.\s*getDeclared(Method|Field|Constructor)s?\b)", "reflection"),
        deny(R"(\bSystem\s*\.\s*(exit|load|loadLibrary|setSecurityManager|getenv)\b)", "System call"),
        deny(R"(\b(File|FileReader|FileWriter|FileInputStream|FileOutputStream|RandomAccessFile)\b)", "file system"),
        deny(R"(\b(Socket|ServerSocket|URL|HttpClient)\b)", "network"),
        deny(R"(\\u+[0-9a-fA-F]{4})", "unicode escape")};
    return spec;
}

vector<language_spec> builtin_languages() {
    return {
        python_language(),
        javascript_language(),
        typescript_language(),
        ruby_language(),
        php_language(),
        go_language(),
        c_language(),
        cpp_language(),
        rust_language(),
        java_language()};
}

}  // namespace runner
