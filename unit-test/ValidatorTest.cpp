#include "gtest/gtest.h"
#include "language/registry.hpp"
#include "validator/validator.hpp"

using namespace std;
using namespace runner;

class ValidatorTest : public ::testing::Test {
protected:
    const language_spec &language(const string &name) {
        return language_registry::builtin().resolve(name);
    }

    vector<violation> imports(const string &code, const string &name) {
        auto &spec = language(name);
        return check_import_rule(code, spec.syntax, spec.policy.imports);
    }
};

TEST_F(ValidatorTest, PythonHelloWorldIsValid) {
    auto result = validate("print(1+1)\n", language("python"));
    EXPECT_TRUE(result.valid);
    EXPECT_TRUE(result.violations.empty());
}

TEST_F(ValidatorTest, PythonOsSystemIsRejected) {
    auto result = validate("import os; os.system('ls')", language("python"));
    ASSERT_FALSE(result.valid);
    ASSERT_EQ(result.violations.size(), 2);

    // 导入规则的违规在前
    EXPECT_EQ(result.violations[0].token, "os");
    EXPECT_EQ(result.violations[0].rule, "import not allowed");
    EXPECT_EQ(result.violations[0].line, 1);
    EXPECT_EQ(result.violations[1].token, "os.system");
    EXPECT_EQ(result.violations[1].line, 1);
}

TEST_F(ValidatorTest, PythonImportForms) {
    EXPECT_TRUE(validate("from collections import deque\nimport math, heapq as hq\n", language("python")).valid);

    auto violations = imports("import math\nimport os.path\nfrom subprocess import run\n", "python");
    ASSERT_EQ(violations.size(), 2);
    EXPECT_EQ(violations[0].token, "os.path");
    EXPECT_EQ(violations[0].line, 2);
    EXPECT_EQ(violations[1].token, "subprocess");
    EXPECT_EQ(violations[1].line, 3);
}

TEST_F(ValidatorTest, CollectsAllViolationsInSourceOrder) {
    auto result = validate("eval('1')\nexec('2')\n", language("python"));
    ASSERT_EQ(result.violations.size(), 2);
    EXPECT_EQ(result.violations[0].token, "eval(");
    EXPECT_EQ(result.violations[0].line, 1);
    EXPECT_EQ(result.violations[1].token, "exec(");
    EXPECT_EQ(result.violations[1].line, 2);
    EXPECT_EQ(result.messages().size(), 2);
}

TEST_F(ValidatorTest, PythonMethodNamedCompileIsAllowed) {
    EXPECT_TRUE(validate("import re\np = re.compile('a+')\n", language("python")).valid);
}

TEST_F(ValidatorTest, CHeadersMatchExactly) {
    auto result = validate("#include <stdio.h>\n#include <unistd.h>\n", language("c"));
    ASSERT_EQ(result.violations.size(), 1);
    EXPECT_EQ(result.violations[0].token, "unistd.h");
    EXPECT_EQ(result.violations[0].rule, "header not allowed");
    EXPECT_EQ(result.violations[0].line, 2);

    // C++ 允许 C 标准库头文件，但不允许系统头文件
    EXPECT_EQ(imports("#include <vector>\n#include \"stdio.h\"\n#include <sys/socket.h>\n", "cpp").size(), 1);
}

TEST_F(ValidatorTest, CppSystemCallIsDenied) {
    auto result = validate("#include <cstdlib>\nint main() { system(\"ls\"); }\n", language("cpp"));
    ASSERT_EQ(result.violations.size(), 1);
    EXPECT_EQ(result.violations[0].token, "system(");
    EXPECT_EQ(result.violations[0].rule, "denied: system");
    EXPECT_EQ(result.violations[0].line, 2);
}

TEST_F(ValidatorTest, JavaPackagesMatchByPrefix) {
    auto violations = imports(
        "import java.util.*;\n"
        "import java.util.stream.Collectors;\n"
        "import static java.lang.Math.max;\n"
        "import java.net.Socket;\n"
        "import java.utilx.Foo;\n",
        "java");
    ASSERT_EQ(violations.size(), 2);
    EXPECT_EQ(violations[0].token, "java.net.Socket");
    EXPECT_EQ(violations[0].line, 4);
    EXPECT_EQ(violations[1].token, "java.utilx.Foo");
    EXPECT_EQ(violations[1].rule, "package not allowed");
}

TEST_F(ValidatorTest, RustPackagesMatchAtPathSeparator) {
    auto violations = imports("use std::io::{self, Read};\nuse std::collections::HashMap;\nuse std::process::Command;\n", "rust");
    ASSERT_EQ(violations.size(), 1);
    EXPECT_EQ(violations[0].token, "std::process::Command");
    EXPECT_EQ(violations[0].line, 3);

    auto result = validate("fn main() { std::process::exit(0); }\n", language("rust"));
    EXPECT_FALSE(result.valid);
}

TEST_F(ValidatorTest, JavaScriptRequires) {
    EXPECT_TRUE(validate(
                    "const readline = require('readline');\n"
                    "const rl = readline.createInterface({ input: process.stdin });\n",
                    language("javascript"))
                    .valid);

    auto violations = imports("const fs = require('fs');\nimport net from \"net\";\n", "javascript");
    ASSERT_EQ(violations.size(), 2);
    EXPECT_EQ(violations[0].token, "fs");
    EXPECT_EQ(violations[0].rule, "module not allowed");
    EXPECT_EQ(violations[1].token, "net");
    EXPECT_EQ(violations[1].line, 2);
}

TEST_F(ValidatorTest, DynamicRequireIsAlwaysRejected) {
    auto violations = imports("const m = 'readline';\nrequire(m);\n", "javascript");
    ASSERT_EQ(violations.size(), 1);
    EXPECT_EQ(violations[0].token, "require(m)");
    EXPECT_EQ(violations[0].rule, "dynamic module loading is not allowed");
    EXPECT_EQ(violations[0].line, 2);

    violations = imports("<?php include $file; ?>", "php");
    ASSERT_EQ(violations.size(), 1);
    EXPECT_EQ(violations[0].token, "include $file");
}

TEST_F(ValidatorTest, JavaScriptDangerousGlobals) {
    auto result = validate("process.exit(1);\nglobalThis.x = 1;\n", language("javascript"));
    ASSERT_EQ(result.violations.size(), 2);
    EXPECT_EQ(result.violations[0].token, "process");
    EXPECT_EQ(result.violations[1].token, "globalThis");
    EXPECT_TRUE(validate("process.stdout.write('hi');\n", language("typescript")).valid);
}

TEST_F(ValidatorTest, GoGroupedImports) {
    auto names = extract_imports("package main\nimport (\n\t\"fmt\"\n\t\"os/exec\"\n)\n", import_syntax::GO);
    ASSERT_EQ(names.size(), 2);
    EXPECT_EQ(names[0].name, "fmt");
    EXPECT_EQ(names[0].line, 3);
    EXPECT_EQ(names[1].name, "os/exec");
    EXPECT_EQ(names[1].line, 4);

    auto violations = imports("package main\nimport (\n\t\"fmt\"\n\t\"os/exec\"\n)\n", "go");
    ASSERT_EQ(violations.size(), 1);
    EXPECT_EQ(violations[0].token, "os/exec");
}

TEST_F(ValidatorTest, RubyRequires) {
    auto violations = imports("require 'set'\nrequire 'socket'\n", "ruby");
    ASSERT_EQ(violations.size(), 1);
    EXPECT_EQ(violations[0].token, "socket");
    EXPECT_EQ(violations[0].line, 2);

    EXPECT_FALSE(validate("puts `ls`\n", language("ruby")).valid);
}

TEST_F(ValidatorTest, DenyRuleIsIndependentOfImports) {
    EXPECT_TRUE(check_deny_rule("eval('1')", deny_rule{}).empty());
    deny_rule rule{{deny(R"(\bfoo\b)", "foo")}};
    auto violations = check_deny_rule("bar\nfoo foo\n", rule);
    ASSERT_EQ(violations.size(), 2);
    EXPECT_EQ(violations[0].line, 2);
    EXPECT_EQ(violations[0].rule, "denied: foo");
}

TEST_F(ValidatorTest, QuotedModuleNamesAreExtracted) {
    auto names = extract_imports("import \"os/exec\"\nimport f \"fmt\"\n", import_syntax::GO);
    ASSERT_EQ(names.size(), 2);
    EXPECT_EQ(names[0].name, "os/exec");
    EXPECT_EQ(names[1].name, "fmt");

    names = extract_imports("const a = require(\"fs\");\nimport b from 'net';\nimport \"http\";\n", import_syntax::JAVASCRIPT);
    ASSERT_EQ(names.size(), 3);
    EXPECT_EQ(names[0].name, "fs");
    EXPECT_EQ(names[1].name, "net");
    EXPECT_EQ(names[2].name, "http");
    EXPECT_TRUE(names[2].literal);

    names = extract_imports("require \"socket\"\nrequire('set')\n", import_syntax::RUBY);
    ASSERT_EQ(names.size(), 2);
    EXPECT_EQ(names[0].name, "socket");
    EXPECT_TRUE(names[0].literal);
    EXPECT_EQ(names[1].name, "set");

    names = extract_imports("<?php require_once \"lib.php\"; include('x.php');", import_syntax::PHP);
    ASSERT_EQ(names.size(), 2);
    EXPECT_EQ(names[0].name, "lib.php");
    EXPECT_EQ(names[1].name, "x.php");
}

TEST_F(ValidatorTest, InterpolatedModuleNamesAreDynamic) {
    auto names = extract_imports("require \"#{name}\"\n", import_syntax::RUBY);
    ASSERT_EQ(names.size(), 1);
    EXPECT_FALSE(names[0].literal);

    names = extract_imports("<?php include \"$dir/x.php\";", import_syntax::PHP);
    ASSERT_EQ(names.size(), 1);
    EXPECT_FALSE(names[0].literal);

    names = extract_imports("require(`${name}`);\n", import_syntax::JAVASCRIPT);
    ASSERT_EQ(names.size(), 1);
    EXPECT_FALSE(names[0].literal);

    names = extract_imports("import \"o\\x73/exec\"\n", import_syntax::GO);
    ASSERT_EQ(names.size(), 1);
    EXPECT_FALSE(names[0].literal);
}

TEST_F(ValidatorTest, LongLinesDoNotExhaustTheStack) {
    auto violations = imports("import math" + string(30000, 'a') + "\n", "python");
    ASSERT_EQ(violations.size(), 1);
    EXPECT_EQ(violations[0].rule, "import not allowed");

    EXPECT_TRUE(extract_imports("package main\nimport (\n" + string(30000, ' '), import_syntax::GO).empty());
    EXPECT_TRUE(extract_imports("import " + string(30000, 'a'), import_syntax::JAVA).empty());
    EXPECT_EQ(extract_imports("#include " + string(30000, 'a'), import_syntax::C_INCLUDE).size(), 1);
    EXPECT_EQ(extract_imports("require(" + string(30000, ' ') + "'fs')", import_syntax::JAVASCRIPT).size(), 1);

    auto result = validate("x = 1\neval" + string(100000, ' ') + "('1')\n", language("python"));
    ASSERT_EQ(result.violations.size(), 1);
    EXPECT_EQ(result.violations[0].token, "eval (");
    EXPECT_EQ(result.violations[0].line, 2);

    EXPECT_TRUE(validate(string(100000, '\n') + "print(1)\n", language("python")).valid);
}

TEST_F(ValidatorTest, PythonContinuationAndCompoundStatements) {
    auto violations = imports("import math, \\\n    os\n", "python");
    ASSERT_EQ(violations.size(), 1);
    EXPECT_EQ(violations[0].token, "os");
    EXPECT_EQ(violations[0].line, 1);

    violations = imports("x = 1; import os\nif True: import subprocess\nfrom \\\n  socket import socket\n", "python");
    ASSERT_EQ(violations.size(), 3);
    EXPECT_EQ(violations[0].token, "os");
    EXPECT_EQ(violations[1].token, "subprocess");
    EXPECT_EQ(violations[1].line, 2);
    EXPECT_EQ(violations[2].token, "socket");
    EXPECT_EQ(violations[2].line, 3);

    EXPECT_TRUE(validate("d = {'a': 1}\nprint(d['a'])\n", language("python")).valid);
}

TEST_F(ValidatorTest, GoRawStringImports) {
    auto violations = imports("package main\nimport `os/exec`\nimport (\n\tf `fmt`; \"net\"\n)\n", "go");
    ASSERT_EQ(violations.size(), 2);
    EXPECT_EQ(violations[0].token, "os/exec");
    EXPECT_EQ(violations[0].line, 2);
    EXPECT_EQ(violations[1].token, "net");
    EXPECT_EQ(violations[1].line, 4);
}

TEST_F(ValidatorTest, CPreprocessorSpellingsOfInclude) {
    auto violations = imports(
        "%:include <unistd.h>\n"
        "?\?=include <sys/socket.h>\n"
        "#inc\\\nlude <fcntl.h>\n"
        "/* comment */ # /* comment */ include <signal.h>\n"
        "  #  include_next <dlfcn.h>\n"
        "#include <stdio.h>\n",
        "c");
    ASSERT_EQ(violations.size(), 5);
    EXPECT_EQ(violations[0].token, "unistd.h");
    EXPECT_EQ(violations[0].line, 1);
    EXPECT_EQ(violations[1].token, "sys/socket.h");
    EXPECT_EQ(violations[2].token, "fcntl.h");
    EXPECT_EQ(violations[2].line, 3);
    EXPECT_EQ(violations[3].token, "signal.h");
    EXPECT_EQ(violations[3].line, 5);
    EXPECT_EQ(violations[4].token, "dlfcn.h");

    // 宏展开的头文件无法静态确定
    violations = imports("#define H <unistd.h>\n#include H\n", "c");
    ASSERT_EQ(violations.size(), 1);
    EXPECT_EQ(violations[0].rule, "dynamic module loading is not allowed");

    // 不在行首的 # 不是预处理指令
    EXPECT_TRUE(imports("int main() { printf(\"%d #include <unistd.h>\", 1); }\n", "c").empty());
}

TEST_F(ValidatorTest, RustGroupedUseIsExpanded) {
    auto names = extract_imports("use std::{fs, io::{self, Read}, collections::HashMap as Map};\n", import_syntax::RUST);
    ASSERT_EQ(names.size(), 4);
    EXPECT_EQ(names[0].name, "std::fs");
    EXPECT_EQ(names[1].name, "std::io");
    EXPECT_EQ(names[2].name, "std::io::Read");
    EXPECT_EQ(names[3].name, "std::collections::HashMap");

    auto violations = imports("use std::{fs, io};\n", "rust");
    ASSERT_EQ(violations.size(), 1);
    EXPECT_EQ(violations[0].token, "std::fs");
}

TEST_F(ValidatorTest, JavaImportWithComment) {
    auto violations = imports("import /* x */ java.net\n    .Socket;\nimport java.util.List;\n", "java");
    ASSERT_EQ(violations.size(), 1);
    EXPECT_EQ(violations[0].token, "java.net.Socket");
    EXPECT_EQ(violations[0].line, 1);

    EXPECT_FALSE(validate("public class Main { String s = \"\\u0052untime\"; }\n", language("java")).valid);
}

TEST_F(ValidatorTest, JavaScriptModuleForms) {
    auto violations = imports("import * as m from 'fs';\nexport { x } from \"net\";\nexport default \"readline\";\n", "javascript");
    ASSERT_EQ(violations.size(), 2);
    EXPECT_EQ(violations[0].token, "fs");
    EXPECT_EQ(violations[1].token, "net");
    EXPECT_EQ(violations[1].line, 2);

    EXPECT_FALSE(validate("const r = require;\nr('fs');\n", language("javascript")).valid);
}

TEST_F(ValidatorTest, PhpKeywordsAreCaseInsensitive) {
    auto violations = imports("<?php REQUIRE 'a.php'; Include_Once $f;", "php");
    ASSERT_EQ(violations.size(), 2);
    EXPECT_EQ(violations[0].token, "a.php");
    EXPECT_EQ(violations[1].rule, "dynamic module loading is not allowed");
}

TEST_F(ValidatorTest, PythonSysInternalsAreDenied) {
    EXPECT_TRUE(validate("import sys\nprint(sys.stdin.readline())\n", language("python")).valid);
    EXPECT_FALSE(validate("import sys\nsys.modules['os'].system('ls')\n", language("python")).valid);
    EXPECT_FALSE(validate("from sys import modules\n", language("python")).valid);
    EXPECT_FALSE(validate("import sys\nf = sys._getframe(0)\n", language("python")).valid);
}

TEST_F(ValidatorTest, GoExecCommandIsDenied) {
    auto result = validate("package main\nfunc main() { exec.Command(\"ls\").Run() }\n", language("go"));
    ASSERT_EQ(result.violations.size(), 1);
    EXPECT_EQ(result.violations[0].token, "exec.Command");
    EXPECT_EQ(result.violations[0].line, 2);
}
