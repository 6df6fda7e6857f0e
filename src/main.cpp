#include <glog/logging.h>
#include <boost/lexical_cast.hpp>
#include <boost/program_options.hpp>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/utils.hpp"
#include "config.hpp"
#include "engine/engine.hpp"
#include "language/registry.hpp"
#include "worker.hpp"
using namespace std;
using nlohmann::json;

namespace po = boost::program_options;

/**
 * @brief 读取配置项，命令行参数优先，其次是环境变量，都没有时保持默认值
 */
template <typename T>
void load_option(const po::variables_map& vm, const char* option, const char* env, T& target) {
    if (vm.count(option)) {
        target = vm.at(option).as<T>();
    } else if (getenv(env)) {
        try {
            target = boost::lexical_cast<T>(getenv(env));
        } catch (boost::bad_lexical_cast&) {
            LOG(WARNING) << "Ignoring invalid value of environment variable " << env << ": " << getenv(env);
        }
    }
}

static string read_source(const string& path) {
    if (path == "-") {
        return string(istreambuf_iterator<char>(cin), istreambuf_iterator<char>());
    }
    return runner::read_file_content(path);
}

static int list_languages(const runner::execution_engine& engine) {
    cout << json(engine.supported_languages()).dump() << endl;
    return EXIT_SUCCESS;
}

static int validate_source(const runner::execution_engine& engine, const string& language, const string& code) {
    try {
        runner::validation_result result = engine.validate(code, language);
        json j = {{"valid", result.valid}, {"violations", result.violations}};
        cout << j.dump(4) << endl;
        return EXIT_SUCCESS;
    } catch (runner::unsupported_language& e) {
        cerr << e.what() << endl;
        return EXIT_FAILURE;
    }
}

static int execute_single(const runner::execution_engine& engine, const runner::execution_request& request) {
    runner::execution_result result = engine.execute(request);
    cout << json(result).dump(4) << endl;
    return EXIT_SUCCESS;
}

static int execute_batch(const runner::execution_engine& engine, istream& in) {
    runner::worker_pool pool(engine, runner::WORKERS);

    // 结果按照输入的顺序输出
    vector<future<runner::execution_result>> results;
    string line;
    size_t line_number = 0;
    while (getline(in, line)) {
        ++line_number;
        if (line.find_first_not_of(" \t\r") == string::npos) continue;

        try {
            runner::execution_request request = json::parse(line).get<runner::execution_request>();
            results.push_back(pool.submit(request));
        } catch (std::exception& e) {
            LOG(WARNING) << "Invalid request at line " << line_number << ": " << e.what();
            runner::execution_result invalid;
            invalid.status = runner::status::SYSTEM_ERROR;
            invalid.error = "Invalid request at line " + to_string(line_number) + ": " + e.what();
            promise<runner::execution_result> p;
            p.set_value(invalid);
            results.push_back(p.get_future());
        }
    }

    for (auto& result : results)
        cout << json(result.get()).dump() << endl;
    return EXIT_SUCCESS;
}

int main(int argc, char* argv[]) {
    google::InitGoogleLogging(argv[0]);
    FLAGS_logtostderr = true;

    po::options_description desc("code-runner options");
    po::variables_map vm;

    // clang-format off
    desc.add_options()
        ("language,l", po::value<string>(), "language of the source code, see --list-languages")
        ("source,s", po::value<string>(), "path of the source code file, or - to read from stdin")
        ("code,c", po::value<string>(), "source code given inline instead of --source")
        ("input,i", po::value<string>(), "path of the file passed to the program as stdin")
        ("batch,b", po::value<string>(), "execute JSON-lines requests from the given file, or - to read from stdin, printing one JSON result per line")
        ("validate", "only run the static validator on the source code")
        ("list-languages", "print supported languages")
        ("time-limit", po::value<double>(), "time limit in seconds of each phase, default to 30. You can either pass it from environ TIMELIMIT")
        ("memory-limit", po::value<int>(), "memory limit in MB, default to 512. You can either pass it from environ MEMLIMIT")
        ("file-limit", po::value<int>(), "file size limit in KB, default to 10240. You can either pass it from environ FILELIMIT")
        ("proc-limit", po::value<int>(), "process count limit, default to 64. You can either pass it from environ PROCLIMIT")
        ("stream-size", po::value<int>(), "maximum size in KB of captured stdout and stderr, default to 1024. You can either pass it from environ STREAMSIZE")
        ("backend", po::value<string>(), "isolation backend: auto, container or subprocess, default to auto. You can either pass it from environ BACKEND")
        ("run-dir", po::value<string>(), "set the directory to create workspaces in. You can either pass it from environ RUNDIR")
        ("max-time-limit", po::value<double>(), "upper bound in seconds of the time limit a request may ask for, default to 300. You can either pass it from environ MAXTIMELIMIT")
        ("max-memory-limit", po::value<int>(), "upper bound in MB of the memory limit a request may ask for, default to 4096. You can either pass it from environ MAXMEMLIMIT")
        ("workers", po::value<int>(), "number of concurrent executions in batch mode, default to the number of cores. You can either pass it from environ WORKERS")
        ("debug", "turn on the debug mode to log every command executed")
        ("help", "display this help text")
        ("version", "display version of this application");
    // clang-format on

    try {
        po::store(po::command_line_parser(argc, argv)
                      .options(desc)
                      .run(),
                  vm);
        po::notify(vm);
    } catch (po::error& e) {
        cerr << e.what() << endl
             << endl;
        cerr << desc << endl;
        return EXIT_FAILURE;
    }

    if (vm.count("help")) {
        cout << "code-runner: execute untrusted code in a sandbox" << endl
             << "Usage: " << argv[0] << " --language python --source main.py [--input in.txt]" << endl
             << "       " << argv[0] << " --batch requests.jsonl [--workers 4]" << endl
             << "       " << argv[0] << " --list-languages" << endl
             << "       " << argv[0] << " --validate --language cpp --source main.cpp" << endl;
        cout << desc << endl;
        return EXIT_SUCCESS;
    }

    if (vm.count("version")) {
        cout << "code-runner 1.0" << endl;
        return EXIT_SUCCESS;
    }

    if (vm.count("debug")) {
        runner::DEBUG = true;
    } else if (getenv("DEBUG")) {
        runner::DEBUG = true;
    }

    load_option(vm, "time-limit", "TIMELIMIT", runner::TIME_LIMIT);
    load_option(vm, "memory-limit", "MEMLIMIT", runner::MEMORY_LIMIT);
    load_option(vm, "file-limit", "FILELIMIT", runner::FILE_LIMIT);
    load_option(vm, "proc-limit", "PROCLIMIT", runner::PROC_LIMIT);
    load_option(vm, "stream-size", "STREAMSIZE", runner::STREAM_SIZE);
    load_option(vm, "backend", "BACKEND", runner::BACKEND);
    load_option(vm, "max-time-limit", "MAXTIMELIMIT", runner::MAX_TIME_LIMIT);
    load_option(vm, "max-memory-limit", "MAXMEMLIMIT", runner::MAX_MEMORY_LIMIT);
    load_option(vm, "workers", "WORKERS", runner::WORKERS);

    try {
        runner::check_config();
    } catch (invalid_argument& e) {
        cerr << e.what() << endl;
        return EXIT_FAILURE;
    }

    if (vm.count("run-dir")) {
        runner::RUN_DIR = filesystem::path(vm.at("run-dir").as<string>());
    } else if (getenv("RUNDIR")) {
        runner::RUN_DIR = filesystem::path(getenv("RUNDIR"));
    }
    filesystem::create_directories(runner::RUN_DIR);
    CHECK(filesystem::is_directory(runner::RUN_DIR))
        << "Run directory " << runner::RUN_DIR << " does not exist";

    const runner::language_registry& registry = runner::language_registry::builtin();

    unique_ptr<runner::isolation_backend> backend;
    try {
        backend = runner::select_backend(runner::BACKEND);
    } catch (invalid_argument& e) {
        cerr << e.what() << endl;
        return EXIT_FAILURE;
    }
    runner::execution_engine engine(registry, move(backend), runner::RUN_DIR, runner::default_limits());

    if (vm.count("list-languages")) {
        return list_languages(engine);
    }

    if (vm.count("batch")) {
        string batch = vm.at("batch").as<string>();
        if (batch == "-") return execute_batch(engine, cin);

        ifstream fin(batch);
        if (!fin) {
            cerr << "Unable to open batch file " << batch << endl;
            return EXIT_FAILURE;
        }
        return execute_batch(engine, fin);
    }

    if (!vm.count("language") || (!vm.count("source") && !vm.count("code"))) {
        cerr << "--language and one of --source or --code are required" << endl
             << endl;
        cerr << desc << endl;
        return EXIT_FAILURE;
    }

    runner::execution_request request;
    request.language = vm.at("language").as<string>();
    try {
        request.code = vm.count("code") ? vm.at("code").as<string>() : read_source(vm.at("source").as<string>());
        if (vm.count("input"))
            request.input_data = runner::read_file_content(vm.at("input").as<string>());
    } catch (runner::internal_error& e) {
        cerr << e.what() << endl;
        return EXIT_FAILURE;
    }

    if (vm.count("validate")) {
        return validate_source(engine, request.language, request.code);
    }

    return execute_single(engine, request);
}
