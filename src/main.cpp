#include <glog/logging.h>
#include <signal.h>
#include <boost/exception/diagnostic_information.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/program_options.hpp>
#include <iostream>
#include <mutex>
#include <nlohmann/json.hpp>
#include "common/io_utils.hpp"
#include "common/messages.hpp"
#include "config.hpp"
#include "language/registry.hpp"
#include "monitor/event_monitor.hpp"
#include "monitor/log_monitor.hpp"
#include "orchestrator.hpp"
#include "server/request_server.hpp"
using namespace std;

static mutex stdout_mutex;

static void write_line(const nlohmann::json& j) {
    string line = j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    scoped_lock guard(stdout_mutex);
    cout << line << endl;
}

/**
 * 从命令行或者环境变量读取配置项，命令行优先
 */
template <typename T>
static bool read_option(const boost::program_options::variables_map& vm, const string& option, const char* env, T& value) {
    if (vm.count(option)) {
        value = vm.at(option).as<T>();
        return true;
    } else if (getenv(env)) {
        value = boost::lexical_cast<T>(getenv(env));
        return true;
    }
    return false;
}

static void list_languages(const runbox::language_registry& registry) {
    nlohmann::json list = nlohmann::json::array();
    for (auto profile : registry.list()) {
        nlohmann::json j = *profile;
        j["available"] = profile->installed();
        list.push_back(j);
    }
    cout << list.dump(2) << endl;
}

/**
 * 执行单个请求，结果以 JSON 格式输出到标准输出
 */
static int run_once(runbox::execution_orchestrator& orchestrator, const runbox::execution_request& request) {
    runbox::execution_result result = orchestrator.submit(request);
    orchestrator.flush_cleanup();
    write_line(result);
    return result.success() ? EXIT_SUCCESS : EXIT_FAILURE;
}

int main(int argc, char* argv[]) {
    google::InitGoogleLogging(argv[0]);

    namespace po = boost::program_options;
    po::options_description desc("runbox options");
    po::variables_map vm;

    // clang-format off
    desc.add_options()
        ("language,l", po::value<string>(), "language id of the source file to run")
        ("file,f", po::value<string>(), "source file to run")
        ("stdin", po::value<string>(), "file whose content is passed to the program as standard input")
        ("filename", po::value<string>(), "file name of the source inside the workspace, default to the language default")
        ("timeout", po::value<long long>(), "time limit of the run step in milliseconds, default to the language default")
        ("validate", "check the syntax of the source file without running it")
        ("system", "print the engine status as JSON")
        ("serve", "read JSON requests line by line from standard input and execute them concurrently")
        ("languages", po::value<string>(), "load the language table from a JSON file instead of the built-in table. You can either pass it from environ RUNBOX_LANGUAGES")
        ("list-languages", "print the language table as JSON")
        ("workspace-dir", po::value<string>(), "set the directory to create workspaces in. You can either pass it from environ RUNBOX_WORKSPACE_DIR")
        ("concurrency", po::value<size_t>(), "set the maximum number of simultaneous executions, default to 4. You can either pass it from environ RUNBOX_CONCURRENCY")
        ("queue-depth", po::value<size_t>(), "set the maximum number of waiting executions, default to 64. You can either pass it from environ RUNBOX_QUEUE_DEPTH")
        ("cleanup-delay", po::value<long long>(), "set the delay in milliseconds before a workspace is deleted, default to 5000. You can either pass it from environ RUNBOX_CLEANUP_DELAY")
        ("max-timeout", po::value<long long>(), "set the maximum time limit in milliseconds a request may ask for, default to 30000. You can either pass it from environ RUNBOX_MAX_TIMEOUT")
        ("max-output", po::value<size_t>(), "set the default capture limit in bytes of stdout and stderr, default to 1048576. You can either pass it from environ RUNBOX_MAX_OUTPUT")
        ("debug", "turn on the debug mode to keep workspaces after execution. You can either pass it from environ RUNBOX_DEBUG")
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
        cout << "runbox: run untrusted source code in isolated, time-bounded workspaces" << endl
             << "Usage: " << argv[0] << " --language <id> --file <path> [--stdin <path>]" << endl
             << "       " << argv[0] << " --validate --language <id> --file <path>" << endl
             << "       " << argv[0] << " --serve" << endl;
        cout << desc << endl;
        return EXIT_SUCCESS;
    }

    if (vm.count("version")) {
        cout << "runbox " ENGINE_VERSION << endl;
        return EXIT_SUCCESS;
    }

    // 写入已经退出的子进程的标准输入时不能让引擎退出
    signal(SIGPIPE, SIG_IGN);

    runbox::engine_config config;
    try {
        string workspace_dir;
        if (read_option(vm, "workspace-dir", "RUNBOX_WORKSPACE_DIR", workspace_dir))
            config.workspace_root = workspace_dir;
        read_option(vm, "concurrency", "RUNBOX_CONCURRENCY", config.max_concurrency);
        read_option(vm, "queue-depth", "RUNBOX_QUEUE_DEPTH", config.max_queue_depth);
        long long milliseconds;
        if (read_option(vm, "cleanup-delay", "RUNBOX_CLEANUP_DELAY", milliseconds))
            config.cleanup_delay = chrono::milliseconds(milliseconds);
        if (read_option(vm, "max-timeout", "RUNBOX_MAX_TIMEOUT", milliseconds))
            config.max_timeout = chrono::milliseconds(milliseconds);
        read_option(vm, "max-output", "RUNBOX_MAX_OUTPUT", config.default_max_output_bytes);
        config.debug = vm.count("debug") || getenv("RUNBOX_DEBUG");
        config.validate();
    } catch (std::exception& e) {
        cerr << "Invalid configuration: " << e.what() << endl;
        return EXIT_FAILURE;
    }

    shared_ptr<const runbox::language_registry> registry;
    string languages_file;
    if (read_option(vm, "languages", "RUNBOX_LANGUAGES", languages_file)) {
        CHECK(filesystem::is_regular_file(languages_file))
            << "Language table " << languages_file << " does not exist";
        try {
            registry = make_shared<runbox::language_registry>(runbox::language_registry::load(languages_file));
        } catch (std::exception& e) {
            LOG(FATAL) << "Language table " << languages_file << " is malformed: " << e.what();
        }
    } else {
        registry = make_shared<runbox::language_registry>(runbox::language_registry::builtin());
    }

    if (vm.count("list-languages")) {
        list_languages(*registry);
        return EXIT_SUCCESS;
    }

    unique_ptr<runbox::execution_orchestrator> orchestrator;
    try {
        orchestrator = make_unique<runbox::execution_orchestrator>(config, registry);
    } catch (std::exception& e) {
        LOG(ERROR) << "Unable to start the execution engine: " << boost::diagnostic_information(e);
        return EXIT_FAILURE;
    }
    orchestrator->register_monitor(make_unique<runbox::log_monitor>());

    if (vm.count("serve")) {
        orchestrator->register_monitor(make_unique<runbox::event_monitor>(cout, stdout_mutex));
        runbox::request_server server(*orchestrator, cout, stdout_mutex);
        server.serve(cin);
        orchestrator->flush_cleanup();
        return EXIT_SUCCESS;
    }

    if (vm.count("system")) {
        cout << nlohmann::json(orchestrator->snapshot()).dump(2) << endl;
        return EXIT_SUCCESS;
    }

    if (!vm.count("language") || !vm.count("file")) {
        cerr << "--language and --file are required unless --serve, --system or --list-languages is given" << endl
             << endl;
        cerr << desc << endl;
        return EXIT_FAILURE;
    }

    runbox::execution_request request;
    request.language = vm.at("language").as<string>();
    string file = vm.at("file").as<string>();
    CHECK(filesystem::is_regular_file(file))
        << "Source file " << file << " does not exist";
    request.source_code = runbox::read_file_content(file);
    if (vm.count("stdin")) {
        string input = vm.at("stdin").as<string>();
        CHECK(filesystem::is_regular_file(input))
            << "Input file " << input << " does not exist";
        request.input = runbox::read_file_content(input);
    }
    if (vm.count("filename"))
        request.filename = vm.at("filename").as<string>();
    if (vm.count("timeout"))
        request.timeout = chrono::milliseconds(vm.at("timeout").as<long long>());

    if (vm.count("validate")) {
        runbox::validation_report report = orchestrator->validate(request);
        orchestrator->flush_cleanup();
        write_line(report);
        return report.valid ? EXIT_SUCCESS : EXIT_FAILURE;
    }

    return run_once(*orchestrator, request);
}
