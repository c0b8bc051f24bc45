#include <curl/curl.h>
#include <glog/logging.h>
#include <signal.h>
#include <boost/algorithm/string.hpp>
#include <system_error>
#include <boost/program_options.hpp>
#include <iostream>
#include <mutex>
#include <thread>
#include "common/concurrent_queue.hpp"
#include "common/defer.hpp"
#include "common/io_utils.hpp"
#include "common/stl_utils.hpp"
#include "common/utils.hpp"
#include "config.hpp"
#include "sandbox/diagnostics.hpp"
#include "sandbox/python_runner.hpp"
#include "worker.hpp"
using namespace std;

struct attachment {
    string name;
    string path;
};

void validate(boost::any& v, const vector<string>& values, attachment*, int) {
    using namespace boost::program_options;

    string const& s = validators::get_single_string(values);
    size_t eq = s.find('=');
    if (eq == string::npos || eq == 0 || eq + 1 == s.size())
        throw validation_error(validation_error::invalid_option_value);
    v = attachment{s.substr(0, eq), s.substr(eq + 1)};
}

void signalHandler(int /* signum */) {
    // 只设置标记，主线程的 read 被信号打断后退出读取循环
    sandbox::stop_workers();
}

static sandbox::run_request build_request(const boost::program_options::variables_map& vm) {
    sandbox::run_request request;
    if (vm.count("request")) {
        nlohmann::json j = nlohmann::json::parse(sandbox::read_file_content(vm.at("request").as<string>()), nullptr, false);
        if (j.is_discarded())
            throw sandbox::validation_error("Request must be a JSON object.");
        request = j.get<sandbox::run_request>();
    }

    if (vm.count("code")) {
        request.code = vm.at("code").as<string>();
    } else if (vm.count("code-file")) {
        request.code = sandbox::read_file_content(vm.at("code-file").as<string>());
    } else if (!vm.count("request")) {
        request.code.assign(istreambuf_iterator<char>(cin), istreambuf_iterator<char>());
    }

    if (vm.count("attach")) {
        for (auto& file : vm.at("attach").as<vector<attachment>>())
            request.files.push_back({file.name, sandbox::read_file_content(file.path)});
    }
    return request;
}

static int run_once(const boost::program_options::variables_map& vm, sandbox::config_cache& cache) {
    sandbox::run_outcome outcome;
    try {
        sandbox::python_runner runner(cache.get());
        outcome = runner.try_run(build_request(vm));
    } catch (sandbox::sandbox_exception& ex) {
        outcome = sandbox::run_failure{ex.kind(), ex.what()};
    } catch (system_error& ex) {
        outcome = sandbox::run_failure{sandbox::error_kind::VALIDATION, ex.what()};
    }

    return visit(overloaded{
                     [](const sandbox::run_result& result) {
                         cout << nlohmann::json(result).dump() << endl;
                         return EXIT_SUCCESS;
                     },
                     [](const sandbox::run_failure& failure) {
                         cout << nlohmann::json(failure).dump() << endl;
                         return 2;
                     }},
                 outcome);
}

static int serve(size_t workers, sandbox::config_cache& cache) {
    struct sigaction action = {};
    action.sa_handler = signalHandler;
    sigemptyset(&action.sa_mask);
    // 不设置 SA_RESTART，使阻塞在标准输入上的 read 被信号打断
    action.sa_flags = 0;
    sigaction(SIGINT, &action, nullptr);
    sigaction(SIGTERM, &action, nullptr);

    mutex output_mutex;
    sandbox::response_writer writer = [&output_mutex](const nlohmann::json& response) {
        scoped_lock guard(output_mutex);
        cout << response.dump() << endl;
    };

    sandbox::concurrent_queue<string> task_queue;
    vector<thread> worker_threads;
    for (size_t i = 0; i < workers; ++i)
        worker_threads.push_back(sandbox::start_worker(i, task_queue, cache, sandbox::make_docker_client, writer));
    LOG(INFO) << "Serving run requests with " << workers << " workers";

    string line;
    while (getline(cin, line)) {
        boost::algorithm::trim(line);
        if (line.empty()) continue;
        task_queue.push(line);
    }
    task_queue.close();

    for (auto& th : worker_threads)
        th.join();
    LOG(INFO) << "All workers stopped";
    return EXIT_SUCCESS;
}

int main(int argc, char* argv[]) {
    google::InitGoogleLogging(argv[0]);

    namespace po = boost::program_options;
    po::options_description desc("sandbox-runner options");
    po::variables_map vm;

    // clang-format off
    desc.add_options()
        ("config", po::value<string>(), "load runner configuration from the given JSON file. You can either pass it from environ RUNNER_CONFIG")
        ("code", po::value<string>(), "run the given Python source code")
        ("code-file", po::value<string>(), "run the Python source code stored in the given file")
        ("attach", po::value<vector<attachment>>(), "attach a text file to the run, in the form name=path, the program can read it by name")
        ("request", po::value<string>(), "run the request stored in the given JSON file, in the form {\"code\": ..., \"files\": [{\"path\": ..., \"content\": ...}]}")
        ("diagnostics", "print the diagnostics report of the container engine connection and exit")
        ("serve", "read JSON-lines run requests {\"id\", \"code\", \"files\"} from stdin and write one response line for each")
        ("workers", po::value<size_t>()->default_value(2), "set the maximum number of concurrent runs in serve mode")
        ("timeout", po::value<unsigned>(), "override the wall-clock time limit in seconds. You can either pass it from environ RUNNER_TIMEOUT_SEC")
        ("image", po::value<string>(), "override the runner image. You can either pass it from environ RUNNER_IMAGE")
        ("docker-host", po::value<string>(), "override the container engine address. You can either pass it from environ RUNNER_DOCKER_HOST")
        ("debug", "turn on verbose logging of container state transitions")
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
        cout << "sandbox-runner: Run untrusted Python programs in throwaway containers" << endl
             << "This app requires access to the container engine control socket" << endl
             << "Usage: " << argv[0] << " [options]" << endl;
        cout << desc << endl;
        return EXIT_SUCCESS;
    }

    if (vm.count("version")) {
        cout << "sandbox-runner 1.0" << endl;
        return EXIT_SUCCESS;
    }

    if (vm.count("debug") || getenv("DEBUG")) {
        FLAGS_v = 1;
        FLAGS_logtostderr = true;
    }

    CHECK(curl_global_init(CURL_GLOBAL_ALL) == CURLE_OK)
        << "Unable to initialize libcurl";
    defer {
        curl_global_cleanup();
    };

    string config_path = vm.count("config") ? vm.at("config").as<string>() : sandbox::get_env("RUNNER_CONFIG", "");

    auto overrides = [&vm](sandbox::runner_config& config) {
        if (vm.count("timeout")) config.timeout_sec = vm.at("timeout").as<unsigned>();
        if (vm.count("image")) config.image = vm.at("image").as<string>();
        if (vm.count("docker-host")) config.docker_host = vm.at("docker-host").as<string>();
    };

    unique_ptr<sandbox::config_cache> cache;
    try {
        cache = make_unique<sandbox::config_cache>(config_path, overrides);
    } catch (std::exception& e) {
        LOG(ERROR) << "Invalid runner configuration: " << e.what();
        cerr << "Invalid runner configuration: " << e.what() << endl;
        return EXIT_FAILURE;
    }

    if (vm.count("diagnostics")) {
        cout << sandbox::diagnostics(cache->get()).dump(2) << endl;
        return EXIT_SUCCESS;
    }

    if (vm.count("serve")) {
        size_t workers = vm.at("workers").as<size_t>();
        if (workers == 0) {
            cerr << "--workers must be at least 1" << endl;
            return EXIT_FAILURE;
        }
        return serve(workers, *cache);
    }

    return run_once(vm, *cache);
}
