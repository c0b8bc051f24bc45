#include "worker.hpp"
#include <glog/logging.h>
#include <pthread.h>
#include <signal.h>
#include <boost/exception/diagnostic_information.hpp>
#include <system_error>
#include "common/exceptions.hpp"
#include "common/stl_utils.hpp"
#include "sandbox/request.hpp"

namespace sandbox {
using namespace std;
using namespace nlohmann;

// 停止 worker 的标记
static volatile bool stop = false;

void stop_workers() {
    stop = true;
}

static json failure_response(const json &id, error_kind kind, const string &message) {
    json response = run_failure{kind, message};
    response["id"] = id;
    return response;
}

json handle_request_line(const string &line, config_cache &cache, const engine_factory &factory) {
    json j = json::parse(line, nullptr, false);
    if (j.is_discarded())
        return failure_response(nullptr, error_kind::VALIDATION, "Request must be a JSON object.");

    json id = j.is_object() && j.count("id") ? j.at("id") : json(nullptr);

    run_request request;
    try {
        request = j.get<run_request>();
    } catch (validation_error &ex) {
        return failure_response(id, ex.kind(), ex.what());
    }

    // 配置文件在两次请求之间可能被修改
    cache.refresh_if_stale();
    python_runner runner(cache.get(), factory);

    return visit(overloaded{
                     [&id](const run_result &result) {
                         json response = result;
                         response["ok"] = true;
                         response["id"] = id;
                         return response;
                     },
                     [&id](const run_failure &failure) {
                         return failure_response(id, failure.kind, failure.message);
                     }},
                 runner.try_run(request));
}

/**
 * @brief serve 模式的 worker 函数
 * 一个 worker 同一时间只运行一个请求，因此 worker 的数量就是并发运行的上限。
 */
static void worker_loop(size_t worker_id, concurrent_queue<string> &task_queue, config_cache &cache, const engine_factory &factory, const response_writer &writer) {
    LOG(INFO) << "Worker " << worker_id << " started";

    string line;
    while (!stop && task_queue.pop(line)) {
        json response;
        try {
            response = handle_request_line(line, cache, factory);
        } catch (std::exception &ex) {
            // 运行器之外的错误，比如结果无法序列化
            LOG(ERROR) << "Worker " << worker_id << " failed to handle request" << endl
                       << boost::diagnostic_information(ex);
            response = failure_response(nullptr, error_kind::EXECUTION_FAILURE, ex.what());
        }
        writer(response);
    }

    LOG(INFO) << "Worker " << worker_id << " stopped";
}

thread start_worker(size_t worker_id, concurrent_queue<string> &task_queue, config_cache &cache, const engine_factory &factory, response_writer writer) {
    // worker 线程不处理 SIGINT，由主线程接收信号并停止读取请求
    sigset_t set, old;
    sigemptyset(&set);
    sigaddset(&set, SIGINT);
    sigaddset(&set, SIGTERM);
    int ret = pthread_sigmask(SIG_BLOCK, &set, &old);
    if (ret != 0) throw system_error(ret, generic_category(), "pthread_sigmask");

    // 新线程继承创建时的信号掩码
    thread thd([worker_id, &task_queue, &cache, factory, writer] {
        worker_loop(worker_id, task_queue, cache, factory, writer);
    });

    pthread_sigmask(SIG_SETMASK, &old, nullptr);
    return thd;
}

}  // namespace sandbox
