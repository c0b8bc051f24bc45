#include "sandbox/python_runner.hpp"
#include <glog/logging.h>
#include <algorithm>
#include <thread>
#include "common/defer.hpp"
#include "common/exceptions.hpp"
#include "common/utils.hpp"
#include "docker/client.hpp"
#include "sandbox/archive.hpp"
#include "sandbox/collector.hpp"
#include "sandbox/exec_script.hpp"
#include "sandbox/sanitizer.hpp"

namespace sandbox {
using namespace std;
using namespace std::chrono;

// 轮询 exec 状态的间隔
static const milliseconds POLL_INTERVAL(50);

// 轮询截止时间比容器内 timeout 命令多出的宽限时间
static const seconds POLL_GRACE(2);

// 被 timeout 或 SIGKILL 杀死的进程的退出码
static constexpr int TIMEOUT_EXIT_CODE = 124;
static constexpr int KILLED_EXIT_CODE = 137;

const char *to_string(container_state state) {
    switch (state) {
        case container_state::UNAVAILABLE: return "UNAVAILABLE";
        case container_state::CREATED: return "CREATED";
        case container_state::STARTED: return "STARTED";
        case container_state::UPLOADED: return "UPLOADED";
        case container_state::EXECUTING: return "EXECUTING";
        case container_state::COMPLETED: return "COMPLETED";
        case container_state::TIMED_OUT: return "TIMED_OUT";
        case container_state::FAILED: return "FAILED";
        case container_state::REMOVED: return "REMOVED";
        default: return "UNKNOWN";
    }
}

unique_ptr<docker::engine> make_docker_client(const runner_config &config) {
    return make_unique<docker::client>(config);
}

static map<string, string> python_env() {
    return {{"PYTHONDONTWRITEBYTECODE", "1"},
            {"PYTHONUNBUFFERED", "1"}};
}

docker::container_options build_container_options(const runner_config &config) {
    docker::container_options options;
    options.image = config.image;
    options.cmd = {"/bin/sh", "-c", "sleep 3600"};
    options.working_dir = WORK_DIR;
    options.user = config.run_user;
    options.env = python_env();
    options.network_mode = "none";
    options.tmpfs[WORK_DIR] = "rw,mode=1777,size=" + std::to_string(config.tmpfs_mb) + "m";
    options.memory_bytes = (long long)config.memory_mb * 1024 * 1024;
    options.nano_cpus = max(1LL, (long long)(config.cpus * 1000000000));
    options.pids_limit = config.pids_limit;
    options.cap_drop = {"ALL"};
    options.security_opt = {"no-new-privileges"};
    return options;
}

docker::exec_options build_exec_options(const string &code, const runner_config &config) {
    exec_command command = build_exec_command(code, config);
    docker::exec_options options;
    options.cmd = command.argv;
    options.env = python_env();
    options.env.insert(command.env.begin(), command.env.end());
    options.working_dir = WORK_DIR;
    options.user = config.run_user;
    return options;
}

python_runner::python_runner(const runner_config &config, engine_factory factory)
    : cfg(config), factory(move(factory)) {}

const runner_config &python_runner::config() const {
    return cfg;
}

void python_runner::pull_image(docker::engine &engine) {
    LOG(INFO) << "Pulling runner image " << cfg.image;
    try {
        engine.pull_image(cfg.image);
    } catch (engine_error &ex) {
        LOG(ERROR) << "Unable to pull runner image " << cfg.image << ": " << ex.what();
        if (ex.status == 404) throw runner_unavailable("Runner image not found.");
        throw runner_unavailable("Unable to pull runner image.");
    } catch (network_error &ex) {
        LOG(ERROR) << "Unable to pull runner image " << cfg.image << ": " << ex.what();
        throw runner_unavailable("Unable to pull runner image.");
    }
}

string python_runner::create_container(docker::engine &engine) {
    try {
        return engine.create_container(build_container_options(cfg));
    } catch (engine_error &ex) {
        LOG(ERROR) << "Unable to create runner container from " << cfg.image << ": " << ex.what();
        if (ex.status == 404) throw runner_unavailable("Runner image not found.");
        throw runner_error(string("Docker execution failed: ") + ex.what());
    } catch (network_error &ex) {
        LOG(ERROR) << "Unable to reach container engine: " << ex.what();
        throw runner_unavailable(string("Docker execution failed: ") + ex.what());
    }
}

run_result python_runner::execute(docker::engine &engine, const string &container_id, const string &code, const string &archive, container_state &state) {
    engine.start_container(container_id);
    state = container_state::STARTED;

    if (!engine.put_archive(container_id, WORK_DIR, archive))
        throw runner_error("Failed to upload code to runner.");
    state = container_state::UPLOADED;

    string exec_id = engine.create_exec(container_id, build_exec_options(code, cfg));
    if (exec_id.empty())
        throw runner_error("Failed to start runner process.");
    state = container_state::EXECUTING;
    VLOG(1) << "Container " << container_id << " executing " << exec_id;

    run_result result;
    milliseconds deadline = seconds(cfg.timeout_sec) + POLL_GRACE;
    elapsed_time exec_time;

    docker::exec_output output = engine.start_exec(exec_id, deadline, output_byte_limit(cfg.max_output_chars));

    docker::exec_state exec = engine.inspect_exec(exec_id);
    while (exec.running && exec_time.duration<milliseconds>() < deadline) {
        this_thread::sleep_for(POLL_INTERVAL);
        exec = engine.inspect_exec(exec_id);
    }

    // exec 进程已经退出但是输出流到截止时间仍未关闭，说明逃逸的子进程还在运行，同样需要杀死
    if (exec.running || !output.complete) {
        LOG(WARNING) << "Container " << container_id << " exceeded the deadline of " << deadline.count() << "ms"
                     << (exec.running ? "" : " with its output stream still open") << ", killing";
        try {
            engine.kill_container(container_id);
        } catch (std::exception &ex) {
            LOG(WARNING) << "Unable to kill container " << container_id << ": " << ex.what();
        }
        result.timed_out = true;
        result.exit_code = KILLED_EXIT_CODE;
        state = container_state::TIMED_OUT;
    } else {
        result.exit_code = exec.exit_code;
        if (result.exit_code == TIMEOUT_EXIT_CODE || result.exit_code == KILLED_EXIT_CODE)
            result.timed_out = true;
        state = result.timed_out ? container_state::TIMED_OUT : container_state::COMPLETED;
    }

    result.stdout_text = truncate_output(output.stdout_bytes, cfg.max_output_chars, output.stdout_overflowed);
    result.stderr_text = truncate_output(output.stderr_bytes, cfg.max_output_chars, output.stderr_overflowed);

    archive_buffer buffer(cfg.max_archive_bytes);
    try {
        engine.get_archive(container_id, WORK_DIR, [&buffer](const char *data, size_t size) { buffer.append(data, size); });
    } catch (runner_error &) {
        throw;
    } catch (std::exception &ex) {
        // 被杀死的容器的 tmpfs 可能已经不可读，超时仍然是正常结果
        if (!result.timed_out) throw;
        LOG(WARNING) << "Unable to retrieve files from timed out container " << container_id << ": " << ex.what();
        return result;
    }
    result.files = collect_files(buffer.data(), cfg);
    return result;
}

run_result python_runner::run(const run_request &request) {
    if (!cfg.enabled)
        throw runner_unavailable("Python runner disabled.");

    validate_code(request.code, cfg);
    vector<sanitized_file> files = sanitize_files(request.files, cfg);
    string archive = build_archive(request.code, files, cfg);

    unique_ptr<docker::engine> engine;
    try {
        engine = factory(cfg);
    } catch (runner_unavailable &) {
        throw;
    } catch (std::exception &ex) {
        LOG(ERROR) << "Unable to create container engine client: " << ex.what();
        throw runner_unavailable(string("Docker client unavailable: ") + ex.what());
    }

    if (cfg.auto_pull) pull_image(*engine);

    elapsed_time timer;
    run_result result;
    {
        string container_id = create_container(*engine);
        container_state state = container_state::CREATED;
        LOG(INFO) << "Created runner container " << container_id;

        defer {
            try {
                engine->remove_container(container_id);
                VLOG(1) << "Container " << container_id << " removed after state " << to_string(state);
            } catch (std::exception &ex) {
                LOG(WARNING) << "Unable to remove container " << container_id << ": " << ex.what();
            }
        };

        try {
            result = execute(*engine, container_id, request.code, archive, state);
        } catch (runner_error &ex) {
            LOG(ERROR) << "Container " << container_id << " failed in state " << to_string(state) << endl << ex;
            state = container_state::FAILED;
            throw;
        } catch (std::exception &ex) {
            LOG(ERROR) << "Container " << container_id << " failed in state " << to_string(state) << ": " << ex.what();
            state = container_state::FAILED;
            throw runner_error(string("Docker execution failed: ") + ex.what());
        }
    }
    result.duration_ms = timer.duration<milliseconds>().count();
    LOG(INFO) << "Run finished in " << result.duration_ms << "ms, exit code "
              << (result.exit_code ? std::to_string(*result.exit_code) : string("none"))
              << (result.timed_out ? ", timed out" : "");
    return result;
}

run_outcome python_runner::try_run(const run_request &request) {
    try {
        return run(request);
    } catch (sandbox_exception &ex) {
        return run_failure{ex.kind(), ex.what()};
    }
}

}  // namespace sandbox
