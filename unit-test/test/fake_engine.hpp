#pragma once

#include <gmock/gmock.h>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "docker/engine.hpp"
#include "sandbox/python_runner.hpp"

namespace sandbox::test {

/**
 * @brief 伪造引擎的脚本和调用记录
 * 测试用例先设置脚本字段，运行之后检查计数器。
 * 同一个 state 可以被多个 fake_engine 共享，用来统计多次运行的总调用次数。
 */
struct fake_engine_state {
    // 脚本
    long pull_status = 0;             // 非 0 时 pull_image 抛出 engine_error
    long create_status = 0;           // 非 0 时 create_container 抛出 engine_error
    bool create_unreachable = false;  // create_container 抛出 network_error
    bool start_failure = false;
    bool upload_ok = true;
    std::string exec_id = "exec-0001";
    std::string exec_stream;         // start_exec 返回的多路复用流
    bool stream_complete = true;
    int running_polls = 0;           // inspect_exec 返回 running 的次数，-1 表示一直运行
    std::optional<int> exit_code = 0;
    std::string post_run_archive;    // get_archive 返回的 tar 归档
    size_t archive_chunk = 4096;     // get_archive 每次交给 sink 的字节数
    bool archive_failure = false;
    bool kill_failure = false;
    bool remove_failure = false;

    // 调用记录
    int factory_calls = 0;
    int pulled = 0;
    int created = 0;
    int started = 0;
    int killed = 0;
    int removed = 0;
    int polls = 0;
    std::string uploaded_archive;
    std::string uploaded_path;
    docker::container_options container;
    docker::exec_options exec;
    std::chrono::milliseconds exec_deadline{0};
    size_t exec_max_bytes = 0;

    /**
     * @brief 已创建但未删除的容器数量
     */
    int leaked() const;
};

/**
 * @brief 按照 fake_engine_state 中的脚本行为的引擎
 */
struct fake_engine : public docker::engine {
    explicit fake_engine(std::shared_ptr<fake_engine_state> state);

    nlohmann::json version() override;
    void pull_image(const std::string &image) override;
    std::string create_container(const docker::container_options &options) override;
    void start_container(const std::string &container_id) override;
    bool put_archive(const std::string &container_id, const std::string &path, const std::string &archive) override;
    std::string create_exec(const std::string &container_id, const docker::exec_options &options) override;
    docker::exec_output start_exec(const std::string &exec_id, std::chrono::milliseconds deadline, size_t max_bytes) override;
    docker::exec_state inspect_exec(const std::string &exec_id) override;
    void kill_container(const std::string &container_id) override;
    void remove_container(const std::string &container_id) override;
    void get_archive(const std::string &container_id, const std::string &path, const docker::archive_sink &sink) override;

private:
    std::shared_ptr<fake_engine_state> state;
};

/**
 * @brief 创建 fake_engine 的工厂，每次调用增加 state->factory_calls
 */
engine_factory fake_factory(std::shared_ptr<fake_engine_state> state);

/**
 * @brief 构造容器引擎输出流中的一帧
 * @param stream 1 为 stdout，2 为 stderr
 */
std::string frame(uint8_t stream, const std::string &payload);

/**
 * @brief 用于检查调用顺序的 gmock 引擎
 */
struct mock_engine : public docker::engine {
    MOCK_METHOD(nlohmann::json, version, (), (override));
    MOCK_METHOD(void, pull_image, (const std::string &), (override));
    MOCK_METHOD(std::string, create_container, (const docker::container_options &), (override));
    MOCK_METHOD(void, start_container, (const std::string &), (override));
    MOCK_METHOD(bool, put_archive, (const std::string &, const std::string &, const std::string &), (override));
    MOCK_METHOD(std::string, create_exec, (const std::string &, const docker::exec_options &), (override));
    MOCK_METHOD(docker::exec_output, start_exec, (const std::string &, std::chrono::milliseconds, size_t), (override));
    MOCK_METHOD(docker::exec_state, inspect_exec, (const std::string &), (override));
    MOCK_METHOD(void, kill_container, (const std::string &), (override));
    MOCK_METHOD(void, remove_container, (const std::string &), (override));
    MOCK_METHOD(void, get_archive, (const std::string &, const std::string &, const docker::archive_sink &), (override));
};

}  // namespace sandbox::test
