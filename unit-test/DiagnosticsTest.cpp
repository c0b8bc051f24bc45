#include "gtest/gtest.h"
#include <unistd.h>
#include <filesystem>
#include <memory>
#include <stdexcept>
#include "common/utils.hpp"
#include "sandbox/diagnostics.hpp"
#include "test/assertions.hpp"
#include "test/fake_engine.hpp"
#include "test/temp_socket.hpp"

using namespace std;
using namespace sandbox;
using nlohmann::json;

class DiagnosticsTest : public ::testing::Test {
protected:
    void SetUp() override {
        path = filesystem::temp_directory_path() / ("diagnostics-" + std::to_string(getpid()) + ".sock");
        state = make_shared<test::fake_engine_state>();
        unset_env("HTTP_PROXY");
        unset_env("no_proxy");
    }

    void TearDown() override {
        unset_env("HTTP_PROXY");
    }

    filesystem::path path;
    shared_ptr<test::fake_engine_state> state;
    runner_config config;
};

TEST_F(DiagnosticsTest, ReportsSocketAndVersion) {
    test::temp_socket sock(path);
    config.docker_host = sock.path.string();

    json report = diagnostics(config, test::fake_factory(state));
    EXPECT_EQ(report.at("runner_enabled"), true);
    EXPECT_EQ(report.at("runner_docker_host"), sock.path.string());
    EXPECT_EQ(report.at("runner_docker_api_version"), "auto");
    EXPECT_TRUE(report.at("curl_version").is_string());

    EXPECT_EQ(report.at("normalized_host"), "unix://" + sock.path.string());
    EXPECT_EQ(report.at("socket_path"), sock.path.string());
    EXPECT_EQ(report.at("socket_exists"), true);
    EXPECT_EQ(report.at("socket_is_socket"), true);
    EXPECT_EQ(report.at("socket_uid"), getuid());
    EXPECT_EQ(report.at("socket_mode").get<string>().substr(0, 2), "0o");

    // 伪造引擎不是 docker::client，没有 base_url
    EXPECT_TRUE(report.at("client_base_url").is_null());
    EXPECT_JSON_EQ(report.at("server_version"), (json{{"Version", "24.0.7"}, {"ApiVersion", "1.43"}}));
    EXPECT_FALSE(report.count("client_error"));
    EXPECT_EQ(state->factory_calls, 1);
}

TEST_F(DiagnosticsTest, MissingSocket) {
    config.docker_host = path.string();

    json report = diagnostics(config);
    EXPECT_EQ(report.at("socket_exists"), false);
    EXPECT_EQ(report.at("socket_is_socket"), false);
    EXPECT_TRUE(report.at("socket_mode").is_null());
    EXPECT_EQ(report.at("client_error"), "Docker socket not available at " + path.string() + ".");
    EXPECT_FALSE(report.count("server_version"));
}

TEST_F(DiagnosticsTest, TcpHost) {
    config.docker_host = "tcp://127.0.0.1:2375";

    json report = diagnostics(config, test::fake_factory(state));
    EXPECT_EQ(report.at("normalized_host"), "tcp://127.0.0.1:2375");
    EXPECT_TRUE(report.at("socket_path").is_null());
    EXPECT_EQ(report.at("socket_exists"), false);
}

TEST_F(DiagnosticsTest, UnsupportedHost) {
    config.docker_host = "ssh://user@host";

    json report = diagnostics(config, test::fake_factory(state));
    EXPECT_TRUE(report.count("socket_error"));
    EXPECT_TRUE(report.at("socket_path").is_null());
}

TEST_F(DiagnosticsTest, ClientFailure) {
    json report = diagnostics(config, [](const runner_config &) -> unique_ptr<docker::engine> {
        throw runtime_error("no engine");
    });
    EXPECT_EQ(report.at("client_error"), "no engine");
    EXPECT_TRUE(report.at("client_base_url").is_null());
    EXPECT_FALSE(report.count("server_version"));
}

TEST_F(DiagnosticsTest, ProxyEnvironment) {
    set_env("HTTP_PROXY", "http://proxy:3128");

    json report = diagnostics(config, test::fake_factory(state));
    const json &proxy = report.at("proxy_env");
    EXPECT_EQ(proxy.size(), 6);
    EXPECT_EQ(proxy.at("HTTP_PROXY"), "http://proxy:3128");
    EXPECT_TRUE(proxy.at("no_proxy").is_null());
}
