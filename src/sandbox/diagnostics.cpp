#include "sandbox/diagnostics.hpp"
#include <curl/curl.h>
#include <fmt/core.h>
#include <glog/logging.h>
#include <sys/stat.h>
#include "common/utils.hpp"
#include "docker/client.hpp"
#include "docker/host.hpp"

namespace sandbox {
using namespace std;
using namespace nlohmann;

static const char *PROXY_VARIABLES[] = {"HTTP_PROXY", "HTTPS_PROXY", "NO_PROXY",
                                        "http_proxy", "https_proxy", "no_proxy"};

static void probe_socket(json &report, const string &host) {
    report["normalized_host"] = nullptr;
    report["socket_path"] = nullptr;
    report["socket_exists"] = false;
    report["socket_is_socket"] = false;
    report["socket_mode"] = nullptr;
    report["socket_uid"] = nullptr;
    report["socket_gid"] = nullptr;

    report["normalized_host"] = docker::normalize_host(host);
    docker::engine_host addr = docker::parse_host(host);
    if (addr.kind != docker::engine_host::transport::UNIX) return;

    report["socket_path"] = addr.socket_path;
    struct stat st;
    if (stat(addr.socket_path.c_str(), &st) != 0) return;

    report["socket_exists"] = true;
    report["socket_is_socket"] = S_ISSOCK(st.st_mode) != 0;
    report["socket_mode"] = fmt::format("0o{:o}", st.st_mode & 0777);
    report["socket_uid"] = st.st_uid;
    report["socket_gid"] = st.st_gid;
}

json diagnostics(const runner_config &config, const engine_factory &factory) {
    json report;
    report["runner_enabled"] = config.enabled;
    report["curl_version"] = curl_version();
    report["runner_docker_host"] = config.docker_host;
    report["runner_docker_api_version"] = config.docker_api_version;

    try {
        probe_socket(report, config.docker_host);
    } catch (std::exception &ex) {
        report["socket_error"] = ex.what();
    }

    json proxy_env = json::object();
    for (const char *name : PROXY_VARIABLES) {
        auto value = get_env(name);
        proxy_env[name] = value ? json(*value) : json(nullptr);
    }
    report["proxy_env"] = proxy_env;

    report["client_base_url"] = nullptr;
    unique_ptr<docker::engine> engine;
    try {
        engine = factory(config);
        if (auto *client = dynamic_cast<docker::client *>(engine.get()))
            report["client_base_url"] = client->base_url();
    } catch (std::exception &ex) {
        report["client_error"] = ex.what();
        return report;
    }

    try {
        report["server_version"] = engine->version();
    } catch (std::exception &ex) {
        LOG(WARNING) << "Unable to query container engine version: " << ex.what();
        report["server_version_error"] = ex.what();
    }
    return report;
}

}  // namespace sandbox
