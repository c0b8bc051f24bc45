#include "docker/host.hpp"
#include <errno.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <boost/algorithm/string.hpp>
#include "common/exceptions.hpp"
#include "config.hpp"

namespace sandbox::docker {
using namespace std;
using boost::algorithm::starts_with;

string normalize_host(const string &host) {
    string result = boost::algorithm::trim_copy(host);
    if (result.empty())
        result = DEFAULT_DOCKER_HOST;
    if (starts_with(result, "/"))
        result = "unix://" + result;
    if (starts_with(result, "unix://") && !starts_with(result, "unix:///"))
        result = "unix:///" + boost::algorithm::trim_left_copy_if(result.substr(7), boost::is_any_of("/"));
    return result;
}

engine_host parse_host(const string &host) {
    engine_host result;
    result.normalized = normalize_host(host);
    const string &url = result.normalized;

    if (starts_with(url, "unix://") || starts_with(url, "http+unix://")) {
        result.kind = engine_host::transport::UNIX;
        result.socket_path = url.substr(url.find("://") + 3);
        result.base_url = "http://localhost";
    } else if (starts_with(url, "tcp://")) {
        result.kind = engine_host::transport::TCP;
        result.base_url = "http://" + url.substr(6);
    } else if (starts_with(url, "http://") || starts_with(url, "https://")) {
        result.kind = engine_host::transport::TCP;
        result.base_url = url;
    } else {
        throw runner_unavailable("Unsupported Docker host: " + url + ".");
    }

    while (!result.base_url.empty() && result.base_url.back() == '/')
        result.base_url.pop_back();
    if (result.kind == engine_host::transport::UNIX && result.socket_path.empty())
        throw runner_unavailable("Docker host has no socket path: " + url + ".");
    return result;
}

void ensure_socket(const engine_host &host) {
    if (host.kind != engine_host::transport::UNIX) return;

    struct stat attr;
    if (stat(host.socket_path.c_str(), &attr) != 0) {
        if (errno == ENOENT || errno == ENOTDIR)
            throw runner_unavailable("Docker socket not available at " + host.socket_path + ".");
        throw runner_unavailable("Unable to access Docker socket: " + host.socket_path + ".");
    }
    if (!S_ISSOCK(attr.st_mode))
        throw runner_unavailable("Docker socket path is not a socket: " + host.socket_path + ".");
}

}  // namespace sandbox::docker
