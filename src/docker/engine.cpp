#include "docker/engine.hpp"

namespace sandbox::docker {
using namespace std;
using namespace nlohmann;

engine::~engine() {}

static json env_list(const map<string, string> &env) {
    json list = json::array();
    for (auto &[key, value] : env)
        list.push_back(key + "=" + value);
    return list;
}

void to_json(json &j, const container_options &options) {
    json host_config = {{"NetworkMode", options.network_mode},
                        {"Tmpfs", options.tmpfs},
                        {"Memory", options.memory_bytes},
                        {"NanoCpus", options.nano_cpus},
                        {"PidsLimit", options.pids_limit},
                        {"CapDrop", options.cap_drop},
                        {"SecurityOpt", options.security_opt}};
    j = {{"Image", options.image},
         {"Cmd", options.cmd},
         {"WorkingDir", options.working_dir},
         {"User", options.user},
         {"Env", env_list(options.env)},
         {"NetworkDisabled", options.network_mode == "none"},
         {"HostConfig", host_config}};
}

void to_json(json &j, const exec_options &options) {
    j = {{"AttachStdin", false},
         {"AttachStdout", true},
         {"AttachStderr", true},
         {"Tty", false},
         {"Cmd", options.cmd},
         {"Env", env_list(options.env)},
         {"WorkingDir", options.working_dir},
         {"User", options.user}};
}

}  // namespace sandbox::docker
