#include "config.hpp"
#include <glog/logging.h>
#include <boost/algorithm/string.hpp>
#include <boost/lexical_cast.hpp>
#include <regex>
#include "common/io_utils.hpp"
#include "common/json_utils.hpp"
#include "common/utils.hpp"

namespace sandbox {
using namespace std;
using namespace nlohmann;

const char *DEFAULT_DOCKER_HOST = "unix:///var/run/docker.sock";

// 容器的 init 进程 sleep 3600 秒，运行时间限制必须远小于容器的生命周期
static constexpr unsigned MAX_TIMEOUT_SEC = 600;

static constexpr size_t MAX_OUTPUT_CHARS = 16 * 1024 * 1024;

template <typename T>
static void env_number(const string &key, T &value) {
    auto text = get_env(key);
    if (!text) return;
    string trimmed = boost::algorithm::trim_copy(*text);
    // lexical_cast 会把 "-1" 转换为很大的无符号数
    if (!trimmed.empty() && trimmed[0] == '-')
        throw invalid_argument("Invalid value for " + key + ": " + *text);
    try {
        value = boost::lexical_cast<T>(trimmed);
    } catch (boost::bad_lexical_cast &) {
        throw invalid_argument("Invalid value for " + key + ": " + *text);
    }
}

static void env_string(const string &key, string &value) {
    if (auto text = get_env(key)) value = boost::algorithm::trim_copy(*text);
}

static void env_bool(const string &key, bool &value) {
    if (auto text = get_env(key)) value = parse_bool(*text);
}

void runner_config::apply_environment() {
    env_bool("RUNNER_ENABLED", enabled);
    env_string("RUNNER_IMAGE", image);
    env_bool("RUNNER_AUTO_PULL", auto_pull);
    env_string("RUNNER_DOCKER_HOST", docker_host);
    env_string("RUNNER_DOCKER_API_VERSION", docker_api_version);
    env_number("RUNNER_TIMEOUT_SEC", timeout_sec);
    env_number("RUNNER_MEMORY_MB", memory_mb);
    env_number("RUNNER_CPUS", cpus);
    env_number("RUNNER_PIDS_LIMIT", pids_limit);
    env_number("RUNNER_TMPFS_MB", tmpfs_mb);
    env_number("RUNNER_MAX_OUTPUT", max_output_chars);
    env_number("RUNNER_MAX_CODE_SIZE", max_code_bytes);
    env_number("RUNNER_MAX_FILES", max_files);
    env_number("RUNNER_MAX_FILE_BYTES", max_file_bytes);
    env_number("RUNNER_MAX_ARCHIVE_BYTES", max_archive_bytes);
    env_string("RUNNER_USER", run_user);
}

static const regex run_user_pattern("^([0-9]+):([0-9]+)$");

void runner_config::validate() const {
    if (image.empty())
        throw invalid_argument("runner image must not be empty");
    if (timeout_sec == 0)
        throw invalid_argument("timeout_sec must be at least 1 second");
    if (timeout_sec > MAX_TIMEOUT_SEC)
        throw invalid_argument("timeout_sec must be at most " + std::to_string(MAX_TIMEOUT_SEC) + " seconds");
    if (memory_mb == 0)
        throw invalid_argument("memory_mb must be positive");
    if (!(cpus > 0))
        throw invalid_argument("cpus must be positive");
    if (pids_limit == 0)
        throw invalid_argument("pids_limit must be positive");
    if (tmpfs_mb == 0)
        throw invalid_argument("tmpfs_mb must be positive");
    if (max_output_chars == 0 || max_output_chars > MAX_OUTPUT_CHARS)
        throw invalid_argument("max_output_chars must be between 1 and " + std::to_string(MAX_OUTPUT_CHARS));
    if (max_archive_bytes == 0)
        throw invalid_argument("max_archive_bytes must be positive");
    if (!regex_match(run_user, run_user_pattern))
        throw invalid_argument("run_user must be numeric uid:gid, got " + run_user);
    if (run_uid() == 0 || run_gid() == 0)
        throw invalid_argument("run_user must not be root");
}

unsigned runner_config::run_uid() const {
    smatch matches;
    if (!regex_match(run_user, matches, run_user_pattern))
        throw invalid_argument("run_user must be numeric uid:gid, got " + run_user);
    return boost::lexical_cast<unsigned>(matches[1].str());
}

unsigned runner_config::run_gid() const {
    smatch matches;
    if (!regex_match(run_user, matches, run_user_pattern))
        throw invalid_argument("run_user must be numeric uid:gid, got " + run_user);
    return boost::lexical_cast<unsigned>(matches[2].str());
}

/**
 * @brief 读取无符号数配置项，get<unsigned> 会把负数转换为很大的无符号数
 */
template <typename T>
static void assign_unsigned(const json &j, T &value, const char *key) {
    if (j.is_object() && j.count(key) && j.at(key).is_number() && j.at(key) < 0)
        throw invalid_argument(string("Invalid value for ") + key + ": " + j.at(key).dump());
    assign_optional(j, value, key);
}

void from_json(const json &j, runner_config &config) {
    assign_optional(j, config.enabled, "enabled");
    assign_optional(j, config.image, "image");
    assign_optional(j, config.auto_pull, "auto_pull");
    assign_optional(j, config.docker_host, "docker_host");
    assign_optional(j, config.docker_api_version, "docker_api_version");
    assign_unsigned(j, config.timeout_sec, "timeout_sec");
    assign_unsigned(j, config.memory_mb, "memory_mb");
    assign_optional(j, config.cpus, "cpus");
    assign_unsigned(j, config.pids_limit, "pids_limit");
    assign_unsigned(j, config.tmpfs_mb, "tmpfs_mb");
    assign_unsigned(j, config.max_output_chars, "max_output_chars");
    assign_unsigned(j, config.max_code_bytes, "max_code_bytes");
    assign_unsigned(j, config.max_files, "max_files");
    assign_unsigned(j, config.max_file_bytes, "max_file_bytes");
    assign_unsigned(j, config.max_archive_bytes, "max_archive_bytes");
    assign_optional(j, config.run_user, "run_user");
}

void to_json(json &j, const runner_config &config) {
    j = {{"enabled", config.enabled},
         {"image", config.image},
         {"auto_pull", config.auto_pull},
         {"docker_host", config.docker_host},
         {"docker_api_version", config.docker_api_version},
         {"timeout_sec", config.timeout_sec},
         {"memory_mb", config.memory_mb},
         {"cpus", config.cpus},
         {"pids_limit", config.pids_limit},
         {"tmpfs_mb", config.tmpfs_mb},
         {"max_output_chars", config.max_output_chars},
         {"max_code_bytes", config.max_code_bytes},
         {"max_files", config.max_files},
         {"max_file_bytes", config.max_file_bytes},
         {"max_archive_bytes", config.max_archive_bytes},
         {"run_user", config.run_user}};
}

runner_config load_config(const filesystem::path &config_path) {
    runner_config config;
    if (!config_path.empty()) {
        json j = json::parse(read_file_content(config_path));
        from_json(j, config);
    }
    config.apply_environment();
    return config;
}

config_cache::config_cache(const filesystem::path &path, function<void(runner_config &)> overrides)
    : path(path), overrides(move(overrides)), mtime(0) {
    if (!path.empty()) mtime = last_write_time(path);
    value = load();
}

runner_config config_cache::load() const {
    runner_config config = load_config(path);
    if (overrides) overrides(config);
    config.validate();
    return config;
}

bool config_cache::refresh_if_stale() {
    if (path.empty()) return false;

    scoped_lock guard(mut);
    time_t current;
    try {
        current = last_write_time(path);
    } catch (system_error &e) {
        LOG(WARNING) << "Unable to stat configuration file " << path << ", keeping previous configuration: " << e.what();
        return false;
    }
    if (current == mtime) return false;

    try {
        value = load();
        mtime = current;
        LOG(INFO) << "Reloaded configuration from " << path;
        return true;
    } catch (std::exception &e) {
        LOG(ERROR) << "Configuration file " << path << " is malformed, keeping previous configuration: " << e.what();
        return false;
    }
}

runner_config config_cache::get() const {
    scoped_lock guard(mut);
    return value;
}

time_t config_cache::source_mtime() const {
    scoped_lock guard(mut);
    return mtime;
}

}  // namespace sandbox
