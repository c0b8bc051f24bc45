#include "docker/client.hpp"
#include <curl/curl.h>
#include <fmt/core.h>
#include <glog/logging.h>
#include <boost/algorithm/string.hpp>
#include <exception>
#include <memory>
#include <sstream>
#include "common/exceptions.hpp"
#include "docker/stream.hpp"

namespace sandbox::docker {
using namespace std;
using namespace nlohmann;

static constexpr long CONNECT_TIMEOUT_MS = 5000;
static const chrono::milliseconds DEFAULT_REQUEST_TIMEOUT(30000);
static const chrono::milliseconds PULL_TIMEOUT(600000);

namespace {

struct transfer {
    CURL *curl;
    const archive_sink *sink;
    string *buffer;
    exception_ptr error;
};

}  // namespace

/**
 * @brief CURL 的写回调
 * 不能让异常穿过 libcurl 的 C 栈帧，所以 sink 抛出的异常先保存下来，
 * 返回 0 使 curl_easy_perform 以 CURLE_WRITE_ERROR 结束，然后再重新抛出。
 */
static size_t write_callback(char *ptr, size_t size, size_t nmemb, void *userdata) {
    auto *t = static_cast<transfer *>(userdata);
    size_t length = size * nmemb;

    long status = 0;
    curl_easy_getinfo(t->curl, CURLINFO_RESPONSE_CODE, &status);
    // 错误响应的响应体总是保存下来用于构造错误信息
    if (!t->sink || !*t->sink || status >= 300) {
        t->buffer->append(ptr, length);
        return length;
    }

    try {
        (*t->sink)(ptr, length);
    } catch (std::exception &) {
        t->error = current_exception();
        return 0;
    }
    return length;
}

string error_message(const string &body) {
    json j = json::parse(body, nullptr, false);
    if (!j.is_discarded() && j.is_object() && j.count("message") && j.at("message").is_string())
        return j.at("message").get<string>();
    return boost::algorithm::trim_copy(body);
}

pair<string, string> split_image_reference(const string &image) {
    if (image.find('@') != string::npos)
        return {image, ""};
    size_t slash = image.rfind('/');
    size_t colon = image.rfind(':');
    if (colon != string::npos && (slash == string::npos || colon > slash))
        return {image.substr(0, colon), image.substr(colon + 1)};
    return {image, "latest"};
}

client::client(const runner_config &config)
    : addr(parse_host(config.docker_host)), request_timeout(DEFAULT_REQUEST_TIMEOUT) {
    ensure_socket(addr);

    string version = boost::algorithm::trim_copy(config.docker_api_version);
    if (!version.empty() && version != "auto") {
        if (version[0] == 'v' || version[0] == 'V') version = version.substr(1);
        api_prefix = "/v" + version;
    }
}

string client::base_url() const {
    return addr.base_url + api_prefix;
}

client::request client::make_request(const string &method, const string &path) const {
    request req;
    req.method = method;
    req.path = path;
    req.timeout = request_timeout;
    return req;
}

client::response client::perform(const request &req) const {
    unique_ptr<CURL, decltype(&curl_easy_cleanup)> curl(curl_easy_init(), curl_easy_cleanup);
    if (!curl)
        throw network_error("unable to initialize curl handle");

    string url = base_url() + req.path;
    for (size_t i = 0; i < req.query.size(); ++i) {
        auto &[key, value] = req.query[i];
        unique_ptr<char, decltype(&curl_free)> escaped(curl_easy_escape(curl.get(), value.c_str(), (int)value.size()), curl_free);
        url += (i == 0 ? "?" : "&") + key + "=" + (escaped ? escaped.get() : "");
    }

    response resp;
    transfer t{curl.get(), &req.sink, &resp.body, nullptr};
    char errbuf[CURL_ERROR_SIZE] = {0};

    unique_ptr<curl_slist, decltype(&curl_slist_free_all)> headers(nullptr, curl_slist_free_all);
    auto add_header = [&headers](const string &header) {
        curl_slist *list = curl_slist_append(headers.get(), header.c_str());
        if (!list) throw network_error("unable to allocate curl header list");
        headers.release();
        headers.reset(list);
    };
    add_header("Expect:");
    if (req.body && !req.content_type.empty())
        add_header("Content-Type: " + req.content_type);

    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_CUSTOMREQUEST, req.method.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &t);
    curl_easy_setopt(curl.get(), CURLOPT_ERRORBUFFER, errbuf);
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT_MS, CONNECT_TIMEOUT_MS);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, (long)req.timeout.count());

    if (addr.kind == engine_host::transport::UNIX) {
        curl_easy_setopt(curl.get(), CURLOPT_UNIX_SOCKET_PATH, addr.socket_path.c_str());
        // 本地 socket 不能经过代理，HTTP_PROXY 等环境变量会让请求发往错误的地方
        curl_easy_setopt(curl.get(), CURLOPT_NOPROXY, "*");
    }

    if (req.body) {
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, req.body->data());
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE_LARGE, (curl_off_t)req.body->size());
    }

    CURLcode res = curl_easy_perform(curl.get());
    if (t.error) rethrow_exception(t.error);

    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &resp.status);

    if (res == CURLE_OPERATION_TIMEDOUT && req.allow_timeout) {
        resp.timed_out = true;
    } else if (res != CURLE_OK) {
        throw network_error(fmt::format("{} {} failed: {}", req.method, req.path,
                                        errbuf[0] ? errbuf : curl_easy_strerror(res)));
    }
    return resp;
}

client::response client::perform_checked(const request &req) const {
    response resp = perform(req);
    if (resp.status >= 400)
        throw engine_error(resp.status, fmt::format("{} {} returned {}: {}", req.method, req.path, resp.status, error_message(resp.body)));
    return resp;
}

json client::version() {
    response resp = perform_checked(make_request("GET", "/version"));
    return json::parse(resp.body);
}

void client::pull_image(const string &image) {
    auto [from_image, tag] = split_image_reference(image);
    request req = make_request("POST", "/images/create");
    req.query.emplace_back("fromImage", from_image);
    if (!tag.empty()) req.query.emplace_back("tag", tag);
    req.timeout = PULL_TIMEOUT;
    static const string empty;
    req.body = &empty;

    response resp = perform_checked(req);

    // 拉取进度是逐行的 JSON，拉取失败时状态码仍然可能是 200，错误信息在某一行的 error 字段中
    istringstream lines(resp.body);
    string line;
    while (getline(lines, line)) {
        json j = json::parse(line, nullptr, false);
        if (!j.is_discarded() && j.is_object() && j.count("error"))
            throw engine_error(500, fmt::format("pulling {} failed: {}", image, j.at("error").dump()));
    }
}

string client::create_container(const container_options &options) {
    string body = json(options).dump();
    request req = make_request("POST", "/containers/create");
    req.body = &body;
    req.content_type = "application/json";

    response resp = perform_checked(req);
    json j = json::parse(resp.body, nullptr, false);
    if (j.is_discarded() || !j.is_object() || !j.count("Id") || !j.at("Id").is_string())
        throw engine_error(resp.status, "container create returned no container id");
    return j.at("Id").get<string>();
}

void client::start_container(const string &container_id) {
    static const string empty;
    request req = make_request("POST", "/containers/" + container_id + "/start");
    req.body = &empty;
    perform_checked(req);
}

bool client::put_archive(const string &container_id, const string &path, const string &archive) {
    request req = make_request("PUT", "/containers/" + container_id + "/archive");
    req.query.emplace_back("path", path);
    req.body = &archive;
    req.content_type = "application/x-tar";

    response resp = perform_checked(req);
    return resp.status == 200;
}

string client::create_exec(const string &container_id, const exec_options &options) {
    string body = json(options).dump();
    request req = make_request("POST", "/containers/" + container_id + "/exec");
    req.body = &body;
    req.content_type = "application/json";

    response resp = perform_checked(req);
    json j = json::parse(resp.body, nullptr, false);
    if (j.is_discarded() || !j.is_object() || !j.count("Id") || !j.at("Id").is_string())
        return "";
    return j.at("Id").get<string>();
}

exec_output client::start_exec(const string &exec_id, chrono::milliseconds deadline, size_t max_bytes) {
    string body = json{{"Detach", false}, {"Tty", false}}.dump();
    stream_demuxer demuxer(max_bytes);

    request req = make_request("POST", "/exec/" + exec_id + "/start");
    req.body = &body;
    req.content_type = "application/json";
    req.timeout = deadline;
    req.allow_timeout = true;
    req.sink = [&demuxer](const char *data, size_t size) { demuxer.feed(data, size); };

    response resp = perform_checked(req);
    if (resp.timed_out)
        LOG(WARNING) << "Output stream of exec " << exec_id << " still open after " << deadline.count() << "ms";

    exec_output output;
    output.stdout_bytes = move(demuxer.stdout_bytes);
    output.stderr_bytes = move(demuxer.stderr_bytes);
    output.stdout_overflowed = demuxer.stdout_overflowed;
    output.stderr_overflowed = demuxer.stderr_overflowed;
    output.complete = !resp.timed_out;
    return output;
}

exec_state client::inspect_exec(const string &exec_id) {
    response resp = perform_checked(make_request("GET", "/exec/" + exec_id + "/json"));
    json j = json::parse(resp.body, nullptr, false);
    if (j.is_discarded() || !j.is_object())
        throw engine_error(resp.status, "exec inspect returned malformed body");

    exec_state state;
    state.running = j.count("Running") && j.at("Running").is_boolean() && j.at("Running").get<bool>();
    if (j.count("ExitCode") && j.at("ExitCode").is_number_integer())
        state.exit_code = j.at("ExitCode").get<int>();
    return state;
}

void client::kill_container(const string &container_id) {
    static const string empty;
    request req = make_request("POST", "/containers/" + container_id + "/kill");
    req.query.emplace_back("signal", "SIGKILL");
    req.body = &empty;
    perform_checked(req);
}

void client::remove_container(const string &container_id) {
    request req = make_request("DELETE", "/containers/" + container_id);
    req.query.emplace_back("force", "1");
    req.query.emplace_back("v", "1");
    perform_checked(req);
}

void client::get_archive(const string &container_id, const string &path, const archive_sink &sink) {
    request req = make_request("GET", "/containers/" + container_id + "/archive");
    req.query.emplace_back("path", path);
    req.sink = sink;
    perform_checked(req);
}

}  // namespace sandbox::docker
