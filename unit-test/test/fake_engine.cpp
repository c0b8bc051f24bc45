#include "test/fake_engine.hpp"
#include <algorithm>
#include "common/exceptions.hpp"
#include "docker/stream.hpp"

namespace sandbox::test {
using namespace std;

static const char *CONTAINER_ID = "c0ffee";

int fake_engine_state::leaked() const {
    return created - removed;
}

fake_engine::fake_engine(shared_ptr<fake_engine_state> state) : state(move(state)) {}

nlohmann::json fake_engine::version() {
    return {{"Version", "24.0.7"}, {"ApiVersion", "1.43"}};
}

void fake_engine::pull_image(const string &) {
    ++state->pulled;
    if (state->pull_status) throw engine_error(state->pull_status, "pull failed");
}

string fake_engine::create_container(const docker::container_options &options) {
    if (state->create_unreachable) throw network_error("connection refused");
    if (state->create_status) throw engine_error(state->create_status, "create failed");
    ++state->created;
    state->container = options;
    return CONTAINER_ID;
}

void fake_engine::start_container(const string &) {
    if (state->start_failure) throw engine_error(500, "cannot start container");
    ++state->started;
}

bool fake_engine::put_archive(const string &, const string &path, const string &archive) {
    state->uploaded_path = path;
    state->uploaded_archive = archive;
    return state->upload_ok;
}

string fake_engine::create_exec(const string &, const docker::exec_options &options) {
    state->exec = options;
    return state->exec_id;
}

docker::exec_output fake_engine::start_exec(const string &, chrono::milliseconds deadline, size_t max_bytes) {
    state->exec_deadline = deadline;
    state->exec_max_bytes = max_bytes;

    docker::stream_demuxer demuxer(max_bytes);
    demuxer.feed(state->exec_stream);

    docker::exec_output output;
    output.stdout_bytes = demuxer.stdout_bytes;
    output.stderr_bytes = demuxer.stderr_bytes;
    output.stdout_overflowed = demuxer.stdout_overflowed;
    output.stderr_overflowed = demuxer.stderr_overflowed;
    output.complete = state->stream_complete;
    return output;
}

docker::exec_state fake_engine::inspect_exec(const string &) {
    docker::exec_state result;
    result.running = state->running_polls < 0 || state->polls < state->running_polls;
    ++state->polls;
    if (!result.running) result.exit_code = state->exit_code;
    return result;
}

void fake_engine::kill_container(const string &) {
    ++state->killed;
    if (state->kill_failure) throw engine_error(409, "container is not running");
}

void fake_engine::remove_container(const string &) {
    if (state->remove_failure) throw engine_error(500, "removal in progress");
    ++state->removed;
}

void fake_engine::get_archive(const string &, const string &, const docker::archive_sink &sink) {
    if (state->archive_failure) throw engine_error(404, "no such container");
    const string &archive = state->post_run_archive;
    for (size_t offset = 0; offset < archive.size(); offset += state->archive_chunk) {
        size_t size = min(state->archive_chunk, archive.size() - offset);
        sink(archive.data() + offset, size);
    }
}

engine_factory fake_factory(shared_ptr<fake_engine_state> state) {
    return [state](const runner_config &) -> unique_ptr<docker::engine> {
        ++state->factory_calls;
        return make_unique<fake_engine>(state);
    };
}

string frame(uint8_t stream, const string &payload) {
    string result(8, '\0');
    result[0] = (char)stream;
    uint32_t size = payload.size();
    result[4] = (char)((size >> 24) & 0xFF);
    result[5] = (char)((size >> 16) & 0xFF);
    result[6] = (char)((size >> 8) & 0xFF);
    result[7] = (char)(size & 0xFF);
    return result + payload;
}

}  // namespace sandbox::test
