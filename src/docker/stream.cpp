#include "docker/stream.hpp"
#include <algorithm>

namespace sandbox::docker {
using namespace std;

static constexpr size_t HEADER_SIZE = 8;

stream_demuxer::stream_demuxer(size_t limit) : limit(limit) {}

void stream_demuxer::append(uint8_t stream, const char *data, size_t size) {
    string &target = stream == 2 ? stderr_bytes : stdout_bytes;
    bool &overflowed = stream == 2 ? stderr_overflowed : stdout_overflowed;
    size_t room = target.size() < limit ? limit - target.size() : 0;
    if (size > room) overflowed = true;
    target.append(data, min(size, room));
}

void stream_demuxer::feed(const char *data, size_t size) {
    while (size > 0) {
        if (remaining == 0) {
            size_t take = min(size, HEADER_SIZE - header.size());
            header.append(data, take);
            data += take, size -= take;
            if (header.size() < HEADER_SIZE) return;

            current_stream = (uint8_t)header[0];
            remaining = ((size_t)(uint8_t)header[4] << 24) |
                        ((size_t)(uint8_t)header[5] << 16) |
                        ((size_t)(uint8_t)header[6] << 8) |
                        (size_t)(uint8_t)header[7];
            header.clear();
            continue;
        }

        size_t take = min(size, remaining);
        append(current_stream, data, take);
        data += take, size -= take;
        remaining -= take;
    }
}

void stream_demuxer::feed(const string &data) {
    feed(data.data(), data.size());
}

}  // namespace sandbox::docker
