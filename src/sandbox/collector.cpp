#include "sandbox/collector.hpp"
#include <boost/algorithm/string.hpp>
#include <limits>
#include <stdexcept>
#include "common/base64.hpp"
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/tar.hpp"
#include "sandbox/archive.hpp"

namespace sandbox {
using namespace std;

const char *TRUNCATION_MARKER = "\n...[truncated]";

size_t output_byte_limit(size_t max_chars) {
    // 每个码点最多 4 字节，多保留一个码点用于判断是否需要截断
    if (max_chars >= numeric_limits<size_t>::max() / 4 - 1)
        return numeric_limits<size_t>::max();
    return max_chars * 4 + 4;
}

string truncate_output(const string &bytes, size_t max_chars, bool overflowed) {
    string text = utf8_decode_lossy(bytes);
    if (overflowed || utf8_length(text) > max_chars)
        return utf8_prefix(text, max_chars) + TRUNCATION_MARKER;
    return text;
}

string mime_for(const string &path) {
    string lower = boost::algorithm::to_lower_copy(path);
    if (boost::algorithm::ends_with(lower, ".svg"))
        return "image/svg+xml";
    if (boost::algorithm::ends_with(lower, ".png"))
        return "image/png";
    if (boost::algorithm::ends_with(lower, ".jpg") || boost::algorithm::ends_with(lower, ".jpeg"))
        return "image/jpeg";
    if (boost::algorithm::ends_with(lower, ".json"))
        return "application/json";
    return "text/plain";
}

static void strip_leading_separators(string &name) {
    while (true) {
        if (boost::algorithm::starts_with(name, "./")) name.erase(0, 2);
        else if (boost::algorithm::starts_with(name, "/")) name.erase(0, 1);
        else break;
    }
}

string output_name(const string &entry_name) {
    string name = entry_name;
    strip_leading_separators(name);
    if (boost::algorithm::starts_with(name, "tmp/")) {
        name.erase(0, 4);
        strip_leading_separators(name);
    }
    return name;
}

archive_buffer::archive_buffer(size_t limit) : limit(limit) {}

void archive_buffer::append(const char *data, size_t size) {
    if (size > limit - buffer.size())
        throw runner_error("Output archive too large.");
    buffer.append(data, size);
}

const string &archive_buffer::data() const {
    return buffer;
}

vector<output_file> collect_files(const string &archive, const runner_config &config) {
    vector<output_file> files;
    if (archive.empty()) return files;

    try {
        read_tar(archive, [&](const tar_member &member) {
            if (!member.is_regular()) return true;

            string name = output_name(member.name);
            if (name.empty() || name == ENTRY_PROGRAM_NAME || name == TURTLE_MODULE_NAME)
                return true;
            // 超出数量上限的文件直接跳过，但仍然继续检查归档剩余部分的格式
            if (files.size() >= config.max_files) return true;

            string content = member.content.substr(0, config.max_file_bytes);
            output_file file;
            file.path = name;
            file.size = content.size();
            file.mime = mime_for(name);
            file.content_base64 = base64_encode(content);
            files.push_back(move(file));
            return true;
        });
    } catch (invalid_argument &ex) {
        throw runner_error(string("Malformed output archive: ") + ex.what());
    }
    return files;
}

}  // namespace sandbox
