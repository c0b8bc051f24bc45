#include "sandbox/sanitizer.hpp"
#include <boost/algorithm/string.hpp>
#include <algorithm>
#include <regex>
#include <vector>
#include "common/io_utils.hpp"
#include "sandbox/archive.hpp"

namespace sandbox {
using namespace std;

static const regex SAFE_PATH("^[A-Za-z0-9][A-Za-z0-9._/-]*$");

sanitized_file::sanitized_file(string path, string content)
    : file_path(move(path)), file_content(move(content)) {}

const string &sanitized_file::path() const {
    return file_path;
}

const string &sanitized_file::content() const {
    return file_content;
}

string safe_path(const string &path) {
    string cleaned = boost::algorithm::trim_copy(path);
    replace(cleaned.begin(), cleaned.end(), '\\', '/');

    if (cleaned.empty() ||
        boost::algorithm::starts_with(cleaned, "/") ||
        boost::algorithm::starts_with(cleaned, "./") ||
        boost::algorithm::starts_with(cleaned, "../"))
        throw validation_error("Invalid file path.");

    if (!regex_match(cleaned, SAFE_PATH))
        throw validation_error("Invalid file path.");

    // 每一段都必须是非空的普通名字，"dir/"、"a//b"、"a/./b" 会在归档中产生冲突的条目
    vector<string> segments;
    boost::algorithm::split(segments, cleaned, boost::algorithm::is_any_of("/"));
    for (auto &segment : segments)
        if (segment.empty() || segment == "." || segment == "..")
            throw validation_error("Invalid file path.");

    // 不允许覆盖入口程序和 turtle 模块
    if (cleaned == ENTRY_PROGRAM_NAME || cleaned == TURTLE_MODULE_NAME)
        throw validation_error("File path is reserved: " + cleaned);

    return cleaned;
}

vector<sanitized_file> sanitize_files(const vector<raw_file> &files, const runner_config &config) {
    vector<sanitized_file> cleaned;
    if (files.empty()) return cleaned;

    if (files.size() > config.max_files)
        throw validation_error("Too many files.");

    for (auto &file : files) {
        string path = safe_path(file.path);
        if (!utf8_check_is_valid(file.content))
            throw validation_error("Invalid file content.");
        if (file.content.size() > config.max_file_bytes)
            throw validation_error("File too large.");
        cleaned.push_back(sanitized_file(path, file.content));
    }
    return cleaned;
}

void validate_code(const string &code, const runner_config &config) {
    if (boost::algorithm::trim_copy(code).empty())
        throw validation_error("Code is required.");
    if (!utf8_check_is_valid(code))
        throw validation_error("Code must be UTF-8 text.");
    if (code.size() > config.max_code_bytes)
        throw validation_error("Code too large.");
}

}  // namespace sandbox
