#include "sandbox/request.hpp"

namespace sandbox {
using namespace std;
using namespace nlohmann;

void from_json(const json &j, run_request &request) {
    if (!j.is_object())
        throw validation_error("Request must be a JSON object.");

    if (!j.count("code") || !j.at("code").is_string())
        throw validation_error("Code is required.");
    request.code = j.at("code").get<string>();

    request.files.clear();
    if (!j.count("files") || j.at("files").is_null()) return;

    const json &files = j.at("files");
    if (!files.is_array())
        throw validation_error("Files must be a list.");
    for (auto &item : files) {
        if (!item.is_object())
            throw validation_error("Invalid file entry.");
        raw_file file;
        if (item.count("path") && !item.at("path").is_null()) {
            if (!item.at("path").is_string())
                throw validation_error("Invalid file path.");
            file.path = item.at("path").get<string>();
        }
        if (item.count("content") && !item.at("content").is_null()) {
            if (!item.at("content").is_string())
                throw validation_error("Invalid file content.");
            file.content = item.at("content").get<string>();
        }
        request.files.push_back(move(file));
    }
}

void to_json(json &j, const output_file &file) {
    j = {{"path", file.path},
         {"size", file.size},
         {"mime", file.mime},
         {"content_base64", file.content_base64}};
}

void to_json(json &j, const run_result &result) {
    j = {{"stdout", result.stdout_text},
         {"stderr", result.stderr_text},
         {"exit_code", nullptr},
         {"timed_out", result.timed_out},
         {"duration_ms", result.duration_ms},
         {"files", result.files}};
    if (result.exit_code) j["exit_code"] = *result.exit_code;
}

void to_json(json &j, const run_failure &failure) {
    j = {{"ok", false},
         {"error_kind", to_string(failure.kind)},
         {"status", http_status(failure.kind)},
         {"message", failure.message}};
}

}  // namespace sandbox
