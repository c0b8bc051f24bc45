#include "common/utils.hpp"
#include <stdlib.h>
#include <boost/algorithm/string.hpp>

namespace sandbox {
using namespace std;

string get_env(const string &key, const string &def_value) {
    char *result = getenv(key.c_str());
    return !result ? def_value : string(result);
}

optional<string> get_env(const string &key) {
    char *result = getenv(key.c_str());
    if (!result) return nullopt;
    return string(result);
}

void set_env(const string &key, const string &value, bool replace) {
    setenv(key.c_str(), value.c_str(), replace);
}

void unset_env(const string &key) {
    unsetenv(key.c_str());
}

bool parse_bool(const string &value) {
    string v = boost::algorithm::to_lower_copy(boost::algorithm::trim_copy(value));
    return v == "1" || v == "true" || v == "yes" || v == "on";
}

elapsed_time::elapsed_time() {
    start = chrono::steady_clock::now();
}

}  // namespace sandbox
