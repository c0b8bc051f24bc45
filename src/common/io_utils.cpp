#include "common/io_utils.hpp"
#include <sys/stat.h>
#include <sys/types.h>
#include <fstream>
#include <system_error>

namespace sandbox {
using namespace std;
namespace fs = std::filesystem;

static const char REPLACEMENT_CHARACTER[] = "\xEF\xBF\xBD";

string read_file_content(fs::path const &path) {
    ifstream fin(path.string(), ios::binary);
    if (!fin)
        throw system_error(errno, system_category(), "unable to open file " + path.string());
    string str((istreambuf_iterator<char>(fin)),
               (istreambuf_iterator<char>()));
    return str;
}

/**
 * @brief 计算从 i 开始的 UTF-8 序列的长度
 * @return 合法序列的字节数；非法时返回 0，并将 bad_end 设置为最大非法子序列的结尾
 */
static size_t utf8_sequence(const string &s, size_t i, size_t &bad_end) {
    unsigned char c = s[i];
    if (c < 0x80) return 1;

    size_t need;
    unsigned char lo = 0x80, hi = 0xBF;
    if (c >= 0xC2 && c <= 0xDF)
        need = 1;
    else if (c >= 0xE0 && c <= 0xEF)
        need = 2;
    else if (c >= 0xF0 && c <= 0xF4)
        need = 3;
    else {
        bad_end = i + 1;
        return 0;
    }

    if (c == 0xE0) lo = 0xA0;  // 过长编码
    if (c == 0xED) hi = 0x9F;  // U+D800 to U+DFFF
    if (c == 0xF0) lo = 0x90;  // 过长编码
    if (c == 0xF4) hi = 0x8F;  // > U+10FFFF

    size_t j = i + 1;
    for (size_t k = 0; k < need; ++k, ++j) {
        if (j >= s.size()) {
            bad_end = j;
            return 0;
        }
        unsigned char b = s[j];
        unsigned char l = k == 0 ? lo : 0x80;
        unsigned char h = k == 0 ? hi : 0xBF;
        if (b < l || b > h) {
            bad_end = j;
            return 0;
        }
    }
    return need + 1;
}

bool utf8_check_is_valid(const string &string) {
    size_t bad_end;
    for (size_t i = 0; i < string.size();) {
        size_t len = utf8_sequence(string, i, bad_end);
        if (!len) return false;
        i += len;
    }
    return true;
}

string utf8_decode_lossy(const string &bytes) {
    string result;
    result.reserve(bytes.size());
    size_t bad_end;
    for (size_t i = 0; i < bytes.size();) {
        size_t len = utf8_sequence(bytes, i, bad_end);
        if (len) {
            result.append(bytes, i, len);
            i += len;
        } else {
            result += REPLACEMENT_CHARACTER;
            i = bad_end;
        }
    }
    return result;
}

size_t utf8_length(const string &string) {
    size_t count = 0;
    for (unsigned char c : string)
        if ((c & 0xC0) != 0x80) ++count;
    return count;
}

string utf8_prefix(const string &string, size_t max_chars) {
    size_t count = 0;
    for (size_t i = 0; i < string.size(); ++i) {
        if (((unsigned char)string[i] & 0xC0) != 0x80) {
            if (count == max_chars) return string.substr(0, i);
            ++count;
        }
    }
    return string;
}

time_t last_write_time(const fs::path &path) {
    struct stat attr;
    if (stat(path.c_str(), &attr) != 0)
        throw system_error(errno, system_category(), "error when reading modification time of path " + path.string());
    return attr.st_mtim.tv_sec;
}

}  // namespace sandbox
