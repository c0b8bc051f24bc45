#include "common/tar.hpp"
#include <fmt/core.h>
#include <algorithm>
#include <cstring>
#include <stdexcept>

namespace sandbox {
using namespace std;

static constexpr size_t BLOCK_SIZE = 512;

// ustar 头部各字段的偏移和长度
static constexpr size_t NAME_OFFSET = 0, NAME_SIZE = 100;
static constexpr size_t MODE_OFFSET = 100;
static constexpr size_t UID_OFFSET = 108;
static constexpr size_t GID_OFFSET = 116;
static constexpr size_t SIZE_OFFSET = 124, SIZE_SIZE = 12;
static constexpr size_t MTIME_OFFSET = 136;
static constexpr size_t CHKSUM_OFFSET = 148, CHKSUM_SIZE = 8;
static constexpr size_t TYPEFLAG_OFFSET = 156;
static constexpr size_t MAGIC_OFFSET = 257;
static constexpr size_t VERSION_OFFSET = 263;
static constexpr size_t PREFIX_OFFSET = 345, PREFIX_SIZE = 155;

bool tar_member::is_regular() const {
    return kind == type::REGULAR;
}

static void put_octal(char *field, size_t width, unsigned long long value) {
    // width - 1 位八进制数字，最后一位为 NUL
    string digits = fmt::format("{:0{}o}", value, width - 1);
    memcpy(field, digits.data(), min(digits.size(), width - 1));
    field[width - 1] = '\0';
}

static unsigned header_checksum(const char *header) {
    unsigned sum = 0;
    for (size_t i = 0; i < BLOCK_SIZE; ++i) {
        if (i >= CHKSUM_OFFSET && i < CHKSUM_OFFSET + CHKSUM_SIZE)
            sum += ' ';
        else
            sum += (unsigned char)header[i];
    }
    return sum;
}

/**
 * @brief 尝试把长路径拆成 ustar 的 prefix 和 name 两部分
 */
static bool split_ustar_name(const string &name, string &prefix, string &base) {
    if (name.size() <= NAME_SIZE) {
        prefix.clear();
        base = name;
        return true;
    }
    for (size_t pos = name.find('/'); pos != string::npos; pos = name.find('/', pos + 1)) {
        if (pos <= PREFIX_SIZE && name.size() - pos - 1 <= NAME_SIZE && pos + 1 < name.size()) {
            prefix = name.substr(0, pos);
            base = name.substr(pos + 1);
            return true;
        }
    }
    return false;
}

tar_writer::tar_writer(unsigned uid, unsigned gid)
    : uid(uid), gid(gid), finished(false) {}

void tar_writer::pad() {
    size_t remainder = buffer.size() % BLOCK_SIZE;
    if (remainder) buffer.append(BLOCK_SIZE - remainder, '\0');
}

void tar_writer::write_header(const string &name, char typeflag, unsigned mode, size_t size) {
    if (finished) throw logic_error("tar archive has already been finished");

    string prefix, base;
    if (!split_ustar_name(name, prefix, base)) {
        write_pax_path(name);
        prefix.clear();
        base = name.substr(name.size() - NAME_SIZE);
    }

    char header[BLOCK_SIZE];
    memset(header, 0, sizeof(header));
    memcpy(header + NAME_OFFSET, base.data(), min(base.size(), NAME_SIZE));
    put_octal(header + MODE_OFFSET, 8, mode);
    put_octal(header + UID_OFFSET, 8, uid);
    put_octal(header + GID_OFFSET, 8, gid);
    put_octal(header + SIZE_OFFSET, SIZE_SIZE, size);
    put_octal(header + MTIME_OFFSET, 12, 0);
    header[TYPEFLAG_OFFSET] = typeflag;
    memcpy(header + MAGIC_OFFSET, "ustar", 6);
    memcpy(header + VERSION_OFFSET, "00", 2);
    memcpy(header + PREFIX_OFFSET, prefix.data(), min(prefix.size(), PREFIX_SIZE));

    string checksum = fmt::format("{:06o}", header_checksum(header));
    memcpy(header + CHKSUM_OFFSET, checksum.data(), 6);
    header[CHKSUM_OFFSET + 6] = '\0';
    header[CHKSUM_OFFSET + 7] = ' ';

    buffer.append(header, BLOCK_SIZE);
}

void tar_writer::write_pax_path(const string &name) {
    // PAX 记录格式为 "<length> path=<name>\n"，length 包含它自身的位数
    string body = " path=" + name + "\n";
    size_t length = body.size() + 1;
    while (std::to_string(length).size() + body.size() != length)
        length = std::to_string(length).size() + body.size();
    string record = std::to_string(length) + body;

    write_header("PaxHeaders/" + name.substr(name.size() - min(name.size(), (size_t)80)), 'x', 0644, record.size());
    buffer += record;
    pad();
}

void tar_writer::add_file(const string &name, const string &content, unsigned mode) {
    write_header(name, '0', mode, content.size());
    buffer += content;
    pad();
}

void tar_writer::add_directory(const string &name, unsigned mode) {
    string dir = name;
    if (dir.empty() || dir.back() != '/') dir += '/';
    write_header(dir, '5', mode, 0);
}

string tar_writer::finish() {
    if (!finished) {
        buffer.append(2 * BLOCK_SIZE, '\0');
        finished = true;
    }
    return buffer;
}

static string read_field(const char *header, size_t offset, size_t size) {
    const char *begin = header + offset;
    const char *end = find(begin, begin + size, '\0');
    return string(begin, end);
}

static unsigned long long read_number(const char *header, size_t offset, size_t size) {
    const unsigned char *field = (const unsigned char *)header + offset;
    if (field[0] & 0x80) {
        // GNU base-256 编码，用于超过八进制表示范围的数值
        unsigned long long value = field[0] & 0x7F;
        for (size_t i = 1; i < size; ++i)
            value = (value << 8) | field[i];
        return value;
    }
    unsigned long long value = 0;
    size_t i = 0;
    while (i < size && (field[i] == ' ' || field[i] == '\0')) ++i;
    for (; i < size && field[i] >= '0' && field[i] <= '7'; ++i)
        value = value * 8 + (field[i] - '0');
    return value;
}

static bool is_zero_block(const char *block) {
    return all_of(block, block + BLOCK_SIZE, [](char c) { return c == '\0'; });
}

static string pax_path(const string &records) {
    string path;
    size_t pos = 0;
    while (pos < records.size()) {
        size_t space = records.find(' ', pos);
        if (space == string::npos) break;
        size_t length = 0;
        try {
            length = stoul(records.substr(pos, space - pos));
        } catch (logic_error &) {
            throw invalid_argument("malformed pax header record");
        }
        if (length == 0 || pos + length > records.size())
            throw invalid_argument("malformed pax header record");
        string record = records.substr(space + 1, pos + length - space - 2);  // 去掉末尾的 '\n'
        size_t eq = record.find('=');
        if (eq != string::npos && record.substr(0, eq) == "path")
            path = record.substr(eq + 1);
        pos += length;
    }
    return path;
}

void read_tar(const string &archive, const function<bool(const tar_member &)> &visitor) {
    string next_name;  // 来自 GNU 长文件名或 PAX 扩展头，作用于下一个条目
    size_t offset = 0;
    while (offset + BLOCK_SIZE <= archive.size()) {
        const char *header = archive.data() + offset;
        if (is_zero_block(header)) break;

        unsigned expected = (unsigned)read_number(header, CHKSUM_OFFSET, CHKSUM_SIZE);
        if (expected != header_checksum(header))
            throw invalid_argument(fmt::format("tar header checksum mismatch at offset {}", offset));

        unsigned long long size = read_number(header, SIZE_OFFSET, SIZE_SIZE);
        size_t data_offset = offset + BLOCK_SIZE;
        if (size > archive.size() - data_offset)
            throw invalid_argument(fmt::format("tar entry at offset {} is truncated", offset));
        size_t padded = (size + BLOCK_SIZE - 1) / BLOCK_SIZE * BLOCK_SIZE;
        offset = data_offset + min<size_t>(padded, archive.size() - data_offset);

        char typeflag = header[TYPEFLAG_OFFSET];
        if (typeflag == 'L') {
            string name = archive.substr(data_offset, size);
            next_name = name.substr(0, name.find('\0'));
            continue;
        }
        if (typeflag == 'x') {
            string path = pax_path(archive.substr(data_offset, size));
            if (!path.empty()) next_name = path;
            continue;
        }
        if (typeflag == 'g') continue;

        tar_member member;
        if (!next_name.empty()) {
            member.name = next_name;
            next_name.clear();
        } else {
            string name = read_field(header, NAME_OFFSET, NAME_SIZE);
            string prefix;
            if (read_field(header, MAGIC_OFFSET, 5) == "ustar")
                prefix = read_field(header, PREFIX_OFFSET, PREFIX_SIZE);
            member.name = prefix.empty() ? name : prefix + "/" + name;
        }
        member.mode = (unsigned)read_number(header, MODE_OFFSET, 8);

        switch (typeflag) {
            case '0':
            case '\0':
            case '7':
                member.kind = tar_member::type::REGULAR;
                member.content = archive.substr(data_offset, size);
                break;
            case '5':
                member.kind = tar_member::type::DIRECTORY;
                break;
            case '2':
                member.kind = tar_member::type::SYMLINK;
                break;
            default:
                member.kind = tar_member::type::OTHER;
                break;
        }

        if (!visitor(member)) return;
    }
}

}  // namespace sandbox
