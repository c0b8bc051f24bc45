#pragma once

#include <functional>
#include <string>

namespace sandbox {

/**
 * @brief tar 归档中的一个条目
 */
struct tar_member {
    enum class type {
        REGULAR,
        DIRECTORY,
        SYMLINK,
        OTHER
    };

    /**
     * @brief 条目的完整路径（已经合并 ustar prefix、GNU 长文件名以及 PAX path 记录）
     */
    std::string name;

    type kind = type::REGULAR;

    unsigned mode = 0644;

    /**
     * @brief 普通文件的内容，其他类型的条目为空
     */
    std::string content;

    bool is_regular() const;
};

/**
 * @brief 在内存中构建 POSIX ustar 格式的归档
 * 所有条目的修改时间都为 0，因此相同输入总是得到相同的字节序列。
 * 超过 ustar 长度限制的路径通过 PAX 扩展头保存。
 */
struct tar_writer {
    /**
     * @param uid 写入条目头的属主 uid
     * @param gid 写入条目头的属组 gid
     */
    tar_writer(unsigned uid = 0, unsigned gid = 0);

    void add_file(const std::string &name, const std::string &content, unsigned mode = 0644);

    void add_directory(const std::string &name, unsigned mode = 0755);

    /**
     * @brief 写入归档结尾的两个全零块，返回整个归档
     * 调用之后不能再添加条目
     */
    std::string finish();

private:
    void write_header(const std::string &name, char typeflag, unsigned mode, size_t size);
    void write_pax_path(const std::string &name);
    void pad();

    unsigned uid, gid;
    bool finished;
    std::string buffer;
};

/**
 * @brief 逐个读取内存中的 tar 归档条目
 * 支持 ustar、GNU 长文件名 ('L') 以及 PAX 扩展头 ('x') 中的 path 记录。
 * @param archive 完整的归档字节
 * @param visitor 对每个条目调用一次，返回 false 时停止读取
 * @throw std::invalid_argument 归档格式损坏（校验和错误或条目被截断）
 */
void read_tar(const std::string &archive, const std::function<bool(const tar_member &)> &visitor);

}  // namespace sandbox
