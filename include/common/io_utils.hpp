#pragma once

#include <filesystem>
#include <string>

namespace grader {

/**
 * @brief 读取文本文件的全部内容
 * @param path 文本文件路径
 * @return 文本文件的内容(没有指定编码)
 * @throw internal_error 文件无法打开
 */
std::string read_file_content(const std::filesystem::path &path);

/**
 * @brief 原子地写入文件
 * 先写入同目录下的临时文件再 rename 覆盖，读者要么看到旧内容，要么看到完整的新内容。
 * @param path 目标文件路径
 * @param content 文件内容
 */
void write_file_atomically(const std::filesystem::path &path, const std::string &content);

/**
 * @brief 断言 subpath 一定不会出现返回上一层目录的情况
 * 这里用于确保计算目录时不会出现目录遍历攻击，如果拿到的文件名包含 "../"，
 * 那么最后有可能导致系统重要文件被覆盖导致安全问题。
 * @param subpath 被检查的文件名
 */
std::string assert_safe_path(const std::string &subpath);

/**
 * @brief 断言 component 是单独一级的路径名
 * 不允许为空、"."、".."，也不允许包含 '/' 或 '\0'。
 * @param component 被检查的路径名
 * @return component 本身
 */
std::string assert_safe_component(const std::string &component);

/**
 * @brief 递归复制文件夹内容到 dest，dest 不存在时会被创建
 */
void copy_directory(const std::filesystem::path &src, const std::filesystem::path &dest);

struct scoped_file_lock {
    scoped_file_lock();
    scoped_file_lock(const std::filesystem::path &path, bool shared);
    scoped_file_lock(scoped_file_lock &&);
    ~scoped_file_lock();

    scoped_file_lock &operator=(scoped_file_lock &&);

    void release();

private:
    int fd = -1;
    bool valid = false;
};

/**
 * @brief 锁文件夹
 * 通过创建文件夹，并对文件夹根目录下的 .lock 文件加锁实现。
 * flock 锁绑定在打开的文件描述上，因此同一进程内的多个线程之间也互斥。
 * @param dir 要被加锁的文件夹
 * @param shared 是否是共享锁，真为共享锁（读锁），假为独占锁（写锁）
 * @return 文件锁
 */
scoped_file_lock lock_directory(const std::filesystem::path &dir, bool shared);

}  // namespace grader
