#pragma once

#include <filesystem>
#include <string>

#include "common/scoped_fd.hpp"

namespace grader {

/**
 * @brief 读取文件内容
 * @param path 文件路径
 * @param max_bytes 最多读取的字节数，超出部分截断并追加 <...truncated>，小于等于 0 表示不限制
 * @return 文件内容
 */
std::string read_file_content(const std::filesystem::path &path, long max_bytes = -1);

/**
 * @brief 读取文件内容，若文件不存在则返回 def
 */
std::string read_file_content(const std::filesystem::path &path, const std::string &def, long max_bytes);

/**
 * @brief 将 content 写入文件，会覆盖已有文件
 */
void write_file_content(const std::filesystem::path &path, const std::string &content);

/**
 * @brief 将不合法的 UTF-8 字节替换为 U+FFFD，合法部分保持不变
 */
std::string utf8_sanitize(const std::string &text);

/**
 * @brief 检查子路径是否会跳出父目录
 * @return subpath 本身
 */
std::string assert_safe_path(const std::string &subpath);

/**
 * @brief 只保留长文本的最后若干行
 * 编译器和运行时错误可能非常长，保存到评测报告前需要截断
 * @param text 原始文本
 * @param max_lines 保留的最大行数
 * @return 截断后的文本，发生截断时末尾追加 "... Extra output Trimmed."
 */
std::string truncate_error_output(const std::string &text, size_t max_lines = 150);

/**
 * @brief 文件夹的 flock 锁，析构时释放
 * 锁文件为文件夹内的 .lock，同一进程的不同线程之间也互斥
 */
class directory_lock {
public:
    /**
     * @param shared 是否为共享锁，读操作使用共享锁，写操作使用排他锁
     */
    directory_lock(const std::filesystem::path &dir, bool shared);

private:
    scoped_fd fd;
};

}  // namespace grader
