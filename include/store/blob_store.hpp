#pragma once

#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>

namespace grader::store {

/**
 * @brief 持久化存储，以字符串为键保存数据
 * 评测任务和评测报告都保存在这里，请求线程和 worker 线程只通过它共享数据
 */
struct blob_store {
    virtual ~blob_store();

    /**
     * @brief 保存数据，会覆盖已有的数据
     */
    virtual void persist(const std::string &key, const std::string &value) = 0;

    /**
     * @brief 读取数据
     * @return 数据，不存在时返回 std::nullopt
     */
    virtual std::optional<std::string> read(const std::string &key) const = 0;

    /**
     * @brief 删除数据，不存在时什么都不做
     */
    virtual void remove(const std::string &key) = 0;
};

/**
 * @brief 由若干段拼接出存储键，例如 make_key("results", context, user)
 * 每一段中的 % 和 / 会被转义，不同的段组合不会得到相同的键
 */
std::string make_key(const std::string &prefix, const std::string &context, const std::string &user);

/**
 * @brief 将数据保存在文件夹中，每个键对应一个文件
 * 写入时先写临时文件再重命名，并对文件夹上锁，多个进程可以共享同一个文件夹
 */
struct file_blob_store : public blob_store {
    explicit file_blob_store(const std::filesystem::path &root);

    void persist(const std::string &key, const std::string &value) override;
    std::optional<std::string> read(const std::string &key) const override;
    void remove(const std::string &key) override;

    /**
     * @brief 键对应的文件路径
     * 键中除字母数字和 -_. 以外的字符都会被编码为 %XX
     */
    std::filesystem::path path_of(const std::string &key) const;

private:
    std::filesystem::path root;
};

/**
 * @brief 保存在内存中，用于测试
 */
struct memory_blob_store : public blob_store {
    void persist(const std::string &key, const std::string &value) override;
    std::optional<std::string> read(const std::string &key) const override;
    void remove(const std::string &key) override;

private:
    mutable std::mutex mut;
    std::map<std::string, std::string> data;
};

}  // namespace grader::store
