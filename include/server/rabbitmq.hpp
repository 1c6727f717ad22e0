#pragma once

#include <atomic>
#include <chrono>
#include <mutex>
#include <thread>

#include "SimpleAmqpClient/SimpleAmqpClient.h"
#include "common/concurrent_queue.hpp"
#include "server/config.hpp"

namespace grader::server {

struct rabbitmq_channel;

/**
 * @brief 从消息队列中取出的一条评测请求
 * 处理完毕后必须调用 ack，否则 RabbitMQ 会在连接断开后重新投递
 */
struct rabbitmq_envelope {
    friend struct rabbitmq_channel;
    rabbitmq_envelope();

    void ack() const;

    /**
     * @brief 拒绝该消息，消息格式错误时不应重新投递
     */
    void reject(bool requeue) const;

    std::string body() const;

    /**
     * @brief 消息是否是 RabbitMQ 重新投递的
     */
    bool redelivered() const;

private:
    AmqpClient::Channel::ptr_t channel;
    AmqpClient::Envelope::ptr_t envelope;
};

/**
 * @brief 一个 AMQP 队列的连接
 * 读模式下订阅队列，一次最多预取 concurrency 条未确认的消息；
 * 写模式下启动一个发送线程，消息在发送失败时重连并重试
 */
struct rabbitmq_channel {
    using envelope_type = rabbitmq_envelope;

    /**
     * @brief 拉取消息失败时最多重试的次数
     */
    static constexpr int FETCH_RETRIES = 5;

    /**
     * @brief 析构时最多等待多长时间将剩余的消息发送出去
     */
    static constexpr std::chrono::seconds FLUSH_TIMEOUT{5};

    rabbitmq_channel(const amqp &amqp, bool write = false);
    ~rabbitmq_channel();

    /**
     * @brief 从队列中拉取一条消息
     * @param envelope 拉取到的消息
     * @param timeout 等待时间（单位为毫秒），-1 表示一直等待
     * @return 是否拉取到了消息
     */
    bool fetch(rabbitmq_envelope &envelope, int timeout = -1);

    /**
     * @brief 发送一条 JSON 消息，routing key 使用配置中的默认值
     * 消息在发送线程中异步发送，本函数不会阻塞
     */
    void publish(const std::string &message);

    void publish(const std::string &message, const std::string &routing_key);

    /**
     * @brief 尚未发送的消息数
     */
    size_t pending() const;

private:
    struct pending_message {
        std::string body;
        std::string routing_key;
    };

    void connect();
    void reconnect();
    void send(const pending_message &message);
    void write_loop();

    AmqpClient::Channel::ptr_t channel;
    amqp queue;
    bool write;
    std::mutex mut;

    concurrent_queue<pending_message> outbox;
    std::atomic<bool> closing{false};
    std::thread write_thread;
};

}  // namespace grader::server
