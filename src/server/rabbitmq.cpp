#include "server/rabbitmq.hpp"

#include <sys/prctl.h>

#include <optional>

#include "logging.hpp"

namespace grader::server {
using namespace std;

rabbitmq_envelope::rabbitmq_envelope() {}

void rabbitmq_envelope::ack() const {
    if (channel && envelope)
        channel->BasicAck(envelope);
}

void rabbitmq_envelope::reject(bool requeue) const {
    if (channel && envelope)
        channel->BasicReject(envelope, requeue);
}

string rabbitmq_envelope::body() const {
    return envelope ? envelope->Message()->Body() : "";
}

bool rabbitmq_envelope::redelivered() const {
    return envelope && envelope->Redelivered();
}

rabbitmq_channel::rabbitmq_channel(const amqp &amqp, bool write)
    : queue(amqp), write(write) {
    connect();
    if (write) {
        write_thread = thread([this]() {
            prctl(PR_SET_NAME, "mq write loop", 0, 0, 0);
            write_loop();
        });
    }
}

rabbitmq_channel::~rabbitmq_channel() {
    closing = true;
    if (write_thread.joinable()) write_thread.join();
}

void rabbitmq_channel::connect() {
    scoped_lock guard(mut);
    LOG_INFO << "Connecting to queue " << queue.queue << " of exchange " << queue.exchange;
    channel = AmqpClient::Channel::Open(AmqpClient::Channel::OpenOpts::FromUri(queue.uri));
    channel->DeclareExchange(queue.exchange, queue.exchange_type, /* passive */ false, /* durable */ true);
    channel->DeclareQueue(queue.queue, /* passive */ false, /* durable */ true, /* exclusive */ false, /* auto_delete */ false);
    channel->BindQueue(queue.queue, queue.exchange, queue.routing_key);
    if (!write) {
        // 每个未确认的评测请求都会占用一个 worker，预取数量即为并发数
        channel->BasicConsume(queue.queue, /* consumer tag */ "", /* no_local */ true, /* no_ack */ false, /* exclusive */ false, queue.concurrency);
    }
}

void rabbitmq_channel::reconnect() {
    try {
        connect();
    } catch (const std::exception &ex) {
        LOG_ERROR << "Unable to reconnect to queue " << queue.queue << ": " << ex.what();
    }
}

bool rabbitmq_channel::fetch(rabbitmq_envelope &envelope, int timeout) {
    for (int retry = 1;; retry++) {
        try {
            envelope.channel = channel;
            return channel->BasicConsumeMessage(envelope.envelope, timeout);
        } catch (const std::exception &ex) {
            LOG_WARN << "Unable to fetch from queue " << queue.queue << " (" << retry << "/" << FETCH_RETRIES << "): " << ex.what();
            if (retry >= FETCH_RETRIES) throw;
            this_thread::sleep_for(chrono::seconds(retry));
            reconnect();
        }
    }
}

void rabbitmq_channel::publish(const string &message) {
    publish(message, queue.routing_key);
}

void rabbitmq_channel::publish(const string &message, const string &routing_key) {
    outbox.push({message, routing_key});
}

size_t rabbitmq_channel::pending() const {
    return outbox.size();
}

void rabbitmq_channel::send(const pending_message &message) {
    auto msg = AmqpClient::BasicMessage::Create(message.body);
    msg->ContentType("application/json");
    msg->DeliveryMode(AmqpClient::BasicMessage::dm_persistent);
    channel->BasicPublish(queue.exchange, message.routing_key, msg);
}

void rabbitmq_channel::write_loop() {
    LOG_DEBUG << "Start publishing to exchange " << queue.exchange;
    optional<chrono::steady_clock::time_point> flush_deadline;
    // 关闭后最多再尝试 FLUSH_TIMEOUT，之后放弃剩余的消息
    auto expired = [&]() {
        if (closing && !flush_deadline) flush_deadline = chrono::steady_clock::now() + FLUSH_TIMEOUT;
        return flush_deadline && chrono::steady_clock::now() >= *flush_deadline;
    };

    pending_message message;
    while (!expired()) {
        if (!outbox.try_pop(message)) {
            if (closing) break;
            this_thread::sleep_for(chrono::milliseconds(10));
            continue;
        }

        while (true) {
            try {
                send(message);
                break;
            } catch (const std::exception &ex) {
                LOG_WARN << "Unable to publish to exchange " << queue.exchange << ": " << ex.what();
            }
            if (expired()) {
                LOG_ERROR << "Dropping report " << message.body;
                break;
            }
            this_thread::sleep_for(chrono::seconds(1));
            reconnect();
        }
    }

    if (outbox.size() > 0)
        LOG_ERROR << outbox.size() << " reports to exchange " << queue.exchange << " are dropped";
    LOG_DEBUG << "Stop publishing to exchange " << queue.exchange;
}

}  // namespace grader::server
