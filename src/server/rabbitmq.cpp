#include "server/rabbitmq.hpp"
#include <glog/logging.h>
#include <algorithm>
#include <thread>
#include "common/exceptions.hpp"
#include "common/utils.hpp"

namespace codejudge::server {
using namespace std;

// 与 broker 的连接断开后重试的次数
const int RETRY_TIMES = 5;

const char *ATTEMPT_HEADER = "x-codejudge-attempt";

unsigned delivery_attempt(const AmqpClient::BasicMessage::ptr_t &message, bool redelivered) {
    unsigned attempt = 1;
    if (message->HeaderTableIsSet()) {
        auto &headers = message->HeaderTable();
        auto it = headers.find(ATTEMPT_HEADER);
        if (it != headers.end() && it->second.GetType() == AmqpClient::TableValue::VT_int32 && it->second.GetInt32() > 0)
            attempt = (unsigned)it->second.GetInt32();
    }
    return redelivered ? attempt + 1 : attempt;
}

AmqpClient::BasicMessage::ptr_t make_retry_message(const AmqpClient::BasicMessage::ptr_t &message, unsigned next_attempt) {
    AmqpClient::BasicMessage::ptr_t retry = AmqpClient::BasicMessage::Create(message->Body());
    retry->DeliveryMode(AmqpClient::BasicMessage::dm_persistent);
    if (message->ContentTypeIsSet()) retry->ContentType(message->ContentType());
    if (message->MessageIdIsSet()) retry->MessageId(message->MessageId());

    AmqpClient::Table headers;
    if (message->HeaderTableIsSet()) headers = message->HeaderTable();
    headers[ATTEMPT_HEADER] = AmqpClient::TableValue((int32_t)next_attempt);
    retry->HeaderTable(headers);
    return retry;
}

rabbitmq::rabbitmq(const amqp &amqp, bool write, uint16_t prefetch)
    : queue(amqp), write(write), prefetch(prefetch) {
    connect();
}

void rabbitmq::connect() {
    LOG(INFO) << "RabbitMQ: Connecting to " << queue.hostname << ":" << queue.port << ", queue " << queue.queue;
    channel = AmqpClient::Channel::Create(queue.hostname, queue.port);
    channel->DeclareQueue(queue.queue, /* passive */ false, /* durable */ true, /* exclusive */ false, /* auto_delete */ false);
    channel->DeclareExchange(queue.exchange, queue.exchange_type, /* passive */ false, /* durable */ true);
    channel->BindQueue(queue.queue, queue.exchange, queue.routing_key);

    AmqpClient::Table delay_args;
    delay_args[AmqpClient::TableKey("x-dead-letter-exchange")] = AmqpClient::TableValue(string());
    delay_args[AmqpClient::TableKey("x-dead-letter-routing-key")] = AmqpClient::TableValue(queue.queue);
    channel->DeclareQueue(delay_queue(), /* passive */ false, /* durable */ true, /* exclusive */ false, /* auto_delete */ false, delay_args);
    channel->DeclareQueue(dead_queue(), /* passive */ false, /* durable */ true, /* exclusive */ false, /* auto_delete */ false);
    if (!write)  // 对于从消息队列读取消息的情况，我们需要监听队列
        tag = channel->BasicConsume(queue.queue, /* consumer tag */ "", /* no_local */ true, /* no_ack */ false, /* exclusive */ false, prefetch);
}

string rabbitmq::publish(const string &body) {
    scoped_lock guard(mut);
    string id = generate_uuid();
    AmqpClient::BasicMessage::ptr_t msg = AmqpClient::BasicMessage::Create(body);
    msg->DeliveryMode(AmqpClient::BasicMessage::dm_persistent);
    msg->MessageId(id);
    msg->ContentType("application/json");
    DLOG(INFO) << "Sending message to exchange:" << queue.exchange << ", routing_key=" << queue.routing_key << std::endl
               << body;

    for (int retry = 1;; ++retry) {
        try {
            channel->BasicPublish(queue.exchange, queue.routing_key, msg);
            DLOG(INFO) << "Sending message succeeded";
            return id;
        } catch (std::exception &e) {
            LOG(WARNING) << "RabbitMQ: Unable to publish message: " << e.what();
            if (retry >= RETRY_TIMES)
                BOOST_THROW_EXCEPTION(queue_error("unable to publish message to " + queue.exchange + ": " + e.what()));
            this_thread::sleep_for(chrono::seconds(retry));
            connect();
        }
    }
}

bool rabbitmq::fetch(delivery &item, chrono::milliseconds timeout) {
    if (write)
        throw logic_error("rabbitmq: fetching from a write-only connection");

    scoped_lock guard(mut);
    for (int retry = 1;; ++retry) {
        try {
            AmqpClient::Envelope::ptr_t envelope;
            if (!channel->BasicConsumeMessage(tag, envelope, (int)timeout.count()))
                return false;
            item.body = envelope->Message()->Body();
            item.attempt = delivery_attempt(envelope->Message(), envelope->Redelivered());
            item.handle = envelope;
            return true;
        } catch (std::exception &e) {
            LOG(WARNING) << "RabbitMQ: Unable to consume message: " << e.what();
            if (retry >= RETRY_TIMES)
                BOOST_THROW_EXCEPTION(queue_error("unable to consume message from " + queue.queue + ": " + e.what()));
            this_thread::sleep_for(chrono::seconds(retry));
            connect();
        }
    }
}

void rabbitmq::ack(const delivery &item) {
    scoped_lock guard(mut);
    channel->BasicAck(any_cast<AmqpClient::Envelope::ptr_t>(item.handle));
}

void rabbitmq::send(const string &routing_key, const AmqpClient::BasicMessage::ptr_t &message) {
    for (int retry = 1;; ++retry) {
        try {
            // 默认 Exchange 按照 routing key 直接投递到同名队列
            channel->BasicPublish("", routing_key, message);
            return;
        } catch (std::exception &e) {
            LOG(WARNING) << "RabbitMQ: Unable to send message to " << routing_key << ": " << e.what();
            if (retry >= RETRY_TIMES)
                BOOST_THROW_EXCEPTION(queue_error("unable to send message to " + routing_key + ": " + e.what()));
            this_thread::sleep_for(chrono::seconds(retry));
            connect();
        }
    }
}

void rabbitmq::release(const delivery &item, chrono::milliseconds delay) {
    scoped_lock guard(mut);
    auto envelope = any_cast<AmqpClient::Envelope::ptr_t>(item.handle);
    if (queue.max_receives > 0 && item.attempt >= queue.max_receives) {
        LOG(WARNING) << "RabbitMQ: Message " << envelope->Message()->MessageId() << " reached "
                     << item.attempt << " deliveries, moving to " << dead_queue();
        send(dead_queue(), make_retry_message(envelope->Message(), item.attempt));
    } else {
        DLOG(INFO) << "RabbitMQ: Retrying message in " << delay.count() << "ms";
        auto retry = make_retry_message(envelope->Message(), item.attempt + 1);
        // 消息在延迟队列中过期后回到原队列
        retry->Expiration(to_string(max<long long>(delay.count(), 0)));
        send(delay_queue(), retry);
    }
    // 副本已经发送，原消息不再需要。如果确认前崩溃，消息会被多投递一次
    channel->BasicAck(envelope);
}

}  // namespace codejudge::server
