#include "server/rabbitmq.hpp"
#include <glog/logging.h>
#include <cmath>
#include <thread>
#include "common/exceptions.hpp"

namespace grader::server {
using namespace std;
using json = nlohmann::json;

rabbitmq_job_queue::rabbitmq_job_queue(const amqp &config, const retry_policy &retry)
    : queue(config), retry(retry) {}

AmqpClient::Channel::ptr_t rabbitmq_job_queue::connect(bool consume) {
    auto channel = AmqpClient::Channel::Create(queue.hostname, queue.port);
    channel->DeclareQueue(queue.queue, /* passive */ false, /* durable */ true, /* exclusive */ false, /* auto_delete */ false);
    channel->DeclareExchange(queue.exchange, queue.exchange_type, /* passive */ false, /* durable */ true);
    channel->BindQueue(queue.queue, queue.exchange, queue.routing_key);
    if (consume)  // 对于从消息队列读取消息的情况，我们需要监听队列，每次只预取一条消息
        consumer_tag = channel->BasicConsume(queue.queue, /* consumer tag */ "", /* no_local */ true, /* no_ack */ false, /* exclusive */ false, /* prefetch */ 1);
    return channel;
}

template <typename Func>
auto rabbitmq_job_queue::with_retry(const char *operation, AmqpClient::Channel::ptr_t &channel, bool consume, Func func) {
    unsigned interval = retry.retry_interval;
    for (unsigned attempt = 0;; ++attempt) {
        try {
            if (!channel) channel = connect(consume);
            return func(channel);
        } catch (std::exception &e) {
            channel.reset();
            if (attempt >= retry.max_retries)
                throw queue_unavailable(string(operation) + " failed after " + to_string(attempt + 1) + " attempts: " + e.what());
            LOG(WARNING) << operation << " failed, retrying in " << interval << "ms: " << e.what();
            this_thread::sleep_for(chrono::milliseconds(interval));
            interval = (unsigned)lround(interval * retry.backoff_multiplier);
        }
    }
}

job_handle rabbitmq_job_queue::enqueue(const evaluation_job &job) {
    string message = json(job).dump();
    scoped_lock guard(publish_mut);
    with_retry("Publishing", publish_channel, false, [&](AmqpClient::Channel::ptr_t &channel) {
        AmqpClient::BasicMessage::ptr_t msg = AmqpClient::BasicMessage::Create(message);
        msg->DeliveryMode(AmqpClient::BasicMessage::dm_persistent);
        msg->ContentType("application/json");
        DLOG(INFO) << "Sending message to exchange:" << queue.exchange << ", routing_key=" << queue.routing_key << std::endl
                   << message;
        channel->BasicPublish(queue.exchange, queue.routing_key, msg);
        return true;
    });
    return {job.job_id};
}

bool rabbitmq_job_queue::dequeue(evaluation_job &job, chrono::milliseconds timeout) {
    scoped_lock guard(consume_mut);
    AmqpClient::Envelope::ptr_t envelope;
    bool received = with_retry("Consuming", consume_channel, true, [&](AmqpClient::Channel::ptr_t &channel) {
        if (!channel->BasicConsumeMessage(consumer_tag, envelope, (int)timeout.count()))
            return false;
        // 取出后立即 ack，worker 崩溃时任务不会被重新投递
        channel->BasicAck(envelope);
        return true;
    });
    if (!received) return false;

    string body = envelope->Message()->Body();
    try {
        json::parse(body).get_to(job);
    } catch (json::exception &e) {
        LOG(ERROR) << "Dropping malformed job message: " << e.what() << endl
                   << body;
        return false;
    }
    return true;
}

}  // namespace grader::server
