#pragma once

#include <chrono>
#include <mutex>
#include "SimpleAmqpClient/SimpleAmqpClient.h"
#include "server/config.hpp"
#include "server/job_queue.hpp"

namespace grader::server {

/**
 * @brief 基于 RabbitMQ 的持久化评测任务队列
 * 队列和 Exchange 都是 durable 的，消息持久化，prefetch 为 1。
 * 消息在取出后立即 ack，因此 worker 崩溃后任务不会被重新投递（至多一次）。
 */
struct rabbitmq_job_queue : public job_queue {
    rabbitmq_job_queue(const amqp &config, const retry_policy &retry);

    job_handle enqueue(const evaluation_job &job) override;
    bool dequeue(evaluation_job &job, std::chrono::milliseconds timeout) override;

private:
    AmqpClient::Channel::ptr_t connect(bool consume);

    template <typename Func>
    auto with_retry(const char *operation, AmqpClient::Channel::ptr_t &channel, bool consume, Func func);

    amqp queue;
    retry_policy retry;

    std::mutex publish_mut;
    AmqpClient::Channel::ptr_t publish_channel;

    std::mutex consume_mut;
    AmqpClient::Channel::ptr_t consume_channel;
    std::string consumer_tag;
};

}  // namespace grader::server
