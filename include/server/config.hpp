#pragma once

#include <nlohmann/json.hpp>
#include <string>

namespace grader::server {

/**
 * @brief 描述一个 AMQP 消息队列的配置数据结构
 */
struct amqp {
    /**
     * @brief AMQP 消息队列的主机地址
     */
    std::string hostname = "localhost";

    /**
     * @brief AMQP 消息队列的主机端口
     */
    int port = 5672;

    /**
     * @brief 通过该结构体发送的消息的 Exchange 名
     */
    std::string exchange;

    /**
     * @brief Exchange 类型，可选 direct, topic, fanout
     */
    std::string exchange_type = "direct";

    /**
     * @brief AMQP 消息队列的队列名
     */
    std::string queue;

    /**
     * @brief AMQP 消息队列的 Routing Key
     */
    std::string routing_key;
};

void from_json(const nlohmann::json &j, amqp &mq);

/**
 * @brief 连接失败时的重试策略
 */
struct retry_policy {
    /**
     * @brief 首次失败后的最多重试次数
     */
    unsigned max_retries = 3;

    /**
     * @brief 第一次重试前的等待时间，单位毫秒
     */
    unsigned retry_interval = 1000;

    /**
     * @brief 每次重试后等待时间的倍数
     */
    double backoff_multiplier = 2;
};

void from_json(const nlohmann::json &j, retry_policy &policy);

}  // namespace grader::server
