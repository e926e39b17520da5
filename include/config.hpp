#pragma once

#include <chrono>
#include <filesystem>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include "harness/harness.hpp"
#include "server/callback.hpp"
#include "server/config.hpp"

namespace grader {

/**
 * @brief 评测队列的配置，不配置 rabbitmq 时使用进程内的队列
 */
struct queue_config {
    /**
     * @brief 可选 memory, rabbitmq
     */
    std::string type = "memory";

    std::optional<server::amqp> rabbitmq;

    /**
     * @brief 连接消息队列失败时的重试策略
     */
    server::retry_policy retry;
};

void from_json(const nlohmann::json &j, queue_config &config);

/**
 * @brief 评测端的配置，来自配置文件，可以被命令行参数和环境变量覆盖
 * @code{.json}
 * {
 *     "data_dir": "/var/lib/grader",
 *     "workers": 4,
 *     "api_token": "...",
 *     "poll_interval": 500,
 *     "queue": {"type": "rabbitmq", "rabbitmq": {"hostname": "localhost", "port": 5672, "exchange": "grader", "queue": "jobs"}},
 *     "callback": {"url": "http://localhost/judge_reply", "token": "...", "unix_socket": "/run/tracker.sock"},
 *     "harness": {"limitrace": "/usr/local/bin/limitrace", "environment_root": "/opt/grader/environments"}
 * }
 * @endcode
 */
struct grader_config {
    /**
     * @brief 数据目录，存放题目定义、提交文件和评测结果
     */
    std::filesystem::path data_dir;

    /**
     * @brief worker 线程数
     */
    std::size_t workers = 1;

    /**
     * @brief 提交评测时需要提供的 token
     */
    std::string api_token;

    /**
     * @brief worker 从队列中取任务的最长等待时间
     */
    std::chrono::milliseconds poll_interval{500};

    queue_config queue;
    server::callback_config callback;
    harness_config harness;
};

void from_json(const nlohmann::json &j, grader_config &config);

/**
 * @brief 读取配置文件，并用环境变量 DATADIR, LIMITRACE, JUDGE_API_TOKEN 覆盖对应配置
 * @param path 配置文件路径，为空时只读取环境变量
 * @throw internal_error 配置文件无法读取
 * @throw nlohmann::json::exception 配置文件格式不正确
 */
grader_config load_config(const std::filesystem::path &path);

}  // namespace grader
