#pragma once

#include <chrono>
#include <functional>
#include <nlohmann/json.hpp>
#include <string>
#include "server/config.hpp"

namespace grader::server {

struct http_response {
    /**
     * @brief HTTP 状态码，请求没有发出时为 0
     */
    long status = 0;
    std::string body;
};

/**
 * @brief 发送 HTTP 请求的方式
 */
struct http_transport {
    virtual ~http_transport();

    /**
     * @brief 发送 POST 请求，请求体为 JSON
     * @throw network_error 请求无法发出或者没有收到响应
     */
    virtual http_response post_json(const std::string &url, const std::string &body) = 0;
};

/**
 * @brief 基于 libcurl 的 HTTP 请求
 */
struct curl_transport : public http_transport {
    /**
     * @param timeout_ms 请求超时时间，单位毫秒
     * @param unix_socket 若不为空，则通过该 Unix domain socket 发送请求
     */
    curl_transport(long timeout_ms, std::string unix_socket);

    http_response post_json(const std::string &url, const std::string &body) override;

private:
    long timeout_ms;
    std::string unix_socket;
};

struct callback_config {
    /**
     * @brief 提交追踪端接收评测结果的地址
     */
    std::string url;

    /**
     * @brief 与提交追踪端共享的 token
     */
    std::string token;

    /**
     * @brief 若不为空，则通过该 Unix domain socket 发送请求
     */
    std::string unix_socket;

    /**
     * @brief 请求超时时间，单位毫秒
     */
    long timeout = 10000;

    retry_policy retry;
};

void from_json(const nlohmann::json &j, callback_config &config);

/**
 * @brief 向提交追踪端回调评测进度和结果
 * 请求体为 {submission_id, token, progress, evaluation_result_json}，
 * evaluation_result_json 只在 progress 为 100 时存在。
 */
struct callback_client {
    using sleeper = std::function<void(std::chrono::milliseconds)>;

    /**
     * @param sleep 重试前的等待方式，默认为 std::this_thread::sleep_for
     */
    callback_client(callback_config config, http_transport &transport, sleeper sleep = {});

    /**
     * @brief 是否配置了回调地址，没有配置时不发送任何请求
     */
    bool enabled() const;

    /**
     * @brief 报告评测进度，只尝试一次，失败时只记录警告
     * @return 是否成功
     */
    bool report_progress(const std::string &submission_id, int progress);

    /**
     * @brief 报告评测结果，被拒绝（非 2xx）或请求失败时按指数退避重试
     * @param payload 评测结果报文
     * @throw delivery_error 重试次数耗尽
     */
    void deliver_result(const std::string &submission_id, const std::string &payload);

private:
    std::string make_body(const std::string &submission_id, int progress, const std::string *payload) const;

    /**
     * @brief 发送一次请求
     * @return 是否被接受 (2xx)
     */
    bool post(const std::string &body, http_response &response, std::string &error);

    callback_config config;
    http_transport &transport;
    sleeper sleep;
};

}  // namespace grader::server
