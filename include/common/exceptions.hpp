#pragma once

#include <boost/stacktrace.hpp>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>

namespace grader {

struct grader_exception : std::exception {
    explicit grader_exception(const std::string &message);

    friend std::ostream &operator<<(std::ostream &os, const grader_exception &ex);

    const char *what() const noexcept override;

private:
    std::string message;
    std::shared_ptr<boost::stacktrace::stacktrace> stacktrace;
};

/**
 * @brief 表示评测系统的内部错误
 * 一般是文件系统、进程创建等环境问题
 */
struct internal_error : public grader_exception {
    explicit internal_error(const std::string &message);
};

/**
 * @brief 表示网络错误，通常由 CURL 产生
 */
struct network_error : public grader_exception {
    explicit network_error(const std::string &message);
};

/**
 * @brief 题目配置（setting.json）不合法
 * 配置缺失、结构错误、版本不存在时抛出。上传时返回给上传者，不会重试。
 */
struct schema_validation_error : public grader_exception {
    explicit schema_validation_error(const std::string &message);
};

/**
 * @brief 限制器（limitrace）追加在 stderr 末尾的统计信息格式不正确
 * 这说明评测环境本身有问题，当前状态直接失败。
 */
struct malformed_trailer_error : public grader_exception {
    explicit malformed_trailer_error(const std::string &message);
};

/**
 * @brief 回调评测结果给提交追踪端失败（重试次数耗尽）
 */
struct delivery_error : public grader_exception {
    delivery_error(const std::string &message, long status_code);

    /**
     * @brief 最后一次请求的 HTTP 状态码，若请求没有发出则为 0
     */
    long status_code;
};

/**
 * @brief 消息队列不可用，入队或出队失败
 * 提交方会收到失败，而不是"已接受但丢失"
 */
struct queue_unavailable : public grader_exception {
    explicit queue_unavailable(const std::string &message);
};

/**
 * @brief 提交时 token 不匹配
 */
struct authentication_error : public grader_exception {
    explicit authentication_error(const std::string &message);
};

}  // namespace grader
