#pragma once

#include <filesystem>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>
#include "exercise/identity.hpp"
#include "exercise/schema.hpp"
#include "server/job_queue.hpp"
#include "server/storage.hpp"

namespace grader::server {

struct submit_request {
    exercise_identity identity;

    /**
     * @brief 选手提交的文件，会被复制到数据目录
     */
    std::filesystem::path submission_file;

    std::string submission_id;
    std::string token;
};

struct submit_response {
    exercise_identity identity;
    std::string submission_id;
    std::string job_id;
    std::string submission_file_name;
};

void to_json(nlohmann::json &j, const submit_response &response);

struct upload_response {
    bool success = false;
    std::vector<std::string> reasons;
};

void to_json(nlohmann::json &j, const upload_response &response);

/**
 * @brief 评测端对外提供的服务
 * 接受提交并入队、上传题目定义、查询题目是否存在、查询评测结果
 */
struct judge_service {
    judge_service(storage &store, job_queue &queue, std::string api_token,
                  const schema_registry &registry = default_schema_registry());

    /**
     * @brief 接受一次提交
     * 提交文件只写一次：同一 submission_id 再次提交（重新评测）时保留已有的文件。
     * @throw authentication_error token 不匹配
     * @throw schema_validation_error 题目定义不存在
     * @throw queue_unavailable 队列不可用
     */
    submit_response submit(const submit_request &request);

    /**
     * @brief 题目定义是否已经上传
     */
    bool exists(const exercise_identity &identity) const;

    /**
     * @brief 上传并检查题目定义，题目定义一经上传不可修改
     * @param bundle zip 压缩包或者文件夹
     * @return 失败时 reasons 给出原因
     */
    upload_response upload(const exercise_identity &identity, const std::filesystem::path &bundle);

    /**
     * @brief 查询评测结果
     * @return 评测结果报文，提交不存在或者尚未评测完成时返回 std::nullopt
     */
    std::optional<std::string> result(const std::string &submission_id) const;

private:
    storage &store;
    job_queue &queue;
    std::string api_token;
    const schema_registry &registry;
};

}  // namespace grader::server
