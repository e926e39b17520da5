#pragma once

#include <chrono>
#include <filesystem>
#include <nlohmann/json.hpp>
#include <string>
#include "exercise/identity.hpp"

namespace grader::server {

/**
 * @brief 一次评测任务，每次提交创建一个，只会被一个 worker 处理一次
 */
struct evaluation_job {
    std::string job_id;
    std::string submission_id;
    exercise_identity identity;

    /**
     * @brief 提交文件在数据目录中的路径
     */
    std::filesystem::path submission_file;

    /**
     * @brief 入队时间，UNIX 时间戳（毫秒）
     */
    int64_t enqueued_at = 0;
};

/**
 * @brief 生成新的评测任务 id (UUID)
 */
std::string generate_job_id();

int64_t current_timestamp_ms();

void to_json(nlohmann::json &j, const evaluation_job &job);
void from_json(const nlohmann::json &j, evaluation_job &job);

}  // namespace grader::server
