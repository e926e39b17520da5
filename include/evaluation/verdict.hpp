#pragma once

#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>
#include "common/exceptions.hpp"
#include "exercise/identity.hpp"
#include "harness/harness.hpp"

namespace grader {

/**
 * @brief 状态机经过的一个状态及其运行结果
 */
struct state_run {
    std::string state;
    execution_result result;
};

/**
 * @brief 一次评测的最终结果
 */
struct verdict {
    /**
     * @brief 终止状态名，评测未完成（配置错误）时为空
     */
    std::string terminal_state;

    /**
     * @brief 按执行顺序排列的状态及其运行结果
     */
    std::vector<state_run> path;

    /**
     * @brief 终止状态是否为 accept
     */
    bool success = false;

    std::optional<int> grade;

    /**
     * @brief 是否因为超过总时间或最大状态转移数被强制终止
     */
    bool aborted = false;

    bool dry_run = false;

    /**
     * @brief 各状态墙上时间之和，单位为微秒
     */
    int64_t total_time_usec = 0;

    /**
     * @brief 各状态内存峰值的最大值，单位为 KiB
     */
    int64_t max_memory_kib = 0;

    /**
     * @brief 评测失败的原因
     */
    std::string error;

    /**
     * @brief 状态名序列，用于日志
     */
    std::string path_trace() const;
};

/**
 * @brief 结果标签，用于在前端展示评测结果的附加信息
 */
struct result_tag {
    std::string name;
    std::string description;
    std::string background_color;
    std::string font_color;
    bool visible = true;

    bool operator<(const result_tag &other) const { return name < other.name; }
    bool operator==(const result_tag &other) const { return name == other.name; }
};

void to_json(nlohmann::json &j, const result_tag &tag);

/**
 * @brief 按名字查找预定义的标签：TLE、MLE、ESE、BSE
 * @throw internal_error 标签不存在
 */
const result_tag &find_tag(const std::string &name);

/**
 * @brief 一个状态的评测状态
 * pass：正常结束；fail：退出码不为 0；error：超过资源限制；fatal：动作无法执行
 */
std::string status_of(const execution_result &result);

/**
 * @brief 一个状态的标签，时间超限为 TLE，内存超限为 MLE，动作无法执行为 ESE
 */
std::vector<result_tag> tags_of(const execution_result &result);

/**
 * @brief 按展示顺序排列的评测状态并集：fatal、fail、error、pass
 */
std::vector<std::string> status_set_of(const verdict &v);

/**
 * @brief 按名字排列的标签并集，被强制终止时包含 TLE
 */
std::vector<result_tag> tag_set_of(const verdict &v);

void to_json(nlohmann::json &j, const state_run &run);

/**
 * @brief 评测配置错误，携带出错前的部分评测结果
 * 包括脚本缺失、必需文件缺失、limitrace 统计信息不合法、转移函数未覆盖运行结果等。
 * 评测失败，不会重试。
 */
struct configuration_error : public grader_exception {
    configuration_error(const std::string &message, verdict partial);

    verdict partial;
};

/**
 * @brief 评测结果报文的元数据
 */
struct verdict_metadata {
    std::string submission_id;
    std::string job_id;
    exercise_identity identity;
};

/**
 * @brief 失败报文的类型
 * ESE (Evaluation System Error)：题目配置问题；BSE (Backend System Error)：评测系统内部问题
 */
enum class failure_type {
    ESE,
    BSE
};

/**
 * @brief 构造发送给提交追踪端、并在评测端保存的结果报文
 */
nlohmann::json make_result_payload(const verdict &v, const verdict_metadata &metadata);

/**
 * @brief 构造评测失败时的结果报文，状态为 fatal
 * @param partial 出错前的部分评测结果，可以为空
 */
nlohmann::json make_failure_payload(failure_type type, const std::string &reason,
                                    const verdict_metadata &metadata, const verdict *partial = nullptr);

}  // namespace grader
