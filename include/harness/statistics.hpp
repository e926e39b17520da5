#pragma once

#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>

namespace grader {

/**
 * @brief limitrace 追加在 stderr 末尾的统计信息头
 */
extern const std::string TRAILER_HEADER;

/**
 * @brief 被限制程序的资源使用统计，来自 wait4 的 rusage 和墙上时间
 */
struct resource_statistics {
    int64_t ru_utime_usec = 0;
    int64_t ru_stime_usec = 0;
    int64_t wall_time_usec = 0;

    /**
     * @brief 内存峰值，单位 KiB
     */
    int64_t ru_maxrss = 0;
    int64_t ru_minflt = 0;
    int64_t ru_majflt = 0;
    int64_t ru_inblock = 0;
    int64_t ru_oublock = 0;
    int64_t ru_nvcsw = 0;
    int64_t ru_nivcsw = 0;
};

/**
 * @brief 资源超限标记，非零表示超限
 */
struct limit_detection {
    /**
     * @brief 时间超限，包括 CPU 时间和墙上时间
     */
    int64_t cpu_overuse = 0;

    /**
     * @brief 内存超限，等于 rss_overuse || as_overuse
     */
    int64_t memory_overuse = 0;
    int64_t utime_overuse = 0;
    int64_t stime_overuse = 0;
    int64_t as_overuse = 0;
    int64_t rss_overuse = 0;

    /**
     * @brief 被限制程序的退出码，被信号杀死时为 128 + 信号
     */
    int64_t exit_status = 0;
};

std::string to_ltsv(const resource_statistics &stats);
std::string to_ltsv(const limit_detection &detection);

/**
 * @brief 解析一行 LTSV 格式的资源统计
 * 键集合必须完全一致，不允许重复键，所有值必须是非负整数
 * @throw malformed_trailer_error 格式不正确
 */
resource_statistics parse_statistics_ltsv(const std::string &line);

/**
 * @brief 解析一行 LTSV 格式的超限标记
 * @throw malformed_trailer_error 格式不正确
 */
limit_detection parse_detection_ltsv(const std::string &line);

/**
 * @brief 生成 limitrace 追加在 stderr 的三行统计信息（以换行结尾）
 */
std::string make_trailer(const resource_statistics &stats, const limit_detection &detection);

struct trailer_parse_result {
    /**
     * @brief 去掉统计信息后的 stderr
     */
    std::string remaining;
    resource_statistics statistics;
    limit_detection detection;
};

/**
 * @brief 从 stderr 的末尾解析 limitrace 统计信息
 * @param stderr_text 被限制程序的完整 stderr 输出
 * @throw malformed_trailer_error 行数不足、头部不匹配、键缺失或重复、值无法解析
 */
trailer_parse_result parse_trailer(const std::string &stderr_text);

void to_json(nlohmann::json &j, const resource_statistics &stats);
void to_json(nlohmann::json &j, const limit_detection &detection);

}  // namespace grader
