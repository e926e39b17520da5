#pragma once

#include <cstdint>
#include <filesystem>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>
#include "harness/statistics.hpp"

namespace grader {

/**
 * @brief 时间限制的上限，一天
 */
const int64_t MAX_TIME_LIMIT_USEC = 24LL * 3600 * 1000000;

/**
 * @brief 预先安装好的运行环境，位于 harness_config::environment_root/<name>/<version>
 */
struct runtime_environment {
    std::string name;
    std::string version;
};

/**
 * @brief 一个状态运行时的资源限制
 */
struct resource_limits {
    /**
     * @brief 墙上时间限制，单位为微秒
     */
    int64_t time_limit_usec = 10 * 1000000LL;

    /**
     * @brief CPU 时间限制（用户态加内核态），单位为微秒
     */
    int64_t cpu_limit_usec = 10 * 1000000LL;

    /**
     * @brief 常驻内存限制，单位为字节
     */
    int64_t memory_limit_bytes = 256LL << 20;

    /**
     * @brief 可以使用的 CPU 个数，0 表示不限制
     */
    int cpu_count = 0;

    bool network_access = true;

    /**
     * @brief 运行环境，其 bin 目录会被加在 PATH 最前面
     */
    std::optional<runtime_environment> environment;
};

/**
 * @brief 一次状态运行的结果
 */
struct execution_result {
    /**
     * @brief 被评测程序的退出码，被信号杀死时为 128 + 信号
     */
    int exit_status = 0;

    std::string stdout_text;

    /**
     * @brief 去掉 limitrace 统计信息后的 stderr
     */
    std::string stderr_text;

    resource_statistics statistics;
    limit_detection detection;

    /**
     * @brief 动作无法执行（脚本缺失、必需文件缺失、运行环境故障）
     */
    bool failed = false;

    /**
     * @brief 动作无法执行的原因
     */
    std::string error_message;

    /**
     * @brief dry-run 模式下跳过了有副作用的状态
     */
    bool skipped = false;
};

void to_json(nlohmann::json &j, const execution_result &result);

struct harness_config {
    /**
     * @brief limitrace 可执行文件的路径
     */
    std::filesystem::path limitrace;

    /**
     * @brief 在墙上时间限制之外额外等待 limitrace 的时间，单位为微秒
     * 超过后直接杀死 limitrace
     */
    int64_t grace_usec = 2 * 1000000LL;

    /**
     * @brief 虚拟内存限制，单位为字节，-1 表示不限制
     */
    int64_t address_space_limit = -1;

    /**
     * @brief 保存的 stdout/stderr 的最大长度，超出部分被丢弃
     */
    size_t max_output_size = 1 << 20;

    /**
     * @brief 运行环境的安装目录
     */
    std::filesystem::path environment_root = "/opt/grader/environments";
};

void from_json(const nlohmann::json &j, harness_config &config);

/**
 * @brief 在资源限制下执行外部命令
 * 命令通过 limitrace 启动，limitrace 负责资源限制并在 stderr 末尾追加统计信息。
 * 超限不会抛出异常，而是记录在 execution_result::detection 中。
 */
struct harness {
    explicit harness(harness_config config);
    virtual ~harness() = default;

    /**
     * @brief 运行命令直到结束
     * 子进程的标准输入为 /dev/null，工作目录为 workdir
     * @param argv 命令及其参数
     * @param workdir 工作目录
     * @param limits 资源限制
     * @throw malformed_trailer_error limitrace 的统计信息缺失或格式不正确
     * @throw internal_error 无法创建子进程，运行环境不存在，或者限制超出范围
     */
    virtual execution_result run(const std::vector<std::string> &argv,
                                 const std::filesystem::path &workdir,
                                 const resource_limits &limits);

private:
    harness_config cfg;
};

}  // namespace grader
