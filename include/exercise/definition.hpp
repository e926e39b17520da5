#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "harness/harness.hpp"

namespace grader {

struct action;

/**
 * @brief 保留的成功终止状态名，不允许在题目中定义
 */
extern const std::string ACCEPT_STATE;

/**
 * @brief 保留的超时终止状态名，超过总时间或最大状态转移数时强制进入
 */
extern const std::string TIMEOUT_ABORTED_STATE;

enum class action_type {
    script,
    command,
    callable
};

/**
 * @brief 状态需要执行的动作
 */
struct action_spec {
    action_type type = action_type::command;

    /**
     * @brief script 类型：解释器，如 bash、python3
     */
    std::string interpreter;

    /**
     * @brief script 类型：脚本在题目定义文件夹中的相对路径
     */
    std::string script;

    /**
     * @brief command 类型：命令及参数
     */
    std::vector<std::string> argv;

    /**
     * @brief callable 类型：进程内执行的动作，只能通过代码构造
     */
    std::shared_ptr<action> callable;
};

/**
 * @brief 运行结果的分类，转移函数根据分类选择下一个状态
 */
enum class outcome_class {
    success,       // 退出码为 0 且没有超限
    failure,       // 退出码不为 0 且没有超限
    time_limit,    // 时间超限
    memory_limit,  // 内存超限
};

extern const std::vector<outcome_class> ALL_OUTCOME_CLASSES;

std::string to_string(outcome_class cls);

/**
 * @brief 对运行结果分类
 * 优先级：内存超限 > 时间超限 > 退出码为 0 > 其他
 */
outcome_class classify(const execution_result &result);

/**
 * @brief 一个状态的转移函数
 * 优先匹配 exit_rules（仅在没有超限时），其次 class_rules，最后 otherwise
 */
struct transition_table {
    std::map<int64_t, std::string> exit_rules;
    std::map<outcome_class, std::string> class_rules;
    std::optional<std::string> otherwise;

    /**
     * @brief 是否对每一种 outcome_class 都有定义
     */
    bool is_total() const;

    /**
     * @brief 所有可能的后继状态
     */
    std::vector<std::string> targets() const;
};

struct state_definition {
    std::string name;
    action_spec action;
    resource_limits limits;

    /**
     * @brief 运行前需要从题目定义文件夹复制到工作目录的文件
     */
    std::vector<std::string> required_files;

    /**
     * @brief 是否有副作用，dry-run 时跳过
     */
    bool destructive = false;

    transition_table transitions;

    /**
     * @brief 根据运行结果计算下一个状态
     * @throw schema_validation_error 转移函数未覆盖该结果
     */
    std::string next_state(const execution_result &result) const;
};

/**
 * @brief 对所有状态生效的沙箱设置
 */
struct sandbox_options {
    /**
     * @brief 可以使用的 CPU 个数，0 表示不限制
     */
    int cpu_limit = 0;

    /**
     * @brief 内存上限，状态的内存限制不能超过这个值
     */
    std::optional<int64_t> memory_limit_bytes;

    bool network_access = true;
};

/**
 * @brief 题目的评测定义，加载后不可变
 */
struct exercise_definition {
    std::string schema_version;
    std::string name;
    std::string version;

    /**
     * @brief 提交文件在工作目录中的文件名，为空表示保持原文件名
     */
    std::optional<std::string> rename;

    /**
     * @brief 运行所有状态时使用的运行环境
     */
    std::optional<runtime_environment> environment;

    sandbox_options sandbox;

    /**
     * @brief 整个评测过程允许的最长时间，单位为微秒
     */
    int64_t max_total_time_usec = 600 * 1000000LL;

    /**
     * @brief 允许执行的最多动作次数
     */
    int64_t max_transitions = 64;

    std::string initial_state;
    std::map<std::string, state_definition> states;

    /**
     * @brief 自定义的终止状态及其成绩
     */
    std::map<std::string, std::optional<int>> terminal_states;

    std::optional<int> accept_grade;

    /**
     * @brief 检查定义的一致性
     * 初始状态存在且不是终止状态；保留名没有被定义；状态名和终止状态名不冲突；
     * 每个转移函数都是全函数，目标状态都存在；时间限制不超过 MAX_TIME_LIMIT_USEC
     * @throw schema_validation_error 定义不一致
     */
    void validate() const;

    bool is_terminal(const std::string &state) const;

    /**
     * @brief 终止状态的成绩，timeout-aborted 没有成绩
     */
    std::optional<int> grade_of(const std::string &terminal) const;

    /**
     * @brief 状态实际运行时的限制：合并沙箱设置和运行环境
     */
    resource_limits limits_of(const state_definition &state) const;
};

}  // namespace grader
