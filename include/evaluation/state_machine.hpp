#pragma once

#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include "evaluation/action.hpp"
#include "evaluation/verdict.hpp"
#include "exercise/definition.hpp"
#include "harness/harness.hpp"

namespace grader {

struct evaluation_options {
    /**
     * @brief 题目定义文件夹（只读）
     */
    std::filesystem::path exercise_dir;

    /**
     * @brief 选手提交的文件
     */
    std::filesystem::path submission_file;

    /**
     * @brief 本次评测私有的工作目录，所有状态共享
     */
    std::filesystem::path working_dir;

    /**
     * @brief 跳过 destructive 状态的动作，其余状态照常执行
     */
    bool dry_run = false;

    /**
     * @brief 每执行完一个状态调用一次，参数为状态名和已执行的状态数
     */
    std::function<void(const std::string &, int64_t)> on_progress;
};

/**
 * @brief 评测状态机
 * 从初始状态开始，依次执行每个状态绑定的动作，根据运行结果和转移函数选择下一个状态，
 * 直到进入终止状态。超过总时间或最大状态转移数时强制进入 timeout-aborted，
 * 不再执行下一个动作。
 */
struct state_machine {
    /**
     * @param def 题目定义，必须已经通过 validate 检查
     * @param h 执行外部命令的 harness
     */
    state_machine(exercise_definition def, harness &h);

    /**
     * @brief 为状态绑定自定义的动作，覆盖题目定义中的动作
     */
    void bind_action(const std::string &state, std::shared_ptr<action> act);

    /**
     * @brief 执行一次评测
     * @throw configuration_error 动作无法执行、提交文件缺失等，携带部分评测结果
     */
    verdict evaluate(const evaluation_options &opts);

    const exercise_definition &definition() const;

private:
    std::shared_ptr<action> action_of(const state_definition &state, const std::filesystem::path &exercise_dir);

    exercise_definition def;
    harness &h;
    std::map<std::string, std::shared_ptr<action>> bound_actions;
};

}  // namespace grader
