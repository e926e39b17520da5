#pragma once

#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <vector>
#include "exercise/definition.hpp"
#include "harness/harness.hpp"

namespace grader {

/**
 * @brief 一个状态绑定的动作
 * 动作在工作目录中执行，返回运行结果。超限不抛出异常，而是记录在结果中。
 */
struct action {
    virtual ~action();

    /**
     * @brief 动作类型名，用于日志
     */
    virtual std::string type() const = 0;

    /**
     * @brief 执行动作
     * @param workdir 评测工作目录，所有状态共享
     * @param limits 该状态的资源限制
     * @throw malformed_trailer_error limitrace 统计信息不合法
     * @throw internal_error 动作无法执行
     */
    virtual execution_result run(const std::filesystem::path &workdir, const resource_limits &limits) = 0;
};

/**
 * @brief 通过解释器执行题目定义文件夹中的脚本
 * 脚本先被复制到工作目录，再以 interpreter ./script 的形式运行
 */
struct script_action : public action {
    script_action(harness &h, std::string interpreter, std::filesystem::path script);

    std::string type() const override;
    execution_result run(const std::filesystem::path &workdir, const resource_limits &limits) override;

private:
    harness &h;
    std::string interpreter;
    std::filesystem::path script;
};

struct command_action : public action {
    command_action(harness &h, std::vector<std::string> argv);

    std::string type() const override;
    execution_result run(const std::filesystem::path &workdir, const resource_limits &limits) override;

private:
    harness &h;
    std::vector<std::string> argv;
};

/**
 * @brief 进程内执行的动作，主要用于测试和代码构造的题目定义
 */
struct callable_action : public action {
    using function_type = std::function<execution_result(const std::filesystem::path &, const resource_limits &)>;

    explicit callable_action(function_type func);

    std::string type() const override;
    execution_result run(const std::filesystem::path &workdir, const resource_limits &limits) override;

private:
    function_type func;
};

/**
 * @brief 根据状态定义构造动作
 * @param spec 动作定义
 * @param exercise_dir 题目定义文件夹，script 类型的脚本相对于该文件夹
 * @param h 执行外部命令的 harness
 */
std::shared_ptr<action> make_action(const action_spec &spec, const std::filesystem::path &exercise_dir, harness &h);

}  // namespace grader
